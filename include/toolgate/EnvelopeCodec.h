//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: EnvelopeCodec.h
// Purpose: Decode/encode of JSON-RPC envelopes (request, response, notification) and batch payloads
//==========================================================================================================

#pragma once

#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "toolgate/JSONRPCTypes.h"

namespace toolgate {

//==========================================================================================================
// Envelope
// Purpose: One protocol message. A Request and a Notification differ only by the presence of the "id"
//          key; a Request with a null id is still a Request.
//==========================================================================================================
using Envelope = std::variant<JSONRPCRequest, JSONRPCResponse, JSONRPCNotification>;

//==========================================================================================================
// MessageKind
// Purpose: Classification of a decoded envelope for routing and logging.
//==========================================================================================================
enum class MessageKind {
    Request,
    Response,
    Notification
};

//==========================================================================================================
// DecodeError
// Purpose: Describes why a payload is not a valid envelope.
// Fields:
//   code: ParseError for malformed JSON, InvalidRequest for well-formed JSON of the wrong shape.
//   message: Human-readable reason.
//   recoveredId: Identifier salvaged from the payload, when one could be found. Only errors with a
//                recovered id are answered; the rest are dropped.
//==========================================================================================================
struct DecodeError {
    int code{JSONRPCErrorCodes::ParseError};
    std::string message;
    std::optional<JSONRPCId> recoveredId;
};

//==========================================================================================================
// DecodeResult
// Purpose: Either a decoded envelope or a DecodeError.
//==========================================================================================================
struct DecodeResult {
    std::optional<Envelope> envelope;
    std::optional<DecodeError> error;

    bool ok() const { return envelope.has_value(); }
};

//==========================================================================================================
// DecodedPayload
// Purpose: Result of decoding one transport payload, which may be a single envelope or a batch array.
// Fields:
//   batch: True when the payload was a non-empty JSON array.
//   items: One DecodeResult per envelope, in payload order (exactly one when batch is false).
//==========================================================================================================
struct DecodedPayload {
    bool batch{false};
    std::vector<DecodeResult> items;
};

//==========================================================================================================
// DecodeEnvelope
// Purpose: Decodes a single envelope from raw bytes. Never throws.
//==========================================================================================================
DecodeResult DecodeEnvelope(const std::string& bytes);

//==========================================================================================================
// DecodeEnvelopeValue
// Purpose: Decodes a single envelope from an already parsed JSON value (used for batch elements).
//==========================================================================================================
DecodeResult DecodeEnvelopeValue(const JSONValue& value);

//==========================================================================================================
// DecodePayload
// Purpose: Decodes a transport payload that may be a batch array. An empty array yields a single
//          InvalidRequest error item. Never throws.
//==========================================================================================================
DecodedPayload DecodePayload(const std::string& bytes);

//==========================================================================================================
// EncodeEnvelope
// Purpose: Serializes an envelope to compact single-line JSON.
//==========================================================================================================
std::string EncodeEnvelope(const Envelope& envelope);

//==========================================================================================================
// ClassifyEnvelope
// Purpose: Returns the MessageKind of a decoded envelope.
//==========================================================================================================
MessageKind ClassifyEnvelope(const Envelope& envelope);

//==========================================================================================================
// SalvageEnvelopeId
// Purpose: Best-effort recovery of the top-level "id" from text that failed to parse. Only string,
//          integer and null ids at nesting depth 1 are recovered; keys inside params are ignored.
//==========================================================================================================
std::optional<JSONRPCId> SalvageEnvelopeId(const std::string& bytes);

} // namespace toolgate
