//========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: EnvelopeCodec.cpp
// Purpose: Envelope decoding rules, batch handling and best-effort id recovery for malformed input
//========================================================================================================

#include <optional>
#include <stdexcept>
#include <string>

#include "logging/Logger.h"
#include "toolgate/EnvelopeCodec.h"
#include "toolgate/JSONRPCTypes.h"

namespace toolgate {

namespace {

bool isWs(char c) { return c == ' ' || c == '\t' || c == '\r' || c == '\n'; }

DecodeResult decodeFailure(int code, std::string message, std::optional<JSONRPCId> id = std::nullopt) {
    DecodeResult r;
    DecodeError e;
    e.code = code;
    e.message = std::move(message);
    e.recoveredId = std::move(id);
    r.error = std::move(e);
    return r;
}

// Accepts string, integer and null ids; anything else (fractions, objects, arrays, booleans) is invalid.
std::optional<JSONRPCId> toId(const JSONValue& v) {
    if (std::holds_alternative<std::string>(v.value)) {
        return JSONRPCId(std::get<std::string>(v.value));
    }
    if (std::holds_alternative<int64_t>(v.value)) {
        return JSONRPCId(std::get<int64_t>(v.value));
    }
    if (std::holds_alternative<std::nullptr_t>(v.value)) {
        return JSONRPCId(nullptr);
    }
    return std::nullopt;
}

// Reads the value token that follows a top-level "id": key, starting at position i.
std::optional<JSONRPCId> readIdToken(const std::string& s, std::size_t i) {
    while (i < s.size() && isWs(s[i])) {
        ++i;
    }
    if (i >= s.size()) {
        return std::nullopt;
    }
    const char c = s[i];
    if (c == '"') {
        std::string out;
        ++i;
        while (i < s.size()) {
            char d = s[i++];
            if (d == '"') {
                return JSONRPCId(out);
            }
            if (d == '\\') {
                if (i >= s.size()) {
                    return std::nullopt;
                }
                char e = s[i++];
                switch (e) {
                    case 'n': out.push_back('\n'); break;
                    case 't': out.push_back('\t'); break;
                    case 'r': out.push_back('\r'); break;
                    case 'u': return std::nullopt; // not worth decoding for a best-effort id
                    default: out.push_back(e); break;
                }
                continue;
            }
            out.push_back(d);
        }
        return std::nullopt;
    }
    if (c == '-' || (c >= '0' && c <= '9')) {
        std::size_t e = i + 1;
        while (e < s.size() && s[e] >= '0' && s[e] <= '9') {
            ++e;
        }
        if (e < s.size() && (s[e] == '.' || s[e] == 'e' || s[e] == 'E')) {
            return std::nullopt;
        }
        try {
            return JSONRPCId(static_cast<int64_t>(std::stoll(s.substr(i, e - i))));
        } catch (const std::exception&) {
            return std::nullopt;
        }
    }
    if (s.compare(i, 4, "null") == 0) {
        return JSONRPCId(nullptr);
    }
    return std::nullopt;
}

} // namespace

std::optional<JSONRPCId> SalvageEnvelopeId(const std::string& s) {
    std::size_t i = 0;
    while (i < s.size() && isWs(s[i])) {
        ++i;
    }
    if (i >= s.size() || s[i] != '{') {
        return std::nullopt;
    }
    ++i;
    unsigned int depth = 1u;
    bool inStr = false;
    bool esc = false;
    while (i < s.size()) {
        char c = s[i++];
        if (inStr) {
            if (esc) {
                esc = false;
                continue;
            }
            if (c == '\\') {
                esc = true;
                continue;
            }
            if (c == '"') {
                inStr = false;
            }
            continue;
        }
        if (c == '"') {
            std::string keyStr;
            bool e2 = false;
            while (i < s.size()) {
                char d = s[i++];
                if (e2) {
                    e2 = false;
                    keyStr.push_back(d);
                    continue;
                }
                if (d == '\\') {
                    e2 = true;
                    continue;
                }
                if (d == '"') {
                    break;
                }
                keyStr.push_back(d);
            }
            while (i < s.size() && isWs(s[i])) {
                ++i;
            }
            if (i < s.size() && s[i] == ':') {
                ++i;
                if (depth == 1u && keyStr == "id") {
                    return readIdToken(s, i);
                }
            }
            continue;
        }
        if (c == '{' || c == '[') {
            ++depth;
            continue;
        }
        if (c == '}' || c == ']') {
            if (depth <= 1u) {
                break;
            }
            --depth;
        }
    }
    return std::nullopt;
}

DecodeResult DecodeEnvelopeValue(const JSONValue& value) {
    if (!value.IsObject()) {
        return decodeFailure(JSONRPCErrorCodes::InvalidRequest, "Invalid Request: envelope must be a JSON object");
    }
    const auto& obj = std::get<JSONValue::Object>(value.value);

    const bool hasId = obj.find("id") != obj.end();
    std::optional<JSONRPCId> id;
    if (hasId) {
        const JSONValue* idVal = value.Find("id");
        if (idVal != nullptr) {
            id = toId(*idVal);
        } else {
            id = JSONRPCId(nullptr);
        }
        if (!id.has_value()) {
            return decodeFailure(JSONRPCErrorCodes::InvalidRequest, "Invalid Request: id must be a string, integer or null");
        }
    }

    if (const JSONValue* version = value.Find("jsonrpc")) {
        if (!version->IsString() || std::get<std::string>(version->value) != "2.0") {
            return decodeFailure(JSONRPCErrorCodes::InvalidRequest, "Invalid Request: jsonrpc must be \"2.0\"", id);
        }
    }

    if (const JSONValue* method = value.Find("method")) {
        if (!method->IsString()) {
            return decodeFailure(JSONRPCErrorCodes::InvalidRequest, "Invalid Request: method must be a string", id);
        }
        std::optional<JSONValue> params;
        if (const JSONValue* p = value.Find("params")) {
            if (!p->IsObject() && !p->IsArray()) {
                return decodeFailure(JSONRPCErrorCodes::InvalidRequest, "Invalid Request: params must be an object or array", id);
            }
            params = *p;
        }
        DecodeResult r;
        if (hasId) {
            r.envelope = Envelope(JSONRPCRequest(*id, std::get<std::string>(method->value), std::move(params)));
        } else {
            r.envelope = Envelope(JSONRPCNotification(std::get<std::string>(method->value), std::move(params)));
        }
        return r;
    }

    const bool hasResult = obj.find("result") != obj.end();
    const bool hasError = obj.find("error") != obj.end();
    if (hasResult || hasError) {
        // Responses are never answered, so a malformed one carries no recovered id
        if (!hasId) {
            return decodeFailure(JSONRPCErrorCodes::InvalidRequest, "Invalid Response: missing id");
        }
        if (hasResult && hasError) {
            return decodeFailure(JSONRPCErrorCodes::InvalidRequest, "Invalid Response: both result and error present");
        }
        JSONRPCResponse response;
        response.id = *id;
        if (hasError) {
            const JSONValue* err = value.Find("error");
            response.error = err ? *err : JSONValue(nullptr);
        } else {
            const JSONValue* res = value.Find("result");
            response.result = res ? *res : JSONValue(nullptr);
        }
        DecodeResult r;
        r.envelope = Envelope(std::move(response));
        return r;
    }

    return decodeFailure(JSONRPCErrorCodes::InvalidRequest, "Invalid Request: missing method", id);
}

DecodeResult DecodeEnvelope(const std::string& bytes) {
    JSONValue parsed;
    try {
        parsed = parseJSON(bytes);
    } catch (const std::exception& e) {
        LOG_DEBUG("Envelope parse failure: {}", e.what());
        return decodeFailure(JSONRPCErrorCodes::ParseError, std::string("Parse error: ") + e.what(), SalvageEnvelopeId(bytes));
    }
    return DecodeEnvelopeValue(parsed);
}

DecodedPayload DecodePayload(const std::string& bytes) {
    DecodedPayload out;
    JSONValue parsed;
    try {
        parsed = parseJSON(bytes);
    } catch (const std::exception& e) {
        LOG_DEBUG("Payload parse failure: {}", e.what());
        out.items.push_back(decodeFailure(JSONRPCErrorCodes::ParseError, std::string("Parse error: ") + e.what(), SalvageEnvelopeId(bytes)));
        return out;
    }
    if (parsed.IsArray()) {
        const auto& arr = std::get<JSONValue::Array>(parsed.value);
        if (arr.empty()) {
            out.items.push_back(decodeFailure(JSONRPCErrorCodes::InvalidRequest, "Invalid Request: empty batch"));
            return out;
        }
        out.batch = true;
        out.items.reserve(arr.size());
        for (const auto& item : arr) {
            out.items.push_back(DecodeEnvelopeValue(item ? *item : JSONValue(nullptr)));
        }
        return out;
    }
    out.items.push_back(DecodeEnvelopeValue(parsed));
    return out;
}

std::string EncodeEnvelope(const Envelope& envelope) {
    return std::visit([](const auto& message) { return message.Serialize(); }, envelope);
}

MessageKind ClassifyEnvelope(const Envelope& envelope) {
    if (std::holds_alternative<JSONRPCRequest>(envelope)) {
        return MessageKind::Request;
    }
    if (std::holds_alternative<JSONRPCResponse>(envelope)) {
        return MessageKind::Response;
    }
    return MessageKind::Notification;
}

} // namespace toolgate
