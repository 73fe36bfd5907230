//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Errors.h
// Purpose: Typed gateway errors and JSON-RPC error mapping helpers
//==========================================================================================================

#pragma once

#include <memory>
#include <optional>
#include <string>

#include "toolgate/JSONRPCTypes.h"

namespace toolgate {
namespace errors {

// Categorization of the error codes the gateway produces or relays.
enum class ErrorCategory {
    JsonRpcParse,
    JsonRpcInvalidRequest,
    JsonRpcMethodNotFound,
    JsonRpcInvalidParams,
    JsonRpcInternal,
    SessionNotInitialized,
    ToolNotFound,
    ToolExecutionFailure,
    BridgeUnreachable,
    BridgeTimeout,
    BridgeRemoteError,
    Unknown
};

// Typed error representation used across the gateway.
struct McpError {
    int code{0};
    std::string message;
    std::optional<JSONValue> data;
    ErrorCategory category{ErrorCategory::Unknown};
};

// Map a JSON-RPC/gateway numeric error code to an ErrorCategory.
//
// Args:
//   code: The integer error code (JSON-RPC standard or gateway-specific).
//
// Returns:
//   ErrorCategory corresponding to the code, or Unknown when unmapped.
inline ErrorCategory errorCategoryFromCode(int code) {
    switch (code) {
        case JSONRPCErrorCodes::ParseError: return ErrorCategory::JsonRpcParse;
        case JSONRPCErrorCodes::InvalidRequest: return ErrorCategory::JsonRpcInvalidRequest;
        case JSONRPCErrorCodes::MethodNotFound: return ErrorCategory::JsonRpcMethodNotFound;
        case JSONRPCErrorCodes::InvalidParams: return ErrorCategory::JsonRpcInvalidParams;
        case JSONRPCErrorCodes::InternalError: return ErrorCategory::JsonRpcInternal;
        case JSONRPCErrorCodes::ServerNotInitialized: return ErrorCategory::SessionNotInitialized;
        case JSONRPCErrorCodes::ToolNotFound: return ErrorCategory::ToolNotFound;
        case JSONRPCErrorCodes::ToolExecutionFailed: return ErrorCategory::ToolExecutionFailure;
        case JSONRPCErrorCodes::BridgeUnreachable: return ErrorCategory::BridgeUnreachable;
        case JSONRPCErrorCodes::BridgeTimeout: return ErrorCategory::BridgeTimeout;
        case JSONRPCErrorCodes::BridgeRemoteError: return ErrorCategory::BridgeRemoteError;
        default: return ErrorCategory::Unknown;
    }
}

// True for failures that belong to the tool itself rather than to the protocol or the network.
// The bridge relays these from a remote gateway unchanged.
inline bool isToolLevelCategory(ErrorCategory category) {
    return category == ErrorCategory::ToolNotFound ||
           category == ErrorCategory::ToolExecutionFailure ||
           category == ErrorCategory::JsonRpcInvalidParams;
}

// Build a typed error with its category derived from the code.
inline McpError makeError(int code, std::string message, std::optional<JSONValue> data = std::nullopt) {
    McpError e;
    e.code = code;
    e.message = std::move(message);
    e.data = std::move(data);
    e.category = errorCategoryFromCode(code);
    return e;
}

// Convert a JSON-RPC error object (shape: { code, message, data? }) to McpError.
// Returns std::nullopt when the input is not a valid error object.
inline std::optional<McpError> mcpErrorFromErrorValue(const JSONValue& errVal) {
    const JSONValue* codeVal = errVal.Find("code");
    const JSONValue* msgVal = errVal.Find("message");
    if (codeVal == nullptr || msgVal == nullptr) {
        return std::nullopt;
    }
    if (!std::holds_alternative<int64_t>(codeVal->value) || !msgVal->IsString()) {
        return std::nullopt;
    }
    std::optional<JSONValue> data;
    if (const JSONValue* d = errVal.Find("data")) {
        data = *d;
    }
    return makeError(static_cast<int>(std::get<int64_t>(codeVal->value)),
                     std::get<std::string>(msgVal->value), std::move(data));
}

// Extract McpError from a JSONRPCResponse if it carries an error.
inline std::optional<McpError> mcpErrorFromResponse(const JSONRPCResponse& response) {
    if (!response.error.has_value()) {
        return std::nullopt;
    }
    return mcpErrorFromErrorValue(response.error.value());
}

// Create a JSONValue error object from a typed McpError.
inline JSONValue makeErrorValue(const McpError& err) {
    return CreateErrorObject(err.code, err.message, err.data);
}

// Convenience: Create a JSONRPCResponse error from McpError and id.
inline std::unique_ptr<JSONRPCResponse> makeErrorResponse(const JSONRPCId& id, const McpError& err) {
    return CreateErrorResponse(id, err.code, err.message, err.data);
}

} // namespace errors
} // namespace toolgate
