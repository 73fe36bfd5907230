//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Protocol.h
// Purpose: Gateway protocol data structures, method names and HTTP header names
//==========================================================================================================

#pragma once

#include "toolgate/JSONRPCTypes.h"
#include "toolgate/errors/Errors.h"
#include <string>
#include <vector>
#include <optional>
#include <unordered_map>

namespace toolgate {
//==========================================================================================================
// Protocol types and constants
// Purpose: Shared protocol structures, capabilities, and method names.
//==========================================================================================================
///////////////////////////////////////// Protocol constants ///////////////////////////////////////////
// Version the gateway itself speaks when it acts as a client (bridge). As a server it never substitutes
// this for the version a caller requested.
constexpr const char* PREFERRED_PROTOCOL_VERSION = "2024-11-05";

namespace Methods {
    constexpr const char* Initialize = "initialize";
    constexpr const char* Ping = "ping";
    constexpr const char* ListTools = "tools/list";
    constexpr const char* CallTool = "tools/call";
    constexpr const char* Initialized = "notifications/initialized";
    constexpr const char* Cancelled = "notifications/cancelled";
}

namespace Headers {
    constexpr const char* SessionId = "Mcp-Session-Id";
    constexpr const char* ResponseMode = "Mcp-Response-Mode";
    constexpr const char* ProtocolVersion = "MCP-Protocol-Version";
}

///////////////////////////////////////// Implementation ///////////////////////////////////////////
// Implementation information
struct Implementation {
    std::string name;
    std::string version;

    Implementation() = default;
    Implementation(std::string name, std::string version)
        : name(std::move(name)), version(std::move(version)) {}
};

///////////////////////////////////////// Capabilities ///////////////////////////////////////////
struct ToolsCapability {
    bool listChanged = false;
};

// A present capability with no options serializes as an empty object, never null.
struct ServerCapabilities {
    std::optional<ToolsCapability> tools{ToolsCapability{}};
    std::unordered_map<std::string, JSONValue> experimental;
};

///////////////////////////////////////// Tools ///////////////////////////////////////////
struct Tool {
    std::string name;
    std::string description;
    JSONValue inputSchema;  // JSON Schema for tool parameters
    std::optional<std::string> title;

    Tool() = default;
    Tool(std::string name, std::string description, JSONValue inputSchema = JSONValue{})
        : name(std::move(name)), description(std::move(description)),
          inputSchema(std::move(inputSchema)) {}
};

struct CallToolResult {
    std::vector<JSONValue> content;  // Array of content items
    bool isError = false;
};

// Builds a {"type":"text","text":...} content item.
JSONValue MakeTextContent(const std::string& text);

// {name, title?, description, inputSchema}; a missing schema is rendered as {"type":"object"}.
JSONValue ToolToJSON(const Tool& tool);

// Reads a tools/list entry. Returns std::nullopt when the entry has no string name.
std::optional<Tool> ToolFromJSON(const JSONValue& value);

// {content:[...], isError}
JSONValue CallToolResultToJSON(const CallToolResult& result);

//==========================================================================================================
// ToolInvocationResult
// Purpose: Outcome of exactly one tool invocation.
// Fields:
//   success: True when the tool produced a result.
//   result: The tools/call result object ({"content":[...],"isError":false}) when success is true.
//   error: Typed failure when success is false. The category tells tool failures (ToolNotFound,
//          JsonRpcInvalidParams, ToolExecutionFailure) apart from network failures (Bridge*).
//==========================================================================================================
struct ToolInvocationResult {
    bool success{false};
    JSONValue result;
    std::optional<errors::McpError> error;

    static ToolInvocationResult Success(JSONValue resultValue) {
        ToolInvocationResult r;
        r.success = true;
        r.result = std::move(resultValue);
        return r;
    }

    static ToolInvocationResult Failure(errors::McpError err) {
        ToolInvocationResult r;
        r.success = false;
        r.error = std::move(err);
        return r;
    }
};

} // namespace toolgate
