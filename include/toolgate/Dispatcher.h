//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Dispatcher.h
// Purpose: Session-aware routing of decoded envelopes to the built-in protocol methods
//==========================================================================================================

#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <string>

#include "toolgate/EnvelopeCodec.h"
#include "toolgate/Protocol.h"
#include "toolgate/SessionManager.h"
#include "toolgate/ToolRegistry.h"

namespace toolgate {

//==========================================================================================================
// MethodTag / NotificationTag
// Purpose: Closed set of methods the gateway answers. Anything else resolves to Unknown.
//==========================================================================================================
enum class MethodTag {
    Initialize,
    Ping,
    ToolsList,
    ToolsCall,
    Unknown
};

enum class NotificationTag {
    Initialized,
    Cancelled,
    Unknown
};

MethodTag methodTagFromName(const std::string& method);
NotificationTag notificationTagFromName(const std::string& method);

//==========================================================================================================
// ConnectionContext
// Purpose: Per-connection state owned by a transport adapter.
// Fields:
//   sessionId: Session bound to the connection. Set by initialize, cleared when the session is unknown.
//   protocolVersion: Negotiated version of the bound session, filled in on every dispatch.
//   ownsSession: True when the context lives as long as the connection (stdio). Its session never idles
//                out and a second initialize replaces it. HTTP builds a context per request from the
//                Mcp-Session-Id header and clears this flag, so initialize there always issues a new
//                session and leaves the named one alone.
//==========================================================================================================
struct ConnectionContext {
    std::optional<std::string> sessionId;
    std::optional<std::string> protocolVersion;
    bool ownsSession{true};
};

//==========================================================================================================
// DispatchResult
// Purpose: Outcome of handling one raw transport payload.
// Fields:
//   reply: Serialized reply (single envelope or batch array). Empty when nothing needs answering.
//   malformed: True when the payload could not be decoded and no id was recoverable. reply then holds
//              an error envelope with a null id; adapters choose whether to send it.
//==========================================================================================================
struct DispatchResult {
    std::optional<std::string> reply;
    bool malformed{false};
};

//==========================================================================================================
// Dispatcher
// Purpose: Applies the session rules and runs the built-in methods against the tool registry.
// Notes:
//   Dispatch and HandlePayload never throw. Any exception raised while handling a request becomes an
//   InternalError response. Notifications never produce a reply.
//==========================================================================================================
class Dispatcher {
public:
    struct Options {
        Implementation serverInfo{"toolgate", ""};
        ServerCapabilities capabilities;
        std::optional<std::string> instructions;
        std::size_t listPageSize{0};  // 0 = all tools in one page
    };

    Dispatcher(ToolRegistry& registry, SessionManager& sessions);
    Dispatcher(ToolRegistry& registry, SessionManager& sessions, Options options);
    ~Dispatcher();

    Dispatcher(const Dispatcher&) = delete;
    Dispatcher& operator=(const Dispatcher&) = delete;

    //======================================================================================================
    // Dispatch
    // Purpose: Handles one decoded envelope.
    // Returns:
    //   The response for a Request; std::nullopt for Notifications and Responses.
    //======================================================================================================
    std::optional<JSONRPCResponse> Dispatch(const Envelope& envelope, ConnectionContext& ctx);

    //======================================================================================================
    // HandlePayload
    // Purpose: Decodes raw bytes (single envelope or batch) and dispatches every element in order.
    //======================================================================================================
    DispatchResult HandlePayload(const std::string& payload, ConnectionContext& ctx);

    // Releases the session bound to ctx, if any.
    void CloseConnection(ConnectionContext& ctx);

    SessionManager& Sessions();
    const ToolRegistry& Tools() const;
    const Options& GetOptions() const;

    // Capabilities advertised in the initialize result.
    JSONValue ServerCapabilitiesJSON() const;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace toolgate
