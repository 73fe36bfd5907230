//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Dispatcher.cpp
// Purpose: Built-in method handlers (initialize, ping, tools/list, tools/call) and notification handling
//==========================================================================================================

#include "toolgate/Dispatcher.h"

#include <stdexcept>

#include "logging/Logger.h"
#include "toolgate/errors/Errors.h"
#include "toolgate/version.h"

namespace toolgate {

MethodTag methodTagFromName(const std::string& method) {
    if (method == Methods::Initialize) return MethodTag::Initialize;
    if (method == Methods::Ping) return MethodTag::Ping;
    if (method == Methods::ListTools) return MethodTag::ToolsList;
    if (method == Methods::CallTool) return MethodTag::ToolsCall;
    return MethodTag::Unknown;
}

NotificationTag notificationTagFromName(const std::string& method) {
    if (method == Methods::Initialized) return NotificationTag::Initialized;
    if (method == Methods::Cancelled) return NotificationTag::Cancelled;
    return NotificationTag::Unknown;
}

namespace {

JSONRPCResponse errorResponse(const JSONRPCId& id, const errors::McpError& e) {
    return JSONRPCResponse(id, errors::makeErrorValue(e), true);
}

JSONRPCResponse errorResponse(const JSONRPCId& id, int code, const std::string& message) {
    return errorResponse(id, errors::makeError(code, message));
}

std::optional<std::string> stringMember(const JSONValue& obj, const char* key) {
    const JSONValue* v = obj.Find(key);
    if (v == nullptr || !v->IsString()) return std::nullopt;
    return std::get<std::string>(v->value);
}

} // namespace

class Dispatcher::Impl {
public:
    Impl(ToolRegistry& reg, SessionManager& sess, Options opts)
        : registry(reg), sessions(sess), options(std::move(opts)) {
        if (options.serverInfo.version.empty()) {
            options.serverInfo.version = getVersionString();
        }
    }

    ToolRegistry& registry;
    SessionManager& sessions;
    Options options;

    JSONValue serializeServerCapabilities() const {
        JSONValue::Object caps;
        const ServerCapabilities& sc = options.capabilities;
        if (sc.tools.has_value()) {
            // listChanged is only advertised when true; an option-less capability stays {}
            JSONValue::Object tools;
            if (sc.tools->listChanged) {
                tools["listChanged"] = std::make_shared<JSONValue>(true);
            }
            caps["tools"] = std::make_shared<JSONValue>(std::move(tools));
        }
        if (!sc.experimental.empty()) {
            JSONValue::Object exp;
            for (const auto& kv : sc.experimental) {
                exp[kv.first] = std::make_shared<JSONValue>(kv.second);
            }
            caps["experimental"] = std::make_shared<JSONValue>(std::move(exp));
        }
        return JSONValue{caps};
    }

    // Resolves the session bound to ctx; clears the binding when it is unknown or expired.
    std::optional<Session> activeSession(ConnectionContext& ctx) {
        ctx.protocolVersion.reset();
        if (!ctx.sessionId.has_value()) {
            return std::nullopt;
        }
        auto s = sessions.Find(ctx.sessionId.value());
        if (!s.has_value()) {
            LOG_DEBUG("Unknown or expired session: {}", ctx.sessionId.value());
            ctx.sessionId.reset();
            return std::nullopt;
        }
        ctx.protocolVersion = s->protocolVersion;
        return s;
    }

    JSONRPCResponse handleInitialize(const JSONRPCRequest& req, ConnectionContext& ctx) {
        LOG_INFO("Handling initialize request");
        if (!req.params.has_value() || !req.params->IsObject()) {
            return errorResponse(req.id, JSONRPCErrorCodes::InvalidParams, "Invalid params: initialize requires an object");
        }
        const JSONValue& params = req.params.value();
        auto version = stringMember(params, "protocolVersion");
        if (!version.has_value()) {
            return errorResponse(req.id, JSONRPCErrorCodes::InvalidParams, "Invalid params: protocolVersion must be a string");
        }

        Implementation clientInfo;
        if (const JSONValue* ci = params.Find("clientInfo")) {
            clientInfo.name = stringMember(*ci, "name").value_or("");
            clientInfo.version = stringMember(*ci, "version").value_or("");
        }
        JSONValue clientCaps{JSONValue::Object{}};
        if (const JSONValue* cc = params.Find("capabilities")) {
            if (cc->IsObject()) clientCaps = *cc;
        }

        // Re-initialize replaces the connection's own session; a session merely named by a header stays
        if (ctx.sessionId.has_value()) {
            if (ctx.ownsSession) {
                sessions.Remove(ctx.sessionId.value());
            }
            ctx.sessionId.reset();
        }
        const JSONValue serverCaps = serializeServerCapabilities();
        Session s = sessions.Create(version.value(), clientInfo, clientCaps, serverCaps, !ctx.ownsSession);
        ctx.sessionId = s.id;
        ctx.protocolVersion = s.protocolVersion;

        JSONValue::Object resultObj;
        resultObj["protocolVersion"] = std::make_shared<JSONValue>(s.protocolVersion);
        resultObj["capabilities"] = std::make_shared<JSONValue>(serverCaps);
        JSONValue::Object serverInfoObj;
        serverInfoObj["name"] = std::make_shared<JSONValue>(options.serverInfo.name);
        serverInfoObj["version"] = std::make_shared<JSONValue>(options.serverInfo.version);
        resultObj["serverInfo"] = std::make_shared<JSONValue>(serverInfoObj);
        if (options.instructions.has_value()) {
            resultObj["instructions"] = std::make_shared<JSONValue>(options.instructions.value());
        }
        return JSONRPCResponse(req.id, JSONValue{resultObj});
    }

    JSONRPCResponse handleToolsList(const JSONRPCRequest& req) {
        LOG_DEBUG("Handling tools/list request");
        std::size_t start = 0;
        if (req.params.has_value() && req.params->IsObject()) {
            if (const JSONValue* c = req.params->Find("cursor")) {
                if (!c->IsNull()) {
                    if (!c->IsString()) {
                        return errorResponse(req.id, JSONRPCErrorCodes::InvalidParams, "Invalid params: cursor must be a string");
                    }
                    const std::string& cursor = std::get<std::string>(c->value);
                    try {
                        std::size_t pos = 0;
                        const unsigned long long v = std::stoull(cursor, &pos);
                        if (pos != cursor.size()) throw std::invalid_argument("trailing characters");
                        start = static_cast<std::size_t>(v);
                    } catch (const std::exception&) {
                        return errorResponse(req.id, JSONRPCErrorCodes::InvalidParams, "Invalid params: bad cursor");
                    }
                }
            }
        }

        const std::vector<Tool> tools = registry.List();
        const std::size_t total = tools.size();
        if (start > total) start = total;
        std::size_t end = total;
        if (options.listPageSize > 0 && total - start > options.listPageSize) {
            end = start + options.listPageSize;
        }

        JSONValue::Object resultObj;
        JSONValue::Array arr;
        for (std::size_t i = start; i < end; ++i) {
            arr.push_back(std::make_shared<JSONValue>(ToolToJSON(tools[i])));
        }
        resultObj["tools"] = std::make_shared<JSONValue>(std::move(arr));
        if (end < total) {
            resultObj["nextCursor"] = std::make_shared<JSONValue>(std::to_string(end));
        }
        return JSONRPCResponse(req.id, JSONValue{resultObj});
    }

    JSONRPCResponse handleToolsCall(const JSONRPCRequest& req) {
        std::string name;
        JSONValue arguments;
        if (req.params.has_value() && req.params->IsObject()) {
            name = stringMember(req.params.value(), "name").value_or("");
            if (const JSONValue* a = req.params->Find("arguments")) {
                arguments = *a;
            }
        }
        if (name.empty()) {
            return errorResponse(req.id, JSONRPCErrorCodes::InvalidParams, "Invalid params: tools/call requires a tool name");
        }
        LOG_DEBUG("Handling tools/call request for '{}'", name);
        ToolInvocationResult r = registry.Invoke(name, arguments);
        if (r.success) {
            return JSONRPCResponse(req.id, std::move(r.result));
        }
        if (r.error.has_value()) {
            return errorResponse(req.id, r.error.value());
        }
        return errorResponse(req.id, JSONRPCErrorCodes::InternalError, "Tool invocation failed without an error");
    }

    JSONRPCResponse handleRequest(const JSONRPCRequest& req, ConnectionContext& ctx) {
        const MethodTag tag = methodTagFromName(req.method);
        if (tag == MethodTag::Initialize) {
            return handleInitialize(req, ctx);
        }
        if (!activeSession(ctx).has_value()) {
            LOG_DEBUG("Rejecting '{}' before initialize", req.method);
            return errorResponse(req.id, JSONRPCErrorCodes::ServerNotInitialized, "Server not initialized");
        }
        switch (tag) {
            case MethodTag::Ping:
                return JSONRPCResponse(req.id, JSONValue{JSONValue::Object{}});
            case MethodTag::ToolsList:
                return handleToolsList(req);
            case MethodTag::ToolsCall:
                return handleToolsCall(req);
            case MethodTag::Initialize:
            case MethodTag::Unknown:
            default:
                return errorResponse(req.id, JSONRPCErrorCodes::MethodNotFound, "Method not found: " + req.method);
        }
    }

    void handleNotification(const JSONRPCNotification& note, ConnectionContext& ctx) {
        switch (notificationTagFromName(note.method)) {
            case NotificationTag::Initialized: {
                if (activeSession(ctx).has_value()) {
                    sessions.MarkInitialized(ctx.sessionId.value());
                    LOG_DEBUG("Client confirmed initialization for session {}", ctx.sessionId.value());
                } else {
                    LOG_WARN("notifications/initialized without an active session");
                }
                break;
            }
            case NotificationTag::Cancelled: {
                std::string requestId = "?";
                if (note.params.has_value()) {
                    if (const JSONValue* rid = note.params->Find("requestId")) {
                        requestId = serializeJSONValue(*rid);
                    }
                }
                LOG_INFO("Cancellation requested for request {} (not supported, ignored)", requestId);
                break;
            }
            case NotificationTag::Unknown:
            default:
                LOG_DEBUG("Ignoring notification '{}'", note.method);
                break;
        }
    }
};

Dispatcher::Dispatcher(ToolRegistry& registry, SessionManager& sessions)
    : Dispatcher(registry, sessions, Options{}) {}

Dispatcher::Dispatcher(ToolRegistry& registry, SessionManager& sessions, Options options)
    : pImpl(std::make_unique<Impl>(registry, sessions, std::move(options))) {}

Dispatcher::~Dispatcher() = default;

std::optional<JSONRPCResponse> Dispatcher::Dispatch(const Envelope& envelope, ConnectionContext& ctx) {
    if (const auto* req = std::get_if<JSONRPCRequest>(&envelope)) {
        try {
            return pImpl->handleRequest(*req, ctx);
        } catch (const std::exception& e) {
            LOG_ERROR("Unhandled exception in '{}': {}", req->method, e.what());
            return errorResponse(req->id, JSONRPCErrorCodes::InternalError, std::string("Internal error: ") + e.what());
        }
    }
    if (const auto* note = std::get_if<JSONRPCNotification>(&envelope)) {
        try {
            pImpl->handleNotification(*note, ctx);
        } catch (const std::exception& e) {
            LOG_ERROR("Notification '{}' failed: {}", note->method, e.what());
        }
        return std::nullopt;
    }
    const auto& resp = std::get<JSONRPCResponse>(envelope);
    LOG_DEBUG("Ignoring response envelope from caller (id {})", idToString(resp.id));
    return std::nullopt;
}

DispatchResult Dispatcher::HandlePayload(const std::string& payload, ConnectionContext& ctx) {
    DispatchResult out;
    DecodedPayload decoded = DecodePayload(payload);

    std::vector<std::string> replies;
    for (const auto& item : decoded.items) {
        if (item.ok()) {
            auto resp = Dispatch(item.envelope.value(), ctx);
            if (resp.has_value()) {
                replies.push_back(resp->Serialize());
            }
            continue;
        }
        const DecodeError& err = item.error.value();
        LOG_WARN("Undecodable envelope: {}", err.message);
        if (err.recoveredId.has_value()) {
            replies.push_back(errorResponse(err.recoveredId.value(), err.code, err.message).Serialize());
        } else if (decoded.batch) {
            replies.push_back(errorResponse(JSONRPCId(nullptr), err.code, err.message).Serialize());
        } else {
            out.malformed = true;
            replies.push_back(errorResponse(JSONRPCId(nullptr), err.code, err.message).Serialize());
        }
    }

    if (replies.empty()) {
        return out;
    }
    if (!decoded.batch) {
        out.reply = std::move(replies.front());
        return out;
    }
    std::string joined = "[";
    for (std::size_t i = 0; i < replies.size(); ++i) {
        if (i) joined += ",";
        joined += replies[i];
    }
    joined += "]";
    out.reply = std::move(joined);
    return out;
}

void Dispatcher::CloseConnection(ConnectionContext& ctx) {
    if (ctx.sessionId.has_value()) {
        pImpl->sessions.Remove(ctx.sessionId.value());
        ctx.sessionId.reset();
    }
    ctx.protocolVersion.reset();
}

SessionManager& Dispatcher::Sessions() {
    return pImpl->sessions;
}

const ToolRegistry& Dispatcher::Tools() const {
    return pImpl->registry;
}

const Dispatcher::Options& Dispatcher::GetOptions() const {
    return pImpl->options;
}

JSONValue Dispatcher::ServerCapabilitiesJSON() const {
    return pImpl->serializeServerCapabilities();
}

} // namespace toolgate
