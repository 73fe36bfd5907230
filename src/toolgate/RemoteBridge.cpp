//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: RemoteBridge.cpp
// Purpose: Remote tool invocation over HTTPTransport with typed failure mapping
//==========================================================================================================

#include "toolgate/RemoteBridge.h"

#include <algorithm>
#include <atomic>
#include <future>
#include <mutex>
#include <set>
#include <stdexcept>

#include "logging/Logger.h"
#include "toolgate/HTTPTransport.hpp"

namespace toolgate {

namespace {

using Clock = std::chrono::steady_clock;

// Remote answered with an error envelope that is not a tool-level failure.
class RemoteEnvelopeError : public std::runtime_error {
public:
    explicit RemoteEnvelopeError(JSONValue err)
        : std::runtime_error("remote error envelope"), errorValue(std::move(err)) {}
    const JSONValue& error() const { return errorValue; }

private:
    JSONValue errorValue;
};

template <class T>
T awaitUntil(std::future<T>& fut, Clock::time_point deadline) {
    if (fut.wait_until(deadline) == std::future_status::timeout) {
        throw TransportError(TransportError::Kind::Timeout, "deadline exceeded");
    }
    return fut.get();
}

} // namespace

class RemoteBridge::Impl {
public:
    BridgeTarget target;
    Implementation clientInfo;
    std::unique_ptr<HTTPTransport> transport;
    std::mutex sessionMutex;
    bool sessionReady{false};
    std::atomic<std::uint64_t> counter{0u};

    Impl(BridgeTarget t, Implementation info) : target(std::move(t)), clientInfo(std::move(info)) {
        if (target.timeout.count() <= 0) {
            throw std::invalid_argument("RemoteBridge: timeout must be positive");
        }
        HTTPTransport::Options opts = HTTPTransport::OptionsFromUrl(target.url);
        const auto ms = static_cast<unsigned int>(target.timeout.count());
        opts.readTimeoutMs = ms;
        opts.connectTimeoutMs = std::min(opts.connectTimeoutMs, ms);
        transport = std::make_unique<HTTPTransport>(opts);
        transport->SetErrorHandler([url = target.url](const std::string& msg) {
            LOG_DEBUG("RemoteBridge[{}] transport: {}", url, msg);
        });
        transport->Start().get();
    }

    JSONRPCId nextId() { return JSONRPCId{std::string("bridge-") + std::to_string(++counter)}; }

    std::unique_ptr<JSONRPCResponse> call(const std::string& method, JSONValue params, Clock::time_point deadline) {
        auto req = std::make_unique<JSONRPCRequest>(nextId(), method, std::move(params));
        auto fut = transport->SendRequest(std::move(req));
        return awaitUntil(fut, deadline);
    }

    void invalidateSession() {
        std::lock_guard<std::mutex> lk(sessionMutex);
        sessionReady = false;
        transport->SetSessionId(std::string());
    }

    //======================================================================================================
    // ensureSession
    // Purpose: Performs the remote initialize handshake once. Serialized so concurrent invocations share
    //          one remote session.
    //======================================================================================================
    void ensureSession(Clock::time_point deadline) {
        std::lock_guard<std::mutex> lk(sessionMutex);
        if (sessionReady) {
            return;
        }
        transport->SetSessionId(std::string());

        JSONValue::Object info;
        info["name"] = std::make_shared<JSONValue>(clientInfo.name);
        info["version"] = std::make_shared<JSONValue>(clientInfo.version);
        JSONValue::Object params;
        params["protocolVersion"] = std::make_shared<JSONValue>(std::string(PREFERRED_PROTOCOL_VERSION));
        params["capabilities"] = std::make_shared<JSONValue>(JSONValue::Object{});
        params["clientInfo"] = std::make_shared<JSONValue>(std::move(info));

        auto resp = call(Methods::Initialize, JSONValue{params}, deadline);
        if (resp->error.has_value()) {
            throw RemoteEnvelopeError(resp->error.value());
        }
        std::string negotiated = PREFERRED_PROTOCOL_VERSION;
        if (resp->result.has_value()) {
            const JSONValue* pv = resp->result->Find("protocolVersion");
            if (pv != nullptr && pv->IsString()) {
                negotiated = std::get<std::string>(pv->value);
            }
        }
        transport->SetProtocolVersion(negotiated);

        auto fut = transport->SendNotification(std::make_unique<JSONRPCNotification>(Methods::Initialized));
        awaitUntil(fut, deadline);
        sessionReady = true;
        LOG_INFO("RemoteBridge: session {} established with {} (protocol {})",
                 transport->GetSessionId(), target.url, negotiated);
    }

    // True when the remote rejected the call because it no longer knows our session.
    static bool sessionLost(const JSONRPCResponse& resp) {
        if (!resp.error.has_value()) return false;
        auto remote = errors::mcpErrorFromErrorValue(resp.error.value());
        return remote.has_value() && remote->category == errors::ErrorCategory::SessionNotInitialized;
    }

    //======================================================================================================
    // callInSession
    // Purpose: Sends one request inside the remote session. A lost session is re-established once and
    //          the request retried; a second rejection is returned to the caller as-is.
    //======================================================================================================
    std::unique_ptr<JSONRPCResponse> callInSession(const std::string& method, const JSONValue& params,
                                                   Clock::time_point deadline) {
        ensureSession(deadline);
        auto resp = call(method, params, deadline);
        if (sessionLost(*resp)) {
            LOG_INFO("RemoteBridge: remote session lost at {}; re-initializing", target.url);
            invalidateSession();
            ensureSession(deadline);
            resp = call(method, params, deadline);
        }
        return resp;
    }

    JSONValue remoteData() const {
        JSONValue::Object data;
        data["remote"] = std::make_shared<JSONValue>(target.url);
        return JSONValue{data};
    }

    errors::McpError fromTransportError(const TransportError& e) {
        JSONValue::Object data;
        data["remote"] = std::make_shared<JSONValue>(target.url);
        data["detail"] = std::make_shared<JSONValue>(std::string(e.what()));
        switch (e.kind()) {
            case TransportError::Kind::Timeout:
                invalidateSession();
                return errors::makeError(JSONRPCErrorCodes::BridgeTimeout,
                                         "Remote gateway timed out after " + std::to_string(target.timeout.count()) + " ms",
                                         JSONValue{data});
            case TransportError::Kind::HttpStatus:
                data["status"] = std::make_shared<JSONValue>(static_cast<int64_t>(e.httpStatus()));
                if (!e.body().empty()) {
                    data["body"] = std::make_shared<JSONValue>(e.body());
                }
                if (e.httpStatus() == 404) {
                    // A restarted remote no longer knows our session
                    invalidateSession();
                }
                return errors::makeError(JSONRPCErrorCodes::BridgeRemoteError,
                                         "Remote gateway returned HTTP " + std::to_string(e.httpStatus()), JSONValue{data});
            case TransportError::Kind::InvalidResponse:
                if (!e.body().empty()) {
                    data["body"] = std::make_shared<JSONValue>(e.body());
                }
                return errors::makeError(JSONRPCErrorCodes::BridgeRemoteError,
                                         "Remote gateway returned an unusable response", JSONValue{data});
            case TransportError::Kind::Unreachable:
            case TransportError::Kind::Closed:
            default:
                invalidateSession();
                return errors::makeError(JSONRPCErrorCodes::BridgeUnreachable,
                                         "Remote gateway unreachable: " + target.url, JSONValue{data});
        }
    }

    errors::McpError fromRemoteEnvelope(const JSONValue& err) const {
        JSONValue::Object data;
        data["remote"] = std::make_shared<JSONValue>(target.url);
        data["remoteError"] = std::make_shared<JSONValue>(err);
        std::string message = "Remote gateway error";
        if (auto remote = errors::mcpErrorFromErrorValue(err)) {
            message += ": " + remote->message;
        }
        return errors::makeError(JSONRPCErrorCodes::BridgeRemoteError, message, JSONValue{data});
    }
};

RemoteBridge::RemoteBridge(BridgeTarget target, Implementation clientInfo)
    : pImpl(std::make_unique<Impl>(std::move(target), std::move(clientInfo))) {}

RemoteBridge::~RemoteBridge() = default;

const BridgeTarget& RemoteBridge::Target() const {
    return pImpl->target;
}

std::string RemoteBridge::RemoteSessionId() const {
    return pImpl->transport->GetSessionId();
}

ToolInvocationResult RemoteBridge::Invoke(const std::string& name, const JSONValue& arguments) {
    FUNC_SCOPE();
    const auto deadline = Clock::now() + pImpl->target.timeout;

    JSONValue::Object params;
    params["name"] = std::make_shared<JSONValue>(name);
    params["arguments"] = std::make_shared<JSONValue>(arguments.IsNull() ? JSONValue{JSONValue::Object{}} : arguments);
    const JSONValue paramsValue{params};

    try {
        auto resp = pImpl->callInSession(Methods::CallTool, paramsValue, deadline);
        if (!resp->error.has_value()) {
            if (!resp->result.has_value()) {
                throw TransportError(TransportError::Kind::InvalidResponse, "response has neither result nor error");
            }
            return ToolInvocationResult::Success(std::move(resp->result.value()));
        }
        if (Impl::sessionLost(*resp)) {
            pImpl->invalidateSession();
            return ToolInvocationResult::Failure(errors::makeError(JSONRPCErrorCodes::BridgeRemoteError,
                                                                   "Remote gateway keeps rejecting the session",
                                                                   pImpl->remoteData()));
        }
        auto remote = errors::mcpErrorFromErrorValue(resp->error.value());
        if (remote.has_value() && errors::isToolLevelCategory(remote->category)) {
            return ToolInvocationResult::Failure(std::move(remote.value()));
        }
        return ToolInvocationResult::Failure(pImpl->fromRemoteEnvelope(resp->error.value()));
    } catch (const TransportError& e) {
        LOG_WARN("RemoteBridge: {} via {} failed: {}", name, pImpl->target.url, e.what());
        return ToolInvocationResult::Failure(pImpl->fromTransportError(e));
    } catch (const RemoteEnvelopeError& e) {
        LOG_WARN("RemoteBridge: initialize rejected by {}", pImpl->target.url);
        return ToolInvocationResult::Failure(pImpl->fromRemoteEnvelope(e.error()));
    } catch (const std::exception& e) {
        LOG_ERROR("RemoteBridge: {} via {} raised: {}", name, pImpl->target.url, e.what());
        return ToolInvocationResult::Failure(errors::makeError(JSONRPCErrorCodes::InternalError, e.what(), pImpl->remoteData()));
    }
}

std::vector<Tool> RemoteBridge::ListTools() {
    FUNC_SCOPE();
    std::vector<Tool> tools;
    std::optional<std::string> cursor;
    std::set<std::string> seenCursors;
    try {
        do {
            const auto deadline = Clock::now() + pImpl->target.timeout;
            JSONValue::Object params;
            if (cursor.has_value()) {
                params["cursor"] = std::make_shared<JSONValue>(cursor.value());
            }
            auto resp = pImpl->callInSession(Methods::ListTools, JSONValue{params}, deadline);
            if (resp->error.has_value()) {
                throw RemoteEnvelopeError(resp->error.value());
            }
            const JSONValue* list = resp->result.has_value() ? resp->result->Find("tools") : nullptr;
            if (list == nullptr || !list->IsArray()) {
                throw std::runtime_error("tools/list result has no tools array");
            }
            for (const auto& item : std::get<JSONValue::Array>(list->value)) {
                if (!item) continue;
                if (auto tool = ToolFromJSON(*item)) {
                    tools.push_back(std::move(tool.value()));
                } else {
                    LOG_WARN("RemoteBridge: skipping remote tool entry without a name");
                }
            }
            cursor.reset();
            const JSONValue* next = resp->result->Find("nextCursor");
            if (next != nullptr && next->IsString()) {
                cursor = std::get<std::string>(next->value);
                if (!seenCursors.insert(cursor.value()).second) {
                    throw std::runtime_error("RemoteBridge: tools/list at " + pImpl->target.url +
                                             " repeated cursor '" + cursor.value() + "'");
                }
            }
        } while (cursor.has_value());
    } catch (const TransportError& e) {
        const auto err = pImpl->fromTransportError(e);
        throw std::runtime_error("RemoteBridge: tools/list at " + pImpl->target.url + " failed: " + err.message + " (" + e.what() + ")");
    } catch (const RemoteEnvelopeError& e) {
        throw std::runtime_error("RemoteBridge: tools/list at " + pImpl->target.url + " failed: " + serializeJSONValue(e.error()));
    }
    LOG_INFO("RemoteBridge: {} remote tools listed at {}", tools.size(), pImpl->target.url);
    return tools;
}

} // namespace toolgate
