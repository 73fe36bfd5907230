//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: HTTPTransport.hpp
// Purpose: Coroutine-based HTTP/HTTPS client transport for talking to a remote gateway using Boost.Beast
//          (TLS 1.3 only for HTTPS)
//==========================================================================================================

#pragma once

#include <memory>
#include <string>
#include <future>
#include <functional>
#include <optional>
#include <stdexcept>

#include "toolgate/Transport.h"

namespace toolgate {

//==========================================================================================================
// TransportError
// Purpose: Failure of the client transport itself, delivered through the futures it returns.
// Kinds:
//   Unreachable: Resolve, connect or I/O failure.
//   Timeout: Connect or read deadline exceeded.
//   HttpStatus: The peer answered with a non-2xx status (httpStatus() and body() carry the details).
//   InvalidResponse: A 2xx answer whose body is not a usable JSON-RPC response.
//   Closed: The transport was closed (or never started) before the exchange completed.
//==========================================================================================================
class TransportError : public std::runtime_error {
public:
    enum class Kind {
        Unreachable,
        Timeout,
        HttpStatus,
        InvalidResponse,
        Closed
    };

    TransportError(Kind kind, const std::string& message, int httpStatus = 0, std::string body = std::string())
        : std::runtime_error(message), errKind(kind), status(httpStatus), responseBody(std::move(body)) {}

    Kind kind() const { return errKind; }
    int httpStatus() const { return status; }
    const std::string& body() const { return responseBody; }

private:
    Kind errKind;
    int status;
    std::string responseBody;
};

const char* transportErrorKindName(TransportError::Kind kind);

//==========================================================================================================
// HTTPTransport
// Purpose: Concrete HTTP/HTTPS transport implementing ITransport using Boost.Beast coroutines.
// Notes:
//   - Every envelope is POSTed to one endpoint path. The Mcp-Session-Id response header is captured and
//     sent on later requests.
//   - Replies delivered as text/event-stream are accepted; the first "message" event carrying the
//     response is used.
//==========================================================================================================
class HTTPTransport : public ITransport {
public:
    //==========================================================================================================
    // Options
    // Purpose: Configuration for the remote endpoint and TLS verification.
    // Fields:
    //   scheme: "http" or "https" (default: http)
    //   host/port: Remote endpoint (default: localhost:8000)
    //   rpcPath: Endpoint path (default: /mcp)
    //   serverName: TLS SNI and hostname verification name (when https; defaults to host)
    //   caFile/caPath: Optional CA bundle/path for trust store
    //   connectTimeoutMs/readTimeoutMs: Per-exchange deadlines in milliseconds
    //   sessionId: Session header to send from the first request on (optional)
    //   protocolVersion: Value for the MCP-Protocol-Version request header (omitted when empty)
    //   responseMode: Value for the Mcp-Response-Mode request header (omitted when empty)
    //==========================================================================================================
    struct Options {
        std::string scheme{"http"};
        std::string host{"localhost"};
        std::string port{"8000"};
        std::string rpcPath{"/mcp"};
        std::string serverName;
        std::string caFile;
        std::string caPath;
        unsigned int connectTimeoutMs{10000};
        unsigned int readTimeoutMs{30000};
        std::string sessionId;
        std::string protocolVersion;
        std::string responseMode;
    };

    explicit HTTPTransport(const Options& opts);
    ~HTTPTransport() override;

    //==========================================================================================================
    // OptionsFromUrl
    // Purpose: Builds options from "scheme://host[:port]/path". Missing ports default to 80/443 and a
    //          missing path to "/mcp".
    // Throws:
    //   std::invalid_argument for an empty host or an unsupported scheme.
    //==========================================================================================================
    static Options OptionsFromUrl(const std::string& url);

    ////////////////////////////////////////// ITransport //////////////////////////////////////////
    std::future<void> Start() override;

    //==========================================================================================================
    // Stops the I/O loop. Exchanges still in flight fail with TransportError::Kind::Closed.
    //==========================================================================================================
    std::future<void> Close() override;

    bool IsConnected() const override;
    std::string GetSessionId() const override;

    //==========================================================================================================
    // Sends a request; the future yields the response envelope (which may carry a JSON-RPC error) or
    // throws TransportError.
    //==========================================================================================================
    std::future<std::unique_ptr<JSONRPCResponse>> SendRequest(
        std::unique_ptr<JSONRPCRequest> request) override;

    //==========================================================================================================
    // Sends a notification; the future completes on a 2xx acknowledgement or throws TransportError.
    //==========================================================================================================
    std::future<void> SendNotification(
        std::unique_ptr<JSONRPCNotification> notification) override;

    void SetErrorHandler(ErrorHandler handler) override;

    // Replaces the session header sent with later requests (empty clears it).
    void SetSessionId(const std::string& sessionId);
    void SetProtocolVersion(const std::string& version);

    const Options& GetOptions() const;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

//==========================================================================================================
// HTTPTransportFactory
// Purpose: Creates HTTP/HTTPS transports from either a URL ("http://host:port/mcp", or "url=<...>") or
//          semicolon-delimited key=value pairs (scheme, host, port, rpcPath, serverName, caFile, caPath,
//          connectTimeoutMs, readTimeoutMs, sessionId, protocolVersion, responseMode).
//==========================================================================================================
class HTTPTransportFactory : public ITransportFactory {
public:
    std::unique_ptr<ITransport> CreateTransport(const std::string& config) override;
};

} // namespace toolgate
