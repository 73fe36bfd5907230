//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: HTTPServer.hpp
// Purpose: Network adapter: coroutine-based HTTP/HTTPS gateway endpoint using Boost.Beast (TLS 1.3 only
//          for HTTPS)
//==========================================================================================================

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <future>
#include <functional>
#include <memory>
#include "toolgate/Transport.h"
#include "toolgate/JSONRPCTypes.h"

namespace toolgate {

  class HTTPServer : public ITransportAdapter {
  public:
    //==========================================================================================================
    // Options
    // Purpose: Configuration for bind address/port, endpoint path, TLS files and stream behavior.
    // Fields:
    //   address: Bind address (default: 0.0.0.0)
    //   port: Listen port (default: 8000; "0" picks an ephemeral port, see BoundPort())
    //   rpcPath: Endpoint path for POST envelopes and GET discovery/streaming
    //   scheme: "http" or "https" (TLS 1.3 only for https)
    //   certFile/keyFile: PEM files required when scheme == https
    //   publicUrl: Externally visible endpoint URL reported by discovery documents; when empty the URL
    //              is rebuilt from the request's Host header
    //   threads: Number of threads servicing the I/O context
    //   keepaliveMs: Interval between ping events on GET event streams
    //   maxBodyBytes: Upper bound for a POST body
    //   readTimeoutMs: Idle limit for reading one request
    //==========================================================================================================
    struct Options {
        std::string address{"0.0.0.0"};
        std::string port{"8000"};
        std::string rpcPath{"/mcp"};
        std::string scheme{"http"}; // "http" or "https"
        std::string certFile; // PEM (required for https)
        std::string keyFile;  // PEM (required for https)
        std::string publicUrl;
        unsigned int threads{4u};
        unsigned int keepaliveMs{15000u};
        std::size_t maxBodyBytes{4u * 1024u * 1024u};
        unsigned int readTimeoutMs{30000u};
    };

    HTTPServer(Dispatcher& dispatcher, const Options& opts);
    ~HTTPServer() override;

    //==========================================================================================================
    // Binds and listens on the calling thread, then services connections on Options::threads threads.
    // Returns:
    //   Future that is ready once the server accepts connections, or that carries the bind/listen error.
    //==========================================================================================================
    std::future<void> Start() override;

    //==========================================================================================================
    // Stops the server: closes the acceptor, stops the I/O context and joins the service threads.
    //==========================================================================================================
    std::future<void> Stop() override;

    bool IsRunning() const override;
    void SetErrorHandler(ErrorHandler handler) override;

    // Port actually bound (useful with port "0"). Zero before Start().
    std::uint16_t BoundPort() const;

    const Options& GetOptions() const;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
  };

  //==========================================================================================================
  // HTTPServerFactory
  // Purpose: Creates HTTP/HTTPS server adapters from a URI configuration string:
  //            - "http://<address>:<port>[/path]" (e.g., http://127.0.0.1:0/mcp)
  //            - "https://<address>:<port>[/path]?cert=<pem>&key=<pem>"
  //          Unknown parameters are ignored. If scheme is omitted, defaults to http; if the path is
  //          omitted, defaults to /mcp.
  //==========================================================================================================
  class HTTPServerFactory : public ITransportAdapterFactory {
  public:
    std::unique_ptr<ITransportAdapter> CreateTransportAdapter(const std::string& config,
                                                              Dispatcher& dispatcher) override;

    // Parses the URI form above into server options.
    static HTTPServer::Options ParseOptions(const std::string& config);
  };

} // namespace toolgate
