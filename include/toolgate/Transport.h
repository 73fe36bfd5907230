//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Transport.h
// Purpose: Transport layer interfaces: server-side adapters feeding the Dispatcher and the client transport
//==========================================================================================================

#pragma once

#include <memory>
#include <string>
#include <functional>
#include <future>
#include <cstdint>

namespace toolgate {

// Forward declarations
class Dispatcher;
class JSONRPCRequest;
class JSONRPCResponse;
class JSONRPCNotification;

//==========================================================================================================
// ITransportAdapter
// Purpose: Server-side binding that receives payloads from callers, hands them to a shared Dispatcher and
//          writes the replies back in the binding's framing.
// Notes:
//   - Adapters never interpret methods themselves; all protocol behavior lives in the Dispatcher.
//   - Transport faults that cannot be reported to the caller go to the error handler.
//==========================================================================================================
class ITransportAdapter {
public:
    virtual ~ITransportAdapter() = default;

    /////////////////////////////////////////// Lifecycle ///////////////////////////////////////////
    //==========================================================================================================
    // Starts the adapter (binds/listens or spawns the reader loop).
    // Returns:
    //   Future that completes when the adapter is serving, or carries the startup exception.
    //==========================================================================================================
    virtual std::future<void> Start() = 0;

    //==========================================================================================================
    // Stops the adapter and releases its connections and sessions.
    //==========================================================================================================
    virtual std::future<void> Stop() = 0;

    virtual bool IsRunning() const = 0;

    /////////////////////////////////////////// Error handling ///////////////////////////////////////////
    using ErrorHandler = std::function<void(const std::string& error)>;
    virtual void SetErrorHandler(ErrorHandler handler) = 0;
};

//==========================================================================================================
// ITransportAdapterFactory
// Purpose: Creates adapters from configuration strings, bound to a Dispatcher.
//==========================================================================================================
class ITransportAdapterFactory {
public:
    virtual ~ITransportAdapterFactory() = default;

    //==========================================================================================================
    // Args:
    //   config: Adapter-specific configuration (e.g., "http://0.0.0.0:8000/mcp").
    //   dispatcher: Dispatcher shared by all connections of the adapter; must outlive it.
    //==========================================================================================================
    virtual std::unique_ptr<ITransportAdapter> CreateTransportAdapter(const std::string& config,
                                                                      Dispatcher& dispatcher) = 0;
};

//==========================================================================================================
// ITransport
// Purpose: Client-side transport used to talk to a remote gateway.
//==========================================================================================================
class ITransport {
public:
    virtual ~ITransport() = default;

    /////////////////////////////////////////// Connection lifecycle ///////////////////////////////////////////
    virtual std::future<void> Start() = 0;
    virtual std::future<void> Close() = 0;
    virtual bool IsConnected() const = 0;

    //==========================================================================================================
    // Returns the session identifier issued by the remote side, or an empty string when none is held.
    //==========================================================================================================
    virtual std::string GetSessionId() const = 0;

    /////////////////////////////////////////// Message sending ///////////////////////////////////////////
    //==========================================================================================================
    // Sends a JSON-RPC request and returns a future for the response.
    // Notes:
    //   Transport failures are delivered as exceptions through the future.
    //==========================================================================================================
    virtual std::future<std::unique_ptr<JSONRPCResponse>> SendRequest(
        std::unique_ptr<JSONRPCRequest> request) = 0;

    //==========================================================================================================
    // Sends a JSON-RPC notification (no response expected). Completes once the peer acknowledged it.
    //==========================================================================================================
    virtual std::future<void> SendNotification(
        std::unique_ptr<JSONRPCNotification> notification) = 0;

    /////////////////////////////////////////// Error handling ///////////////////////////////////////////
    using ErrorHandler = std::function<void(const std::string& error)>;
    virtual void SetErrorHandler(ErrorHandler handler) = 0;
};

//==========================================================================================================
// Transport factory interface
// Purpose: Factory for creating client transports from configuration strings.
//==========================================================================================================
class ITransportFactory {
public:
    virtual ~ITransportFactory() = default;

    virtual std::unique_ptr<ITransport> CreateTransport(const std::string& config) = 0;
};

} // namespace toolgate
