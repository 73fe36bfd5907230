//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: RemoteBridge.h
// Purpose: Forwards tool invocations to a remote gateway over the HTTP client transport
//==========================================================================================================

#pragma once

#include <chrono>
#include <memory>
#include <string>
#include <vector>

#include "toolgate/Protocol.h"
#include "toolgate/ToolRegistry.h"

namespace toolgate {

// Remote endpoint (scheme://host:port/path) and the bound on one whole invocation.
struct BridgeTarget {
    std::string url;
    std::chrono::milliseconds timeout{30000};
};

//==========================================================================================================
// RemoteBridge
// Purpose: IRemoteToolInvoker backed by another gateway.
// Notes:
//   The remote handshake (initialize + notifications/initialized) is performed lazily and hidden from
//   the caller. The remote session id is reused between calls; a lost remote session is re-established
//   once per call. Network failures are reported as Bridge* errors, tool failures of the remote are
//   relayed unchanged.
//==========================================================================================================
class RemoteBridge : public IRemoteToolInvoker {
public:
    //======================================================================================================
    // Constructor
    // Args:
    //   target: Remote endpoint and per-call timeout.
    //   clientInfo: Implementation announced in the remote initialize request.
    // Throws:
    //   std::invalid_argument when the URL is malformed or the timeout is not positive.
    //======================================================================================================
    RemoteBridge(BridgeTarget target, Implementation clientInfo);
    ~RemoteBridge() override;

    RemoteBridge(const RemoteBridge&) = delete;
    RemoteBridge& operator=(const RemoteBridge&) = delete;

    ToolInvocationResult Invoke(const std::string& name, const JSONValue& arguments) override;

    // Remote tools/list, following nextCursor. Throws std::runtime_error on any failure.
    std::vector<Tool> ListTools() override;

    const BridgeTarget& Target() const;

    // Empty until a remote session has been established.
    std::string RemoteSessionId() const;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace toolgate
