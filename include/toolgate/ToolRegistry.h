//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ToolRegistry.h
// Purpose: Registry of named tools with schema-checked invocation, local or through a remote invoker
//==========================================================================================================

#pragma once

#include <functional>
#include <future>
#include <memory>
#include <string>
#include <vector>

#include "toolgate/Protocol.h"

namespace toolgate {

using ToolHandler = std::function<std::future<CallToolResult>(const JSONValue& arguments)>;

//==========================================================================================================
// IRemoteToolInvoker
// Purpose: Executes tools that live in another gateway. Implementations must not throw from Invoke;
//          failures are reported through the returned ToolInvocationResult.
//==========================================================================================================
class IRemoteToolInvoker {
public:
    virtual ~IRemoteToolInvoker() = default;

    virtual ToolInvocationResult Invoke(const std::string& name, const JSONValue& arguments) = 0;

    // Descriptors advertised by the remote side. Throws on failure.
    virtual std::vector<Tool> ListTools() = 0;
};

//==========================================================================================================
// ToolRegistry
// Purpose: Maps tool names to descriptors and their execution path.
// Notes:
//   Registration happens at startup. Seal() freezes the registry; it is then read concurrently
//   without locking.
//==========================================================================================================
class ToolRegistry {
public:
    ToolRegistry();
    ~ToolRegistry();

    ToolRegistry(const ToolRegistry&) = delete;
    ToolRegistry& operator=(const ToolRegistry&) = delete;

    ////////////////////////////////////////// Registration //////////////////////////////////////////
    // Throws std::logic_error on a duplicate name or after Seal(), std::invalid_argument on an
    // empty name or a null handler/invoker.
    void RegisterTool(const Tool& tool, ToolHandler handler);
    void RegisterRemoteTool(const Tool& tool, std::shared_ptr<IRemoteToolInvoker> invoker);

    //======================================================================================================
    // RegisterRemoteTools
    // Purpose: Imports every tool the invoker lists, bound to that invoker.
    // Returns:
    //   Number of tools registered.
    //======================================================================================================
    std::size_t RegisterRemoteTools(const std::shared_ptr<IRemoteToolInvoker>& invoker);

    void Seal();
    bool IsSealed() const;

    ////////////////////////////////////////// Lookup //////////////////////////////////////////
    // Descriptors in registration order.
    std::vector<Tool> List() const;
    bool Contains(const std::string& name) const;
    std::size_t Size() const;

    //======================================================================================================
    // Invoke
    // Purpose: Runs a tool by name and reports the outcome. Never throws.
    // Args:
    //   name: Tool name (case-sensitive).
    //   arguments: Argument object; null means no arguments and is treated as {}.
    // Returns:
    //   Success with {"content":[...],"isError":false}, or a failure carrying ToolNotFound,
    //   InvalidParams (schema mismatch) or ToolExecutionFailed. Remote outcomes are returned as-is.
    //======================================================================================================
    ToolInvocationResult Invoke(const std::string& name, const JSONValue& arguments) const;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace toolgate
