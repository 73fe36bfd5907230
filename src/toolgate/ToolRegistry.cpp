//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ToolRegistry.cpp
// Purpose: Tool registration and invocation with argument validation
//==========================================================================================================

#include "toolgate/ToolRegistry.h"

#include <stdexcept>
#include <unordered_map>

#include "logging/Logger.h"
#include "toolgate/validation/Validators.h"

namespace toolgate {

namespace {

errors::McpError toolNotFound(const std::string& name) {
    JSONValue::Object data;
    data["name"] = std::make_shared<JSONValue>(name);
    return errors::makeError(JSONRPCErrorCodes::ToolNotFound, "Tool not found: " + name, JSONValue{data});
}

errors::McpError executionFailed(const std::string& name, const std::string& detail,
                                 const std::vector<JSONValue>* content = nullptr) {
    JSONValue::Object data;
    data["name"] = std::make_shared<JSONValue>(name);
    if (!detail.empty()) {
        data["detail"] = std::make_shared<JSONValue>(detail);
    }
    if (content != nullptr) {
        JSONValue::Array arr;
        for (const auto& c : *content) arr.push_back(std::make_shared<JSONValue>(c));
        data["content"] = std::make_shared<JSONValue>(std::move(arr));
    }
    return errors::makeError(JSONRPCErrorCodes::ToolExecutionFailed, "Tool execution failed: " + name, JSONValue{data});
}

// First text item of an error result, used as the failure detail.
std::string firstText(const std::vector<JSONValue>& content) {
    for (const auto& c : content) {
        const JSONValue* text = c.Find("text");
        if (text != nullptr && text->IsString()) {
            return std::get<std::string>(text->value);
        }
    }
    return std::string();
}

} // namespace

class ToolRegistry::Impl {
public:
    struct Entry {
        Tool tool;
        ToolHandler handler;
        std::shared_ptr<IRemoteToolInvoker> remote;
    };

    std::vector<Entry> entries;
    std::unordered_map<std::string, std::size_t> index;
    bool sealed{false};

    void add(Entry entry) {
        if (sealed) {
            throw std::logic_error("ToolRegistry: registration after Seal(): " + entry.tool.name);
        }
        if (entry.tool.name.empty()) {
            throw std::invalid_argument("ToolRegistry: tool name must not be empty");
        }
        if (index.find(entry.tool.name) != index.end()) {
            throw std::logic_error("ToolRegistry: duplicate tool name: " + entry.tool.name);
        }
        index.emplace(entry.tool.name, entries.size());
        LOG_DEBUG("Registered {} tool '{}'", entry.remote ? "remote" : "local", entry.tool.name);
        entries.push_back(std::move(entry));
    }

    const Entry* find(const std::string& name) const {
        auto it = index.find(name);
        if (it == index.end()) return nullptr;
        return &entries[it->second];
    }
};

ToolRegistry::ToolRegistry() : pImpl(std::make_unique<Impl>()) {}

ToolRegistry::~ToolRegistry() = default;

void ToolRegistry::RegisterTool(const Tool& tool, ToolHandler handler) {
    if (!handler) {
        throw std::invalid_argument("ToolRegistry: null handler for tool " + tool.name);
    }
    Impl::Entry e;
    e.tool = tool;
    e.handler = std::move(handler);
    pImpl->add(std::move(e));
}

void ToolRegistry::RegisterRemoteTool(const Tool& tool, std::shared_ptr<IRemoteToolInvoker> invoker) {
    if (!invoker) {
        throw std::invalid_argument("ToolRegistry: null invoker for tool " + tool.name);
    }
    Impl::Entry e;
    e.tool = tool;
    e.remote = std::move(invoker);
    pImpl->add(std::move(e));
}

std::size_t ToolRegistry::RegisterRemoteTools(const std::shared_ptr<IRemoteToolInvoker>& invoker) {
    if (!invoker) {
        throw std::invalid_argument("ToolRegistry: null invoker");
    }
    const auto tools = invoker->ListTools();
    for (const auto& t : tools) {
        RegisterRemoteTool(t, invoker);
    }
    LOG_INFO("Imported {} remote tool(s)", tools.size());
    return tools.size();
}

void ToolRegistry::Seal() {
    pImpl->sealed = true;
}

bool ToolRegistry::IsSealed() const {
    return pImpl->sealed;
}

std::vector<Tool> ToolRegistry::List() const {
    std::vector<Tool> out;
    out.reserve(pImpl->entries.size());
    for (const auto& e : pImpl->entries) {
        out.push_back(e.tool);
    }
    return out;
}

bool ToolRegistry::Contains(const std::string& name) const {
    return pImpl->find(name) != nullptr;
}

std::size_t ToolRegistry::Size() const {
    return pImpl->entries.size();
}

ToolInvocationResult ToolRegistry::Invoke(const std::string& name, const JSONValue& arguments) const {
    const Impl::Entry* entry = pImpl->find(name);
    if (entry == nullptr) {
        LOG_DEBUG("Invoke: unknown tool '{}'", name);
        return ToolInvocationResult::Failure(toolNotFound(name));
    }

    JSONValue args = arguments.IsNull() ? JSONValue{JSONValue::Object{}} : arguments;

    if (entry->remote) {
        // Remote side validates against its own schema
        try {
            return entry->remote->Invoke(name, args);
        } catch (const std::exception& e) {
            LOG_ERROR("Remote invoker threw for '{}': {}", name, e.what());
            return ToolInvocationResult::Failure(
                errors::makeError(JSONRPCErrorCodes::InternalError, std::string("Remote invoker failed: ") + e.what()));
        }
    }

    std::vector<validation::FieldError> problems;
    if (!args.IsObject()) {
        problems.push_back({std::string(), "arguments must be an object, got " + validation::jsonTypeName(args)});
    } else {
        problems = validation::validateArguments(entry->tool.inputSchema, args);
    }
    if (!problems.empty()) {
        LOG_DEBUG("Invoke: invalid arguments for '{}' ({} problem(s))", name, problems.size());
        return ToolInvocationResult::Failure(errors::makeError(
            JSONRPCErrorCodes::InvalidParams, "Invalid arguments for tool: " + name, validation::fieldErrorsToJSON(problems)));
    }

    CallToolResult tr;
    try {
        auto fut = entry->handler(args);
        tr = fut.get();
    } catch (const std::exception& e) {
        LOG_WARN("Tool '{}' failed: {}", name, e.what());
        return ToolInvocationResult::Failure(executionFailed(name, e.what()));
    }
    if (tr.isError) {
        return ToolInvocationResult::Failure(executionFailed(name, firstText(tr.content), &tr.content));
    }
    return ToolInvocationResult::Success(CallToolResultToJSON(tr));
}

} // namespace toolgate
