//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: DemoTools.cpp
// Purpose: echo and add tool handlers
//==========================================================================================================

#include "toolgate/DemoTools.h"

#include <cstdint>
#include <future>
#include <string>
#include <vector>

#include <fmt/format.h>

namespace toolgate {

namespace {

JSONValue typedProperty(const char* type) {
    JSONValue::Object p;
    p["type"] = std::make_shared<JSONValue>(std::string(type));
    return JSONValue{p};
}

JSONValue objectSchema(const JSONValue::Object& props, const std::vector<std::string>& requiredNames) {
    JSONValue::Array required;
    for (const auto& n : requiredNames) required.push_back(std::make_shared<JSONValue>(n));
    JSONValue::Object schema;
    schema["type"] = std::make_shared<JSONValue>(std::string("object"));
    schema["properties"] = std::make_shared<JSONValue>(JSONValue{props});
    schema["required"] = std::make_shared<JSONValue>(JSONValue{required});
    return JSONValue{schema};
}

double asNumber(const JSONValue& v) {
    if (std::holds_alternative<int64_t>(v.value)) {
        return static_cast<double>(std::get<int64_t>(v.value));
    }
    return std::get<double>(v.value);
}

// Arguments were validated against the schema before the handler runs.
std::string addText(const JSONValue& a, const JSONValue& b) {
    int64_t sum = 0;
    if (std::holds_alternative<int64_t>(a.value) && std::holds_alternative<int64_t>(b.value) &&
        !__builtin_add_overflow(std::get<int64_t>(a.value), std::get<int64_t>(b.value), &sum)) {
        return std::to_string(sum);
    }
    return fmt::format("{}", asNumber(a) + asNumber(b));
}

} // namespace

void RegisterDemoTools(ToolRegistry& registry) {
    JSONValue::Object echoProps;
    echoProps["message"] = std::make_shared<JSONValue>(typedProperty("string"));
    Tool echo{"echo", "Echo a message back as text", objectSchema(echoProps, {"message"})};
    registry.RegisterTool(echo, [](const JSONValue& args) -> std::future<CallToolResult> {
        return std::async(std::launch::async, [args]() {
            CallToolResult r;
            r.content.push_back(MakeTextContent(std::get<std::string>(args.Find("message")->value)));
            return r;
        });
    });

    JSONValue::Object addProps;
    addProps["a"] = std::make_shared<JSONValue>(typedProperty("number"));
    addProps["b"] = std::make_shared<JSONValue>(typedProperty("number"));
    Tool add{"add", "Add two numbers", objectSchema(addProps, {"a", "b"})};
    registry.RegisterTool(add, [](const JSONValue& args) -> std::future<CallToolResult> {
        return std::async(std::launch::async, [args]() {
            CallToolResult r;
            r.content.push_back(MakeTextContent(addText(*args.Find("a"), *args.Find("b"))));
            return r;
        });
    });
}

} // namespace toolgate
