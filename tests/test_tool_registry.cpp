//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: tests/test_tool_registry.cpp
// Purpose: GoogleTests for tool registration, listing and invocation outcomes
//==========================================================================================================

#include <gtest/gtest.h>

#include <stdexcept>

#include "TestTools.h"
#include "toolgate/ToolRegistry.h"

using namespace toolgate;
using namespace toolgate::testing;

namespace {

class FakeInvoker : public IRemoteToolInvoker {
public:
    int calls{0};
    std::string lastName;
    JSONValue lastArgs;

    ToolInvocationResult Invoke(const std::string& name, const JSONValue& arguments) override {
        ++calls;
        lastName = name;
        lastArgs = arguments;
        return ToolInvocationResult::Success(obj({{"content", arr({MakeTextContent("remote")})}, {"isError", JSONValue{false}}}));
    }

    std::vector<Tool> ListTools() override {
        return {Tool{"r1", "first remote"}, Tool{"r2", "second remote"}};
    }
};

class ThrowingInvoker : public FakeInvoker {
public:
    ToolInvocationResult Invoke(const std::string&, const JSONValue&) override {
        throw std::runtime_error("wire broke");
    }
};

} // namespace

TEST(ToolRegistry, ListIsStableAndInRegistrationOrder) {
    ToolRegistry registry;
    registerSampleTools(registry);
    registry.Seal();
    auto a = registry.List();
    auto b = registry.List();
    ASSERT_EQ(a.size(), 3u);
    ASSERT_EQ(a.size(), b.size());
    EXPECT_EQ(a[0].name, "echo");
    EXPECT_EQ(a[1].name, "add");
    EXPECT_EQ(a[2].name, "fail");
    for (std::size_t i = 0; i < a.size(); ++i) {
        EXPECT_EQ(a[i].name, b[i].name);
        EXPECT_EQ(a[i].inputSchema, b[i].inputSchema);
    }
}

TEST(ToolRegistry, RejectsDuplicateEmptyAndLateRegistration) {
    ToolRegistry registry;
    registerSampleTools(registry);
    auto handler = [](const JSONValue&) { return std::promise<CallToolResult>().get_future(); };
    EXPECT_THROW(registry.RegisterTool(Tool{"echo", "again"}, handler), std::logic_error);
    EXPECT_THROW(registry.RegisterTool(Tool{"", "nameless"}, handler), std::invalid_argument);
    EXPECT_THROW(registry.RegisterTool(Tool{"x", "no handler"}, ToolHandler{}), std::invalid_argument);
    registry.Seal();
    EXPECT_TRUE(registry.IsSealed());
    EXPECT_THROW(registry.RegisterTool(Tool{"late", "too late"}, handler), std::logic_error);
    EXPECT_EQ(registry.Size(), 3u);
}

TEST(ToolRegistry, NamesAreCaseSensitive) {
    ToolRegistry registry;
    registerSampleTools(registry);
    EXPECT_TRUE(registry.Contains("echo"));
    EXPECT_FALSE(registry.Contains("Echo"));
}

TEST(ToolRegistry, InvokeSuccessProducesCallResult) {
    ToolRegistry registry;
    registerSampleTools(registry);
    auto r = registry.Invoke("add", obj({{"a", num(2)}, {"b", num(3)}}));
    ASSERT_TRUE(r.success);
    EXPECT_FALSE(r.error.has_value());
    const auto& content = asArray(at(r.result, "content"));
    ASSERT_EQ(content.size(), 1u);
    EXPECT_EQ(asString(at(*content[0], "text")), "5");
    EXPECT_EQ(at(r.result, "isError"), JSONValue{false});
}

TEST(ToolRegistry, UnknownToolIsToolNotFound) {
    ToolRegistry registry;
    registerSampleTools(registry);
    auto r = registry.Invoke("frobnicate", obj({}));
    ASSERT_FALSE(r.success);
    ASSERT_TRUE(r.error.has_value());
    EXPECT_EQ(r.error->code, JSONRPCErrorCodes::ToolNotFound);
    EXPECT_EQ(r.error->category, errors::ErrorCategory::ToolNotFound);
    EXPECT_EQ(r.error->message, "Tool not found: frobnicate");
}

TEST(ToolRegistry, InvalidArgumentsNeverReachHandler) {
    ToolRegistry registry;
    bool called = false;
    Tool t{"strict", "needs n", obj({{"type", str("object")}, {"required", arr({str("n")})}})};
    registry.RegisterTool(t, [&called](const JSONValue&) {
        called = true;
        std::promise<CallToolResult> p;
        p.set_value(CallToolResult{});
        return p.get_future();
    });
    auto r = registry.Invoke("strict", obj({}));
    ASSERT_FALSE(r.success);
    EXPECT_FALSE(called);
    EXPECT_EQ(r.error->code, JSONRPCErrorCodes::InvalidParams);
    ASSERT_TRUE(r.error->data.has_value());
    EXPECT_EQ(asString(*asArray(at(r.error->data.value(), "fields"))[0]), "n");

    auto notObject = registry.Invoke("strict", arr({}));
    ASSERT_FALSE(notObject.success);
    EXPECT_EQ(notObject.error->code, JSONRPCErrorCodes::InvalidParams);
    EXPECT_FALSE(called);
}

TEST(ToolRegistry, NullArgumentsAreTreatedAsEmptyObject) {
    ToolRegistry registry;
    registerSampleTools(registry);
    auto r = registry.Invoke("fail", JSONValue{nullptr});
    ASSERT_FALSE(r.success);
    EXPECT_EQ(r.error->code, JSONRPCErrorCodes::ToolExecutionFailed);
}

TEST(ToolRegistry, ErrorResultBecomesExecutionFailure) {
    ToolRegistry registry;
    registerSampleTools(registry);
    auto r = registry.Invoke("fail", obj({}));
    ASSERT_FALSE(r.success);
    EXPECT_EQ(r.error->category, errors::ErrorCategory::ToolExecutionFailure);
    EXPECT_EQ(asString(at(r.error->data.value(), "detail")), "boom");
    EXPECT_EQ(asString(at(r.error->data.value(), "name")), "fail");
}

TEST(ToolRegistry, ThrowingHandlerBecomesExecutionFailure) {
    ToolRegistry registry;
    registry.RegisterTool(Tool{"thrower", "throws"}, [](const JSONValue&) -> std::future<CallToolResult> {
        throw std::runtime_error("handler exploded");
    });
    auto r = registry.Invoke("thrower", obj({}));
    ASSERT_FALSE(r.success);
    EXPECT_EQ(r.error->code, JSONRPCErrorCodes::ToolExecutionFailed);
    EXPECT_EQ(asString(at(r.error->data.value(), "detail")), "handler exploded");
}

TEST(ToolRegistry, RemoteToolsDelegateToInvoker) {
    ToolRegistry registry;
    auto invoker = std::make_shared<FakeInvoker>();
    EXPECT_EQ(registry.RegisterRemoteTools(invoker), 2u);
    EXPECT_TRUE(registry.Contains("r2"));
    auto r = registry.Invoke("r2", obj({{"k", num(1)}}));
    ASSERT_TRUE(r.success);
    EXPECT_EQ(invoker->calls, 1);
    EXPECT_EQ(invoker->lastName, "r2");
    EXPECT_EQ(invoker->lastArgs, obj({{"k", num(1)}}));
}

TEST(ToolRegistry, ThrowingRemoteInvokerIsContained) {
    ToolRegistry registry;
    registry.RegisterRemoteTool(Tool{"r", "remote"}, std::make_shared<ThrowingInvoker>());
    auto r = registry.Invoke("r", obj({}));
    ASSERT_FALSE(r.success);
    EXPECT_EQ(r.error->code, JSONRPCErrorCodes::InternalError);
}
