//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: tests/test_dispatcher.cpp
// Purpose: GoogleTests for session rules, built-in methods, batches and malformed payloads
//==========================================================================================================

#include <gtest/gtest.h>

#include <atomic>

#include "TestTools.h"
#include "toolgate/Dispatcher.h"

using namespace toolgate;
using namespace toolgate::testing;

namespace {

class DispatcherTest : public ::testing::Test {
protected:
    ToolRegistry registry;
    SessionManager sessions;
    std::unique_ptr<Dispatcher> dispatcher;
    ConnectionContext ctx;

    void SetUp() override {
        registerSampleTools(registry);
        registry.Seal();
        dispatcher = std::make_unique<Dispatcher>(registry, sessions);
    }

    JSONValue call(const std::string& payload) {
        auto r = dispatcher->HandlePayload(payload, ctx);
        if (!r.reply.has_value()) {
            ADD_FAILURE() << "no reply for " << payload;
            return JSONValue{nullptr};
        }
        return parseJSON(r.reply.value());
    }

    void initialize(const std::string& version = "2025-06-18") {
        auto reply = call(R"({"jsonrpc":"2.0","id":"init","method":"initialize","params":{"protocolVersion":")" + version +
                          R"(","capabilities":{},"clientInfo":{"name":"t","version":"1"}}})");
        ASSERT_TRUE(reply.Find("result") != nullptr);
    }
};

} // namespace

TEST(DispatcherTags, ClosedMethodTable) {
    EXPECT_EQ(methodTagFromName("initialize"), MethodTag::Initialize);
    EXPECT_EQ(methodTagFromName("ping"), MethodTag::Ping);
    EXPECT_EQ(methodTagFromName("tools/list"), MethodTag::ToolsList);
    EXPECT_EQ(methodTagFromName("tools/call"), MethodTag::ToolsCall);
    EXPECT_EQ(methodTagFromName("resources/list"), MethodTag::Unknown);
    EXPECT_EQ(notificationTagFromName("notifications/initialized"), NotificationTag::Initialized);
    EXPECT_EQ(notificationTagFromName("notifications/cancelled"), NotificationTag::Cancelled);
    EXPECT_EQ(notificationTagFromName("notifications/whatever"), NotificationTag::Unknown);
}

TEST_F(DispatcherTest, InitializeEchoesRequestedVersion) {
    auto reply = call(R"({"jsonrpc":"2.0","id":1,"method":"initialize","params":{"protocolVersion":"2025-06-18","capabilities":{}}})");
    const JSONValue& result = at(reply, "result");
    EXPECT_EQ(asString(at(result, "protocolVersion")), "2025-06-18");
    EXPECT_EQ(at(at(result, "capabilities"), "tools"), JSONValue{JSONValue::Object{}});
    EXPECT_EQ(asString(at(at(result, "serverInfo"), "name")), "toolgate");
    EXPECT_FALSE(asString(at(at(result, "serverInfo"), "version")).empty());
    ASSERT_TRUE(ctx.sessionId.has_value());
    EXPECT_EQ(ctx.protocolVersion.value(), "2025-06-18");
    EXPECT_EQ(sessions.Count(), 1u);
}

TEST_F(DispatcherTest, InitializeEchoesUnknownVersionsToo) {
    initialize("1.0");
    EXPECT_EQ(sessions.Find(ctx.sessionId.value())->protocolVersion, "1.0");
}

TEST_F(DispatcherTest, InitializeWithoutVersionIsInvalidParams) {
    auto reply = call(R"({"jsonrpc":"2.0","id":1,"method":"initialize","params":{"capabilities":{}}})");
    EXPECT_EQ(asInt(at(at(reply, "error"), "code")), JSONRPCErrorCodes::InvalidParams);
    EXPECT_FALSE(ctx.sessionId.has_value());
    EXPECT_EQ(sessions.Count(), 0u);
}

TEST_F(DispatcherTest, ReinitializeReplacesSession) {
    initialize();
    const std::string first = ctx.sessionId.value();
    initialize("2024-11-05");
    EXPECT_NE(ctx.sessionId.value(), first);
    EXPECT_EQ(sessions.Count(), 1u);
    EXPECT_FALSE(sessions.Find(first).has_value());
}

TEST_F(DispatcherTest, InitializeLeavesHeaderNamedSessionAlone) {
    initialize();
    const std::string first = ctx.sessionId.value();

    ConnectionContext request;
    request.ownsSession = false;
    request.sessionId = first;
    auto r = dispatcher->HandlePayload(
        R"({"jsonrpc":"2.0","id":1,"method":"initialize","params":{"protocolVersion":"2025-06-18"}})", request);
    ASSERT_TRUE(r.reply.has_value());
    ASSERT_TRUE(request.sessionId.has_value());
    EXPECT_NE(request.sessionId.value(), first);
    EXPECT_TRUE(sessions.Find(first).has_value());
    EXPECT_EQ(sessions.Count(), 2u);
    EXPECT_TRUE(sessions.Find(request.sessionId.value())->expires);
    EXPECT_FALSE(sessions.Find(first)->expires);
}

TEST_F(DispatcherTest, RequestsBeforeInitializeAreRejected) {
    ToolRegistry reg;
    std::atomic<int> invoked{0};
    reg.RegisterTool(Tool{"counter", "counts calls", obj({{"type", str("object")}})}, [&invoked](const JSONValue&) {
        ++invoked;
        std::promise<CallToolResult> p;
        p.set_value(CallToolResult{});
        return p.get_future();
    });
    reg.Seal();
    Dispatcher d(reg, sessions);
    ConnectionContext fresh;
    auto r = d.HandlePayload(R"({"jsonrpc":"2.0","id":5,"method":"tools/call","params":{"name":"counter","arguments":{}}})", fresh);
    ASSERT_TRUE(r.reply.has_value());
    auto reply = parseJSON(r.reply.value());
    EXPECT_EQ(asInt(at(at(reply, "error"), "code")), JSONRPCErrorCodes::ServerNotInitialized);
    EXPECT_EQ(asString(at(at(reply, "error"), "message")), "Server not initialized");
    EXPECT_EQ(reply.Find("result"), nullptr);
    EXPECT_EQ(invoked.load(), 0);

    auto ping = parseJSON(d.HandlePayload(R"({"jsonrpc":"2.0","id":6,"method":"ping"})", fresh).reply.value());
    EXPECT_EQ(asInt(at(at(ping, "error"), "code")), JSONRPCErrorCodes::ServerNotInitialized);
}

TEST_F(DispatcherTest, UnknownSessionIsTreatedAsUninitialized) {
    ctx.sessionId = std::string("stale-session");
    auto reply = call(R"({"jsonrpc":"2.0","id":1,"method":"tools/list"})");
    EXPECT_EQ(asInt(at(at(reply, "error"), "code")), JSONRPCErrorCodes::ServerNotInitialized);
    EXPECT_FALSE(ctx.sessionId.has_value());
}

TEST_F(DispatcherTest, PingReturnsEmptyObject) {
    initialize();
    auto reply = call(R"({"jsonrpc":"2.0","id":"p","method":"ping"})");
    EXPECT_EQ(at(reply, "result"), JSONValue{JSONValue::Object{}});
    EXPECT_EQ(asString(at(reply, "id")), "p");
}

TEST_F(DispatcherTest, UnknownMethodIsMethodNotFound) {
    initialize();
    auto reply = call(R"({"jsonrpc":"2.0","id":2,"method":"resources/list"})");
    EXPECT_EQ(asInt(at(at(reply, "error"), "code")), JSONRPCErrorCodes::MethodNotFound);
    EXPECT_EQ(asString(at(at(reply, "error"), "message")), "Method not found: resources/list");
}

TEST_F(DispatcherTest, NotificationsNeverReply) {
    initialize();
    EXPECT_FALSE(dispatcher->HandlePayload(R"({"jsonrpc":"2.0","method":"notifications/initialized"})", ctx).reply.has_value());
    EXPECT_TRUE(sessions.Find(ctx.sessionId.value())->initializedNotified);
    EXPECT_FALSE(dispatcher->HandlePayload(R"({"jsonrpc":"2.0","method":"notifications/cancelled","params":{"requestId":3}})", ctx).reply.has_value());
    EXPECT_FALSE(dispatcher->HandlePayload(R"({"jsonrpc":"2.0","method":"made/up"})", ctx).reply.has_value());

    ConnectionContext none;
    EXPECT_FALSE(dispatcher->HandlePayload(R"({"jsonrpc":"2.0","method":"notifications/initialized"})", none).reply.has_value());
}

TEST_F(DispatcherTest, CallerResponsesAreIgnored) {
    initialize();
    auto r = dispatcher->HandlePayload(R"({"jsonrpc":"2.0","id":77,"result":{}})", ctx);
    EXPECT_FALSE(r.reply.has_value());
    EXPECT_FALSE(r.malformed);
}

TEST_F(DispatcherTest, ToolsListReturnsExactSet) {
    initialize();
    auto reply = call(R"({"jsonrpc":"2.0","id":3,"method":"tools/list"})");
    const auto& tools = asArray(at(at(reply, "result"), "tools"));
    ASSERT_EQ(tools.size(), 3u);
    EXPECT_EQ(asString(at(*tools[0], "name")), "echo");
    EXPECT_EQ(asString(at(*tools[1], "name")), "add");
    EXPECT_EQ(asString(at(*tools[2], "name")), "fail");
    EXPECT_TRUE(at(*tools[0], "inputSchema").IsObject());
    EXPECT_EQ(at(reply, "result").Find("nextCursor"), nullptr);
}

TEST(DispatcherPaging, CursorWalksPages) {
    ToolRegistry registry;
    registerSampleTools(registry);
    registry.Seal();
    SessionManager sessions;
    Dispatcher::Options opts;
    opts.listPageSize = 2;
    Dispatcher d(registry, sessions, opts);
    ConnectionContext ctx;
    d.HandlePayload(R"({"jsonrpc":"2.0","id":0,"method":"initialize","params":{"protocolVersion":"x"}})", ctx);

    auto first = parseJSON(d.HandlePayload(R"({"jsonrpc":"2.0","id":1,"method":"tools/list"})", ctx).reply.value());
    EXPECT_EQ(asArray(at(at(first, "result"), "tools")).size(), 2u);
    EXPECT_EQ(asString(at(at(first, "result"), "nextCursor")), "2");

    auto second = parseJSON(d.HandlePayload(R"({"jsonrpc":"2.0","id":2,"method":"tools/list","params":{"cursor":"2"}})", ctx).reply.value());
    ASSERT_EQ(asArray(at(at(second, "result"), "tools")).size(), 1u);
    EXPECT_EQ(at(second, "result").Find("nextCursor"), nullptr);

    auto bad = parseJSON(d.HandlePayload(R"({"jsonrpc":"2.0","id":3,"method":"tools/list","params":{"cursor":"abc"}})", ctx).reply.value());
    EXPECT_EQ(asInt(at(at(bad, "error"), "code")), JSONRPCErrorCodes::InvalidParams);
}

TEST_F(DispatcherTest, ToolsCallSuccess) {
    initialize();
    auto reply = call(R"({"jsonrpc":"2.0","id":4,"method":"tools/call","params":{"name":"echo","arguments":{"message":"hi"}}})");
    const JSONValue& result = at(reply, "result");
    EXPECT_EQ(asString(at(*asArray(at(result, "content"))[0], "text")), "hi");
    EXPECT_EQ(at(result, "isError"), JSONValue{false});
    EXPECT_EQ(reply.Find("error"), nullptr);
}

TEST_F(DispatcherTest, ToolsCallUnknownToolIsError) {
    initialize();
    auto reply = call(R"({"jsonrpc":"2.0","id":4,"method":"tools/call","params":{"name":"frobnicate","arguments":{}}})");
    EXPECT_EQ(reply.Find("result"), nullptr);
    EXPECT_EQ(asInt(at(at(reply, "error"), "code")), JSONRPCErrorCodes::ToolNotFound);
}

TEST_F(DispatcherTest, ToolsCallWithoutNameIsInvalidParams) {
    initialize();
    auto reply = call(R"({"jsonrpc":"2.0","id":4,"method":"tools/call","params":{}})");
    EXPECT_EQ(asInt(at(at(reply, "error"), "code")), JSONRPCErrorCodes::InvalidParams);
}

TEST_F(DispatcherTest, ToolsCallBadArgumentsIsInvalidParams) {
    initialize();
    auto reply = call(R"({"jsonrpc":"2.0","id":4,"method":"tools/call","params":{"name":"add","arguments":{"a":"x","b":1}}})");
    const JSONValue& err = at(reply, "error");
    EXPECT_EQ(asInt(at(err, "code")), JSONRPCErrorCodes::InvalidParams);
    EXPECT_EQ(asString(*asArray(at(at(err, "data"), "fields"))[0]), "a");
}

TEST_F(DispatcherTest, BatchRepliesInOrderAndSkipsNotifications) {
    initialize();
    auto reply = call(R"([{"jsonrpc":"2.0","id":1,"method":"ping"},)"
                      R"({"jsonrpc":"2.0","method":"notifications/initialized"},)"
                      R"({"jsonrpc":"2.0","id":2,"method":"tools/call","params":{"name":"add","arguments":{"a":1,"b":2}}},)"
                      R"(7])");
    ASSERT_TRUE(reply.IsArray());
    const auto& items = asArray(reply);
    ASSERT_EQ(items.size(), 3u);
    EXPECT_EQ(asInt(at(*items[0], "id")), 1);
    EXPECT_EQ(asInt(at(*items[1], "id")), 2);
    EXPECT_TRUE(at(*items[2], "id").IsNull());
    EXPECT_EQ(asInt(at(at(*items[2], "error"), "code")), JSONRPCErrorCodes::InvalidRequest);
}

TEST_F(DispatcherTest, NotificationOnlyBatchHasNoReply) {
    initialize();
    auto r = dispatcher->HandlePayload(R"([{"jsonrpc":"2.0","method":"notifications/initialized"},{"jsonrpc":"2.0","method":"x"}])", ctx);
    EXPECT_FALSE(r.reply.has_value());
    EXPECT_FALSE(r.malformed);
}

TEST_F(DispatcherTest, MalformedPayloadWithoutId) {
    auto r = dispatcher->HandlePayload("{nope", ctx);
    EXPECT_TRUE(r.malformed);
    ASSERT_TRUE(r.reply.has_value());
    auto reply = parseJSON(r.reply.value());
    EXPECT_TRUE(at(reply, "id").IsNull());
    EXPECT_EQ(asInt(at(at(reply, "error"), "code")), JSONRPCErrorCodes::ParseError);
}

TEST_F(DispatcherTest, MalformedPayloadWithRecoveredId) {
    auto r = dispatcher->HandlePayload(R"({"jsonrpc":"2.0","id":"x9","method":)", ctx);
    EXPECT_FALSE(r.malformed);
    auto reply = parseJSON(r.reply.value());
    EXPECT_EQ(asString(at(reply, "id")), "x9");
    EXPECT_EQ(asInt(at(at(reply, "error"), "code")), JSONRPCErrorCodes::ParseError);
}

TEST_F(DispatcherTest, EmptyBatchIsInvalidRequest) {
    auto r = dispatcher->HandlePayload("[]", ctx);
    EXPECT_TRUE(r.malformed);
    auto reply = parseJSON(r.reply.value());
    EXPECT_EQ(asInt(at(at(reply, "error"), "code")), JSONRPCErrorCodes::InvalidRequest);
}

TEST_F(DispatcherTest, CloseConnectionDiscardsSession) {
    initialize();
    const std::string id = ctx.sessionId.value();
    dispatcher->CloseConnection(ctx);
    EXPECT_FALSE(ctx.sessionId.has_value());
    EXPECT_FALSE(sessions.Find(id).has_value());
}

TEST(DispatcherOptions, InstructionsAndServerInfoAreReported) {
    ToolRegistry registry;
    registry.Seal();
    SessionManager sessions;
    Dispatcher::Options opts;
    opts.serverInfo = Implementation{"edge", "9.9"};
    opts.instructions = std::string("use echo");
    opts.capabilities.tools = ToolsCapability{true};
    Dispatcher d(registry, sessions, opts);
    ConnectionContext ctx;
    auto reply = parseJSON(d.HandlePayload(R"({"jsonrpc":"2.0","id":1,"method":"initialize","params":{"protocolVersion":"v"}})", ctx).reply.value());
    const JSONValue& result = at(reply, "result");
    EXPECT_EQ(asString(at(at(result, "serverInfo"), "name")), "edge");
    EXPECT_EQ(asString(at(at(result, "serverInfo"), "version")), "9.9");
    EXPECT_EQ(asString(at(result, "instructions")), "use echo");
    EXPECT_EQ(at(at(at(result, "capabilities"), "tools"), "listChanged"), JSONValue{true});
}
