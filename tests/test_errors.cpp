//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_errors.cpp
// Purpose: GoogleTests for typed error structures and JSON-RPC error mapping helpers
//==========================================================================================================

#include <gtest/gtest.h>

#include "TestTools.h"
#include "toolgate/errors/Errors.h"

using namespace toolgate;
using namespace toolgate::testing;

TEST(Errors, CategoryMapping) {
    using toolgate::errors::ErrorCategory;
    using toolgate::errors::errorCategoryFromCode;
    EXPECT_EQ(errorCategoryFromCode(JSONRPCErrorCodes::ParseError), ErrorCategory::JsonRpcParse);
    EXPECT_EQ(errorCategoryFromCode(JSONRPCErrorCodes::InvalidRequest), ErrorCategory::JsonRpcInvalidRequest);
    EXPECT_EQ(errorCategoryFromCode(JSONRPCErrorCodes::MethodNotFound), ErrorCategory::JsonRpcMethodNotFound);
    EXPECT_EQ(errorCategoryFromCode(JSONRPCErrorCodes::InvalidParams), ErrorCategory::JsonRpcInvalidParams);
    EXPECT_EQ(errorCategoryFromCode(JSONRPCErrorCodes::InternalError), ErrorCategory::JsonRpcInternal);
    EXPECT_EQ(errorCategoryFromCode(JSONRPCErrorCodes::ServerNotInitialized), ErrorCategory::SessionNotInitialized);
    EXPECT_EQ(errorCategoryFromCode(JSONRPCErrorCodes::ToolNotFound), ErrorCategory::ToolNotFound);
    EXPECT_EQ(errorCategoryFromCode(JSONRPCErrorCodes::ToolExecutionFailed), ErrorCategory::ToolExecutionFailure);
    EXPECT_EQ(errorCategoryFromCode(JSONRPCErrorCodes::BridgeUnreachable), ErrorCategory::BridgeUnreachable);
    EXPECT_EQ(errorCategoryFromCode(JSONRPCErrorCodes::BridgeTimeout), ErrorCategory::BridgeTimeout);
    EXPECT_EQ(errorCategoryFromCode(JSONRPCErrorCodes::BridgeRemoteError), ErrorCategory::BridgeRemoteError);
    EXPECT_EQ(errorCategoryFromCode(12345), ErrorCategory::Unknown);
}

TEST(Errors, ToolLevelCategories) {
    using toolgate::errors::ErrorCategory;
    EXPECT_TRUE(errors::isToolLevelCategory(ErrorCategory::ToolNotFound));
    EXPECT_TRUE(errors::isToolLevelCategory(ErrorCategory::ToolExecutionFailure));
    EXPECT_TRUE(errors::isToolLevelCategory(ErrorCategory::JsonRpcInvalidParams));
    EXPECT_FALSE(errors::isToolLevelCategory(ErrorCategory::BridgeTimeout));
    EXPECT_FALSE(errors::isToolLevelCategory(ErrorCategory::SessionNotInitialized));
}

TEST(Errors, ErrorValueRoundTrip) {
    auto e = errors::makeError(JSONRPCErrorCodes::ToolNotFound, "Tool not found: x", obj({{"name", str("x")}}));
    JSONValue v = errors::makeErrorValue(e);
    EXPECT_EQ(asInt(at(v, "code")), JSONRPCErrorCodes::ToolNotFound);
    auto back = errors::mcpErrorFromErrorValue(v);
    ASSERT_TRUE(back.has_value());
    EXPECT_EQ(back->message, "Tool not found: x");
    EXPECT_EQ(back->category, errors::ErrorCategory::ToolNotFound);
    EXPECT_EQ(asString(at(back->data.value(), "name")), "x");
}

TEST(Errors, MalformedErrorObjectIsRejected) {
    EXPECT_FALSE(errors::mcpErrorFromErrorValue(obj({{"message", str("no code")}})).has_value());
    EXPECT_FALSE(errors::mcpErrorFromErrorValue(obj({{"code", str("1")}, {"message", str("m")}})).has_value());
}

TEST(Errors, ErrorResponseCarriesIdAndNoResult) {
    auto resp = errors::makeErrorResponse(JSONRPCId(std::string("q")), errors::makeError(JSONRPCErrorCodes::MethodNotFound, "Method not found: z"));
    ASSERT_TRUE(resp != nullptr);
    auto parsed = parseJSON(resp->Serialize());
    EXPECT_EQ(asString(at(parsed, "id")), "q");
    EXPECT_EQ(parsed.Find("result"), nullptr);
    EXPECT_FALSE(at(parsed, "error").Find("data") != nullptr);
    auto typed = errors::mcpErrorFromResponse(*resp);
    ASSERT_TRUE(typed.has_value());
    EXPECT_EQ(typed->category, errors::ErrorCategory::JsonRpcMethodNotFound);
}
