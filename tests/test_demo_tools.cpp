//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: tests/test_demo_tools.cpp
// Purpose: GoogleTests for the gateway's echo and add tools
//==========================================================================================================

#include <gtest/gtest.h>

#include <limits>

#include "TestTools.h"
#include "toolgate/DemoTools.h"

using namespace toolgate;
using namespace toolgate::testing;

namespace {

class DemoToolsTest : public ::testing::Test {
protected:
    ToolRegistry registry;

    void SetUp() override {
        RegisterDemoTools(registry);
        registry.Seal();
    }

    std::string firstText(const std::string& name, const JSONValue& args) {
        ToolInvocationResult r = registry.Invoke(name, args);
        EXPECT_TRUE(r.success);
        if (!r.success) return std::string();
        return asString(at(*asArray(at(r.result, "content"))[0], "text"));
    }
};

} // namespace

TEST_F(DemoToolsTest, EchoReturnsMessage) {
    EXPECT_EQ(registry.Size(), 2u);
    EXPECT_EQ(firstText("echo", obj({{"message", str("hi")}})), "hi");
}

TEST_F(DemoToolsTest, AddIntegersExactly) {
    EXPECT_EQ(firstText("add", obj({{"a", num(2)}, {"b", num(3)}})), "5");
    EXPECT_EQ(firstText("add", obj({{"a", num(-9000000000000000000)}, {"b", num(-1)}})), "-9000000000000000001");
}

TEST_F(DemoToolsTest, AddMixedNumbersUsesDouble) {
    EXPECT_EQ(firstText("add", obj({{"a", JSONValue{1.5}}, {"b", num(2)}})), "3.5");
}

TEST_F(DemoToolsTest, AddOverflowFallsBackToDouble) {
    const std::string text = firstText("add", obj({{"a", num(std::numeric_limits<int64_t>::max())}, {"b", num(1)}}));
    EXPECT_EQ(std::stod(text), 9223372036854775808.0);
    EXPECT_EQ(text.find('-'), std::string::npos);
}

TEST_F(DemoToolsTest, AddRequiresBothOperands) {
    ToolInvocationResult r = registry.Invoke("add", obj({{"a", num(1)}}));
    ASSERT_FALSE(r.success);
    EXPECT_EQ(r.error->code, JSONRPCErrorCodes::InvalidParams);
}
