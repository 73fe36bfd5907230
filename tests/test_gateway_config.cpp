//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: tests/test_gateway_config.cpp
// Purpose: GoogleTests for environment and command-line configuration
//==========================================================================================================

#include <gtest/gtest.h>

#include <cstdlib>
#include <stdexcept>
#include <vector>

#include "toolgate/GatewayConfig.h"

using namespace toolgate;

namespace {

const char* kVars[] = {
    "TOOLGATE_TRANSPORT", "TOOLGATE_LISTEN", "TOOLGATE_PUBLIC_URL", "TOOLGATE_SERVER_NAME",
    "TOOLGATE_LOG_LEVEL", "TOOLGATE_LOG_FILE", "TOOLGATE_REMOTE_URL", "TOOLGATE_BRIDGE_TIMEOUT_MS",
    "TOOLGATE_SESSION_IDLE_MS", "TOOLGATE_HTTP_THREADS", "TOOLGATE_KEEPALIVE_MS",
};

class GatewayConfigTest : public ::testing::Test {
protected:
    void SetUp() override { clear(); }
    void TearDown() override { clear(); }

    static void clear() {
        for (const char* v : kVars) {
            ::unsetenv(v);
        }
    }

    static GatewayConfig load(std::vector<const char*> args) {
        args.insert(args.begin(), "toolgate_gateway");
        return LoadGatewayConfig(static_cast<int>(args.size()), args.data());
    }
};

} // namespace

TEST_F(GatewayConfigTest, Defaults) {
    auto c = load({});
    EXPECT_EQ(c.transport, "stdio");
    EXPECT_EQ(c.listen, "http://0.0.0.0:8000/mcp");
    EXPECT_EQ(c.serverName, "toolgate");
    EXPECT_TRUE(c.remoteUrl.empty());
    EXPECT_EQ(c.bridgeTimeoutMs, 30000ul);
    EXPECT_EQ(c.sessionIdleMs, 1800000ul);
    EXPECT_EQ(c.httpThreads, 4u);
    EXPECT_EQ(c.keepaliveMs, 15000u);
    EXPECT_FALSE(c.showHelp);
}

TEST_F(GatewayConfigTest, EnvironmentIsRead) {
    ::setenv("TOOLGATE_TRANSPORT", "http", 1);
    ::setenv("TOOLGATE_REMOTE_URL", "http://10.0.0.2:8000/mcp", 1);
    ::setenv("TOOLGATE_HTTP_THREADS", "8", 1);
    ::setenv("TOOLGATE_SESSION_IDLE_MS", "0", 1);
    auto c = load({});
    EXPECT_EQ(c.transport, "http");
    EXPECT_EQ(c.remoteUrl, "http://10.0.0.2:8000/mcp");
    EXPECT_EQ(c.httpThreads, 8u);
    EXPECT_EQ(c.sessionIdleMs, 0ul);
}

TEST_F(GatewayConfigTest, ArgumentsOverrideEnvironment) {
    ::setenv("TOOLGATE_TRANSPORT", "stdio", 1);
    ::setenv("TOOLGATE_SERVER_NAME", "from-env", 1);
    auto c = load({"--transport=http", "--server-name=from-cli", "--listen=http://127.0.0.1:9000/rpc",
                   "--public-url=https://gw.example.com/rpc", "--bridge-timeout-ms=1500"});
    EXPECT_EQ(c.transport, "http");
    EXPECT_EQ(c.serverName, "from-cli");
    EXPECT_EQ(c.bridgeTimeoutMs, 1500ul);

    auto opts = ToServerOptions(c);
    EXPECT_EQ(opts.address, "127.0.0.1");
    EXPECT_EQ(opts.port, "9000");
    EXPECT_EQ(opts.rpcPath, "/rpc");
    EXPECT_EQ(opts.publicUrl, "https://gw.example.com/rpc");
    EXPECT_EQ(opts.threads, 4u);
}

TEST_F(GatewayConfigTest, MalformedNumericEnvFallsBackToDefault) {
    ::setenv("TOOLGATE_KEEPALIVE_MS", "often", 1);
    EXPECT_EQ(load({}).keepaliveMs, 15000u);
}

TEST_F(GatewayConfigTest, BadArgumentsThrow) {
    EXPECT_THROW(load({"--transport=pigeon"}), std::invalid_argument);
    EXPECT_THROW(load({"--http-threads=0"}), std::invalid_argument);
    EXPECT_THROW(load({"--http-threads=many"}), std::invalid_argument);
    EXPECT_THROW(load({"--no-such-option=1"}), std::invalid_argument);
    EXPECT_THROW(load({"--transport"}), std::invalid_argument);
    EXPECT_THROW(load({"stray"}), std::invalid_argument);
    EXPECT_THROW(load({"--remote=http://x/mcp", "--bridge-timeout-ms=0"}), std::invalid_argument);
}

TEST_F(GatewayConfigTest, HelpAndVersionFlags) {
    auto c = load({"--help", "--version"});
    EXPECT_TRUE(c.showHelp);
    EXPECT_TRUE(c.showVersion);
    EXPECT_NE(GatewayConfigUsage("gw").find("--remote=URL"), std::string::npos);
}
