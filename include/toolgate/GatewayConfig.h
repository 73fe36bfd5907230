//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: GatewayConfig.h
// Purpose: Gateway process configuration from environment variables and command-line overrides
//==========================================================================================================

#pragma once

#include <string>

#include "toolgate/HTTPServer.hpp"

namespace toolgate {

struct GatewayConfig {
    std::string transport{"stdio"};                    // "stdio" | "http"
    std::string listen{"http://0.0.0.0:8000/mcp"};     // HTTPServerFactory URI form
    std::string publicUrl;
    std::string serverName{"toolgate"};
    std::string logLevel{"INFO"};
    std::string logFile;
    std::string remoteUrl;                             // empty = no bridge
    unsigned long bridgeTimeoutMs{30000ul};
    unsigned long sessionIdleMs{1800000ul};            // 0 disables expiry
    unsigned int httpThreads{4u};
    unsigned int keepaliveMs{15000u};
    bool showHelp{false};
    bool showVersion{false};
};

//==========================================================================================================
// LoadGatewayConfig
// Purpose: Reads TOOLGATE_* environment variables, then applies --key=value arguments on top.
// Args:
//   argc/argv: Process arguments; argv[0] is skipped.
// Returns:
//   The resolved configuration.
// Throws:
//   std::invalid_argument for unknown options, malformed numbers, or an unsupported transport.
//==========================================================================================================
GatewayConfig LoadGatewayConfig(int argc, const char* const* argv);

// HTTP server options for the configured listen URI, public URL, threads and keepalive.
HTTPServer::Options ToServerOptions(const GatewayConfig& config);

// Usage text for --help.
std::string GatewayConfigUsage(const std::string& program);

} // namespace toolgate
