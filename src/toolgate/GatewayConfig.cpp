//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: GatewayConfig.cpp
// Purpose: Gateway configuration loading
//==========================================================================================================

#include "toolgate/GatewayConfig.h"

#include <limits>
#include <stdexcept>

#include "env/EnvVars.h"

namespace toolgate {

namespace {

unsigned long parseUnsigned(const std::string& key, const std::string& value) {
    if (value.empty() || value.find_first_not_of("0123456789") != std::string::npos) {
        throw std::invalid_argument("Invalid value for " + key + ": '" + value + "'");
    }
    try {
        return std::stoul(value);
    } catch (const std::out_of_range&) {
        throw std::invalid_argument("Value out of range for " + key + ": '" + value + "'");
    }
}

unsigned int toUInt(const std::string& key, unsigned long value) {
    if (value > std::numeric_limits<unsigned int>::max()) {
        throw std::invalid_argument("Value out of range for " + key);
    }
    return static_cast<unsigned int>(value);
}

void applyOption(GatewayConfig& cfg, const std::string& key, const std::string& value) {
    if (key == "transport") {
        cfg.transport = value;
    } else if (key == "listen") {
        cfg.listen = value;
    } else if (key == "public-url") {
        cfg.publicUrl = value;
    } else if (key == "server-name") {
        cfg.serverName = value;
    } else if (key == "log-level") {
        cfg.logLevel = value;
    } else if (key == "log-file") {
        cfg.logFile = value;
    } else if (key == "remote") {
        cfg.remoteUrl = value;
    } else if (key == "bridge-timeout-ms") {
        cfg.bridgeTimeoutMs = parseUnsigned(key, value);
    } else if (key == "session-idle-ms") {
        cfg.sessionIdleMs = parseUnsigned(key, value);
    } else if (key == "http-threads") {
        cfg.httpThreads = toUInt(key, parseUnsigned(key, value));
    } else if (key == "keepalive-ms") {
        cfg.keepaliveMs = toUInt(key, parseUnsigned(key, value));
    } else {
        throw std::invalid_argument("Unknown option: --" + key);
    }
}

} // namespace

GatewayConfig LoadGatewayConfig(int argc, const char* const* argv) {
    GatewayConfig cfg;
    cfg.transport = GetEnvOrDefault("TOOLGATE_TRANSPORT", cfg.transport);
    cfg.listen = GetEnvOrDefault("TOOLGATE_LISTEN", cfg.listen);
    cfg.publicUrl = GetEnvOrDefault("TOOLGATE_PUBLIC_URL", cfg.publicUrl);
    cfg.serverName = GetEnvOrDefault("TOOLGATE_SERVER_NAME", cfg.serverName);
    cfg.logLevel = GetEnvOrDefault("TOOLGATE_LOG_LEVEL", cfg.logLevel);
    cfg.logFile = GetEnvOrDefault("TOOLGATE_LOG_FILE", cfg.logFile);
    cfg.remoteUrl = GetEnvOrDefault("TOOLGATE_REMOTE_URL", cfg.remoteUrl);
    cfg.bridgeTimeoutMs = GetEnvUnsignedOrDefault("TOOLGATE_BRIDGE_TIMEOUT_MS", cfg.bridgeTimeoutMs);
    cfg.sessionIdleMs = GetEnvUnsignedOrDefault("TOOLGATE_SESSION_IDLE_MS", cfg.sessionIdleMs);
    cfg.httpThreads = toUInt("TOOLGATE_HTTP_THREADS", GetEnvUnsignedOrDefault("TOOLGATE_HTTP_THREADS", cfg.httpThreads));
    cfg.keepaliveMs = toUInt("TOOLGATE_KEEPALIVE_MS", GetEnvUnsignedOrDefault("TOOLGATE_KEEPALIVE_MS", cfg.keepaliveMs));

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i] != nullptr ? argv[i] : "";
        if (arg == "--help" || arg == "-h") {
            cfg.showHelp = true;
            continue;
        }
        if (arg == "--version") {
            cfg.showVersion = true;
            continue;
        }
        if (arg.rfind("--", 0) != 0) {
            throw std::invalid_argument("Unexpected argument: " + arg);
        }
        const auto eq = arg.find('=');
        if (eq == std::string::npos) {
            throw std::invalid_argument("Option requires a value (--key=value): " + arg);
        }
        applyOption(cfg, arg.substr(2, eq - 2), arg.substr(eq + 1));
    }

    if (cfg.transport != "stdio" && cfg.transport != "http") {
        throw std::invalid_argument("Unsupported transport: " + cfg.transport + " (expected stdio or http)");
    }
    if (cfg.httpThreads == 0u) {
        throw std::invalid_argument("http-threads must be at least 1");
    }
    if (!cfg.remoteUrl.empty() && cfg.bridgeTimeoutMs == 0ul) {
        throw std::invalid_argument("bridge-timeout-ms must be positive");
    }
    return cfg;
}

HTTPServer::Options ToServerOptions(const GatewayConfig& config) {
    HTTPServer::Options opts = HTTPServerFactory::ParseOptions(config.listen);
    if (!config.publicUrl.empty()) {
        opts.publicUrl = config.publicUrl;
    }
    opts.threads = config.httpThreads;
    opts.keepaliveMs = config.keepaliveMs;
    return opts;
}

std::string GatewayConfigUsage(const std::string& program) {
    return "Usage: " + program + " [--key=value ...]\n"
           "  --transport=stdio|http      TOOLGATE_TRANSPORT (default stdio)\n"
           "  --listen=URI                TOOLGATE_LISTEN (default http://0.0.0.0:8000/mcp;\n"
           "                              https://host:port/path?cert=FILE&key=FILE for TLS)\n"
           "  --public-url=URL            TOOLGATE_PUBLIC_URL\n"
           "  --server-name=NAME          TOOLGATE_SERVER_NAME (default toolgate)\n"
           "  --log-level=LEVEL           TOOLGATE_LOG_LEVEL (DEBUG, INFO, WARN, ERROR)\n"
           "  --log-file=PATH             TOOLGATE_LOG_FILE\n"
           "  --remote=URL                TOOLGATE_REMOTE_URL (import tools from a remote gateway)\n"
           "  --bridge-timeout-ms=N       TOOLGATE_BRIDGE_TIMEOUT_MS (default 30000)\n"
           "  --session-idle-ms=N         TOOLGATE_SESSION_IDLE_MS (default 1800000, 0 = never)\n"
           "  --http-threads=N            TOOLGATE_HTTP_THREADS (default 4)\n"
           "  --keepalive-ms=N            TOOLGATE_KEEPALIVE_MS (default 15000)\n"
           "  --version                   Print the version and exit\n";
}

} // namespace toolgate
