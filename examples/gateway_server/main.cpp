//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: main.cpp
// Purpose: toolgate gateway executable (stdio or HTTP, optional remote bridge)
//==========================================================================================================

#include <chrono>
#include <csignal>
#include <future>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>

#include "logging/Logger.h"
#include "toolgate/DemoTools.h"
#include "toolgate/Dispatcher.h"
#include "toolgate/GatewayConfig.h"
#include "toolgate/HTTPServer.hpp"
#include "toolgate/RemoteBridge.h"
#include "toolgate/SessionManager.h"
#include "toolgate/StdioTransport.hpp"
#include "toolgate/ToolRegistry.h"
#include "toolgate/version.h"

using namespace toolgate;

int main(int argc, char** argv) {
    GatewayConfig config;
    try {
        config = LoadGatewayConfig(argc, argv);
    } catch (const std::invalid_argument& e) {
        std::cerr << e.what() << "\n" << GatewayConfigUsage(argv[0]);
        return 2;
    }
    if (config.showHelp) {
        std::cout << GatewayConfigUsage(argv[0]);
        return 0;
    }
    if (config.showVersion) {
        std::cout << "toolgate " << getVersionString() << "\n";
        return 0;
    }

    // stdout carries envelopes in stdio mode
    if (config.transport == "stdio") {
        Logger::setUseStderr(true);
    }
    Logger::setLogLevelFromString(config.logLevel);
    if (!config.logFile.empty() && !Logger::setLogFile(config.logFile)) {
        std::cerr << "Cannot open log file " << config.logFile << "; logging to the console only\n";
    }
    FUNC_SCOPE();
    LOG_INFO("toolgate {} starting (transport={})", getVersionString(), config.transport);

    ToolRegistry registry;
    try {
        RegisterDemoTools(registry);
        if (!config.remoteUrl.empty()) {
            BridgeTarget target{config.remoteUrl, std::chrono::milliseconds(config.bridgeTimeoutMs)};
            auto bridge = std::make_shared<RemoteBridge>(target, Implementation{config.serverName, getVersionString()});
            const std::size_t imported = registry.RegisterRemoteTools(bridge);
            LOG_INFO("Imported {} tools from {}", imported, config.remoteUrl);
        }
    } catch (const std::exception& e) {
        LOG_ERROR("Tool registration failed: {}", e.what());
        return 1;
    }
    registry.Seal();

    SessionManager sessions(std::chrono::milliseconds(config.sessionIdleMs));
    Dispatcher::Options dopts;
    dopts.serverInfo = Implementation{config.serverName, getVersionString()};
    Dispatcher dispatcher(registry, sessions, dopts);

    if (config.transport == "stdio") {
        StdioTransport transport(dispatcher);
        transport.SetErrorHandler([](const std::string& err) {
            LOG_WARN("stdio: {}", err);
        });
        transport.Run();
        LOG_INFO("stdin closed; exiting");
        return 0;
    }

    std::unique_ptr<HTTPServer> server;
    try {
        server = std::make_unique<HTTPServer>(dispatcher, ToServerOptions(config));
        server->SetErrorHandler([](const std::string& err) {
            LOG_ERROR("HTTPServer error: {}", err);
        });
        server->Start().get();
    } catch (const std::exception& e) {
        LOG_ERROR("HTTP server failed to start: {}", e.what());
        return 1;
    }
    LOG_INFO("Listening on port {} (path {})", server->BoundPort(), server->GetOptions().rpcPath);

    boost::asio::io_context signals;
    boost::asio::signal_set set(signals, SIGINT, SIGTERM);
    set.async_wait([](const boost::system::error_code& ec, int signo) {
        if (!ec) {
            LOG_INFO("Signal {} received; shutting down", signo);
        }
    });
    signals.run();

    server->Stop().get();
    return 0;
}
