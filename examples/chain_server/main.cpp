//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: main.cpp
// Purpose: mcpchain_server - serves a chain composed from handler aliases over stdio or HTTP(S)
//==========================================================================================================

#include <algorithm>
#include <csignal>
#include <iostream>
#include <string>
#include <vector>

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>

#include "logging/Logger.h"
#include "mcpchain/Chain.h"
#include "mcpchain/Config.h"
#include "mcpchain/HTTPServer.hpp"
#include "mcpchain/StdioServer.hpp"
#include "mcpchain/handlers/Catalog.hpp"
#include "mcpchain/version.h"

using namespace mcpchain;

static int serveStdio(const std::shared_ptr<const Chain>& chain, const ServerConfig& cfg) {
    StdioServer server(chain, cfg.framing, std::cin, std::cout);
    server.Run();
    return 0;
}

static int serveHttp(const std::shared_ptr<const Chain>& chain, const ServerConfig& cfg) {
    HTTPServer server(chain, ParseListenUrl(cfg.listen));

    // Block until SIGINT/SIGTERM or a fatal server error.
    boost::asio::io_context signalIoc;
    boost::asio::signal_set signals(signalIoc, SIGINT, SIGTERM);
    int exitCode = 0;
    signals.async_wait([](const boost::system::error_code& ec, int signo) {
        if (!ec) {
            LOG_INFO("Received signal {}, stopping", signo);
        }
    });
    server.SetErrorHandler([&signalIoc, &exitCode](const std::string& err) {
        LOG_ERROR("HTTPServer error: {}", err);
        exitCode = 1;
        signalIoc.stop();
    });

    server.Start().get();
    signalIoc.run();
    server.Stop().get();
    return exitCode;
}

int main(int argc, char** argv) {
    FUNC_SCOPE();
    std::vector<std::string> args(argv + 1, argv + argc);
    if (std::find(args.begin(), args.end(), std::string("--help")) != args.end()) {
        std::cout << Usage();
        return 0;
    }

    ServerConfig cfg;
    try {
        cfg = ParseServerConfig(args);
    } catch (const std::invalid_argument& e) {
        std::cerr << e.what() << "\n" << Usage();
        return 2;
    }

    Logger::setLogLevelFromString(cfg.logLevel);
    if (!cfg.logFile.empty()) {
        Logger::setLogFile(cfg.logFile);
    }
    if (cfg.transport == "stdio") {
        // stdout carries only JSON-RPC frames
        Logger::setForceStderr(true);
    }
    LOG_INFO("mcpchain_server {} starting (transport={}, validation={})",
             getVersionString(), cfg.transport, validation::toString(cfg.validation));

    std::shared_ptr<const Chain> chain;
    try {
        chain = ChainBuilder(handlers::MakeBuiltinRegistry())
                    .FromAliasList(cfg.chain)
                    .SetValidationMode(cfg.validation)
                    .Build();
    } catch (const errors::ChainCompositionError& e) {
        LOG_ERROR("Cannot compose chain '{}': {}", cfg.chain, e.what());
        return 2;
    }

    try {
        if (cfg.transport == "http") {
            return serveHttp(chain, cfg);
        }
        return serveStdio(chain, cfg);
    } catch (const std::exception& e) {
        LOG_ERROR("Server failed: {}", e.what());
        return 1;
    }
}
