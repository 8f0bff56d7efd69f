//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: main.cpp
// Purpose: F1 data MCP server over stdin/stdout
//==========================================================================================================

#include <exception>
#include <iostream>
#include <memory>

#include "env/EnvVars.h"
#include "f1mcp/Config.h"
#include "f1mcp/Dispatcher.h"
#include "f1mcp/StdioServer.hpp"
#include "f1mcp/cache/CacheStore.h"
#include "f1mcp/net/BackoffClient.h"
#include "f1mcp/net/HttpClient.hpp"
#include "f1mcp/provider/ErgastProvider.hpp"
#include "f1mcp/tools/F1DataService.h"
#include "f1mcp/tools/F1Tools.h"
#include "f1mcp/version.h"
#include "logging/Logger.h"

using namespace f1mcp;

int main(int argc, char** argv) {
    FUNC_SCOPE();
    // stdout carries JSON-RPC frames only
    Logger::setStdioMode(true);
    Logger::setLogLevelFromString(GetEnvOrDefault("F1MCP_LOG_LEVEL", "INFO"));

    ServerOptions options = DefaultServerOptions();
    ApplyEnvironment(options);
    ApplyCommandLine(options, argc, argv);
    Logger::setLogLevelFromString(options.logLevel);
    if (!options.logFile.empty()) {
        Logger::setLogFile(options.logFile);
    }
    LOG_INFO("{} {} starting: {}", SERVER_NAME, getVersionString(), Describe(options));

    std::shared_ptr<Dispatcher> dispatcher;
    try {
        net::HttpClientOptions httpOptions;
        httpOptions.connectTimeout = options.connectTimeout;
        httpOptions.readTimeout = options.readTimeout;
        httpOptions.userAgent = getUserAgent();
        net::HttpClientFactory httpFactory;
        auto http = httpFactory.CreateClient(httpOptions);

        // One attempt may spend at most connect + read time
        auto provider = std::make_shared<provider::ErgastProvider>(
            options.providerBaseUrl, http, options.connectTimeout + options.readTimeout);
        auto backoff = std::make_shared<const net::BackoffClient>(options.retry);
        auto cacheStore = std::make_shared<cache::CacheStore>(options.cache);
        auto service = std::make_shared<tools::F1DataService>(provider, backoff, cacheStore, options.historicalTtl);

        dispatcher = std::make_shared<Dispatcher>(tools::BuildF1Registries(service),
                                                  Implementation{SERVER_NAME, getVersionString()});
    } catch (const std::exception& e) {
        LOG_ERROR("Startup failed: {}", e.what());
        return 1;
    }

    StdioServerOptions stdioOptions;
    stdioOptions.workers = options.workers;
    StdioServer server(dispatcher, stdioOptions);

    std::ios::sync_with_stdio(false);
    server.Run(std::cin, std::cout);
    LOG_INFO("{} stopped", SERVER_NAME);
    return 0;
}
