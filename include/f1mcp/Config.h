//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Config.h
// Purpose: Runtime options for the F1 MCP server (defaults, F1MCP_* environment, --key=value overrides)
//==========================================================================================================

#pragma once

#include <chrono>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "f1mcp/cache/CacheStore.h"
#include "f1mcp/net/BackoffClient.h"

namespace f1mcp {

//==========================================================================================================
// ServerOptions
// Purpose: Everything the server executable can tune.
// Fields:
//   cache: backend, default TTL, bound on entries.
//   historicalTtl: TTL for seasons that are over.
//   retry: attempts, delays, jitter and overall deadline for provider calls.
//   connectTimeout/readTimeout: Per-phase socket timeouts of a single attempt.
//   providerBaseUrl: Ergast-compatible API root.
//   workers: 0 or 1 = sequential request handling; N > 1 = pool of N workers.
//   logLevel/logFile: Logger configuration.
//==========================================================================================================
struct ServerOptions {
    cache::CacheOptions cache;
    std::chrono::milliseconds historicalTtl{std::chrono::hours(24)};
    net::RetryPolicy retry;
    std::chrono::milliseconds connectTimeout{5000};
    std::chrono::milliseconds readTimeout{10000};
    std::string providerBaseUrl;
    int workers{0};
    std::string logLevel{"INFO"};
    std::string logFile;
};

ServerOptions DefaultServerOptions();

// Lookup function for a named setting; returns std::nullopt when unset.
using SettingSource = std::function<std::optional<std::string>(const std::string& envName, const std::string& cliKey)>;

//==========================================================================================================
// ApplySettings
// Purpose: Overlays settings from source onto options. Malformed values are logged and ignored.
// Returns:
//   Names of settings that were rejected.
//==========================================================================================================
std::vector<std::string> ApplySettings(ServerOptions& options, const SettingSource& source);

// Settings from F1MCP_* environment variables.
std::vector<std::string> ApplyEnvironment(ServerOptions& options);

// Settings from --key=value command-line arguments (argv[0] is skipped).
std::vector<std::string> ApplyCommandLine(ServerOptions& options, int argc, char** argv);

// Parses "--key=value" style options; std::nullopt when key is absent.
std::optional<std::string> getArgValue(int argc, char** argv, const std::string& key);

// One-line human-readable summary for the startup log.
std::string Describe(const ServerOptions& options);

} // namespace f1mcp
