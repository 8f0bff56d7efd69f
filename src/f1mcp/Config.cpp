//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Config.cpp
// Purpose: Runtime options for the F1 MCP server (defaults, F1MCP_* environment, --key=value overrides)
//==========================================================================================================

#include "f1mcp/Config.h"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>

#include <fmt/core.h>

#include "env/EnvVars.h"
#include "f1mcp/provider/ErgastProvider.hpp"
#include "logging/Logger.h"

namespace f1mcp {

namespace {

std::optional<long long> parseInteger(const std::string& text) {
    if (text.empty()) return std::nullopt;
    errno = 0;
    char* end = nullptr;
    long long v = std::strtoll(text.c_str(), &end, 10);
    if (errno != 0 || end == text.c_str() || *end != '\0') return std::nullopt;
    return v;
}

std::optional<double> parseDouble(const std::string& text) {
    if (text.empty()) return std::nullopt;
    errno = 0;
    char* end = nullptr;
    double v = std::strtod(text.c_str(), &end);
    if (errno != 0 || end == text.c_str() || *end != '\0') return std::nullopt;
    return v;
}

class SettingsReader {
public:
    SettingsReader(const SettingSource& source, std::vector<std::string>& rejected)
        : source(source), rejected(rejected) {}

    // Integer setting in [minValue, maxValue]; out-of-range or malformed values are rejected.
    template <typename Apply>
    void integer(const char* env, const char* cli, long long minValue, long long maxValue, Apply apply) {
        auto raw = source(env, cli);
        if (!raw.has_value()) return;
        auto v = parseInteger(*raw);
        if (!v.has_value() || *v < minValue || *v > maxValue) {
            reject(env, *raw, fmt::format("an integer in [{}, {}]", minValue, maxValue));
            return;
        }
        apply(*v);
    }

    template <typename Apply>
    void real(const char* env, const char* cli, double minValue, Apply apply) {
        auto raw = source(env, cli);
        if (!raw.has_value()) return;
        auto v = parseDouble(*raw);
        if (!v.has_value() || *v < minValue) {
            reject(env, *raw, fmt::format("a number >= {}", minValue));
            return;
        }
        apply(*v);
    }

    template <typename Apply>
    void text(const char* env, const char* cli, Apply apply) {
        auto raw = source(env, cli);
        if (!raw.has_value()) return;
        if (!apply(*raw)) {
            reject(env, *raw, "a supported value");
        }
    }

private:
    void reject(const char* env, const std::string& raw, const std::string& expected) {
        LOG_WARN("Ignoring {}='{}': expected {}", env, raw, expected);
        rejected.emplace_back(env);
    }

    const SettingSource& source;
    std::vector<std::string>& rejected;
};

} // namespace

ServerOptions DefaultServerOptions() {
    ServerOptions options;
    options.providerBaseUrl = provider::kDefaultErgastBaseUrl;
    return options;
}

std::vector<std::string> ApplySettings(ServerOptions& o, const SettingSource& source) {
    using std::chrono::milliseconds;
    using std::chrono::seconds;
    constexpr long long kMaxMs = 24LL * 3600 * 1000;
    constexpr long long kMaxSeconds = 365LL * 24 * 3600;

    std::vector<std::string> rejected;
    SettingsReader r(source, rejected);

    r.text("F1MCP_CACHE_BACKEND", "--cache", [&](const std::string& v) {
        auto backend = cache::backendFromString(v);
        if (!backend.has_value()) return false;
        o.cache.backend = *backend;
        return true;
    });
    r.integer("F1MCP_CACHE_TTL_S", "--cache-ttl-s", 0, kMaxSeconds,
              [&](long long v) { o.cache.defaultTtl = std::chrono::duration_cast<milliseconds>(seconds(v)); });
    r.integer("F1MCP_CACHE_HISTORICAL_TTL_S", "--cache-historical-ttl-s", 0, kMaxSeconds,
              [&](long long v) { o.historicalTtl = std::chrono::duration_cast<milliseconds>(seconds(v)); });
    r.integer("F1MCP_CACHE_MAX_ENTRIES", "--cache-max-entries", 1, 10000000,
              [&](long long v) { o.cache.maxEntries = static_cast<std::size_t>(v); });

    r.integer("F1MCP_RETRY_ATTEMPTS", "--retry-attempts", 1, 100,
              [&](long long v) { o.retry.maxAttempts = static_cast<int>(v); });
    r.integer("F1MCP_RETRY_BASE_MS", "--retry-base-ms", 0, kMaxMs,
              [&](long long v) { o.retry.baseDelay = milliseconds(v); });
    r.real("F1MCP_RETRY_MULTIPLIER", "--retry-multiplier", 1.0,
           [&](double v) { o.retry.multiplier = v; });
    r.integer("F1MCP_RETRY_MAX_DELAY_MS", "--retry-max-delay-ms", 0, kMaxMs,
              [&](long long v) { o.retry.maxDelay = milliseconds(v); });
    r.real("F1MCP_RETRY_JITTER", "--retry-jitter", 0.0,
           [&](double v) { o.retry.jitterRatio = v; });
    r.integer("F1MCP_FETCH_DEADLINE_MS", "--fetch-deadline-ms", 1, kMaxMs,
              [&](long long v) { o.retry.overallDeadline = milliseconds(v); });

    r.integer("F1MCP_HTTP_CONNECT_TIMEOUT_MS", "--connect-timeout-ms", 1, kMaxMs,
              [&](long long v) { o.connectTimeout = milliseconds(v); });
    r.integer("F1MCP_HTTP_READ_TIMEOUT_MS", "--read-timeout-ms", 1, kMaxMs,
              [&](long long v) { o.readTimeout = milliseconds(v); });
    r.text("F1MCP_PROVIDER_URL", "--provider-url", [&](const std::string& v) {
        if (v.rfind("http://", 0) != 0 && v.rfind("https://", 0) != 0) return false;
        o.providerBaseUrl = v;
        while (o.providerBaseUrl.size() > 1 && o.providerBaseUrl.back() == '/') o.providerBaseUrl.pop_back();
        return true;
    });
    r.integer("F1MCP_WORKERS", "--workers", 0, 256,
              [&](long long v) { o.workers = static_cast<int>(v); });

    r.text("F1MCP_LOG_LEVEL", "--log-level", [&](const std::string& v) {
        std::string up;
        for (char c : v) up.push_back(static_cast<char>(::toupper(static_cast<unsigned char>(c))));
        if (up != "DEBUG" && up != "INFO" && up != "WARN" && up != "WARNING" && up != "ERROR") return false;
        o.logLevel = up;
        return true;
    });
    r.text("F1MCP_LOG_FILE", "--log-file", [&](const std::string& v) {
        o.logFile = v;
        return true;
    });

    // Jittered delays must stay monotone: (1 + j) <= multiplier.
    const double maxJitter = std::max(0.0, o.retry.multiplier - 1.0);
    if (o.retry.jitterRatio > maxJitter) {
        LOG_WARN("Clamping retry jitter {} to {} (multiplier {})", o.retry.jitterRatio, maxJitter, o.retry.multiplier);
        o.retry.jitterRatio = maxJitter;
    }
    if (o.retry.maxDelay < o.retry.baseDelay) {
        LOG_WARN("Raising retry max delay {} ms to base delay {} ms", o.retry.maxDelay.count(), o.retry.baseDelay.count());
        o.retry.maxDelay = o.retry.baseDelay;
    }
    return rejected;
}

std::vector<std::string> ApplyEnvironment(ServerOptions& options) {
    return ApplySettings(options, [](const std::string& envName, const std::string&) {
        return GetEnv(envName.c_str());
    });
}

std::optional<std::string> getArgValue(int argc, char** argv, const std::string& key) {
    for (size_t i = 1; i < static_cast<size_t>(argc); ++i) {
        std::string a = argv[i];
        auto eq = a.find('=');
        if (eq != std::string::npos) {
            std::string k = a.substr(0, eq);
            std::string v = a.substr(eq + 1);
            if (k == key) {
                return v;
            }
        }
    }
    return std::nullopt;
}

std::vector<std::string> ApplyCommandLine(ServerOptions& options, int argc, char** argv) {
    return ApplySettings(options, [argc, argv](const std::string&, const std::string& cliKey) {
        return getArgValue(argc, argv, cliKey);
    });
}

std::string Describe(const ServerOptions& o) {
    return fmt::format(
        "cache={} ttl={}s historicalTtl={}s maxEntries={} retry(attempts={} base={}ms x{} max={}ms jitter={} "
        "deadline={}ms) connect={}ms read={}ms provider={} workers={} logLevel={}",
        cache::toString(o.cache.backend),
        std::chrono::duration_cast<std::chrono::seconds>(o.cache.defaultTtl).count(),
        std::chrono::duration_cast<std::chrono::seconds>(o.historicalTtl).count(),
        o.cache.maxEntries, o.retry.maxAttempts, o.retry.baseDelay.count(), o.retry.multiplier,
        o.retry.maxDelay.count(), o.retry.jitterRatio, o.retry.overallDeadline.count(),
        o.connectTimeout.count(), o.readTimeout.count(), o.providerBaseUrl, o.workers, o.logLevel);
}

} // namespace f1mcp
