//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: CacheStore.h
// Purpose: In-memory TTL cache with single-flight computation in front of the data provider
//==========================================================================================================

#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

#include "f1mcp/errors/FetchError.h"

namespace f1mcp {
namespace cache {

// Storage backend selected by configuration. None keeps single-flight but stores nothing.
enum class CacheBackend {
    Memory,
    None
};

// Parses "memory" / "none" (case-insensitive). Returns std::nullopt for anything else.
std::optional<CacheBackend> backendFromString(const std::string& name);
const char* toString(CacheBackend backend);

struct CacheOptions {
    CacheBackend backend{CacheBackend::Memory};
    std::chrono::milliseconds defaultTtl{std::chrono::seconds(300)};
    std::size_t maxEntries{1024};
};

struct CacheStats {
    std::size_t entryCount{0};
    std::uint64_t hitCount{0};
    std::uint64_t missCount{0};
    std::size_t inFlight{0};
};

//==========================================================================================================
// CacheStore
// Purpose: Key -> value store with per-entry expiry. Only successful results are stored. Concurrent callers
//          asking for the same uncached key share one computation: the first caller runs compute, the
//          others block on its result. The store lock is never held while compute runs.
// Methods:
//   GetOrCompute(key, ttl, compute): Cached value or result of compute (which runs at most once per call).
//   Invalidate(prefix): Drops entries whose key starts with prefix (empty prefix drops all); results of
//                       computations in flight for matching keys are not stored. Returns entries dropped.
//   Stats(): Entry count and hit/miss counters. A caller joining an in-flight computation counts as a hit.
//==========================================================================================================
class CacheStore {
public:
    using Clock = std::chrono::steady_clock;
    using ClockFn = std::function<Clock::time_point()>;
    using ComputeFn = std::function<FetchResult()>;

    explicit CacheStore(CacheOptions options = CacheOptions{}, ClockFn clock = ClockFn{});
    ~CacheStore();

    CacheStore(const CacheStore&) = delete;
    CacheStore& operator=(const CacheStore&) = delete;

    FetchResult GetOrCompute(const std::string& key, std::chrono::milliseconds ttl, const ComputeFn& compute);
    FetchResult GetOrCompute(const std::string& key, const ComputeFn& compute);

    std::size_t Invalidate(const std::string& prefix);
    CacheStats Stats() const;

    // Runtime switch between storing and pass-through; disabling also drops stored entries.
    void SetEnabled(bool enabled);
    bool IsEnabled() const;

    std::chrono::milliseconds DefaultTtl() const;
    std::size_t MaxEntries() const;

private:
    struct Entry {
        FetchResult value;
        Clock::time_point createdAt;
        std::chrono::milliseconds ttl;
    };
    struct InFlight {
        std::promise<FetchResult> promise;
        std::shared_future<FetchResult> future;
        bool invalidated{false};
    };

    Clock::time_point now() const;
    bool isExpired(const Entry& e, Clock::time_point t) const;
    void evictLocked(Clock::time_point t);
    void finish(const std::string& key, const std::shared_ptr<InFlight>& flight, std::chrono::milliseconds ttl,
                const FetchResult& result);

    CacheOptions options;
    ClockFn clock;
    bool enabled;

    mutable std::mutex mutex;
    std::unordered_map<std::string, Entry> entries;
    std::unordered_map<std::string, std::shared_ptr<InFlight>> inflight;
    std::uint64_t hits{0};
    std::uint64_t misses{0};
};

} // namespace cache
} // namespace f1mcp
