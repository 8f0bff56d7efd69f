//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: CacheStore.cpp
// Purpose: TTL cache and single-flight implementation
//==========================================================================================================

#include "f1mcp/cache/CacheStore.h"

#include <cctype>
#include <exception>

#include "logging/Logger.h"

namespace f1mcp {
namespace cache {

std::optional<CacheBackend> backendFromString(const std::string& name) {
    std::string s; s.reserve(name.size());
    for (char c : name) s.push_back(static_cast<char>(::tolower(static_cast<unsigned char>(c))));
    if (s == "memory" || s == "inmemory" || s == "in-memory") return CacheBackend::Memory;
    if (s == "none" || s == "off" || s == "disabled") return CacheBackend::None;
    return std::nullopt;
}

const char* toString(CacheBackend backend) {
    switch (backend) {
        case CacheBackend::Memory: return "memory";
        case CacheBackend::None: return "none";
    }
    return "unknown";
}

CacheStore::CacheStore(CacheOptions opts, ClockFn clockFn)
    : options(opts), clock(std::move(clockFn)), enabled(opts.backend == CacheBackend::Memory) {
    if (options.maxEntries == 0) {
        options.maxEntries = 1;
    }
    LOG_DEBUG("CacheStore created (backend={}, defaultTtlMs={}, maxEntries={})",
              toString(options.backend), options.defaultTtl.count(), options.maxEntries);
}

CacheStore::~CacheStore() = default;

CacheStore::Clock::time_point CacheStore::now() const {
    return clock ? clock() : Clock::now();
}

bool CacheStore::isExpired(const Entry& e, Clock::time_point t) const {
    return (t - e.createdAt) > e.ttl;
}

FetchResult CacheStore::GetOrCompute(const std::string& key, const ComputeFn& compute) {
    return GetOrCompute(key, options.defaultTtl, compute);
}

FetchResult CacheStore::GetOrCompute(const std::string& key, std::chrono::milliseconds ttl, const ComputeFn& compute) {
    std::shared_ptr<InFlight> flight;
    {
        std::unique_lock<std::mutex> lock(mutex);
        const auto t = now();
        auto it = entries.find(key);
        if (it != entries.end()) {
            if (!isExpired(it->second, t)) {
                ++hits;
                LOG_DEBUG("Cache hit: {}", key);
                return it->second.value;
            }
            entries.erase(it);
        }
        auto fit = inflight.find(key);
        if (fit != inflight.end()) {
            ++hits;
            auto waitOn = fit->second->future;
            lock.unlock();
            LOG_DEBUG("Cache join in-flight: {}", key);
            return waitOn.get();
        }
        ++misses;
        flight = std::make_shared<InFlight>();
        flight->future = flight->promise.get_future().share();
        inflight.emplace(key, flight);
    }

    LOG_DEBUG("Cache miss: {}", key);
    // Completes waiters even when compute throws something unexpected
    struct Completion {
        CacheStore* self;
        const std::string& key;
        std::shared_ptr<InFlight> flight;
        std::chrono::milliseconds ttl;
        bool done{false};
        void complete(const FetchResult& r) {
            self->finish(key, flight, ttl, r);
            done = true;
        }
        ~Completion() {
            if (!done) {
                self->finish(key, flight, ttl,
                    FetchResult::failure(FetchErrorKind::Internal, "Computation for '" + key + "' was aborted"));
            }
        }
    } completion{this, key, flight, ttl};

    FetchResult result;
    try {
        result = compute();
    } catch (const std::exception& e) {
        LOG_ERROR("Cache compute for '{}' threw: {}", key, e.what());
        result = FetchResult::failure(FetchErrorKind::Internal, e.what());
    }
    if (!result.ok() && !result.error.has_value()) {
        result = FetchResult::failure(FetchErrorKind::Internal, "Computation returned no value");
    }
    completion.complete(result);
    return result;
}

void CacheStore::finish(const std::string& key, const std::shared_ptr<InFlight>& flight,
                        std::chrono::milliseconds ttl, const FetchResult& result) {
    {
        std::lock_guard<std::mutex> lock(mutex);
        auto fit = inflight.find(key);
        if (fit != inflight.end() && fit->second == flight) {
            inflight.erase(fit);
        }
        if (result.ok() && enabled && !flight->invalidated && ttl.count() > 0) {
            const auto t = now();
            entries[key] = Entry{result, t, ttl};
            if (entries.size() > options.maxEntries) {
                evictLocked(t);
            }
        }
    }
    flight->promise.set_value(result);
}

void CacheStore::evictLocked(Clock::time_point t) {
    for (auto it = entries.begin(); it != entries.end();) {
        if (isExpired(it->second, t)) it = entries.erase(it); else ++it;
    }
    while (entries.size() > options.maxEntries) {
        auto victim = entries.begin();
        for (auto it = entries.begin(); it != entries.end(); ++it) {
            if (it->second.createdAt + it->second.ttl < victim->second.createdAt + victim->second.ttl) {
                victim = it;
            }
        }
        LOG_DEBUG("Cache evict: {}", victim->first);
        entries.erase(victim);
    }
}

std::size_t CacheStore::Invalidate(const std::string& prefix) {
    std::size_t removed = 0;
    std::lock_guard<std::mutex> lock(mutex);
    for (auto it = entries.begin(); it != entries.end();) {
        if (it->first.compare(0, prefix.size(), prefix) == 0) {
            it = entries.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    for (auto& [key, flight] : inflight) {
        if (key.compare(0, prefix.size(), prefix) == 0) {
            flight->invalidated = true;
        }
    }
    LOG_INFO("Cache invalidated {} entries (prefix='{}')", removed, prefix);
    return removed;
}

CacheStats CacheStore::Stats() const {
    std::lock_guard<std::mutex> lock(mutex);
    CacheStats s;
    const auto t = now();
    for (const auto& [key, e] : entries) {
        if (!isExpired(e, t)) ++s.entryCount;
    }
    s.hitCount = hits;
    s.missCount = misses;
    s.inFlight = inflight.size();
    return s;
}

void CacheStore::SetEnabled(bool on) {
    std::lock_guard<std::mutex> lock(mutex);
    if (enabled == on) return;
    enabled = on;
    if (!on) {
        entries.clear();
        for (auto& [key, flight] : inflight) flight->invalidated = true;
    }
    LOG_INFO("Cache {}", on ? "enabled" : "disabled");
}

bool CacheStore::IsEnabled() const {
    std::lock_guard<std::mutex> lock(mutex);
    return enabled;
}

std::chrono::milliseconds CacheStore::DefaultTtl() const {
    return options.defaultTtl;
}

std::size_t CacheStore::MaxEntries() const {
    return options.maxEntries;
}

} // namespace cache
} // namespace f1mcp
