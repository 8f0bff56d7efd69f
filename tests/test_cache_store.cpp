//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_cache_store.cpp
// Purpose: GoogleTests for TTL expiry, single-flight computation, invalidation and stats of CacheStore
//==========================================================================================================

#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <future>
#include <thread>
#include <vector>

#include "f1mcp/cache/CacheStore.h"

using namespace f1mcp;
using namespace std::chrono_literals;
using f1mcp::cache::CacheOptions;
using f1mcp::cache::CacheStore;

namespace {

// Manually advanced clock shared with the store
struct FakeClock {
    std::shared_ptr<CacheStore::Clock::time_point> now =
        std::make_shared<CacheStore::Clock::time_point>(CacheStore::Clock::time_point{} + 1h);
    CacheStore::ClockFn fn() const {
        auto p = now;
        return [p]() { return *p; };
    }
    void advance(std::chrono::milliseconds d) { *now += d; }
};

FetchResult value(int64_t v) {
    return FetchResult::success(JSONValue(v));
}

} // namespace

TEST(CacheStore, HitAfterMissWithinTtl) {
    FakeClock clock;
    CacheStore store(CacheOptions{}, clock.fn());
    int computed = 0;
    auto compute = [&]() { ++computed; return value(42); };

    auto first = store.GetOrCompute("ergast:2024/drivers", 1000ms, compute);
    auto second = store.GetOrCompute("ergast:2024/drivers", 1000ms, compute);
    ASSERT_TRUE(first.ok());
    ASSERT_TRUE(second.ok());
    EXPECT_EQ(*first.value, *second.value);
    EXPECT_EQ(computed, 1);

    auto stats = store.Stats();
    EXPECT_EQ(stats.entryCount, 1u);
    EXPECT_EQ(stats.hitCount, 1u);
    EXPECT_EQ(stats.missCount, 1u);
}

TEST(CacheStore, ExpiredEntryIsRecomputed) {
    FakeClock clock;
    CacheStore store(CacheOptions{}, clock.fn());
    int computed = 0;
    auto compute = [&]() { return value(++computed); };

    store.GetOrCompute("k", 1000ms, compute);
    clock.advance(1000ms);
    // Exactly at the TTL boundary the entry is still fresh
    auto atBoundary = store.GetOrCompute("k", 1000ms, compute);
    EXPECT_EQ(getInt(&*atBoundary.value).value(), 1);
    clock.advance(1ms);
    auto afterExpiry = store.GetOrCompute("k", 1000ms, compute);
    EXPECT_EQ(getInt(&*afterExpiry.value).value(), 2);
    EXPECT_EQ(computed, 2);
}

TEST(CacheStore, FailuresAreNotCached) {
    CacheStore store;
    int computed = 0;
    auto failing = [&]() {
        ++computed;
        return FetchResult::failure(FetchErrorKind::Exhausted, "upstream down");
    };
    EXPECT_FALSE(store.GetOrCompute("k", failing).ok());
    EXPECT_FALSE(store.GetOrCompute("k", failing).ok());
    EXPECT_EQ(computed, 2);
    EXPECT_EQ(store.Stats().entryCount, 0u);
}

TEST(CacheStore, ThrowingComputeBecomesInternalFailure) {
    CacheStore store;
    auto r = store.GetOrCompute("k", []() -> FetchResult { throw std::runtime_error("bad payload"); });
    ASSERT_FALSE(r.ok());
    EXPECT_EQ(r.error->kind, FetchErrorKind::Internal);
    EXPECT_EQ(store.Stats().inFlight, 0u);
}

TEST(CacheStore, ConcurrentCallersShareOneComputation) {
    CacheStore store;
    std::atomic<int> computed{0};
    std::promise<void> release;
    std::shared_future<void> gate = release.get_future().share();

    auto compute = [&]() {
        ++computed;
        gate.wait();
        return value(7);
    };

    constexpr int kCallers = 8;
    std::vector<std::future<FetchResult>> results;
    for (int i = 0; i < kCallers; ++i) {
        results.push_back(std::async(std::launch::async, [&]() {
            return store.GetOrCompute("ergast:2023/results", 10s, compute);
        }));
    }
    // Let every caller reach the store before the computation finishes
    for (int spin = 0; spin < 200 && store.Stats().hitCount + store.Stats().missCount < kCallers; ++spin) {
        std::this_thread::sleep_for(5ms);
    }
    release.set_value();

    for (auto& f : results) {
        auto r = f.get();
        ASSERT_TRUE(r.ok());
        EXPECT_EQ(getInt(&*r.value).value(), 7);
    }
    EXPECT_EQ(computed.load(), 1);
    auto stats = store.Stats();
    EXPECT_EQ(stats.missCount, 1u);
    EXPECT_EQ(stats.hitCount, static_cast<uint64_t>(kCallers - 1));
}

TEST(CacheStore, InvalidateByPrefix) {
    CacheStore store;
    store.GetOrCompute("ergast:2024/drivers", [] { return value(1); });
    store.GetOrCompute("ergast:2024/results", [] { return value(2); });
    store.GetOrCompute("ergast:2023/results", [] { return value(3); });

    EXPECT_EQ(store.Invalidate("ergast:2024"), 2u);
    EXPECT_EQ(store.Stats().entryCount, 1u);
    EXPECT_EQ(store.Invalidate(""), 1u);
    EXPECT_EQ(store.Stats().entryCount, 0u);
}

TEST(CacheStore, InvalidateDuringComputationDiscardsResult) {
    CacheStore store;
    auto r = store.GetOrCompute("ergast:current/drivers", [&]() {
        store.Invalidate("ergast:current");
        return value(1);
    });
    EXPECT_TRUE(r.ok());
    EXPECT_EQ(store.Stats().entryCount, 0u);
}

TEST(CacheStore, EvictsEntryClosestToExpiry) {
    FakeClock clock;
    CacheOptions opts;
    opts.maxEntries = 2;
    CacheStore store(opts, clock.fn());
    int computed = 0;
    auto compute = [&]() { return value(++computed); };

    store.GetOrCompute("short", 1000ms, compute);
    store.GetOrCompute("long", 60000ms, compute);
    store.GetOrCompute("medium", 5000ms, compute);

    EXPECT_EQ(store.Stats().entryCount, 2u);
    const int before = computed;
    store.GetOrCompute("long", 60000ms, compute);
    store.GetOrCompute("medium", 5000ms, compute);
    EXPECT_EQ(computed, before);
    store.GetOrCompute("short", 1000ms, compute);
    EXPECT_EQ(computed, before + 1);
}

TEST(CacheStore, DisabledStoreComputesEveryTime) {
    CacheOptions opts;
    opts.backend = cache::CacheBackend::None;
    CacheStore store(opts);
    EXPECT_FALSE(store.IsEnabled());
    int computed = 0;
    store.GetOrCompute("k", [&] { return value(++computed); });
    store.GetOrCompute("k", [&] { return value(++computed); });
    EXPECT_EQ(computed, 2);
    EXPECT_EQ(store.Stats().entryCount, 0u);
}

TEST(CacheStore, RuntimeDisableDropsEntries) {
    CacheStore store;
    store.GetOrCompute("k", [] { return value(1); });
    EXPECT_EQ(store.Stats().entryCount, 1u);
    store.SetEnabled(false);
    EXPECT_EQ(store.Stats().entryCount, 0u);
    store.SetEnabled(true);
    store.GetOrCompute("k", [] { return value(1); });
    EXPECT_EQ(store.Stats().entryCount, 1u);
}

TEST(CacheStore, ZeroTtlIsNotStored) {
    CacheStore store;
    int computed = 0;
    store.GetOrCompute("k", 0ms, [&] { return value(++computed); });
    store.GetOrCompute("k", 0ms, [&] { return value(++computed); });
    EXPECT_EQ(computed, 2);
}

TEST(CacheStore, BackendNames) {
    EXPECT_EQ(cache::backendFromString("MEMORY"), cache::CacheBackend::Memory);
    EXPECT_EQ(cache::backendFromString("none"), cache::CacheBackend::None);
    EXPECT_FALSE(cache::backendFromString("redis").has_value());
}
