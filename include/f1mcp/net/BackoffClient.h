//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: BackoffClient.h
// Purpose: Bounded exponential-backoff retry around outbound provider calls
//==========================================================================================================

#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <mutex>
#include <random>

#include "f1mcp/errors/FetchError.h"

namespace f1mcp {
namespace net {

//==========================================================================================================
// RetryPolicy
// Purpose: Retry/backoff configuration.
// Fields:
//   maxAttempts: Total attempts including the first (>= 1).
//   baseDelay: Delay before attempt 2.
//   multiplier: Growth factor between consecutive delays (>= 1).
//   maxDelay: Upper bound for a single delay.
//   jitterRatio: Random stretch in [0, jitterRatio] applied to each delay; clamped to multiplier - 1.
//   overallDeadline: Budget covering every attempt and every delay.
//==========================================================================================================
struct RetryPolicy {
    int maxAttempts{4};
    std::chrono::milliseconds baseDelay{500};
    double multiplier{2.0};
    std::chrono::milliseconds maxDelay{8000};
    double jitterRatio{0.0};
    std::chrono::milliseconds overallDeadline{30000};
};

//==========================================================================================================
// BackoffClient
// Purpose: Runs an operation until it succeeds, fails non-transiently, exhausts its attempts or runs out of
//          time. Delay before attempt n (n >= 2) is min(maxDelay, baseDelay * multiplier^(n-2)), optionally
//          jittered; consecutive delays never decrease. Knows nothing about caching or dispatching.
// Methods:
//   Call(op): FetchResult of the first success, the first non-transient failure, Exhausted (carrying the
//             last transient failure) or Timeout.
//   DelayBeforeAttempt(n, u): Delay preceding attempt n for jitter sample u in [0, 1).
//==========================================================================================================
class BackoffClient {
public:
    using Clock = std::chrono::steady_clock;
    using Sleeper = std::function<void(std::chrono::milliseconds)>;
    using ClockFn = std::function<Clock::time_point()>;

    struct Attempt {
        int number{1};
        Clock::time_point deadline;

        // Time left before the overall deadline, never negative.
        std::chrono::milliseconds Remaining(Clock::time_point now) const;
    };
    using Operation = std::function<FetchResult(const Attempt&)>;

    explicit BackoffClient(RetryPolicy policy, Sleeper sleeper = Sleeper{}, ClockFn clock = ClockFn{},
                           std::uint32_t seed = std::random_device{}());

    FetchResult Call(const Operation& op) const;

    std::chrono::milliseconds DelayBeforeAttempt(int attempt, double jitterSample = 0.0) const;
    const RetryPolicy& Policy() const { return policy; }

private:
    Clock::time_point now() const;
    double nextJitterSample() const;

    RetryPolicy policy;
    Sleeper sleeper;
    ClockFn clock;
    mutable std::mutex rngMutex;
    mutable std::mt19937 rng;
};

} // namespace net
} // namespace f1mcp
