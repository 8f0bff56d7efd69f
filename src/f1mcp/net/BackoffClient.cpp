//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: BackoffClient.cpp
// Purpose: Retry loop, delay schedule and deadline enforcement
//==========================================================================================================

#include "f1mcp/net/BackoffClient.h"

#include <algorithm>
#include <cmath>
#include <thread>

#include "logging/Logger.h"

namespace f1mcp {
namespace net {

std::chrono::milliseconds BackoffClient::Attempt::Remaining(Clock::time_point t) const {
    if (t >= deadline) return std::chrono::milliseconds(0);
    return std::chrono::duration_cast<std::chrono::milliseconds>(deadline - t);
}

BackoffClient::BackoffClient(RetryPolicy p, Sleeper s, ClockFn c, std::uint32_t seed)
    : policy(p), sleeper(std::move(s)), clock(std::move(c)), rng(seed) {
    if (policy.maxAttempts < 1) policy.maxAttempts = 1;
    if (policy.multiplier < 1.0) policy.multiplier = 1.0;
    if (policy.baseDelay.count() < 0) policy.baseDelay = std::chrono::milliseconds(0);
    if (policy.maxDelay < policy.baseDelay) policy.maxDelay = policy.baseDelay;
    // Keeps jittered delays non-decreasing: d*(1+j) <= d*multiplier
    policy.jitterRatio = std::clamp(policy.jitterRatio, 0.0, policy.multiplier - 1.0);
    if (!sleeper) {
        sleeper = [](std::chrono::milliseconds d) { std::this_thread::sleep_for(d); };
    }
}

BackoffClient::Clock::time_point BackoffClient::now() const {
    return clock ? clock() : Clock::now();
}

double BackoffClient::nextJitterSample() const {
    if (policy.jitterRatio <= 0.0) return 0.0;
    std::lock_guard<std::mutex> lock(rngMutex);
    std::uniform_real_distribution<double> dist(0.0, 1.0);
    return dist(rng);
}

std::chrono::milliseconds BackoffClient::DelayBeforeAttempt(int attempt, double jitterSample) const {
    if (attempt < 2) return std::chrono::milliseconds(0);
    const double base = static_cast<double>(policy.baseDelay.count());
    const double cap = static_cast<double>(policy.maxDelay.count());
    double raw = base * std::pow(policy.multiplier, attempt - 2);
    raw = std::min(raw, cap);
    const double u = std::clamp(jitterSample, 0.0, 1.0);
    double jittered = std::min(raw * (1.0 + policy.jitterRatio * u), cap);
    return std::chrono::milliseconds(static_cast<int64_t>(std::llround(jittered)));
}

FetchResult BackoffClient::Call(const Operation& op) const {
    const auto deadline = now() + policy.overallDeadline;
    std::optional<FetchError> last;

    auto timeoutError = [&](int attemptsMade) {
        FetchError e;
        e.kind = FetchErrorKind::Timeout;
        e.message = "Overall deadline of " + std::to_string(policy.overallDeadline.count()) + " ms exceeded";
        e.attempts = attemptsMade;
        if (last.has_value()) {
            e.lastKind = last->kind;
            e.httpStatus = last->httpStatus;
        }
        LOG_WARN("{}", e.describe());
        return FetchResult::failure(std::move(e));
    };

    for (int n = 1; n <= policy.maxAttempts; ++n) {
        if (n >= 2) {
            const auto delay = DelayBeforeAttempt(n, nextJitterSample());
            const auto t = now();
            if (t + delay >= deadline) {
                return timeoutError(n - 1);
            }
            LOG_DEBUG("Retrying in {} ms (attempt {}/{})", delay.count(), n, policy.maxAttempts);
            sleeper(delay);
        }
        if (now() >= deadline) {
            return timeoutError(n - 1);
        }

        FetchResult result = op(Attempt{n, deadline});
        if (result.ok()) {
            if (n > 1) LOG_INFO("Provider call succeeded on attempt {}", n);
            return result;
        }
        FetchError err = result.error.value_or(FetchError{FetchErrorKind::Internal, "Operation returned no value"});
        err.attempts = n;
        if (!IsTransient(err.kind)) {
            LOG_DEBUG("Non-transient failure, not retrying: {}", err.describe());
            return FetchResult::failure(std::move(err));
        }
        LOG_WARN("Transient failure on attempt {}/{}: {}", n, policy.maxAttempts, err.describe());
        last = std::move(err);
        if (now() >= deadline) {
            return timeoutError(n);
        }
    }

    FetchError e;
    e.kind = FetchErrorKind::Exhausted;
    e.attempts = policy.maxAttempts;
    if (last.has_value()) {
        e.lastKind = last->kind;
        e.httpStatus = last->httpStatus;
        e.message = last->message;
    }
    LOG_WARN("{}", e.describe());
    return FetchResult::failure(std::move(e));
}

} // namespace net
} // namespace f1mcp
