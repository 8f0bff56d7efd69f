//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: FetchError.h
// Purpose: Classified outbound-call failures and the FetchResult outcome type
//==========================================================================================================

#pragma once

#include <optional>
#include <string>

#include "f1mcp/JSONRPCTypes.h"

namespace f1mcp {

// Classification of a failed provider call.
enum class FetchErrorKind {
    Network,          // resolve/connect/reset/EOF
    AttemptTimeout,   // a single attempt ran past its socket timeout
    RateLimited,      // HTTP 429
    ServerError,      // HTTP 5xx
    ClientError,      // HTTP 4xx other than 429
    Malformed,        // body is not valid JSON
    SchemaMismatch,   // JSON is valid but lacks the expected envelope
    Timeout,          // overall deadline across all attempts exceeded
    Exhausted,        // transient failures on every allowed attempt
    Internal          // unexpected local failure
};

const char* toString(FetchErrorKind kind);

// Network, AttemptTimeout, RateLimited and ServerError are retried by the backoff client.
bool IsTransient(FetchErrorKind kind);

//==========================================================================================================
// FetchError
// Purpose: Failure half of FetchResult.
// Fields:
//   kind: Classification.
//   message: Human-readable detail.
//   httpStatus: Status code when the failure came from an HTTP response.
//   attempts: Number of attempts made (filled in by the backoff client).
//   lastKind: For Exhausted/Timeout, the classification of the last underlying failure.
//==========================================================================================================
struct FetchError {
    FetchErrorKind kind{FetchErrorKind::Internal};
    std::string message;
    std::optional<int> httpStatus;
    int attempts{0};
    std::optional<FetchErrorKind> lastKind;

    std::string describe() const;
};

//==========================================================================================================
// FetchResult
// Purpose: Success/failure outcome of a provider call. Exactly one of value or error is set.
//==========================================================================================================
struct FetchResult {
    std::optional<JSONValue> value;
    std::optional<FetchError> error;

    bool ok() const { return value.has_value() && !error.has_value(); }

    static FetchResult success(JSONValue v) {
        FetchResult r; r.value = std::move(v); return r;
    }
    static FetchResult failure(FetchError e) {
        FetchResult r; r.error = std::move(e); return r;
    }
    static FetchResult failure(FetchErrorKind kind, std::string message, std::optional<int> httpStatus = std::nullopt) {
        FetchError e; e.kind = kind; e.message = std::move(message); e.httpStatus = httpStatus;
        return failure(std::move(e));
    }
};

} // namespace f1mcp
