//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: DataProvider.h
// Purpose: Data provider adapter interface and query descriptor
//==========================================================================================================

#pragma once

#include <map>
#include <optional>
#include <string>

#include "f1mcp/errors/FetchError.h"
#include "f1mcp/net/BackoffClient.h"

namespace f1mcp {
namespace provider {

//==========================================================================================================
// ProviderQuery
// Purpose: Resource path relative to the provider base (e.g. "2024/drivers") plus query parameters.
//          Every field that changes the response is part of CacheKey().
//==========================================================================================================
struct ProviderQuery {
    std::string path;
    std::map<std::string, std::string> params;
    // Season the query targets; drives cache TTL selection. Empty for "current" or season-less queries.
    std::optional<int> season;

    // "ergast:" + path + "?" + sorted, encoded params
    std::string CacheKey() const;
    // path + "?" + sorted, encoded params (relative URL suffix)
    std::string Target() const;
};

// Percent-encodes everything outside RFC 3986 unreserved characters.
std::string urlEncode(const std::string& value);

//==========================================================================================================
// IDataProvider
// Purpose: One attempt at fetching a query. Classifies failures so the backoff client can decide whether
//          to retry. Implementations must be callable from several threads.
// Args:
//   query: What to fetch.
//   attempt: Attempt number and the overall deadline; implementations bound their I/O by it.
// Returns:
//   FetchResult with the decoded payload or a classified FetchError.
//==========================================================================================================
class IDataProvider {
public:
    virtual ~IDataProvider() = default;
    virtual FetchResult Fetch(const ProviderQuery& query, const net::BackoffClient::Attempt& attempt) = 0;
    virtual std::string Name() const = 0;
};

} // namespace provider
} // namespace f1mcp
