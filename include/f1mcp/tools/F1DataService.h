//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: F1DataService.h
// Purpose: Cached, retried access to Ergast-shaped F1 data used by the tool and resource handlers
//==========================================================================================================

#pragma once

#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>

#include "f1mcp/JSONRPCTypes.h"
#include "f1mcp/cache/CacheStore.h"
#include "f1mcp/net/BackoffClient.h"
#include "f1mcp/provider/DataProvider.h"

namespace f1mcp {
namespace tools {

//==========================================================================================================
// F1DataService
// Purpose: Every provider read goes through here: CacheStore first, then BackoffClient around the provider.
//          Failures are thrown as errors::DataError carrying the FetchError.
// Methods:
//   Query(q): MRData object for one request.
//   FetchList(path, season, table, list): All items of MRData.<table>.<list> across pages (limit/offset).
//                                         Races split across pages are merged by round.
//   Schedule(season): Season calendar (Races); std::nullopt season means the current one.
//   ResolveEvent(season, gp): Race entry of the calendar matching a round number or a name fragment.
//   TtlFor(season): Historical TTL for finished seasons, default TTL otherwise.
//==========================================================================================================
class F1DataService {
public:
    using YearFn = std::function<int()>;

    static constexpr int kPageSize = 100;
    static constexpr int kMaxPages = 30;

    F1DataService(std::shared_ptr<provider::IDataProvider> provider,
                  std::shared_ptr<const net::BackoffClient> backoff,
                  std::shared_ptr<cache::CacheStore> cache,
                  std::chrono::milliseconds historicalTtl,
                  YearFn currentYear = YearFn{});

    JSONValue Query(const provider::ProviderQuery& query) const;

    JSONValue::Array FetchList(const std::string& path, std::optional<int> season,
                               const std::string& table, const std::string& list,
                               std::map<std::string, std::string> params = {}) const;

    JSONValue::Array Schedule(std::optional<int> season) const;
    JSONValue ResolveEvent(int season, const JSONValue& gp) const;

    std::chrono::milliseconds TtlFor(std::optional<int> season) const;
    int CurrentYear() const;

    cache::CacheStore& Cache() const { return *cache; }
    const net::BackoffClient& Backoff() const { return *backoff; }
    std::chrono::milliseconds HistoricalTtl() const { return historicalTtl; }
    std::string ProviderName() const { return provider->Name(); }

    // "2024" or "current"
    static std::string SeasonSegment(std::optional<int> season);

private:
    std::shared_ptr<provider::IDataProvider> provider;
    std::shared_ptr<const net::BackoffClient> backoff;
    std::shared_ptr<cache::CacheStore> cache;
    std::chrono::milliseconds historicalTtl;
    YearFn currentYear;
};

// Lower-cases ASCII letters.
std::string toLower(std::string s);

// Integer value of a JSON integer or an all-digit string ("7", 7); std::nullopt otherwise.
std::optional<int64_t> asInteger(const JSONValue* v);

} // namespace tools
} // namespace f1mcp
