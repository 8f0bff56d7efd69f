//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: F1DataService.cpp
// Purpose: Cached, retried access to Ergast-shaped F1 data used by the tool and resource handlers
//==========================================================================================================

#include "f1mcp/tools/F1DataService.h"

#include <algorithm>
#include <cctype>
#include <ctime>
#include <stdexcept>

#include "f1mcp/errors/Errors.h"
#include "logging/Logger.h"

namespace f1mcp {
namespace tools {

std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(::tolower(c)); });
    return s;
}

std::optional<int64_t> asInteger(const JSONValue* v) {
    if (v == nullptr) return std::nullopt;
    if (auto i = getInt(v)) return i;
    auto s = getString(v);
    if (!s.has_value() || s->empty() || s->size() > 9) return std::nullopt;
    for (char c : *s) {
        if (!::isdigit(static_cast<unsigned char>(c))) return std::nullopt;
    }
    return std::stoll(*s);
}

namespace {

int systemCurrentYear() {
    std::time_t now = std::time(nullptr);
    std::tm buf{};
    ::localtime_r(&now, &buf);
    return buf.tm_year + 1900;
}

// Child arrays of a Race that the provider pages through.
constexpr const char* kRaceRows[] = {"Results", "QualifyingResults", "SprintResults", "Laps"};

JSONValue::Array concat(const JSONValue::Array* a, const JSONValue::Array* b) {
    JSONValue::Array out;
    if (a) out.insert(out.end(), a->begin(), a->end());
    if (b) out.insert(out.end(), b->begin(), b->end());
    return out;
}

// Appends next's Timings onto the last lap of laps when both describe the same lap number.
JSONValue::Array mergeLaps(const JSONValue::Array* laps, const JSONValue::Array* next) {
    JSONValue::Array out = laps ? *laps : JSONValue::Array{};
    if (!next) return out;
    for (const auto& lap : *next) {
        if (!out.empty() && lap && out.back()) {
            const auto lastNumber = getString(out.back()->find("number"));
            const auto number = getString(lap->find("number"));
            if (lastNumber.has_value() && lastNumber == number) {
                auto* lastObj = std::get_if<JSONValue::Object>(&out.back()->value);
                if (lastObj) {
                    JSONValue::Object merged = *lastObj;
                    merged["Timings"] = makeJSON(JSONValue(concat(getArray(out.back()->find("Timings")),
                                                                  getArray(lap->find("Timings")))));
                    out.back() = makeJSON(JSONValue(std::move(merged)));
                    continue;
                }
            }
        }
        out.push_back(lap);
    }
    return out;
}

// Appends page races to acc; a race continuing from the previous page gets its row arrays merged.
void mergeRaces(JSONValue::Array& acc, const JSONValue::Array& page) {
    for (const auto& race : page) {
        if (!race) continue;
        if (!acc.empty() && acc.back()) {
            const auto lastRound = getString(acc.back()->find("round"));
            const auto lastSeason = getString(acc.back()->find("season"));
            if (lastRound.has_value() && lastRound == getString(race->find("round")) &&
                lastSeason == getString(race->find("season"))) {
                auto* lastObj = std::get_if<JSONValue::Object>(&acc.back()->value);
                if (lastObj) {
                    JSONValue::Object merged = *lastObj;
                    for (const char* key : kRaceRows) {
                        const auto* mine = getArray(acc.back()->find(key));
                        const auto* theirs = getArray(race->find(key));
                        if (!mine && !theirs) continue;
                        merged[key] = makeJSON(JSONValue(std::string(key) == "Laps"
                            ? mergeLaps(mine, theirs) : concat(mine, theirs)));
                    }
                    acc.back() = makeJSON(JSONValue(std::move(merged)));
                    continue;
                }
            }
        }
        acc.push_back(race);
    }
}

} // namespace

F1DataService::F1DataService(std::shared_ptr<provider::IDataProvider> provider,
                             std::shared_ptr<const net::BackoffClient> backoff,
                             std::shared_ptr<cache::CacheStore> cache,
                             std::chrono::milliseconds historicalTtl,
                             YearFn currentYear)
    : provider(std::move(provider)), backoff(std::move(backoff)), cache(std::move(cache)),
      historicalTtl(historicalTtl), currentYear(std::move(currentYear)) {
    if (!this->provider || !this->backoff || !this->cache) {
        throw std::invalid_argument("F1DataService requires a provider, a backoff client and a cache");
    }
    if (!this->currentYear) {
        this->currentYear = systemCurrentYear;
    }
}

int F1DataService::CurrentYear() const {
    return currentYear();
}

std::string F1DataService::SeasonSegment(std::optional<int> season) {
    return season.has_value() ? std::to_string(*season) : std::string("current");
}

std::chrono::milliseconds F1DataService::TtlFor(std::optional<int> season) const {
    if (season.has_value() && *season < CurrentYear()) {
        return historicalTtl;
    }
    return cache->DefaultTtl();
}

JSONValue F1DataService::Query(const provider::ProviderQuery& query) const {
    const std::string key = query.CacheKey();
    FetchResult result = cache->GetOrCompute(key, TtlFor(query.season), [this, &query]() {
        LOG_DEBUG("Cache miss for {}; fetching from {}", query.CacheKey(), provider->Name());
        return backoff->Call([this, &query](const net::BackoffClient::Attempt& attempt) {
            return provider->Fetch(query, attempt);
        });
    });
    if (!result.ok()) {
        FetchError err = result.error.value_or(FetchError{});
        LOG_WARN("Fetch {} failed: {}", key, err.describe());
        throw errors::DataError(std::move(err));
    }
    return *result.value;
}

JSONValue::Array F1DataService::FetchList(const std::string& path, std::optional<int> season,
                                          const std::string& table, const std::string& list,
                                          std::map<std::string, std::string> params) const {
    JSONValue::Array items;
    const bool races = (list == "Races");
    int64_t offset = 0;
    for (int page = 0; page < kMaxPages; ++page) {
        provider::ProviderQuery q;
        q.path = path;
        q.params = params;
        q.params["limit"] = std::to_string(kPageSize);
        q.params["offset"] = std::to_string(offset);
        q.season = season;

        JSONValue mr = Query(q);
        const JSONValue* listVal = findPath(mr, {table.c_str(), list.c_str()});
        if (listVal != nullptr && !listVal->isArray()) {
            throw errors::DataError(FetchError{FetchErrorKind::SchemaMismatch,
                "MRData." + table + "." + list + " is not an array", std::nullopt, 0, std::nullopt});
        }
        if (const auto* arr = getArray(listVal)) {
            if (races) {
                mergeRaces(items, *arr);
            } else {
                items.insert(items.end(), arr->begin(), arr->end());
            }
        }

        // total counts rows (results, laps), not races
        const auto total = asInteger(mr.find("total")).value_or(0);
        const auto limit = asInteger(mr.find("limit")).value_or(kPageSize);
        offset += std::max<int64_t>(limit, 1);
        if (offset >= total) {
            return items;
        }
    }
    LOG_WARN("Stopped paging {} after {} pages", path, kMaxPages);
    return items;
}

JSONValue::Array F1DataService::Schedule(std::optional<int> season) const {
    return FetchList(SeasonSegment(season), season, "RaceTable", "Races");
}

JSONValue F1DataService::ResolveEvent(int season, const JSONValue& gp) const {
    const JSONValue::Array schedule = Schedule(season);
    if (auto round = asInteger(&gp)) {
        for (const auto& race : schedule) {
            if (race && asInteger(race->find("round")) == round) {
                return *race;
            }
        }
        throw errors::DataError("No round " + std::to_string(*round) + " in the " + std::to_string(season) + " season");
    }

    const std::string needle = toLower(getString(&gp).value_or(""));
    if (needle.empty()) {
        throw errors::ValidationError("gp", "Event must be a round number or a non-empty name", "string|integer");
    }
    for (const auto& race : schedule) {
        if (!race) continue;
        const std::string fields[] = {
            getString(race->find("raceName")).value_or(""),
            getString(findPath(*race, {"Circuit", "circuitId"})).value_or(""),
            getString(findPath(*race, {"Circuit", "circuitName"})).value_or(""),
            getString(findPath(*race, {"Circuit", "Location", "locality"})).value_or(""),
            getString(findPath(*race, {"Circuit", "Location", "country"})).value_or(""),
        };
        for (const auto& f : fields) {
            if (!f.empty() && toLower(f).find(needle) != std::string::npos) {
                return *race;
            }
        }
    }
    throw errors::DataError("No event matching '" + getString(&gp).value_or("") + "' in the " +
                            std::to_string(season) + " season");
}

} // namespace tools
} // namespace f1mcp
