//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: F1Tools.cpp
// Purpose: F1 tool and resource handlers and their registration
//==========================================================================================================

#include "f1mcp/tools/F1Tools.h"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <map>
#include <stdexcept>
#include <vector>

#include <fmt/core.h>

#include "f1mcp/errors/Errors.h"
#include "f1mcp/provider/DataProvider.h"
#include "f1mcp/tools/DriverStatistics.h"
#include "logging/Logger.h"

namespace f1mcp {
namespace tools {

namespace {

constexpr int kFirstSeason = 1950;

using Service = std::shared_ptr<F1DataService>;

////////////////////////////////////////// schema helpers //////////////////////////////////////////
struct Prop {
    const char* name;
    std::vector<std::string> types;
    const char* description;
    bool required;
};

JSONValue schemaOf(std::initializer_list<Prop> props) {
    JSONValue::Object properties;
    JSONValue::Array required;
    for (const auto& p : props) {
        JSONValue::Object prop;
        if (p.types.size() == 1) {
            prop["type"] = makeJSON(p.types.front());
        } else {
            JSONValue::Array types;
            for (const auto& t : p.types) types.push_back(makeJSON(t));
            prop["type"] = makeJSON(JSONValue(std::move(types)));
        }
        prop["description"] = makeJSON(p.description);
        properties[p.name] = makeJSON(JSONValue(std::move(prop)));
        if (p.required) required.push_back(makeJSON(p.name));
    }
    JSONValue::Object schema;
    schema["type"] = makeJSON("object");
    schema["properties"] = makeJSON(JSONValue(std::move(properties)));
    if (!required.empty()) {
        schema["required"] = makeJSON(JSONValue(std::move(required)));
    }
    return JSONValue(std::move(schema));
}

const Prop kYearRequired{"year", {"integer"}, "Season year, e.g. 2024", true};
const Prop kYearOptional{"year", {"integer"}, "Season year (defaults to the current season)", false};
const Prop kGpRequired{"gp", {"string", "integer"}, "Round number or part of the event, circuit or country name", true};
const Prop kGpOptional{"gp", {"string", "integer"}, "Round number or part of the event, circuit or country name", false};
const Prop kSession{"session", {"string"}, "Session: FP1, FP2, FP3, Q, SQ, S (Sprint) or R", true};

////////////////////////////////////////// argument helpers //////////////////////////////////////////
int seasonArg(const Service& svc, const JSONValue& args) {
    const JSONValue* v = args.find("year");
    auto year = getInt(v);
    if (!year.has_value()) {
        throw errors::ValidationError("year",
            (v == nullptr || v->isNull()) ? "Missing required argument: year" : "Argument 'year' must be an integer",
            "integer");
    }
    if (*year < kFirstSeason || *year > svc->CurrentYear() + 1) {
        throw errors::ValidationError("year",
            fmt::format("Season {} is outside {}..{}", *year, kFirstSeason, svc->CurrentYear() + 1), "integer");
    }
    return static_cast<int>(*year);
}

std::optional<int> optionalSeasonArg(const Service& svc, const JSONValue& args) {
    const JSONValue* v = args.find("year");
    if (v == nullptr || v->isNull()) return std::nullopt;
    return seasonArg(svc, args);
}

std::string stringArg(const JSONValue& args, const char* key) {
    auto s = getString(args.find(key));
    if (!s.has_value() || s->empty()) {
        throw errors::ValidationError(key, std::string("Argument '") + key + "' must be a non-empty string", "string");
    }
    return *s;
}

bool hasArg(const JSONValue& args, const char* key) {
    const JSONValue* v = args.find(key);
    return v != nullptr && !v->isNull();
}

std::string sessionArg(const JSONValue& args) {
    const std::string raw = stringArg(args, "session");
    auto code = normalizeSession(raw);
    if (!code.has_value()) {
        throw errors::ValidationError("session", "Unknown session: " + raw, "FP1|FP2|FP3|Q|SQ|S|R");
    }
    return *code;
}

std::string seg(const std::string& s) {
    return provider::urlEncode(s);
}

std::string str(const JSONValue* v) {
    return getString(v).value_or("");
}

JSONValue copyOrNull(const JSONValue* v) {
    return v ? *v : JSONValue(nullptr);
}

JSONValue toArray(const JSONValue::Array& arr) {
    return JSONValue(arr);
}

////////////////////////////////////////// shaping //////////////////////////////////////////
std::string driverName(const JSONValue& driver) {
    std::string given = str(driver.find("givenName"));
    std::string family = str(driver.find("familyName"));
    if (given.empty()) return family;
    return given + " " + family;
}

JSONValue driverSummary(const JSONValue& driver) {
    JSONValue::Object o;
    o["driverId"] = makeJSON(str(driver.find("driverId")));
    o["code"] = makeJSON(copyOrNull(driver.find("code")));
    o["number"] = makeJSON(copyOrNull(driver.find("permanentNumber")));
    o["name"] = makeJSON(driverName(driver));
    o["nationality"] = makeJSON(copyOrNull(driver.find("nationality")));
    return JSONValue(std::move(o));
}

JSONValue eventSummary(const JSONValue& race) {
    JSONValue::Object o;
    o["season"] = makeJSON(copyOrNull(race.find("season")));
    o["round"] = makeJSON(copyOrNull(race.find("round")));
    o["raceName"] = makeJSON(copyOrNull(race.find("raceName")));
    o["circuitId"] = makeJSON(copyOrNull(findPath(race, {"Circuit", "circuitId"})));
    o["circuitName"] = makeJSON(copyOrNull(findPath(race, {"Circuit", "circuitName"})));
    o["locality"] = makeJSON(copyOrNull(findPath(race, {"Circuit", "Location", "locality"})));
    o["country"] = makeJSON(copyOrNull(findPath(race, {"Circuit", "Location", "country"})));
    o["date"] = makeJSON(copyOrNull(race.find("date")));
    o["time"] = makeJSON(copyOrNull(race.find("time")));
    return JSONValue(std::move(o));
}

JSONValue resultSummary(const JSONValue& r) {
    JSONValue::Object o;
    o["position"] = makeJSON(copyOrNull(r.find("position")));
    o["positionText"] = makeJSON(copyOrNull(r.find("positionText")));
    o["driverId"] = makeJSON(copyOrNull(findPath(r, {"Driver", "driverId"})));
    o["code"] = makeJSON(copyOrNull(findPath(r, {"Driver", "code"})));
    if (const JSONValue* d = r.find("Driver")) {
        o["driver"] = makeJSON(driverName(*d));
    }
    o["constructor"] = makeJSON(copyOrNull(findPath(r, {"Constructor", "name"})));
    o["grid"] = makeJSON(copyOrNull(r.find("grid")));
    o["laps"] = makeJSON(copyOrNull(r.find("laps")));
    o["points"] = makeJSON(copyOrNull(r.find("points")));
    o["status"] = makeJSON(copyOrNull(r.find("status")));
    o["time"] = makeJSON(copyOrNull(findPath(r, {"Time", "time"})));
    o["fastestLap"] = makeJSON(copyOrNull(findPath(r, {"FastestLap", "Time", "time"})));
    // Qualifying rows
    if (r.find("Q1")) o["q1"] = makeJSON(copyOrNull(r.find("Q1")));
    if (r.find("Q2")) o["q2"] = makeJSON(copyOrNull(r.find("Q2")));
    if (r.find("Q3")) o["q3"] = makeJSON(copyOrNull(r.find("Q3")));
    return JSONValue(std::move(o));
}

JSONValue summarizeRows(const JSONValue::Array* rows) {
    JSONValue::Array out;
    if (rows) {
        for (const auto& r : *rows) {
            if (r) out.push_back(makeJSON(resultSummary(*r)));
        }
    }
    return JSONValue(std::move(out));
}

// Session code -> calendar key on a Race object. R uses the race's own date/time.
std::vector<const char*> scheduleKeys(const std::string& code) {
    if (code == "FP1") return {"FirstPractice"};
    if (code == "FP2") return {"SecondPractice"};
    if (code == "FP3") return {"ThirdPractice"};
    if (code == "Q") return {"Qualifying"};
    if (code == "SQ") return {"SprintQualifying", "SprintShootout"};
    if (code == "S") return {"Sprint"};
    return {};
}

JSONValue sessionsOf(const JSONValue& race) {
    JSONValue::Object sessions;
    for (const char* code : {"FP1", "FP2", "FP3", "SQ", "Q", "S"}) {
        for (const char* key : scheduleKeys(code)) {
            if (const JSONValue* s = race.find(key)) {
                sessions[code] = makeJSON(*s);
                break;
            }
        }
    }
    JSONValue::Object r;
    r["date"] = makeJSON(copyOrNull(race.find("date")));
    r["time"] = makeJSON(copyOrNull(race.find("time")));
    sessions["R"] = makeJSON(JSONValue(std::move(r)));
    return JSONValue(std::move(sessions));
}

std::vector<JSONValue> sortedByRound(const JSONValue::Array& races) {
    std::vector<JSONValue> out;
    for (const auto& r : races) {
        if (r) out.push_back(*r);
    }
    std::stable_sort(out.begin(), out.end(), [](const JSONValue& a, const JSONValue& b) {
        return asInteger(a.find("round")).value_or(0) < asInteger(b.find("round")).value_or(0);
    });
    return out;
}

JSONValue::Array toSharedArray(std::vector<JSONValue> values) {
    JSONValue::Array out;
    for (auto& v : values) out.push_back(makeJSON(std::move(v)));
    return out;
}

////////////////////////////////////////// lookups //////////////////////////////////////////
// Finds a driver of the season by code, driverId, permanent number or name fragment.
JSONValue resolveDriver(const Service& svc, int season, const std::string& query) {
    const JSONValue::Array drivers =
        svc->FetchList(fmt::format("{}/drivers", season), season, "DriverTable", "Drivers");
    const std::string needle = toLower(query);
    for (const auto& d : drivers) {
        if (!d) continue;
        if (toLower(str(d->find("code"))) == needle || toLower(str(d->find("driverId"))) == needle ||
            str(d->find("permanentNumber")) == query) {
            return *d;
        }
    }
    for (const auto& d : drivers) {
        if (d && toLower(driverName(*d)).find(needle) != std::string::npos) {
            return *d;
        }
    }
    throw errors::DataError(fmt::format("No driver matching '{}' in the {} season", query, season));
}

JSONValue resolveConstructor(const Service& svc, int season, const std::string& query) {
    const JSONValue::Array teams =
        svc->FetchList(fmt::format("{}/constructors", season), season, "ConstructorTable", "Constructors");
    const std::string needle = toLower(query);
    for (const auto& t : teams) {
        if (t && toLower(str(t->find("constructorId"))) == needle) return *t;
    }
    for (const auto& t : teams) {
        if (!t) continue;
        if (toLower(str(t->find("name"))).find(needle) != std::string::npos ||
            toLower(str(t->find("constructorId"))).find(needle) != std::string::npos) {
            return *t;
        }
    }
    throw errors::DataError(fmt::format("No team matching '{}' in the {} season", query, season));
}

JSONValue resolveCircuit(const Service& svc, const std::string& query) {
    const JSONValue::Array circuits = svc->FetchList("circuits", std::nullopt, "CircuitTable", "Circuits");
    const std::string needle = toLower(query);
    for (const auto& c : circuits) {
        if (c && toLower(str(c->find("circuitId"))) == needle) return *c;
    }
    for (const auto& c : circuits) {
        if (!c) continue;
        for (const JSONValue* f : {c->find("circuitName"), findPath(*c, {"Location", "locality"}),
                                   findPath(*c, {"Location", "country"}), c->find("circuitId")}) {
            if (toLower(str(f)).find(needle) != std::string::npos) return *c;
        }
    }
    throw errors::DataError("No circuit matching '" + query + "'");
}

// Race rows of one driver; all rounds of the season or a single one.
JSONValue::Array driverRaces(const Service& svc, int season, const std::string& driverId,
                             std::optional<int64_t> round) {
    const std::string path = round.has_value()
        ? fmt::format("{}/{}/drivers/{}/results", season, *round, seg(driverId))
        : fmt::format("{}/drivers/{}/results", season, seg(driverId));
    return toSharedArray(sortedByRound(svc->FetchList(path, season, "RaceTable", "Races")));
}

////////////////////////////////////////// tools //////////////////////////////////////////
JSONValue getDrivers(const Service& svc, const JSONValue& args) {
    auto season = optionalSeasonArg(svc, args);
    return toArray(svc->FetchList(F1DataService::SeasonSegment(season) + "/drivers", season,
                                  "DriverTable", "Drivers"));
}

JSONValue getDriverResults(const Service& svc, const JSONValue& args) {
    const int season = seasonArg(svc, args);
    const std::string driverId = stringArg(args, "driver_id");
    return toArray(driverRaces(svc, season, driverId, std::nullopt));
}

JSONValue calculateAveragePosition(const Service& svc, const JSONValue& args) {
    const int season = seasonArg(svc, args);
    const std::string driverId = stringArg(args, "driver_id");
    const JSONValue::Array races = driverRaces(svc, season, driverId, std::nullopt);
    if (races.empty()) {
        throw errors::DataError(fmt::format("No race data found for {} in {}", driverId, season));
    }
    const DriverStatistics stats = computeDriverStatistics(races);

    JSONValue::Object o;
    o["driver_id"] = makeJSON(driverId);
    o["year"] = makeJSON(season);
    o["average_position"] = makeJSON(stats.averagePosition.has_value()
        ? JSONValue(*stats.averagePosition) : JSONValue(nullptr));
    o["races_count"] = makeJSON(static_cast<int64_t>(races.size()));
    JSONValue::Array positions;
    for (int p : stats.positions) positions.push_back(makeJSON(p));
    o["positions"] = makeJSON(JSONValue(std::move(positions)));
    return JSONValue(std::move(o));
}

JSONValue getEventSchedule(const Service& svc, const JSONValue& args) {
    auto season = optionalSeasonArg(svc, args);
    JSONValue::Array events;
    std::string seasonText = season.has_value() ? std::to_string(*season) : std::string();
    for (const auto& race : svc->Schedule(season)) {
        if (!race) continue;
        JSONValue e = eventSummary(*race);
        if (auto* obj = std::get_if<JSONValue::Object>(&e.value)) {
            (*obj)["sessions"] = makeJSON(sessionsOf(*race));
        }
        if (seasonText.empty()) seasonText = str(race->find("season"));
        events.push_back(makeJSON(std::move(e)));
    }
    JSONValue::Object o;
    o["season"] = makeJSON(seasonText);
    o["count"] = makeJSON(static_cast<int64_t>(events.size()));
    o["events"] = makeJSON(JSONValue(std::move(events)));
    return JSONValue(std::move(o));
}

JSONValue getSession(const Service& svc, const JSONValue& args) {
    const int season = seasonArg(svc, args);
    const std::string code = sessionArg(args);
    const JSONValue race = svc->ResolveEvent(season, *args.find("gp"));

    JSONValue::Object o;
    o["event"] = makeJSON(eventSummary(race));
    o["session"] = makeJSON(code);
    if (code == "R") {
        o["date"] = makeJSON(copyOrNull(race.find("date")));
        o["time"] = makeJSON(copyOrNull(race.find("time")));
        return JSONValue(std::move(o));
    }
    for (const char* key : scheduleKeys(code)) {
        if (const JSONValue* s = race.find(key)) {
            o["date"] = makeJSON(copyOrNull(s->find("date")));
            o["time"] = makeJSON(copyOrNull(s->find("time")));
            return JSONValue(std::move(o));
        }
    }
    throw errors::DataError(fmt::format("Session {} is not part of {} {}", code, season, str(race.find("raceName"))));
}

JSONValue getSessionResults(const Service& svc, const JSONValue& args) {
    const int season = seasonArg(svc, args);
    const std::string code = sessionArg(args);
    const JSONValue race = svc->ResolveEvent(season, *args.find("gp"));
    const std::string round = str(race.find("round"));

    std::string endpoint;
    const char* rowsKey = nullptr;
    if (code == "R") {
        endpoint = "results";
        rowsKey = "Results";
    } else if (code == "Q") {
        endpoint = "qualifying";
        rowsKey = "QualifyingResults";
    } else if (code == "S") {
        endpoint = "sprint";
        rowsKey = "SprintResults";
    } else {
        throw errors::DataError(fmt::format("Results for session {} are not available from the data provider", code));
    }

    const JSONValue::Array races =
        svc->FetchList(fmt::format("{}/{}/{}", season, seg(round), endpoint), season, "RaceTable", "Races");
    if (races.empty() || !races.front()) {
        throw errors::DataError(fmt::format("No {} results for {} {}", code, season, str(race.find("raceName"))));
    }
    JSONValue::Object o;
    o["event"] = makeJSON(eventSummary(race));
    o["session"] = makeJSON(code);
    o["results"] = makeJSON(summarizeRows(getArray(races.front()->find(rowsKey))));
    return JSONValue(std::move(o));
}

JSONValue getLapTimes(const Service& svc, const JSONValue& args) {
    const int season = seasonArg(svc, args);
    const std::string code = sessionArg(args);
    if (code != "R") {
        throw errors::DataError(fmt::format("Lap timings for session {} are not available from the data provider", code));
    }
    const JSONValue race = svc->ResolveEvent(season, *args.find("gp"));
    const std::string round = str(race.find("round"));

    std::string path = fmt::format("{}/{}/laps", season, seg(round));
    std::optional<JSONValue> driver;
    if (hasArg(args, "driver")) {
        driver = resolveDriver(svc, season, stringArg(args, "driver"));
        path = fmt::format("{}/{}/drivers/{}/laps", season, seg(round), seg(str(driver->find("driverId"))));
    }

    const JSONValue::Array races = svc->FetchList(path, season, "RaceTable", "Races");
    JSONValue::Array laps;
    if (!races.empty() && races.front()) {
        if (const auto* rows = getArray(races.front()->find("Laps"))) {
            for (const auto& lap : *rows) {
                if (!lap) continue;
                JSONValue::Object l;
                l["lap"] = makeJSON(asInteger(lap->find("number")).value_or(0));
                JSONValue::Array timings;
                if (const auto* ts = getArray(lap->find("Timings"))) {
                    for (const auto& t : *ts) {
                        if (!t) continue;
                        JSONValue::Object tj;
                        tj["driverId"] = makeJSON(copyOrNull(t->find("driverId")));
                        tj["position"] = makeJSON(copyOrNull(t->find("position")));
                        tj["time"] = makeJSON(copyOrNull(t->find("time")));
                        auto ms = parseLapTimeMs(str(t->find("time")));
                        tj["time_ms"] = makeJSON(ms.has_value() ? JSONValue(*ms) : JSONValue(nullptr));
                        timings.push_back(makeJSON(JSONValue(std::move(tj))));
                    }
                }
                l["timings"] = makeJSON(JSONValue(std::move(timings)));
                laps.push_back(makeJSON(JSONValue(std::move(l))));
            }
        }
    }
    if (laps.empty()) {
        throw errors::DataError(fmt::format("No lap timings for {} {}", season, str(race.find("raceName"))));
    }
    JSONValue::Object o;
    o["event"] = makeJSON(eventSummary(race));
    o["session"] = makeJSON(code);
    o["driver"] = makeJSON(driver.has_value() ? driverSummary(*driver) : JSONValue(nullptr));
    o["lap_count"] = makeJSON(static_cast<int64_t>(laps.size()));
    o["laps"] = makeJSON(JSONValue(std::move(laps)));
    return JSONValue(std::move(o));
}

JSONValue getDriverInfo(const Service& svc, const JSONValue& args) {
    const int season = seasonArg(svc, args);
    const JSONValue driver = resolveDriver(svc, season, stringArg(args, "driver"));
    const std::string driverId = str(driver.find("driverId"));
    const JSONValue::Array teams = svc->FetchList(fmt::format("{}/drivers/{}/constructors", season, seg(driverId)),
                                                  season, "ConstructorTable", "Constructors");
    JSONValue::Object o;
    o["season"] = makeJSON(season);
    o["driver"] = makeJSON(driver);
    o["teams"] = makeJSON(toArray(teams));
    return JSONValue(std::move(o));
}

JSONValue getTeamInfo(const Service& svc, const JSONValue& args) {
    const int season = seasonArg(svc, args);
    const JSONValue team = resolveConstructor(svc, season, stringArg(args, "team"));
    const std::string teamId = str(team.find("constructorId"));
    const JSONValue::Array drivers = svc->FetchList(fmt::format("{}/constructors/{}/drivers", season, seg(teamId)),
                                                    season, "DriverTable", "Drivers");
    JSONValue::Array summaries;
    for (const auto& d : drivers) {
        if (d) summaries.push_back(makeJSON(driverSummary(*d)));
    }
    JSONValue::Object o;
    o["season"] = makeJSON(season);
    o["team"] = makeJSON(team);
    o["drivers"] = makeJSON(JSONValue(std::move(summaries)));
    return JSONValue(std::move(o));
}

// Shared by the standings tools and resources. rowsKey is DriverStandings or ConstructorStandings.
JSONValue standings(const Service& svc, std::optional<int> season, std::optional<int64_t> round,
                    const std::string& endpoint, const char* rowsKey) {
    std::string path = F1DataService::SeasonSegment(season);
    if (round.has_value()) path += "/" + std::to_string(*round);
    path += "/" + endpoint;

    const JSONValue::Array lists = svc->FetchList(path, season, "StandingsTable", "StandingsLists");
    if (lists.empty() || !lists.front()) {
        throw errors::DataError("No standings available for " + path);
    }
    JSONValue::Array rows;
    for (const auto& list : lists) {
        if (!list) continue;
        if (const auto* r = getArray(list->find(rowsKey))) {
            rows.insert(rows.end(), r->begin(), r->end());
        }
    }
    JSONValue::Object o;
    o["season"] = makeJSON(copyOrNull(lists.front()->find("season")));
    o["round"] = makeJSON(copyOrNull(lists.front()->find("round")));
    o["standings"] = makeJSON(JSONValue(std::move(rows)));
    return JSONValue(std::move(o));
}

std::optional<int64_t> roundArg(const JSONValue& args) {
    if (!hasArg(args, "round")) return std::nullopt;
    auto r = getInt(args.find("round"));
    if (!r.has_value() || *r < 1) {
        throw errors::ValidationError("round", "Round must be a positive integer", "integer");
    }
    return r;
}

JSONValue getDriverStandings(const Service& svc, const JSONValue& args) {
    return standings(svc, seasonArg(svc, args), roundArg(args), "driverStandings", "DriverStandings");
}

JSONValue getConstructorStandings(const Service& svc, const JSONValue& args) {
    return standings(svc, seasonArg(svc, args), roundArg(args), "constructorStandings", "ConstructorStandings");
}

JSONValue getHistoricalResults(const Service& svc, const JSONValue& args) {
    const int season = seasonArg(svc, args);
    std::string path = fmt::format("{}/results", season);
    if (hasArg(args, "gp")) {
        const JSONValue race = svc->ResolveEvent(season, *args.find("gp"));
        path = fmt::format("{}/{}/results", season, seg(str(race.find("round"))));
    }
    JSONValue::Array races;
    for (const auto& race : sortedByRound(svc->FetchList(path, season, "RaceTable", "Races"))) {
        JSONValue summary = eventSummary(race);
        if (auto* obj = std::get_if<JSONValue::Object>(&summary.value)) {
            (*obj)["results"] = makeJSON(summarizeRows(getArray(race.find("Results"))));
        }
        races.push_back(makeJSON(std::move(summary)));
    }
    JSONValue::Object o;
    o["season"] = makeJSON(season);
    o["race_count"] = makeJSON(static_cast<int64_t>(races.size()));
    o["races"] = makeJSON(JSONValue(std::move(races)));
    return JSONValue(std::move(o));
}

JSONValue getLapRecords(const Service& svc, const JSONValue& args) {
    const JSONValue circuit = resolveCircuit(svc, stringArg(args, "circuit"));
    const std::string circuitId = str(circuit.find("circuitId"));
    // Fastest-lap holder of every race run at the circuit
    const JSONValue::Array races = svc->FetchList(fmt::format("circuits/{}/fastest/1/results", seg(circuitId)),
                                                  std::nullopt, "RaceTable", "Races");
    std::optional<int64_t> bestMs;
    JSONValue record(nullptr);
    for (const auto& race : races) {
        if (!race) continue;
        const auto* results = getArray(race->find("Results"));
        if (!results) continue;
        for (const auto& r : *results) {
            if (!r) continue;
            auto ms = parseLapTimeMs(str(findPath(*r, {"FastestLap", "Time", "time"})));
            if (!ms.has_value() || (bestMs.has_value() && *ms >= *bestMs)) continue;
            bestMs = ms;
            JSONValue::Object rec;
            rec["time"] = makeJSON(copyOrNull(findPath(*r, {"FastestLap", "Time", "time"})));
            rec["time_ms"] = makeJSON(*ms);
            rec["lap"] = makeJSON(copyOrNull(findPath(*r, {"FastestLap", "lap"})));
            rec["driver"] = makeJSON(r->find("Driver") ? driverSummary(*r->find("Driver")) : JSONValue(nullptr));
            rec["constructor"] = makeJSON(copyOrNull(findPath(*r, {"Constructor", "name"})));
            rec["season"] = makeJSON(copyOrNull(race->find("season")));
            rec["round"] = makeJSON(copyOrNull(race->find("round")));
            rec["raceName"] = makeJSON(copyOrNull(race->find("raceName")));
            record = JSONValue(std::move(rec));
        }
    }
    JSONValue::Object o;
    o["circuit"] = makeJSON(circuit);
    o["races_with_timing"] = makeJSON(static_cast<int64_t>(races.size()));
    o["record"] = makeJSON(std::move(record));
    return JSONValue(std::move(o));
}

struct DriverSeason {
    JSONValue driver;
    JSONValue::Array races;
};

DriverSeason loadDriverSeason(const Service& svc, int season, const std::string& query,
                              std::optional<int64_t> round) {
    DriverSeason ds;
    ds.driver = resolveDriver(svc, season, query);
    ds.races = driverRaces(svc, season, str(ds.driver.find("driverId")), round);
    return ds;
}

std::optional<int64_t> eventRoundArg(const Service& svc, int season, const JSONValue& args, JSONValue& event) {
    if (!hasArg(args, "gp")) return std::nullopt;
    event = svc->ResolveEvent(season, *args.find("gp"));
    return asInteger(event.find("round"));
}

JSONValue calculateDriverStatistics(const Service& svc, const JSONValue& args) {
    const int season = seasonArg(svc, args);
    JSONValue event(nullptr);
    auto round = eventRoundArg(svc, season, args, event);
    DriverSeason ds = loadDriverSeason(svc, season, stringArg(args, "driver"), round);
    if (ds.races.empty()) {
        throw errors::DataError(fmt::format("No race results for {} in {}", driverName(ds.driver), season));
    }
    JSONValue::Object o;
    o["season"] = makeJSON(season);
    o["event"] = makeJSON(event.isNull() ? JSONValue(nullptr) : eventSummary(event));
    o["driver"] = makeJSON(driverSummary(ds.driver));
    o["statistics"] = makeJSON(toJSON(computeDriverStatistics(ds.races)));
    return JSONValue(std::move(o));
}

JSONValue compareDrivers(const Service& svc, const JSONValue& args) {
    const int season = seasonArg(svc, args);
    JSONValue event(nullptr);
    auto round = eventRoundArg(svc, season, args, event);
    DriverSeason a = loadDriverSeason(svc, season, stringArg(args, "driver1"), round);
    DriverSeason b = loadDriverSeason(svc, season, stringArg(args, "driver2"), round);

    // Head-to-head over rounds both drivers have a result in
    std::map<int64_t, int> positionsA;
    for (const auto& race : a.races) {
        const auto* rs = race ? getArray(race->find("Results")) : nullptr;
        auto r = race ? asInteger(race->find("round")) : std::nullopt;
        if (rs && !rs->empty() && rs->front() && r.has_value()) {
            positionsA[*r] = isClassified(*rs->front()) ? finishingPosition(*rs->front()) : kUnclassifiedPosition;
        }
    }
    int aheadA = 0, aheadB = 0, compared = 0;
    for (const auto& race : b.races) {
        const auto* rs = race ? getArray(race->find("Results")) : nullptr;
        auto r = race ? asInteger(race->find("round")) : std::nullopt;
        if (!rs || rs->empty() || !rs->front() || !r.has_value()) continue;
        auto it = positionsA.find(*r);
        if (it == positionsA.end()) continue;
        const int pb = isClassified(*rs->front()) ? finishingPosition(*rs->front()) : kUnclassifiedPosition;
        ++compared;
        if (it->second < pb) ++aheadA;
        else if (pb < it->second) ++aheadB;
    }

    auto block = [](const DriverSeason& ds) {
        JSONValue::Object o;
        o["driver"] = makeJSON(driverSummary(ds.driver));
        o["statistics"] = makeJSON(toJSON(computeDriverStatistics(ds.races)));
        return JSONValue(std::move(o));
    };
    JSONValue::Object h2h;
    h2h["races_compared"] = makeJSON(compared);
    h2h["driver1_ahead"] = makeJSON(aheadA);
    h2h["driver2_ahead"] = makeJSON(aheadB);

    JSONValue::Object o;
    o["season"] = makeJSON(season);
    o["event"] = makeJSON(event.isNull() ? JSONValue(nullptr) : eventSummary(event));
    o["driver1"] = makeJSON(block(a));
    o["driver2"] = makeJSON(block(b));
    o["head_to_head"] = makeJSON(JSONValue(std::move(h2h)));
    return JSONValue(std::move(o));
}

JSONValue cacheInfo(const Service& svc) {
    const cache::CacheStore& c = svc->Cache();
    const cache::CacheStats st = c.Stats();
    const auto lookups = st.hitCount + st.missCount;
    const auto& policy = svc->Backoff().Policy();

    JSONValue::Object retry;
    retry["max_attempts"] = makeJSON(policy.maxAttempts);
    retry["base_delay_ms"] = makeJSON(static_cast<int64_t>(policy.baseDelay.count()));
    retry["multiplier"] = makeJSON(policy.multiplier);
    retry["max_delay_ms"] = makeJSON(static_cast<int64_t>(policy.maxDelay.count()));
    retry["jitter_ratio"] = makeJSON(policy.jitterRatio);
    retry["overall_deadline_ms"] = makeJSON(static_cast<int64_t>(policy.overallDeadline.count()));

    JSONValue::Object o;
    o["enabled"] = makeJSON(c.IsEnabled());
    o["entry_count"] = makeJSON(static_cast<int64_t>(st.entryCount));
    o["hit_count"] = makeJSON(static_cast<int64_t>(st.hitCount));
    o["miss_count"] = makeJSON(static_cast<int64_t>(st.missCount));
    o["in_flight"] = makeJSON(static_cast<int64_t>(st.inFlight));
    o["hit_rate"] = makeJSON(lookups == 0 ? 0.0 : static_cast<double>(st.hitCount) / static_cast<double>(lookups));
    o["max_entries"] = makeJSON(static_cast<int64_t>(c.MaxEntries()));
    o["default_ttl_s"] = makeJSON(static_cast<int64_t>(
        std::chrono::duration_cast<std::chrono::seconds>(c.DefaultTtl()).count()));
    o["historical_ttl_s"] = makeJSON(static_cast<int64_t>(
        std::chrono::duration_cast<std::chrono::seconds>(svc->HistoricalTtl()).count()));
    o["provider"] = makeJSON(svc->ProviderName());
    o["retry"] = makeJSON(JSONValue(std::move(retry)));
    return JSONValue(std::move(o));
}

JSONValue configureCache(const Service& svc, const JSONValue& args) {
    cache::CacheStore& c = svc->Cache();
    if (auto enabled = getBool(args.find("enabled"))) {
        c.SetEnabled(*enabled);
        LOG_INFO("Cache {}", *enabled ? "enabled" : "disabled");
    }
    int64_t cleared = 0;
    if (getBool(args.find("clear_cache")).value_or(false)) {
        const std::string prefix = getString(args.find("prefix")).value_or("");
        cleared = static_cast<int64_t>(c.Invalidate(prefix));
        LOG_INFO("Cleared {} cache entries (prefix='{}')", cleared, prefix);
    }
    JSONValue::Object o;
    o["cleared"] = makeJSON(cleared);
    o["cache"] = makeJSON(cacheInfo(svc));
    return JSONValue(std::move(o));
}

void add(ToolRegistry& registry, const Service& svc, const char* name, const char* description,
         JSONValue schema, JSONValue (*fn)(const Service&, const JSONValue&)) {
    registry.Register(Tool(name, description, std::move(schema)),
                      [svc, fn](const JSONValue& args) { return fn(svc, args); });
}

} // namespace

std::optional<std::string> normalizeSession(const std::string& name) {
    std::string s;
    for (char c : name) {
        if (c == ' ' || c == '_' || c == '-') continue;
        s.push_back(static_cast<char>(::toupper(static_cast<unsigned char>(c))));
    }
    if (s == "FP1" || s == "PRACTICE1") return "FP1";
    if (s == "FP2" || s == "PRACTICE2") return "FP2";
    if (s == "FP3" || s == "PRACTICE3") return "FP3";
    if (s == "Q" || s == "QUALIFYING") return "Q";
    if (s == "SQ" || s == "SPRINTQUALIFYING" || s == "SPRINTSHOOTOUT" || s == "SS") return "SQ";
    if (s == "S" || s == "SPRINT") return "S";
    if (s == "R" || s == "RACE") return "R";
    return std::nullopt;
}

std::optional<int64_t> parseLapTimeMs(const std::string& text) {
    if (text.empty()) return std::nullopt;
    double minutes = 0.0;
    std::string secondsPart = text;
    auto colon = text.find(':');
    if (colon != std::string::npos) {
        const std::string m = text.substr(0, colon);
        if (m.empty() || !std::all_of(m.begin(), m.end(), [](unsigned char c) { return ::isdigit(c) != 0; })) {
            return std::nullopt;
        }
        minutes = std::atof(m.c_str());
        secondsPart = text.substr(colon + 1);
    }
    if (secondsPart.empty()) return std::nullopt;
    char* end = nullptr;
    double seconds = std::strtod(secondsPart.c_str(), &end);
    if (end == secondsPart.c_str() || *end != '\0' || seconds < 0.0 || !std::isfinite(seconds)) {
        return std::nullopt;
    }
    return static_cast<int64_t>(std::llround((minutes * 60.0 + seconds) * 1000.0));
}

void RegisterF1Tools(ToolRegistry& r, std::shared_ptr<F1DataService> service) {
    if (!service) {
        throw std::invalid_argument("RegisterF1Tools requires a data service");
    }
    const Service svc = std::move(service);

    add(r, svc, "get_drivers", "List the drivers of a season",
        schemaOf({kYearOptional}), getDrivers);
    add(r, svc, "get_driver_results", "Race results of one driver for a season, ordered by round",
        schemaOf({{"driver_id", {"string"}, "Driver id, e.g. max_verstappen", true}, kYearRequired}),
        getDriverResults);
    add(r, svc, "calculate_average_position",
        "Average finishing position of a driver over a season (non-finishes count as 25)",
        schemaOf({{"driver_id", {"string"}, "Driver id, e.g. max_verstappen", true}, kYearRequired}),
        calculateAveragePosition);
    add(r, svc, "get_event_schedule", "Season calendar with session dates",
        schemaOf({kYearOptional}), getEventSchedule);
    add(r, svc, "get_session", "Event details and the scheduled date/time of one session",
        schemaOf({kYearRequired, kGpRequired, kSession}), getSession);
    add(r, svc, "get_session_results", "Classification of a race, qualifying or sprint session",
        schemaOf({kYearRequired, kGpRequired, kSession}), getSessionResults);
    add(r, svc, "get_lap_times", "Lap-by-lap timings of a race, optionally for a single driver",
        schemaOf({kYearRequired, kGpRequired, kSession,
                  {"driver", {"string"}, "Driver code, id, number or name", false}}),
        getLapTimes);
    add(r, svc, "get_driver_info", "Driver details and teams for a season",
        schemaOf({kYearRequired, {"driver", {"string"}, "Driver code, id, number or name", true}}),
        getDriverInfo);
    add(r, svc, "get_team_info", "Constructor details and its drivers for a season",
        schemaOf({kYearRequired, {"team", {"string"}, "Constructor id or name", true}}),
        getTeamInfo);
    add(r, svc, "get_driver_standings", "Drivers' championship standings, after a given round or latest",
        schemaOf({kYearRequired, {"round", {"integer"}, "Round number (defaults to the latest)", false}}),
        getDriverStandings);
    add(r, svc, "get_constructor_standings", "Constructors' championship standings, after a given round or latest",
        schemaOf({kYearRequired, {"round", {"integer"}, "Round number (defaults to the latest)", false}}),
        getConstructorStandings);
    add(r, svc, "get_historical_results", "Race results of a season or of one event",
        schemaOf({kYearRequired, kGpOptional}), getHistoricalResults);
    add(r, svc, "get_lap_records", "Circuit details and the fastest race lap recorded there",
        schemaOf({{"circuit", {"string"}, "Circuit id or part of its name, city or country", true}}),
        getLapRecords);
    add(r, svc, "calculate_driver_statistics",
        "Wins, podiums, points, DNFs, average finish/grid and positions gained for a driver",
        schemaOf({kYearRequired, {"driver", {"string"}, "Driver code, id, number or name", true}, kGpOptional}),
        calculateDriverStatistics);
    add(r, svc, "compare_drivers", "Statistics of two drivers side by side with a head-to-head count",
        schemaOf({kYearRequired,
                  {"driver1", {"string"}, "First driver code, id, number or name", true},
                  {"driver2", {"string"}, "Second driver code, id, number or name", true},
                  kGpOptional}),
        compareDrivers);
    add(r, svc, "configure_cache", "Enable or disable the response cache and clear entries",
        schemaOf({{"enabled", {"boolean"}, "Turn caching on or off", false},
                  {"clear_cache", {"boolean"}, "Drop cached entries", false},
                  {"prefix", {"string"}, "Only drop entries whose key starts with this prefix", false}}),
        configureCache);
    add(r, svc, "get_cache_info", "Cache statistics and retry configuration",
        schemaOf({}), [](const Service& s, const JSONValue&) { return cacheInfo(s); });
}

void RegisterF1Resources(ResourceRegistry& r, std::shared_ptr<F1DataService> service) {
    if (!service) {
        throw std::invalid_argument("RegisterF1Resources requires a data service");
    }
    const Service svc = std::move(service);
    const std::string json = "application/json";
    const JSONValue noArgs{JSONValue::Object{}};

    r.Register(Resource("f1://schedule/current", "Current season schedule",
                        std::string("Calendar of the current season with session dates"), json),
               [svc, noArgs](const std::string&) { return getEventSchedule(svc, noArgs); });
    r.Register(Resource("f1://standings/drivers", "Current drivers' standings",
                        std::string("Latest drivers' championship standings"), json),
               [svc](const std::string&) {
                   return standings(svc, std::nullopt, std::nullopt, "driverStandings", "DriverStandings");
               });
    r.Register(Resource("f1://standings/constructors", "Current constructors' standings",
                        std::string("Latest constructors' championship standings"), json),
               [svc](const std::string&) {
                   return standings(svc, std::nullopt, std::nullopt, "constructorStandings", "ConstructorStandings");
               });
    r.Register(Resource("f1://drivers/current", "Current drivers",
                        std::string("Drivers entered in the current season"), json),
               [svc, noArgs](const std::string&) { return getDrivers(svc, noArgs); });
}

std::shared_ptr<const Registries> BuildF1Registries(std::shared_ptr<F1DataService> service) {
    auto registries = std::make_shared<Registries>();
    RegisterF1Tools(registries->tools, service);
    RegisterF1Resources(registries->resources, service);
    registries->Freeze();
    LOG_INFO("Registered {} tools and {} resources", registries->tools.Size(), registries->resources.Size());
    return registries;
}

} // namespace tools
} // namespace f1mcp
