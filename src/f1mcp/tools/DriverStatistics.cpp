//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: DriverStatistics.cpp
// Purpose: Season/race statistics computed from Ergast race results
//==========================================================================================================

#include "f1mcp/tools/DriverStatistics.h"

#include <cctype>
#include <cmath>
#include <cstdlib>

#include "f1mcp/tools/F1DataService.h"

namespace f1mcp {
namespace tools {

namespace {
std::optional<double> parseNumber(const JSONValue* v) {
    if (auto n = getNumber(v)) return n;
    auto s = getString(v);
    if (!s.has_value() || s->empty()) return std::nullopt;
    char* end = nullptr;
    double d = std::strtod(s->c_str(), &end);
    if (end == s->c_str() || *end != '\0' || !std::isfinite(d)) return std::nullopt;
    return d;
}

std::optional<double> mean(long long sum, int count) {
    if (count == 0) return std::nullopt;
    return static_cast<double>(sum) / count;
}

JSONValue optionalNumber(const std::optional<double>& v) {
    if (!v.has_value()) return JSONValue(nullptr);
    // Two decimals keeps the text output readable
    return JSONValue(std::round(*v * 100.0) / 100.0);
}
} // namespace

bool isClassified(const JSONValue& result) {
    auto text = getString(result.find("positionText"));
    if (!text.has_value()) {
        // Older payloads only carry position
        return asInteger(result.find("position")).has_value();
    }
    return asInteger(result.find("positionText")).has_value();
}

int finishingPosition(const JSONValue& result) {
    auto pos = asInteger(result.find("position"));
    if (!pos.has_value() || *pos <= 0) return kUnclassifiedPosition;
    return static_cast<int>(*pos);
}

DriverStatistics computeDriverStatistics(const JSONValue::Array& races) {
    DriverStatistics s;
    long long positionSum = 0;
    long long finishSum = 0;
    int finishes = 0;
    long long gridSum = 0;
    int gridCount = 0;

    for (const auto& race : races) {
        if (!race) continue;
        const auto* results = getArray(race->find("Results"));
        if (!results || results->empty() || !results->front()) continue;
        const JSONValue& r = *results->front();

        ++s.races;
        const bool classified = isClassified(r);
        const int position = classified ? finishingPosition(r) : kUnclassifiedPosition;
        s.positions.push_back(position);
        positionSum += position;

        s.points += parseNumber(r.find("points")).value_or(0.0);
        if (parseNumber(r.find("points")).value_or(0.0) > 0.0) ++s.pointsFinishes;

        const auto grid = asInteger(r.find("grid"));
        if (grid.has_value() && *grid > 0) {
            gridSum += *grid;
            ++gridCount;
            if (*grid == 1) ++s.poles;
        }
        if (asInteger(findPath(r, {"FastestLap", "rank"})) == 1) {
            ++s.fastestLaps;
        }

        if (!classified) {
            ++s.dnfs;
            continue;
        }
        ++finishes;
        finishSum += position;
        if (position == 1) ++s.wins;
        if (position <= 3) ++s.podiums;
        if (!s.bestFinish.has_value() || position < *s.bestFinish) s.bestFinish = position;
        if (grid.has_value() && *grid > 0) {
            s.positionsGained += static_cast<int>(*grid) - position;
        }
    }

    s.averagePosition = mean(positionSum, s.races);
    s.averageFinish = mean(finishSum, finishes);
    s.averageGrid = mean(gridSum, gridCount);
    return s;
}

JSONValue toJSON(const DriverStatistics& s) {
    JSONValue::Object obj;
    obj["races"] = makeJSON(JSONValue(s.races));
    obj["wins"] = makeJSON(JSONValue(s.wins));
    obj["podiums"] = makeJSON(JSONValue(s.podiums));
    obj["points_finishes"] = makeJSON(JSONValue(s.pointsFinishes));
    obj["dnfs"] = makeJSON(JSONValue(s.dnfs));
    obj["poles"] = makeJSON(JSONValue(s.poles));
    obj["fastest_laps"] = makeJSON(JSONValue(s.fastestLaps));
    obj["points"] = makeJSON(JSONValue(s.points));
    obj["positions_gained"] = makeJSON(JSONValue(s.positionsGained));
    obj["best_finish"] = makeJSON(s.bestFinish.has_value() ? JSONValue(*s.bestFinish) : JSONValue(nullptr));
    obj["average_position"] = makeJSON(optionalNumber(s.averagePosition));
    obj["average_finish"] = makeJSON(optionalNumber(s.averageFinish));
    obj["average_grid"] = makeJSON(optionalNumber(s.averageGrid));
    JSONValue::Array positions;
    for (int p : s.positions) positions.push_back(makeJSON(JSONValue(p)));
    obj["positions"] = makeJSON(JSONValue(std::move(positions)));
    return JSONValue(std::move(obj));
}

} // namespace tools
} // namespace f1mcp
