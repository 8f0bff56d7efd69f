//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: DriverStatistics.h
// Purpose: Season/race statistics computed from Ergast race results
//==========================================================================================================

#pragma once

#include <optional>
#include <string>
#include <vector>

#include "f1mcp/JSONRPCTypes.h"

namespace f1mcp {
namespace tools {

// Position used for a race without a numeric finishing position.
constexpr int kUnclassifiedPosition = 25;

//==========================================================================================================
// DriverStatistics
// Purpose: Aggregates over the races one driver took part in.
// Fields:
//   positions: Finishing position per race in round order; non-numeric positions count as 25.
//   averagePosition: Mean of positions (DNFs included as 25).
//   averageFinish: Mean finishing position over classified finishes only.
//   positionsGained: Sum of grid - finish over classified finishes that started from a grid slot.
//==========================================================================================================
struct DriverStatistics {
    int races{0};
    int wins{0};
    int podiums{0};
    int pointsFinishes{0};
    int dnfs{0};
    int poles{0};
    int fastestLaps{0};
    double points{0.0};
    int positionsGained{0};
    std::optional<int> bestFinish;
    std::optional<double> averagePosition;
    std::optional<double> averageFinish;
    std::optional<double> averageGrid;
    std::vector<int> positions;
};

// True when a result's positionText is a plain number (the car was classified).
bool isClassified(const JSONValue& result);

// Finishing position of a result; kUnclassifiedPosition when position is missing or non-numeric.
int finishingPosition(const JSONValue& result);

//==========================================================================================================
// computeDriverStatistics
// Purpose: Folds the first Results entry of every race into a DriverStatistics.
// Args:
//   races: Ergast Race objects, each with a Results array filtered to one driver.
//==========================================================================================================
DriverStatistics computeDriverStatistics(const JSONValue::Array& races);

JSONValue toJSON(const DriverStatistics& stats);

} // namespace tools
} // namespace f1mcp
