//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: F1Tools.h
// Purpose: F1 tool and resource handlers and their registration
//==========================================================================================================

#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include "f1mcp/Registry.h"
#include "f1mcp/tools/F1DataService.h"

namespace f1mcp {
namespace tools {

//==========================================================================================================
// RegisterF1Tools
// Purpose: Registers the F1 tools in their advertised order:
//   get_drivers, get_driver_results, calculate_average_position, get_event_schedule, get_session,
//   get_session_results, get_lap_times, get_driver_info, get_team_info, get_driver_standings,
//   get_constructor_standings, get_historical_results, get_lap_records, calculate_driver_statistics,
//   compare_drivers, configure_cache, get_cache_info
// Args:
//   registry: Target registry (not yet frozen).
//   service: Shared data access; handlers keep it alive.
//==========================================================================================================
void RegisterF1Tools(ToolRegistry& registry, std::shared_ptr<F1DataService> service);

// Registers f1://schedule/current, f1://standings/drivers, f1://standings/constructors, f1://drivers/current.
void RegisterF1Resources(ResourceRegistry& registry, std::shared_ptr<F1DataService> service);

// Tools + resources, frozen and ready for the Dispatcher.
std::shared_ptr<const Registries> BuildF1Registries(std::shared_ptr<F1DataService> service);

// Canonical session code (FP1, FP2, FP3, Q, SQ, S, R) for a case-insensitive name; std::nullopt if unknown.
std::optional<std::string> normalizeSession(const std::string& name);

// "1:23.456" / "83.456" -> milliseconds; std::nullopt when unparseable.
std::optional<int64_t> parseLapTimeMs(const std::string& text);

} // namespace tools
} // namespace f1mcp
