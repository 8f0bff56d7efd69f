//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: version.h
// Purpose: Public version API for the F1 MCP server (semantic version helpers).
//==========================================================================================================
#pragma once

#include <string>

namespace f1mcp {

//==========================================================================================================
// VersionInfo
// Purpose: Semantic version components.
//==========================================================================================================
struct VersionInfo {
    int major;
    int minor;
    int patch;
};

// Returns the server semantic version components.
VersionInfo getVersion();

// Returns the version formatted as "MAJOR.MINOR.PATCH"; reported as serverInfo.version.
std::string getVersionString();

// Returns the HTTP User-Agent sent to the data provider, "f1-mcp-server/MAJOR.MINOR.PATCH".
std::string getUserAgent();

} // namespace f1mcp
