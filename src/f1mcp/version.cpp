//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: version.cpp
// Purpose: Implements version helpers returning semantic version string.
//==========================================================================================================
#include "f1mcp/version.h"

#include <fmt/core.h>

namespace f1mcp {

VersionInfo getVersion() {
    return VersionInfo{1, 0, 0};
}

std::string getVersionString() {
    const auto v = getVersion();
    return fmt::format("{}.{}.{}", v.major, v.minor, v.patch);
}

std::string getUserAgent() {
    return "f1-mcp-server/" + getVersionString();
}

} // namespace f1mcp
