//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Logger.cpp
// Purpose: Definitions for Logger static members.
//==========================================================================================================

#include "logging/Logger.h"

namespace {
bool stdioModeFromEnv() {
    const std::string v = GetEnvOrDefault("F1MCP_STDIO_MODE", "0");
    return (v == "1" || v == "true" || v == "TRUE");
}
}

// Define static members
LogLevel Logger::sLogLevel = LogLevel::LOG_INFO_LEVEL;
bool Logger::sStdioMode = stdioModeFromEnv();
std::ofstream Logger::sLogFile;
std::mutex Logger::sLogMutex;
