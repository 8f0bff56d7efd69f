//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_logger.cpp
// Purpose: GoogleTests for log level parsing and runtime format handling in the Logger
//==========================================================================================================

#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <unistd.h>

#include "logging/Logger.h"

namespace {

std::string readAll(const std::filesystem::path& p) {
    std::ifstream in(p);
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

} // namespace

TEST(Logger, LevelFromStringIsCaseInsensitive) {
    EXPECT_EQ(Logger::levelFromString("debug"), LogLevel::LOG_DEBUG_LEVEL);
    EXPECT_EQ(Logger::levelFromString("Warning"), LogLevel::LOG_WARN_LEVEL);
    EXPECT_EQ(Logger::levelFromString("ERROR"), LogLevel::LOG_ERROR_LEVEL);
    EXPECT_EQ(Logger::levelFromString("chatty"), LogLevel::LOG_INFO_LEVEL);
}

TEST(Logger, MismatchedFormatArgumentsAreReportedNotThrown) {
    const auto path = std::filesystem::temp_directory_path() /
        ("f1mcp_logger_test_" + std::to_string(::getpid()) + ".log");
    std::filesystem::remove(path);
    Logger::setStdioMode(true);
    Logger::setLogLevel(LogLevel::LOG_DEBUG_LEVEL);
    Logger::setLogFile(path.string());

    EXPECT_NO_THROW(LOG_INFO("Round {} of {}", 3));
    EXPECT_NO_THROW(LOG_WARN("Unclosed brace {", 1));
    LOG_INFO("Session {} loaded", "R");

    const std::string text = readAll(path);
    EXPECT_NE(text.find("Format error:"), std::string::npos);
    EXPECT_NE(text.find("(format: Round {} of {})"), std::string::npos);
    EXPECT_NE(text.find("Session R loaded"), std::string::npos);

    Logger::setLogLevel(LogLevel::LOG_INFO_LEVEL);
    std::filesystem::remove(path);
}
