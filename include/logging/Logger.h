//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Logger.h
// Purpose: Process-wide logging facade for the F1 MCP server (stderr-safe in stdio mode).
//==========================================================================================================
#pragma once

#include <mutex>
#include <iostream>
#include <sstream>
#include <fstream>
#include <string>
#include <cstring>
#include <cerrno>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <cstdlib>
#include <cctype>
#include <fmt/core.h>
#include <fmt/format.h>
#include "env/EnvVars.h"

// Log level enum
enum class LogLevel {
    LOG_DEBUG_LEVEL,
    LOG_INFO_LEVEL,
    LOG_WARN_LEVEL,
    LOG_ERROR_LEVEL,
    LOG_FATAL_LEVEL
};

class Logger {
public:
    // Convert common level strings to LogLevel (case-insensitive). Unknown strings map to INFO.
    static LogLevel levelFromString(const std::string& lvl) {
        std::string s; s.reserve(lvl.size());
        for (char c : lvl) s.push_back(static_cast<char>(::toupper(static_cast<unsigned char>(c))));
        if (s == "DEBUG") return LogLevel::LOG_DEBUG_LEVEL;
        if (s == "INFO")  return LogLevel::LOG_INFO_LEVEL;
        if (s == "WARN" || s == "WARNING")  return LogLevel::LOG_WARN_LEVEL;
        if (s == "ERROR") return LogLevel::LOG_ERROR_LEVEL;
        if (s == "FATAL") return LogLevel::LOG_FATAL_LEVEL;
        return LogLevel::LOG_INFO_LEVEL;
    }

    // Variadic logging using fmt::vformat with runtime format strings
    template <typename... Args>
    static void logf(const char* level, const char* fmt, const char* file, unsigned int line, Args&&... args) {
        std::string buffer;
        try {
            buffer = fmt::vformat(fmt, fmt::make_format_args(args...));
        } catch (const fmt::format_error& e) {
            buffer = fmt::format("Format error: {} (format: {})", e.what(), fmt);
        }
        log(level, buffer, file, line);
    }

public:
    // Configure logging
    static void setLogLevel(LogLevel level) {
        sLogLevel = level;
    }

    static void setLogLevelFromString(const std::string& level) {
        sLogLevel = levelFromString(level);
    }

    static void setLogFile(const std::string& filePath) {
        std::lock_guard<std::mutex> lock(sLogMutex);
        if (sLogFile.is_open()) {
            sLogFile.close();
        }
        sLogFile.open(filePath, std::ios::out | std::ios::app);
        if (!sLogFile.is_open()) {
            std::cerr << "[ERROR] Failed to open log file: " << filePath << " (errno=" << errno << ")" << std::endl;
            return;
        }
        auto now = std::chrono::system_clock::now();
        std::time_t nowTime = std::chrono::system_clock::to_time_t(now);
        std::tm buf{};
        ::localtime_r(&nowTime, &buf);
        sLogFile << "\n=== f1mcp log opened at " << std::put_time(&buf, "%Y-%m-%d %H:%M:%S") << " ===\n";
        sLogFile.flush();
    }

    static void log(const char* level, const std::string& msg, const char* file, unsigned int line) {
        std::lock_guard<std::mutex> lock(sLogMutex);
        // Optional ANSI colorization for the label only, controlled by F1MCP_LOG_COLOR
        static bool colorEnabled = [](){
            const std::string v = GetEnvOrDefault("F1MCP_LOG_COLOR", "0");
            return (v == "1" || v == "true" || v == "TRUE");
        }();
        const char* reset = colorEnabled ? "\033[0m" : "";
        const char* labelColor = "";
        if (colorEnabled) {
            labelColor = (::strncmp(level, "ERROR", 5) == 0 || ::strncmp(level, "FATAL", 5) == 0)
                ? "\033[31m" : (::strncmp(level, "WARN", 4) == 0 ? "\033[33m" : "\033[36m");
        }
        const char* base = ::strrchr(file, '/');
        base = base ? base + 1 : file;

        std::ostringstream oss;
        oss << "[" << labelColor << level << reset << "] " << base << ":" << line << ": " << msg << '\n';
        const std::string logMessage = oss.str();

        // stdout carries JSON-RPC frames in stdio mode, so console output goes to stderr there
        if (sStdioMode) {
            std::cerr << logMessage;
            std::cerr.flush();
        } else {
            std::cout << logMessage;
        }

        if (sLogFile.is_open()) {
            sLogFile << logMessage;
            sLogFile.flush();
        }
    }

    // Route console output to stderr. Initialized from F1MCP_STDIO_MODE; the server forces it on.
    static void setStdioMode(bool enabled) {
        std::lock_guard<std::mutex> lock(sLogMutex);
        sStdioMode = enabled;
    }

    static LogLevel sLogLevel;

private:
    static bool sStdioMode;
    static std::ofstream sLogFile;
    static std::mutex sLogMutex;
};

// Enhanced logging macros with log level filtering
#define LOG_DEBUG(fmt, ...) if (Logger::sLogLevel <= LogLevel::LOG_DEBUG_LEVEL) Logger::logf("DEBUG", fmt, __FILE__, __LINE__, ##__VA_ARGS__)
#define LOG_INFO(fmt, ...)  if (Logger::sLogLevel <= LogLevel::LOG_INFO_LEVEL)  Logger::logf("INFO", fmt, __FILE__, __LINE__, ##__VA_ARGS__)
#define LOG_WARN(fmt, ...)  if (Logger::sLogLevel <= LogLevel::LOG_WARN_LEVEL)  Logger::logf("WARN", fmt, __FILE__, __LINE__, ##__VA_ARGS__)
#define LOG_ERROR(fmt, ...) if (Logger::sLogLevel <= LogLevel::LOG_ERROR_LEVEL) Logger::logf("ERROR", fmt, __FILE__, __LINE__, ##__VA_ARGS__)
#define LOG_FATAL(fmt, ...) do { Logger::logf("FATAL", fmt, __FILE__, __LINE__, ##__VA_ARGS__); ::_Exit(EXIT_FAILURE); } while(0)

// Function entry/exit macros for logging
#ifdef _DEBUG
namespace {
struct FuncScopeGuard {
    const char* func;
    explicit FuncScopeGuard(const char* f) : func(f) { LOG_DEBUG("ENTER: {}", func); }
    ~FuncScopeGuard() { LOG_DEBUG("EXIT:  {}", func); }
};
}
#define FUNC_SCOPE() [[maybe_unused]] FuncScopeGuard funcScope(__FUNCTION__)
#else
#define FUNC_SCOPE() ((void)0)
#endif
