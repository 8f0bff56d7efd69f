//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: EnvVars.h
// Purpose: Helpers to read F1MCP_* environment variables safely.
//==========================================================================================================
#pragma once
#include <cstdlib>
#include <optional>
#include <string>

//==========================================================================================================
// GetEnvOrDefault
// Purpose: Returns the value of the environment variable or a provided default when unset/empty.
// Args:
//   name: C-string name of the environment variable. When null or empty, returns defaultValue.
//   defaultValue: Value to return when the variable is not set or set to an empty string.
// Returns:
//   std::string with the environment value (when set) or defaultValue otherwise.
//==========================================================================================================
inline std::string GetEnvOrDefault(const char* name, const std::string& defaultValue) {
    if (name == nullptr || *name == '\0') {
        return defaultValue;
    }
    const char* v = std::getenv(name);
    if (v == nullptr || *v == '\0') {
        return defaultValue;
    }
    return std::string(v);
}

//==========================================================================================================
// GetEnv
// Purpose: Returns the environment value when set and non-empty; std::nullopt otherwise.
//==========================================================================================================
inline std::optional<std::string> GetEnv(const char* name) {
    if (name == nullptr || *name == '\0') {
        return std::nullopt;
    }
    const char* v = std::getenv(name);
    if (v == nullptr || *v == '\0') {
        return std::nullopt;
    }
    return std::string(v);
}
