//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: EnvVars.h
// Purpose: Helpers to read environment variables used for logging and interceptor configuration.
//==========================================================================================================
#pragma once
#include <cstdlib>
#include <optional>
#include <string>

//==========================================================================================================
// GetEnvOrDefault
// Purpose: Returns the value of the environment variable or a provided default when unset.
// Args:
//   name: C-string name of the environment variable. When null or empty, returns defaultValue.
//   defaultValue: Value to return when the variable is not set.
// Returns:
//   std::string with the environment value (when set) or defaultValue otherwise.
//==========================================================================================================
inline std::string GetEnvOrDefault(const char* name, const std::string& defaultValue) {
    if (name == nullptr || *name == '\0') {
        return defaultValue;
    }
    const char* v = std::getenv(name);
    return v ? std::string(v) : defaultValue;
}

//==========================================================================================================
// GetEnvUnsigned
// Purpose: Reads an environment variable as an unsigned integer.
// Returns:
//   The parsed value, or std::nullopt when unset, empty, negative or not a number.
//==========================================================================================================
inline std::optional<unsigned long> GetEnvUnsigned(const char* name) {
    const std::string v = GetEnvOrDefault(name, std::string());
    if (v.empty() || v[0] == '-') {
        return std::nullopt;
    }
    try {
        std::size_t used = 0;
        unsigned long parsed = std::stoul(v, &used);
        if (used != v.size()) {
            return std::nullopt;
        }
        return parsed;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

//==========================================================================================================
// GetEnvFlag
// Purpose: True when the variable is "1", "true" or "TRUE"; defaultValue when unset.
//==========================================================================================================
inline bool GetEnvFlag(const char* name, bool defaultValue) {
    const std::string v = GetEnvOrDefault(name, defaultValue ? "1" : "0");
    return (v == "1" || v == "true" || v == "TRUE");
}
