//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: EnvVars.h
// Purpose: Helpers to read MCPRT_* environment variables with typed defaults.
//==========================================================================================================
#pragma once
#include <cctype>
#include <cstdint>
#include <cstdlib>
#include <stdexcept>
#include <string>

//==========================================================================================================
// GetEnvOrDefault
// Purpose: Returns the value of the environment variable or a provided default when unset/empty.
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
    if (v == nullptr || *v == '\0') {
        return defaultValue;
    }
    return std::string(v);
}

//==========================================================================================================
// GetEnvUintOrDefault
// Purpose: Reads an unsigned integer environment variable.
// Args:
//   name: Environment variable name.
//   defaultValue: Returned when unset or not a valid unsigned integer.
// Returns:
//   Parsed value or defaultValue.
//==========================================================================================================
inline uint64_t GetEnvUintOrDefault(const char* name, uint64_t defaultValue) {
    const std::string raw = GetEnvOrDefault(name, "");
    if (raw.empty() || raw[0] == '-') {
        return defaultValue;
    }
    try {
        std::size_t used = 0;
        unsigned long long v = std::stoull(raw, &used);
        if (used != raw.size()) {
            return defaultValue;
        }
        return static_cast<uint64_t>(v);
    } catch (const std::logic_error&) {
        return defaultValue;
    }
}

// "1", "true", "yes", "on" (any case) are true; "0", "false", "no", "off" are false.
inline bool GetEnvBoolOrDefault(const char* name, bool defaultValue) {
    std::string raw = GetEnvOrDefault(name, "");
    for (auto& c : raw) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    if (raw == "1" || raw == "true" || raw == "yes" || raw == "on") return true;
    if (raw == "0" || raw == "false" || raw == "no" || raw == "off") return false;
    return defaultValue;
}
