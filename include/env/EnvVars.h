//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: EnvVars.h
// Purpose: Helpers to read OAUTHWEB_* environment overrides with typed defaults.
//==========================================================================================================
#pragma once
#include <cctype>
#include <cstddef>
#include <cstdlib>
#include <stdexcept>
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
    const char* raw = std::getenv(name);
    return raw ? std::string(raw) : defaultValue;
}

//==========================================================================================================
// GetEnvSizeOrDefault
// Purpose: Reads a non-negative decimal size from the environment.
// Returns:
//   Parsed value, or defaultValue when unset, empty, non-numeric, or out of range.
//==========================================================================================================
inline std::size_t GetEnvSizeOrDefault(const char* name, std::size_t defaultValue) {
    const std::string v = GetEnvOrDefault(name, std::string());
    if (v.empty()) {
        return defaultValue;
    }
    for (char c : v) {
        if (std::isdigit(static_cast<unsigned char>(c)) == 0) {
            return defaultValue;
        }
    }
    try {
        return static_cast<std::size_t>(std::stoull(v));
    } catch (const std::out_of_range&) {
        return defaultValue;
    }
}

// Truthy flag helper: "1", "true", "TRUE".
inline bool GetEnvFlag(const char* name, bool defaultValue) {
    const std::string v = GetEnvOrDefault(name, defaultValue ? "1" : "0");
    return (v == "1" || v == "true" || v == "TRUE");
}
