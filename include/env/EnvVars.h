//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: EnvVars.h
// Purpose: Helpers to read gateway settings from environment variables.
//==========================================================================================================
#pragma once
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
//   std::string with the environment value (when set and non-empty) or defaultValue otherwise.
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
// GetEnvUnsignedOrDefault
// Purpose: Reads a non-negative integer setting; falls back to defaultValue when unset or not numeric.
//==========================================================================================================
inline unsigned long GetEnvUnsignedOrDefault(const char* name, unsigned long defaultValue) {
    const std::string v = GetEnvOrDefault(name, std::string());
    if (v.empty()) {
        return defaultValue;
    }
    for (char c : v) {
        if (c < '0' || c > '9') {
            return defaultValue;
        }
    }
    try {
        return std::stoul(v);
    } catch (const std::exception&) {
        return defaultValue;
    }
}
