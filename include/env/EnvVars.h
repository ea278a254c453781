//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: EnvVars.h
// Purpose: Helpers to read environment variables safely.
//==========================================================================================================
#pragma once
#include <algorithm>
#include <cctype>
#include <cstdlib>
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
    return std::getenv(name) ? std::string(std::getenv(name)) : defaultValue;
}

//==========================================================================================================
// GetEnvFlag
// Purpose: Interprets an environment variable as a boolean flag.
// Args:
//   name: Environment variable name.
//   defaultValue: Returned when the variable is unset or empty.
// Returns:
//   true for 1/true/yes/on (case-insensitive), false for any other non-empty value.
//==========================================================================================================
inline bool GetEnvFlag(const char* name, bool defaultValue) {
    std::string v = GetEnvOrDefault(name, "");
    if (v.empty()) {
        return defaultValue;
    }
    std::transform(v.begin(), v.end(), v.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return v == "1" || v == "true" || v == "yes" || v == "on";
}
