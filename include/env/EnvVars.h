//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: EnvVars.h
// Purpose: Helpers to read MCPCORE_* environment variables with typed defaults.
//==========================================================================================================
#pragma once
#include <chrono>
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
    return (v != nullptr && *v != '\0') ? std::string(v) : defaultValue;
}

// Truthy values: "1", "true", "TRUE", "yes".
inline bool GetEnvFlagOrDefault(const char* name, bool defaultValue) {
    const std::string v = GetEnvOrDefault(name, "");
    if (v.empty()) {
        return defaultValue;
    }
    return v == "1" || v == "true" || v == "TRUE" || v == "yes";
}

//==========================================================================================================
// GetEnvMillisOrDefault
// Purpose: Reads a millisecond duration from the environment. Malformed values fall back to the default.
// Args:
//   name: Environment variable name.
//   defaultValue: Duration used when unset or unparsable.
// Returns:
//   Parsed duration or defaultValue.
//==========================================================================================================
inline std::chrono::milliseconds GetEnvMillisOrDefault(const char* name, std::chrono::milliseconds defaultValue) {
    const std::string v = GetEnvOrDefault(name, "");
    if (v.empty()) {
        return defaultValue;
    }
    try {
        return std::chrono::milliseconds(static_cast<int64_t>(std::stoll(v)));
    } catch (const std::invalid_argument&) {
        return defaultValue;
    } catch (const std::out_of_range&) {
        return defaultValue;
    }
}
