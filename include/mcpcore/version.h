//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: version.h
// Purpose: Public version API for the mcpcore client runtime (semantic version helpers).
//==========================================================================================================
#pragma once

#include <string>

namespace mcpcore {

//==========================================================================================================
// VersionInfo
// Fields:
//   major, minor, patch: Version components.
//==========================================================================================================
struct VersionInfo {
    int major;
    int minor;
    int patch;
};

VersionInfo getVersion();

//==========================================================================================================
// getVersionString
// Returns:
//   "MAJOR.MINOR.PATCH"; also the default clientInfo.version sent during initialize.
//==========================================================================================================
std::string getVersionString();

// Default clientInfo.name sent during initialize.
constexpr const char* kClientName = "mcpcore";

} // namespace mcpcore
