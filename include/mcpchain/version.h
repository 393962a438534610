//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: version.h
// Purpose: Public version API for mcpchain (semantic version helpers).
//==========================================================================================================
#pragma once

#include <string>

namespace mcpchain {

//==========================================================================================================
// VersionInfo
// Purpose: Semantic version components.
//==========================================================================================================
struct VersionInfo {
    int major;
    int minor;
    int patch;
};

VersionInfo getVersion();

//==========================================================================================================
// getVersionString
// Purpose: Returns the semantic version string ("MAJOR.MINOR.PATCH"), reported as serverInfo.version.
//==========================================================================================================
std::string getVersionString();

// Name reported as serverInfo.name by the lifecycle handler.
constexpr const char* SERVER_NAME = "mcpchain";

} // namespace mcpchain
