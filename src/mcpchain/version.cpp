//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: version.cpp
// Purpose: Version helpers; components come from the build (project VERSION in CMakeLists.txt)
//==========================================================================================================
#include "mcpchain/version.h"

#include <fmt/format.h>

#ifndef MCPCHAIN_VERSION_MAJOR
#define MCPCHAIN_VERSION_MAJOR 0
#endif
#ifndef MCPCHAIN_VERSION_MINOR
#define MCPCHAIN_VERSION_MINOR 0
#endif
#ifndef MCPCHAIN_VERSION_PATCH
#define MCPCHAIN_VERSION_PATCH 0
#endif

namespace mcpchain {

VersionInfo getVersion() {
    return VersionInfo{MCPCHAIN_VERSION_MAJOR, MCPCHAIN_VERSION_MINOR, MCPCHAIN_VERSION_PATCH};
}

std::string getVersionString() {
    const VersionInfo v = getVersion();
    return fmt::format("{}.{}.{}", v.major, v.minor, v.patch);
}

} // namespace mcpchain
