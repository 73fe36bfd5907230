//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: version.h
// Purpose: Gateway version reporting (semantic version helpers)
//==========================================================================================================
#pragma once

#include <string>

#define TOOLGATE_VERSION_MAJOR 0
#define TOOLGATE_VERSION_MINOR 3
#define TOOLGATE_VERSION_PATCH 0

namespace toolgate {

struct VersionInfo {
    int major;
    int minor;
    int patch;
};

//==========================================================================================================
// getVersion
// Purpose: Returns the gateway semantic version components. Also reported as serverInfo.version.
//==========================================================================================================
VersionInfo getVersion();

// "MAJOR.MINOR.PATCH"
std::string getVersionString();

} // namespace toolgate
