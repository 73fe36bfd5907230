//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: version.cpp
// Purpose: Version helpers
//==========================================================================================================
#include "toolgate/version.h"

#include <fmt/format.h>

namespace toolgate {

VersionInfo getVersion() {
    return VersionInfo{TOOLGATE_VERSION_MAJOR, TOOLGATE_VERSION_MINOR, TOOLGATE_VERSION_PATCH};
}

std::string getVersionString() {
    const auto v = getVersion();
    return fmt::format("{}.{}.{}", v.major, v.minor, v.patch);
}

} // namespace toolgate
