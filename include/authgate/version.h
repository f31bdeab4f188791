//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: version.h
// Purpose: Library version query (components come from the build via AUTHGATE_VERSION_* definitions)
//==========================================================================================================
#pragma once

#include <string>

namespace authgate {

struct VersionInfo {
    int major;
    int minor;
    int patch;
};

// Library semantic version components
VersionInfo getVersion();

// "MAJOR.MINOR.PATCH"
std::string getVersionString();

} // namespace authgate
