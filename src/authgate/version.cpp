//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: version.cpp
// Purpose: Version helpers backed by the project version the build passes in.
//==========================================================================================================
#include "authgate/version.h"

#include <fmt/format.h>

#ifndef AUTHGATE_VERSION_MAJOR
#define AUTHGATE_VERSION_MAJOR 0
#endif
#ifndef AUTHGATE_VERSION_MINOR
#define AUTHGATE_VERSION_MINOR 0
#endif
#ifndef AUTHGATE_VERSION_PATCH
#define AUTHGATE_VERSION_PATCH 0
#endif

namespace authgate {

VersionInfo getVersion() {
    return VersionInfo{AUTHGATE_VERSION_MAJOR, AUTHGATE_VERSION_MINOR, AUTHGATE_VERSION_PATCH};
}

std::string getVersionString() {
    const auto v = getVersion();
    return fmt::format("{}.{}.{}", v.major, v.minor, v.patch);
}

} // namespace authgate
