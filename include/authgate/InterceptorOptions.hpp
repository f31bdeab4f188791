//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: InterceptorOptions.hpp
// Purpose: Refresh rate-limit configuration for AuthenticationInterceptor
//==========================================================================================================

#pragma once

#include <chrono>
#include <string>

namespace authgate {

//==========================================================================================================
// InterceptorOptions
// Purpose: Tunables for the refresh safety window.
// Fields:
//   refreshSafetyInterval: Trailing window over which refresh attempts are counted (default 30s).
//   refreshCountAllowed: Refresh attempts tolerated inside the window before further refreshes are rejected
//                        with excessiveRefresh (default 5).
//==========================================================================================================
struct InterceptorOptions {
    std::chrono::milliseconds refreshSafetyInterval{std::chrono::seconds(30)};
    unsigned int refreshCountAllowed{5u};

    //==========================================================================================================
    // FromConfigString
    // Purpose: Parses "key=value; key=value" (keys: refreshSafetyIntervalMs, refreshCountAllowed). Unknown keys
    //          are ignored; a malformed value leaves the corresponding default in place.
    //==========================================================================================================
    static InterceptorOptions FromConfigString(const std::string& config);

    //==========================================================================================================
    // FromEnvironment
    // Purpose: Reads AUTHGATE_REFRESH_SAFETY_INTERVAL_MS and AUTHGATE_REFRESH_COUNT_ALLOWED over the defaults.
    //==========================================================================================================
    static InterceptorOptions FromEnvironment();
};

} // namespace authgate
