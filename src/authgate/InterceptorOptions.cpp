//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: InterceptorOptions.cpp
// Purpose: Config-string and environment parsing for InterceptorOptions
//==========================================================================================================

#include "authgate/InterceptorOptions.hpp"

#include <cctype>
#include <stdexcept>

#include "env/EnvVars.h"
#include "logging/Logger.h"

namespace authgate {

namespace {

std::string trim(const std::string& s) {
    std::size_t b = 0;
    std::size_t e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) {
        ++b;
    }
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) {
        --e;
    }
    return s.substr(b, e - b);
}

bool parseUnsigned(const std::string& val, unsigned long& out) {
    if (val.empty() || val[0] == '-') {
        return false;
    }
    try {
        std::size_t used = 0;
        out = std::stoul(val, &used);
        return used == val.size();
    } catch (const std::exception&) {
        return false;
    }
}

} // namespace

InterceptorOptions InterceptorOptions::FromConfigString(const std::string& config) {
    InterceptorOptions opts;
    std::size_t start = 0;
    while (start < config.size()) {
        std::size_t sep = config.find(';', start);
        if (sep == std::string::npos) {
            sep = config.size();
        }
        std::string kv = config.substr(start, sep - start);
        std::size_t eq = kv.find('=');
        if (eq != std::string::npos) {
            std::string key = trim(kv.substr(0, eq));
            std::string val = trim(kv.substr(eq + 1));
            unsigned long parsed = 0;
            if (key == "refreshSafetyIntervalMs") {
                if (parseUnsigned(val, parsed)) {
                    opts.refreshSafetyInterval = std::chrono::milliseconds(parsed);
                } else {
                    LOG_WARN("Ignoring malformed refreshSafetyIntervalMs='{}'", val);
                }
            }
            else if (key == "refreshCountAllowed") {
                if (parseUnsigned(val, parsed)) {
                    opts.refreshCountAllowed = static_cast<unsigned int>(parsed);
                } else {
                    LOG_WARN("Ignoring malformed refreshCountAllowed='{}'", val);
                }
            }
        }
        start = sep + 1;
    }
    return opts;
}

InterceptorOptions InterceptorOptions::FromEnvironment() {
    InterceptorOptions opts;
    if (auto ms = GetEnvUnsigned("AUTHGATE_REFRESH_SAFETY_INTERVAL_MS")) {
        opts.refreshSafetyInterval = std::chrono::milliseconds(*ms);
    }
    if (auto count = GetEnvUnsigned("AUTHGATE_REFRESH_COUNT_ALLOWED")) {
        opts.refreshCountAllowed = static_cast<unsigned int>(*count);
    }
    return opts;
}

} // namespace authgate
