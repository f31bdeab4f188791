//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Logger.cpp
// Purpose: Definitions for Logger static members.
//==========================================================================================================

#include "logging/Logger.h"

// Initial level honours AUTHGATE_LOG_LEVEL (DEBUG/INFO/WARN/ERROR); INFO when unset
LogLevel Logger::sLogLevel = Logger::levelFromString(GetEnvOrDefault("AUTHGATE_LOG_LEVEL", "INFO"));
std::ofstream Logger::sLogFile;
std::mutex Logger::sLogMutex;
