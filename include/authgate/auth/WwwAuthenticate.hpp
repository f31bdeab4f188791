//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: WwwAuthenticate.hpp
// Purpose: Parser for HTTP WWW-Authenticate challenges (RFC 7235 auth-params, RFC 6750 Bearer errors)
//==========================================================================================================

#pragma once

#include <optional>
#include <string>
#include <unordered_map>

namespace authgate::auth {

//==========================================================================================================
// WwwAuthChallenge
// Purpose: Parsed representation of a single WWW-Authenticate challenge.
//==========================================================================================================
struct WwwAuthChallenge {
    std::string scheme;                                          // lower-case, e.g. "bearer", "basic"
    std::unordered_map<std::string, std::string> params;         // lower-case key -> unquoted, unescaped value
};

//==========================================================================================================
// parseWwwAuthenticate
// Purpose: Parse one WWW-Authenticate header value of any scheme with comma-separated key=value parameters
//          (values may be quoted). Returns std::nullopt for empty or malformed input (e.g., unterminated quote).
//==========================================================================================================
std::optional<WwwAuthChallenge> parseWwwAuthenticate(const std::string& header);

//==========================================================================================================
// isInvalidTokenChallenge
// Purpose: True for a Bearer challenge whose error parameter is "invalid_token" (the token was expired,
//          revoked or otherwise rejected, as opposed to insufficient_scope or invalid_request).
//==========================================================================================================
bool isInvalidTokenChallenge(const WwwAuthChallenge& challenge);

} // namespace authgate::auth
