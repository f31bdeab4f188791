//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: include/authgate/auth/OAuthClient.hpp
// Purpose: OAuth2 token endpoint client (form POST over HTTP/HTTPS) and token response parsing
//==========================================================================================================
#pragma once

#include <chrono>
#include <string>
#include <utility>
#include <boost/asio/awaitable.hpp>

#include "authgate/Result.h"
#include "authgate/auth/OAuthCredential.hpp"

namespace authgate::auth {

//==========================================================================================================
// TokenEndpointParams
// Fields:
//   url: Full token endpoint URL (http:// or https://).
//   serverName: TLS SNI / hostname verification override; host from url when empty.
//   caFile/caPath: Optional trust store; system defaults when both are empty.
//   connectTimeoutMs/readTimeoutMs: Socket deadlines.
//==========================================================================================================
struct TokenEndpointParams {
    std::string url;
    std::string serverName;
    std::string caFile;
    std::string caPath;
    unsigned int connectTimeoutMs{10000};
    unsigned int readTimeoutMs{30000};
};

struct TokenHttpResponse {
    int status{0};
    std::string body;
};

// application/x-www-form-urlencoded encoding of a single value
std::string urlEncodeForm(const std::string& s);

//==========================================================================================================
// coPostFormUrlencoded
// Purpose: POSTs a form body to the token endpoint. HTTPS is TLS 1.3 only with peer verification.
// Returns:
//   Status and body of the response (any status), or a Transport error when no response was read.
//==========================================================================================================
boost::asio::awaitable<Result<TokenHttpResponse>> coPostFormUrlencoded(const TokenEndpointParams& params,
                                                                       const std::string& body);

//==========================================================================================================
// parseTokenResponse
// Purpose: Builds the refreshed credential from a token endpoint response.
// Args:
//   response: Status and JSON body returned by the endpoint.
//   previous: Credential being refreshed; its refresh token and user id carry over when the response omits them.
// Returns:
//   The new credential; HttpStatus error for non-2xx (message carries the endpoint's "error" when present);
//   InvalidTokenResponse when access_token is missing. expires_in defaults to 3600 seconds.
//==========================================================================================================
Result<OAuthCredentialPtr> parseTokenResponse(const TokenHttpResponse& response, const OAuthCredential& previous);

} // namespace authgate::auth
