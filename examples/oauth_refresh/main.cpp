//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: main.cpp
// Purpose: Example exchanging a refresh token at a real OAuth2 token endpoint through the interceptor
// Usage: AUTHGATE_TOKEN_URL=https://idp.example.com/oauth/token AUTHGATE_REFRESH_TOKEN=... \
//        AUTHGATE_CLIENT_ID=... [AUTHGATE_CLIENT_SECRET=...] oauth_refresh
//==========================================================================================================

#include <chrono>
#include <iostream>
#include <memory>
#include <string>

#include <boost/asio/thread_pool.hpp>

#include "authgate/AuthenticationInterceptor.hpp"
#include "authgate/auth/OAuthAuthenticator.hpp"
#include "env/EnvVars.h"

using namespace authgate;
namespace http = boost::beast::http;

int main() {
    const std::string url = GetEnvOrDefault("AUTHGATE_TOKEN_URL", "");
    const std::string refreshToken = GetEnvOrDefault("AUTHGATE_REFRESH_TOKEN", "");
    if (url.empty() || refreshToken.empty()) {
        std::cerr << "Set AUTHGATE_TOKEN_URL and AUTHGATE_REFRESH_TOKEN\n";
        return 2;
    }

    boost::asio::thread_pool pool{2};
    auth::OAuthAuthenticator::Options opts;
    opts.endpoint.url = url;
    opts.clientId = GetEnvOrDefault("AUTHGATE_CLIENT_ID", "");
    opts.clientSecret = GetEnvOrDefault("AUTHGATE_CLIENT_SECRET", "");
    opts.scope = GetEnvOrDefault("AUTHGATE_SCOPE", "");
    auto authenticator = std::make_shared<auth::OAuthAuthenticator>(opts, pool.get_executor());

    // No access token yet: an expiry in the past forces a refresh on the first request
    auto initial = std::make_shared<const auth::OAuthCredential>(
        std::string(), refreshToken, std::chrono::system_clock::now() - std::chrono::seconds(1));
    AuthenticationInterceptor interceptor(authenticator, initial, pool.get_executor(), InterceptorOptions::FromEnvironment());

    auto result = interceptor.AdaptAsync(HttpRequest{http::verb::get, "/", 11}, SessionContext{"oauth-example", 1u}).get();
    int rc = 0;
    if (result.ok()) {
        auto credential = std::dynamic_pointer_cast<const auth::OAuthCredential>(interceptor.GetCredential());
        const auto ttl = std::chrono::duration_cast<std::chrono::seconds>(credential->getExpiration() - std::chrono::system_clock::now());
        std::cout << "refreshed; access token expires in " << ttl.count() << "s\n";
    } else {
        std::cerr << "refresh failed: " << result.error().toString() << "\n";
        rc = 1;
    }
    pool.join();
    return rc;
}
