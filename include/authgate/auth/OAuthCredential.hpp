//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: include/authgate/auth/OAuthCredential.hpp
// Purpose: OAuth2 bearer credential (access + refresh token with expiry)
//==========================================================================================================
#pragma once

#include <chrono>
#include <memory>
#include <string>

#include "authgate/auth/Credential.hpp"

namespace authgate::auth {

class OAuthCredential final : public ICredential {
public:
    OAuthCredential(std::string accessToken,
                    std::string refreshToken,
                    std::chrono::system_clock::time_point expiration,
                    std::string userId = std::string(),
                    std::chrono::seconds refreshSkew = std::chrono::minutes(5))
        : accessToken(std::move(accessToken)),
          refreshToken(std::move(refreshToken)),
          userId(std::move(userId)),
          expiration(expiration),
          refreshSkew(refreshSkew) {}

    // Refresh once the token is within refreshSkew of expiring
    bool requiresRefresh() const override {
        return std::chrono::system_clock::now() + refreshSkew > expiration;
    }

    const std::string& getAccessToken() const { return accessToken; }
    const std::string& getRefreshToken() const { return refreshToken; }
    const std::string& getUserId() const { return userId; }
    std::chrono::system_clock::time_point getExpiration() const { return expiration; }
    std::chrono::seconds getRefreshSkew() const { return refreshSkew; }

private:
    std::string accessToken;
    std::string refreshToken;
    std::string userId;
    std::chrono::system_clock::time_point expiration;
    std::chrono::seconds refreshSkew;
};

using OAuthCredentialPtr = std::shared_ptr<const OAuthCredential>;

} // namespace authgate::auth
