//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: include/authgate/auth/OAuthAuthenticator.hpp
// Purpose: OAuth2 bearer-token authenticator refreshing through the refresh_token grant
//==========================================================================================================
#pragma once

#include <string>
#include <boost/asio/any_io_executor.hpp>

#include "authgate/auth/Authenticator.hpp"
#include "authgate/auth/OAuthClient.hpp"
#include "authgate/auth/OAuthCredential.hpp"

namespace authgate::auth {

class OAuthAuthenticator final : public IAuthenticator {
public:
    //==========================================================================================================
    // Options
    // Fields:
    //   endpoint: Token endpoint and socket settings.
    //   clientId/clientSecret: Sent with the refresh_token grant when non-empty.
    //   scope: Optional space-delimited scopes for the refreshed token.
    //   requireInvalidTokenChallenge: When true, a 401 counts as an authentication failure only if it carries
    //     WWW-Authenticate: Bearer error="invalid_token". Use when downstream services also answer 401 for
    //     reasons a new token would not fix.
    //==========================================================================================================
    struct Options {
        TokenEndpointParams endpoint;
        std::string clientId;
        std::string clientSecret;
        std::string scope;
        bool requireInvalidTokenChallenge{false};
    };

    OAuthAuthenticator(Options opts, boost::asio::any_io_executor executor);

    void apply(HttpRequest& request, const ICredential& credential) override;
    void refresh(CredentialPtr credential, RefreshCompletion onComplete) override;
    bool didRequestFailDueToAuthentication(const HttpRequest* request,
                                           const HttpResponse* response,
                                           const errors::AuthError& error) const override;
    bool isRequestAuthenticatedWith(const HttpRequest* request, const ICredential& credential) const override;

    // Form body of the refresh_token grant for this credential
    std::string buildRefreshForm(const OAuthCredential& credential) const;

private:
    Options opts;
    boost::asio::any_io_executor executor;
};

} // namespace authgate::auth
