//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: include/authgate/auth/Authenticator.hpp
// Purpose: Authentication scheme interface consumed by AuthenticationInterceptor
//==========================================================================================================
#pragma once

#include <functional>

#include "authgate/HttpTypes.h"
#include "authgate/Result.h"
#include "authgate/auth/Credential.hpp"
#include "authgate/errors/Errors.h"

namespace authgate::auth {

using RefreshCompletion = std::function<void(Result<CredentialPtr>)>;

class IAuthenticator {
public:
    virtual ~IAuthenticator() = default;

    // Apply the credential to an outgoing request (e.g., set the Authorization header)
    virtual void apply(HttpRequest& request, const ICredential& credential) = 0;

    // Refresh the credential. Must invoke onComplete exactly once, from any thread, possibly before returning.
    virtual void refresh(CredentialPtr credential, RefreshCompletion onComplete) = 0;

    // Whether the request failed because the credential was rejected (as opposed to any other error).
    // Either pointer may be null when the transport never built the request or never received a response.
    virtual bool didRequestFailDueToAuthentication(const HttpRequest* request,
                                                   const HttpResponse* response,
                                                   const errors::AuthError& error) const = 0;

    // Whether the request was authenticated with this exact credential
    virtual bool isRequestAuthenticatedWith(const HttpRequest* request, const ICredential& credential) const = 0;
};

} // namespace authgate::auth
