//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/authgate/auth/OAuthAuthenticator.cpp
// Purpose: OAuth2 bearer-token authenticator refreshing through the refresh_token grant
//==========================================================================================================
#include <exception>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <utility>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/beast/http.hpp>

#include "logging/Logger.h"
#include "authgate/auth/OAuthAuthenticator.hpp"
#include "authgate/auth/WwwAuthenticate.hpp"

namespace authgate::auth {
namespace net = boost::asio;
namespace http = boost::beast::http;

namespace {

std::string bearerValue(const OAuthCredential& credential) {
    return std::string("Bearer ") + credential.getAccessToken();
}

} // namespace

OAuthAuthenticator::OAuthAuthenticator(Options opts, boost::asio::any_io_executor executor)
    : opts(std::move(opts)), executor(std::move(executor)) {}

void OAuthAuthenticator::apply(HttpRequest& request, const ICredential& credential) {
    const auto* oauth = dynamic_cast<const OAuthCredential*>(&credential);
    if (!oauth) {
        LOG_WARN("OAuthAuthenticator: credential is not an OAuthCredential; request left unauthenticated");
        return;
    }
    request.set(http::field::authorization, bearerValue(*oauth));
}

std::string OAuthAuthenticator::buildRefreshForm(const OAuthCredential& credential) const {
    std::ostringstream form;
    form << "grant_type=refresh_token";
    form << "&refresh_token=" << urlEncodeForm(credential.getRefreshToken());
    if (!opts.clientId.empty()) { form << "&client_id=" << urlEncodeForm(opts.clientId); }
    if (!opts.clientSecret.empty()) { form << "&client_secret=" << urlEncodeForm(opts.clientSecret); }
    if (!opts.scope.empty()) { form << "&scope=" << urlEncodeForm(opts.scope); }
    return form.str();
}

void OAuthAuthenticator::refresh(CredentialPtr credential, RefreshCompletion onComplete) {
    auto oauth = std::dynamic_pointer_cast<const OAuthCredential>(credential);
    if (!oauth) {
        onComplete(Result<CredentialPtr>::failure(
            errors::makeError(errors::ErrorCategory::RefreshFailed, "credential is not an OAuthCredential")));
        return;
    }
    if (oauth->getRefreshToken().empty()) {
        onComplete(Result<CredentialPtr>::failure(
            errors::makeError(errors::ErrorCategory::RefreshFailed, "credential has no refresh token")));
        return;
    }

    auto endpoint = opts.endpoint;
    auto form = buildRefreshForm(*oauth);
    // onComplete is invoked exactly once, from the last statement of the coroutine
    auto task = [endpoint, form, oauth, onComplete]() -> net::awaitable<void> {
        auto response = co_await coPostFormUrlencoded(endpoint, form);
        std::optional<Result<CredentialPtr>> outcome;
        if (!response.ok()) {
            outcome.emplace(Result<CredentialPtr>::failure(response.error()));
        } else {
            auto parsed = parseTokenResponse(response.value(), *oauth);
            if (parsed.ok()) {
                outcome.emplace(Result<CredentialPtr>::success(std::move(parsed).value()));
            } else {
                outcome.emplace(Result<CredentialPtr>::failure(parsed.error()));
            }
        }
        onComplete(std::move(*outcome));
    };

    net::co_spawn(executor, std::move(task), [](std::exception_ptr ep) {
        if (!ep) {
            return;
        }
        try {
            std::rethrow_exception(ep);
        } catch (const std::exception& e) {
            LOG_ERROR("OAuthAuthenticator: refresh completion threw: {}", e.what());
        }
    });
}

bool OAuthAuthenticator::didRequestFailDueToAuthentication(const HttpRequest* request,
                                                           const HttpResponse* response,
                                                           const errors::AuthError& error) const {
    (void)request;
    int status = 0;
    if (response) {
        status = static_cast<int>(response->result_int());
    } else if (error.httpStatus.has_value()) {
        status = error.httpStatus.value();
    }
    if (status != 401) {
        return false;
    }
    if (!opts.requireInvalidTokenChallenge) {
        return true;
    }
    if (!response) {
        return false;
    }
    auto it = response->find(http::field::www_authenticate);
    if (it == response->end()) {
        return false;
    }
    auto challenge = parseWwwAuthenticate(std::string(it->value()));
    return challenge.has_value() && isInvalidTokenChallenge(challenge.value());
}

bool OAuthAuthenticator::isRequestAuthenticatedWith(const HttpRequest* request, const ICredential& credential) const {
    const auto* oauth = dynamic_cast<const OAuthCredential*>(&credential);
    if (!request || !oauth) {
        return false;
    }
    auto it = request->find(http::field::authorization);
    if (it == request->end()) {
        return false;
    }
    return std::string(it->value()) == bearerValue(*oauth);
}

} // namespace authgate::auth
