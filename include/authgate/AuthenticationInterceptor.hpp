//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: AuthenticationInterceptor.hpp
// Purpose: Request interceptor that authenticates requests and coordinates single-flight credential refresh
//==========================================================================================================

#pragma once

#include <chrono>
#include <cstddef>
#include <memory>

#include <boost/asio/any_io_executor.hpp>

#include "authgate/InterceptorOptions.hpp"
#include "authgate/RequestInterceptor.h"
#include "authgate/auth/Authenticator.hpp"
#include "authgate/auth/Credential.hpp"

namespace authgate {

//==========================================================================================================
// AuthenticationInterceptor
// Purpose: Attaches the current credential to outgoing requests and, when a credential needs refreshing or is
//          rejected, runs at most one refresh at a time. Requests arriving while a refresh is in flight are held
//          and resumed (in arrival order) once it completes: adapt waiters with the new credential or the
//          refresh error, retry waiters with Retry or DoNotRetryWithError.
// Notes:
//   - Held requests are resumed on `executor`, never on the thread that completed the refresh. The executor
//     must keep running while refreshes are outstanding.
//   - The authenticator may complete a refresh synchronously from inside refresh().
//   - No timeout is applied to a refresh; a refresh that never completes holds its waiters indefinitely.
//==========================================================================================================
class AuthenticationInterceptor : public IRequestInterceptor {
public:
    struct PendingCounts {
        std::size_t adapts{0};
        std::size_t retries{0};
    };

    AuthenticationInterceptor(std::shared_ptr<auth::IAuthenticator> authenticator,
                              auth::CredentialPtr credential,
                              boost::asio::any_io_executor executor,
                              const InterceptorOptions& opts = InterceptorOptions());
    ~AuthenticationInterceptor() override;

    AuthenticationInterceptor(const AuthenticationInterceptor&) = delete;
    AuthenticationInterceptor& operator=(const AuthenticationInterceptor&) = delete;

    ////////////////////////////////////////// IRequestInterceptor //////////////////////////////////////////
    //==========================================================================================================
    // Completes immediately with the authenticated request, immediately with missingCredential, or later once
    // the in-flight (or newly triggered) refresh completes.
    //==========================================================================================================
    void Adapt(HttpRequest request, const SessionContext& session, AdaptCompletion completion) override;

    //==========================================================================================================
    // Verdicts:
    //   DoNotRetryWithError(missingCredential) when no credential is set;
    //   DoNotRetry when the authenticator does not classify the failure as an authentication failure;
    //   Retry immediately when the request carried an older credential than the current one;
    //   otherwise queued behind a refresh (triggered if none is in flight).
    //==========================================================================================================
    void Retry(const RequestRecord& record,
               const SessionContext& session,
               const errors::AuthError& error,
               RetryCompletion completion) override;

    ////////////////////////////////////////// Configuration //////////////////////////////////////////
    auth::CredentialPtr GetCredential() const;
    void SetCredential(auth::CredentialPtr credential);

    std::chrono::milliseconds GetRefreshSafetyInterval() const;
    void SetRefreshSafetyInterval(std::chrono::milliseconds interval);

    unsigned int GetRefreshCountAllowed() const;
    void SetRefreshCountAllowed(unsigned int count);

    ////////////////////////////////////////// Diagnostics //////////////////////////////////////////
    bool IsRefreshing() const;
    PendingCounts GetPendingCounts() const;

    // Number of refresh attempts still retained in the rate-limit history
    std::size_t GetRetainedRefreshAttempts() const;

private:
    class Impl;
    std::shared_ptr<Impl> pImpl;
};

} // namespace authgate
