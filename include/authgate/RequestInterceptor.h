//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: RequestInterceptor.h
// Purpose: Request interceptor interface consumed by the HTTP transport layer (adapt before send, retry after
//          failure)
//==========================================================================================================

#pragma once

#include <functional>
#include <future>
#include <memory>
#include <optional>
#include <string>

#include "authgate/HttpTypes.h"
#include "authgate/Result.h"
#include "authgate/errors/Errors.h"

namespace authgate {

//==========================================================================================================
// RetryVerdict
// Purpose: Decision for a failed request.
// Fields:
//   action: Retry (resend now), DoNotRetry (not this interceptor's concern), or DoNotRetryWithError.
//   error: Present only for DoNotRetryWithError.
//==========================================================================================================
struct RetryVerdict {
    enum class Action {
        Retry,
        DoNotRetry,
        DoNotRetryWithError
    };

    Action action{Action::DoNotRetry};
    std::optional<errors::AuthError> error;

    static RetryVerdict retry() { return RetryVerdict{Action::Retry, std::nullopt}; }
    static RetryVerdict doNotRetry() { return RetryVerdict{Action::DoNotRetry, std::nullopt}; }
    static RetryVerdict doNotRetryWithError(errors::AuthError e) {
        return RetryVerdict{Action::DoNotRetryWithError, std::move(e)};
    }

    bool shouldRetry() const { return action == Action::Retry; }
};

inline const char* retryActionName(RetryVerdict::Action action) {
    switch (action) {
        case RetryVerdict::Action::Retry: return "retry";
        case RetryVerdict::Action::DoNotRetry: return "doNotRetry";
        case RetryVerdict::Action::DoNotRetryWithError: return "doNotRetryWithError";
    }
    return "unknown";
}

//==========================================================================================================
// IRequestInterceptor
// Purpose: Hooks a transport calls around every request. Both entry points are non-blocking: the completion
//          may run before the call returns or later on another thread, but it runs exactly once.
//==========================================================================================================
class IRequestInterceptor {
public:
    virtual ~IRequestInterceptor() = default;

    using AdaptCompletion = std::function<void(Result<HttpRequest>)>;
    using RetryCompletion = std::function<void(RetryVerdict)>;

    //==========================================================================================================
    // Adapts an outgoing request before it is sent.
    // Args:
    //   request: The request to adapt (taken by value; the adapted copy is handed to the completion).
    //   session: Transport session issuing the request.
    //   completion: Receives the adapted request or the reason it cannot be sent.
    // Returns:
    //   (none)
    //==========================================================================================================
    virtual void Adapt(HttpRequest request, const SessionContext& session, AdaptCompletion completion) = 0;

    //==========================================================================================================
    // Decides whether a failed request should be sent again.
    // Args:
    //   record: The failed request and the response received for it, if any.
    //   session: Transport session that issued the request.
    //   error: The failure reported by the transport.
    //   completion: Receives the verdict.
    // Returns:
    //   (none)
    //==========================================================================================================
    virtual void Retry(const RequestRecord& record,
                       const SessionContext& session,
                       const errors::AuthError& error,
                       RetryCompletion completion) = 0;

    //==========================================================================================================
    // Future-returning forms of Adapt/Retry for callers built around std::future.
    //==========================================================================================================
    std::future<Result<HttpRequest>> AdaptAsync(HttpRequest request, const SessionContext& session) {
        auto promise = std::make_shared<std::promise<Result<HttpRequest>>>();
        auto fut = promise->get_future();
        Adapt(std::move(request), session, [promise](Result<HttpRequest> result) {
            promise->set_value(std::move(result));
        });
        return fut;
    }

    std::future<RetryVerdict> RetryAsync(const RequestRecord& record,
                                         const SessionContext& session,
                                         const errors::AuthError& error) {
        auto promise = std::make_shared<std::promise<RetryVerdict>>();
        auto fut = promise->get_future();
        Retry(record, session, error, [promise](RetryVerdict verdict) {
            promise->set_value(std::move(verdict));
        });
        return fut;
    }
};

} // namespace authgate
