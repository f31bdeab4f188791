//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/authgate/AuthenticationInterceptor.cpp
// Purpose: Single-flight credential refresh coordination for outgoing HTTP requests
//==========================================================================================================

#include <algorithm>
#include <atomic>
#include <chrono>
#include <deque>
#include <exception>
#include <mutex>
#include <optional>
#include <utility>
#include <vector>

#include <boost/asio/post.hpp>

#include "logging/Logger.h"
#include "authgate/AuthenticationInterceptor.hpp"

namespace authgate {
namespace net = boost::asio;
using steady = std::chrono::steady_clock;

class AuthenticationInterceptor::Impl : public std::enable_shared_from_this<AuthenticationInterceptor::Impl> {
public:
    struct AdaptOperation {
        HttpRequest request;
        SessionContext session;
        AdaptCompletion completion;
    };

    // Everything below is guarded by mtx.
    struct MutableState {
        auth::CredentialPtr credential;

        bool isRefreshing{false};
        std::deque<steady::time_point> refreshTimestamps;
        std::chrono::milliseconds refreshSafetyInterval{std::chrono::seconds(30)};
        unsigned int refreshCountAllowed{5u};
        // Largest refreshCountAllowed ever configured; bounds refreshTimestamps
        unsigned int maxRefreshCountAllowed{5u};

        std::vector<AdaptOperation> adaptOperations;
        std::vector<RetryCompletion> requestsToRetry;
    };

    // Waiters captured on the isRefreshing true -> false transition; error unset means the refresh succeeded.
    struct Drain {
        std::vector<AdaptOperation> adaptOperations;
        std::vector<RetryCompletion> requestsToRetry;
        std::optional<errors::AuthError> error;

        bool empty() const { return adaptOperations.empty() && requestsToRetry.empty(); }
    };

    // Work decided under the lock and carried out after releasing it.
    struct AfterUnlock {
        auth::CredentialPtr refreshCredential;
        std::optional<Drain> drain;
    };

    std::shared_ptr<auth::IAuthenticator> authenticator;
    net::any_io_executor executor;

    mutable std::mutex mtx;
    MutableState state;

    Impl(std::shared_ptr<auth::IAuthenticator> a, auth::CredentialPtr c, net::any_io_executor ex, const InterceptorOptions& opts)
        : authenticator(std::move(a)), executor(std::move(ex)) {
        state.credential = std::move(c);
        state.refreshSafetyInterval = opts.refreshSafetyInterval;
        state.refreshCountAllowed = opts.refreshCountAllowed;
        state.maxRefreshCountAllowed = opts.refreshCountAllowed;
    }

    ////////////////////////////////////////// Adapt //////////////////////////////////////////
    void adapt(HttpRequest request, const SessionContext& session, AdaptCompletion completion) {
        enum class Decision { Adapt, DoNotAdapt, Deferred };

        Decision decision = Decision::Deferred;
        auth::CredentialPtr credential;
        AfterUnlock after;
        {
            std::lock_guard<std::mutex> lk(mtx);
            if (state.isRefreshing) {
                state.adaptOperations.push_back(AdaptOperation{std::move(request), session, std::move(completion)});
                decision = Decision::Deferred;
            } else if (!state.credential) {
                decision = Decision::DoNotAdapt;
            } else if (state.credential->requiresRefresh()) {
                state.adaptOperations.push_back(AdaptOperation{std::move(request), session, std::move(completion)});
                after = startRefreshLocked(state.credential);
                decision = Decision::Deferred;
            } else {
                credential = state.credential;
                decision = Decision::Adapt;
            }
        }

        switch (decision) {
            case Decision::Adapt:
                authenticator->apply(request, *credential);
                completion(Result<HttpRequest>::success(std::move(request)));
                break;
            case Decision::DoNotAdapt:
                LOG_DEBUG("Adapt: no credential for session {} attempt {}", session.sessionId, session.attempt);
                completion(Result<HttpRequest>::failure(errors::makeMissingCredentialError()));
                break;
            case Decision::Deferred:
                LOG_DEBUG("Adapt: session {} attempt {} waits for the credential refresh", session.sessionId, session.attempt);
                runAfterUnlock(std::move(after));
                break;
        }
    }

    ////////////////////////////////////////// Retry //////////////////////////////////////////
    void retry(const RequestRecord& record, const SessionContext& session, const errors::AuthError& error,
               RetryCompletion completion) {
        auth::CredentialPtr credential = getCredential();
        if (!credential) {
            completion(RetryVerdict::doNotRetryWithError(errors::makeMissingCredentialError()));
            return;
        }

        const HttpRequest* req = record.request ? &record.request.value() : nullptr;
        const HttpResponse* res = record.response ? &record.response.value() : nullptr;

        if (!authenticator->didRequestFailDueToAuthentication(req, res, error)) {
            completion(RetryVerdict::doNotRetry());
            return;
        }

        // Sent with an older credential: a refresh already happened while the request was in flight
        if (!authenticator->isRequestAuthenticatedWith(req, *credential)) {
            LOG_DEBUG("Retry: session {} used a stale credential, retrying immediately (retry #{})", session.sessionId,
                      record.retryCount + 1u);
            completion(RetryVerdict::retry());
            return;
        }

        enum class Decision { Queued, RetryNow, MissingCredential };
        Decision decision = Decision::Queued;
        AfterUnlock after;
        {
            std::lock_guard<std::mutex> lk(mtx);
            if (!state.credential) {
                decision = Decision::MissingCredential;
            } else if (state.credential != credential && !state.isRefreshing) {
                // Replaced between classification and here; same situation as the stale check above
                decision = Decision::RetryNow;
            } else {
                state.requestsToRetry.push_back(std::move(completion));
                if (!state.isRefreshing) {
                    after = startRefreshLocked(state.credential);
                }
            }
        }

        switch (decision) {
            case Decision::MissingCredential:
                completion(RetryVerdict::doNotRetryWithError(errors::makeMissingCredentialError()));
                break;
            case Decision::RetryNow:
                completion(RetryVerdict::retry());
                break;
            case Decision::Queued:
                LOG_DEBUG("Retry: session {} (previous retries {}) queued behind the credential refresh", session.sessionId,
                          record.retryCount);
                runAfterUnlock(std::move(after));
                break;
        }
    }

    ////////////////////////////////////////// Refresh //////////////////////////////////////////
    std::size_t refreshCountWithinWindowLocked(steady::time_point now) const {
        const steady::time_point windowStart = now - state.refreshSafetyInterval;
        return static_cast<std::size_t>(std::count_if(state.refreshTimestamps.begin(), state.refreshTimestamps.end(),
                                                      [&](const steady::time_point& t) { return windowStart <= t; }));
    }

    AfterUnlock startRefreshLocked(auth::CredentialPtr credential) {
        AfterUnlock after;
        const steady::time_point now = steady::now();
        const std::size_t count = refreshCountWithinWindowLocked(now);
        if (count > state.refreshCountAllowed) {
            LOG_WARN("Refresh rejected: {} refreshes within {} ms (allowed {})", count,
                     state.refreshSafetyInterval.count(), state.refreshCountAllowed);
            after.drain = captureWaitersLocked(errors::makeExcessiveRefreshError(count, state.refreshCountAllowed));
            return after;
        }

        // Timestamps are appended in order, so any window holds a suffix of the history. Whether more than
        // `allowed` entries fall inside it only depends on the newest allowed + 1 of them, whatever the interval.
        state.refreshTimestamps.push_back(now);
        const std::size_t keep = static_cast<std::size_t>(state.maxRefreshCountAllowed) + 1u;
        while (state.refreshTimestamps.size() > keep) {
            state.refreshTimestamps.pop_front();
        }
        state.isRefreshing = true;
        after.refreshCredential = std::move(credential);
        return after;
    }

    void issueRefresh(auth::CredentialPtr credential) {
        LOG_INFO("Refreshing credential");
        auto self = shared_from_this();
        auto completed = std::make_shared<std::atomic<bool>>(false);
        auto onComplete = [self, completed](Result<auth::CredentialPtr> result) {
            if (completed->exchange(true)) {
                LOG_ERROR("Authenticator completed a refresh more than once; ignoring the extra completion");
                return;
            }
            self->onRefreshComplete(std::move(result));
        };
        try {
            authenticator->refresh(std::move(credential), onComplete);
        } catch (const std::exception& e) {
            LOG_ERROR("Authenticator refresh threw: {}", e.what());
            if (!completed->exchange(true)) {
                onRefreshComplete(Result<auth::CredentialPtr>::failure(
                    errors::makeError(errors::ErrorCategory::RefreshFailed, std::string("refresh threw: ") + e.what())));
            }
        } catch (...) {
            LOG_ERROR("Authenticator refresh threw a non-standard exception");
            if (!completed->exchange(true)) {
                onRefreshComplete(Result<auth::CredentialPtr>::failure(
                    errors::makeError(errors::ErrorCategory::RefreshFailed, "refresh threw a non-standard exception")));
            }
        }
    }

    void onRefreshComplete(Result<auth::CredentialPtr> result) {
        Drain drain;
        {
            std::lock_guard<std::mutex> lk(mtx);
            if (result.ok() && result.value()) {
                state.credential = std::move(result).value();
                drain = captureWaitersLocked(std::nullopt);
            } else if (result.ok()) {
                drain = captureWaitersLocked(
                    errors::makeError(errors::ErrorCategory::RefreshFailed, "Authenticator returned an empty credential"));
            } else {
                drain = captureWaitersLocked(result.error());
            }
        }
        if (drain.error) {
            LOG_WARN("Credential refresh failed: {}", drain.error->toString());
        } else {
            LOG_INFO("Credential refreshed; resuming {} adapt and {} retry waiters",
                     drain.adaptOperations.size(), drain.requestsToRetry.size());
        }
        dispatchDrain(std::move(drain));
    }

    Drain captureWaitersLocked(std::optional<errors::AuthError> error) {
        Drain drain;
        drain.adaptOperations.swap(state.adaptOperations);
        drain.requestsToRetry.swap(state.requestsToRetry);
        drain.error = std::move(error);
        state.isRefreshing = false;
        return drain;
    }

    void runAfterUnlock(AfterUnlock after) {
        if (after.drain) {
            dispatchDrain(std::move(*after.drain));
        }
        if (after.refreshCredential) {
            issueRefresh(std::move(after.refreshCredential));
        }
    }

    // Resuming an adapt waiter re-enters adapt(), so waiters never run on the thread holding or releasing mtx
    void dispatchDrain(Drain drain) {
        if (drain.empty()) {
            return;
        }
        auto self = shared_from_this();
        net::post(executor, [self, drain = std::move(drain)]() mutable {
            self->resumeWaiters(std::move(drain));
        });
    }

    void resumeWaiters(Drain drain) {
        LOG_DEBUG("Draining {} adapt and {} retry waiters", drain.adaptOperations.size(), drain.requestsToRetry.size());
        for (auto& op : drain.adaptOperations) {
            try {
                if (drain.error) {
                    op.completion(Result<HttpRequest>::failure(*drain.error));
                } else {
                    adapt(std::move(op.request), op.session, std::move(op.completion));
                }
            } catch (const std::exception& e) {
                LOG_ERROR("Adapt completion for session {} threw: {}", op.session.sessionId, e.what());
            } catch (...) {
                LOG_ERROR("Adapt completion for session {} threw a non-standard exception", op.session.sessionId);
            }
        }
        for (auto& completion : drain.requestsToRetry) {
            try {
                if (drain.error) {
                    completion(RetryVerdict::doNotRetryWithError(*drain.error));
                } else {
                    completion(RetryVerdict::retry());
                }
            } catch (const std::exception& e) {
                LOG_ERROR("Retry completion threw: {}", e.what());
            } catch (...) {
                LOG_ERROR("Retry completion threw a non-standard exception");
            }
        }
    }

    auth::CredentialPtr getCredential() const {
        std::lock_guard<std::mutex> lk(mtx);
        return state.credential;
    }
};

AuthenticationInterceptor::AuthenticationInterceptor(std::shared_ptr<auth::IAuthenticator> authenticator,
                                                     auth::CredentialPtr credential,
                                                     boost::asio::any_io_executor executor,
                                                     const InterceptorOptions& opts)
    : pImpl(std::make_shared<Impl>(std::move(authenticator), std::move(credential), std::move(executor), opts)) {}

AuthenticationInterceptor::~AuthenticationInterceptor() = default;

void AuthenticationInterceptor::Adapt(HttpRequest request, const SessionContext& session, AdaptCompletion completion) {
    FUNC_SCOPE();
    pImpl->adapt(std::move(request), session, std::move(completion));
}

void AuthenticationInterceptor::Retry(const RequestRecord& record,
                                      const SessionContext& session,
                                      const errors::AuthError& error,
                                      RetryCompletion completion) {
    FUNC_SCOPE();
    pImpl->retry(record, session, error, std::move(completion));
}

auth::CredentialPtr AuthenticationInterceptor::GetCredential() const {
    return pImpl->getCredential();
}

void AuthenticationInterceptor::SetCredential(auth::CredentialPtr credential) {
    std::lock_guard<std::mutex> lk(pImpl->mtx);
    pImpl->state.credential = std::move(credential);
}

std::chrono::milliseconds AuthenticationInterceptor::GetRefreshSafetyInterval() const {
    std::lock_guard<std::mutex> lk(pImpl->mtx);
    return pImpl->state.refreshSafetyInterval;
}

void AuthenticationInterceptor::SetRefreshSafetyInterval(std::chrono::milliseconds interval) {
    std::lock_guard<std::mutex> lk(pImpl->mtx);
    pImpl->state.refreshSafetyInterval = interval;
}

unsigned int AuthenticationInterceptor::GetRefreshCountAllowed() const {
    std::lock_guard<std::mutex> lk(pImpl->mtx);
    return pImpl->state.refreshCountAllowed;
}

void AuthenticationInterceptor::SetRefreshCountAllowed(unsigned int count) {
    std::lock_guard<std::mutex> lk(pImpl->mtx);
    pImpl->state.refreshCountAllowed = count;
    pImpl->state.maxRefreshCountAllowed = std::max(pImpl->state.maxRefreshCountAllowed, count);
}

bool AuthenticationInterceptor::IsRefreshing() const {
    std::lock_guard<std::mutex> lk(pImpl->mtx);
    return pImpl->state.isRefreshing;
}

AuthenticationInterceptor::PendingCounts AuthenticationInterceptor::GetPendingCounts() const {
    std::lock_guard<std::mutex> lk(pImpl->mtx);
    PendingCounts counts;
    counts.adapts = pImpl->state.adaptOperations.size();
    counts.retries = pImpl->state.requestsToRetry.size();
    return counts;
}

std::size_t AuthenticationInterceptor::GetRetainedRefreshAttempts() const {
    std::lock_guard<std::mutex> lk(pImpl->mtx);
    return pImpl->state.refreshTimestamps.size();
}

} // namespace authgate
