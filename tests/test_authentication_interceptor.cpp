//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: tests/test_authentication_interceptor.cpp
// Purpose: Tests for AuthenticationInterceptor (single-flight refresh, queue draining, retry verdicts)
//==========================================================================================================

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <cstdio>
#include <fstream>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include <boost/asio/thread_pool.hpp>
#include <boost/beast/http.hpp>

#include "authgate/AuthenticationInterceptor.hpp"
#include "logging/Logger.h"

using namespace authgate;
namespace http = boost::beast::http;
using namespace std::chrono_literals;

namespace {

class FakeCredential final : public auth::ICredential {
public:
    FakeCredential(std::string token, bool expired) : token(std::move(token)), expired(expired) {}
    bool requiresRefresh() const override { return expired; }

    const std::string token;
    const bool expired;
};

auth::CredentialPtr makeCredential(const std::string& token, bool expired = false) {
    return std::make_shared<const FakeCredential>(token, expired);
}

std::string tokenOf(const auth::ICredential& credential) {
    return dynamic_cast<const FakeCredential&>(credential).token;
}

// Authenticator that holds refresh completions until the test releases them, or completes them inline when
// autoComplete is set.
class FakeAuthenticator final : public auth::IAuthenticator {
public:
    void apply(HttpRequest& request, const auth::ICredential& credential) override {
        request.set(http::field::authorization, "Bearer " + tokenOf(credential));
    }

    void refresh(auth::CredentialPtr credential, auth::RefreshCompletion onComplete) override {
        refreshCalls.fetch_add(1);
        std::function<Result<auth::CredentialPtr>()> immediate;
        {
            std::lock_guard<std::mutex> lk(mtx);
            lastRefreshed = credential;
            if (autoComplete) {
                immediate = autoComplete;
            } else {
                pending.push_back(std::move(onComplete));
            }
        }
        if (immediate) {
            onComplete(immediate());
        }
    }

    bool didRequestFailDueToAuthentication(const HttpRequest*, const HttpResponse*, const errors::AuthError&) const override {
        return authFailure.load();
    }

    bool isRequestAuthenticatedWith(const HttpRequest* request, const auth::ICredential& credential) const override {
        if (!request) {
            return false;
        }
        auto it = request->find(http::field::authorization);
        return it != request->end() && std::string(it->value()) == "Bearer " + tokenOf(credential);
    }


    void completePending(const Result<auth::CredentialPtr>& result) {
        std::vector<auth::RefreshCompletion> callbacks;
        {
            std::lock_guard<std::mutex> lk(mtx);
            callbacks.swap(pending);
        }
        for (auto& cb : callbacks) {
            cb(result);
        }
    }

    void setAutoComplete(std::function<Result<auth::CredentialPtr>()> fn) {
        std::lock_guard<std::mutex> lk(mtx);
        autoComplete = std::move(fn);
    }

    std::atomic<int> refreshCalls{0};
    std::atomic<bool> authFailure{true};
    auth::CredentialPtr lastRefreshed;

private:
    std::mutex mtx;
    std::vector<auth::RefreshCompletion> pending;
    std::function<Result<auth::CredentialPtr>()> autoComplete;
};

HttpRequest makeRequest(const std::string& target = "/items") {
    return HttpRequest{http::verb::get, target, 11};
}

RequestRecord failedRecordWith(const std::string& token, unsigned int status = 401) {
    RequestRecord record;
    HttpRequest req = makeRequest();
    req.set(http::field::authorization, "Bearer " + token);
    record.request = std::move(req);
    HttpResponse res{static_cast<http::status>(status), 11};
    record.response = std::move(res);
    return record;
}

std::string authHeaderOf(const HttpRequest& req) {
    auto it = req.find(http::field::authorization);
    return it == req.end() ? std::string() : std::string(it->value());
}

errors::AuthError unauthorized() {
    return errors::makeError(errors::ErrorCategory::HttpStatus, "unauthorized", 401);
}

struct InterceptorHarness {
    boost::asio::thread_pool pool{2};
    std::shared_ptr<FakeAuthenticator> authenticator = std::make_shared<FakeAuthenticator>();
    std::unique_ptr<AuthenticationInterceptor> interceptor;
    SessionContext session{"test-session", 1u};

    explicit InterceptorHarness(auth::CredentialPtr credential, const InterceptorOptions& opts = InterceptorOptions()) {
        interceptor = std::make_unique<AuthenticationInterceptor>(authenticator, std::move(credential), pool.get_executor(), opts);
    }
};

} // namespace

TEST(AuthenticationInterceptor, AdaptAttachesCurrentCredential) {
    InterceptorHarness h(makeCredential("c1"));
    auto fut = h.interceptor->AdaptAsync(makeRequest(), h.session);
    ASSERT_EQ(fut.wait_for(0s), std::future_status::ready);
    auto result = fut.get();
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(authHeaderOf(result.value()), std::string("Bearer c1"));
    EXPECT_EQ(h.authenticator->refreshCalls.load(), 0);
}

TEST(AuthenticationInterceptor, AdaptWithoutCredentialFailsImmediately) {
    InterceptorHarness h(nullptr);
    auto fut = h.interceptor->AdaptAsync(makeRequest(), h.session);
    ASSERT_EQ(fut.wait_for(0s), std::future_status::ready);
    auto result = fut.get();
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error().category, errors::ErrorCategory::MissingCredential);
    EXPECT_EQ(h.authenticator->refreshCalls.load(), 0);
}

TEST(AuthenticationInterceptor, RetryWithoutCredentialFailsImmediately) {
    InterceptorHarness h(nullptr);
    auto fut = h.interceptor->RetryAsync(failedRecordWith("c1"), h.session, unauthorized());
    ASSERT_EQ(fut.wait_for(0s), std::future_status::ready);
    auto verdict = fut.get();
    EXPECT_EQ(verdict.action, RetryVerdict::Action::DoNotRetryWithError);
    ASSERT_TRUE(verdict.error.has_value());
    EXPECT_EQ(verdict.error->category, errors::ErrorCategory::MissingCredential);
}

TEST(AuthenticationInterceptor, NonAuthenticationFailureIsNotRetried) {
    InterceptorHarness h(makeCredential("c1", true));
    h.authenticator->authFailure.store(false);
    auto fut = h.interceptor->RetryAsync(failedRecordWith("c1", 500), h.session,
                                         errors::makeError(errors::ErrorCategory::HttpStatus, "server error", 500));
    ASSERT_EQ(fut.wait_for(0s), std::future_status::ready);
    EXPECT_EQ(fut.get().action, RetryVerdict::Action::DoNotRetry);
    EXPECT_EQ(h.authenticator->refreshCalls.load(), 0);
    EXPECT_FALSE(h.interceptor->IsRefreshing());
}

TEST(AuthenticationInterceptor, ConcurrentAdaptsShareOneRefresh) {
    InterceptorHarness h(makeCredential("c1", true));
    constexpr int kCallers = 16;
    std::vector<std::promise<Result<HttpRequest>>> promises(kCallers);
    std::vector<std::future<Result<HttpRequest>>> futures;
    for (auto& p : promises) {
        futures.push_back(p.get_future());
    }

    std::vector<std::thread> threads;
    for (int i = 0; i < kCallers; ++i) {
        threads.emplace_back([&h, &promises, i]() {
            h.interceptor->Adapt(makeRequest("/r/" + std::to_string(i)), h.session,
                                 [&promises, i](Result<HttpRequest> r) { promises[i].set_value(std::move(r)); });
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    EXPECT_EQ(h.authenticator->refreshCalls.load(), 1);
    EXPECT_TRUE(h.interceptor->IsRefreshing());
    EXPECT_EQ(h.interceptor->GetPendingCounts().adapts, static_cast<std::size_t>(kCallers));
    for (auto& f : futures) {
        EXPECT_EQ(f.wait_for(0s), std::future_status::timeout);
    }

    h.authenticator->completePending(Result<auth::CredentialPtr>::success(makeCredential("c2")));

    for (auto& f : futures) {
        ASSERT_EQ(f.wait_for(2s), std::future_status::ready);
        auto r = f.get();
        ASSERT_TRUE(r.ok());
        EXPECT_EQ(authHeaderOf(r.value()), std::string("Bearer c2"));
    }
    EXPECT_EQ(h.authenticator->refreshCalls.load(), 1);
    EXPECT_FALSE(h.interceptor->IsRefreshing());
    EXPECT_EQ(h.interceptor->GetPendingCounts().adapts, 0u);
    EXPECT_EQ(tokenOf(*h.interceptor->GetCredential()), std::string("c2"));
}

TEST(AuthenticationInterceptor, AdaptDuringRefreshIsQueuedWithoutSecondRefresh) {
    InterceptorHarness h(makeCredential("c1", true));
    auto first = h.interceptor->AdaptAsync(makeRequest(), h.session);
    ASSERT_TRUE(h.interceptor->IsRefreshing());

    // A valid credential set mid-flight does not bypass the in-flight refresh
    h.interceptor->SetCredential(makeCredential("manual"));
    auto second = h.interceptor->AdaptAsync(makeRequest(), h.session);
    EXPECT_EQ(second.wait_for(0s), std::future_status::timeout);
    EXPECT_EQ(h.authenticator->refreshCalls.load(), 1);

    h.authenticator->completePending(Result<auth::CredentialPtr>::success(makeCredential("c2")));
    ASSERT_EQ(first.wait_for(2s), std::future_status::ready);
    ASSERT_EQ(second.wait_for(2s), std::future_status::ready);
    EXPECT_EQ(authHeaderOf(first.get().value()), std::string("Bearer c2"));
    EXPECT_EQ(authHeaderOf(second.get().value()), std::string("Bearer c2"));
}

TEST(AuthenticationInterceptor, WaitersResumeInArrivalOrder) {
    InterceptorHarness h(makeCredential("c1", true));
    std::mutex orderMutex;
    std::vector<std::string> adaptOrder;
    std::vector<int> retryOrder;
    std::promise<void> allDone;
    std::atomic<int> remaining{6};

    auto markDone = [&]() {
        if (remaining.fetch_sub(1) == 1) {
            allDone.set_value();
        }
    };

    for (int i = 1; i <= 3; ++i) {
        const std::string target = "/w" + std::to_string(i);
        h.interceptor->Adapt(makeRequest(target), h.session, [&, target](Result<HttpRequest> r) {
            EXPECT_TRUE(r.ok());
            {
                std::lock_guard<std::mutex> lk(orderMutex);
                adaptOrder.push_back(std::string(r.value().target()));
            }
            markDone();
        });
    }
    for (int i = 1; i <= 3; ++i) {
        // Failed with the credential that is still current, so each one queues
        h.interceptor->Retry(failedRecordWith("c1"), h.session, unauthorized(), [&, i](RetryVerdict v) {
            EXPECT_EQ(v.action, RetryVerdict::Action::Retry);
            {
                std::lock_guard<std::mutex> lk(orderMutex);
                retryOrder.push_back(i);
            }
            markDone();
        });
    }
    EXPECT_EQ(h.authenticator->refreshCalls.load(), 1);
    EXPECT_EQ(h.interceptor->GetPendingCounts().retries, 3u);

    h.authenticator->completePending(Result<auth::CredentialPtr>::success(makeCredential("c2")));
    ASSERT_EQ(allDone.get_future().wait_for(2s), std::future_status::ready);

    std::lock_guard<std::mutex> lk(orderMutex);
    EXPECT_EQ(adaptOrder, (std::vector<std::string>{"/w1", "/w2", "/w3"}));
    EXPECT_EQ(retryOrder, (std::vector<int>{1, 2, 3}));
}

TEST(AuthenticationInterceptor, RetryWithCurrentCredentialTriggersRefresh) {
    InterceptorHarness h(makeCredential("c1"));
    auto first = h.interceptor->RetryAsync(failedRecordWith("c1"), h.session, unauthorized());
    auto second = h.interceptor->RetryAsync(failedRecordWith("c1"), h.session, unauthorized());

    EXPECT_EQ(h.authenticator->refreshCalls.load(), 1);
    ASSERT_TRUE(h.authenticator->lastRefreshed);
    EXPECT_EQ(tokenOf(*h.authenticator->lastRefreshed), std::string("c1"));
    EXPECT_EQ(first.wait_for(0s), std::future_status::timeout);

    h.authenticator->completePending(Result<auth::CredentialPtr>::success(makeCredential("c2")));
    ASSERT_EQ(first.wait_for(2s), std::future_status::ready);
    ASSERT_EQ(second.wait_for(2s), std::future_status::ready);
    EXPECT_EQ(first.get().action, RetryVerdict::Action::Retry);
    EXPECT_EQ(second.get().action, RetryVerdict::Action::Retry);
}

TEST(AuthenticationInterceptor, StaleCredentialRetriesImmediately) {
    InterceptorHarness h(makeCredential("c2"));
    auto fut = h.interceptor->RetryAsync(failedRecordWith("c1"), h.session, unauthorized());
    ASSERT_EQ(fut.wait_for(0s), std::future_status::ready);
    EXPECT_EQ(fut.get().action, RetryVerdict::Action::Retry);
    EXPECT_EQ(h.authenticator->refreshCalls.load(), 0);
    EXPECT_FALSE(h.interceptor->IsRefreshing());
    EXPECT_EQ(h.interceptor->GetPendingCounts().retries, 0u);
}

TEST(AuthenticationInterceptor, RefreshFailureFailsEveryWaiter) {
    InterceptorHarness h(makeCredential("c1", true));
    auto a1 = h.interceptor->AdaptAsync(makeRequest(), h.session);
    auto a2 = h.interceptor->AdaptAsync(makeRequest(), h.session);
    auto r1 = h.interceptor->RetryAsync(failedRecordWith("c1"), h.session, unauthorized());

    const auto refreshError = errors::makeError(errors::ErrorCategory::HttpStatus, "invalid_grant", 400);
    h.authenticator->completePending(Result<auth::CredentialPtr>::failure(refreshError));

    for (auto* f : {&a1, &a2}) {
        ASSERT_EQ(f->wait_for(2s), std::future_status::ready);
        auto r = f->get();
        ASSERT_FALSE(r.ok());
        EXPECT_EQ(r.error(), refreshError);
    }
    ASSERT_EQ(r1.wait_for(2s), std::future_status::ready);
    auto verdict = r1.get();
    EXPECT_EQ(verdict.action, RetryVerdict::Action::DoNotRetryWithError);
    ASSERT_TRUE(verdict.error.has_value());
    EXPECT_EQ(verdict.error.value(), refreshError);

    // The expired credential is kept; the next adapt starts a new refresh
    EXPECT_FALSE(h.interceptor->IsRefreshing());
    EXPECT_EQ(tokenOf(*h.interceptor->GetCredential()), std::string("c1"));
    auto again = h.interceptor->AdaptAsync(makeRequest(), h.session);
    EXPECT_EQ(h.authenticator->refreshCalls.load(), 2);
    h.authenticator->completePending(Result<auth::CredentialPtr>::success(makeCredential("c3")));
    ASSERT_EQ(again.wait_for(2s), std::future_status::ready);
    EXPECT_EQ(authHeaderOf(again.get().value()), std::string("Bearer c3"));
}

TEST(AuthenticationInterceptor, EmptyRefreshedCredentialIsFailure) {
    InterceptorHarness h(makeCredential("c1", true));
    auto fut = h.interceptor->AdaptAsync(makeRequest(), h.session);
    h.authenticator->completePending(Result<auth::CredentialPtr>::success(nullptr));
    ASSERT_EQ(fut.wait_for(2s), std::future_status::ready);
    auto r = fut.get();
    ASSERT_FALSE(r.ok());
    EXPECT_EQ(r.error().category, errors::ErrorCategory::RefreshFailed);
}

TEST(AuthenticationInterceptor, SynchronousRefreshCompletionDoesNotDeadlock) {
    InterceptorHarness h(makeCredential("c1", true));
    h.authenticator->setAutoComplete([]() { return Result<auth::CredentialPtr>::success(makeCredential("c2")); });
    auto fut = h.interceptor->AdaptAsync(makeRequest(), h.session);
    ASSERT_EQ(fut.wait_for(2s), std::future_status::ready);
    auto r = fut.get();
    ASSERT_TRUE(r.ok());
    EXPECT_EQ(authHeaderOf(r.value()), std::string("Bearer c2"));
    EXPECT_EQ(h.authenticator->refreshCalls.load(), 1);
}

TEST(AuthenticationInterceptor, ExcessiveRefreshIsRejectedWithoutCallingAuthenticator) {
    InterceptorHarness h(makeCredential("t0"));
    ASSERT_EQ(h.interceptor->GetRefreshCountAllowed(), 5u);
    ASSERT_EQ(h.interceptor->GetRefreshSafetyInterval(), std::chrono::milliseconds(30000));

    std::atomic<int> issued{0};
    h.authenticator->setAutoComplete([&issued]() {
        const int n = issued.fetch_add(1) + 1;
        return Result<auth::CredentialPtr>::success(makeCredential("t" + std::to_string(n)));
    });

    // Six refreshes fit: the count inside the window never exceeds five when each one starts
    for (int i = 0; i < 6; ++i) {
        const std::string current = tokenOf(*h.interceptor->GetCredential());
        auto fut = h.interceptor->RetryAsync(failedRecordWith(current), h.session, unauthorized());
        ASSERT_EQ(fut.wait_for(2s), std::future_status::ready);
        EXPECT_EQ(fut.get().action, RetryVerdict::Action::Retry) << "refresh " << i;
    }
    EXPECT_EQ(h.authenticator->refreshCalls.load(), 6);

    const std::string current = tokenOf(*h.interceptor->GetCredential());
    auto rejected = h.interceptor->RetryAsync(failedRecordWith(current), h.session, unauthorized());
    ASSERT_EQ(rejected.wait_for(2s), std::future_status::ready);
    auto verdict = rejected.get();
    EXPECT_EQ(verdict.action, RetryVerdict::Action::DoNotRetryWithError);
    ASSERT_TRUE(verdict.error.has_value());
    EXPECT_EQ(verdict.error->category, errors::ErrorCategory::ExcessiveRefresh);
    EXPECT_EQ(h.authenticator->refreshCalls.load(), 6);
    EXPECT_FALSE(h.interceptor->IsRefreshing());
}

TEST(AuthenticationInterceptor, ExcessiveRefreshFailsQueuedAdapt) {
    InterceptorOptions opts;
    opts.refreshCountAllowed = 0u;
    InterceptorHarness h(makeCredential("c1", true), opts);
    // Every refresh hands back another expired credential
    h.authenticator->setAutoComplete([]() { return Result<auth::CredentialPtr>::success(makeCredential("again", true)); });

    auto fut = h.interceptor->AdaptAsync(makeRequest(), h.session);
    ASSERT_EQ(fut.wait_for(2s), std::future_status::ready);
    auto r = fut.get();
    ASSERT_FALSE(r.ok());
    EXPECT_EQ(r.error().category, errors::ErrorCategory::ExcessiveRefresh);
    EXPECT_EQ(h.authenticator->refreshCalls.load(), 1);
}

TEST(AuthenticationInterceptor, RefreshAllowedAgainOnceWindowPasses) {
    InterceptorOptions opts;
    opts.refreshSafetyInterval = std::chrono::milliseconds(100);
    opts.refreshCountAllowed = 0u;
    InterceptorHarness h(makeCredential("c0"), opts);
    std::atomic<int> issued{0};
    h.authenticator->setAutoComplete([&issued]() {
        return Result<auth::CredentialPtr>::success(makeCredential("c" + std::to_string(issued.fetch_add(1) + 1)));
    });

    auto retryCurrent = [&h]() {
        const std::string current = tokenOf(*h.interceptor->GetCredential());
        auto fut = h.interceptor->RetryAsync(failedRecordWith(current), h.session, unauthorized());
        EXPECT_EQ(fut.wait_for(2s), std::future_status::ready);
        return fut.get();
    };

    EXPECT_EQ(retryCurrent().action, RetryVerdict::Action::Retry);
    EXPECT_EQ(retryCurrent().action, RetryVerdict::Action::DoNotRetryWithError);
    EXPECT_EQ(h.authenticator->refreshCalls.load(), 1);

    std::this_thread::sleep_for(150ms);
    EXPECT_EQ(retryCurrent().action, RetryVerdict::Action::Retry);
    EXPECT_EQ(h.authenticator->refreshCalls.load(), 2);
    // With zero refreshes allowed only the newest attempt needs to be kept
    EXPECT_EQ(h.interceptor->GetRetainedRefreshAttempts(), 1u);
}

TEST(AuthenticationInterceptor, EveryWaiterResumesExactlyOnce) {
    InterceptorHarness h(makeCredential("c1", true));
    constexpr int kWaiters = 8;
    std::vector<std::atomic<int>> calls(kWaiters * 2);
    for (auto& c : calls) {
        c.store(0);
    }
    for (int i = 0; i < kWaiters; ++i) {
        h.interceptor->Adapt(makeRequest(), h.session, [&calls, i](Result<HttpRequest>) { calls[i].fetch_add(1); });
        h.interceptor->Retry(failedRecordWith("c1"), h.session, unauthorized(),
                             [&calls, i](RetryVerdict) { calls[kWaiters + i].fetch_add(1); });
    }
    h.authenticator->completePending(Result<auth::CredentialPtr>::success(makeCredential("c2")));

    auto deadline = std::chrono::steady_clock::now() + 2s;
    auto allCalled = [&calls]() {
        for (auto& c : calls) {
            if (c.load() == 0) return false;
        }
        return true;
    };
    while (!allCalled() && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(5ms);
    }
    std::this_thread::sleep_for(50ms);
    for (std::size_t i = 0; i < calls.size(); ++i) {
        EXPECT_EQ(calls[i].load(), 1) << "waiter " << i;
    }
}

TEST(AuthenticationInterceptor, DuplicateRefreshCompletionIsIgnored) {
    class TwiceAuthenticator final : public auth::IAuthenticator {
    public:
        void apply(HttpRequest& request, const auth::ICredential& credential) override {
            request.set(http::field::authorization, "Bearer " + tokenOf(credential));
        }
        void refresh(auth::CredentialPtr, auth::RefreshCompletion onComplete) override {
            onComplete(Result<auth::CredentialPtr>::success(makeCredential("first")));
            onComplete(Result<auth::CredentialPtr>::success(makeCredential("second")));
        }
        bool didRequestFailDueToAuthentication(const HttpRequest*, const HttpResponse*, const errors::AuthError&) const override {
            return true;
        }
        bool isRequestAuthenticatedWith(const HttpRequest*, const auth::ICredential&) const override { return true; }
    };

    boost::asio::thread_pool pool{1};
    AuthenticationInterceptor interceptor(std::make_shared<TwiceAuthenticator>(), makeCredential("c1", true), pool.get_executor());
    std::atomic<int> completions{0};
    std::promise<std::string> header;
    interceptor.Adapt(makeRequest(), SessionContext{"s", 1u}, [&](Result<HttpRequest> r) {
        if (completions.fetch_add(1) == 0) {
            header.set_value(r.ok() ? authHeaderOf(r.value()) : std::string());
        }
    });
    auto fut = header.get_future();
    ASSERT_EQ(fut.wait_for(2s), std::future_status::ready);
    EXPECT_EQ(fut.get(), std::string("Bearer first"));
    std::this_thread::sleep_for(50ms);
    EXPECT_EQ(completions.load(), 1);
    EXPECT_EQ(tokenOf(*interceptor.GetCredential()), std::string("first"));
    pool.join();
}

TEST(AuthenticationInterceptor, ThrowingCompletionDoesNotStopDrain) {
    InterceptorHarness h(makeCredential("c1", true));
    h.interceptor->Adapt(makeRequest(), h.session, [](Result<HttpRequest>) {
        throw std::runtime_error("caller bug");
    });
    auto second = h.interceptor->AdaptAsync(makeRequest(), h.session);
    auto retry = h.interceptor->RetryAsync(failedRecordWith("c1"), h.session, unauthorized());

    h.authenticator->completePending(Result<auth::CredentialPtr>::success(makeCredential("c2")));
    ASSERT_EQ(second.wait_for(2s), std::future_status::ready);
    EXPECT_TRUE(second.get().ok());
    ASSERT_EQ(retry.wait_for(2s), std::future_status::ready);
    EXPECT_EQ(retry.get().action, RetryVerdict::Action::Retry);
}

TEST(AuthenticationInterceptor, ThrowingAuthenticatorRefreshFailsWaiters) {
    class ThrowingAuthenticator final : public auth::IAuthenticator {
    public:
        void apply(HttpRequest&, const auth::ICredential&) override {}
        void refresh(auth::CredentialPtr, auth::RefreshCompletion) override { throw std::runtime_error("no network"); }
        bool didRequestFailDueToAuthentication(const HttpRequest*, const HttpResponse*, const errors::AuthError&) const override {
            return true;
        }
        bool isRequestAuthenticatedWith(const HttpRequest*, const auth::ICredential&) const override { return true; }
    };

    boost::asio::thread_pool pool{1};
    AuthenticationInterceptor interceptor(std::make_shared<ThrowingAuthenticator>(), makeCredential("c1", true), pool.get_executor());
    auto fut = interceptor.AdaptAsync(makeRequest(), SessionContext{"s", 1u});
    ASSERT_EQ(fut.wait_for(2s), std::future_status::ready);
    auto r = fut.get();
    ASSERT_FALSE(r.ok());
    EXPECT_EQ(r.error().category, errors::ErrorCategory::RefreshFailed);
    EXPECT_FALSE(interceptor.IsRefreshing());
    pool.join();
}

TEST(AuthenticationInterceptor, SettersUpdateConfiguration) {
    InterceptorOptions opts;
    opts.refreshSafetyInterval = std::chrono::milliseconds(1500);
    opts.refreshCountAllowed = 2u;
    InterceptorHarness h(nullptr, opts);
    EXPECT_EQ(h.interceptor->GetRefreshSafetyInterval(), std::chrono::milliseconds(1500));
    EXPECT_EQ(h.interceptor->GetRefreshCountAllowed(), 2u);

    h.interceptor->SetRefreshSafetyInterval(std::chrono::milliseconds(10));
    h.interceptor->SetRefreshCountAllowed(9u);
    EXPECT_EQ(h.interceptor->GetRefreshSafetyInterval(), std::chrono::milliseconds(10));
    EXPECT_EQ(h.interceptor->GetRefreshCountAllowed(), 9u);

    EXPECT_FALSE(h.interceptor->GetCredential());
    h.interceptor->SetCredential(makeCredential("late"));
    auto fut = h.interceptor->AdaptAsync(makeRequest(), h.session);
    ASSERT_EQ(fut.wait_for(0s), std::future_status::ready);
    EXPECT_EQ(authHeaderOf(fut.get().value()), std::string("Bearer late"));
}

TEST(AuthenticationInterceptor, EnlargedWindowStillCountsEarlierRefreshes) {
    InterceptorOptions opts;
    opts.refreshSafetyInterval = std::chrono::milliseconds(100);
    opts.refreshCountAllowed = 1u;
    InterceptorHarness h(makeCredential("c0"), opts);
    std::atomic<int> issued{0};
    h.authenticator->setAutoComplete([&issued]() {
        return Result<auth::CredentialPtr>::success(makeCredential("c" + std::to_string(issued.fetch_add(1) + 1)));
    });

    auto retryCurrent = [&h]() {
        const std::string current = tokenOf(*h.interceptor->GetCredential());
        auto fut = h.interceptor->RetryAsync(failedRecordWith(current), h.session, unauthorized());
        EXPECT_EQ(fut.wait_for(2s), std::future_status::ready);
        return fut.get();
    };

    EXPECT_EQ(retryCurrent().action, RetryVerdict::Action::Retry);
    std::this_thread::sleep_for(150ms);
    EXPECT_EQ(retryCurrent().action, RetryVerdict::Action::Retry);
    EXPECT_EQ(h.authenticator->refreshCalls.load(), 2);
    EXPECT_EQ(h.interceptor->GetRetainedRefreshAttempts(), 2u);

    // Both earlier refreshes now sit inside the window: 2 > 1
    h.interceptor->SetRefreshSafetyInterval(std::chrono::seconds(10));
    auto verdict = retryCurrent();
    EXPECT_EQ(verdict.action, RetryVerdict::Action::DoNotRetryWithError);
    ASSERT_TRUE(verdict.error.has_value());
    EXPECT_EQ(verdict.error->category, errors::ErrorCategory::ExcessiveRefresh);
    EXPECT_EQ(h.authenticator->refreshCalls.load(), 2);
}

TEST(AuthenticationInterceptor, RefreshHistoryStaysBounded) {
    InterceptorOptions opts;
    opts.refreshSafetyInterval = std::chrono::milliseconds(1);
    opts.refreshCountAllowed = 2u;
    InterceptorHarness h(makeCredential("c0"), opts);
    std::atomic<int> issued{0};
    h.authenticator->setAutoComplete([&issued]() {
        return Result<auth::CredentialPtr>::success(makeCredential("c" + std::to_string(issued.fetch_add(1) + 1)));
    });

    for (int i = 0; i < 10; ++i) {
        const std::string current = tokenOf(*h.interceptor->GetCredential());
        auto fut = h.interceptor->RetryAsync(failedRecordWith(current), h.session, unauthorized());
        ASSERT_EQ(fut.wait_for(2s), std::future_status::ready);
        EXPECT_EQ(fut.get().action, RetryVerdict::Action::Retry) << "refresh " << i;
        std::this_thread::sleep_for(5ms);
    }
    EXPECT_EQ(h.authenticator->refreshCalls.load(), 10);
    EXPECT_EQ(h.interceptor->GetRetainedRefreshAttempts(), 3u);
}

TEST(AuthenticationInterceptor, CredentialReplacedDuringClassificationRetriesImmediately) {
    // Replaces the interceptor's credential while Retry is classifying the failed request
    class ReplacingAuthenticator final : public auth::IAuthenticator {
    public:
        void apply(HttpRequest& request, const auth::ICredential& credential) override {
            request.set(http::field::authorization, "Bearer " + tokenOf(credential));
        }
        void refresh(auth::CredentialPtr, auth::RefreshCompletion) override { refreshCalls.fetch_add(1); }
        bool didRequestFailDueToAuthentication(const HttpRequest*, const HttpResponse*, const errors::AuthError&) const override {
            return true;
        }
        bool isRequestAuthenticatedWith(const HttpRequest*, const auth::ICredential&) const override {
            if (target) {
                target->SetCredential(makeCredential("replacement"));
            }
            return true;
        }

        AuthenticationInterceptor* target{nullptr};
        std::atomic<int> refreshCalls{0};
    };

    boost::asio::thread_pool pool{1};
    auto authenticator = std::make_shared<ReplacingAuthenticator>();
    AuthenticationInterceptor interceptor(authenticator, makeCredential("c1"), pool.get_executor());
    authenticator->target = &interceptor;

    auto fut = interceptor.RetryAsync(failedRecordWith("c1"), SessionContext{"s", 1u}, unauthorized());
    ASSERT_EQ(fut.wait_for(0s), std::future_status::ready);
    EXPECT_EQ(fut.get().action, RetryVerdict::Action::Retry);
    EXPECT_EQ(authenticator->refreshCalls.load(), 0);
    EXPECT_FALSE(interceptor.IsRefreshing());
    EXPECT_EQ(interceptor.GetPendingCounts().retries, 0u);
    EXPECT_EQ(tokenOf(*interceptor.GetCredential()), std::string("replacement"));
    pool.join();
}

TEST(AuthenticationInterceptor, NonStandardExceptionFromRefreshFailsWaiters) {
    class IntThrowingAuthenticator final : public auth::IAuthenticator {
    public:
        void apply(HttpRequest&, const auth::ICredential&) override {}
        void refresh(auth::CredentialPtr, auth::RefreshCompletion) override { throw 42; }
        bool didRequestFailDueToAuthentication(const HttpRequest*, const HttpResponse*, const errors::AuthError&) const override {
            return true;
        }
        bool isRequestAuthenticatedWith(const HttpRequest*, const auth::ICredential&) const override { return true; }
    };

    boost::asio::thread_pool pool{1};
    AuthenticationInterceptor interceptor(std::make_shared<IntThrowingAuthenticator>(), makeCredential("c1", true), pool.get_executor());
    auto fut = interceptor.AdaptAsync(makeRequest(), SessionContext{"s", 1u});
    ASSERT_EQ(fut.wait_for(2s), std::future_status::ready);
    auto r = fut.get();
    ASSERT_FALSE(r.ok());
    EXPECT_EQ(r.error().category, errors::ErrorCategory::RefreshFailed);
    EXPECT_FALSE(interceptor.IsRefreshing());

    // The next caller starts a new refresh instead of queueing forever
    auto again = interceptor.AdaptAsync(makeRequest(), SessionContext{"s", 2u});
    ASSERT_EQ(again.wait_for(2s), std::future_status::ready);
    EXPECT_FALSE(again.get().ok());
    pool.join();
}

TEST(AuthenticationInterceptor, NonStandardExceptionFromCompletionDoesNotStopDrain) {
    InterceptorHarness h(makeCredential("c1", true));
    h.interceptor->Adapt(makeRequest(), h.session, [](Result<HttpRequest>) { throw 7; });
    h.interceptor->Retry(failedRecordWith("c1"), h.session, unauthorized(), [](RetryVerdict) { throw 8; });
    auto second = h.interceptor->AdaptAsync(makeRequest(), h.session);
    auto retry = h.interceptor->RetryAsync(failedRecordWith("c1"), h.session, unauthorized());

    h.authenticator->completePending(Result<auth::CredentialPtr>::success(makeCredential("c2")));
    ASSERT_EQ(second.wait_for(2s), std::future_status::ready);
    EXPECT_TRUE(second.get().ok());
    ASSERT_EQ(retry.wait_for(2s), std::future_status::ready);
    EXPECT_EQ(retry.get().action, RetryVerdict::Action::Retry);
}

TEST(AuthenticationInterceptor, LogsSessionAttemptAndRetryCount) {
    const std::string path = ::testing::TempDir() + "authgate_interceptor_session.log";
    std::remove(path.c_str());
    const LogLevel saved = Logger::sLogLevel;
    Logger::setLogFile(path);
    Logger::setLogLevel(LogLevel::LOG_DEBUG_LEVEL);

    {
        InterceptorHarness missing(nullptr);
        auto fut = missing.interceptor->AdaptAsync(makeRequest(), SessionContext{"sess-a", 3u});
        ASSERT_EQ(fut.wait_for(0s), std::future_status::ready);
        EXPECT_FALSE(fut.get().ok());
    }
    {
        InterceptorHarness stale(makeCredential("c2"));
        RequestRecord record = failedRecordWith("c1");
        record.retryCount = 2u;
        auto fut = stale.interceptor->RetryAsync(record, SessionContext{"sess-b", 1u}, unauthorized());
        ASSERT_EQ(fut.wait_for(0s), std::future_status::ready);
        EXPECT_EQ(fut.get().action, RetryVerdict::Action::Retry);
    }

    Logger::closeLogFile();
    Logger::setLogLevel(saved);
    std::ifstream in(path);
    std::ostringstream contents;
    contents << in.rdbuf();
    EXPECT_NE(contents.str().find("no credential for session sess-a attempt 3"), std::string::npos);
    EXPECT_NE(contents.str().find("session sess-b used a stale credential, retrying immediately (retry #3)"), std::string::npos);
    std::remove(path.c_str());
}
