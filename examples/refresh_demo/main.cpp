//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: main.cpp
// Purpose: Example demonstrating single-flight refresh shared by concurrent requests, and a 401 retry
//==========================================================================================================

#include <atomic>
#include <chrono>
#include <future>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include <boost/asio/post.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/thread_pool.hpp>

#include "authgate/AuthenticationInterceptor.hpp"
#include "authgate/version.h"

using namespace authgate;
namespace http = boost::beast::http;

namespace {

class DemoCredential final : public auth::ICredential {
public:
    DemoCredential(std::string token, std::chrono::steady_clock::time_point expiry)
        : token(std::move(token)), expiry(expiry) {}
    bool requiresRefresh() const override { return std::chrono::steady_clock::now() >= expiry; }
    const std::string token;
    const std::chrono::steady_clock::time_point expiry;
};

// Issues "token-N" after a simulated 200 ms token endpoint round trip
class DemoAuthenticator final : public auth::IAuthenticator {
public:
    explicit DemoAuthenticator(boost::asio::any_io_executor ex) : executor(std::move(ex)) {}

    void apply(HttpRequest& request, const auth::ICredential& credential) override {
        request.set(http::field::authorization, "Bearer " + static_cast<const DemoCredential&>(credential).token);
    }

    void refresh(auth::CredentialPtr, auth::RefreshCompletion onComplete) override {
        const int n = ++issued;
        std::cout << "refresh #" << n << " started\n";
        auto timer = std::make_shared<boost::asio::steady_timer>(executor, std::chrono::milliseconds(200));
        timer->async_wait([timer, n, onComplete](const boost::system::error_code&) {
            onComplete(Result<auth::CredentialPtr>::success(std::make_shared<const DemoCredential>(
                "token-" + std::to_string(n), std::chrono::steady_clock::now() + std::chrono::minutes(10))));
        });
    }

    bool didRequestFailDueToAuthentication(const HttpRequest*, const HttpResponse* response,
                                           const errors::AuthError&) const override {
        return response && response->result() == http::status::unauthorized;
    }

    bool isRequestAuthenticatedWith(const HttpRequest* request, const auth::ICredential& credential) const override {
        return request && std::string((*request)[http::field::authorization]) ==
                              "Bearer " + static_cast<const DemoCredential&>(credential).token;
    }

private:
    boost::asio::any_io_executor executor;
    std::atomic<int> issued{0};
};

} // namespace

int main() {
    std::cout << "authgate " << getVersionString() << "\n";
    boost::asio::thread_pool pool{4};
    auto authenticator = std::make_shared<DemoAuthenticator>(pool.get_executor());
    // Start with an already expired credential so the first burst must wait for one refresh
    auto expired = std::make_shared<const DemoCredential>("token-0", std::chrono::steady_clock::now());
    AuthenticationInterceptor interceptor(authenticator, expired, pool.get_executor(),
                                          InterceptorOptions::FromEnvironment());

    std::vector<std::future<Result<HttpRequest>>> pending;
    for (int i = 0; i < 8; ++i) {
        HttpRequest req{http::verb::get, "/items/" + std::to_string(i), 11};
        pending.push_back(interceptor.AdaptAsync(std::move(req), SessionContext{"demo-" + std::to_string(i), 1u}));
    }
    for (auto& f : pending) {
        auto r = f.get();
        if (r.ok()) {
            std::cout << r.value().target() << " -> " << r.value()[http::field::authorization] << "\n";
        } else {
            std::cout << "adapt failed: " << r.error().toString() << "\n";
        }
    }

    // The server rejects the current token: Retry refreshes once, then says to retry
    RequestRecord record;
    HttpRequest sent{http::verb::get, "/items/0", 11};
    authenticator->apply(sent, *interceptor.GetCredential());
    record.request = std::move(sent);
    record.response = HttpResponse{http::status::unauthorized, 11};
    auto verdict = interceptor
                       .RetryAsync(record, SessionContext{"demo-retry", 1u},
                                   errors::makeError(errors::ErrorCategory::HttpStatus, "unauthorized", 401))
                       .get();
    std::cout << "retry verdict: " << retryActionName(verdict.action) << "\n";

    pool.join();
    return 0;
}
