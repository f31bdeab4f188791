//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/authgate/auth/OAuthClient.cpp
// Purpose: OAuth2 token endpoint client (form POST over HTTP/HTTPS) and token response parsing
//==========================================================================================================
#include <memory>
#include <sstream>
#include <string>
#include <utility>
#include <chrono>
#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/http.hpp>
#include <openssl/ssl.h>

#include "logging/Logger.h"
#include "authgate/auth/OAuthClient.hpp"

namespace authgate::auth {
namespace net = boost::asio;
namespace ssl = boost::asio::ssl;
namespace http = boost::beast::http;
using tcp = net::ip::tcp;

namespace {

struct UrlParts { std::string scheme, host, port, path; };

UrlParts parseUrl(const std::string& url) {
    UrlParts parts;
    std::size_t pos = 0;
    std::size_t schemeEnd = url.find("://");
    if (schemeEnd != std::string::npos) {
        parts.scheme = url.substr(0, schemeEnd);
        pos = schemeEnd + 3;
    } else {
        parts.scheme = std::string("http");
    }
    std::size_t slash = url.find('/', pos);
    std::string hostPort;
    if (slash == std::string::npos) {
        hostPort = url.substr(pos);
        parts.path = std::string("/");
    } else {
        hostPort = url.substr(pos, slash - pos);
        parts.path = url.substr(slash);
    }
    std::size_t colon = hostPort.find(':');
    if (colon == std::string::npos) {
        parts.host = hostPort;
        parts.port = (parts.scheme == std::string("https")) ? std::string("443") : std::string("80");
    } else {
        parts.host = hostPort.substr(0, colon);
        parts.port = hostPort.substr(colon + 1);
    }
    return parts;
}

http::request<http::string_body> makeFormRequest(const std::string& target, const std::string& host, const std::string& body) {
    http::request<http::string_body> req{http::verb::post, target, 11};
    req.set(http::field::host, host);
    req.set(http::field::content_type, "application/x-www-form-urlencoded");
    req.set(http::field::accept, "application/json");
    req.set(http::field::connection, "close");
    req.body() = body;
    req.prepare_payload();
    return req;
}

// Minimal field extraction for flat token responses
bool parseJsonStringField(const std::string& json, const std::string& key, std::string& out) {
    out.clear();
    std::string needle = std::string("\"") + key + std::string("\"");
    std::size_t k = json.find(needle);
    if (k == std::string::npos) {
        return false;
    }
    std::size_t colon = json.find(':', k + needle.size());
    if (colon == std::string::npos) {
        return false;
    }
    std::size_t q1 = json.find('"', colon + 1);
    if (q1 == std::string::npos) {
        return false;
    }
    // Only whitespace may sit between ':' and the opening quote
    for (std::size_t i = colon + 1; i < q1; ++i) {
        if (json[i] != ' ' && json[i] != '\t' && json[i] != '\r' && json[i] != '\n') {
            return false;
        }
    }
    std::size_t q2 = q1 + 1;
    while (q2 < json.size()) {
        if (json[q2] == '"' && json[q2 - 1] != '\\') {
            break;
        }
        ++q2;
    }
    if (q2 >= json.size()) {
        return false;
    }
    out = json.substr(q1 + 1, q2 - q1 - 1);
    return true;
}

bool parseJsonIntField(const std::string& json, const std::string& key, long& out) {
    std::string needle = std::string("\"") + key + std::string("\"");
    std::size_t k = json.find(needle);
    if (k == std::string::npos) {
        return false;
    }
    std::size_t colon = json.find(':', k + needle.size());
    if (colon == std::string::npos) {
        return false;
    }
    std::size_t i = colon + 1;
    while (i < json.size() && (json[i] == ' ' || json[i] == '\t' || json[i] == '\r' || json[i] == '\n' || json[i] == '"')) {
        ++i;
    }
    std::size_t j = i;
    while (j < json.size() && ((json[j] >= '0' && json[j] <= '9') || json[j] == '-')) {
        ++j;
    }
    if (j == i) {
        return false;
    }
    try {
        out = std::stol(json.substr(i, j - i));
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

} // namespace

std::string urlEncodeForm(const std::string& s) {
    std::ostringstream oss;
    const char* hex = "0123456789ABCDEF";
    for (unsigned char c : s) {
        if ((c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '-' || c == '_' || c == '.' || c == '~') {
            oss << static_cast<char>(c);
        } else if (c == ' ') {
            oss << '+';
        } else {
            oss << '%' << hex[(c >> 4) & 0xFu] << hex[c & 0xFu];
        }
    }
    return oss.str();
}

net::awaitable<Result<TokenHttpResponse>> coPostFormUrlencoded(const TokenEndpointParams& params, const std::string& body) {
    std::string failure;
    try {
        UrlParts u = parseUrl(params.url);
        tcp::resolver resolver(co_await net::this_coro::executor);
        auto results = co_await resolver.async_resolve(u.host, u.port, net::use_awaitable);
        LOG_DEBUG("Token endpoint resolved {}:{} path={}", u.host, u.port, u.path);

        boost::beast::flat_buffer buffer;
        http::response<http::string_body> res;

        if (u.scheme == std::string("https")) {
            ssl::context ctx(ssl::context::tls_client);
            ::SSL_CTX_set_min_proto_version(ctx.native_handle(), TLS1_3_VERSION);
            ::SSL_CTX_set_max_proto_version(ctx.native_handle(), TLS1_3_VERSION);
            if (!params.caFile.empty() || !params.caPath.empty()) {
                if (!params.caFile.empty()) { ctx.load_verify_file(params.caFile); }
                if (!params.caPath.empty()) { ctx.add_verify_path(params.caPath); }
            } else {
                ctx.set_default_verify_paths();
            }
            ctx.set_verify_mode(ssl::verify_peer);

            boost::beast::ssl_stream<boost::beast::tcp_stream> stream(co_await net::this_coro::executor, ctx);
            const std::string sni = params.serverName.empty() ? u.host : params.serverName;
            if (!::SSL_set_tlsext_host_name(stream.native_handle(), sni.c_str())) {
                LOG_WARN("Token endpoint: failed to set SNI host name {}", sni);
            }
            (void)::SSL_set1_host(stream.native_handle(), sni.c_str());

            stream.next_layer().expires_after(std::chrono::milliseconds(params.connectTimeoutMs));
            co_await stream.next_layer().async_connect(results, net::use_awaitable);
            co_await stream.async_handshake(ssl::stream_base::client, net::use_awaitable);

            auto req = makeFormRequest(u.path, sni, body);
            stream.next_layer().expires_after(std::chrono::milliseconds(params.readTimeoutMs));
            co_await http::async_write(stream, req, net::use_awaitable);
            co_await http::async_read(stream, buffer, res, net::use_awaitable);
            boost::system::error_code ec; stream.shutdown(ec);
        } else {
            boost::beast::tcp_stream stream(co_await net::this_coro::executor);
            stream.expires_after(std::chrono::milliseconds(params.connectTimeoutMs));
            co_await stream.async_connect(results, net::use_awaitable);

            auto req = makeFormRequest(u.path, u.host, body);
            stream.expires_after(std::chrono::milliseconds(params.readTimeoutMs));
            co_await http::async_write(stream, req, net::use_awaitable);
            co_await http::async_read(stream, buffer, res, net::use_awaitable);
            boost::system::error_code ec; stream.socket().shutdown(tcp::socket::shutdown_both, ec);
        }

        LOG_DEBUG("Token endpoint replied status={} bytes={}", res.result_int(), res.body().size());
        TokenHttpResponse out;
        out.status = static_cast<int>(res.result_int());
        out.body = std::move(res.body());
        co_return Result<TokenHttpResponse>::success(std::move(out));
    } catch (const std::exception& e) {
        failure = e.what();
    }
    LOG_DEBUG("Token endpoint request failed: {}", failure);
    co_return Result<TokenHttpResponse>::failure(
        errors::makeError(errors::ErrorCategory::Transport, std::string("token endpoint request failed: ") + failure));
}

Result<OAuthCredentialPtr> parseTokenResponse(const TokenHttpResponse& response, const OAuthCredential& previous) {
    if (response.status < 200 || response.status >= 300) {
        std::string oauthError;
        std::string message = std::string("token endpoint returned HTTP ") + std::to_string(response.status);
        if (parseJsonStringField(response.body, "error", oauthError)) {
            message += ": " + oauthError;
        }
        return Result<OAuthCredentialPtr>::failure(
            errors::makeError(errors::ErrorCategory::HttpStatus, message, response.status));
    }

    std::string accessToken;
    if (!parseJsonStringField(response.body, "access_token", accessToken) || accessToken.empty()) {
        return Result<OAuthCredentialPtr>::failure(
            errors::makeError(errors::ErrorCategory::InvalidTokenResponse, "token endpoint response missing access_token"));
    }

    std::string refreshToken;
    if (!parseJsonStringField(response.body, "refresh_token", refreshToken) || refreshToken.empty()) {
        refreshToken = previous.getRefreshToken();
    }

    long expiresIn = 0;
    if (!parseJsonIntField(response.body, "expires_in", expiresIn) || expiresIn <= 0) {
        expiresIn = 3600;
    }

    auto credential = std::make_shared<const OAuthCredential>(
        std::move(accessToken),
        std::move(refreshToken),
        std::chrono::system_clock::now() + std::chrono::seconds(expiresIn),
        previous.getUserId(),
        previous.getRefreshSkew());
    return Result<OAuthCredentialPtr>::success(std::move(credential));
}

} // namespace authgate::auth
