//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: HttpTypes.h
// Purpose: HTTP message aliases and per-request transport context shared by interceptors and authenticators
//==========================================================================================================

#pragma once

#include <optional>
#include <string>

#include <boost/beast/http.hpp>

namespace authgate {

using HttpRequest = boost::beast::http::request<boost::beast::http::string_body>;
using HttpResponse = boost::beast::http::response<boost::beast::http::string_body>;

//==========================================================================================================
// SessionContext
// Purpose: Identifies the transport session a request belongs to. Interceptors treat it as opaque and hand it
//          back unchanged when a deferred request is resumed.
// Fields:
//   sessionId: Transport session identifier (diagnostics).
//   attempt: 1-based send attempt for the request within the session.
//==========================================================================================================
struct SessionContext {
    std::string sessionId;
    unsigned int attempt{1u};
};

//==========================================================================================================
// RequestRecord
// Purpose: What the transport knows about a request that failed: the request as sent (if it was built), the
//          response (if one was received), and how many times it has already been retried.
//==========================================================================================================
struct RequestRecord {
    std::optional<HttpRequest> request;
    std::optional<HttpResponse> response;
    unsigned int retryCount{0u};
};

} // namespace authgate
