//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Errors.h
// Purpose: Typed error structure and error category helpers for authgate
//==========================================================================================================

#pragma once

#include <cstddef>
#include <optional>
#include <string>

namespace authgate {
namespace errors {

// Categorization of errors surfaced through completions and retry verdicts.
enum class ErrorCategory {
    MissingCredential,
    ExcessiveRefresh,
    RefreshFailed,
    Transport,
    HttpStatus,
    InvalidTokenResponse,
    Unknown
};

// Stable numeric codes, one per category.
namespace ErrorCodes {
    static constexpr int MissingCredential = -32101;
    static constexpr int ExcessiveRefresh = -32102;
    static constexpr int RefreshFailed = -32103;
    static constexpr int Transport = -32110;
    static constexpr int HttpStatus = -32111;
    static constexpr int InvalidTokenResponse = -32112;
    static constexpr int Unknown = -32199;
}

//==========================================================================================================
// errorCategoryName
// Purpose: Short, stable name for an ErrorCategory (used in logs and toString()).
//==========================================================================================================
inline const char* errorCategoryName(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::MissingCredential: return "missingCredential";
        case ErrorCategory::ExcessiveRefresh: return "excessiveRefresh";
        case ErrorCategory::RefreshFailed: return "refreshFailed";
        case ErrorCategory::Transport: return "transport";
        case ErrorCategory::HttpStatus: return "httpStatus";
        case ErrorCategory::InvalidTokenResponse: return "invalidTokenResponse";
        default: return "unknown";
    }
}

// Map a numeric code back to its ErrorCategory; Unknown when unmapped.
inline ErrorCategory errorCategoryFromCode(int code) {
    switch (code) {
        case ErrorCodes::MissingCredential: return ErrorCategory::MissingCredential;
        case ErrorCodes::ExcessiveRefresh: return ErrorCategory::ExcessiveRefresh;
        case ErrorCodes::RefreshFailed: return ErrorCategory::RefreshFailed;
        case ErrorCodes::Transport: return ErrorCategory::Transport;
        case ErrorCodes::HttpStatus: return ErrorCategory::HttpStatus;
        case ErrorCodes::InvalidTokenResponse: return ErrorCategory::InvalidTokenResponse;
        default: return ErrorCategory::Unknown;
    }
}

//==========================================================================================================
// AuthError
// Purpose: Error value carried by Result<T> and RetryVerdict.
// Fields:
//   category: Classification of the failure.
//   code: Numeric code (see ErrorCodes).
//   message: Human-readable description.
//   httpStatus: HTTP status of the response that caused the error, when there was one.
//==========================================================================================================
struct AuthError {
    ErrorCategory category{ErrorCategory::Unknown};
    int code{ErrorCodes::Unknown};
    std::string message;
    std::optional<int> httpStatus;

    std::string toString() const {
        std::string s = std::string(errorCategoryName(category)) + " (" + std::to_string(code) + ")";
        if (httpStatus.has_value()) {
            s += " status=" + std::to_string(httpStatus.value());
        }
        if (!message.empty()) {
            s += ": " + message;
        }
        return s;
    }
};

inline bool operator==(const AuthError& a, const AuthError& b) {
    return a.category == b.category && a.code == b.code && a.message == b.message && a.httpStatus == b.httpStatus;
}

inline bool operator!=(const AuthError& a, const AuthError& b) {
    return !(a == b);
}

//==========================================================================================================
// makeError
// Purpose: Builds an AuthError whose code matches the category.
//==========================================================================================================
inline AuthError makeError(ErrorCategory category, std::string message, std::optional<int> httpStatus = std::nullopt) {
    AuthError e;
    e.category = category;
    switch (category) {
        case ErrorCategory::MissingCredential: e.code = ErrorCodes::MissingCredential; break;
        case ErrorCategory::ExcessiveRefresh: e.code = ErrorCodes::ExcessiveRefresh; break;
        case ErrorCategory::RefreshFailed: e.code = ErrorCodes::RefreshFailed; break;
        case ErrorCategory::Transport: e.code = ErrorCodes::Transport; break;
        case ErrorCategory::HttpStatus: e.code = ErrorCodes::HttpStatus; break;
        case ErrorCategory::InvalidTokenResponse: e.code = ErrorCodes::InvalidTokenResponse; break;
        default: e.code = ErrorCodes::Unknown; break;
    }
    e.message = std::move(message);
    e.httpStatus = httpStatus;
    return e;
}

// No credential was set when one was required.
inline AuthError makeMissingCredentialError() {
    return makeError(ErrorCategory::MissingCredential, "No credential is available to authenticate the request");
}

// The refresh rate limit rejected a refresh attempt.
inline AuthError makeExcessiveRefreshError(std::size_t countInWindow, std::size_t allowed) {
    return makeError(ErrorCategory::ExcessiveRefresh,
                     "Refresh rejected: " + std::to_string(countInWindow) + " refreshes inside the safety window (allowed " +
                         std::to_string(allowed) + ")");
}

} // namespace errors
} // namespace authgate
