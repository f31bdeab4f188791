//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: WwwAuthenticate.cpp
// Purpose: Parser for HTTP WWW-Authenticate challenges (RFC 7235 auth-params, RFC 6750 Bearer errors)
//==========================================================================================================

#include "authgate/auth/WwwAuthenticate.hpp"

#include <cctype>

namespace authgate::auth {

namespace {

std::string toLower(std::string s) {
    for (char& c : s) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return s;
}

bool isSpace(char c) {
    return c == ' ' || c == '\t';
}

// Cursor over a header value
class Scanner {
public:
    explicit Scanner(const std::string& s) : text(s) {}

    bool atEnd() const { return pos >= text.size(); }
    char peek() const { return text[pos]; }
    void advance() { ++pos; }

    void skipSpaces() {
        while (!atEnd() && isSpace(peek())) {
            ++pos;
        }
    }

    // token = 1*tchar; stops on whitespace, '=', ',' or '"'
    bool token(std::string& out) {
        const std::size_t start = pos;
        while (!atEnd()) {
            const char c = peek();
            if (isSpace(c) || c == '=' || c == ',' || c == '"') {
                break;
            }
            ++pos;
        }
        out = text.substr(start, pos - start);
        return pos > start;
    }

    // quoted-string with backslash escapes; cursor must sit on the opening quote
    bool quoted(std::string& out) {
        out.clear();
        ++pos;
        while (!atEnd()) {
            const char c = peek();
            if (c == '\\') {
                if (pos + 1 >= text.size()) {
                    return false;
                }
                out.push_back(text[pos + 1]);
                pos += 2;
                continue;
            }
            ++pos;
            if (c == '"') {
                return true;
            }
            out.push_back(c);
        }
        return false;
    }

    // Unquoted value up to the next comma, trimmed
    std::string bare() {
        const std::size_t start = pos;
        while (!atEnd() && peek() != ',') {
            ++pos;
        }
        std::size_t b = start;
        std::size_t e = pos;
        while (b < e && isSpace(text[b])) {
            ++b;
        }
        while (e > b && isSpace(text[e - 1])) {
            --e;
        }
        return text.substr(b, e - b);
    }

private:
    const std::string& text;
    std::size_t pos{0};
};

} // namespace

std::optional<WwwAuthChallenge> parseWwwAuthenticate(const std::string& header) {
    Scanner sc(header);
    sc.skipSpaces();

    WwwAuthChallenge out;
    std::string scheme;
    if (!sc.token(scheme)) {
        return std::nullopt;
    }
    out.scheme = toLower(scheme);

    while (true) {
        sc.skipSpaces();
        while (!sc.atEnd() && sc.peek() == ',') {
            sc.advance();
            sc.skipSpaces();
        }
        if (sc.atEnd()) {
            break;
        }

        std::string key;
        if (!sc.token(key)) {
            // token68 or stray quote: nothing further we can attribute to a key
            break;
        }
        key = toLower(key);

        sc.skipSpaces();
        if (sc.atEnd() || sc.peek() != '=') {
            out.params[key] = std::string();
            continue;
        }
        sc.advance();
        sc.skipSpaces();

        std::string value;
        if (!sc.atEnd() && sc.peek() == '"') {
            if (!sc.quoted(value)) {
                return std::nullopt;
            }
        } else {
            value = sc.bare();
        }
        out.params[key] = value;
    }

    return out;
}

bool isInvalidTokenChallenge(const WwwAuthChallenge& challenge) {
    if (challenge.scheme != "bearer") {
        return false;
    }
    auto it = challenge.params.find("error");
    return it != challenge.params.end() && it->second == "invalid_token";
}

} // namespace authgate::auth
