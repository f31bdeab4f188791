//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Result.h
// Purpose: Value-or-AuthError result type passed to adapt and refresh completions
//==========================================================================================================

#pragma once

#include <stdexcept>
#include <utility>
#include <variant>

#include "authgate/errors/Errors.h"

namespace authgate {

//==========================================================================================================
// Result<T>
// Purpose: Holds either a T or an errors::AuthError. Completions receive exactly one of these.
//==========================================================================================================
template <typename T>
class Result {
public:
    static Result success(T value) { return Result(std::in_place_index<0>, std::move(value)); }
    static Result failure(errors::AuthError error) { return Result(std::in_place_index<1>, std::move(error)); }

    bool ok() const noexcept { return state.index() == 0; }
    explicit operator bool() const noexcept { return ok(); }

    // Throws std::logic_error when called on the wrong alternative.
    T& value() & {
        if (!ok()) { throw std::logic_error("Result::value() called on a failure: " + std::get<1>(state).toString()); }
        return std::get<0>(state);
    }
    const T& value() const& {
        if (!ok()) { throw std::logic_error("Result::value() called on a failure: " + std::get<1>(state).toString()); }
        return std::get<0>(state);
    }
    T&& value() && {
        if (!ok()) { throw std::logic_error("Result::value() called on a failure: " + std::get<1>(state).toString()); }
        return std::get<0>(std::move(state));
    }

    const errors::AuthError& error() const {
        if (ok()) { throw std::logic_error("Result::error() called on a success"); }
        return std::get<1>(state);
    }

private:
    template <std::size_t I, typename U>
    Result(std::in_place_index_t<I> idx, U&& u) : state(idx, std::forward<U>(u)) {}

    std::variant<T, errors::AuthError> state;
};

} // namespace authgate
