#pragma once

#include "errors.hpp"

#include <utility>
#include <variant>

namespace courier {

/// Outcome of a request: the decoded output or a `request_error`
template<typename T>
class request_result {
public:
    using value_type = T;

    /// Construct success result
    explicit request_result(T value)
        : state_(std::in_place_index<0>, std::move(value)) {}

    /// Construct error result
    explicit request_result(request_error err)
        : state_(std::in_place_index<1>, std::move(err)) {}

    /// Check if successful
    bool ok() const noexcept { return state_.index() == 0; }
    explicit operator bool() const noexcept { return ok(); }

    /// Get error (kind `success` when the result holds a value)
    const request_error& error() const noexcept {
        static const request_error none;
        return ok() ? none : std::get<1>(state_);
    }

    /// Get value (throws request_failure if error)
    T& value() & {
        if (!ok()) throw request_failure(std::get<1>(state_));
        return std::get<0>(state_);
    }
    const T& value() const& {
        if (!ok()) throw request_failure(std::get<1>(state_));
        return std::get<0>(state_);
    }
    T&& value() && {
        if (!ok()) throw request_failure(std::get<1>(state_));
        return std::get<0>(std::move(state_));
    }

    /// Get value or default
    template<typename U>
    T value_or(U&& default_value) const& {
        return ok() ? std::get<0>(state_) : static_cast<T>(std::forward<U>(default_value));
    }

    /// Access value (undefined if error)
    T* operator->() { return std::get_if<0>(&state_); }
    const T* operator->() const { return std::get_if<0>(&state_); }
    T& operator*() & { return *std::get_if<0>(&state_); }
    const T& operator*() const& { return *std::get_if<0>(&state_); }
    T&& operator*() && { return std::move(*std::get_if<0>(&state_)); }

    bool operator==(const request_result&) const = default;

private:
    std::variant<T, request_error> state_;
};

} // namespace courier
