#pragma once

/// @file errors.hpp
/// @brief Error values produced while sending a request
///
/// Every failure that can happen between driving a request future and
/// decoding its result is described by a `request_error` value:
/// - `io`: the payload could not be encoded
/// - `network`: the transport could not complete the call
/// - `invalid_json`: the response body is not the expected JSON
/// - `api`: the server answered with `"ok": false`
/// - `retry_after` / `migrate_to_chat_id`: structured server failures that
///   carry an instruction for the caller
///
/// Construction-time validation failures are not request errors; they throw
/// `invalid_field` from the constructor of the offending value.

#include <fmt/format.h>

#include <chrono>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

namespace courier {

/// Error categories for request failures
enum class error_kind : uint32_t {
    success = 0,
    api = 1,
    migrate_to_chat_id = 2,
    retry_after = 3,
    network = 4,
    invalid_json = 5,
    io = 6,
};

/// Convert error kind to string
inline const char* error_kind_str(error_kind kind) noexcept {
    switch (kind) {
        case error_kind::success: return "success";
        case error_kind::api: return "api error";
        case error_kind::migrate_to_chat_id: return "migrate to chat id";
        case error_kind::retry_after: return "retry after";
        case error_kind::network: return "network error";
        case error_kind::invalid_json: return "invalid json";
        case error_kind::io: return "io error";
        default: return "unknown error";
    }
}

/// Failure reported by the server in the response envelope
struct api_error {
    int32_t error_code = 0;
    std::string description;

    bool operator==(const api_error&) const = default;
};

/// Any failure that can occur while attempting a call
class request_error {
public:
    request_error() = default;

    request_error(error_kind kind, std::string message)
        : kind_(kind), message_(std::move(message)) {}

    static request_error from_api(api_error err) {
        request_error e(error_kind::api, err.description);
        e.api_ = std::move(err);
        return e;
    }

    /// The group has been migrated to a supergroup with the given id
    static request_error migrated(int64_t new_chat_id, api_error err) {
        request_error e(error_kind::migrate_to_chat_id, err.description);
        e.api_ = std::move(err);
        e.migrate_to_ = new_chat_id;
        return e;
    }

    /// Flood control; the call may be repeated after `delay`
    static request_error flood(std::chrono::seconds delay, api_error err) {
        request_error e(error_kind::retry_after, err.description);
        e.api_ = std::move(err);
        e.retry_after_ = delay;
        return e;
    }

    static request_error network_failure(std::string message) {
        return request_error(error_kind::network, std::move(message));
    }

    static request_error io_failure(std::string message) {
        return request_error(error_kind::io, std::move(message));
    }

    static request_error bad_json(std::string message, std::string raw) {
        request_error e(error_kind::invalid_json, std::move(message));
        e.raw_ = std::move(raw);
        return e;
    }

    [[nodiscard]] error_kind kind() const noexcept { return kind_; }
    [[nodiscard]] const std::string& message() const noexcept { return message_; }

    [[nodiscard]] const std::optional<api_error>& api() const noexcept { return api_; }
    [[nodiscard]] std::optional<int64_t> migrate_to_chat_id() const noexcept { return migrate_to_; }
    [[nodiscard]] std::optional<std::chrono::seconds> retry_after() const noexcept { return retry_after_; }

    /// Raw response body for `invalid_json` errors
    [[nodiscard]] const std::string& raw_body() const noexcept { return raw_; }

    [[nodiscard]] std::string to_string() const {
        switch (kind_) {
            case error_kind::api:
                return fmt::format("{} {}: {}", error_kind_str(kind_),
                                   api_ ? api_->error_code : 0, message_);
            case error_kind::migrate_to_chat_id:
                return fmt::format("{} {}: {}", error_kind_str(kind_),
                                   migrate_to_.value_or(0), message_);
            case error_kind::retry_after:
                return fmt::format("{} {}s: {}", error_kind_str(kind_),
                                   retry_after_ ? retry_after_->count() : 0, message_);
            default:
                if (message_.empty()) return error_kind_str(kind_);
                return fmt::format("{}: {}", error_kind_str(kind_), message_);
        }
    }

    bool operator==(const request_error&) const = default;

private:
    error_kind kind_ = error_kind::success;
    std::string message_;
    std::optional<api_error> api_;
    std::optional<int64_t> migrate_to_;
    std::optional<std::chrono::seconds> retry_after_;
    std::string raw_;
};

/// Thrown by `request_result::value()` when the result holds an error
class request_failure : public std::runtime_error {
public:
    explicit request_failure(request_error err)
        : std::runtime_error(err.to_string()), error_(std::move(err)) {}

    [[nodiscard]] const request_error& error() const noexcept { return error_; }

private:
    request_error error_;
};

/// Thrown at construction when a required field value is malformed
class invalid_field : public std::invalid_argument {
public:
    invalid_field(const char* field, const std::string& reason)
        : std::invalid_argument(fmt::format("invalid {}: {}", field, reason))
        , field_(field) {}

    [[nodiscard]] const char* field() const noexcept { return field_; }

private:
    const char* field_;
};

} // namespace courier
