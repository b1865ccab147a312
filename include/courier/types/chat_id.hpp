#pragma once

#include <courier/requests/errors.hpp>

#include <nlohmann/json.hpp>

#include <concepts>
#include <cstdint>
#include <functional>
#include <string>
#include <string_view>
#include <type_traits>
#include <variant>

namespace courier::types {

namespace detail {

/// Integer types whose every value is a valid `int64_t` chat id. Excludes
/// `bool`, the character types and unsigned types as wide as `int64_t`.
template<typename I>
concept chat_integer = std::integral<I>
    && !std::same_as<I, bool>
    && !std::same_as<I, char> && !std::same_as<I, wchar_t> && !std::same_as<I, char8_t>
    && !std::same_as<I, char16_t> && !std::same_as<I, char32_t>
    && (std::is_signed_v<I> || sizeof(I) < sizeof(int64_t));

} // namespace detail

/// Target chat: a numeric chat id or the `@username` of a public channel
class chat_id {
public:
    /// Numeric id from any integer type that fits `int64_t`
    template<detail::chat_integer I>
    chat_id(I id) noexcept : value_(static_cast<int64_t>(id)) {}

    /// Channel username in the format `@channelusername`
    /// @throws invalid_field if `username` is not `@` followed by a name
    chat_id(std::string username) : value_(validate(std::move(username))) {}
    chat_id(const char* username) : chat_id(std::string(username)) {}

    [[nodiscard]] bool is_id() const noexcept { return value_.index() == 0; }
    [[nodiscard]] bool is_username() const noexcept { return value_.index() == 1; }

    /// Numeric id; throws std::bad_variant_access for usernames
    [[nodiscard]] int64_t id() const { return std::get<0>(value_); }

    /// Username including the leading `@`; throws std::bad_variant_access for ids
    [[nodiscard]] const std::string& username() const { return std::get<1>(value_); }

    bool operator==(const chat_id&) const = default;

    friend void to_json(nlohmann::json& j, const chat_id& c) {
        if (c.is_id()) {
            j = c.id();
        } else {
            j = c.username();
        }
    }

private:
    friend struct std::hash<chat_id>;

    static std::string validate(std::string username) {
        if (username.size() < 2 || username.front() != '@') {
            throw invalid_field("chat_id",
                "expected a numeric id or '@channelusername', got '" + username + "'");
        }
        return username;
    }

    std::variant<int64_t, std::string> value_;
};

} // namespace courier::types

template<>
struct std::hash<courier::types::chat_id> {
    size_t operator()(const courier::types::chat_id& c) const noexcept {
        return std::hash<std::variant<int64_t, std::string>>{}(c.value_);
    }
};
