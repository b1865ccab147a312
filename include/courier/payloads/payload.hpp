#pragma once

/// @file payload.hpp
/// @brief Payload declaration helpers, output binding and wire encoding
///
/// A payload is a plain value type describing one remote method call.
/// Required fields are constructor parameters; optional fields are
/// `std::optional` members with chainable setters. The field list drives
/// encoding and hashing.
///
/// Usage:
/// @code
/// struct create_chat_invite_link {
///     using output_type = types::chat_invite_link;
///     static constexpr std::string_view method_name = "createChatInviteLink";
///
///     types::chat_id chat_id;
///     COURIER_OPTIONAL_FIELD(create_chat_invite_link, int64_t, expire_date)
///     COURIER_OPTIONAL_FIELD(create_chat_invite_link, uint32_t, member_limit)
///
///     explicit create_chat_invite_link(types::chat_id chat) : chat_id(std::move(chat)) {}
///     bool operator==(const create_chat_invite_link&) const = default;
///
///     COURIER_PAYLOAD_FIELDS(create_chat_invite_link, chat_id, expire_date, member_limit)
/// };
/// @endcode

#include <courier/requests/errors.hpp>
#include <courier/requests/result.hpp>

#include <nlohmann/json.hpp>

#include <concepts>
#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <tuple>
#include <type_traits>
#include <utility>

namespace courier {

// ============================================================================
// Field introspection
// ============================================================================

/// Marker type to detect if a struct has payload field definitions
struct payload_fields_marker {};

/// Field descriptor for compile-time reflection
template<typename T, typename Class>
struct field_descriptor {
    using value_type = T;
    using class_type = Class;

    T Class::* ptr;
    const char* name;

    constexpr field_descriptor(T Class::* p, const char* n) : ptr(p), name(n) {}

    const T& get(const Class& obj) const { return obj.*ptr; }
    T& get(Class& obj) const { return obj.*ptr; }
};

/// Helper to create field descriptor
template<typename T, typename Class>
constexpr auto make_field(T Class::* ptr, const char* name) {
    return field_descriptor<T, Class>{ptr, name};
}

namespace detail {

/// Implicit conversion that is not narrowing: `To{from}` must be well formed
template<typename From, typename To>
concept converts_without_narrowing = std::convertible_to<From, To> && requires(From&& from) {
    To{std::forward<From>(from)};
};

} // namespace detail

// ============================================================================
// Payload concept and output binding
// ============================================================================

/// A payload names its remote method, its output type and its fields, and is
/// a comparable value
template<typename P>
concept payload = std::copyable<P> && std::equality_comparable<P> && requires {
    typename P::output_type;
    typename P::_courier_fields_tag;
    { P::method_name } -> std::convertible_to<std::string_view>;
    P::_courier_get_fields();
};

/// Type a payload decodes to on success
template<payload P>
using output_t = typename P::output_type;

// ============================================================================
// Encoding
// ============================================================================

namespace detail {

template<typename T>
void put_field(nlohmann::json& j, const char* name, const T& value) {
    j[name] = value;
}

/// Unset optional fields are omitted, never written as null
template<typename T>
void put_field(nlohmann::json& j, const char* name, const std::optional<T>& value) {
    if (value) {
        j[name] = *value;
    }
}

inline void hash_combine(size_t& seed, size_t h) noexcept {
    seed ^= h + 0x9e3779b97f4a7c15ULL + (seed << 6) + (seed >> 2);
}

template<typename T>
size_t hash_field(const T& value) {
    return std::hash<T>{}(value);
}

template<typename T>
size_t hash_field(const std::optional<T>& value) {
    return value ? hash_field(*value) ^ 0x5bd1e995ULL : 0;
}

} // namespace detail

/// Build the JSON object for a payload
template<payload P>
nlohmann::json to_json_object(const P& p) {
    auto j = nlohmann::json::object();
    std::apply([&](const auto&... field) {
        (detail::put_field(j, field.name, field.get(p)), ...);
    }, P::_courier_get_fields());
    return j;
}

/// Encode a payload into the request body
/// @return JSON text, or an `io` error if a field cannot be encoded
///         (for example a string that is not valid UTF-8)
template<payload P>
request_result<std::string> encode_payload(const P& p) {
    try {
        return request_result<std::string>(to_json_object(p).dump());
    } catch (const nlohmann::json::exception& e) {
        return request_result<std::string>(request_error::io_failure(
            fmt::format("failed to encode {}: {}", P::method_name, e.what())));
    }
}

// ============================================================================
// Hashing
// ============================================================================

/// Hash over every field, including the set/unset state of optional fields.
/// Consistent with the payload's operator==.
struct payload_hash {
    template<payload P>
    size_t operator()(const P& p) const {
        size_t seed = std::hash<std::string_view>{}(P::method_name);
        std::apply([&](const auto&... field) {
            (detail::hash_combine(seed, detail::hash_field(field.get(p))), ...);
        }, P::_courier_get_fields());
        return seed;
    }
};

} // namespace courier

// ============================================================================
// Macros for payload declaration
// ============================================================================

/// Internal helper macros
#define _COURIER_FIELD_IMPL(Class, field) \
    ::courier::make_field(&Class::field, #field)

#define _COURIER_EXPAND(x) x

// FOR_EACH macros that pass Class through
#define _COURIER_FOR_EACH_1(Class, macro, x) macro(Class, x)
#define _COURIER_FOR_EACH_2(Class, macro, x, ...) macro(Class, x), _COURIER_EXPAND(_COURIER_FOR_EACH_1(Class, macro, __VA_ARGS__))
#define _COURIER_FOR_EACH_3(Class, macro, x, ...) macro(Class, x), _COURIER_EXPAND(_COURIER_FOR_EACH_2(Class, macro, __VA_ARGS__))
#define _COURIER_FOR_EACH_4(Class, macro, x, ...) macro(Class, x), _COURIER_EXPAND(_COURIER_FOR_EACH_3(Class, macro, __VA_ARGS__))
#define _COURIER_FOR_EACH_5(Class, macro, x, ...) macro(Class, x), _COURIER_EXPAND(_COURIER_FOR_EACH_4(Class, macro, __VA_ARGS__))
#define _COURIER_FOR_EACH_6(Class, macro, x, ...) macro(Class, x), _COURIER_EXPAND(_COURIER_FOR_EACH_5(Class, macro, __VA_ARGS__))
#define _COURIER_FOR_EACH_7(Class, macro, x, ...) macro(Class, x), _COURIER_EXPAND(_COURIER_FOR_EACH_6(Class, macro, __VA_ARGS__))
#define _COURIER_FOR_EACH_8(Class, macro, x, ...) macro(Class, x), _COURIER_EXPAND(_COURIER_FOR_EACH_7(Class, macro, __VA_ARGS__))
#define _COURIER_FOR_EACH_9(Class, macro, x, ...) macro(Class, x), _COURIER_EXPAND(_COURIER_FOR_EACH_8(Class, macro, __VA_ARGS__))
#define _COURIER_FOR_EACH_10(Class, macro, x, ...) macro(Class, x), _COURIER_EXPAND(_COURIER_FOR_EACH_9(Class, macro, __VA_ARGS__))
#define _COURIER_FOR_EACH_11(Class, macro, x, ...) macro(Class, x), _COURIER_EXPAND(_COURIER_FOR_EACH_10(Class, macro, __VA_ARGS__))
#define _COURIER_FOR_EACH_12(Class, macro, x, ...) macro(Class, x), _COURIER_EXPAND(_COURIER_FOR_EACH_11(Class, macro, __VA_ARGS__))

#define _COURIER_GET_MACRO(_1,_2,_3,_4,_5,_6,_7,_8,_9,_10,_11,_12,NAME,...) NAME
#define _COURIER_FOR_EACH(Class, macro, ...) \
    _COURIER_EXPAND(_COURIER_GET_MACRO(__VA_ARGS__, \
        _COURIER_FOR_EACH_12, _COURIER_FOR_EACH_11, _COURIER_FOR_EACH_10, _COURIER_FOR_EACH_9, \
        _COURIER_FOR_EACH_8, _COURIER_FOR_EACH_7, _COURIER_FOR_EACH_6, _COURIER_FOR_EACH_5, \
        _COURIER_FOR_EACH_4, _COURIER_FOR_EACH_3, _COURIER_FOR_EACH_2, _COURIER_FOR_EACH_1) \
    (Class, macro, __VA_ARGS__))

/// Define the encoded fields of a payload
/// @param ClassName The name of the enclosing struct
/// @param ... The field names; the member name is the wire name. The encoded
///        object lists its keys sorted by name, whatever the order here.
#define COURIER_PAYLOAD_FIELDS(ClassName, ...) \
    using _courier_fields_tag = ::courier::payload_fields_marker; \
    static constexpr auto _courier_get_fields() { \
        return std::make_tuple(_COURIER_FOR_EACH(ClassName, _COURIER_FIELD_IMPL, __VA_ARGS__)); \
    }

/// Define a payload with no fields
#define COURIER_PAYLOAD_EMPTY_FIELDS(ClassName) \
    using _courier_fields_tag = ::courier::payload_fields_marker; \
    static constexpr auto _courier_get_fields() { \
        return std::make_tuple(); \
    }

/// Declare an optional field with chainable setters
///
/// `set_<name>(v)` accepts anything `Type` converts to without narrowing
/// (`Type{v}` must be well formed) and returns the payload (an lvalue
/// reference on lvalues, an rvalue on temporaries). A negative `int` for an
/// unsigned field or a `double` for an integer field does not compile.
/// `reset_<name>()` clears the field.
#define COURIER_OPTIONAL_FIELD(ClassName, Type, name) \
    std::optional<Type> name; \
    template<typename U> \
        requires ::courier::detail::converts_without_narrowing<U&&, Type> \
    ClassName& set_##name(U&& value) & { \
        name.emplace(std::forward<U>(value)); \
        return *this; \
    } \
    template<typename U> \
        requires ::courier::detail::converts_without_narrowing<U&&, Type> \
    ClassName&& set_##name(U&& value) && { \
        name.emplace(std::forward<U>(value)); \
        return std::move(*this); \
    } \
    ClassName& reset_##name() & { \
        name.reset(); \
        return *this; \
    } \
    ClassName&& reset_##name() && { \
        name.reset(); \
        return std::move(*this); \
    }
