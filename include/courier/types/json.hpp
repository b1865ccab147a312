#pragma once

#include <nlohmann/json.hpp>

#include <optional>

namespace courier::types::detail {

/// Read an optional response member; a missing key or `null` leaves it unset
template<typename T>
void read_optional(const nlohmann::json& j, const char* key, std::optional<T>& out) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        out.reset();
        return;
    }
    out = it->template get<T>();
}

/// Read a boolean member that the server omits when false
inline bool read_flag(const nlohmann::json& j, const char* key) {
    auto it = j.find(key);
    return it != j.end() && it->is_boolean() && it->get<bool>();
}

/// Write an optional member only when it is set
template<typename T>
void write_optional(nlohmann::json& j, const char* key, const std::optional<T>& value) {
    if (value) {
        j[key] = *value;
    }
}

} // namespace courier::types::detail
