#pragma once

#include "json.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace courier::types {

/// A user or bot account
struct user {
    int64_t id = 0;
    bool is_bot = false;
    std::string first_name;
    std::optional<std::string> last_name;
    std::optional<std::string> username;
    std::optional<std::string> language_code;

    bool operator==(const user&) const = default;
};

inline void from_json(const nlohmann::json& j, user& u) {
    j.at("id").get_to(u.id);
    j.at("is_bot").get_to(u.is_bot);
    j.at("first_name").get_to(u.first_name);
    detail::read_optional(j, "last_name", u.last_name);
    detail::read_optional(j, "username", u.username);
    detail::read_optional(j, "language_code", u.language_code);
}

inline void to_json(nlohmann::json& j, const user& u) {
    j = nlohmann::json{{"id", u.id}, {"is_bot", u.is_bot}, {"first_name", u.first_name}};
    detail::write_optional(j, "last_name", u.last_name);
    detail::write_optional(j, "username", u.username);
    detail::write_optional(j, "language_code", u.language_code);
}

} // namespace courier::types
