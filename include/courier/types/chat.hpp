#pragma once

#include "json.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace courier::types {

/// A private chat, group, supergroup or channel
struct chat {
    int64_t id = 0;
    std::string type;   // "private", "group", "supergroup" or "channel"
    std::optional<std::string> title;
    std::optional<std::string> username;
    std::optional<std::string> first_name;
    std::optional<std::string> last_name;
    std::optional<std::string> description;
    std::optional<std::string> invite_link;

    [[nodiscard]] bool is_private() const noexcept { return type == "private"; }
    [[nodiscard]] bool is_channel() const noexcept { return type == "channel"; }

    bool operator==(const chat&) const = default;
};

inline void from_json(const nlohmann::json& j, chat& c) {
    j.at("id").get_to(c.id);
    j.at("type").get_to(c.type);
    detail::read_optional(j, "title", c.title);
    detail::read_optional(j, "username", c.username);
    detail::read_optional(j, "first_name", c.first_name);
    detail::read_optional(j, "last_name", c.last_name);
    detail::read_optional(j, "description", c.description);
    detail::read_optional(j, "invite_link", c.invite_link);
}

inline void to_json(nlohmann::json& j, const chat& c) {
    j = nlohmann::json{{"id", c.id}, {"type", c.type}};
    detail::write_optional(j, "title", c.title);
    detail::write_optional(j, "username", c.username);
    detail::write_optional(j, "first_name", c.first_name);
    detail::write_optional(j, "last_name", c.last_name);
    detail::write_optional(j, "description", c.description);
    detail::write_optional(j, "invite_link", c.invite_link);
}

} // namespace courier::types
