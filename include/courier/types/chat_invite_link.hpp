#pragma once

#include "user.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace courier::types {

/// An invite link for a chat
struct chat_invite_link {
    /// The invite link. If created by another administrator, the second
    /// part of the link is replaced with "..."
    std::string invite_link;
    user creator;
    bool creates_join_request = false;
    bool is_primary = false;
    bool is_revoked = false;
    std::optional<std::string> name;
    std::optional<int64_t> expire_date;     // Unix time
    std::optional<uint32_t> member_limit;   // 1-99999
    std::optional<uint32_t> pending_join_request_count;

    bool operator==(const chat_invite_link&) const = default;
};

inline void from_json(const nlohmann::json& j, chat_invite_link& l) {
    j.at("invite_link").get_to(l.invite_link);
    j.at("creator").get_to(l.creator);
    l.creates_join_request = detail::read_flag(j, "creates_join_request");
    j.at("is_primary").get_to(l.is_primary);
    j.at("is_revoked").get_to(l.is_revoked);
    detail::read_optional(j, "name", l.name);
    detail::read_optional(j, "expire_date", l.expire_date);
    detail::read_optional(j, "member_limit", l.member_limit);
    detail::read_optional(j, "pending_join_request_count", l.pending_join_request_count);
}

} // namespace courier::types
