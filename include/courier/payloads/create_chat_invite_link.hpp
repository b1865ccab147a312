#pragma once

#include "payload.hpp"

#include <courier/types/chat_id.hpp>
#include <courier/types/chat_invite_link.hpp>

#include <cstdint>
#include <string_view>

namespace courier::payloads {

/// Use this method to create an additional invite link for a chat. The bot
/// must be an administrator in the chat for this to work and must have the
/// appropriate admin rights. The link can be revoked using
/// `revoke_chat_invite_link`. Returns the new invite link.
struct create_chat_invite_link {
    using output_type = types::chat_invite_link;
    static constexpr std::string_view method_name = "createChatInviteLink";

    /// Unique identifier for the target chat or username of the target
    /// channel (in the format `@channelusername`)
    types::chat_id chat_id;
    /// Point in time (Unix timestamp) when the link will expire
    COURIER_OPTIONAL_FIELD(create_chat_invite_link, int64_t, expire_date)
    /// Maximum number of users that can be members of the chat simultaneously
    /// after joining the chat via this invite link; 1-99999
    COURIER_OPTIONAL_FIELD(create_chat_invite_link, uint32_t, member_limit)

    explicit create_chat_invite_link(types::chat_id chat) : chat_id(std::move(chat)) {}

    bool operator==(const create_chat_invite_link&) const = default;

    COURIER_PAYLOAD_FIELDS(create_chat_invite_link, chat_id, expire_date, member_limit)
};

} // namespace courier::payloads
