#pragma once

#include "payload.hpp"

#include <courier/types/chat_id.hpp>
#include <courier/types/chat_invite_link.hpp>

#include <cstdint>
#include <string>
#include <string_view>

namespace courier::payloads {

/// Use this method to edit a non-primary invite link created by the bot.
/// Returns the edited invite link.
struct edit_chat_invite_link {
    using output_type = types::chat_invite_link;
    static constexpr std::string_view method_name = "editChatInviteLink";

    types::chat_id chat_id;
    /// The invite link to edit
    std::string invite_link;
    COURIER_OPTIONAL_FIELD(edit_chat_invite_link, int64_t, expire_date)
    COURIER_OPTIONAL_FIELD(edit_chat_invite_link, uint32_t, member_limit)

    edit_chat_invite_link(types::chat_id chat, std::string link)
        : chat_id(std::move(chat)), invite_link(std::move(link)) {}

    bool operator==(const edit_chat_invite_link&) const = default;

    COURIER_PAYLOAD_FIELDS(edit_chat_invite_link, chat_id, invite_link, expire_date, member_limit)
};

} // namespace courier::payloads
