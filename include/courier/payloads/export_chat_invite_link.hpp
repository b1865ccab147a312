#pragma once

#include "payload.hpp"

#include <courier/types/chat_id.hpp>

#include <string>
#include <string_view>

namespace courier::payloads {

/// Use this method to generate a new primary invite link for a chat; any
/// previously generated primary link is revoked. Returns the new invite link
/// as a string.
struct export_chat_invite_link {
    using output_type = std::string;
    static constexpr std::string_view method_name = "exportChatInviteLink";

    types::chat_id chat_id;

    explicit export_chat_invite_link(types::chat_id chat) : chat_id(std::move(chat)) {}

    bool operator==(const export_chat_invite_link&) const = default;

    COURIER_PAYLOAD_FIELDS(export_chat_invite_link, chat_id)
};

} // namespace courier::payloads
