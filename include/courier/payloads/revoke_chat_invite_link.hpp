#pragma once

#include "payload.hpp"

#include <courier/types/chat_id.hpp>
#include <courier/types/chat_invite_link.hpp>

#include <string>
#include <string_view>

namespace courier::payloads {

/// Use this method to revoke an invite link created by the bot. If the
/// primary link is revoked, a new link is automatically generated. Returns
/// the revoked invite link.
struct revoke_chat_invite_link {
    using output_type = types::chat_invite_link;
    static constexpr std::string_view method_name = "revokeChatInviteLink";

    types::chat_id chat_id;
    std::string invite_link;

    revoke_chat_invite_link(types::chat_id chat, std::string link)
        : chat_id(std::move(chat)), invite_link(std::move(link)) {}

    bool operator==(const revoke_chat_invite_link&) const = default;

    COURIER_PAYLOAD_FIELDS(revoke_chat_invite_link, chat_id, invite_link)
};

} // namespace courier::payloads
