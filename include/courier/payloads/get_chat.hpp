#pragma once

#include "payload.hpp"

#include <courier/types/chat.hpp>
#include <courier/types/chat_id.hpp>

#include <string_view>

namespace courier::payloads {

/// Use this method to get up to date information about the chat.
struct get_chat {
    using output_type = types::chat;
    static constexpr std::string_view method_name = "getChat";

    types::chat_id chat_id;

    explicit get_chat(types::chat_id chat) : chat_id(std::move(chat)) {}

    bool operator==(const get_chat&) const = default;

    COURIER_PAYLOAD_FIELDS(get_chat, chat_id)
};

} // namespace courier::payloads
