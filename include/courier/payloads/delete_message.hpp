#pragma once

#include "payload.hpp"

#include <courier/types/chat_id.hpp>

#include <cstdint>
#include <string_view>

namespace courier::payloads {

/// Use this method to delete a message, including service messages.
/// A message can only be deleted if it was sent less than 48 hours ago.
/// Returns true on success.
struct delete_message {
    using output_type = bool;
    static constexpr std::string_view method_name = "deleteMessage";

    types::chat_id chat_id;
    int32_t message_id;

    delete_message(types::chat_id chat, int32_t id)
        : chat_id(std::move(chat)), message_id(id) {}

    bool operator==(const delete_message&) const = default;

    COURIER_PAYLOAD_FIELDS(delete_message, chat_id, message_id)
};

} // namespace courier::payloads
