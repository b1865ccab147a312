#pragma once

#include "payload.hpp"

#include <courier/types/chat_id.hpp>
#include <courier/types/message.hpp>
#include <courier/types/parse_mode.hpp>

#include <cstdint>
#include <string>
#include <string_view>

namespace courier::payloads {

/// Use this method to send text messages. On success, the sent message is
/// returned.
struct send_message {
    using output_type = types::message;
    static constexpr std::string_view method_name = "sendMessage";

    /// Unique identifier for the target chat or username of the target
    /// channel (in the format `@channelusername`)
    types::chat_id chat_id;
    /// Text of the message to be sent, 1-4096 characters after entities parsing
    std::string text;
    /// Unique identifier for the target message thread (topic) of the forum;
    /// for forum supergroups only
    COURIER_OPTIONAL_FIELD(send_message, int32_t, message_thread_id)
    /// Mode for parsing entities in the message text
    COURIER_OPTIONAL_FIELD(send_message, types::parse_mode, parse_mode)
    /// Disables link previews for links in this message
    COURIER_OPTIONAL_FIELD(send_message, bool, disable_web_page_preview)
    /// Sends the message silently. Users will receive a notification with no sound.
    COURIER_OPTIONAL_FIELD(send_message, bool, disable_notification)
    /// Protects the contents of sent messages from forwarding and saving
    COURIER_OPTIONAL_FIELD(send_message, bool, protect_content)
    /// If the message is a reply, ID of the original message
    COURIER_OPTIONAL_FIELD(send_message, int32_t, reply_to_message_id)
    /// Pass true if the message should be sent even if the specified
    /// replied-to message is not found
    COURIER_OPTIONAL_FIELD(send_message, bool, allow_sending_without_reply)

    send_message(types::chat_id chat, std::string message_text)
        : chat_id(std::move(chat)), text(std::move(message_text)) {}

    bool operator==(const send_message&) const = default;

    COURIER_PAYLOAD_FIELDS(send_message, chat_id, text, message_thread_id, parse_mode,
                           disable_web_page_preview, disable_notification, protect_content,
                           reply_to_message_id, allow_sending_without_reply)
};

} // namespace courier::payloads
