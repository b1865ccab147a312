#pragma once

#include "chat.hpp"
#include "user.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace courier::types {

/// A message; only the members needed by the supported methods are decoded
struct message {
    int32_t message_id = 0;
    std::optional<int32_t> message_thread_id;
    int64_t date = 0;   // Unix time
    types::chat chat;
    std::optional<user> from;
    std::optional<std::string> text;
    std::optional<int64_t> edit_date;

    bool operator==(const message&) const = default;
};

inline void from_json(const nlohmann::json& j, message& m) {
    j.at("message_id").get_to(m.message_id);
    detail::read_optional(j, "message_thread_id", m.message_thread_id);
    j.at("date").get_to(m.date);
    j.at("chat").get_to(m.chat);
    detail::read_optional(j, "from", m.from);
    detail::read_optional(j, "text", m.text);
    detail::read_optional(j, "edit_date", m.edit_date);
}

} // namespace courier::types
