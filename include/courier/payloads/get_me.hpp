#pragma once

#include "payload.hpp"

#include <courier/types/user.hpp>

#include <string_view>

namespace courier::payloads {

/// A simple method for testing your bot's auth token. Requires no
/// parameters. Returns basic information about the bot.
struct get_me {
    using output_type = types::user;
    static constexpr std::string_view method_name = "getMe";

    get_me() = default;

    bool operator==(const get_me&) const = default;

    COURIER_PAYLOAD_EMPTY_FIELDS(get_me)
};

} // namespace courier::payloads
