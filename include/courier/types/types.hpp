#pragma once

/// Value types exchanged with the Bot API

#include "chat.hpp"
#include "chat_id.hpp"
#include "chat_invite_link.hpp"
#include "message.hpp"
#include "parse_mode.hpp"
#include "user.hpp"
