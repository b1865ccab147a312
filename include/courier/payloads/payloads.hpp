#pragma once

/// Request payloads, one per supported Bot API method

#include "payload.hpp"

#include "create_chat_invite_link.hpp"
#include "delete_message.hpp"
#include "edit_chat_invite_link.hpp"
#include "export_chat_invite_link.hpp"
#include "get_chat.hpp"
#include "get_me.hpp"
#include "revoke_chat_invite_link.hpp"
#include "send_message.hpp"
