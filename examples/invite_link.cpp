/// @file invite_link.cpp
/// @brief Invite link lifecycle example
///
/// Creates an invite link that expires in an hour and admits ten members,
/// raises its member limit, then revokes it.
///
/// Usage: COURIER_TOKEN=<token> ./invite_link <chat id or @channel>
/// Set COURIER_LOG_LEVEL=debug|info|warn|error to change the log level.

#include <courier/courier.hpp>
#include <courier/net/http_transport.hpp>

#include <chrono>
#include <cstdlib>
#include <exception>
#include <iostream>
#include <string>

using namespace courier;

/// Parse the command line chat argument
types::chat_id parse_chat(const std::string& arg) {
    if (!arg.empty() && arg.front() == '@') {
        return types::chat_id(arg);
    }
    return types::chat_id(std::stoll(arg));
}

coro::task<int> run(bot b, types::chat_id chat) {
    auto expires = std::chrono::system_clock::now() + std::chrono::hours(1);

    auto create = b.create_chat_invite_link(chat);
    create->set_expire_date(std::chrono::system_clock::to_time_t(expires))
           .set_member_limit(10u);

    auto created = co_await std::move(create).send();
    if (!created) {
        COURIER_LOG_ERROR("createChatInviteLink: {}", created.error().to_string());
        co_return 1;
    }
    COURIER_LOG_INFO("created {} (limit {})", created->invite_link, created->member_limit.value_or(0));

    auto edit = b.edit_chat_invite_link(chat, created->invite_link);
    edit->set_member_limit(20u);
    auto edited = co_await std::move(edit).send();
    if (!edited) {
        COURIER_LOG_ERROR("editChatInviteLink: {}", edited.error().to_string());
        co_return 1;
    }
    COURIER_LOG_INFO("raised limit to {}", edited->member_limit.value_or(0));

    auto revoked = co_await b.revoke_chat_invite_link(chat, created->invite_link).send();
    if (!revoked) {
        COURIER_LOG_ERROR("revokeChatInviteLink: {}", revoked.error().to_string());
        co_return 1;
    }
    COURIER_LOG_INFO("revoked: {}", revoked->is_revoked);
    co_return 0;
}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        std::cerr << "Usage: " << argv[0] << " <chat id or @channel>" << std::endl;
        return 1;
    }

    if (const char* name = std::getenv("COURIER_LOG_LEVEL")) {
        if (auto lvl = log::level_from_string(name)) {
            log::logger::instance().set_level(*lvl);
        } else {
            COURIER_LOG_WARNING("unknown log level '{}', keeping info", name);
        }
    }

    try {
        auto chat = parse_chat(argv[1]);
        bot b(std::make_shared<net::http_transport>(net::transport_config::from_env()));
        return coro::sync_wait(run(b, chat));
    } catch (const std::exception& e) {
        COURIER_LOG_ERROR("{}", e.what());
        return 1;
    }
}
