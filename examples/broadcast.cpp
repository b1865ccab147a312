/// @file broadcast.cpp
/// @brief Send one message to several chats with a single request
///
/// Builds the message once and sends it by reference, changing only the
/// target chat between sends. Requests are traced, `get_me` is cached and
/// messages default to HTML formatting.
///
/// Usage: COURIER_TOKEN=<token> ./broadcast <text> <chat id>...

#include <courier/courier.hpp>
#include <courier/net/http_transport.hpp>

#include <cstdint>
#include <exception>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

using namespace courier;

template<requester B>
coro::task<int> broadcast(B sender, std::string text, std::vector<int64_t> chats) {
    auto me = co_await sender.get_me().send();
    if (!me) {
        COURIER_LOG_ERROR("getMe: {}", me.error().to_string());
        co_return 1;
    }
    COURIER_LOG_INFO("broadcasting as @{}", me->username.value_or(me->first_name));

    int failures = 0;
    auto req = sender.send_message(0, std::move(text));
    req->set_disable_web_page_preview(true);

    for (auto chat : chats) {
        req->chat_id = chat;
        auto sent = co_await req.send_ref();

        // One retry after flood control
        if (!sent && sent.error().kind() == error_kind::retry_after) {
            std::this_thread::sleep_for(*sent.error().retry_after());
            sent = co_await req.send_ref();
        }

        if (!sent && sent.error().kind() == error_kind::migrate_to_chat_id) {
            req->chat_id = *sent.error().migrate_to_chat_id();
            sent = co_await req.send_ref();
        }

        if (!sent) {
            ++failures;
            continue;
        }
        COURIER_LOG_INFO("sent message {} to {}", sent->message_id, sent->chat.id);
    }

    co_return failures == 0 ? 0 : 2;
}

int main(int argc, char* argv[]) {
    if (argc < 3) {
        std::cerr << "Usage: " << argv[0] << " <text> <chat id>..." << std::endl;
        return 1;
    }

    try {
        std::vector<int64_t> chats;
        for (int i = 2; i < argc; ++i) {
            chats.push_back(std::stoll(argv[i]));
        }

        bot b(std::make_shared<net::http_transport>(net::transport_config::from_env()));
        auto stack = adaptors::trace(
            adaptors::cache_me(adaptors::default_parse_mode(b, types::parse_mode::html)),
            {.requests = true, .responses = true, .log_level = log::level::info});

        return coro::sync_wait(broadcast(stack, argv[1], std::move(chats)));
    } catch (const std::exception& e) {
        COURIER_LOG_ERROR("{}", e.what());
        return 1;
    }
}
