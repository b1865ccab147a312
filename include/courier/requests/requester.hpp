#pragma once

/// @file requester.hpp
/// @brief Named request constructors shared by bots and bot wrappers
///
/// A requester is anything with a `request(P)` member turning a payload into
/// a request. Deriving from `requester_mixin` adds one named method per
/// supported Bot API method, so wrappers get the full surface by providing
/// `request` alone.

#include "request.hpp"

#include <courier/payloads/payloads.hpp>

#include <concepts>
#include <string>
#include <utility>

namespace courier {

/// Anything that builds requests from payloads
template<typename B>
concept requester = std::copyable<B> && requires(const B& b) {
    { b.request(payloads::get_me{}) } -> request;
    { b.request(payloads::send_message{0, std::string{}}) } -> request;
};

/// Request type a requester builds for payload P
template<typename B, payload P>
using request_t = decltype(std::declval<const B&>().request(std::declval<P>()));

template<typename Derived>
class requester_mixin {
public:
    auto get_me() const {
        return self().request(payloads::get_me{});
    }

    auto send_message(types::chat_id chat_id, std::string text) const {
        return self().request(payloads::send_message(std::move(chat_id), std::move(text)));
    }

    auto get_chat(types::chat_id chat_id) const {
        return self().request(payloads::get_chat(std::move(chat_id)));
    }

    auto delete_message(types::chat_id chat_id, int32_t message_id) const {
        return self().request(payloads::delete_message(std::move(chat_id), message_id));
    }

    auto export_chat_invite_link(types::chat_id chat_id) const {
        return self().request(payloads::export_chat_invite_link(std::move(chat_id)));
    }

    auto create_chat_invite_link(types::chat_id chat_id) const {
        return self().request(payloads::create_chat_invite_link(std::move(chat_id)));
    }

    auto edit_chat_invite_link(types::chat_id chat_id, std::string invite_link) const {
        return self().request(payloads::edit_chat_invite_link(std::move(chat_id), std::move(invite_link)));
    }

    auto revoke_chat_invite_link(types::chat_id chat_id, std::string invite_link) const {
        return self().request(payloads::revoke_chat_invite_link(std::move(chat_id), std::move(invite_link)));
    }

private:
    const Derived& self() const noexcept { return static_cast<const Derived&>(*this); }
};

} // namespace courier
