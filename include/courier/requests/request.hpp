#pragma once

/// @file request.hpp
/// @brief The request contract
///
/// A request is a payload bound to a transport. It exposes two ways to
/// obtain a future of the call:
///
/// - `std::move(req).send()` consumes the request
/// - `req.send_ref()` leaves it alive, so a field can be changed and the
///   same request sent again
///
/// Both must be lazy: no serialization, no transport call and no other
/// observable work may happen before the returned future is driven.
/// Request wrappers rely on this to decide, inside their own future, whether
/// to forward the call at all. The future from `send_ref` must not refer
/// back to the request object; it may outlive it.
///
/// @code
/// auto req = bot.send_message(0, "Hi there!");
/// for (auto id : chat_ids) {
///     req->chat_id = id;
///     auto sent = co_await req.send_ref();
/// }
/// @endcode

#include "errors.hpp"
#include "future.hpp"
#include "result.hpp"

#include <courier/payloads/payload.hpp>
#include <courier/coro/sync_wait.hpp>

#include <concepts>
#include <type_traits>
#include <utility>

namespace courier {

/// A value exposing a payload for reading and in-place mutation
template<typename R>
concept has_payload = requires(R& r, const R& cr) {
    typename R::payload_type;
    requires payload<typename R::payload_type>;
    { r.payload_mut() } -> std::same_as<typename R::payload_type&>;
    { cr.payload_ref() } -> std::same_as<const typename R::payload_type&>;
};

/// Payload type carried by a request
template<has_payload R>
using payload_of = typename R::payload_type;

/// Awaitable yielding `request_result<Output>`
template<typename F, typename Output>
concept request_future = std::movable<F> &&
    std::same_as<coro::await_result_t<F>, request_result<Output>>;

/// The request contract implemented by concrete requests and by wrappers
template<typename R>
concept request = has_payload<R> && std::movable<R> && requires(R r, const R& cr) {
    typename R::error_type;
    typename R::send_type;
    typename R::send_ref_type;
    requires std::same_as<typename R::error_type, request_error>;
    requires request_future<typename R::send_type, output_t<payload_of<R>>>;
    requires request_future<typename R::send_ref_type, output_t<payload_of<R>>>;
    requires !std::same_as<typename R::send_type, typename R::send_ref_type>;
    { std::move(r).send() } -> std::same_as<typename R::send_type>;
    { cr.send_ref() } -> std::same_as<typename R::send_ref_type>;
};

/// Output type of a request
template<request R>
using request_output_t = output_t<payload_of<R>>;

} // namespace courier
