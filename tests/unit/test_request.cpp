#include <catch2/catch_test_macros.hpp>
#include <courier/bot.hpp>
#include <courier/coro/sync_wait.hpp>

#include "../test_transport.hpp"

#include <memory>
#include <stdexcept>
#include <string>
#include <type_traits>

using namespace courier;
using courier::coro::sync_wait;
using courier::test::ok_envelope;
using courier::test::stub_transport;

// Request contract
static_assert(requester<bot>);
static_assert(request<json_request<payloads::get_me>>);
static_assert(request<json_request<payloads::create_chat_invite_link>>);
static_assert(!std::is_same_v<json_request<payloads::get_me>::send_type,
                              json_request<payloads::get_me>::send_ref_type>);
static_assert(std::is_same_v<request_output_t<json_request<payloads::get_chat>>, types::chat>);
static_assert(std::is_same_v<request_t<bot, payloads::delete_message>, json_request<payloads::delete_message>>);
static_assert(std::is_same_v<coro::await_result_t<send_future<bool>>, request_result<bool>>);
static_assert(!std::is_copy_constructible_v<send_ref_future<bool>>);

namespace {

/// Start a future by hand and return the task driving it
template<typename Future>
auto start(Future future) {
    auto t = std::move(future).into_task();
    t.handle().resume();
    return t;
}

const std::string message_json =
    R"({"message_id":7,"date":1700000000,"chat":{"id":42,"type":"private"},"text":"hi"})";

} // namespace

TEST_CASE("bot requires a transport", "[request][bot]") {
    REQUIRE_THROWS_AS(bot(nullptr), std::invalid_argument);
}

TEST_CASE("requests do nothing until driven", "[request][lazy]") {
    auto stub = std::make_shared<stub_transport>();
    bot b(stub);

    {
        auto req = b.send_message(42, "hi");
        auto by_ref = req.send_ref();
        auto by_value = std::move(req).send();

        REQUIRE_FALSE(by_ref.started());
        REQUIRE_FALSE(by_value.started());
        REQUIRE(stub->call_count() == 0);
    }
    // Dropped without being driven
    REQUIRE(stub->call_count() == 0);
}

TEST_CASE("encoding happens inside the future", "[request][lazy]") {
    auto stub = std::make_shared<stub_transport>();
    bot b(stub);

    // Not valid UTF-8; building the future must not fail
    auto fut = b.send_message(42, std::string("\xc3\x28", 2)).send();
    REQUIRE(stub->call_count() == 0);

    auto r = sync_wait(std::move(fut));
    REQUIRE(r.error().kind() == error_kind::io);
    REQUIRE(stub->call_count() == 0);
}

TEST_CASE("send and send_ref produce the same call", "[request]") {
    auto stub = std::make_shared<stub_transport>();
    stub->respond("createChatInviteLink", ok_envelope(test::invite_link_json));
    bot b(stub);

    auto req = b.create_chat_invite_link(42);
    req->set_expire_date(1700000000);

    auto by_ref = sync_wait(req.send_ref());
    auto by_value = sync_wait(std::move(req).send());

    REQUIRE(by_ref.ok());
    REQUIRE(by_ref == by_value);
    REQUIRE(by_ref->invite_link == "https://t.me/+abc");
    REQUIRE(by_ref->expire_date == 1700000000);

    auto calls = stub->calls();
    REQUIRE(calls.size() == 2);
    REQUIRE(calls[0].method == "createChatInviteLink");
    REQUIRE(calls[0].body == R"({"chat_id":42,"expire_date":1700000000})");
    REQUIRE(calls[0].method == calls[1].method);
    REQUIRE(calls[0].body == calls[1].body);
}

TEST_CASE("send_ref allows changing the request between sends", "[request]") {
    auto stub = std::make_shared<stub_transport>();
    stub->respond("sendMessage", ok_envelope(message_json));
    bot b(stub);

    auto req = b.send_message(1, "hi");
    auto first = req.send_ref();
    req->chat_id = 2;
    auto second = req.send_ref();
    req->set_disable_notification(true);
    auto third = req.send_ref();

    // Each future sends the payload as it was when it was created
    REQUIRE(sync_wait(std::move(third)).ok());
    REQUIRE(sync_wait(std::move(first)).ok());
    REQUIRE(sync_wait(std::move(second)).ok());

    auto calls = stub->calls();
    REQUIRE(calls.size() == 3);
    REQUIRE(calls[0].body == R"({"chat_id":2,"disable_notification":true,"text":"hi"})");
    REQUIRE(calls[1].body == R"({"chat_id":1,"text":"hi"})");
    REQUIRE(calls[2].body == R"({"chat_id":2,"text":"hi"})");
}

TEST_CASE("send_ref future may outlive its request", "[request]") {
    auto stub = std::make_shared<stub_transport>();
    stub->respond("getMe", ok_envelope(test::bot_user_json));

    auto fut = [&] {
        bot b(stub);
        auto req = b.get_me();
        return req.send_ref();
    }();

    auto me = sync_wait(std::move(fut));
    REQUIRE(me.ok());
    REQUIRE(me->username == "courier_bot");
    REQUIRE(stub->call_count() == 1);
}

TEST_CASE("named methods build the matching payloads", "[request][bot]") {
    auto stub = std::make_shared<stub_transport>();
    bot b(stub);

    REQUIRE(b.get_me().payload_ref() == payloads::get_me{});
    REQUIRE(b.get_chat("@news").payload_ref() == payloads::get_chat("@news"));
    REQUIRE(b.delete_message(1, 2).payload_ref() == payloads::delete_message(1, 2));
    REQUIRE(b.export_chat_invite_link(1).payload_ref() == payloads::export_chat_invite_link(1));
    REQUIRE(b.edit_chat_invite_link(1, "l").payload_ref() == payloads::edit_chat_invite_link(1, "l"));
    REQUIRE(b.revoke_chat_invite_link(1, "l").payload_ref() == payloads::revoke_chat_invite_link(1, "l"));
}

TEST_CASE("transport and api failures reach the caller", "[request][errors]") {
    auto stub = std::make_shared<stub_transport>();
    bot b(stub);

    SECTION("network failure") {
        stub->fail_with(request_error::network_failure("connect: Connection refused"));
        auto r = sync_wait(b.delete_message(1, 2).send());
        REQUIRE(r.error().kind() == error_kind::network);
        REQUIRE(r.error().message() == "connect: Connection refused");
    }

    SECTION("api failure") {
        stub->respond("deleteMessage", R"({"ok":false,"error_code":400,"description":"Bad Request: message to delete not found"})");
        auto r = sync_wait(b.delete_message(1, 2).send());
        REQUIRE(r.error().kind() == error_kind::api);
        REQUIRE(r.error().api()->error_code == 400);
    }

    SECTION("malformed body") {
        stub->respond("deleteMessage", "not json");
        auto r = sync_wait(b.delete_message(1, 2).send());
        REQUIRE(r.error().kind() == error_kind::invalid_json);
        REQUIRE(r.error().raw_body() == "not json");
    }
}

TEST_CASE("dropping an in-flight future abandons the call", "[request][cancel]") {
    auto stub = std::make_shared<stub_transport>();
    stub->set_deferred(true);
    bot b(stub);

    auto req = b.get_me();
    {
        auto t = start(req.send_ref());
        REQUIRE(stub->call_count() == 1);
        REQUIRE_FALSE(t.done());
        REQUIRE_FALSE(stub->is_abandoned(0));
    }
    REQUIRE(stub->is_abandoned(0));
    // A late answer is not delivered anywhere
    REQUIRE_FALSE(stub->resolve(0, ok_envelope(test::bot_user_json)));

    // The request is still usable
    auto t = start(req.send_ref());
    REQUIRE(stub->call_count() == 2);
    REQUIRE(stub->resolve(1, ok_envelope(test::bot_user_json)));
    REQUIRE(t.done());
    REQUIRE(t.handle().promise().value_->ok());
    REQUIRE(t.handle().promise().value_->value().id == 1);
}

TEST_CASE("concurrent futures of one request complete independently", "[request][cancel]") {
    auto stub = std::make_shared<stub_transport>();
    stub->set_deferred(true);
    bot b(stub);

    auto req = b.export_chat_invite_link(42);
    auto first = start(req.send_ref());
    auto second = start(req.send_ref());
    REQUIRE(stub->call_count() == 2);

    REQUIRE(stub->resolve(1, ok_envelope(R"("https://t.me/+second")")));
    REQUIRE(second.done());
    REQUIRE_FALSE(first.done());

    REQUIRE(stub->resolve(0, ok_envelope(R"("https://t.me/+first")")));
    REQUIRE(first.done());

    REQUIRE(first.handle().promise().value_->value() == "https://t.me/+first");
    REQUIRE(second.handle().promise().value_->value() == "https://t.me/+second");
}
