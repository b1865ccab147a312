#pragma once

#include <courier/net/transport.hpp>
#include <courier/requests/json_request.hpp>
#include <courier/requests/requester.hpp>

#include <memory>
#include <stdexcept>
#include <utility>

namespace courier {

/// The base requester: builds `json_request`s bound to a shared transport
///
/// Copies share the transport, so a bot is cheap to pass around and to wrap.
///
/// @code
/// courier::bot bot(std::make_shared<net::http_transport>(net::transport_config::from_env()));
/// auto link = co_await bot.create_chat_invite_link(chat).send();
/// @endcode
class bot : public requester_mixin<bot> {
public:
    /// @throws std::invalid_argument if `transport` is null
    explicit bot(std::shared_ptr<net::transport> transport)
        : transport_(std::move(transport)) {
        if (!transport_) {
            throw std::invalid_argument("bot requires a transport");
        }
    }

    template<payload P>
    [[nodiscard]] json_request<P> request(P payload) const {
        return json_request<P>(transport_, std::move(payload));
    }

    [[nodiscard]] const std::shared_ptr<net::transport>& transport() const noexcept {
        return transport_;
    }

private:
    std::shared_ptr<net::transport> transport_;
};

} // namespace courier
