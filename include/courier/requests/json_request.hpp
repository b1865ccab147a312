#pragma once

#include "request.hpp"
#include "response.hpp"

#include <courier/log/macros.hpp>
#include <courier/net/transport.hpp>

#include <memory>
#include <string>
#include <utility>

namespace courier {

/// Request sending its payload as a JSON body
///
/// Both send operations return a future owning everything it needs: the
/// payload (moved for `send`, copied for `send_ref`) and a shared reference
/// to the transport. Encoding, the transport call and decoding all happen
/// inside the future, in that order.
template<payload P>
class json_request {
public:
    using payload_type = P;
    using output_type = output_t<P>;
    using error_type = request_error;
    using send_type = send_future<output_type>;
    using send_ref_type = send_ref_future<output_type>;

    json_request(std::shared_ptr<net::transport> transport, P payload)
        : transport_(std::move(transport)), payload_(std::move(payload)) {}

    [[nodiscard]] P& payload_mut() noexcept { return payload_; }
    [[nodiscard]] const P& payload_ref() const noexcept { return payload_; }

    P* operator->() noexcept { return &payload_; }
    const P* operator->() const noexcept { return &payload_; }

    /// Send this request
    [[nodiscard]] send_type send() && {
        return send_type(execute(std::move(transport_), std::move(payload_)));
    }

    /// Send this request by reference
    ///
    /// The request can be modified and sent again while earlier futures are
    /// still pending; each future sends the payload as it was at this call.
    [[nodiscard]] send_ref_type send_ref() const {
        return send_ref_type(execute(transport_, payload_));
    }

private:
    static coro::task<request_result<output_type>> execute(std::shared_ptr<net::transport> transport, P payload) {
        auto body = encode_payload(payload);
        if (!body) {
            COURIER_LOG_ERROR("{}", body.error().to_string());
            co_return request_result<output_type>(body.error());
        }

        COURIER_LOG_DEBUG("calling {} with {}", P::method_name, *body);
        auto raw = co_await transport->call(std::string(P::method_name), std::move(*body));
        if (!raw) {
            co_return request_result<output_type>(raw.error());
        }
        co_return decode_response<output_type>(*raw);
    }

    std::shared_ptr<net::transport> transport_;
    P payload_;
};

} // namespace courier
