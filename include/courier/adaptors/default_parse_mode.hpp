#pragma once

#include <courier/requests/requester.hpp>
#include <courier/types/parse_mode.hpp>

#include <concepts>
#include <utility>

namespace courier::adaptors {

/// Requester wrapper giving text messages a default parse mode
///
/// Applied when the request is built: a `send_message` payload without a
/// parse mode gets `mode`. One that already has a parse mode keeps it, and
/// the caller can still change it on the returned request.
template<requester B>
class default_parse_mode : public requester_mixin<default_parse_mode<B>> {
public:
    default_parse_mode(B inner, types::parse_mode mode)
        : inner_(std::move(inner)), mode_(mode) {}

    template<payload P>
    [[nodiscard]] auto request(P payload) const {
        if constexpr (std::same_as<P, payloads::send_message>) {
            if (!payload.parse_mode) {
                payload.parse_mode = mode_;
            }
        }
        return inner_.request(std::move(payload));
    }

    [[nodiscard]] types::parse_mode parse_mode() const noexcept { return mode_; }
    [[nodiscard]] const B& inner() const noexcept { return inner_; }

private:
    B inner_;
    types::parse_mode mode_;
};

} // namespace courier::adaptors
