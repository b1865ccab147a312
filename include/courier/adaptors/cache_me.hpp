#pragma once

/// @file cache_me.hpp
/// @brief Requester wrapper caching the result of `get_me`
///
/// The bot's own account does not change, so after the first successful
/// `get_me` every later one is answered from memory without reaching the
/// transport. The cache is shared by copies of the wrapper.

#include <courier/requests/request.hpp>
#include <courier/requests/requester.hpp>
#include <courier/types/user.hpp>

#include <concepts>
#include <memory>
#include <mutex>
#include <optional>
#include <utility>

namespace courier::adaptors {

namespace detail {

class me_cache {
public:
    std::optional<types::user> get() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return me_;
    }

    void set(const types::user& me) {
        std::lock_guard<std::mutex> lock(mutex_);
        me_ = me;
    }

    void clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        me_.reset();
    }

private:
    mutable std::mutex mutex_;
    std::optional<types::user> me_;
};

} // namespace detail

/// `get_me` request served from the cache when possible
template<request R>
    requires std::same_as<payload_of<R>, payloads::get_me>
class cached_me_request {
public:
    using payload_type = payloads::get_me;
    using output_type = types::user;
    using error_type = request_error;
    using send_type = send_future<output_type>;
    using send_ref_type = send_ref_future<output_type>;

    cached_me_request(R inner, std::shared_ptr<detail::me_cache> cache)
        : inner_(std::move(inner)), cache_(std::move(cache)) {}

    [[nodiscard]] payload_type& payload_mut() noexcept { return inner_.payload_mut(); }
    [[nodiscard]] const payload_type& payload_ref() const noexcept { return inner_.payload_ref(); }

    payload_type* operator->() noexcept { return &inner_.payload_mut(); }
    const payload_type* operator->() const noexcept { return &inner_.payload_ref(); }

    [[nodiscard]] send_type send() && {
        return send_type(lookup(std::move(inner_).send(), cache_));
    }

    [[nodiscard]] send_ref_type send_ref() const {
        return send_ref_type(lookup(inner_.send_ref(), cache_));
    }

private:
    // The inner future is only driven on a cache miss
    template<typename Future>
    static coro::task<request_result<output_type>> lookup(Future inner, std::shared_ptr<detail::me_cache> cache) {
        if (auto me = cache->get()) {
            co_return request_result<output_type>(std::move(*me));
        }
        auto result = co_await std::move(inner);
        if (result) {
            cache->set(*result);
        }
        co_return result;
    }

    R inner_;
    std::shared_ptr<detail::me_cache> cache_;
};

/// Requester wrapper caching `get_me`
template<requester B>
class cache_me : public requester_mixin<cache_me<B>> {
public:
    explicit cache_me(B inner)
        : inner_(std::move(inner)), cache_(std::make_shared<detail::me_cache>()) {}

    template<payload P>
    [[nodiscard]] auto request(P payload) const {
        if constexpr (std::same_as<P, payloads::get_me>) {
            return cached_me_request<request_t<B, P>>(inner_.request(std::move(payload)), cache_);
        } else {
            return inner_.request(std::move(payload));
        }
    }

    /// Cached account, if a `get_me` has completed
    [[nodiscard]] std::optional<types::user> cached() const { return cache_->get(); }

    /// Forget the cached account
    void reset_cache() const { cache_->clear(); }

    [[nodiscard]] const B& inner() const noexcept { return inner_; }

private:
    B inner_;
    std::shared_ptr<detail::me_cache> cache_;
};

} // namespace courier::adaptors
