#pragma once

/// @file trace.hpp
/// @brief Requester wrapper that logs every request and its outcome
///
/// Logging happens inside the returned futures, so a traced request that is
/// never driven logs nothing.
///
/// Usage:
/// @code
/// auto traced = adaptors::trace(bot, {.requests = true, .responses = true});
/// auto me = co_await traced.get_me().send();
/// @endcode

#include <courier/log/macros.hpp>
#include <courier/requests/request.hpp>
#include <courier/requests/requester.hpp>

#include <utility>

namespace courier::adaptors {

/// What to log
struct trace_settings {
    bool requests = true;     ///< log method and encoded payload before sending
    bool responses = true;    ///< log the outcome after completion
    log::level log_level = log::level::info;
};

/// Request wrapper produced by `trace`
template<request R>
class trace_request {
public:
    using payload_type = payload_of<R>;
    using output_type = output_t<payload_type>;
    using error_type = request_error;
    using send_type = send_future<output_type>;
    using send_ref_type = send_ref_future<output_type>;

    trace_request(R inner, trace_settings settings)
        : inner_(std::move(inner)), settings_(settings) {}

    [[nodiscard]] payload_type& payload_mut() noexcept { return inner_.payload_mut(); }
    [[nodiscard]] const payload_type& payload_ref() const noexcept { return inner_.payload_ref(); }

    payload_type* operator->() noexcept { return &inner_.payload_mut(); }
    const payload_type* operator->() const noexcept { return &inner_.payload_ref(); }

    [[nodiscard]] send_type send() && {
        auto snapshot = inner_.payload_ref();
        return send_type(traced(std::move(inner_).send(), std::move(snapshot), settings_));
    }

    [[nodiscard]] send_ref_type send_ref() const {
        return send_ref_type(traced(inner_.send_ref(), inner_.payload_ref(), settings_));
    }

private:
    template<typename Future>
    static coro::task<request_result<output_type>> traced(Future inner, payload_type snapshot, trace_settings settings) {
        auto& logger = log::logger::instance();
        if (settings.requests && logger.enabled(settings.log_level)) {
            logger.log(settings.log_level, __FILE__, __LINE__, "sending {}: {}",
                    payload_type::method_name,
                    to_json_object(snapshot).dump(-1, ' ', false, nlohmann::json::error_handler_t::replace));
        }

        auto result = co_await std::move(inner);

        if (settings.responses && logger.enabled(settings.log_level)) {
            if (result) {
                logger.log(settings.log_level, __FILE__, __LINE__, "{} succeeded", payload_type::method_name);
            } else {
                logger.log(settings.log_level, __FILE__, __LINE__, "{} failed: {}",
                        payload_type::method_name, result.error().to_string());
            }
        }
        co_return result;
    }

    R inner_;
    trace_settings settings_;
};

/// Requester wrapper logging every request it builds
template<requester B>
class trace : public requester_mixin<trace<B>> {
public:
    explicit trace(B inner, trace_settings settings = {})
        : inner_(std::move(inner)), settings_(settings) {}

    template<payload P>
    [[nodiscard]] auto request(P payload) const {
        return trace_request<request_t<B, P>>(inner_.request(std::move(payload)), settings_);
    }

    [[nodiscard]] const B& inner() const noexcept { return inner_; }
    [[nodiscard]] const trace_settings& settings() const noexcept { return settings_; }

private:
    B inner_;
    trace_settings settings_;
};

} // namespace courier::adaptors
