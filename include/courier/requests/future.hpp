#pragma once

#include "result.hpp"

#include <courier/coro/task.hpp>

#include <coroutine>
#include <utility>

namespace courier {

/// How a future was obtained from its request
enum class send_mode {
    consume,    ///< from `send`: the request was moved into the future
    borrow,     ///< from `send_ref`: the request is still alive
};

/// Future of one request call
///
/// Wraps a lazily started task. Nothing runs until the future is awaited (or
/// its task is driven); dropping it before that has no effect, and dropping
/// it while suspended abandons the call.
///
/// The mode parameter makes the futures returned by `send` and `send_ref`
/// distinct types.
template<typename Output, send_mode Mode>
class basic_send {
public:
    using output_type = Output;
    using result_type = request_result<Output>;

    explicit basic_send(coro::task<result_type> task) noexcept
        : task_(std::move(task)) {}

    basic_send(basic_send&&) noexcept = default;
    basic_send& operator=(basic_send&&) noexcept = default;

    basic_send(const basic_send&) = delete;
    basic_send& operator=(const basic_send&) = delete;

    [[nodiscard]] bool await_ready() const noexcept { return false; }

    template<typename Promise>
    [[nodiscard]] std::coroutine_handle<> await_suspend(std::coroutine_handle<Promise> awaiter) {
        return task_.await_suspend(awaiter);
    }

    result_type await_resume() {
        return task_.await_resume();
    }

    /// Check whether the call has started
    [[nodiscard]] bool started() const noexcept {
        return task_.handle() &&
               task_.handle().promise().state() != coro::coroutine_state::created;
    }

    /// Unwrap into the underlying task
    [[nodiscard]] coro::task<result_type> into_task() && {
        return std::move(task_);
    }

private:
    coro::task<result_type> task_;
};

/// Future returned by `send`
template<typename Output>
using send_future = basic_send<Output, send_mode::consume>;

/// Future returned by `send_ref`
template<typename Output>
using send_ref_future = basic_send<Output, send_mode::borrow>;

} // namespace courier
