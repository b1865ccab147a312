#pragma once

#include "task.hpp"
#include <condition_variable>
#include <exception>
#include <mutex>
#include <optional>
#include <type_traits>
#include <utility>

namespace courier::coro {

/// Result type of `co_await`ing an awaitable with a member await_resume()
template<typename Awaitable>
using await_result_t = decltype(std::declval<Awaitable&>().await_resume());

namespace detail {

/// Completion signal for sync_wait
template<typename T>
struct completion_signal {
    std::mutex mutex;
    std::condition_variable cv;
    std::optional<T> result;
    std::exception_ptr exception;
    bool completed = false;

    void set_result(T value) {
        std::lock_guard<std::mutex> lock(mutex);
        result.emplace(std::move(value));
        completed = true;
        cv.notify_one();
    }

    void set_exception(std::exception_ptr e) {
        std::lock_guard<std::mutex> lock(mutex);
        exception = e;
        completed = true;
        cv.notify_one();
    }

    T wait() {
        std::unique_lock<std::mutex> lock(mutex);
        cv.wait(lock, [this] { return completed; });
        if (exception) {
            std::rethrow_exception(exception);
        }
        return std::move(*result);
    }
};

template<>
struct completion_signal<void> {
    std::mutex mutex;
    std::condition_variable cv;
    std::exception_ptr exception;
    bool completed = false;

    void set_result() {
        std::lock_guard<std::mutex> lock(mutex);
        completed = true;
        cv.notify_one();
    }

    void set_exception(std::exception_ptr e) {
        std::lock_guard<std::mutex> lock(mutex);
        exception = e;
        completed = true;
        cv.notify_one();
    }

    void wait() {
        std::unique_lock<std::mutex> lock(mutex);
        cv.wait(lock, [this] { return completed; });
        if (exception) {
            std::rethrow_exception(exception);
        }
    }
};

/// Wrapper task that signals completion
template<typename Awaitable, typename T>
task<void> completion_wrapper(Awaitable inner, completion_signal<T>* signal) {
    try {
        if constexpr (std::is_void_v<T>) {
            co_await std::move(inner);
            signal->set_result();
        } else {
            T result = co_await std::move(inner);
            signal->set_result(std::move(result));
        }
    } catch (...) {
        signal->set_exception(std::current_exception());
    }
}

} // namespace detail

/// Drive an awaitable to completion from synchronous code
///
/// The awaitable is started on the calling thread. If it suspends (for
/// example on a transport call that completes on an io thread) the calling
/// thread blocks until whichever thread resumes it reaches the end.
/// An exception escaping the awaitable is rethrown here.
///
/// @code
/// auto me = coro::sync_wait(bot.get_me().send_ref());
/// @endcode
template<typename Awaitable>
await_result_t<Awaitable> sync_wait(Awaitable awaitable) {
    using result_type = await_result_t<Awaitable>;
    detail::completion_signal<result_type> signal;

    // Detached: the frame may finish on another thread after signalling
    auto wrapper = detail::completion_wrapper(std::move(awaitable), &signal);
    wrapper.release().resume();

    return signal.wait();
}

} // namespace courier::coro
