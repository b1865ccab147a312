#pragma once

#include "promise_base.hpp"
#include <coroutine>
#include <optional>
#include <exception>
#include <utility>
#include <type_traits>

namespace courier::coro {

template<typename T = void>
class task;

namespace detail {

/// Initial awaiter: always suspends, so nothing in the body runs until the
/// task is first resumed or awaited
struct initial_awaiter {
    promise_base* promise_;

    [[nodiscard]] bool await_ready() const noexcept { return false; }
    void await_suspend(std::coroutine_handle<>) const noexcept {}
    void await_resume() const noexcept {
        promise_->set_state(coroutine_state::running);
    }
};

struct final_awaiter {
    [[nodiscard]] bool await_ready() const noexcept { return false; }

    template<typename Promise>
    [[nodiscard]] std::coroutine_handle<> await_suspend(std::coroutine_handle<Promise> h) noexcept {
        auto& promise = h.promise();
        if (promise.state() != coroutine_state::failed) {
            promise.set_state(coroutine_state::completed);
        }
        auto continuation = promise.continuation_;
        if (continuation) {
            return continuation;
        } else if (promise.detached_) {
            // Detached task with no continuation - self-destruct
            h.destroy();
            return std::noop_coroutine();
        } else {
            // Owned task with no continuation - stay suspended for owner to destroy
            return std::noop_coroutine();
        }
    }

    void await_resume() const noexcept {}
};

} // namespace detail

/// Lazily started coroutine task
///
/// The body does not run until the task is awaited or its handle is resumed.
/// Destroying a task that has not finished destroys the coroutine frame and
/// every object alive at its suspension point. If another thread is resuming
/// the task at that moment, destruction waits until that resume returns.
template<typename T>
class task {
public:
    struct promise_type : promise_base {
        std::optional<T> value_;
        std::coroutine_handle<> continuation_;
        bool detached_ = false;

        promise_type() noexcept = default;

        [[nodiscard]] task get_return_object() noexcept {
            return task{std::coroutine_handle<promise_type>::from_promise(*this)};
        }

        [[nodiscard]] detail::initial_awaiter initial_suspend() noexcept { return {this}; }
        [[nodiscard]] detail::final_awaiter final_suspend() noexcept { return {}; }

        template<typename U>
        void return_value(U&& value) {
            value_.emplace(std::forward<U>(value));
        }
    };

    using handle_type = std::coroutine_handle<promise_type>;

    explicit task(handle_type handle) noexcept : handle_(handle) {}
    task(task&& other) noexcept : handle_(std::exchange(other.handle_, nullptr)) {}

    task& operator=(task&& other) noexcept {
        if (this != &other) {
            destroy();
            handle_ = std::exchange(other.handle_, nullptr);
        }
        return *this;
    }

    ~task() { destroy(); }

    task(const task&) = delete;
    task& operator=(const task&) = delete;

    [[nodiscard]] handle_type handle() const noexcept { return handle_; }

    /// Give up ownership; the frame destroys itself when it finishes
    [[nodiscard]] handle_type release() noexcept {
        if (handle_) handle_.promise().detached_ = true;
        return std::exchange(handle_, nullptr);
    }

    /// True once the body has run to completion (or thrown)
    [[nodiscard]] bool done() const noexcept { return handle_ && handle_.done(); }

    [[nodiscard]] bool await_ready() const noexcept { return false; }

    template<typename Promise>
    [[nodiscard]] std::coroutine_handle<> await_suspend(std::coroutine_handle<Promise> awaiter) {
        if constexpr (std::is_base_of_v<promise_base, Promise>) {
            handle_.promise().join_chain(awaiter.promise());
        }
        handle_.promise().continuation_ = awaiter;
        return handle_;
    }

    T await_resume() {
        auto& promise = handle_.promise();
        if (promise.exception()) {
            std::rethrow_exception(promise.exception());
        }
        return std::move(*promise.value_);
    }

private:
    /// Waits out a resume running on another thread before freeing the frame
    void destroy() noexcept {
        if (handle_) {
            handle_.promise().drop_chain();
            handle_.destroy();
        }
    }

    handle_type handle_;
};

/// Specialization for task<void>
template<>
class task<void> {
public:
    struct promise_type : promise_base {
        std::coroutine_handle<> continuation_;
        bool detached_ = false;

        promise_type() noexcept = default;

        [[nodiscard]] task get_return_object() noexcept {
            return task{std::coroutine_handle<promise_type>::from_promise(*this)};
        }

        [[nodiscard]] detail::initial_awaiter initial_suspend() noexcept { return {this}; }
        [[nodiscard]] detail::final_awaiter final_suspend() noexcept { return {}; }

        void return_void() noexcept {}
    };

    using handle_type = std::coroutine_handle<promise_type>;

    explicit task(handle_type handle) noexcept : handle_(handle) {}
    task(task&& other) noexcept : handle_(std::exchange(other.handle_, nullptr)) {}

    task& operator=(task&& other) noexcept {
        if (this != &other) {
            destroy();
            handle_ = std::exchange(other.handle_, nullptr);
        }
        return *this;
    }

    ~task() { destroy(); }

    task(const task&) = delete;
    task& operator=(const task&) = delete;

    [[nodiscard]] handle_type handle() const noexcept { return handle_; }
    [[nodiscard]] handle_type release() noexcept {
        if (handle_) handle_.promise().detached_ = true;
        return std::exchange(handle_, nullptr);
    }

    [[nodiscard]] bool done() const noexcept { return handle_ && handle_.done(); }

    [[nodiscard]] bool await_ready() const noexcept { return false; }

    template<typename Promise>
    [[nodiscard]] std::coroutine_handle<> await_suspend(std::coroutine_handle<Promise> awaiter) {
        if constexpr (std::is_base_of_v<promise_base, Promise>) {
            handle_.promise().join_chain(awaiter.promise());
        }
        handle_.promise().continuation_ = awaiter;
        return handle_;
    }

    void await_resume() {
        auto& promise = handle_.promise();
        if (promise.exception()) {
            std::rethrow_exception(promise.exception());
        }
    }

private:
    void destroy() noexcept {
        if (handle_) {
            handle_.promise().drop_chain();
            handle_.destroy();
        }
    }

    handle_type handle_;
};

} // namespace courier::coro
