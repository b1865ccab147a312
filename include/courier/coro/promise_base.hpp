#pragma once

#include "resume_gate.hpp"

#include <exception>
#include <cstdint>
#include <memory>

namespace courier::coro {

/// Coroutine lifecycle state
enum class coroutine_state : uint8_t {
    created = 0,    // Just created, not started
    running = 1,    // Started, not yet finished
    completed = 2,  // Finished execution
    failed = 3      // Threw an exception
};

/// Base class for all coroutine promise types
///
/// Holds the exception escaping the coroutine body and a coarse lifecycle
/// state. A request future that was never driven stays in `created`, which
/// is what the laziness tests look at.
///
/// Also holds the resume gate of the await chain the coroutine belongs to.
/// It is created by the outermost frame on first use and handed down to
/// each awaited task before that task starts.
class promise_base {
public:
    promise_base() noexcept = default;
    ~promise_base() noexcept = default;

    promise_base(const promise_base&) = delete;
    promise_base& operator=(const promise_base&) = delete;
    promise_base(promise_base&&) = delete;
    promise_base& operator=(promise_base&&) = delete;

    void unhandled_exception() noexcept {
        exception_ = std::current_exception();
        state_ = coroutine_state::failed;
    }

    [[nodiscard]] std::exception_ptr exception() const noexcept {
        return exception_;
    }

    [[nodiscard]] coroutine_state state() const noexcept { return state_; }

    void set_state(coroutine_state state) noexcept {
        state_ = state;
    }

    /// Gate of this chain, created on first use
    [[nodiscard]] const std::shared_ptr<detail::resume_gate>& gate() {
        if (!gate_) {
            gate_ = std::make_shared<detail::resume_gate>();
        }
        return gate_;
    }

    /// Join the chain of the coroutine awaiting this one
    void join_chain(promise_base& awaiting) {
        gate_ = awaiting.gate();
    }

    /// Called by the owner before the frame is destroyed
    void drop_chain() {
        if (gate_) {
            gate_->drop();
        }
    }

private:
    std::exception_ptr exception_;
    coroutine_state state_ = coroutine_state::created;
    std::shared_ptr<detail::resume_gate> gate_;
};

} // namespace courier::coro
