#pragma once

#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <thread>

namespace courier::coro::detail {

/// Hand-off between a resume coming from another thread and the owner
/// destroying the suspended chain
///
/// One gate is shared by every frame of an await chain. A frame waiting on
/// an event from another thread parks the chain and gets a ticket. The thread
/// delivering the event must claim the ticket before resuming; the owner
/// drops the chain before destroying it. Exactly one of the two wins.
class resume_gate {
public:
    resume_gate() = default;

    resume_gate(const resume_gate&) = delete;
    resume_gate& operator=(const resume_gate&) = delete;

    /// Mark the chain as waiting on an external event
    /// @return Ticket to pass to claim()
    std::uint64_t park() {
        std::lock_guard<std::mutex> lock(mutex_);
        state_ = gate_state::parked;
        return ++ticket_;
    }

    /// Take the right to resume the chain parked under `ticket`
    /// @return false if the chain was dropped (or parked again since)
    [[nodiscard]] bool claim(std::uint64_t ticket) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ != gate_state::parked || ticket != ticket_) {
            return false;
        }
        state_ = gate_state::resuming;
        resumer_ = std::this_thread::get_id();
        return true;
    }

    /// End of a resume started by claim(); call once `resume()` returned
    void release() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (state_ == gate_state::resuming && resumer_ == std::this_thread::get_id()) {
                state_ = gate_state::idle;
            }
        }
        cv_.notify_all();
    }

    /// Owner side, before destroying the chain. Waits out a resume running on
    /// another thread; a parked chain is dropped so no later claim succeeds.
    void drop() {
        std::unique_lock<std::mutex> lock(mutex_);
        const auto self = std::this_thread::get_id();
        cv_.wait(lock, [&] {
            return state_ != gate_state::resuming || resumer_ == self;
        });
        if (state_ == gate_state::parked) {
            state_ = gate_state::dropped;
        }
    }

private:
    enum class gate_state : std::uint8_t {
        idle,       // running on its own thread, finished, or not started
        parked,     // waiting for an external event
        resuming,   // an external event is being delivered
        dropped,    // destroyed by the owner while parked
    };

    std::mutex mutex_;
    std::condition_variable cv_;
    gate_state state_ = gate_state::idle;
    std::uint64_t ticket_ = 0;
    std::thread::id resumer_;
};

} // namespace courier::coro::detail
