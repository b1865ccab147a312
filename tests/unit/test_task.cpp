#include <catch2/catch_test_macros.hpp>
#include <courier/coro/task.hpp>
#include <courier/coro/sync_wait.hpp>

#include <atomic>
#include <chrono>
#include <coroutine>
#include <cstdint>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>

using namespace courier::coro;

// Helper: Simple coroutine that returns a value
task<int> simple_return_value() {
    co_return 42;
}

// Helper: Simple void coroutine
task<void> simple_void() {
    co_return;
}

// Helper: Coroutine that throws
task<int> throwing_coroutine() {
    throw std::runtime_error("test error");
    co_return 0;  // Unreachable
}

// Helper: Nested coroutines
task<int> nested_inner() {
    co_return 10;
}

task<int> nested_outer() {
    int value = co_await nested_inner();
    co_return value * 2;
}

TEST_CASE("task construction and destruction", "[task]") {
    {
        auto t = simple_return_value();
        REQUIRE(t.handle() != nullptr);
    }
    // Task should destroy handle in destructor
}

TEST_CASE("task move semantics", "[task]") {
    auto t1 = simple_return_value();
    auto h1 = t1.handle();
    REQUIRE(h1 != nullptr);

    auto t2 = std::move(t1);
    REQUIRE(t1.handle() == nullptr);  // Moved-from
    REQUIRE(t2.handle() == h1);       // Moved-to
}

TEST_CASE("task does not run before it is resumed", "[task]") {
    int runs = 0;
    auto body = [&runs]() -> task<int> {
        ++runs;
        co_return runs;
    };

    {
        auto t = body();
        REQUIRE(runs == 0);
        REQUIRE(t.handle().promise().state() == coroutine_state::created);
        REQUIRE_FALSE(t.done());
    }
    // Dropped without being driven
    REQUIRE(runs == 0);

    auto t = body();
    t.handle().resume();
    REQUIRE(runs == 1);
    REQUIRE(t.done());
    REQUIRE(t.handle().promise().state() == coroutine_state::completed);
}

TEST_CASE("task<int> co_return value", "[task]") {
    auto t = simple_return_value();

    // Start the coroutine
    t.handle().resume();

    // The promise should have the value
    REQUIRE(t.handle().promise().value_.has_value());
    REQUIRE(t.handle().promise().value_.value() == 42);
}

TEST_CASE("task<void> co_return void", "[task]") {
    auto t = simple_void();

    t.handle().resume();

    REQUIRE(t.handle().done());
}

TEST_CASE("task stores exception", "[task]") {
    auto t = throwing_coroutine();

    t.handle().resume();

    REQUIRE(t.handle().promise().exception() != nullptr);
    REQUIRE(t.handle().promise().state() == coroutine_state::failed);
}

TEST_CASE("task nested co_await", "[task]") {
    auto t = nested_outer();
    t.handle().resume();

    // The outer coroutine should return 20 (10 * 2)
    REQUIRE(t.handle().promise().value_.value() == 20);
}

TEST_CASE("task exception propagation via co_await", "[task]") {
    auto outer = []() -> task<void> {
        try {
            co_await throwing_coroutine();
            FAIL("Should have thrown");
        } catch (const std::runtime_error& e) {
            REQUIRE(std::string(e.what()) == "test error");
        }
    };

    auto t = outer();
    t.handle().resume();

    REQUIRE(t.handle().done());
}

TEST_CASE("sync_wait returns the task result", "[task][sync_wait]") {
    REQUIRE(sync_wait(nested_outer()) == 20);
    sync_wait(simple_void());
}

TEST_CASE("sync_wait rethrows", "[task][sync_wait]") {
    REQUIRE_THROWS_AS(sync_wait(throwing_coroutine()), std::runtime_error);
}

namespace {

/// Awaitable completing on a separate thread
struct resume_on_thread {
    std::thread* worker;

    bool await_ready() const noexcept { return false; }
    void await_suspend(std::coroutine_handle<> h) {
        *worker = std::thread([h] { h.resume(); });
    }
    void await_resume() const noexcept {}
};

} // namespace

TEST_CASE("sync_wait waits for completion on another thread", "[task][sync_wait]") {
    std::thread worker;
    auto body = [](std::thread* w) -> task<std::thread::id> {
        co_await resume_on_thread{w};
        co_return std::this_thread::get_id();
    };

    auto finished_on = sync_wait(body(&worker));
    worker.join();

    REQUIRE(finished_on != std::this_thread::get_id());
}

TEST_CASE("resume_gate rejects claims after a drop", "[task][resume_gate]") {
    detail::resume_gate gate;
    auto ticket = gate.park();
    gate.drop();
    REQUIRE_FALSE(gate.claim(ticket));
}

TEST_CASE("resume_gate only honours the latest ticket", "[task][resume_gate]") {
    detail::resume_gate gate;
    auto stale = gate.park();
    auto current = gate.park();
    REQUIRE_FALSE(gate.claim(stale));
    REQUIRE(gate.claim(current));
    gate.release();
    REQUIRE_FALSE(gate.claim(current));
}

namespace {

/// Where a chain parked itself
struct parking_spot {
    std::shared_ptr<detail::resume_gate> gate;
    std::uint64_t ticket = 0;
    std::coroutine_handle<> waiter;
};

/// Awaitable that parks the chain and leaves resumption to the test
struct park_here {
    parking_spot* spot;

    bool await_ready() const noexcept { return false; }

    template<typename Promise>
    void await_suspend(std::coroutine_handle<Promise> h) {
        spot->gate = h.promise().gate();
        spot->ticket = spot->gate->park();
        spot->waiter = h;
    }

    void await_resume() const noexcept {}
};

task<void> parked_inner(parking_spot* spot, std::atomic<bool>* finished) {
    co_await park_here{spot};
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    *finished = true;
}

task<void> parked_outer(parking_spot* spot, std::atomic<bool>* finished) {
    co_await parked_inner(spot, finished);
}

} // namespace

TEST_CASE("dropping a parked task blocks later resumption", "[task][resume_gate]") {
    parking_spot spot;
    std::atomic<bool> finished{false};
    {
        auto t = parked_outer(&spot, &finished);
        t.handle().resume();
        REQUIRE(spot.gate);
    }
    REQUIRE_FALSE(spot.gate->claim(spot.ticket));
    REQUIRE_FALSE(finished.load());
}

TEST_CASE("destroying a task waits for a resume on another thread", "[task][resume_gate]") {
    parking_spot spot;
    std::atomic<bool> finished{false};
    std::atomic<bool> claimed{false};

    std::optional<task<void>> t(parked_outer(&spot, &finished));
    t->handle().resume();

    std::thread worker([&] {
        if (spot.gate->claim(spot.ticket)) {
            claimed = true;
            spot.waiter.resume();
            spot.gate->release();
        }
    });
    while (!claimed.load()) {
        std::this_thread::yield();
    }

    t.reset();
    REQUIRE(finished.load());
    worker.join();
}
