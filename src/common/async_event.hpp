#pragma once

#include <chrono>
#include <cstdint>
#include <set>

#include <boost/asio/awaitable.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>

namespace rlevel {

// ── AsyncEvent ───────────────────────────────────────────────────────────────
//
// Manual-reset event for coroutines.  wait() suspends until set() is called;
// once set, wait() returns immediately until reset().  A steady_timer that
// never expires serves as the signal: set() cancels it, which wakes every
// pending waiter.
//
// NOT thread-safe: use it from a single strand.

class AsyncEvent {
public:
    explicit AsyncEvent(boost::asio::io_context& ioc);

    [[nodiscard]] boost::asio::awaitable<void> wait();

    void set();
    void reset() noexcept { set_ = false; }

    [[nodiscard]] bool is_set() const noexcept { return set_; }

private:
    boost::asio::steady_timer timer_;
    bool set_ = false;
};

// ── WriteNotifier ────────────────────────────────────────────────────────────
//
// Wakes update feeds after the database issues a write.  Each feed waits on
// its own timer with a poll interval; notify() cancels every registered timer.
// The generation counter closes the gap between a feed's last poll and the
// start of its wait.
//
// NOT thread-safe: use it from a single strand.

class WriteNotifier {
public:
    [[nodiscard]] uint64_t generation() const noexcept { return generation_; }

    void notify();

    // Returns when notify() is called, `timeout` elapses, or `timer` is
    // cancelled by its owner.  Returns at once if the generation moved past
    // `seen`.
    [[nodiscard]] boost::asio::awaitable<void>
    wait(boost::asio::steady_timer& timer, uint64_t seen,
         std::chrono::milliseconds timeout);

    [[nodiscard]] std::size_t waiting() const noexcept { return waiters_.size(); }

private:
    uint64_t generation_ = 0;
    std::set<boost::asio::steady_timer*> waiters_;
};

} // namespace rlevel
