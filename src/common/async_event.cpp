#include "common/async_event.hpp"

#include <boost/asio/as_tuple.hpp>
#include <boost/asio/use_awaitable.hpp>

namespace rlevel {

using boost::asio::as_tuple;
using boost::asio::awaitable;
using boost::asio::use_awaitable;

// ── AsyncEvent ───────────────────────────────────────────────────────────────

AsyncEvent::AsyncEvent(boost::asio::io_context& ioc)
    : timer_(ioc, boost::asio::steady_timer::time_point::max())
{}

awaitable<void> AsyncEvent::wait() {
    while (!set_) {
        // operation_aborted is the wake-up signal; the flag decides.
        auto [ec] = co_await timer_.async_wait(as_tuple(use_awaitable));
        (void)ec;
    }
}

void AsyncEvent::set() {
    set_ = true;
    timer_.cancel();
}

// ── WriteNotifier ────────────────────────────────────────────────────────────

void WriteNotifier::notify() {
    ++generation_;
    for (auto* timer : waiters_) {
        timer->cancel();
    }
}

awaitable<void> WriteNotifier::wait(boost::asio::steady_timer& timer, uint64_t seen,
                                    std::chrono::milliseconds timeout) {
    if (generation_ != seen) {
        co_return;
    }

    timer.expires_after(timeout);
    waiters_.insert(&timer);
    auto [ec] = co_await timer.async_wait(as_tuple(use_awaitable));
    (void)ec;
    waiters_.erase(&timer);
}

} // namespace rlevel
