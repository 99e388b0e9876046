#pragma once

#include <exception>
#include <optional>
#include <type_traits>
#include <utility>

#include <boost/asio/associated_executor.hpp>
#include <boost/asio/async_result.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/execution/outstanding_work.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/prefer.hpp>
#include <boost/asio/thread_pool.hpp>
#include <boost/asio/use_awaitable.hpp>

namespace rlevel {

// ── offload ───────────────────────────────────────────────────────────────────
//
// Runs a blocking engine call on `pool` and resumes the calling coroutine on
// its own executor afterwards, so that no façade state is touched from a
// worker thread.  Whatever `fn` throws is rethrown in the coroutine.
//
//   auto value = co_await offload(pool_, [&] { return engine_->get(key, ro); });
//
// `fn` may capture locals of the calling coroutine by reference: the
// coroutine frame stays suspended until `fn` has returned.

template <typename Fn>
boost::asio::awaitable<std::invoke_result_t<Fn&>>
offload(boost::asio::thread_pool& pool, Fn fn) {
    using Result = std::invoke_result_t<Fn&>;
    using Slot = std::conditional_t<std::is_void_v<Result>, bool, std::optional<Result>>;

    Slot result{};
    std::exception_ptr error;

    co_await boost::asio::async_initiate<const boost::asio::use_awaitable_t<>&, void()>(
        [&](auto handler) {
            // Keep the caller's executor alive while the worker runs.
            auto home = boost::asio::prefer(
                boost::asio::get_associated_executor(handler),
                boost::asio::execution::outstanding_work.tracked);

            boost::asio::post(pool,
                [&, handler = std::move(handler), home]() mutable {
                    try {
                        if constexpr (std::is_void_v<Result>) {
                            fn();
                        } else {
                            result.emplace(fn());
                        }
                    } catch (...) {
                        error = std::current_exception();
                    }
                    boost::asio::post(home, std::move(handler));
                });
        },
        boost::asio::use_awaitable);

    if (error) {
        std::rethrow_exception(error);
    }
    if constexpr (!std::is_void_v<Result>) {
        co_return std::move(*result);
    }
}

} // namespace rlevel
