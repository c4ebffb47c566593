#pragma once

#include <boost/asio/awaitable.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/system/error_code.hpp>

#include <chrono>

namespace batchforge {

template <typename T = void> using task = boost::asio::awaitable<T>;

/// Fire-and-forget coroutine launched with co_spawn(..., detached).
using spawn_task = task<void>;

// Waits for an armed timer; yields the wait status instead of throwing so a
// cancelled timer reads as operation_aborted.
[[nodiscard]] inline auto await_timer(boost::asio::steady_timer &timer)
    -> task<boost::system::error_code> {
  boost::system::error_code ec;
  co_await timer.async_wait(
      boost::asio::redirect_error(boost::asio::use_awaitable, ec));
  co_return ec;
}

// True when the full delay elapsed.
[[nodiscard]] inline auto async_sleep(std::chrono::milliseconds delay)
    -> task<bool> {
  auto executor = co_await boost::asio::this_coro::executor;
  boost::asio::steady_timer timer(executor, delay);
  co_return !(co_await await_timer(timer));
}

} // namespace batchforge
