#pragma once

#include <boost/asio/as_tuple.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/experimental/awaitable_operators.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>

#include <chrono>

namespace planforge {

template <typename T = void> using task = boost::asio::awaitable<T>;

/// Convenience alias for fire-and-forget coroutines.
using spawn_task = task<void>;

using boost::asio::co_spawn;
using boost::asio::detached;
using boost::asio::use_awaitable;

/// Completion token that reports errors as a leading tuple element instead
/// of throwing.
inline constexpr auto use_nothrow =
    boost::asio::as_tuple(boost::asio::use_awaitable);

namespace awaitable_ops = boost::asio::experimental::awaitable_operators;

/// Suspend on the current executor for `d`. False when the wait was cut
/// short by cancellation.
inline auto sleep_for(std::chrono::steady_clock::duration d) -> task<bool> {
  boost::asio::steady_timer timer(co_await boost::asio::this_coro::executor,
                                  d);
  auto [ec] = co_await timer.async_wait(use_nothrow);
  co_return !ec;
}

} // namespace planforge
