#pragma once

#include "planforge/core/coroutine.hpp"

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/steady_timer.hpp>

#include <chrono>

namespace planforge {

/// Set-once broadcast event for coroutines on a single executor.
///
/// Backed by a steady_timer parked at time_point::max(): waiters suspend on
/// the timer and set() cancels it, waking all of them at once. Waits that
/// are cancelled from outside (e.g. the losing side of an `||`) complete
/// normally without throwing.
class AsyncEvent {
public:
  explicit AsyncEvent(boost::asio::any_io_executor executor);

  AsyncEvent(const AsyncEvent &) = delete;
  auto operator=(const AsyncEvent &) -> AsyncEvent & = delete;

  auto set() -> void;
  [[nodiscard]] auto is_set() const noexcept -> bool { return set_; }

  auto wait() -> task<void>;

  // Returns true if the event was set before `timeout` elapsed.
  auto wait_for(std::chrono::milliseconds timeout) -> task<bool>;

private:
  boost::asio::steady_timer timer_;
  bool set_{false};
};

} // namespace planforge
