#include "planforge/core/async_event.hpp"

namespace planforge {

AsyncEvent::AsyncEvent(boost::asio::any_io_executor executor)
    : timer_(std::move(executor),
             boost::asio::steady_timer::time_point::max()) {}

auto AsyncEvent::set() -> void {
  if (set_) {
    return;
  }
  set_ = true;
  timer_.cancel();
}

auto AsyncEvent::wait() -> task<void> {
  if (set_) {
    co_return;
  }
  [[maybe_unused]] auto [ec] = co_await timer_.async_wait(use_nothrow);
}

auto AsyncEvent::wait_for(std::chrono::milliseconds timeout) -> task<bool> {
  using namespace awaitable_ops;
  if (set_) {
    co_return true;
  }
  // Outer cancellation reaches both branches.
  boost::asio::steady_timer deadline(timer_.get_executor(), timeout);
  [[maybe_unused]] auto first =
      co_await (wait() || deadline.async_wait(use_nothrow));
  co_return set_;
}

} // namespace planforge
