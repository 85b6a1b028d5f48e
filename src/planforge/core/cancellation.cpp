#include "planforge/core/cancellation.hpp"

#include <boost/asio/this_coro.hpp>

namespace planforge {

CancellationSource::CancellationSource(boost::asio::any_io_executor executor)
    : state_(std::make_shared<State>(std::move(executor))) {}

auto CancellationSource::cancel(CancelReason reason) -> bool {
  if (state_->event.is_set()) {
    return false;
  }
  state_->reason = reason;
  state_->event.set();
  return true;
}

auto CancellationToken::wait() const -> task<void> {
  if (state_) {
    // Keep the state alive for the duration of the wait.
    auto state = state_;
    co_await state->event.wait();
    co_return;
  }
  boost::asio::steady_timer never(co_await boost::asio::this_coro::executor,
                                  boost::asio::steady_timer::time_point::max());
  [[maybe_unused]] auto [ec] = co_await never.async_wait(use_nothrow);
}

auto CancellationToken::wait_for(std::chrono::milliseconds d) const
    -> task<bool> {
  if (state_) {
    auto state = state_;
    co_return co_await state->event.wait_for(d);
  }
  [[maybe_unused]] auto elapsed = co_await sleep_for(d);
  co_return false;
}

PauseGate::PauseGate(boost::asio::any_io_executor executor)
    : timer_(std::move(executor),
             boost::asio::steady_timer::time_point::max()) {}

auto PauseGate::pause() -> bool {
  if (paused_) {
    return false;
  }
  paused_ = true;
  return true;
}

auto PauseGate::resume() -> bool {
  if (!paused_) {
    return false;
  }
  paused_ = false;
  timer_.cancel();
  return true;
}

auto PauseGate::wait_open() -> task<void> {
  while (paused_) {
    [[maybe_unused]] auto [ec] = co_await timer_.async_wait(use_nothrow);
    auto cs = co_await boost::asio::this_coro::cancellation_state;
    if (cs.cancelled() != boost::asio::cancellation_type::none) {
      co_return;
    }
  }
}

} // namespace planforge
