#pragma once

#include "planforge/core/async_event.hpp"
#include "planforge/core/coroutine.hpp"
#include "planforge/util/enum.hpp"

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/describe/enum.hpp>

#include <chrono>
#include <cstdint>
#include <memory>

namespace planforge {

enum class CancelReason : std::uint8_t { None, User, Timeout, RaceSettled };
BOOST_DESCRIBE_ENUM(CancelReason, None, User, Timeout, RaceSettled)
PLANFORGE_DEFINE_ENUM_SERDE(CancelReason, CancelReason::None)

class CancellationToken;

/// Owner side of a set-once cancellation switch. The first cancel() wins and
/// fixes the reason; later calls are no-ops.
class CancellationSource {
public:
  explicit CancellationSource(boost::asio::any_io_executor executor);

  [[nodiscard]] auto token() const noexcept -> CancellationToken;

  auto cancel(CancelReason reason) -> bool;
  [[nodiscard]] auto is_cancelled() const noexcept -> bool {
    return state_->event.is_set();
  }
  [[nodiscard]] auto reason() const noexcept -> CancelReason {
    return state_->reason;
  }

private:
  struct State {
    explicit State(boost::asio::any_io_executor executor)
        : event(std::move(executor)) {}
    AsyncEvent event;
    CancelReason reason{CancelReason::None};
  };
  std::shared_ptr<State> state_;

  friend class CancellationToken;
};

class CancellationToken {
public:
  CancellationToken() = default;

  [[nodiscard]] auto is_cancelled() const noexcept -> bool {
    return state_ && state_->event.is_set();
  }
  [[nodiscard]] auto reason() const noexcept -> CancelReason {
    return state_ ? state_->reason : CancelReason::None;
  }

  // Completes once the source is cancelled. A default-constructed token
  // never completes on its own.
  auto wait() const -> task<void>;

  // Sleeps for `d`. Returns true if cancellation arrived first.
  auto wait_for(std::chrono::milliseconds d) const -> task<bool>;

  [[nodiscard]] static auto none() noexcept -> CancellationToken { return {}; }

private:
  explicit CancellationToken(std::shared_ptr<CancellationSource::State> state)
      : state_(std::move(state)) {}

  std::shared_ptr<CancellationSource::State> state_;

  friend class CancellationSource;
};

inline auto CancellationSource::token() const noexcept -> CancellationToken {
  return CancellationToken{state_};
}

/// Resumable gate consulted before every dispatch. Pausing never interrupts
/// work already in flight.
class PauseGate {
public:
  explicit PauseGate(boost::asio::any_io_executor executor);

  auto pause() -> bool;
  auto resume() -> bool;
  [[nodiscard]] auto is_paused() const noexcept -> bool { return paused_; }

  auto wait_open() -> task<void>;

private:
  boost::asio::steady_timer timer_;
  bool paused_{false};
};

} // namespace planforge
