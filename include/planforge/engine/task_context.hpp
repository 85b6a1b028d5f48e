#pragma once

#include "planforge/core/async_event.hpp"
#include "planforge/core/cancellation.hpp"
#include "planforge/core/coroutine.hpp"
#include "planforge/engine/callbacks.hpp"
#include "planforge/util/id.hpp"
#include "planforge/util/json.hpp"
#include "planforge/util/log.hpp"

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/cancellation_signal.hpp>

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace planforge {

class ExecutionContext;

namespace detail {

// Abandonment switch for one attempt. Flipped when the attempt loses to its
// timer or to run cancellation; also delivers a terminal cancellation into
// the body's coroutine so its pending operation is interrupted.
struct AttemptControl {
  explicit AttemptControl(boost::asio::any_io_executor executor)
      : abandoned(std::move(executor)) {}

  auto abandon() -> void {
    if (abandoned.is_set()) {
      return;
    }
    abandoned.set();
    body_signal.emit(boost::asio::cancellation_type::terminal);
  }

  AsyncEvent abandoned;
  boost::asio::cancellation_signal body_signal;
};

} // namespace detail

/// Handle given to a task body for one attempt.
///
/// Copyable; copies share the same attempt. State written through get/set
/// lives in the run's store under `task:<task id>:<key>`, so tasks cannot
/// clobber each other's keys.
///
/// Bodies are expected to observe cancellation at their own suspension
/// points (`sleep`, `is_cancelled`). The engine stops waiting for an
/// abandoned body but cannot stop code that never suspends.
class TaskContext {
public:
  TaskContext(std::shared_ptr<ExecutionContext> run, TaskId task_id,
              int attempt, std::shared_ptr<detail::AttemptControl> control,
              std::shared_ptr<EngineCallbacks> callbacks);

  [[nodiscard]] auto task_id() const noexcept -> const TaskId & {
    return task_id_;
  }
  [[nodiscard]] auto execution_id() const noexcept -> const ExecutionId &;
  [[nodiscard]] auto attempt() const noexcept -> int { return attempt_; }
  [[nodiscard]] auto started_at() const noexcept
      -> std::chrono::system_clock::time_point {
    return started_at_;
  }
  [[nodiscard]] auto executor() const -> boost::asio::any_io_executor;

  [[nodiscard]] auto get(std::string_view key) const
      -> std::optional<JsonValue>;
  auto set(std::string_view key, JsonValue value) const -> void;

  [[nodiscard]] static auto state_key(const TaskId &task_id,
                                      std::string_view key) -> std::string;

  // True once the run is cancelled or this attempt has been abandoned.
  [[nodiscard]] auto is_cancelled() const noexcept -> bool;
  [[nodiscard]] auto cancellation_token() const -> CancellationToken;

  // Sleeps for `d`. Returns false if the attempt was abandoned first.
  auto sleep(std::chrono::milliseconds d) const -> task<bool>;

  auto log(log::Level level, std::string_view message) const -> void;
  auto record_metric(std::string_view name, double value,
                     const MetricTags &tags = {}) const -> void;

private:
  std::shared_ptr<ExecutionContext> run_;
  TaskId task_id_;
  int attempt_{1};
  std::chrono::system_clock::time_point started_at_;
  std::shared_ptr<detail::AttemptControl> control_;
  std::shared_ptr<EngineCallbacks> callbacks_;
};

} // namespace planforge
