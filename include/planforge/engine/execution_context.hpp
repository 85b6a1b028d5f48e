#pragma once

#include "planforge/core/async_event.hpp"
#include "planforge/core/cancellation.hpp"
#include "planforge/core/coroutine.hpp"
#include "planforge/engine/result.hpp"
#include "planforge/plan/plan.hpp"
#include "planforge/util/id.hpp"
#include "planforge/util/json.hpp"

#include <ankerl/unordered_dense.h>
#include <boost/asio/any_io_executor.hpp>

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace planforge {

/// Per-run state: the plan, a global key/value store, the task result map,
/// the cancellation switch and the pause gate.
///
/// Single-writer: every member is touched only from the engine's executor,
/// so there is no locking. Task bodies reach the store through their own
/// TaskContext.
class ExecutionContext {
public:
  ExecutionContext(ExecutionId id, std::shared_ptr<const Plan> plan,
                   boost::asio::any_io_executor executor);

  ExecutionContext(const ExecutionContext &) = delete;
  auto operator=(const ExecutionContext &) -> ExecutionContext & = delete;

  [[nodiscard]] auto id() const noexcept -> const ExecutionId & { return id_; }
  [[nodiscard]] auto plan() const noexcept -> const Plan & { return *plan_; }
  [[nodiscard]] auto executor() const -> boost::asio::any_io_executor {
    return executor_;
  }
  [[nodiscard]] auto started_at() const noexcept
      -> std::chrono::system_clock::time_point {
    return started_at_;
  }
  [[nodiscard]] auto started_steady() const noexcept
      -> std::chrono::steady_clock::time_point {
    return started_steady_;
  }

  [[nodiscard]] auto get_global(std::string_view key) const
      -> std::optional<JsonValue>;
  auto set_global(std::string key, JsonValue value) -> void;

  [[nodiscard]] auto task_result(const TaskId &task_id) const
      -> const TaskResult *;
  [[nodiscard]] auto results() const noexcept -> const ResultMap & {
    return results_;
  }
  // Overwrites the task's slot; there is exactly one result per task.
  auto record_result(TaskResult result) -> void;
  [[nodiscard]] auto has_failures() const -> bool;

  auto cancel(CancelReason reason) -> bool;
  [[nodiscard]] auto is_cancelled() const noexcept -> bool {
    return cancel_.is_cancelled();
  }
  [[nodiscard]] auto cancel_reason() const noexcept -> CancelReason {
    return cancel_.reason();
  }
  [[nodiscard]] auto cancellation_token() const noexcept
      -> CancellationToken {
    return cancel_.token();
  }

  auto pause() -> bool;
  auto resume() -> bool;
  [[nodiscard]] auto is_paused() const noexcept -> bool {
    return gate_.is_paused();
  }

  // Suspends while paused. Returns false once the run is cancelled, in
  // which case nothing new may be dispatched.
  auto wait_runnable() -> task<bool>;

  [[nodiscard]] auto status() const noexcept -> RunStatus { return status_; }
  auto set_status(RunStatus status) noexcept -> void { status_ = status; }

  // Set once the driver has returned; the global timeout watchdog waits on
  // it.
  [[nodiscard]] auto settled() noexcept -> AsyncEvent & { return settled_; }

private:
  ExecutionId id_;
  std::shared_ptr<const Plan> plan_;
  boost::asio::any_io_executor executor_;
  std::chrono::system_clock::time_point started_at_;
  std::chrono::steady_clock::time_point started_steady_;

  ankerl::unordered_dense::map<std::string, JsonValue> store_;
  ResultMap results_;

  CancellationSource cancel_;
  PauseGate gate_;
  AsyncEvent settled_;
  RunStatus status_{RunStatus::Running};
};

} // namespace planforge
