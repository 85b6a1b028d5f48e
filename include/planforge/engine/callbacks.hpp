#pragma once

#include "planforge/engine/result.hpp"
#include "planforge/plan/task.hpp"
#include "planforge/util/id.hpp"
#include "planforge/util/log.hpp"

#include <chrono>
#include <exception>
#include <functional>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

namespace planforge {

struct Plan;

using MetricTags = std::vector<std::pair<std::string, std::string>>;

/// Observability hooks. All optional; invoked on the engine's executor.
/// A throwing hook is logged and otherwise ignored.
struct EngineCallbacks {
  std::move_only_function<void(const ExecutionId &, const Plan &)>
      on_run_started;
  std::move_only_function<void(const ExecutionResult &)> on_run_completed;
  // The plan was rejected before any task ran.
  std::move_only_function<void(const ExecutionId &, std::error_code)>
      on_run_failed;
  std::move_only_function<void(const ExecutionId &)> on_run_cancelled;

  std::move_only_function<void(const ExecutionId &, const TaskId &,
                               int attempt)>
      on_task_started;
  std::move_only_function<void(const ExecutionId &, const TaskResult &)>
      on_task_completed;
  // One call per failed attempt, including the final one.
  std::move_only_function<void(const ExecutionId &, const TaskId &,
                               int attempt, const TaskFailure &)>
      on_task_failed;
  std::move_only_function<void(const ExecutionId &, const TaskId &,
                               int attempt, std::chrono::milliseconds delay)>
      on_task_retry;
  std::move_only_function<void(const ExecutionId &, const TaskId &,
                               std::string_view error)>
      on_compensation_failed;

  std::move_only_function<void(const ExecutionId &, const TaskId &,
                               log::Level, std::string_view message)>
      on_task_log;
  std::move_only_function<void(const ExecutionId &, const TaskId &,
                               std::string_view name, double value,
                               const MetricTags &tags)>
      on_task_metric;
};

namespace detail {

template <typename Fn, typename... Args>
auto invoke_hook(Fn &hook, std::string_view hook_name, Args &&...args)
    -> void {
  if (!hook) {
    return;
  }
  try {
    hook(std::forward<Args>(args)...);
  } catch (const std::exception &e) {
    log::error("hook {} threw: {}", hook_name, e.what());
  } catch (...) {
    log::error("hook {} threw a non-standard exception", hook_name);
  }
}

} // namespace detail

} // namespace planforge
