#pragma once

#include "planforge/core/coroutine.hpp"
#include "planforge/engine/callbacks.hpp"
#include "planforge/plan/task.hpp"
#include "planforge/util/json.hpp"

#include <chrono>
#include <expected>
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace planforge {

class ExecutionContext;

/// Runs one task to its final result: condition check, bounded retry loop
/// with backoff, per-attempt timeout, cancellation and compensation.
///
/// A task's failure never escapes run(); it is folded into the returned
/// TaskResult.
class TaskRunner {
public:
  // Receives intermediate snapshots (status running) as attempts start.
  using ProgressFn = std::function<void(const TaskResult &)>;

  TaskRunner(std::shared_ptr<ExecutionContext> run,
             std::shared_ptr<EngineCallbacks> callbacks,
             std::chrono::milliseconds default_timeout);

  auto run(const TaskSpec &spec, JsonValue input, ProgressFn progress = {})
      -> task<TaskResult>;

  // Best-effort rollback. Bounded by the task's timeout; failures are
  // logged and reported through on_compensation_failed only.
  auto compensate(const TaskSpec &spec, JsonValue input,
                  std::optional<JsonValue> output, int attempt) -> task<void>;

  [[nodiscard]] auto timeout_for(const TaskSpec &spec) const noexcept
      -> std::chrono::milliseconds {
    return spec.timeout.value_or(default_timeout_);
  }

private:
  enum class AttemptEnd { Succeeded, Failed, TimedOut, Cancelled };

  struct AttemptOutcome {
    AttemptEnd end{AttemptEnd::Failed};
    JsonValue output;
    std::string message;
  };

  auto attempt(const TaskSpec &spec, const JsonValue &input, int attempt_no)
      -> task<AttemptOutcome>;
  auto evaluate_condition(const TaskSpec &spec, const JsonValue &input,
                          int attempt_no)
      -> task<std::expected<bool, std::string>>;

  std::shared_ptr<ExecutionContext> run_;
  std::shared_ptr<EngineCallbacks> callbacks_;
  std::chrono::milliseconds default_timeout_;
};

} // namespace planforge
