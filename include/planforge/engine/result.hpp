#pragma once

#include "planforge/plan/task.hpp"
#include "planforge/util/enum.hpp"
#include "planforge/util/id.hpp"
#include "planforge/util/json.hpp"

#include <ankerl/unordered_dense.h>
#include <boost/describe/enum.hpp>

#include <chrono>
#include <cstdint>
#include <system_error>

namespace planforge {

enum class RunStatus : std::uint8_t {
  Running,
  Paused,
  Completed,
  Failed,
  Cancelled,
  Timeout,
};
BOOST_DESCRIBE_ENUM(RunStatus, Running, Paused, Completed, Failed, Cancelled,
                    Timeout)
PLANFORGE_DEFINE_ENUM_SERDE(RunStatus, RunStatus::Running)

using ResultMap = ankerl::unordered_dense::map<TaskId, TaskResult>;

struct ExecutionResult {
  ExecutionId execution_id;
  PlanId plan_id;
  RunStatus status{RunStatus::Running};
  ResultMap results;
  std::chrono::milliseconds duration{0};
  std::chrono::system_clock::time_point started_at;
  std::chrono::system_clock::time_point completed_at;
  // Set only when the plan itself was rejected; no task ran in that case.
  std::error_code error;

  [[nodiscard]] auto result_for(const TaskId &id) const -> const TaskResult * {
    auto it = results.find(id);
    return it != results.end() ? &it->second : nullptr;
  }
};

[[nodiscard]] auto to_json(const TaskResult &result) -> JsonValue;
[[nodiscard]] auto to_json(const ExecutionResult &result) -> JsonValue;

} // namespace planforge
