#pragma once

#include "planforge/core/error.hpp"
#include "planforge/plan/plan.hpp"
#include "planforge/plan/task.hpp"
#include "planforge/util/id.hpp"
#include "planforge/util/json.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace planforge {

/// Parameters handed to an action factory. Each built-in reads the subset
/// it understands.
struct ActionParams {
  std::optional<JsonValue> value;
  std::chrono::milliseconds delay{0};
  std::int64_t amount{1};
  std::string message;
  int fail_times{0};
};

struct TaskDefinition {
  TaskId id;
  std::string name;
  std::string action;
  std::vector<TaskId> depends_on;
  std::optional<std::chrono::milliseconds> timeout;
  std::optional<RetryPolicy> retry;
  ActionParams params;
  // Empty or "log".
  std::string compensate;
};

/// A plan as written in a TOML file, before its actions are bound to code.
struct PlanDefinition {
  PlanId id;
  std::string name;
  std::string description;
  Strategy strategy{Strategy::Sequential};
  std::optional<std::chrono::milliseconds> global_timeout;
  std::vector<TaskDefinition> tasks;

  [[nodiscard]] auto find_task(const TaskId &task_id) const
      -> const TaskDefinition *;
};

class PlanDefinitionLoader {
public:
  [[nodiscard]] static auto load_from_file(std::string_view path,
                                           std::string *diagnostic = nullptr)
      -> Result<PlanDefinition>;
  [[nodiscard]] static auto load_from_string(std::string_view toml_str,
                                             std::string *diagnostic = nullptr)
      -> Result<PlanDefinition>;
};

} // namespace planforge
