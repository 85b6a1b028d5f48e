#pragma once

#include "planforge/config/plan_definition.hpp"
#include "planforge/core/error.hpp"
#include "planforge/plan/plan.hpp"
#include "planforge/plan/task.hpp"

#include <ankerl/unordered_dense.h>

#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace planforge {

using ActionFactory =
    std::move_only_function<Result<TaskBody>(const ActionParams &) const>;

/// Named task bodies for plans loaded from files.
class ActionRegistry {
public:
  // echo, sleep, increment, fail, flaky and log.
  [[nodiscard]] static auto with_builtins() -> ActionRegistry;

  [[nodiscard]] auto register_action(std::string name, ActionFactory factory)
      -> Result<void>;
  [[nodiscard]] auto contains(std::string_view name) const -> bool;
  [[nodiscard]] auto create(std::string_view name,
                            const ActionParams &params) const
      -> Result<TaskBody>;
  // Sorted.
  [[nodiscard]] auto names() const -> std::vector<std::string>;

private:
  ankerl::unordered_dense::map<std::string, ActionFactory> factories_;
};

auto register_builtin_actions(ActionRegistry &registry) -> void;

// Compensation that only records that it ran, through the task's log hook.
[[nodiscard]] auto make_log_compensation() -> TaskCompensation;

/// Turns a definition into an executable plan. Unknown actions fail with
/// NotFound and name the offending task in `diagnostic`.
[[nodiscard]] auto bind_plan(const PlanDefinition &definition,
                             const ActionRegistry &registry,
                             std::string *diagnostic = nullptr)
    -> Result<std::shared_ptr<const Plan>>;

} // namespace planforge
