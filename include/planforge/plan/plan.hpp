#pragma once

#include "planforge/core/error.hpp"
#include "planforge/plan/task.hpp"
#include "planforge/util/enum.hpp"
#include "planforge/util/id.hpp"

#include <boost/describe/enum.hpp>

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace planforge {

enum class Strategy : std::uint8_t { Sequential, Parallel, Race, All, Dag };
BOOST_DESCRIBE_ENUM(Strategy, Sequential, Parallel, Race, All, Dag)
PLANFORGE_DEFINE_ENUM_SERDE(Strategy, Strategy::Sequential)

// Race and all settle on a whole-set condition, so they have no meaningful
// per-task stream.
[[nodiscard]] constexpr auto supports_streaming(Strategy s) noexcept -> bool {
  return s == Strategy::Sequential || s == Strategy::Parallel ||
         s == Strategy::Dag;
}

using TaskResultCallback =
    std::move_only_function<void(const TaskResult &) const>;

struct Plan {
  PlanId id;
  std::string name;
  std::string description;
  Strategy strategy{Strategy::Sequential};
  std::vector<TaskSpec> tasks;
  std::optional<std::chrono::milliseconds> global_timeout;
  TaskResultCallback on_task_complete;
  TaskResultCallback on_task_error;

  [[nodiscard]] auto find_task(const TaskId &id) const -> const TaskSpec *;

  struct Builder;
  static auto builder() -> Builder;
};

struct Plan::Builder {
  Plan plan_;

  auto id(std::string id_str) -> Builder && {
    plan_.id = PlanId{std::move(id_str)};
    return std::move(*this);
  }

  auto name(std::string n) -> Builder && {
    plan_.name = std::move(n);
    return std::move(*this);
  }

  auto description(std::string d) -> Builder && {
    plan_.description = std::move(d);
    return std::move(*this);
  }

  auto strategy(Strategy s) -> Builder && {
    plan_.strategy = s;
    return std::move(*this);
  }

  auto task(TaskSpec t) -> Builder && {
    plan_.tasks.push_back(std::move(t));
    return std::move(*this);
  }

  auto global_timeout(std::chrono::milliseconds t) -> Builder && {
    plan_.global_timeout = t;
    return std::move(*this);
  }

  auto on_task_complete(TaskResultCallback cb) -> Builder && {
    plan_.on_task_complete = std::move(cb);
    return std::move(*this);
  }

  auto on_task_error(TaskResultCallback cb) -> Builder && {
    plan_.on_task_error = std::move(cb);
    return std::move(*this);
  }

  // Structural checks (duplicates, dependencies, cycles) are deferred to
  // validate_plan so that a bad graph surfaces as a failed run.
  [[nodiscard]] auto build() && -> Result<Plan> {
    if (plan_.id.empty()) {
      if (plan_.name.empty()) {
        return fail(Error::InvalidArgument);
      }
      plan_.id = PlanId{plan_.name};
    }
    if (plan_.name.empty()) {
      plan_.name = plan_.id.str();
    }
    if (plan_.global_timeout && plan_.global_timeout->count() <= 0) {
      return fail(Error::InvalidArgument);
    }
    return ok(std::move(plan_));
  }

  [[nodiscard]] auto build_shared() && -> Result<std::shared_ptr<const Plan>> {
    return std::move(*this).build().transform([](Plan &&p) {
      return std::shared_ptr<const Plan>(std::make_shared<Plan>(std::move(p)));
    });
  }
};

inline auto Plan::builder() -> Builder { return {}; }

inline auto Plan::find_task(const TaskId &id) const -> const TaskSpec * {
  for (const auto &t : tasks) {
    if (t.id == id) {
      return &t;
    }
  }
  return nullptr;
}

} // namespace planforge
