#pragma once

#include "planforge/core/coroutine.hpp"
#include "planforge/core/error.hpp"
#include "planforge/util/enum.hpp"
#include "planforge/util/id.hpp"
#include "planforge/util/json.hpp"

#include <boost/describe/enum.hpp>

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <system_error>
#include <vector>

namespace planforge {

class TaskContext;

namespace task_defaults {
inline constexpr std::chrono::milliseconds kTimeout{30000};
inline constexpr int kMaxAttempts{1};
inline constexpr double kJitterRatio{0.5};
} // namespace task_defaults

enum class TaskStatus : std::uint8_t {
  Pending,
  Scheduled,
  Running,
  Paused,
  Completed,
  Failed,
  Cancelled,
  Timeout,
};
BOOST_DESCRIBE_ENUM(TaskStatus, Pending, Scheduled, Running, Paused, Completed,
                    Failed, Cancelled, Timeout)
PLANFORGE_DEFINE_ENUM_SERDE(TaskStatus, TaskStatus::Pending)

// Timeout is a failure flavour: it counts toward a failed run.
[[nodiscard]] constexpr auto is_failure(TaskStatus s) noexcept -> bool {
  return s == TaskStatus::Failed || s == TaskStatus::Timeout;
}

enum class BackoffKind : std::uint8_t { Fixed, Linear, Exponential, Jitter };
BOOST_DESCRIBE_ENUM(BackoffKind, Fixed, Linear, Exponential, Jitter)
PLANFORGE_DEFINE_ENUM_SERDE(BackoffKind, BackoffKind::Fixed)

struct RetryPolicy {
  int max_attempts{task_defaults::kMaxAttempts};
  std::chrono::milliseconds base_delay{0};
  BackoffKind backoff{BackoffKind::Fixed};
  std::optional<std::chrono::milliseconds> max_delay;
  // Empty: every failure is retryable. Otherwise the failure message must
  // contain one of these substrings.
  std::vector<std::string> retryable_errors;
  // Spread of the jitter kind around the exponential delay, in [0, 1].
  double jitter_ratio{task_defaults::kJitterRatio};
};

using TaskBody =
    std::move_only_function<task<JsonValue>(JsonValue, TaskContext) const>;
using TaskCondition =
    std::move_only_function<task<bool>(JsonValue, TaskContext) const>;
using TaskCompensation = std::move_only_function<task<void>(
    JsonValue, std::optional<JsonValue>, TaskContext) const>;

struct TaskFailure {
  std::error_code code;
  std::string message;
};

struct TaskResult {
  TaskId task_id;
  TaskStatus status{TaskStatus::Pending};
  std::optional<JsonValue> output; // empty: the task produced nothing
  std::optional<TaskFailure> error;
  std::chrono::milliseconds duration{0};
  int attempts{0};
  std::chrono::system_clock::time_point started_at;
  std::optional<std::chrono::system_clock::time_point> completed_at;
};

struct TaskSpec {
  TaskId id;
  std::string name;
  TaskBody execute;
  std::optional<RetryPolicy> retry;
  // Unset: the engine's default task timeout applies.
  std::optional<std::chrono::milliseconds> timeout;
  std::vector<TaskId> dependencies;
  TaskCondition condition;
  TaskCompensation compensate;

  struct Builder;
  static auto builder() -> Builder;
};

struct TaskSpec::Builder {
  TaskSpec spec_;

  auto id(std::string id_str) -> Builder && {
    spec_.id = TaskId{std::move(id_str)};
    return std::move(*this);
  }

  auto name(std::string n) -> Builder && {
    spec_.name = std::move(n);
    return std::move(*this);
  }

  auto execute(TaskBody body) -> Builder && {
    spec_.execute = std::move(body);
    return std::move(*this);
  }

  auto retry(RetryPolicy policy) -> Builder && {
    spec_.retry = std::move(policy);
    return std::move(*this);
  }

  auto timeout(std::chrono::milliseconds t) -> Builder && {
    spec_.timeout = t;
    return std::move(*this);
  }

  auto depends_on(std::string dep_id) -> Builder && {
    spec_.dependencies.emplace_back(std::move(dep_id));
    return std::move(*this);
  }

  auto condition(TaskCondition c) -> Builder && {
    spec_.condition = std::move(c);
    return std::move(*this);
  }

  auto compensate(TaskCompensation c) -> Builder && {
    spec_.compensate = std::move(c);
    return std::move(*this);
  }

  [[nodiscard]] auto build() && -> Result<TaskSpec> {
    if (!is_valid_id_text(spec_.id.value()) || !spec_.execute) {
      return fail(Error::InvalidArgument);
    }
    if (spec_.timeout && spec_.timeout->count() <= 0) {
      return fail(Error::InvalidArgument);
    }
    if (spec_.retry) {
      const auto &r = *spec_.retry;
      if (r.max_attempts < 1 || r.base_delay.count() < 0 ||
          (r.max_delay && r.max_delay->count() < 0) || r.jitter_ratio < 0.0 ||
          r.jitter_ratio > 1.0) {
        return fail(Error::InvalidArgument);
      }
    }
    if (spec_.name.empty()) {
      spec_.name = spec_.id.str();
    }
    return ok(std::move(spec_));
  }
};

inline auto TaskSpec::builder() -> Builder { return {}; }

} // namespace planforge
