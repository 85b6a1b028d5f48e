#include "planforge/config/plan_definition.hpp"
#include "planforge/config/toml_util.hpp"

#include "planforge/plan/plan_graph.hpp"
#include "planforge/util/enum.hpp"
#include "planforge/util/log.hpp"

#include <glaze/toml.hpp>

#include <cstddef>
#include <format>
#include <iterator>
#include <string>
#include <string_view>
#include <vector>

namespace planforge {
namespace detail {

struct DefaultsToml {
  std::int64_t timeout_ms{0};
  int max_attempts{0};
  std::int64_t base_delay_ms{-1};
  std::int64_t max_delay_ms{0};
  std::string backoff;
};

struct PlanTaskToml {
  std::string id;
  std::string name;
  std::string action;
  std::vector<std::string> depends_on;
  std::int64_t timeout_ms{0};
  int max_attempts{0};
  std::int64_t base_delay_ms{-1};
  std::int64_t max_delay_ms{0};
  std::string backoff;
  std::vector<std::string> retry_on;

  std::string value;
  std::int64_t delay_ms{0};
  std::int64_t amount{1};
  std::string message;
  int fail_times{0};
  std::string compensate;
};

struct PlanToml {
  std::string id;
  std::string name;
  std::string description;
  std::string strategy{"sequential"};
  std::int64_t global_timeout_ms{0};
  DefaultsToml defaults{};
  std::vector<PlanTaskToml> tasks;
};

} // namespace detail
} // namespace planforge

namespace glz {
template <> struct meta<planforge::detail::DefaultsToml> {
  using T = planforge::detail::DefaultsToml;
  static constexpr auto value =
      object("timeout_ms", &T::timeout_ms, "max_attempts", &T::max_attempts,
             "base_delay_ms", &T::base_delay_ms, "max_delay_ms",
             &T::max_delay_ms, "backoff", &T::backoff);
};

template <> struct meta<planforge::detail::PlanTaskToml> {
  using T = planforge::detail::PlanTaskToml;
  static constexpr auto value = object(
      "id", &T::id, "name", &T::name, "action", &T::action, "depends_on",
      &T::depends_on, "timeout_ms", &T::timeout_ms, "max_attempts",
      &T::max_attempts, "base_delay_ms", &T::base_delay_ms, "max_delay_ms",
      &T::max_delay_ms, "backoff", &T::backoff, "retry_on", &T::retry_on,
      "value", &T::value, "delay_ms", &T::delay_ms, "amount", &T::amount,
      "message", &T::message, "fail_times", &T::fail_times, "compensate",
      &T::compensate);
};

template <> struct meta<planforge::detail::PlanToml> {
  using T = planforge::detail::PlanToml;
  static constexpr auto value =
      object("id", &T::id, "name", &T::name, "description", &T::description,
             "strategy", &T::strategy, "global_timeout_ms",
             &T::global_timeout_ms, "defaults", &T::defaults, "tasks",
             &T::tasks);
};
} // namespace glz

namespace planforge {
namespace {

// Task-level settings override [defaults]; zero (or -1 for delays) means
// "not set here".
[[nodiscard]] auto parse_retry(const detail::PlanTaskToml &raw,
                               const detail::DefaultsToml &defaults,
                               std::vector<std::string> &errors)
    -> std::optional<RetryPolicy> {
  const int max_attempts =
      raw.max_attempts != 0 ? raw.max_attempts : defaults.max_attempts;
  const auto base_delay =
      raw.base_delay_ms >= 0 ? raw.base_delay_ms : defaults.base_delay_ms;
  const auto max_delay =
      raw.max_delay_ms != 0 ? raw.max_delay_ms : defaults.max_delay_ms;
  const auto &backoff = !raw.backoff.empty() ? raw.backoff : defaults.backoff;

  if (max_attempts == 0 && base_delay < 0 && max_delay == 0 &&
      backoff.empty() && raw.retry_on.empty()) {
    return std::nullopt;
  }

  RetryPolicy policy{};
  if (max_attempts != 0) {
    policy.max_attempts = max_attempts;
  }
  if (base_delay >= 0) {
    policy.base_delay = std::chrono::milliseconds(base_delay);
  }
  if (max_delay > 0) {
    policy.max_delay = std::chrono::milliseconds(max_delay);
  }
  if (!backoff.empty()) {
    if (auto kind = util::try_parse_enum<BackoffKind>(backoff)) {
      policy.backoff = *kind;
    } else {
      errors.emplace_back(
          std::format("Task '{}': unknown backoff '{}'", raw.id, backoff));
    }
  }
  policy.retryable_errors = raw.retry_on;

  if (policy.max_attempts < 1) {
    errors.emplace_back(
        std::format("Task '{}': max_attempts must be at least 1", raw.id));
  }
  if (max_delay < 0) {
    errors.emplace_back(
        std::format("Task '{}': negative max_delay_ms not allowed", raw.id));
  }
  return policy;
}

[[nodiscard]] auto parse_task(const detail::PlanTaskToml &raw,
                              const detail::DefaultsToml &defaults,
                              std::vector<std::string> &errors)
    -> TaskDefinition {
  TaskDefinition task{};
  task.id = TaskId(raw.id);
  task.name = raw.name.empty() ? raw.id : raw.name;
  task.action = raw.action;
  task.compensate = raw.compensate;

  const auto timeout_ms =
      raw.timeout_ms != 0 ? raw.timeout_ms : defaults.timeout_ms;
  if (timeout_ms > 0) {
    task.timeout = std::chrono::milliseconds(timeout_ms);
  } else if (timeout_ms < 0) {
    errors.emplace_back(
        std::format("Task '{}': negative timeout not allowed", raw.id));
  }

  task.retry = parse_retry(raw, defaults, errors);

  task.depends_on.reserve(raw.depends_on.size());
  for (const auto &dep : raw.depends_on) {
    task.depends_on.emplace_back(dep);
  }

  if (!raw.value.empty()) {
    if (auto value = parse_json(raw.value)) {
      task.params.value = std::move(*value);
    } else {
      errors.emplace_back(
          std::format("Task '{}': value is not valid JSON", raw.id));
    }
  }
  if (raw.delay_ms < 0) {
    errors.emplace_back(
        std::format("Task '{}': negative delay_ms not allowed", raw.id));
  }
  if (raw.fail_times < 0) {
    errors.emplace_back(
        std::format("Task '{}': negative fail_times not allowed", raw.id));
  }
  task.params.delay = std::chrono::milliseconds(raw.delay_ms);
  task.params.amount = raw.amount;
  task.params.message = raw.message;
  task.params.fail_times = raw.fail_times;
  return task;
}

[[nodiscard]] auto validate_definition(const PlanDefinition &def)
    -> std::vector<std::string> {
  std::vector<std::string> errors;

  if (def.tasks.empty()) {
    errors.emplace_back("Plan must have at least one task");
    return errors;
  }

  PlanGraph graph;
  for (const auto &task : def.tasks) {
    if (task.id.empty()) {
      errors.emplace_back("Task ID cannot be empty");
      continue;
    }
    if (!is_valid_id_text(task.id.value())) {
      errors.emplace_back(
          std::format("Task ID '{}' contains control characters", task.id));
      continue;
    }
    if (!graph.add_node(task.id)) {
      errors.emplace_back(std::format("Duplicate task ID: '{}'", task.id));
    }
    if (task.action.empty()) {
      errors.emplace_back(
          std::format("Task '{}': action cannot be empty", task.id));
    }
    if (!task.compensate.empty() && task.compensate != "log") {
      errors.emplace_back(std::format("Task '{}': unknown compensation '{}'",
                                      task.id, task.compensate));
    }
  }

  for (const auto &task : def.tasks) {
    if (!graph.has_node(task.id)) {
      continue;
    }
    for (const auto &dep : task.depends_on) {
      if (dep == task.id) {
        errors.emplace_back(
            std::format("Task '{}': self-dependency not allowed", task.id));
      } else if (!graph.has_node(dep)) {
        errors.emplace_back(std::format("Task '{}': dependency '{}' not found",
                                        task.id, dep));
      } else if (!graph.add_edge(graph.index_of(dep),
                                 graph.index_of(task.id))) {
        errors.emplace_back(std::format(
            "Task '{}': invalid dependency on '{}'", task.id, dep));
      }
    }
  }

  if (errors.empty() && !graph.is_acyclic()) {
    errors.emplace_back("Circular dependency detected");
  }
  if (errors.empty() && def.strategy != Strategy::Dag) {
    for (const auto &task : def.tasks) {
      if (!task.depends_on.empty()) {
        log::warn("Plan '{}': task '{}' declares dependencies, ignored by "
                  "the {} strategy",
                  def.id, task.id, to_string_view(def.strategy));
      }
    }
  }

  return errors;
}

auto report_errors(const std::vector<std::string> &errors,
                   std::string *diagnostic) -> void {
  if (diagnostic) {
    std::string joined;
    for (std::size_t i = 0; i < errors.size(); ++i) {
      if (i > 0) {
        joined += "; ";
      }
      joined += errors[i];
    }
    *diagnostic = std::move(joined);
  }
  for (const auto &err : errors) {
    log::error("Plan validation error: {}", err);
  }
}

[[nodiscard]] auto parse_definition_from_text(std::string_view text,
                                              std::string *diagnostic)
    -> Result<PlanDefinition> {
  auto raw_result = toml_util::parse_toml<detail::PlanToml>(text, diagnostic);
  if (!raw_result) {
    return fail(raw_result.error());
  }
  auto &raw = *raw_result;

  if (raw.id.empty()) {
    constexpr auto kErr =
        "Plan parse error: missing required top-level field 'id'\n"
        "Hint: add `id = \"your_plan_id\"` before any [[tasks]] section.";
    log::error("{}", kErr);
    if (diagnostic) {
      *diagnostic = kErr;
    }
    return fail(Error::InvalidArgument);
  }

  std::vector<std::string> errors;
  PlanDefinition def{};
  def.id = PlanId(raw.id);
  def.name = raw.name.empty() ? raw.id : raw.name;
  def.description = raw.description;
  if (auto strategy = util::try_parse_enum<Strategy>(raw.strategy)) {
    def.strategy = *strategy;
  } else {
    errors.emplace_back(std::format("Unknown strategy '{}'", raw.strategy));
  }
  if (raw.global_timeout_ms > 0) {
    def.global_timeout = std::chrono::milliseconds(raw.global_timeout_ms);
  } else if (raw.global_timeout_ms < 0) {
    errors.emplace_back("Negative global_timeout_ms not allowed");
  }

  def.tasks.reserve(raw.tasks.size());
  for (std::size_t i = 0; i < raw.tasks.size(); ++i) {
    const auto &task_raw = raw.tasks[i];
    if (task_raw.id.empty()) {
      if (diagnostic) {
        *diagnostic = std::format(
            "Plan parse error: task #{} is missing required field 'id'\n"
            "Hint: add `id = \"task_name\"` under [[tasks]].",
            i + 1);
      }
      return fail(Error::InvalidArgument);
    }
    def.tasks.emplace_back(parse_task(task_raw, raw.defaults, errors));
  }

  if (!errors.empty()) {
    // Reported together with the structural checks below.
    auto structural = validate_definition(def);
    errors.insert(errors.end(), std::make_move_iterator(structural.begin()),
                  std::make_move_iterator(structural.end()));
    report_errors(errors, diagnostic);
    return fail(Error::InvalidArgument);
  }

  return ok(std::move(def));
}

} // namespace

auto PlanDefinition::find_task(const TaskId &task_id) const
    -> const TaskDefinition * {
  for (const auto &t : tasks) {
    if (t.id == task_id) {
      return &t;
    }
  }
  return nullptr;
}

auto PlanDefinitionLoader::load_from_file(std::string_view path,
                                          std::string *diagnostic)
    -> Result<PlanDefinition> {
  auto text = toml_util::read_file(path, diagnostic);
  if (!text) {
    return fail(text.error());
  }

  return load_from_string(*text, diagnostic);
}

auto PlanDefinitionLoader::load_from_string(std::string_view toml_str,
                                            std::string *diagnostic)
    -> Result<PlanDefinition> {
  try {
    auto result = parse_definition_from_text(toml_str, diagnostic);
    if (!result) {
      return fail(result.error());
    }

    auto errors = validate_definition(*result);
    if (!errors.empty()) {
      report_errors(errors, diagnostic);
      return fail(Error::InvalidArgument);
    }

    return result;
  } catch (const std::exception &e) {
    log::error("TOML parse error: {}", e.what());
    if (diagnostic) {
      *diagnostic = e.what();
    }
    return fail(Error::ParseError);
  }
}

} // namespace planforge
