#include "planforge/engine/result.hpp"

#include "planforge/util/time.hpp"

#include <algorithm>
#include <string>
#include <vector>

namespace planforge {

auto to_json(const TaskResult &result) -> JsonValue {
  JsonValue j{
      {"task_id", result.task_id.str()},
      {"status", std::string(to_string_view(result.status))},
      {"attempts", static_cast<std::int64_t>(result.attempts)},
      {"duration_ms", static_cast<std::int64_t>(result.duration.count())},
      {"started_at", util::format_iso8601(result.started_at)},
  };
  auto &obj = j.get_object();
  if (result.output) {
    obj.emplace("output", *result.output);
  }
  if (result.error) {
    obj.emplace("error", result.error->message);
  }
  if (result.completed_at) {
    obj.emplace("completed_at", util::format_iso8601(*result.completed_at));
  }
  return j;
}

auto to_json(const ExecutionResult &result) -> JsonValue {
  // Stable output: tasks sorted by id.
  std::vector<const TaskResult *> ordered;
  ordered.reserve(result.results.size());
  for (const auto &[_, r] : result.results) {
    ordered.push_back(&r);
  }
  std::ranges::sort(ordered, {}, [](const TaskResult *r) {
    return r->task_id.value();
  });

  JsonValue tasks = std::vector<JsonValue>{};
  for (const auto *r : ordered) {
    tasks.get_array().emplace_back(to_json(*r));
  }

  JsonValue j{
      {"execution_id", result.execution_id.str()},
      {"plan_id", result.plan_id.str()},
      {"status", std::string(to_string_view(result.status))},
      {"duration_ms", static_cast<std::int64_t>(result.duration.count())},
      {"started_at", util::format_iso8601(result.started_at)},
      {"completed_at", util::format_iso8601(result.completed_at)},
      {"tasks", std::move(tasks)},
  };
  if (result.error) {
    j.get_object().emplace("error", result.error.message());
  }
  return j;
}

} // namespace planforge
