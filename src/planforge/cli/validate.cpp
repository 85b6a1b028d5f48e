#include "planforge/action/action_registry.hpp"
#include "planforge/cli/commands.hpp"
#include "planforge/cli/formatting.hpp"
#include "planforge/config/plan_definition.hpp"
#include "planforge/plan/plan_graph.hpp"
#include "planforge/util/json.hpp"
#include "planforge/util/log.hpp"

#include <cstdint>
#include <filesystem>
#include <format>
#include <print>
#include <vector>

namespace planforge::cli {

namespace {

struct ValidationResult {
  std::string plan_id;
  std::string file_path;
  std::size_t task_count{0};
  bool valid{false};
  std::string error;
};

auto validate_single_file(const std::filesystem::path &path,
                          const ActionRegistry &registry)
    -> ValidationResult {
  ValidationResult vr{.plan_id = path.stem().string(),
                      .file_path = path.string(),
                      .task_count = 0,
                      .valid = false,
                      .error = {}};

  std::string diagnostic;
  auto res =
      PlanDefinitionLoader::load_from_file(path.string(), &diagnostic)
          .and_then([&](const PlanDefinition &def) -> Result<void> {
            vr.plan_id = def.id.str();
            vr.task_count = def.tasks.size();
            return bind_plan(def, registry, &diagnostic)
                .and_then([](const std::shared_ptr<const Plan> &plan)
                              -> Result<void> {
                  return validate_plan(*plan).transform(
                      [](const PlanGraph &) {});
                });
          });

  vr.valid = res.has_value();
  if (!vr.valid) {
    vr.error = diagnostic.empty() ? res.error().message() : diagnostic;
  }
  return vr;
}

} // namespace

auto cmd_validate(const ValidateOptions &opts) -> int {
  log::set_output_stderr();
  const auto registry = ActionRegistry::with_builtins();
  std::vector<ValidationResult> results;

  for (const auto &file : opts.files) {
    if (!std::filesystem::exists(file)) {
      std::println(stderr, "Error: File does not exist: {}", file);
      return 1;
    }
    if (std::filesystem::is_directory(file)) {
      for (const auto &entry : std::filesystem::directory_iterator(file)) {
        if (!entry.is_regular_file())
          continue;
        if (entry.path().extension() != ".toml")
          continue;
        results.emplace_back(validate_single_file(entry.path(), registry));
      }
      continue;
    }
    results.emplace_back(validate_single_file(file, registry));
  }

  int valid_count = 0;
  int invalid_count = 0;

  if (opts.json) {
    JsonValue arr = std::vector<JsonValue>{};
    for (const auto &vr : results) {
      JsonValue obj{
          {"plan_id", vr.plan_id},
          {"file", vr.file_path},
          {"tasks", static_cast<std::int64_t>(vr.task_count)},
          {"valid", vr.valid},
      };
      if (!vr.valid) {
        obj.get_object().emplace("error", vr.error);
      }
      arr.get_array().emplace_back(std::move(obj));
      if (vr.valid)
        valid_count++;
      else
        invalid_count++;
    }
    JsonValue output{
        {"results", std::move(arr)},
        {"summary",
         JsonValue{
             {"valid", static_cast<std::int64_t>(valid_count)},
             {"invalid", static_cast<std::int64_t>(invalid_count)},
             {"total", static_cast<std::int64_t>(results.size())},
         }},
    };
    std::println("{}", dump_json(output));
  } else {
    for (const auto &vr : results) {
      if (vr.valid) {
        std::println("{} {} - {} ({} tasks)", fmt::ansi::green("\u2713"),
                     vr.plan_id, fmt::ansi::green("Valid"), vr.task_count);
        valid_count++;
      } else {
        std::println("{} {} - {}", fmt::ansi::red("\u2717"), vr.plan_id,
                     fmt::ansi::red(vr.error));
        invalid_count++;
      }
    }

    std::println("\nSummary: {} valid, {} invalid out of {} plan files",
                 fmt::ansi::green(std::format("{}", valid_count)),
                 invalid_count > 0
                     ? fmt::ansi::red(std::format("{}", invalid_count))
                     : std::format("{}", invalid_count),
                 results.size());
  }

  return invalid_count > 0 ? 1 : 0;
}

} // namespace planforge::cli
