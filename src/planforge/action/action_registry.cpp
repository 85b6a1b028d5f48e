#include "planforge/action/action_registry.hpp"

#include "planforge/util/log.hpp"

#include <algorithm>
#include <format>

namespace planforge {

auto ActionRegistry::with_builtins() -> ActionRegistry {
  ActionRegistry registry;
  register_builtin_actions(registry);
  return registry;
}

auto ActionRegistry::register_action(std::string name, ActionFactory factory)
    -> Result<void> {
  if (name.empty() || !factory) {
    return fail(Error::InvalidArgument);
  }
  if (!factories_.try_emplace(std::move(name), std::move(factory)).second) {
    return fail(Error::AlreadyExists);
  }
  return ok();
}

auto ActionRegistry::contains(std::string_view name) const -> bool {
  return factories_.contains(std::string(name));
}

auto ActionRegistry::create(std::string_view name,
                            const ActionParams &params) const
    -> Result<TaskBody> {
  auto it = factories_.find(std::string(name));
  if (it == factories_.end()) {
    return fail(Error::NotFound);
  }
  return it->second(params);
}

auto ActionRegistry::names() const -> std::vector<std::string> {
  std::vector<std::string> out;
  out.reserve(factories_.size());
  for (const auto &[name, factory] : factories_) {
    out.push_back(name);
  }
  std::ranges::sort(out);
  return out;
}

auto bind_plan(const PlanDefinition &definition,
               const ActionRegistry &registry, std::string *diagnostic)
    -> Result<std::shared_ptr<const Plan>> {
  auto report = [&](std::string message, Error e) {
    log::error("Plan '{}': {}", definition.id, message);
    if (diagnostic) {
      *diagnostic = std::move(message);
    }
    return fail(e);
  };

  auto builder = Plan::builder()
                     .id(definition.id.str())
                     .name(definition.name)
                     .description(definition.description)
                     .strategy(definition.strategy);
  if (definition.global_timeout) {
    builder.global_timeout(*definition.global_timeout);
  }

  for (const auto &def : definition.tasks) {
    auto body = registry.create(def.action, def.params);
    if (!body) {
      return report(std::format("Task '{}': unknown action '{}'", def.id,
                                def.action),
                    Error::NotFound);
    }

    auto task = TaskSpec::builder()
                    .id(def.id.str())
                    .name(def.name)
                    .execute(std::move(*body));
    if (def.timeout) {
      task.timeout(*def.timeout);
    }
    if (def.retry) {
      task.retry(*def.retry);
    }
    for (const auto &dep : def.depends_on) {
      task.depends_on(dep.str());
    }
    if (def.compensate == "log") {
      task.compensate(make_log_compensation());
    }

    auto spec = std::move(task).build();
    if (!spec) {
      return report(std::format("Task '{}': {}", def.id,
                                spec.error().message()),
                    Error::InvalidArgument);
    }
    builder.task(std::move(*spec));
  }

  return std::move(builder).build_shared();
}

} // namespace planforge
