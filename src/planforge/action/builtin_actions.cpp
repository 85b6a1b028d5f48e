#include "planforge/action/action_registry.hpp"

#include "planforge/engine/task_context.hpp"
#include "planforge/util/log.hpp"

#include <chrono>
#include <cstdint>
#include <format>
#include <optional>
#include <stdexcept>
#include <string>

namespace planforge {
namespace {

// Bodies are plain coroutine functions taking everything by value, so no
// frame ever points back into the closure that created it.

auto echo(std::optional<JsonValue> value, JsonValue input, TaskContext)
    -> task<JsonValue> {
  co_return value ? std::move(*value) : std::move(input);
}

auto sleep_for(std::chrono::milliseconds delay, JsonValue input,
               TaskContext ctx) -> task<JsonValue> {
  if (!co_await ctx.sleep(delay)) {
    throw std::runtime_error("sleep interrupted");
  }
  ctx.record_metric("slept_ms", static_cast<double>(delay.count()));
  co_return input;
}

auto increment(std::int64_t amount, JsonValue input, TaskContext)
    -> task<JsonValue> {
  auto n = json_to_int(input);
  if (!n) {
    throw std::invalid_argument(
        std::format("increment expects an integer input, got {}",
                    dump_json(input)));
  }
  co_return JsonValue(*n + amount);
}

auto fail_with(std::string message, JsonValue, TaskContext)
    -> task<JsonValue> {
  throw std::runtime_error(message);
  co_return JsonValue{};
}

auto flaky(int fail_times, std::string message,
           std::optional<JsonValue> value, JsonValue input, TaskContext ctx)
    -> task<JsonValue> {
  if (ctx.attempt() <= fail_times) {
    throw std::runtime_error(std::format("{} (attempt {})", message,
                                         ctx.attempt()));
  }
  co_return value ? std::move(*value) : std::move(input);
}

auto log_message(std::string message, JsonValue input, TaskContext ctx)
    -> task<JsonValue> {
  ctx.log(log::Level::Info, message);
  co_return input;
}

auto log_compensation(JsonValue, std::optional<JsonValue> output,
                      TaskContext ctx) -> task<void> {
  ctx.log(log::Level::Warn,
          std::format("compensating (output: {})",
                      output ? dump_json(*output) : std::string{"none"}));
  co_return;
}

} // namespace

auto make_log_compensation() -> TaskCompensation {
  return [](JsonValue input, std::optional<JsonValue> output,
            TaskContext ctx) {
    return log_compensation(std::move(input), std::move(output),
                            std::move(ctx));
  };
}

auto register_builtin_actions(ActionRegistry &registry) -> void {
  auto add = [&](std::string name, ActionFactory factory) {
    if (auto r = registry.register_action(name, std::move(factory)); !r) {
      log::warn("action '{}' not registered: {}", name, r.error().message());
    }
  };

  add("echo", [](const ActionParams &p) -> Result<TaskBody> {
    return ok(TaskBody{[value = p.value](JsonValue input, TaskContext ctx) {
      return echo(value, std::move(input), std::move(ctx));
    }});
  });

  add("sleep", [](const ActionParams &p) -> Result<TaskBody> {
    return ok(TaskBody{[delay = p.delay](JsonValue input, TaskContext ctx) {
      return sleep_for(delay, std::move(input), std::move(ctx));
    }});
  });

  add("increment", [](const ActionParams &p) -> Result<TaskBody> {
    return ok(TaskBody{[amount = p.amount](JsonValue input, TaskContext ctx) {
      return increment(amount, std::move(input), std::move(ctx));
    }});
  });

  add("fail", [](const ActionParams &p) -> Result<TaskBody> {
    auto message = p.message.empty() ? std::string{"Task failed"} : p.message;
    return ok(TaskBody{[message](JsonValue input, TaskContext ctx) {
      return fail_with(message, std::move(input), std::move(ctx));
    }});
  });

  add("flaky", [](const ActionParams &p) -> Result<TaskBody> {
    auto message =
        p.message.empty() ? std::string{"Transient failure"} : p.message;
    return ok(TaskBody{[fail_times = p.fail_times, message,
                        value = p.value](JsonValue input, TaskContext ctx) {
      return flaky(fail_times, message, value, std::move(input),
                   std::move(ctx));
    }});
  });

  add("log", [](const ActionParams &p) -> Result<TaskBody> {
    return ok(TaskBody{[message = p.message](JsonValue input,
                                             TaskContext ctx) {
      return log_message(message, std::move(input), std::move(ctx));
    }});
  });
}

} // namespace planforge
