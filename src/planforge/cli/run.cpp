#include "planforge/action/action_registry.hpp"
#include "planforge/cli/commands.hpp"
#include "planforge/cli/formatting.hpp"
#include "planforge/config/config.hpp"
#include "planforge/config/plan_definition.hpp"
#include "planforge/engine/engine.hpp"
#include "planforge/util/json.hpp"
#include "planforge/util/log.hpp"

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/asio/use_future.hpp>

#include <csignal>
#include <format>
#include <optional>
#include <print>
#include <string>

namespace planforge::cli {

namespace {

template <typename T>
auto run_async(boost::asio::io_context &io, task<T> op) -> T {
  auto fut = boost::asio::co_spawn(io, std::move(op), boost::asio::use_future);
  io.run();
  io.restart();
  return fut.get();
}

// Flushes the async logger on every exit path.
class LoggerSession {
public:
  LoggerSession() { log::start(); }
  ~LoggerSession() { log::stop(); }

  LoggerSession(const LoggerSession &) = delete;
  auto operator=(const LoggerSession &) -> LoggerSession & = delete;
};

auto describe_task(const TaskResult &r) -> std::string {
  if (r.error) {
    return r.error->message;
  }
  if (r.output) {
    return dump_json(*r.output);
  }
  return r.attempts == 0 ? std::string{"skipped"} : std::string{};
}

auto print_stream_line(const TaskResult &r, bool json) -> void {
  if (json) {
    std::println("{}", dump_json(to_json(r)));
    return;
  }
  std::println("{} {:<24} {:>8}  {}", fmt::colorize_task_status(r.status),
               r.task_id.str(), fmt::format_duration(r.duration),
               fmt::ellipsize(describe_task(r), 60));
}

auto print_result(const Plan &plan, const ExecutionResult &result, bool json)
    -> void {
  if (json) {
    std::println("{}", dump_json(to_json(result)));
    return;
  }

  std::println("\nPlan:      {} ({})", fmt::ansi::bold(plan.name),
               to_string_view(plan.strategy));
  std::println("Execution: {}", result.execution_id);
  std::println("Status:    {}", fmt::colorize_run_status(result.status));
  std::println("Duration:  {}\n", fmt::format_duration(result.duration));

  fmt::Table table({{"TASK", 24},
                    {"STATUS", 10},
                    {"ATTEMPTS", 8, true},
                    {"DURATION", 10, true},
                    {"OUTPUT / ERROR", 48}});
  table.print_header();
  for (const auto &spec : plan.tasks) {
    const auto *r = result.result_for(spec.id);
    if (r == nullptr) {
      table.print_row({fmt::ellipsize(spec.id.str(), 24), fmt::ansi::dim("-"),
                       "-", "-", fmt::ansi::dim("not run")});
      continue;
    }
    table.print_row({fmt::ellipsize(spec.id.str(), 24),
                     fmt::colorize_task_status(r->status),
                     std::format("{}", r->attempts),
                     fmt::format_duration(r->duration),
                     fmt::ellipsize(describe_task(*r), 48)});
  }
}

} // namespace

auto cmd_run(const RunOptions &opts) -> int {
  log::set_output_stderr();

  auto config = opts.config_file.empty()
                    ? ConfigLoader::load_defaults()
                    : ConfigLoader::load_from_file(opts.config_file);
  if (!config) {
    std::println(stderr, "Error: failed to load config: {}",
                 config.error().message());
    return 1;
  }

  log::set_level(config->logging.level);
  if (opts.log_level) {
    if (auto level = log::parse_level(*opts.log_level)) {
      log::set_level(*level);
    } else {
      std::println(stderr, "Error: unknown log level '{}'", *opts.log_level);
      return 1;
    }
  }
  if (!config->logging.file.empty() &&
      !log::set_output_file(config->logging.file)) {
    std::println(stderr, "Error: cannot open log file {}",
                 config->logging.file);
    return 1;
  }
  LoggerSession logger_session;

  std::string diagnostic;
  auto definition =
      PlanDefinitionLoader::load_from_file(opts.plan_file, &diagnostic);
  if (!definition) {
    std::println(stderr, "Error: {}",
                 diagnostic.empty() ? definition.error().message()
                                    : diagnostic);
    return 1;
  }

  const auto registry = ActionRegistry::with_builtins();
  auto plan = bind_plan(*definition, registry, &diagnostic);
  if (!plan) {
    std::println(stderr, "Error: {}",
                 diagnostic.empty() ? plan.error().message() : diagnostic);
    return 1;
  }

  JsonValue input{};
  if (!opts.input.empty()) {
    auto parsed = parse_json(opts.input);
    if (!parsed) {
      std::println(stderr, "Error: --input is not valid JSON");
      return 1;
    }
    input = std::move(*parsed);
  }

  boost::asio::io_context io;
  ExecutionEngine engine{io.get_executor(), config->engine};

  boost::asio::signal_set signals{io, SIGINT, SIGTERM};
  signals.async_wait(
      [&engine](const boost::system::error_code &ec, int signo) {
        if (ec) {
          return;
        }
        log::warn("signal {} received, cancelling", signo);
        for (const auto &id : engine.active_runs()) {
          engine.cancel(id);
        }
      });

  std::optional<ExecutionResult> result;
  if (opts.stream) {
    auto stream = engine.execute_stream(*plan, std::move(input));
    if (!stream) {
      std::println(stderr, "Error: cannot stream plan {}: {}",
                   (*plan)->id, stream.error().message());
      return 1;
    }
    result = run_async(io, [&]() -> task<ExecutionResult> {
      while (auto settled = co_await stream->next()) {
        print_stream_line(*settled, opts.json);
      }
      auto final_result = co_await stream->result();
      signals.cancel();
      co_return final_result;
    }());
    if (!opts.json) {
      print_result(**plan, *result, false);
    }
  } else {
    result = run_async(io, [&]() -> task<ExecutionResult> {
      auto final_result = co_await engine.execute(*plan, std::move(input));
      signals.cancel();
      co_return final_result;
    }());
    print_result(**plan, *result, opts.json);
  }

  if (result->error) {
    std::println(stderr, "Error: plan rejected: {}", result->error.message());
  }
  return result->status == RunStatus::Completed ? 0 : 1;
}

} // namespace planforge::cli
