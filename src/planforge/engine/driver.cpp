#include "planforge/engine/driver.hpp"

#include "planforge/engine/execution_context.hpp"
#include "planforge/util/log.hpp"

#include <algorithm>
#include <deque>
#include <exception>
#include <format>
#include <optional>
#include <string>

namespace planforge {

StrategyDriver::StrategyDriver(std::shared_ptr<ExecutionContext> run,
                               std::shared_ptr<EngineCallbacks> callbacks,
                               const PlanGraph &graph,
                               std::chrono::milliseconds default_timeout,
                               SettleSink sink)
    : run_(std::move(run)), callbacks_(std::move(callbacks)), graph_(graph),
      runner_(std::make_shared<TaskRunner>(run_, callbacks_, default_timeout)),
      channel_(std::make_shared<SettlementChannel>(
          run_->executor(), std::max<std::size_t>(1, graph.size()))),
      sink_(std::move(sink)) {}

auto StrategyDriver::run(JsonValue input) -> task<void> {
  log::debug("execution {}: {} strategy over {} task(s)", run_->id(),
             to_string_view(run_->plan().strategy), graph_.size());
  switch (run_->plan().strategy) {
  case Strategy::Sequential:
    co_await run_sequential(std::move(input));
    break;
  case Strategy::Parallel:
    co_await run_parallel(input);
    break;
  case Strategy::All:
    co_await run_all(input);
    break;
  case Strategy::Race:
    co_await run_race(input);
    break;
  case Strategy::Dag:
    co_await run_dag(input);
    break;
  }
}

auto StrategyDriver::dag_input(
    std::span<const NodeIndex> deps, const JsonValue &plan_input,
    const std::vector<std::optional<JsonValue>> &outputs) -> JsonValue {
  if (deps.empty()) {
    return plan_input;
  }
  if (deps.size() == 1) {
    return outputs[deps.front()].value_or(JsonValue{});
  }
  JsonValue arr = JsonArray{};
  for (auto dep : deps) {
    arr.get_array().emplace_back(outputs[dep].value_or(JsonValue{}));
  }
  return arr;
}

auto StrategyDriver::progress_recorder() const -> TaskRunner::ProgressFn {
  return [run = run_](const TaskResult &snapshot) {
    run->record_result(snapshot);
  };
}

auto StrategyDriver::settle(TaskResult result) -> void {
  const auto &plan = run_->plan();
  detail::invoke_hook(callbacks_->on_task_completed, "on_task_completed",
                      run_->id(), result);
  detail::invoke_hook(plan.on_task_complete, "on_task_complete", result);
  if (is_failure(result.status)) {
    detail::invoke_hook(plan.on_task_error, "on_task_error", result);
  }
  if (sink_) {
    sink_(result);
  }
  run_->record_result(std::move(result));
}

auto StrategyDriver::dispatch(NodeIndex node, JsonValue input,
                              bool track_progress) -> void {
  ++in_flight_;
  TaskRunner::ProgressFn progress;
  if (track_progress) {
    progress = progress_recorder();
  }
  co_spawn(
      run_->executor(),
      [runner = runner_, channel = channel_, run = run_, node,
       input = std::move(input),
       progress = std::move(progress)]() mutable -> spawn_task {
        const auto &spec = run->plan().tasks[node];
        TaskResult result;
        std::optional<std::string> runner_error;
        try {
          result = co_await runner->run(spec, std::move(input),
                                        std::move(progress));
        } catch (const std::exception &e) {
          runner_error = e.what();
        } catch (...) {
          runner_error = "unknown error";
        }
        if (runner_error) {
          log::error("execution {} task {}: runner failed: {}", run->id(),
                     spec.id, *runner_error);
          result.task_id = spec.id;
          result.status = TaskStatus::Failed;
          result.error = TaskFailure{make_error_code(Error::Unknown),
                                     std::move(*runner_error)};
          result.completed_at = std::chrono::system_clock::now();
        }
        if (!channel->try_send(boost::system::error_code{},
                               Settlement{node, std::move(result)})) {
          log::error("execution {} task {}: settlement dropped", run->id(),
                     spec.id);
        }
      },
      detached);
}

auto StrategyDriver::next_settlement() -> task<std::optional<Settlement>> {
  auto [ec, settlement] = co_await channel_->async_receive(use_nothrow);
  if (ec) {
    log::error("execution {}: settlement channel failed: {}", run_->id(),
               ec.message());
    co_return std::nullopt;
  }
  --in_flight_;
  co_return std::move(settlement);
}

auto StrategyDriver::drain() -> task<void> {
  while (in_flight_ > 0) {
    auto settlement = co_await next_settlement();
    if (!settlement) {
      co_return;
    }
    settle(std::move(settlement->result));
  }
}

auto StrategyDriver::run_sequential(JsonValue input) -> task<void> {
  const auto &plan = run_->plan();
  JsonValue current = std::move(input);
  for (const auto &spec : plan.tasks) {
    if (!co_await run_->wait_runnable()) {
      break;
    }
    auto result = co_await runner_->run(spec, current, progress_recorder());
    const auto status = result.status;
    // A task without output passes its own input along.
    if (result.output) {
      current = *result.output;
    }
    settle(std::move(result));

    if (status == TaskStatus::Cancelled) {
      break;
    }
    if (is_failure(status) && !spec.compensate) {
      log::info("execution {}: task {} failed, stopping", run_->id(), spec.id);
      break;
    }
  }
}

auto StrategyDriver::run_parallel(const JsonValue &input) -> task<void> {
  for (NodeIndex i = 0; i < graph_.size(); ++i) {
    if (!co_await run_->wait_runnable()) {
      break;
    }
    dispatch(i, input, true);
  }
  co_await drain();
}

auto StrategyDriver::run_all(const JsonValue &input) -> task<void> {
  co_await run_parallel(input);

  const auto &plan = run_->plan();
  if (!run_->has_failures()) {
    co_return;
  }
  log::info("execution {}: a task failed, compensating completed tasks",
            run_->id());
  for (const auto &spec : plan.tasks) {
    const auto *result = run_->task_result(spec.id);
    if (!spec.compensate || result == nullptr ||
        result->status != TaskStatus::Completed) {
      continue;
    }
    co_await runner_->compensate(spec, input, result->output,
                                 result->attempts);
  }
}

auto StrategyDriver::run_race(const JsonValue &input) -> task<void> {
  for (NodeIndex i = 0; i < graph_.size(); ++i) {
    if (channel_->ready() || !co_await run_->wait_runnable()) {
      break;
    }
    dispatch(i, input, false);
  }
  if (in_flight_ == 0) {
    co_return;
  }

  auto winner = co_await next_settlement();
  if (!winner) {
    co_return;
  }
  log::debug("execution {}: race won by {}", run_->id(),
             winner->result.task_id);
  settle(std::move(winner->result));
  // Losers are abandoned in place; their late settlements are discarded
  // with the channel.
  run_->cancel(CancelReason::RaceSettled);
}

auto StrategyDriver::run_dag(const JsonValue &input) -> task<void> {
  const auto n = graph_.size();
  std::vector<std::size_t> remaining(n);
  std::vector<std::optional<JsonValue>> outputs(n);
  std::deque<NodeIndex> ready;
  for (NodeIndex i = 0; i < n; ++i) {
    remaining[i] = graph_.deps(i).size();
    if (remaining[i] == 0) {
      ready.push_back(i);
    }
  }

  bool stopped = false;
  while (true) {
    while (!ready.empty() && !stopped) {
      if (!co_await run_->wait_runnable()) {
        stopped = true;
        break;
      }
      const auto node = ready.front();
      ready.pop_front();
      dispatch(node, dag_input(graph_.deps(node), input, outputs), true);
    }
    if (in_flight_ == 0) {
      break;
    }

    auto settlement = co_await next_settlement();
    if (!settlement) {
      break;
    }
    const auto node = settlement->node;
    outputs[node] = settlement->result.output;
    settle(std::move(settlement->result));

    // Any terminal state satisfies the edge.
    for (auto dependent : graph_.dependents(node)) {
      if (--remaining[dependent] == 0) {
        ready.push_back(dependent);
      }
    }
  }

  if (!ready.empty()) {
    log::info("execution {}: {} ready task(s) left undispatched", run_->id(),
              ready.size());
  }
}

} // namespace planforge
