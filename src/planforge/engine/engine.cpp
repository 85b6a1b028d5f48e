#include "planforge/engine/engine.hpp"

#include "planforge/engine/driver.hpp"
#include "planforge/engine/execution_context.hpp"
#include "planforge/plan/plan_graph.hpp"
#include "planforge/util/log.hpp"

#include <ankerl/unordered_dense.h>

#include <exception>

namespace planforge {

struct ExecutionEngine::Shared {
  EngineOptions options;
  std::shared_ptr<EngineCallbacks> callbacks;
  ankerl::unordered_dense::map<ExecutionId, std::shared_ptr<ExecutionContext>>
      runs;
  EngineStats stats;

  auto record(RunStatus status) -> void {
    ++stats.total;
    switch (status) {
    case RunStatus::Completed:
      ++stats.completed;
      break;
    case RunStatus::Cancelled:
      ++stats.cancelled;
      break;
    case RunStatus::Timeout:
      ++stats.timed_out;
      break;
    default:
      ++stats.failed;
      break;
    }
  }
};

struct ExecutionEngine::PreparedRun {
  std::shared_ptr<ExecutionContext> run;
  PlanGraph graph;
};

namespace {

// Keeps a run reachable by id while it is live. Releasing it settles the
// run, which also retires its global-timeout watchdog.
class RunRegistration {
public:
  using Runs =
      ankerl::unordered_dense::map<ExecutionId,
                                   std::shared_ptr<ExecutionContext>>;

  RunRegistration(std::shared_ptr<void> keep_alive, Runs &runs,
                  std::shared_ptr<ExecutionContext> run)
      : keep_alive_(std::move(keep_alive)), runs_(runs), run_(std::move(run)) {}

  RunRegistration(const RunRegistration &) = delete;
  auto operator=(const RunRegistration &) -> RunRegistration & = delete;

  ~RunRegistration() {
    run_->settled().set();
    runs_.erase(run_->id());
  }

private:
  std::shared_ptr<void> keep_alive_;
  Runs &runs_;
  std::shared_ptr<ExecutionContext> run_;
};

auto final_status(const ExecutionContext &run) -> RunStatus {
  if (run.is_cancelled()) {
    return run.cancel_reason() == CancelReason::Timeout ? RunStatus::Timeout
                                                         : RunStatus::Cancelled;
  }
  return run.has_failures() ? RunStatus::Failed : RunStatus::Completed;
}

auto finalize(ExecutionContext &run) -> ExecutionResult {
  ExecutionResult result;
  result.execution_id = run.id();
  result.plan_id = run.plan().id;
  result.status = final_status(run);
  result.results = run.results();
  result.started_at = run.started_at();
  result.completed_at = std::chrono::system_clock::now();
  result.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - run.started_steady());
  run.set_status(result.status);
  return result;
}

} // namespace

ExecutionEngine::ExecutionEngine(boost::asio::any_io_executor executor,
                                 EngineOptions options,
                                 EngineCallbacks callbacks)
    : executor_(std::move(executor)), shared_(std::make_shared<Shared>()) {
  shared_->options = options;
  shared_->callbacks =
      std::make_shared<EngineCallbacks>(std::move(callbacks));
}

ExecutionEngine::~ExecutionEngine() {
  // Runs outlive the engine only as orphans; make them wind down.
  for (auto &[id, run] : shared_->runs) {
    if (run->cancel(CancelReason::User)) {
      log::warn("execution {}: engine destroyed while running", id);
    }
  }
}

auto ExecutionEngine::prepare(const std::shared_ptr<const Plan> &plan)
    -> Result<PreparedRun> {
  if (!plan) {
    return fail(Error::InvalidArgument);
  }
  auto graph = validate_plan(*plan);
  if (!graph) {
    return fail(graph.error());
  }
  const auto limit = shared_->options.max_active_runs;
  if (limit > 0 && shared_->runs.size() >= limit) {
    return fail(Error::ResourceExhausted);
  }

  auto run = std::make_shared<ExecutionContext>(generate_execution_id(), plan,
                                                executor_);
  shared_->runs.emplace(run->id(), run);
  return PreparedRun{std::move(run), std::move(*graph)};
}

auto ExecutionEngine::reject(const std::shared_ptr<const Plan> &plan,
                             std::error_code ec) -> ExecutionResult {
  ExecutionResult result;
  result.execution_id = generate_execution_id();
  if (plan) {
    result.plan_id = plan->id;
  }
  result.status = RunStatus::Failed;
  result.error = ec;
  result.started_at = std::chrono::system_clock::now();
  result.completed_at = result.started_at;

  log::error("execution {}: plan {} rejected: {}", result.execution_id,
             result.plan_id, ec.message());
  shared_->record(result.status);
  detail::invoke_hook(shared_->callbacks->on_run_failed, "on_run_failed",
                      result.execution_id, ec);
  return result;
}

auto ExecutionEngine::execute(std::shared_ptr<const Plan> plan,
                              JsonValue input) -> task<ExecutionResult> {
  auto prepared = prepare(plan);
  if (!prepared) {
    co_return reject(plan, prepared.error());
  }
  co_return co_await drive(shared_, std::move(*prepared), std::move(input),
                           {});
}

auto ExecutionEngine::execute_stream(std::shared_ptr<const Plan> plan,
                                     JsonValue input) -> Result<ResultStream> {
  if (plan && !supports_streaming(plan->strategy)) {
    log::warn("plan {}: {} strategy cannot be streamed", plan->id,
              to_string_view(plan->strategy));
    return fail(Error::UnsupportedStrategy);
  }
  auto prepared = prepare(plan);
  if (!prepared) {
    [[maybe_unused]] auto rejected = reject(plan, prepared.error());
    return fail(prepared.error());
  }

  auto id = prepared->run->id();
  auto state = std::make_shared<ResultStream::State>(executor_,
                                                     plan->tasks.size() + 1);
  co_spawn(executor_,
           drive(shared_, std::move(*prepared), std::move(input),
                 [state](const TaskResult &r) { state->push(r); }),
           [state, id](std::exception_ptr ep, ExecutionResult result) {
             if (ep) {
               try {
                 std::rethrow_exception(ep);
               } catch (const std::exception &e) {
                 log::error("execution {}: stream failed: {}", id, e.what());
               } catch (...) {
                 log::error("execution {}: stream failed", id);
               }
               result.execution_id = id;
               result.status = RunStatus::Failed;
               result.error = make_error_code(Error::Unknown);
             }
             state->finish(std::move(result));
           });
  return ResultStream{std::move(id), std::move(state)};
}

auto ExecutionEngine::drive(std::shared_ptr<Shared> shared,
                            PreparedRun prepared, JsonValue input,
                            std::function<void(const TaskResult &)> sink)
    -> task<ExecutionResult> {
  auto run = prepared.run;
  RunRegistration registration{shared, shared->runs, run};
  const auto &plan = run->plan();

  if (plan.global_timeout) {
    co_spawn(
        run->executor(),
        [run, timeout = *plan.global_timeout]() -> spawn_task {
          if (!co_await run->settled().wait_for(timeout) &&
              run->cancel(CancelReason::Timeout)) {
            log::warn("execution {}: global timeout after {}ms", run->id(),
                      timeout.count());
          }
        },
        detached);
  }

  log::info("execution {}: plan {} started ({} task(s), {})", run->id(),
            plan.id, plan.tasks.size(), to_string_view(plan.strategy));
  detail::invoke_hook(shared->callbacks->on_run_started, "on_run_started",
                      run->id(), plan);

  StrategyDriver driver{run, shared->callbacks, prepared.graph,
                        shared->options.default_task_timeout,
                        std::move(sink)};
  co_await driver.run(std::move(input));

  auto result = finalize(*run);
  run->settled().set();
  shared->record(result.status);
  log::info("execution {}: {} in {}ms", run->id(),
            to_string_view(result.status), result.duration.count());
  detail::invoke_hook(shared->callbacks->on_run_completed, "on_run_completed",
                      result);
  co_return result;
}

auto ExecutionEngine::cancel(const ExecutionId &id) -> bool {
  auto run = find(id);
  if (!run || run->settled().is_set()) {
    return false;
  }
  if (!run->cancel(CancelReason::User)) {
    return false;
  }
  log::info("execution {}: cancel requested", id);
  detail::invoke_hook(shared_->callbacks->on_run_cancelled,
                      "on_run_cancelled", id);
  return true;
}

auto ExecutionEngine::pause(const ExecutionId &id) -> bool {
  auto run = find(id);
  if (!run || run->settled().is_set() || !run->pause()) {
    return false;
  }
  log::info("execution {}: paused", id);
  return true;
}

auto ExecutionEngine::resume(const ExecutionId &id) -> bool {
  auto run = find(id);
  if (!run || run->settled().is_set() || !run->resume()) {
    return false;
  }
  log::info("execution {}: resumed", id);
  return true;
}

auto ExecutionEngine::find(const ExecutionId &id) const
    -> std::shared_ptr<ExecutionContext> {
  auto it = shared_->runs.find(id);
  return it != shared_->runs.end() ? it->second : nullptr;
}

auto ExecutionEngine::active_runs() const -> std::vector<ExecutionId> {
  std::vector<ExecutionId> ids;
  ids.reserve(shared_->runs.size());
  for (const auto &[id, run] : shared_->runs) {
    ids.push_back(id);
  }
  return ids;
}

auto ExecutionEngine::stats() const -> EngineStats {
  auto stats = shared_->stats;
  stats.active = shared_->runs.size();
  return stats;
}

} // namespace planforge
