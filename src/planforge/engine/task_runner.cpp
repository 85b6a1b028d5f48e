#include "planforge/engine/task_runner.hpp"

#include "planforge/core/async_event.hpp"
#include "planforge/engine/backoff.hpp"
#include "planforge/engine/execution_context.hpp"
#include "planforge/engine/task_context.hpp"
#include "planforge/util/log.hpp"

#include <boost/asio/bind_cancellation_slot.hpp>
#include <boost/asio/error.hpp>
#include <boost/system/system_error.hpp>

#include <exception>
#include <format>

namespace planforge {

namespace {

// Outcome slot shared between a spawned body and the attempt waiting on it.
// Outlives the attempt when the body is abandoned.
struct BodyState {
  explicit BodyState(boost::asio::any_io_executor executor)
      : settled(std::move(executor)) {}

  AsyncEvent settled;
  JsonValue output;
  std::string error;
  bool failed{false};
};

auto describe_exception(const std::exception_ptr &ep) -> std::string {
  try {
    std::rethrow_exception(ep);
  } catch (const boost::system::system_error &e) {
    if (e.code() == boost::asio::error::operation_aborted) {
      return "Operation aborted";
    }
    return e.what();
  } catch (const std::exception &e) {
    return e.what();
  } catch (...) {
    return "Unknown error";
  }
}

// Spawns `fn` as an independent coroutine whose cancellation slot is wired
// to the attempt's abandonment signal.
template <typename Fn>
auto spawn_body(boost::asio::any_io_executor executor,
                const std::shared_ptr<detail::AttemptControl> &control,
                const std::shared_ptr<BodyState> &state, Fn fn) -> void {
  co_spawn(std::move(executor), std::move(fn),
           boost::asio::bind_cancellation_slot(
               control->body_signal.slot(),
               [state, control](std::exception_ptr ep, JsonValue value) {
                 if (ep) {
                   state->failed = true;
                   state->error = describe_exception(ep);
                 } else {
                   state->output = std::move(value);
                 }
                 state->settled.set();
               }));
}

auto error_for(bool timed_out, bool cancelled) -> Error {
  if (cancelled) {
    return Error::Cancelled;
  }
  return timed_out ? Error::Timeout : Error::TaskFailed;
}

} // namespace

TaskRunner::TaskRunner(std::shared_ptr<ExecutionContext> run,
                       std::shared_ptr<EngineCallbacks> callbacks,
                       std::chrono::milliseconds default_timeout)
    : run_(std::move(run)), callbacks_(std::move(callbacks)),
      default_timeout_(default_timeout) {}

auto TaskRunner::run(const TaskSpec &spec, JsonValue input,
                     ProgressFn progress) -> task<TaskResult> {
  const auto policy = spec.retry.value_or(RetryPolicy{});
  const auto steady_start = std::chrono::steady_clock::now();
  auto token = run_->cancellation_token();

  TaskResult result{.task_id = spec.id,
                    .started_at = std::chrono::system_clock::now()};

  auto finish = [&](TaskStatus status) {
    result.status = status;
    result.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - steady_start);
    result.completed_at = std::chrono::system_clock::now();
  };

  while (true) {
    if (run_->is_cancelled()) {
      result.error =
          TaskFailure{make_error_code(Error::Cancelled), "Task cancelled"};
      finish(TaskStatus::Cancelled);
      co_return result;
    }

    std::optional<std::string> condition_error;
    if (spec.condition) {
      auto verdict =
          co_await evaluate_condition(spec, input, result.attempts + 1);
      if (!verdict) {
        condition_error = std::move(verdict.error());
      } else if (!*verdict) {
        log::debug("execution {} task {}: condition false, skipped",
                   run_->id(), spec.id);
        result.status = TaskStatus::Completed;
        result.output.reset();
        result.error.reset();
        result.duration = std::chrono::milliseconds{0};
        result.completed_at = std::chrono::system_clock::now();
        co_return result;
      }
    }

    ++result.attempts;
    AttemptOutcome outcome;
    if (condition_error) {
      outcome.message = std::move(*condition_error);
    } else {
      result.status = TaskStatus::Running;
      if (progress) {
        progress(result);
      }
      log::debug("execution {} task {}: attempt {}/{}", run_->id(), spec.id,
                 result.attempts, policy.max_attempts);
      detail::invoke_hook(callbacks_->on_task_started, "on_task_started",
                          run_->id(), spec.id, result.attempts);
      outcome = co_await attempt(spec, input, result.attempts);
    }

    if (outcome.end == AttemptEnd::Succeeded) {
      result.output = std::move(outcome.output);
      result.error.reset();
      finish(TaskStatus::Completed);
      co_return result;
    }

    const bool timed_out = outcome.end == AttemptEnd::TimedOut;
    const bool cancelled = outcome.end == AttemptEnd::Cancelled;
    TaskFailure failure{make_error_code(error_for(timed_out, cancelled)),
                        std::move(outcome.message)};
    log::warn("execution {} task {}: attempt {} failed: {}", run_->id(),
              spec.id, result.attempts, failure.message);
    detail::invoke_hook(callbacks_->on_task_failed, "on_task_failed",
                        run_->id(), spec.id, result.attempts, failure);
    result.error = std::move(failure);

    if (cancelled) {
      finish(TaskStatus::Cancelled);
      co_return result;
    }

    if (result.attempts >= policy.max_attempts ||
        !is_retryable(policy, result.error->message)) {
      finish(timed_out ? TaskStatus::Timeout : TaskStatus::Failed);
      if (spec.compensate) {
        co_await compensate(spec, input, std::nullopt, result.attempts);
      }
      co_return result;
    }

    const auto delay = compute_backoff(policy, result.attempts);
    log::info("execution {} task {}: retrying in {}ms", run_->id(), spec.id,
              delay.count());
    detail::invoke_hook(callbacks_->on_task_retry, "on_task_retry",
                        run_->id(), spec.id, result.attempts, delay);
    if (delay.count() > 0) {
      // A cancel during the backoff is picked up at the top of the loop.
      [[maybe_unused]] const bool interrupted = co_await token.wait_for(delay);
    }
  }
}

auto TaskRunner::evaluate_condition(const TaskSpec &spec,
                                    const JsonValue &input, int attempt_no)
    -> task<std::expected<bool, std::string>> {
  TaskContext ctx{run_, spec.id, attempt_no,
                  std::make_shared<detail::AttemptControl>(run_->executor()),
                  callbacks_};
  try {
    co_return co_await spec.condition(input, ctx);
  } catch (const std::exception &e) {
    co_return std::unexpected(std::format("Condition failed: {}", e.what()));
  } catch (...) {
    co_return std::unexpected(std::string{"Condition failed: unknown error"});
  }
}

auto TaskRunner::attempt(const TaskSpec &spec, const JsonValue &input,
                         int attempt_no) -> task<AttemptOutcome> {
  using namespace awaitable_ops;

  auto executor = run_->executor();
  auto control = std::make_shared<detail::AttemptControl>(executor);
  auto state = std::make_shared<BodyState>(executor);
  TaskContext ctx{run_, spec.id, attempt_no, control, callbacks_};

  // The context keeps the run, and so the plan owning `body`, alive for as
  // long as the body runs.
  spawn_body(executor, control, state,
             [&body = spec.execute, input, ctx]() -> task<JsonValue> {
               co_return co_await body(input, ctx);
             });

  const auto timeout = timeout_for(spec);
  auto token = run_->cancellation_token();
  if (!state->settled.is_set()) {
    [[maybe_unused]] auto first =
        co_await (state->settled.wait_for(timeout) || token.wait());
  }

  if (state->settled.is_set()) {
    if (state->failed) {
      co_return AttemptOutcome{AttemptEnd::Failed, {}, std::move(state->error)};
    }
    co_return AttemptOutcome{AttemptEnd::Succeeded, std::move(state->output),
                             {}};
  }

  control->abandon();
  if (run_->is_cancelled()) {
    co_return AttemptOutcome{AttemptEnd::Cancelled, {}, "Task cancelled"};
  }
  co_return AttemptOutcome{
      AttemptEnd::TimedOut, {},
      std::format("Task timeout after {}ms", timeout.count())};
}

auto TaskRunner::compensate(const TaskSpec &spec, JsonValue input,
                            std::optional<JsonValue> output, int attempt)
    -> task<void> {
  if (!spec.compensate) {
    co_return;
  }

  auto executor = run_->executor();
  auto control = std::make_shared<detail::AttemptControl>(executor);
  auto state = std::make_shared<BodyState>(executor);
  TaskContext ctx{run_, spec.id, attempt, control, callbacks_};

  log::info("execution {} task {}: compensating", run_->id(), spec.id);
  spawn_body(executor, control, state,
             [&fn = spec.compensate, input = std::move(input),
              output = std::move(output), ctx]() -> task<JsonValue> {
               co_await fn(input, output, ctx);
               co_return JsonValue{};
             });

  const auto timeout = timeout_for(spec);
  std::string error;
  if (!co_await state->settled.wait_for(timeout)) {
    control->abandon();
    error = std::format("Compensation timeout after {}ms", timeout.count());
  } else if (state->failed) {
    error = std::move(state->error);
  } else {
    co_return;
  }

  log::error("execution {} task {}: compensation failed: {}", run_->id(),
             spec.id, error);
  detail::invoke_hook(callbacks_->on_compensation_failed,
                      "on_compensation_failed", run_->id(), spec.id,
                      std::string_view{error});
}

} // namespace planforge
