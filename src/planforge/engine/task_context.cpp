#include "planforge/engine/task_context.hpp"

#include "planforge/engine/execution_context.hpp"

#include <format>

namespace planforge {

TaskContext::TaskContext(std::shared_ptr<ExecutionContext> run,
                         TaskId task_id, int attempt,
                         std::shared_ptr<detail::AttemptControl> control,
                         std::shared_ptr<EngineCallbacks> callbacks)
    : run_(std::move(run)), task_id_(std::move(task_id)), attempt_(attempt),
      started_at_(std::chrono::system_clock::now()),
      control_(std::move(control)), callbacks_(std::move(callbacks)) {}

auto TaskContext::execution_id() const noexcept -> const ExecutionId & {
  return run_->id();
}

auto TaskContext::executor() const -> boost::asio::any_io_executor {
  return run_->executor();
}

auto TaskContext::state_key(const TaskId &task_id, std::string_view key)
    -> std::string {
  return std::format("task:{}:{}", task_id, key);
}

auto TaskContext::get(std::string_view key) const -> std::optional<JsonValue> {
  return run_->get_global(state_key(task_id_, key));
}

auto TaskContext::set(std::string_view key, JsonValue value) const -> void {
  run_->set_global(state_key(task_id_, key), std::move(value));
}

auto TaskContext::is_cancelled() const noexcept -> bool {
  return run_->is_cancelled() || (control_ && control_->abandoned.is_set());
}

auto TaskContext::cancellation_token() const -> CancellationToken {
  return run_->cancellation_token();
}

auto TaskContext::sleep(std::chrono::milliseconds d) const -> task<bool> {
  if (is_cancelled()) {
    co_return false;
  }
  if (!control_) {
    auto token = run_->cancellation_token();
    co_return !(co_await token.wait_for(d));
  }
  auto control = control_;
  const bool abandoned = co_await control->abandoned.wait_for(d);
  co_return !abandoned && !run_->is_cancelled();
}

auto TaskContext::log(log::Level level, std::string_view message) const
    -> void {
  log::logger().log(level, "execution {} task {} (attempt {}): {}",
                    run_->id(), task_id_, attempt_, message);
  if (callbacks_) {
    detail::invoke_hook(callbacks_->on_task_log, "on_task_log", run_->id(),
                        task_id_, level, message);
  }
}

auto TaskContext::record_metric(std::string_view name, double value,
                                const MetricTags &tags) const -> void {
  log::trace("execution {} task {}: metric {}={}", run_->id(), task_id_, name,
             value);
  if (callbacks_) {
    detail::invoke_hook(callbacks_->on_task_metric, "on_task_metric",
                        run_->id(), task_id_, name, value, tags);
  }
}

} // namespace planforge
