#include "planforge/engine/execution_context.hpp"

#include "planforge/util/log.hpp"

#include <algorithm>

namespace planforge {

ExecutionContext::ExecutionContext(ExecutionId id,
                                   std::shared_ptr<const Plan> plan,
                                   boost::asio::any_io_executor executor)
    : id_(std::move(id)), plan_(std::move(plan)), executor_(executor),
      started_at_(std::chrono::system_clock::now()),
      started_steady_(std::chrono::steady_clock::now()), cancel_(executor),
      gate_(executor), settled_(executor) {}

auto ExecutionContext::get_global(std::string_view key) const
    -> std::optional<JsonValue> {
  auto it = store_.find(std::string(key));
  if (it == store_.end()) {
    return std::nullopt;
  }
  return it->second;
}

auto ExecutionContext::set_global(std::string key, JsonValue value) -> void {
  store_.insert_or_assign(std::move(key), std::move(value));
}

auto ExecutionContext::task_result(const TaskId &task_id) const
    -> const TaskResult * {
  auto it = results_.find(task_id);
  return it != results_.end() ? &it->second : nullptr;
}

auto ExecutionContext::record_result(TaskResult result) -> void {
  auto key = result.task_id;
  results_.insert_or_assign(std::move(key), std::move(result));
}

auto ExecutionContext::has_failures() const -> bool {
  return std::ranges::any_of(results_, [](const auto &entry) {
    return is_failure(entry.second.status);
  });
}

auto ExecutionContext::cancel(CancelReason reason) -> bool {
  if (!cancel_.cancel(reason)) {
    return false;
  }
  log::debug("execution {}: cancelled ({})", id_, to_string_view(reason));
  // A paused run must still be able to observe the switch and wind down.
  gate_.resume();
  return true;
}

auto ExecutionContext::pause() -> bool {
  if (is_cancelled() || !gate_.pause()) {
    return false;
  }
  status_ = RunStatus::Paused;
  return true;
}

auto ExecutionContext::resume() -> bool {
  if (!gate_.resume()) {
    return false;
  }
  status_ = RunStatus::Running;
  return true;
}

auto ExecutionContext::wait_runnable() -> task<bool> {
  if (cancel_.is_cancelled()) {
    co_return false;
  }
  if (gate_.is_paused()) {
    using namespace awaitable_ops;
    auto token = cancel_.token();
    co_await (gate_.wait_open() || token.wait());
  }
  co_return !cancel_.is_cancelled();
}

} // namespace planforge
