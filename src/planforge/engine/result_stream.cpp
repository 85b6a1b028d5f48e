#include "planforge/engine/result_stream.hpp"

#include "planforge/util/log.hpp"

namespace planforge {

auto ResultStream::State::push(const TaskResult &result) -> void {
  if (!channel.try_send(boost::system::error_code{},
                        std::optional<TaskResult>{result})) {
    log::error("result stream: dropped result for task {}", result.task_id);
  }
}

auto ResultStream::State::finish(ExecutionResult result) -> void {
  final = std::move(result);
  if (!channel.try_send(boost::system::error_code{},
                        std::optional<TaskResult>{})) {
    log::error("result stream: end marker dropped");
  }
  done.set();
}

auto ResultStream::next() -> task<std::optional<TaskResult>> {
  auto state = state_;
  if (state->exhausted) {
    co_return std::nullopt;
  }
  auto [ec, item] = co_await state->channel.async_receive(use_nothrow);
  if (ec || !item) {
    state->exhausted = true;
    co_return std::nullopt;
  }
  co_return std::move(item);
}

auto ResultStream::result() -> task<ExecutionResult> {
  auto state = state_;
  co_await state->done.wait();
  co_return *state->final;
}

} // namespace planforge
