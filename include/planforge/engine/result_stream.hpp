#pragma once

#include "planforge/core/async_event.hpp"
#include "planforge/core/coroutine.hpp"
#include "planforge/engine/result.hpp"
#include "planforge/util/id.hpp"

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/experimental/channel.hpp>
#include <boost/system/error_code.hpp>

#include <cstddef>
#include <memory>
#include <optional>

namespace planforge {

/// Completion-ordered sequence of settled task results for one run.
///
/// Single consumer and not restartable: once next() has returned nullopt
/// the stream stays exhausted. result() may be awaited at any point and
/// completes when the run does.
class ResultStream {
public:
  struct State {
    State(boost::asio::any_io_executor executor, std::size_t capacity)
        : channel(executor, capacity), done(executor) {}

    auto push(const TaskResult &result) -> void;
    auto finish(ExecutionResult result) -> void;

    // nullopt marks the end of the run.
    boost::asio::experimental::channel<
        boost::asio::any_io_executor,
        void(boost::system::error_code, std::optional<TaskResult>)>
        channel;
    AsyncEvent done;
    std::optional<ExecutionResult> final;
    bool exhausted{false};
  };

  ResultStream(ExecutionId id, std::shared_ptr<State> state)
      : id_(std::move(id)), state_(std::move(state)) {}

  [[nodiscard]] auto id() const noexcept -> const ExecutionId & {
    return id_;
  }

  auto next() -> task<std::optional<TaskResult>>;
  auto result() -> task<ExecutionResult>;

private:
  ExecutionId id_;
  std::shared_ptr<State> state_;
};

} // namespace planforge
