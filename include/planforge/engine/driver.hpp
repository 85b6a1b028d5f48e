#pragma once

#include "planforge/core/coroutine.hpp"
#include "planforge/engine/callbacks.hpp"
#include "planforge/engine/task_runner.hpp"
#include "planforge/plan/plan_graph.hpp"
#include "planforge/util/json.hpp"

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/experimental/channel.hpp>
#include <boost/system/error_code.hpp>

#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <span>
#include <vector>

namespace planforge {

class ExecutionContext;

struct Settlement {
  NodeIndex node{kInvalidNode};
  TaskResult result;
};

using SettlementChannel = boost::asio::experimental::channel<
    boost::asio::any_io_executor,
    void(boost::system::error_code, Settlement)>;

// Observer for every recorded, settled task result (the streaming path).
using SettleSink = std::function<void(const TaskResult &)>;

/// Schedules a validated plan's tasks according to its strategy.
///
/// Concurrent strategies spawn each task as its own coroutine; finished
/// tasks report back through a buffered channel sized to the plan, so a
/// send never blocks and the driver reacts to each settlement as it
/// arrives. The pause gate is consulted before every dispatch.
class StrategyDriver {
public:
  StrategyDriver(std::shared_ptr<ExecutionContext> run,
                 std::shared_ptr<EngineCallbacks> callbacks,
                 const PlanGraph &graph,
                 std::chrono::milliseconds default_timeout,
                 SettleSink sink = {});

  auto run(JsonValue input) -> task<void>;

  // Input handed to a dag node: the plan input for roots, the single
  // dependency's output, or an array of outputs in declaration order.
  [[nodiscard]] static auto
  dag_input(std::span<const NodeIndex> deps, const JsonValue &plan_input,
            const std::vector<std::optional<JsonValue>> &outputs)
      -> JsonValue;

private:
  auto run_sequential(JsonValue input) -> task<void>;
  auto run_parallel(const JsonValue &input) -> task<void>;
  auto run_all(const JsonValue &input) -> task<void>;
  auto run_race(const JsonValue &input) -> task<void>;
  auto run_dag(const JsonValue &input) -> task<void>;

  auto dispatch(NodeIndex node, JsonValue input, bool track_progress) -> void;
  auto next_settlement() -> task<std::optional<Settlement>>;
  auto drain() -> task<void>;
  auto settle(TaskResult result) -> void;
  [[nodiscard]] auto progress_recorder() const -> TaskRunner::ProgressFn;

  std::shared_ptr<ExecutionContext> run_;
  std::shared_ptr<EngineCallbacks> callbacks_;
  const PlanGraph &graph_;
  std::shared_ptr<TaskRunner> runner_;
  std::shared_ptr<SettlementChannel> channel_;
  SettleSink sink_;
  std::size_t in_flight_{0};
};

} // namespace planforge
