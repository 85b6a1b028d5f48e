#pragma once

#include "planforge/core/coroutine.hpp"
#include "planforge/core/error.hpp"
#include "planforge/engine/callbacks.hpp"
#include "planforge/engine/result.hpp"
#include "planforge/engine/result_stream.hpp"
#include "planforge/plan/plan.hpp"
#include "planforge/util/id.hpp"
#include "planforge/util/json.hpp"

#include <boost/asio/any_io_executor.hpp>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <vector>

namespace planforge {

class ExecutionContext;

struct EngineOptions {
  std::chrono::milliseconds default_task_timeout{task_defaults::kTimeout};
  // 0 = unlimited.
  std::size_t max_active_runs{0};
};

struct EngineStats {
  std::uint64_t total{0};
  std::uint64_t completed{0};
  std::uint64_t failed{0};
  std::uint64_t cancelled{0};
  std::uint64_t timed_out{0};
  std::size_t active{0};
};

/// Runs plans on a single executor.
///
/// Every run gets its own ExecutionContext, registered under a fresh
/// execution id for as long as it is live so that cancel/pause/resume can
/// reach it. Registries are per engine instance.
///
/// Not thread-safe: call it from the executor it was built with.
class ExecutionEngine {
public:
  explicit ExecutionEngine(boost::asio::any_io_executor executor,
                           EngineOptions options = {},
                           EngineCallbacks callbacks = {});
  ~ExecutionEngine();

  ExecutionEngine(const ExecutionEngine &) = delete;
  auto operator=(const ExecutionEngine &) -> ExecutionEngine & = delete;

  // Never throws for task failures. Plan errors surface as a failed result
  // with `error` set and no task results.
  auto execute(std::shared_ptr<const Plan> plan, JsonValue input = {})
      -> task<ExecutionResult>;

  // Starts the run immediately. Rejects race/all with UnsupportedStrategy
  // and plan errors with their own code.
  [[nodiscard]] auto execute_stream(std::shared_ptr<const Plan> plan,
                                    JsonValue input = {})
      -> Result<ResultStream>;

  // Cooperative: stops new dispatch and abandons in-flight attempts.
  // False for unknown or already settled runs.
  auto cancel(const ExecutionId &id) -> bool;
  auto pause(const ExecutionId &id) -> bool;
  auto resume(const ExecutionId &id) -> bool;

  [[nodiscard]] auto find(const ExecutionId &id) const
      -> std::shared_ptr<ExecutionContext>;
  [[nodiscard]] auto active_runs() const -> std::vector<ExecutionId>;
  [[nodiscard]] auto stats() const -> EngineStats;

  [[nodiscard]] auto executor() const noexcept
      -> const boost::asio::any_io_executor & {
    return executor_;
  }

private:
  struct Shared;
  struct PreparedRun;

  [[nodiscard]] auto prepare(const std::shared_ptr<const Plan> &plan)
      -> Result<PreparedRun>;
  auto reject(const std::shared_ptr<const Plan> &plan, std::error_code ec)
      -> ExecutionResult;

  static auto drive(std::shared_ptr<Shared> shared, PreparedRun prepared,
                    JsonValue input, std::function<void(const TaskResult &)> sink)
      -> task<ExecutionResult>;

  boost::asio::any_io_executor executor_;
  std::shared_ptr<Shared> shared_;
};

} // namespace planforge
