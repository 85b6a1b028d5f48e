#pragma once

#include "planforge/core/error.hpp"
#include "planforge/util/id.hpp"

#include <ankerl/unordered_dense.h>

#include <cstdint>
#include <span>
#include <string>
#include <vector>

namespace planforge {

struct Plan;

using NodeIndex = std::uint32_t;
constexpr NodeIndex kInvalidNode = UINT32_MAX;

/// Dependency graph over a plan's tasks. Node indices follow plan order, so
/// index i is plan.tasks[i]. Edges run dependency -> dependent.
class PlanGraph {
public:
  [[nodiscard]] auto add_node(TaskId task_id) -> Result<NodeIndex>;
  [[nodiscard]] auto add_edge(NodeIndex from, NodeIndex to) -> Result<void>;

  [[nodiscard]] auto has_node(const TaskId &task_id) const -> bool;
  [[nodiscard]] auto index_of(const TaskId &task_id) const -> NodeIndex;
  [[nodiscard]] auto key(NodeIndex idx) const -> const TaskId &;

  // Dependencies in declaration order.
  [[nodiscard]] auto deps(NodeIndex idx) const noexcept
      -> std::span<const NodeIndex>;
  [[nodiscard]] auto dependents(NodeIndex idx) const noexcept
      -> std::span<const NodeIndex>;

  [[nodiscard]] auto is_acyclic() const -> Result<void>;
  [[nodiscard]] auto topological_order() const -> std::vector<NodeIndex>;
  [[nodiscard]] auto roots() const -> std::vector<NodeIndex>;

  [[nodiscard]] auto size() const noexcept -> std::size_t {
    return nodes_.size();
  }
  [[nodiscard]] auto empty() const noexcept -> bool { return nodes_.empty(); }

private:
  struct Node {
    std::vector<NodeIndex> deps;
    std::vector<NodeIndex> dependents;
  };

  std::vector<Node> nodes_;
  std::vector<TaskId> keys_;
  ankerl::unordered_dense::map<TaskId, NodeIndex> key_to_idx_;
};

struct PlanIssue {
  Error kind;
  TaskId task_id;
  std::string message;
};

// Every structural problem in the plan, for tooling that wants the full
// list rather than the first failure.
[[nodiscard]] auto collect_plan_issues(const Plan &plan)
    -> std::vector<PlanIssue>;

// Builds the dependency graph, failing with DuplicateTask,
// UnknownDependency or CycleDetected.
[[nodiscard]] auto validate_plan(const Plan &plan) -> Result<PlanGraph>;

} // namespace planforge
