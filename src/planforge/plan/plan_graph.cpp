#include "planforge/plan/plan_graph.hpp"

#include "planforge/plan/plan.hpp"

#include <algorithm>
#include <format>
#include <ranges>
#include <utility>

namespace planforge {

auto PlanGraph::add_node(TaskId task_id) -> Result<NodeIndex> {
  if (key_to_idx_.contains(task_id)) {
    return fail(Error::DuplicateTask);
  }
  auto idx = static_cast<NodeIndex>(nodes_.size());
  nodes_.emplace_back();
  keys_.push_back(task_id);
  key_to_idx_.emplace(std::move(task_id), idx);
  return ok(idx);
}

auto PlanGraph::add_edge(NodeIndex from, NodeIndex to) -> Result<void> {
  if (from >= nodes_.size() || to >= nodes_.size()) [[unlikely]] {
    return fail(Error::InvalidArgument);
  }
  if (from == to) {
    return fail(Error::CycleDetected);
  }
  nodes_[to].deps.push_back(from);
  nodes_[from].dependents.push_back(to);
  return ok();
}

auto PlanGraph::has_node(const TaskId &task_id) const -> bool {
  return key_to_idx_.contains(task_id);
}

auto PlanGraph::index_of(const TaskId &task_id) const -> NodeIndex {
  auto it = key_to_idx_.find(task_id);
  return it != key_to_idx_.end() ? it->second : kInvalidNode;
}

auto PlanGraph::key(NodeIndex idx) const -> const TaskId & {
  return keys_.at(idx);
}

auto PlanGraph::deps(NodeIndex idx) const noexcept
    -> std::span<const NodeIndex> {
  if (idx >= nodes_.size()) {
    return {};
  }
  return nodes_[idx].deps;
}

auto PlanGraph::dependents(NodeIndex idx) const noexcept
    -> std::span<const NodeIndex> {
  if (idx >= nodes_.size()) {
    return {};
  }
  return nodes_[idx].dependents;
}

auto PlanGraph::is_acyclic() const -> Result<void> {
  // 0 = unvisited, 1 = on stack, 2 = done
  std::vector<std::uint8_t> state(nodes_.size(), 0);
  std::vector<std::pair<NodeIndex, std::size_t>> stack;
  stack.reserve(nodes_.size());

  for (NodeIndex start :
       std::views::iota(NodeIndex{0}, static_cast<NodeIndex>(nodes_.size()))) {
    if (state[start] != 0) {
      continue;
    }
    stack.emplace_back(start, 0);
    state[start] = 1;

    while (!stack.empty()) {
      auto &[node, child_idx] = stack.back();
      const auto &next = nodes_[node].dependents;
      if (child_idx < next.size()) {
        NodeIndex child = next[child_idx++];
        if (state[child] == 1) {
          return fail(Error::CycleDetected);
        }
        if (state[child] == 0) {
          state[child] = 1;
          stack.emplace_back(child, 0);
        }
      } else {
        state[node] = 2;
        stack.pop_back();
      }
    }
  }
  return ok();
}

auto PlanGraph::topological_order() const -> std::vector<NodeIndex> {
  std::vector<std::size_t> in_degree;
  in_degree.reserve(nodes_.size());
  for (const auto &node : nodes_) {
    in_degree.push_back(node.deps.size());
  }

  std::vector<NodeIndex> order = roots();
  order.reserve(nodes_.size());
  for (std::size_t head = 0; head < order.size(); ++head) {
    for (NodeIndex next : nodes_[order[head]].dependents) {
      if (--in_degree[next] == 0) {
        order.push_back(next);
      }
    }
  }
  return order;
}

auto PlanGraph::roots() const -> std::vector<NodeIndex> {
  std::vector<NodeIndex> out;
  for (auto [i, node] : std::views::enumerate(nodes_)) {
    if (node.deps.empty()) {
      out.push_back(static_cast<NodeIndex>(i));
    }
  }
  return out;
}

auto collect_plan_issues(const Plan &plan) -> std::vector<PlanIssue> {
  std::vector<PlanIssue> issues;
  PlanGraph graph;

  for (const auto &task : plan.tasks) {
    if (!is_valid_id_text(task.id.value())) {
      issues.push_back({Error::InvalidArgument, task.id,
                        "task id is empty or contains control characters"});
      continue;
    }
    if (auto r = graph.add_node(task.id); !r) {
      issues.push_back({Error::DuplicateTask, task.id,
                        std::format("duplicate task id '{}'", task.id)});
    }
  }

  for (const auto &task : plan.tasks) {
    NodeIndex to = graph.index_of(task.id);
    if (to == kInvalidNode) {
      continue;
    }
    for (const auto &dep : task.dependencies) {
      if (dep == task.id) {
        issues.push_back(
            {Error::CycleDetected, task.id,
             std::format("task '{}' depends on itself", task.id)});
        continue;
      }
      NodeIndex from = graph.index_of(dep);
      if (from == kInvalidNode) {
        issues.push_back(
            {Error::UnknownDependency, task.id,
             std::format("task '{}' depends on unknown task '{}'", task.id,
                         dep)});
        continue;
      }
      if (std::ranges::find(graph.deps(to), from) != graph.deps(to).end()) {
        continue;
      }
      (void)graph.add_edge(from, to);
    }
  }

  if (issues.empty()) {
    if (auto r = graph.is_acyclic(); !r) {
      issues.push_back(
          {Error::CycleDetected, TaskId{}, "circular dependency detected"});
    }
  }
  return issues;
}

auto validate_plan(const Plan &plan) -> Result<PlanGraph> {
  PlanGraph graph;
  for (const auto &task : plan.tasks) {
    if (!is_valid_id_text(task.id.value())) {
      return fail(Error::InvalidArgument);
    }
    if (!task.execute) {
      return fail(Error::InvalidArgument);
    }
    if (auto r = graph.add_node(task.id); !r) {
      return fail(r.error());
    }
  }

  for (const auto &[to, task] : std::views::enumerate(plan.tasks)) {
    for (const auto &dep : task.dependencies) {
      NodeIndex from = graph.index_of(dep);
      if (from == kInvalidNode) {
        return fail(Error::UnknownDependency);
      }
      auto existing = graph.deps(static_cast<NodeIndex>(to));
      if (std::ranges::find(existing, from) != existing.end()) {
        continue;
      }
      if (auto r = graph.add_edge(from, static_cast<NodeIndex>(to)); !r) {
        return fail(r.error());
      }
    }
  }

  if (auto r = graph.is_acyclic(); !r) {
    return fail(r.error());
  }
  return ok(std::move(graph));
}

} // namespace planforge
