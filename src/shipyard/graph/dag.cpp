#include "shipyard/graph/dag.hpp"

#include <queue>
#include <ranges>

namespace shipyard {

auto DAG::add_node(std::string_view name) -> NodeIndex {
  auto it = key_to_idx_.find(name);
  if (it != key_to_idx_.end()) {
    return it->second;
  }

  NodeIndex idx = static_cast<NodeIndex>(nodes_.size());
  nodes_.emplace_back();
  keys_.emplace_back(name);
  key_to_idx_.emplace(std::string(name), idx);
  return idx;
}

auto DAG::add_edge(std::string_view from, std::string_view to) -> Result<void> {
  NodeIndex from_idx = get_index(from);
  NodeIndex to_idx = get_index(to);
  if (from_idx == kInvalidNode || to_idx == kInvalidNode) [[unlikely]] {
    return fail(Error::NotFound);
  }
  return add_edge(from_idx, to_idx);
}

auto DAG::add_edge(NodeIndex from, NodeIndex to) -> Result<void> {
  if (from >= nodes_.size() || to >= nodes_.size()) [[unlikely]] {
    return fail(Error::InvalidArgument);
  }

  // A self edge is the shortest cycle.
  if (from == to || would_create_cycle(from, to)) {
    return fail(Error::CycleDetected);
  }

  nodes_[to].deps.push_back(from);
  nodes_[from].dependents.push_back(to);
  return ok();
}

auto DAG::would_create_cycle(NodeIndex from, NodeIndex to) const -> bool {
  std::vector<bool> visited(nodes_.size(), false);
  std::vector<NodeIndex> stack{from};

  while (!stack.empty()) {
    NodeIndex current = stack.back();
    stack.pop_back();

    if (current == to) {
      return true;
    }

    if (visited[current]) {
      continue;
    }
    visited[current] = true;

    for (NodeIndex dep : nodes_[current].deps) {
      if (!visited[dep]) {
        stack.push_back(dep);
      }
    }
  }
  return false;
}

auto DAG::get_topological_order() const -> std::vector<std::string> {
  auto in_degree = nodes_ | std::views::transform([](const Node& n) {
                     return static_cast<int>(n.deps.size());
                   }) |
                   std::ranges::to<std::vector>();

  std::queue<NodeIndex> ready;
  for (auto [i, deg] : std::views::enumerate(in_degree)) {
    if (deg == 0) {
      ready.push(static_cast<NodeIndex>(i));
    }
  }

  std::vector<std::string> result;
  result.reserve(nodes_.size());
  while (!ready.empty()) {
    NodeIndex current = ready.front();
    ready.pop();
    result.push_back(keys_[current]);

    for (NodeIndex dep : nodes_[current].dependents) {
      if (--in_degree[dep] == 0) {
        ready.push(dep);
      }
    }
  }

  return result;
}

auto DAG::get_index(std::string_view name) const -> NodeIndex {
  auto it = key_to_idx_.find(name);
  return it != key_to_idx_.end() ? it->second : kInvalidNode;
}

}  // namespace shipyard
