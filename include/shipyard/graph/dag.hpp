#pragma once

#include "shipyard/core/error.hpp"

#include <cstdint>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace shipyard {

using NodeIndex = std::uint32_t;
inline constexpr NodeIndex kInvalidNode = UINT32_MAX;

// Entity ordering graph. An edge from -> to means `to` depends on `from`.
class DAG {
public:
  auto add_node(std::string_view name) -> NodeIndex;
  [[nodiscard]] auto add_edge(std::string_view from, std::string_view to)
      -> Result<void>;
  [[nodiscard]] auto add_edge(NodeIndex from, NodeIndex to) -> Result<void>;

  // Kahn's algorithm; ready nodes are released in insertion order.
  [[nodiscard]] auto get_topological_order() const -> std::vector<std::string>;

private:
  [[nodiscard]] auto get_index(std::string_view name) const -> NodeIndex;
  [[nodiscard]] auto would_create_cycle(NodeIndex from, NodeIndex to) const
      -> bool;

  struct Node {
    std::vector<NodeIndex> deps;
    std::vector<NodeIndex> dependents;
  };

  std::vector<Node> nodes_;
  std::vector<std::string> keys_;
  std::unordered_map<std::string, NodeIndex, StringHash, StringEqual>
      key_to_idx_;
};

}  // namespace shipyard
