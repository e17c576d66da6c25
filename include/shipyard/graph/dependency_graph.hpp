#pragma once

#include "shipyard/core/error.hpp"
#include "shipyard/graph/dependency.hpp"
#include "shipyard/module/entity_module.hpp"

#include <map>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace shipyard {

struct ResolvedDependency {
  std::string name;
  std::shared_ptr<DeploymentObject> object;
  std::string kind;
};

// Resolved dependencies per entity. Entities without dependencies have no
// entry; dependencies_of() treats them as an empty list.
class DependencyGraph {
public:
  using Edges =
      std::map<std::string, std::vector<ResolvedDependency>, std::less<>>;

  DependencyGraph() = default;

  // Fails with DanglingDependency when a reference names no known object.
  [[nodiscard]] static auto build(const RawDependencies& raw,
                                  const DeploymentObjects& objects)
      -> Result<DependencyGraph>;

  [[nodiscard]] auto dependencies_of(std::string_view name) const
      -> std::span<const ResolvedDependency>;

  [[nodiscard]] auto contains(std::string_view name) const -> bool {
    return edges_.contains(name);
  }

  [[nodiscard]] auto edges() const noexcept -> const Edges& {
    return edges_;
  }

  [[nodiscard]] auto size() const noexcept -> std::size_t {
    return edges_.size();
  }

  [[nodiscard]] auto empty() const noexcept -> bool {
    return edges_.empty();
  }

  // Every object, dependencies before dependents. Fails with CycleDetected.
  [[nodiscard]] auto deployment_order(const DeploymentObjects& objects) const
      -> Result<std::vector<std::string>>;

private:
  Edges edges_;
};

}  // namespace shipyard
