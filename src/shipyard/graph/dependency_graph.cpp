#include "shipyard/graph/dependency_graph.hpp"

#include "shipyard/graph/dag.hpp"
#include "shipyard/util/log.hpp"

namespace shipyard {

auto DependencyGraph::build(const RawDependencies& raw,
                            const DeploymentObjects& objects)
    -> Result<DependencyGraph> {
  DependencyGraph graph;

  for (const auto& [name, refs] : raw) {
    if (refs.empty()) {
      continue;
    }

    std::vector<ResolvedDependency> resolved;
    resolved.reserve(refs.size());
    for (const auto& ref : refs) {
      auto it = objects.find(ref.name);
      if (it == objects.end()) {
        log::error("Could not find {} (dependency of {})", ref.name, name);
        return fail(Error::DanglingDependency);
      }
      resolved.push_back(ResolvedDependency{ref.name, it->second, ref.kind});
    }
    graph.edges_.emplace(name, std::move(resolved));
  }

  return ok(std::move(graph));
}

auto DependencyGraph::dependencies_of(std::string_view name) const
    -> std::span<const ResolvedDependency> {
  auto it = edges_.find(name);
  if (it == edges_.end()) {
    return {};
  }
  return it->second;
}

auto DependencyGraph::deployment_order(const DeploymentObjects& objects) const
    -> Result<std::vector<std::string>> {
  DAG dag;
  for (const auto& [name, _] : objects) {
    dag.add_node(name);
  }

  for (const auto& [name, deps] : edges_) {
    for (const auto& dep : deps) {
      if (auto r = dag.add_edge(dep.name, name); !r) {
        if (r.error() == Error::CycleDetected) {
          log::error("Dependency cycle: {} -> {}", name, dep.name);
        } else {
          log::error("Invalid dependency: {} -> {}", name, dep.name);
        }
        return fail(r.error());
      }
    }
  }

  return dag.get_topological_order();
}

}  // namespace shipyard
