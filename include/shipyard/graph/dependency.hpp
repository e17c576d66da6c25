#pragma once

#include "shipyard/config/yaml_utils.hpp"

#include <yaml-cpp/yaml.h>

#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace shipyard {

inline constexpr std::string_view kDefaultRelation = "create";

struct DependencyRef {
  std::string name;
  std::string kind{kDefaultRelation};

  bool operator==(const DependencyRef& other) const = default;
};

// "name:kind" splits on the last ':'; without one the kind is "create".
[[nodiscard]] auto parse_dependency(std::string_view text) -> DependencyRef;

// Declared dependencies per entity, in declaration order.
using RawDependencies =
    std::map<std::string, std::vector<DependencyRef>, std::less<>>;

}  // namespace shipyard

namespace YAML {

template <>
struct convert<shipyard::DependencyRef> {
  static bool decode(const Node& node, shipyard::DependencyRef& dep) {
    if (node.IsScalar()) {
      dep = shipyard::parse_dependency(node.Scalar());
      return true;
    }
    if (node.IsMap()) {
      dep.name = shipyard::yaml_get_or<std::string>(node, "name", "");
      dep.kind = shipyard::yaml_get_or<std::string>(
          node, "kind", std::string(shipyard::kDefaultRelation));
      return !dep.name.empty();
    }
    return false;
  }
};

}  // namespace YAML
