#pragma once

#include <yaml-cpp/yaml.h>

#include <optional>
#include <string>
#include <string_view>

namespace shipyard {

template <typename T>
concept YamlParsable = requires(const YAML::Node& n) { { n.as<T>() }; };

template <YamlParsable T>
[[nodiscard]] auto yaml_get_or(const YAML::Node& node, std::string_view key,
                               T default_val) -> T {
  if (!node.IsMap()) {
    return default_val;
  }
  auto field = node[std::string(key)];
  if (!field || (!field.IsScalar() && !field.IsSequence() && !field.IsMap())) {
    return default_val;
  }
  return field.as<T>();
}

// String form of a scalar; nullopt for null, missing or non-scalar nodes.
[[nodiscard]] inline auto yaml_scalar(const YAML::Node& node)
    -> std::optional<std::string> {
  if (!node || !node.IsScalar()) {
    return std::nullopt;
  }
  return node.Scalar();
}

[[nodiscard]] inline auto yaml_scalar(const YAML::Node& node,
                                      std::string_view key)
    -> std::optional<std::string> {
  if (!node.IsMap()) {
    return std::nullopt;
  }
  return yaml_scalar(node[std::string(key)]);
}

[[nodiscard]] inline auto yaml_has(const YAML::Node& node, std::string_view key)
    -> bool {
  return node.IsMap() && static_cast<bool>(node[std::string(key)]);
}

}  // namespace shipyard
