#include "shipyard/config/conditions.hpp"

#include "shipyard/config/yaml_utils.hpp"
#include "shipyard/util/log.hpp"

namespace shipyard {

namespace {

auto is_empty_restriction(const YAML::Node& node) -> bool {
  return !node || node.IsNull() || (node.IsMap() && node.size() == 0);
}

auto matches(const VariableContainer& variables, const std::string& name,
             const YAML::Node& expected) -> bool {
  return variables.get(name) == yaml_scalar(expected);
}

}  // namespace

auto should_skip(const VariableContainer& variables, const YAML::Node& only,
                 const YAML::Node& except) -> Result<bool> {
  if (!is_empty_restriction(only)) {
    if (!only.IsMap()) {
      log::error("'only' restriction must be a mapping of variable to value");
      return fail(Error::InvalidEntity);
    }
    for (const auto& entry : only) {
      auto name = entry.first.as<std::string>();
      if (!variables.has(name) || !matches(variables, name, entry.second)) {
        return true;
      }
    }
  }

  if (!is_empty_restriction(except)) {
    if (!except.IsMap()) {
      log::error("'except' restriction must be a mapping of variable to value");
      return fail(Error::InvalidEntity);
    }
    for (const auto& entry : except) {
      auto name = entry.first.as<std::string>();
      if (variables.has(name) && matches(variables, name, entry.second)) {
        return true;
      }
    }
  }

  return false;
}

auto should_skip(const VariableContainer& variables,
                 const YAML::Node& entity_config) -> Result<bool> {
  if (!entity_config.IsMap()) {
    return false;
  }
  return should_skip(variables, entity_config["only"], entity_config["except"]);
}

}  // namespace shipyard
