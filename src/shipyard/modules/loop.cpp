#include "shipyard/modules/loop.hpp"

#include "shipyard/config/yaml_utils.hpp"
#include "shipyard/util/log.hpp"

#include <string>
#include <utility>

namespace shipyard {

auto extra_variables(const YAML::Node& config) -> ExtraVariables {
  ExtraVariables vars;
  if (!config.IsMap()) {
    return vars;
  }
  auto node = config["extra_vars"];
  if (!node || !node.IsMap()) {
    return vars;
  }
  for (const auto& entry : node) {
    if (auto value = yaml_scalar(entry.second)) {
      vars.insert_or_assign(entry.first.as<std::string>(), std::move(*value));
    }
  }
  return vars;
}

auto expand_loop(std::string_view name, const YAML::Node& config,
                 const ConfigHelper& helper)
    -> Result<std::vector<EntityDefinition>> {
  std::vector<EntityDefinition> entities;
  auto loop = config.IsMap() ? config["loop"] : YAML::Node{};
  if (!loop || loop.IsNull()) {
    entities.push_back(EntityDefinition{std::string(name), config});
    return ok(std::move(entities));
  }
  if (!loop.IsMap()) {
    log::error("Entity {}: 'loop' must map variable names to value lists", name);
    return fail(Error::InvalidEntity);
  }

  // Cartesian product, first loop variable varying slowest.
  std::vector<std::vector<std::pair<std::string, std::string>>> combinations{{}};
  for (const auto& entry : loop) {
    auto var = entry.first.as<std::string>();
    if (!entry.second.IsSequence()) {
      log::error("Entity {}: loop variable {} must list its values", name, var);
      return fail(Error::InvalidEntity);
    }
    std::vector<std::vector<std::pair<std::string, std::string>>> next;
    for (const auto& partial : combinations) {
      for (const auto& value : entry.second) {
        auto combined = partial;
        combined.emplace_back(var, value.as<std::string>());
        next.push_back(std::move(combined));
      }
    }
    combinations = std::move(next);
  }

  for (const auto& combination : combinations) {
    auto vars = extra_variables(config);
    for (const auto& [var, value] : combination) {
      vars.insert_or_assign(var, value);
    }

    auto rendered_name = helper.render(name, vars);
    if (!rendered_name) {
      log::error("Entity {}: could not render looped name", name);
      return fail(rendered_name.error());
    }

    auto expanded = YAML::Clone(config);
    expanded.remove("loop");
    YAML::Node extra(YAML::NodeType::Map);
    for (const auto& [var, value] : vars) {
      extra[var] = value;
    }
    expanded["extra_vars"] = extra;
    entities.push_back(EntityDefinition{std::move(*rendered_name), expanded});
  }

  log::debug("Entity {} expanded into {} entities", name, entities.size());
  return ok(std::move(entities));
}

}  // namespace shipyard
