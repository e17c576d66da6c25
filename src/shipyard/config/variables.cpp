#include "shipyard/config/variables.hpp"

#include "shipyard/config/yaml_utils.hpp"
#include "shipyard/util/log.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <format>
#include <ranges>

namespace YAML {

template <>
struct convert<shipyard::VariableDefinition> {
  static bool decode(const Node& node, shipyard::VariableDefinition& v) {
    // `name:` with no body declares a plain optional variable.
    if (node.IsNull()) {
      return true;
    }
    if (!node.IsMap()) {
      return false;
    }
    v.from = shipyard::yaml_scalar(node, "from");
    v.default_value = shipyard::yaml_scalar(node, "default");
    v.required = shipyard::yaml_get_or(node, "required", false);
    if (auto values = node["values"]) {
      v.values = values.as<std::vector<std::string>>();
    }
    return true;
  }
};

}  // namespace YAML

namespace shipyard {

auto process_environment(std::string_view name) -> std::optional<std::string> {
  const char* value = std::getenv(std::string(name).c_str());
  if (value == nullptr) {
    return std::nullopt;
  }
  return std::string{value};
}

auto derived_env_name(std::string_view name) -> std::string {
  std::string env_name{"VAR_"};
  env_name.reserve(env_name.size() + name.size());
  for (char c : name) {
    env_name.push_back(
        c == '-' ? '_'
                 : static_cast<char>(std::toupper(static_cast<unsigned char>(c))));
  }
  return env_name;
}

auto VariableResolver::parse_definitions(const YAML::Node& section)
    -> Result<std::vector<VariableDefinition>> {
  std::vector<VariableDefinition> defs;
  if (!section || section.IsNull()) {
    return ok(std::move(defs));
  }
  if (!section.IsMap()) {
    log::error("'variables' must be a mapping of variable name to definition");
    return fail(Error::ParseError);
  }

  try {
    for (const auto& entry : section) {
      auto def = entry.second.as<VariableDefinition>();
      def.name = entry.first.as<std::string>();
      defs.push_back(std::move(def));
    }
  } catch (const YAML::Exception& e) {
    log::error("Invalid variable definition: {}", e.what());
    return fail(Error::ParseError);
  }
  return ok(std::move(defs));
}

auto VariableResolver::calculate_value(const VariableDefinition& def,
                                       const VariableMap& provided) const
    -> std::optional<std::string> {
  if (auto it = provided.find(def.name); it != provided.end()) {
    return it->second;
  }
  auto env_name = def.from && !def.from->empty() ? *def.from
                                                 : derived_env_name(def.name);
  if (auto env_value = environment_(env_name)) {
    return env_value;
  }
  return def.default_value;
}

auto VariableResolver::resolve(const std::vector<VariableDefinition>& declared,
                               const VariableMap& provided) const
    -> Result<VariableContainer> {
  VariableContainer::Values values;

  for (const auto& def : declared) {
    auto value = calculate_value(def, provided);

    // An explicit empty string is indistinguishable from no value here.
    if (def.required && (!value || value->empty())) {
      log::error("Missing required variable {}", def.name);
      return fail(Error::MissingVariable);
    }

    if (def.values && (!value || !std::ranges::contains(*def.values, *value))) {
      auto allowed = *def.values | std::views::join_with(',') |
                     std::ranges::to<std::string>();
      log::error("Value '{}' not allowed for {}. Possible values: {}",
                 value.value_or(""), def.name, allowed);
      return fail(Error::DisallowedValue);
    }

    log::trace("Variable {} resolved to '{}'", def.name, value.value_or(""));
    values.insert_or_assign(def.name, std::move(value));
  }

  for (const auto& [name, value] : provided) {
    if (!values.contains(name)) {
      values.emplace(name, value);
    }
  }

  return ok(VariableContainer{std::move(values)});
}

auto VariableResolver::resolve(const YAML::Node& section,
                               const VariableMap& provided) const
    -> Result<VariableContainer> {
  auto defs = parse_definitions(section);
  if (!defs) {
    return fail(defs.error());
  }
  return resolve(*defs, provided);
}

}  // namespace shipyard
