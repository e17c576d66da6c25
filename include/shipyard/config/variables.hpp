#pragma once

#include "shipyard/core/error.hpp"

#include <yaml-cpp/yaml.h>

#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace shipyard {

// Variables supplied by the caller (command line, API); always strings.
using VariableMap = std::map<std::string, std::string, std::less<>>;

using EnvironmentLookup =
    std::function<std::optional<std::string>(std::string_view)>;

[[nodiscard]] auto process_environment(std::string_view name)
    -> std::optional<std::string>;

struct VariableDefinition {
  std::string name;
  std::optional<std::string> from;
  std::optional<std::string> default_value;
  bool required{false};
  std::optional<std::vector<std::string>> values;
};

// "VAR_" + upper-cased name with '-' replaced by '_'.
[[nodiscard]] auto derived_env_name(std::string_view name) -> std::string;

class VariableContainer {
public:
  using Values = std::map<std::string, std::optional<std::string>, std::less<>>;

  VariableContainer() = default;
  explicit VariableContainer(Values values) : values_(std::move(values)) {}

  // Declared (or passed through) variables, whether or not they have a value.
  [[nodiscard]] auto has(std::string_view name) const -> bool {
    return values_.contains(name);
  }

  [[nodiscard]] auto get(std::string_view name) const
      -> std::optional<std::string> {
    auto it = values_.find(name);
    return it != values_.end() ? it->second : std::nullopt;
  }

  [[nodiscard]] auto values() const noexcept -> const Values& {
    return values_;
  }

  [[nodiscard]] auto size() const noexcept -> std::size_t {
    return values_.size();
  }

private:
  Values values_;
};

class VariableResolver {
public:
  explicit VariableResolver(EnvironmentLookup environment = process_environment)
      : environment_(std::move(environment)) {}

  [[nodiscard]] static auto parse_definitions(const YAML::Node& section)
      -> Result<std::vector<VariableDefinition>>;

  [[nodiscard]] auto resolve(const std::vector<VariableDefinition>& declared,
                             const VariableMap& provided) const
      -> Result<VariableContainer>;

  [[nodiscard]] auto resolve(const YAML::Node& section,
                             const VariableMap& provided) const
      -> Result<VariableContainer>;

private:
  [[nodiscard]] auto calculate_value(const VariableDefinition& def,
                                     const VariableMap& provided) const
      -> std::optional<std::string>;

  EnvironmentLookup environment_;
};

}  // namespace shipyard
