#pragma once

#include "shipyard/config/variables.hpp"
#include "shipyard/core/error.hpp"

#include <yaml-cpp/yaml.h>

namespace shipyard {

// `only`: every listed variable must be declared and equal the listed value.
// `except`: any listed variable that is declared and equal skips the entity.
// A null listed value matches a declared variable that has no value.
[[nodiscard]] auto should_skip(const VariableContainer& variables,
                               const YAML::Node& only,
                               const YAML::Node& except) -> Result<bool>;

// Reads `only`/`except` from an entity config.
[[nodiscard]] auto should_skip(const VariableContainer& variables,
                               const YAML::Node& entity_config) -> Result<bool>;

}  // namespace shipyard
