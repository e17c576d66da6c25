#pragma once

#include "shipyard/config/config_helper.hpp"
#include "shipyard/core/error.hpp"
#include "shipyard/module/entity_module.hpp"

#include <yaml-cpp/yaml.h>

#include <string_view>
#include <vector>

namespace shipyard {

// Expands `loop: {var: [v1, v2], other: [...]}` into one entity per
// combination. Names are rendered with the loop values and each config gets
// them under `extra_vars` (merged over any existing extra_vars).
[[nodiscard]] auto expand_loop(std::string_view name, const YAML::Node& config,
                               const ConfigHelper& helper)
    -> Result<std::vector<EntityDefinition>>;

// `extra_vars` of an entity config as renderer input.
[[nodiscard]] auto extra_variables(const YAML::Node& config) -> ExtraVariables;

}  // namespace shipyard
