#pragma once

#include "shipyard/config/config_helper.hpp"
#include "shipyard/config/variables.hpp"
#include "shipyard/core/error.hpp"
#include "shipyard/graph/dependency.hpp"
#include "shipyard/module/entity_module.hpp"
#include "shipyard/module/module_registry.hpp"

#include <yaml-cpp/yaml.h>

#include <array>
#include <string_view>

namespace shipyard {

// Top-level keys that carry metadata instead of entities.
inline constexpr std::array<std::string_view, 3> kReservedKeys = {
    "variables", "modules", "includes"};

[[nodiscard]] constexpr auto is_reserved_key(std::string_view key) noexcept
    -> bool {
  for (auto reserved : kReservedKeys) {
    if (key == reserved) {
      return true;
    }
  }
  return false;
}

struct PipelineOutput {
  DeploymentObjects objects;
  RawDependencies dependencies;
};

class EntityPipeline {
public:
  // Preprocesses, filters and parses every entity section in document order.
  [[nodiscard]] static auto process(const ModuleRegistry& registry,
                                    const VariableContainer& variables,
                                    const YAML::Node& document,
                                    const ConfigHelper& helper)
      -> Result<PipelineOutput>;

private:
  [[nodiscard]] static auto process_section(const IEntityModule& module,
                                            std::string_view name,
                                            const YAML::Node& config,
                                            const VariableContainer& variables,
                                            const ConfigHelper& helper,
                                            PipelineOutput& output)
      -> Result<void>;

  [[nodiscard]] static auto process_entity(const IEntityModule& module,
                                           const EntityDefinition& entity,
                                           const VariableContainer& variables,
                                           const ConfigHelper& helper,
                                           PipelineOutput& output)
      -> Result<void>;
};

}  // namespace shipyard
