#pragma once

#include "shipyard/config/config_helper.hpp"
#include "shipyard/core/error.hpp"

#include <yaml-cpp/yaml.h>

#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace shipyard {

// Parsed, type specific result of an entity module. The core only stores it.
class DeploymentObject {
public:
  virtual ~DeploymentObject() = default;

  // Key of the manager that applies objects of this kind.
  [[nodiscard]] virtual auto manager_key() const -> std::string_view = 0;
};

using DeploymentObjects =
    std::map<std::string, std::shared_ptr<DeploymentObject>, std::less<>>;

// Per-type singleton applying deployment objects. Execution lives outside this
// library; describe() renders a dry summary of what would be applied.
class IManager {
public:
  virtual ~IManager() = default;

  [[nodiscard]] virtual auto key() const -> std::string_view = 0;
  [[nodiscard]] virtual auto describe(const DeploymentObject& object) const
      -> std::string = 0;
};

struct EntityDefinition {
  std::string name;
  YAML::Node config;
};

class IEntityModule {
public:
  virtual ~IEntityModule() = default;

  // Value of the `type` field handled by this module.
  [[nodiscard]] virtual auto section_type() const -> std::string_view = 0;
  [[nodiscard]] virtual auto manager_key() const -> std::string_view = 0;
  [[nodiscard]] virtual auto create_manager() const
      -> std::unique_ptr<IManager> = 0;

  [[nodiscard]] virtual auto has_preprocessor() const noexcept -> bool {
    return false;
  }

  // Expands one config block into zero or more entities.
  [[nodiscard]] virtual auto preprocess(std::string_view name,
                                        const YAML::Node& config,
                                        const ConfigHelper& /*helper*/) const
      -> Result<std::vector<EntityDefinition>> {
    return ok(std::vector<EntityDefinition>{
        EntityDefinition{std::string(name), config}});
  }

  [[nodiscard]] virtual auto parse(std::string_view name,
                                   const YAML::Node& config,
                                   const ConfigHelper& helper) const
      -> Result<std::shared_ptr<DeploymentObject>> = 0;
};

// Bumped whenever IEntityModule, IManager or DeploymentObject change layout.
inline constexpr std::uint32_t kModuleAbiVersion = 1;

inline constexpr const char* kModuleEntrySymbol = "shipyard_module_entry";
inline constexpr const char* kModuleAbiSymbol = "shipyard_module_abi_version";

using ModuleEntryFn = IEntityModule* (*)();
using ModuleAbiFn = std::uint32_t (*)();

}  // namespace shipyard

// Exports a module type from a plugin shared object.
#define SHIPYARD_DECLARE_MODULE(ModuleType)                          \
  extern "C" std::uint32_t shipyard_module_abi_version() {           \
    return ::shipyard::kModuleAbiVersion;                            \
  }                                                                  \
  extern "C" ::shipyard::IEntityModule* shipyard_module_entry() {    \
    return new ModuleType();                                         \
  }
