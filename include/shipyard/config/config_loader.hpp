#pragma once

#include "shipyard/config/variables.hpp"
#include "shipyard/core/error.hpp"
#include "shipyard/graph/dependency_graph.hpp"
#include "shipyard/module/entity_module.hpp"
#include "shipyard/module/module_registry.hpp"
#include "shipyard/module/plugin_library.hpp"

#include <yaml-cpp/yaml.h>

#include <filesystem>
#include <memory>
#include <string_view>
#include <vector>

namespace shipyard {

struct LoadOptions {
  VariableMap provided_variables;
  // Searched for plugin modules before any `dir:module` additions.
  std::vector<std::filesystem::path> plugin_paths;
  ModuleCatalog catalog{ModuleCatalog::with_builtins()};
  EnvironmentLookup environment{process_environment};
};

// Result of one load. Plugin libraries are declared first so they are
// unloaded after the objects and managers created by their code.
struct LoadedConfig {
  std::vector<std::shared_ptr<PluginLibrary>> libraries;
  std::shared_ptr<const VariableContainer> variables;
  ManagerMap managers;
  DeploymentObjects objects;
  DependencyGraph dependencies;
};

class ConfigLoader {
public:
  [[nodiscard]] static auto load(const std::filesystem::path& path,
                                 const LoadOptions& options)
      -> Result<LoadedConfig>;

  [[nodiscard]] static auto load(const std::filesystem::path& path,
                                 const VariableMap& provided_variables)
      -> Result<LoadedConfig>;

  // Reads a YAML document that must be a mapping.
  [[nodiscard]] static auto read_document(const std::filesystem::path& path)
      -> Result<YAML::Node>;

  // Shallow merge of every `includes` entry into `root`, in list order. A
  // `variables` key in an include is skipped with a warning.
  [[nodiscard]] static auto merge_includes(YAML::Node& root,
                                           const std::filesystem::path& base_path)
      -> Result<void>;
};

}  // namespace shipyard
