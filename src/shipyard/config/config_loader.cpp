#include "shipyard/config/config_loader.hpp"

#include "shipyard/config/config_helper.hpp"
#include "shipyard/pipeline/entity_pipeline.hpp"
#include "shipyard/util/log.hpp"

#include <fstream>
#include <sstream>
#include <string>

namespace shipyard {

namespace {

auto read_module_list(const YAML::Node& document)
    -> Result<std::vector<std::string>> {
  auto node = document["modules"];
  if (!node || node.IsNull()) {
    return ok(std::vector<std::string>{});
  }
  try {
    return node.as<std::vector<std::string>>();
  } catch (const YAML::Exception& e) {
    log::error("'modules' must be a list of module names: {}", e.what());
    return fail(Error::ParseError);
  }
}

}  // namespace

auto ConfigLoader::read_document(const std::filesystem::path& path)
    -> Result<YAML::Node> {
  std::ifstream file(path);
  if (!file.is_open()) {
    log::error("Failed to open config file: {}", path.string());
    return fail(Error::FileNotFound);
  }

  std::stringstream buffer;
  buffer << file.rdbuf();
  try {
    YAML::Node root = YAML::Load(buffer.str());
    if (!root.IsDefined() || root.IsNull()) {
      return YAML::Node(YAML::NodeType::Map);
    }
    if (!root.IsMap()) {
      log::error("{}: top level must be a mapping", path.string());
      return fail(Error::ParseError);
    }
    return root;
  } catch (const YAML::Exception& e) {
    log::error("YAML parse error in {}: {}", path.string(), e.what());
    return fail(Error::ParseError);
  }
}

auto ConfigLoader::merge_includes(YAML::Node& root,
                                  const std::filesystem::path& base_path)
    -> Result<void> {
  const YAML::Node& doc = root;
  auto includes_node = doc["includes"];
  if (!includes_node || includes_node.IsNull()) {
    return ok();
  }

  std::vector<std::string> includes;
  try {
    includes = includes_node.as<std::vector<std::string>>();
  } catch (const YAML::Exception& e) {
    log::error("'includes' must be a list of paths: {}", e.what());
    return fail(Error::ParseError);
  }

  for (const auto& include : includes) {
    auto include_path = (base_path / include).lexically_normal();
    auto additional = read_document(include_path);
    if (!additional) {
      return fail(additional.error());
    }

    for (const auto& entry : *additional) {
      auto key = entry.first.as<std::string>();
      if (doc[key]) {
        log::error("{} found in base config and include file {}", key, include);
        return fail(Error::DuplicateSection);
      }
      if (key == "variables") {
        log::warn("Variables in include file {} are ignored", include);
        continue;
      }
      root[key] = entry.second;
    }
    log::debug("Merged include {}", include_path.string());
  }
  return ok();
}

auto ConfigLoader::load(const std::filesystem::path& path,
                        const LoadOptions& options) -> Result<LoadedConfig> {
  auto abspath = std::filesystem::absolute(path).lexically_normal();
  auto base_path = abspath.parent_path();

  auto root = read_document(abspath);
  if (!root) {
    return fail(root.error());
  }
  const YAML::Node& document = *root;

  // Only the root document declares variables. They are resolved before any
  // include is read or module loaded, so a missing required variable fails
  // the load up front.
  VariableResolver resolver{options.environment};
  auto variables = resolver.resolve(document["variables"],
                                    options.provided_variables);
  if (!variables) {
    return fail(variables.error());
  }

  if (auto r = merge_includes(*root, base_path); !r) {
    return fail(r.error());
  }
  auto container =
      std::make_shared<const VariableContainer>(std::move(*variables));
  ConfigHelper helper{container, base_path};

  auto additional_modules = read_module_list(document);
  if (!additional_modules) {
    return fail(additional_modules.error());
  }
  ModuleRegistry registry{options.catalog, options.plugin_paths, base_path};
  if (auto r = registry.load(*additional_modules); !r) {
    return fail(r.error());
  }

  auto parsed = EntityPipeline::process(registry, *container, document, helper);
  if (!parsed) {
    return fail(parsed.error());
  }

  auto graph = DependencyGraph::build(parsed->dependencies, parsed->objects);
  if (!graph) {
    return fail(graph.error());
  }

  log::info("Loaded {} entities from {}", parsed->objects.size(),
            abspath.string());

  return ok(LoadedConfig{
      .libraries = registry.libraries(),
      .variables = std::move(container),
      .managers = registry.managers(),
      .objects = std::move(parsed->objects),
      .dependencies = std::move(*graph),
  });
}

auto ConfigLoader::load(const std::filesystem::path& path,
                        const VariableMap& provided_variables)
    -> Result<LoadedConfig> {
  LoadOptions options;
  options.provided_variables = provided_variables;
  return load(path, options);
}

}  // namespace shipyard
