#include "shipyard/pipeline/entity_pipeline.hpp"

#include "shipyard/config/conditions.hpp"
#include "shipyard/config/yaml_utils.hpp"
#include "shipyard/util/log.hpp"

#include <string>
#include <vector>

namespace shipyard {

auto EntityPipeline::process(const ModuleRegistry& registry,
                             const VariableContainer& variables,
                             const YAML::Node& document,
                             const ConfigHelper& helper)
    -> Result<PipelineOutput> {
  PipelineOutput output;

  for (const auto& section : document) {
    auto name = section.first.as<std::string>();
    if (is_reserved_key(name)) {
      continue;
    }

    const auto& config = section.second;
    if (!config.IsMap()) {
      log::error("Entity {}: configuration must be a mapping", name);
      return fail(Error::InvalidEntity);
    }

    auto type = yaml_scalar(config, "type");
    if (!type) {
      log::error("Entity {} has no type", name);
      return fail(Error::MissingEntityType);
    }

    const auto* module = registry.find(*type);
    if (module == nullptr) {
      log::error("Entity {} has unknown type '{}'", name, *type);
      return fail(Error::UnknownEntityType);
    }

    if (auto r = process_section(*module, name, config, variables, helper,
                                 output);
        !r) {
      return fail(r.error());
    }
  }

  log::debug("Parsed {} entities, {} with dependencies", output.objects.size(),
             output.dependencies.size());
  return ok(std::move(output));
}

auto EntityPipeline::process_section(const IEntityModule& module,
                                     std::string_view name,
                                     const YAML::Node& config,
                                     const VariableContainer& variables,
                                     const ConfigHelper& helper,
                                     PipelineOutput& output) -> Result<void> {
  std::vector<EntityDefinition> entities;
  if (module.has_preprocessor()) {
    try {
      auto expanded = module.preprocess(name, config, helper);
      if (!expanded) {
        return fail(expanded.error());
      }
      entities = std::move(*expanded);
    } catch (const YAML::Exception& e) {
      log::error("Entity {}: invalid configuration: {}", name, e.what());
      return fail(Error::InvalidEntity);
    }
  } else {
    entities.push_back(EntityDefinition{std::string(name), config});
  }

  for (const auto& entity : entities) {
    if (auto r = process_entity(module, entity, variables, helper, output); !r) {
      return r;
    }
  }
  return ok();
}

auto EntityPipeline::process_entity(const IEntityModule& module,
                                    const EntityDefinition& entity,
                                    const VariableContainer& variables,
                                    const ConfigHelper& helper,
                                    PipelineOutput& output) -> Result<void> {
  auto skip = should_skip(variables, entity.config);
  if (!skip) {
    log::error("Entity {}: invalid only/except restriction", entity.name);
    return fail(skip.error());
  }
  if (*skip) {
    log::debug("Entity {} skipped by only/except restriction", entity.name);
    return ok();
  }

  std::vector<DependencyRef> dependencies;
  try {
    if (auto deps = entity.config["dependencies"]; deps && !deps.IsNull()) {
      dependencies = deps.as<std::vector<DependencyRef>>();
    }
  } catch (const YAML::Exception& e) {
    log::error("Entity {}: invalid dependencies: {}", entity.name, e.what());
    return fail(Error::InvalidEntity);
  }

  std::shared_ptr<DeploymentObject> object;
  try {
    auto parsed = module.parse(entity.name, entity.config, helper);
    if (!parsed) {
      log::error("Entity {}: {}", entity.name, parsed.error().message());
      return fail(parsed.error());
    }
    object = std::move(*parsed);
  } catch (const YAML::Exception& e) {
    log::error("Entity {}: invalid configuration: {}", entity.name, e.what());
    return fail(Error::InvalidEntity);
  }

  if (!object) {
    log::error("Module for type '{}' returned no object for {}",
               module.section_type(), entity.name);
    return fail(Error::ModuleContractViolation);
  }

  if (output.objects.contains(entity.name)) {
    log::debug("Entity {} redefined, replacing the earlier definition",
               entity.name);
  }
  output.objects.insert_or_assign(entity.name, std::move(object));
  // A redefinition without dependencies keeps the ones recorded earlier.
  if (!dependencies.empty()) {
    output.dependencies.insert_or_assign(entity.name, std::move(dependencies));
  }
  return ok();
}

}  // namespace shipyard
