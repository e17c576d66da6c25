#include "shipyard/cli/commands.hpp"
#include "shipyard/config/config_loader.hpp"

#include <print>
#include <string>

namespace shipyard::cli {

auto cmd_plan(const PlanOptions& opts) -> int {
  LoadOptions load_opts;
  load_opts.provided_variables = opts.variables;
  load_opts.plugin_paths = opts.plugin_paths;

  auto result = ConfigLoader::load(opts.config_file, load_opts);
  if (!result) {
    std::println(stderr, "Error: {} ({})", result.error().message(),
                 is_configuration_error(result.error()) ? "check the config"
                                                        : "check the module");
    return 1;
  }
  const auto& config = *result;

  auto order = config.dependencies.deployment_order(config.objects);
  if (!order) {
    std::println(stderr, "Error: {}", order.error().message());
    return 1;
  }

  std::println("{} entities, {} managers", config.objects.size(),
               config.managers.size());
  for (const auto& name : *order) {
    const auto& object = config.objects.at(name);
    auto manager = config.managers.find(object->manager_key());
    auto summary = manager != config.managers.end()
                       ? manager->second->describe(*object)
                       : std::string{"(no manager)"};
    std::println("  {}: {}", name, summary);

    for (const auto& dep : config.dependencies.dependencies_of(name)) {
      std::println("      after {} [{}]", dep.name, dep.kind);
    }
  }
  return 0;
}

}  // namespace shipyard::cli
