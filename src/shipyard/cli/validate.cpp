#include "shipyard/cli/commands.hpp"
#include "shipyard/config/config_loader.hpp"

#include <print>

namespace shipyard::cli {

auto cmd_validate(const ValidateOptions& opts) -> int {
  LoadOptions load_opts;
  load_opts.provided_variables = opts.variables;
  load_opts.plugin_paths = opts.plugin_paths;

  auto result = ConfigLoader::load(opts.config_file, load_opts);
  if (!result) {
    std::println("✗ {} - {}", opts.config_file, result.error().message());
    if (!is_configuration_error(result.error())) {
      std::println(stderr, "A module violated its contract; fix the module, "
                           "not the config");
    }
    return 1;
  }

  if (auto order = result->dependencies.deployment_order(result->objects);
      !order) {
    std::println("✗ {} - {}", opts.config_file, order.error().message());
    return 1;
  }

  std::println("✓ {} - Valid ({} entities, {} with dependencies)",
               opts.config_file, result->objects.size(),
               result->dependencies.size());
  return 0;
}

}  // namespace shipyard::cli
