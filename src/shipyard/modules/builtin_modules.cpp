#include "shipyard/module/module_registry.hpp"
#include "shipyard/modules/builtin.hpp"

namespace shipyard {

auto ModuleCatalog::with_builtins() -> ModuleCatalog {
  ModuleCatalog catalog;
  catalog.add("secret", create_secret_module);
  catalog.add("app", create_app_module);
  catalog.add("job", create_job_module);
  return catalog;
}

}  // namespace shipyard
