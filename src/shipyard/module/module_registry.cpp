#include "shipyard/module/module_registry.hpp"

#include "shipyard/util/log.hpp"

#include <ranges>

namespace shipyard {

auto parse_module_identifier(std::string_view identifier) -> ModuleIdentifier {
  auto pos = identifier.rfind(':');
  if (pos == std::string_view::npos) {
    return ModuleIdentifier{std::nullopt, std::string(identifier)};
  }
  return ModuleIdentifier{std::string(identifier.substr(0, pos)),
                          std::string(identifier.substr(pos + 1))};
}

ModuleRegistry::ModuleRegistry(ModuleCatalog catalog,
                               std::vector<std::filesystem::path> search_paths,
                               std::filesystem::path base_path)
    : catalog_(std::move(catalog)),
      search_paths_(std::move(search_paths)),
      base_path_(std::move(base_path)) {}

auto ModuleRegistry::load(const std::vector<std::string>& additional)
    -> Result<void> {
  for (auto name : kBuiltinModules) {
    if (auto r = load_one(name); !r) {
      return r;
    }
  }
  for (const auto& identifier : additional) {
    if (auto r = load_one(identifier); !r) {
      return r;
    }
  }
  log::debug("Loaded {} module(s), {} manager(s)", modules_.size(),
             managers_.size());
  return ok();
}

auto ModuleRegistry::load_one(std::string_view identifier) -> Result<void> {
  auto id = parse_module_identifier(identifier);
  if (id.name.empty()) {
    log::error("Invalid module identifier '{}'", identifier);
    return fail(Error::ModuleLoadFailed);
  }

  // Stays in effect for every module loaded after this one.
  if (id.search_path) {
    std::filesystem::path dir{*id.search_path};
    if (dir.is_relative() && !base_path_.empty()) {
      dir = base_path_ / dir;
    }
    search_paths_.push_back(dir.lexically_normal());
  }

  auto module = instantiate(id.name);
  if (!module) {
    return fail(module.error());
  }
  return install(id.name, std::move(*module));
}

auto ModuleRegistry::instantiate(std::string_view name)
    -> Result<std::shared_ptr<IEntityModule>> {
  if (const auto* factory = catalog_.find(name)) {
    std::shared_ptr<IEntityModule> module = (*factory)();
    if (!module) {
      log::error("Module factory '{}' returned no module", name);
      return fail(Error::ModuleContractViolation);
    }
    return module;
  }
  return instantiate_plugin(name);
}

auto ModuleRegistry::instantiate_plugin(std::string_view name)
    -> Result<std::shared_ptr<IEntityModule>> {
  auto path = find_plugin(search_paths_, name);
  if (!path) {
    log::error("Could not find module '{}' (searched {} plugin path(s))", name,
               search_paths_.size());
    return fail(Error::ModuleLoadFailed);
  }

  auto library = PluginLibrary::open(*path);
  if (!library) {
    return fail(library.error());
  }

  auto abi_fn = reinterpret_cast<ModuleAbiFn>((*library)->symbol(kModuleAbiSymbol));
  auto entry_fn =
      reinterpret_cast<ModuleEntryFn>((*library)->symbol(kModuleEntrySymbol));
  if (abi_fn == nullptr || entry_fn == nullptr) {
    log::error("Plugin {} does not export the module entry points",
               path->string());
    return fail(Error::ModuleLoadFailed);
  }
  if (auto version = abi_fn(); version != kModuleAbiVersion) {
    log::error("Plugin {} was built for module ABI {}, expected {}",
               path->string(), version, kModuleAbiVersion);
    return fail(Error::ModuleLoadFailed);
  }

  IEntityModule* raw = entry_fn();
  if (raw == nullptr) {
    log::error("Plugin {} returned no module", path->string());
    return fail(Error::ModuleContractViolation);
  }

  libraries_.push_back(*library);
  // The deleter keeps the library mapped until the module is destroyed.
  return std::shared_ptr<IEntityModule>(
      raw, [lib = *library](IEntityModule* m) { delete m; });
}

auto ModuleRegistry::install(std::string_view name,
                             std::shared_ptr<IEntityModule> module)
    -> Result<void> {
  auto section_type = std::string(module->section_type());
  auto manager_key = std::string(module->manager_key());
  if (section_type.empty() || manager_key.empty()) {
    log::error("Module '{}' must declare a section type and a manager key",
               name);
    return fail(Error::ModuleContractViolation);
  }

  std::shared_ptr<IManager> manager = module->create_manager();
  if (!manager) {
    log::error("Module '{}' did not create a manager", name);
    return fail(Error::ModuleContractViolation);
  }

  log::debug("Module '{}' handles type '{}' (manager '{}')", name,
             section_type, manager_key);
  managers_.insert_or_assign(std::move(manager_key), std::move(manager));
  modules_.insert_or_assign(std::move(section_type), std::move(module));
  return ok();
}

auto ModuleRegistry::find(std::string_view section_type) const
    -> const IEntityModule* {
  auto it = modules_.find(section_type);
  return it != modules_.end() ? it->second.get() : nullptr;
}

auto ModuleRegistry::section_types() const -> std::vector<std::string> {
  return modules_ | std::views::keys | std::ranges::to<std::vector<std::string>>();
}

}  // namespace shipyard
