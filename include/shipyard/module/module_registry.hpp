#pragma once

#include "shipyard/core/error.hpp"
#include "shipyard/module/entity_module.hpp"
#include "shipyard/module/plugin_library.hpp"

#include <array>
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

namespace shipyard {

using ModuleFactory = std::function<std::unique_ptr<IEntityModule>()>;

// Modules compiled into the executable, addressed by module name.
class ModuleCatalog {
public:
  [[nodiscard]] static auto with_builtins() -> ModuleCatalog;

  auto add(std::string name, ModuleFactory factory) -> void {
    factories_.insert_or_assign(std::move(name), std::move(factory));
  }

  [[nodiscard]] auto find(std::string_view name) const -> const ModuleFactory* {
    auto it = factories_.find(name);
    return it != factories_.end() ? &it->second : nullptr;
  }

  [[nodiscard]] auto contains(std::string_view name) const -> bool {
    return factories_.contains(name);
  }

private:
  std::unordered_map<std::string, ModuleFactory, StringHash, StringEqual>
      factories_;
};

// Loaded before anything named in the document's `modules` list.
inline constexpr std::array<std::string_view, 3> kBuiltinModules = {
    "secret", "app", "job"};

using ManagerMap = std::map<std::string, std::shared_ptr<IManager>, std::less<>>;

struct ModuleIdentifier {
  std::optional<std::string> search_path;
  std::string name;
};

// "dir:module" -> {dir, module}; "module" -> {nullopt, module}.
[[nodiscard]] auto parse_module_identifier(std::string_view identifier)
    -> ModuleIdentifier;

class ModuleRegistry {
public:
  // `base_path` anchors relative search paths given in module identifiers.
  explicit ModuleRegistry(ModuleCatalog catalog,
                          std::vector<std::filesystem::path> search_paths = {},
                          std::filesystem::path base_path = {});

  ModuleRegistry(const ModuleRegistry&) = delete;
  auto operator=(const ModuleRegistry&) -> ModuleRegistry& = delete;
  ModuleRegistry(ModuleRegistry&&) noexcept = default;
  auto operator=(ModuleRegistry&&) noexcept -> ModuleRegistry& = default;

  // Loads the built-in modules, then `additional` in order.
  [[nodiscard]] auto load(const std::vector<std::string>& additional)
      -> Result<void>;

  [[nodiscard]] auto find(std::string_view section_type) const
      -> const IEntityModule*;

  [[nodiscard]] auto managers() const noexcept -> const ManagerMap& {
    return managers_;
  }

  [[nodiscard]] auto libraries() const noexcept
      -> const std::vector<std::shared_ptr<PluginLibrary>>& {
    return libraries_;
  }

  [[nodiscard]] auto search_paths() const noexcept
      -> const std::vector<std::filesystem::path>& {
    return search_paths_;
  }

  [[nodiscard]] auto section_types() const -> std::vector<std::string>;

  [[nodiscard]] auto size() const noexcept -> std::size_t {
    return modules_.size();
  }

private:
  [[nodiscard]] auto load_one(std::string_view identifier) -> Result<void>;
  [[nodiscard]] auto instantiate(std::string_view name)
      -> Result<std::shared_ptr<IEntityModule>>;
  [[nodiscard]] auto instantiate_plugin(std::string_view name)
      -> Result<std::shared_ptr<IEntityModule>>;
  [[nodiscard]] auto install(std::string_view name,
                             std::shared_ptr<IEntityModule> module)
      -> Result<void>;

  // Declared first so plugin code stays mapped until everything else is gone.
  std::vector<std::shared_ptr<PluginLibrary>> libraries_;
  ModuleCatalog catalog_;
  std::vector<std::filesystem::path> search_paths_;
  std::filesystem::path base_path_;
  std::map<std::string, std::shared_ptr<IEntityModule>, std::less<>> modules_;
  ManagerMap managers_;
};

}  // namespace shipyard
