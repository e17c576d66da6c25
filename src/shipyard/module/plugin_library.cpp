#include "shipyard/module/plugin_library.hpp"

#include "shipyard/util/log.hpp"

#include <dlfcn.h>

#include <format>
#include <string>

namespace shipyard {

namespace {
constexpr std::string_view kLibraryExtension = ".so";
}  // namespace

PluginLibrary::PluginLibrary(void* handle, std::filesystem::path path)
    : handle_(handle), path_(std::move(path)) {}

PluginLibrary::~PluginLibrary() {
  if (handle_ != nullptr) {
    dlclose(handle_);
    handle_ = nullptr;
  }
}

auto PluginLibrary::open(const std::filesystem::path& path)
    -> Result<std::shared_ptr<PluginLibrary>> {
  if (!std::filesystem::exists(path)) {
    log::error("Plugin file not found: {}", path.string());
    return fail(Error::ModuleLoadFailed);
  }

  dlerror();
  void* handle = dlopen(path.c_str(), RTLD_NOW | RTLD_LOCAL);
  if (handle == nullptr) {
    const char* reason = dlerror();
    log::error("Failed to load plugin {}: {}", path.string(),
               reason != nullptr ? reason : "unknown error");
    return fail(Error::ModuleLoadFailed);
  }

  log::debug("Loaded plugin library {}", path.string());
  return std::shared_ptr<PluginLibrary>(new PluginLibrary(handle, path));
}

auto PluginLibrary::symbol(const char* name) const -> void* {
  if (handle_ == nullptr) {
    return nullptr;
  }
  dlerror();
  return dlsym(handle_, name);
}

auto find_plugin(const std::vector<std::filesystem::path>& search_paths,
                 std::string_view name) -> std::optional<std::filesystem::path> {
  const std::string candidates[] = {
      std::format("lib{}{}", name, kLibraryExtension),
      std::format("{}{}", name, kLibraryExtension),
  };

  for (const auto& dir : search_paths) {
    for (const auto& file : candidates) {
      auto full_path = dir / file;
      if (std::filesystem::exists(full_path)) {
        return full_path;
      }
    }
  }
  return std::nullopt;
}

}  // namespace shipyard
