#pragma once

#include "shipyard/core/error.hpp"

#include <filesystem>
#include <memory>
#include <optional>
#include <string_view>
#include <vector>

namespace shipyard {

// Owns a dlopen handle. Objects created by code in the library must be
// destroyed before the last reference to it goes away.
class PluginLibrary {
public:
  ~PluginLibrary();

  PluginLibrary(const PluginLibrary&) = delete;
  auto operator=(const PluginLibrary&) -> PluginLibrary& = delete;

  [[nodiscard]] static auto open(const std::filesystem::path& path)
      -> Result<std::shared_ptr<PluginLibrary>>;

  [[nodiscard]] auto symbol(const char* name) const -> void*;

  [[nodiscard]] auto path() const noexcept -> const std::filesystem::path& {
    return path_;
  }

private:
  PluginLibrary(void* handle, std::filesystem::path path);

  void* handle_{nullptr};
  std::filesystem::path path_;
};

// Looks for lib<name>.so, then <name>.so, in each directory in order.
[[nodiscard]] auto find_plugin(const std::vector<std::filesystem::path>& search_paths,
                               std::string_view name)
    -> std::optional<std::filesystem::path>;

}  // namespace shipyard
