#pragma once

#include "shipyard/config/template_renderer.hpp"
#include "shipyard/config/variables.hpp"
#include "shipyard/core/error.hpp"

#include <nlohmann/json.hpp>
#include <yaml-cpp/yaml.h>

#include <filesystem>
#include <memory>
#include <string>
#include <string_view>

namespace shipyard {

// Facade handed to entity modules. Every relative path is resolved against the
// directory of the root document, including paths written in include files.
class ConfigHelper {
 public:
  ConfigHelper(std::shared_ptr<const VariableContainer> variables,
               std::filesystem::path base_path);

  [[nodiscard]] auto abspath(const std::filesystem::path& path) const
      -> std::filesystem::path;

  [[nodiscard]] auto read_file(const std::filesystem::path& path,
                               bool render_variables = false,
                               const ExtraVariables& extra_vars = {}) const
      -> Result<std::string>;

  [[nodiscard]] auto read_yaml(const std::filesystem::path& path,
                               bool render_variables = false,
                               const ExtraVariables& extra_vars = {}) const
      -> Result<YAML::Node>;

  [[nodiscard]] auto read_json(const std::filesystem::path& path,
                               bool render_variables = false,
                               const ExtraVariables& extra_vars = {}) const
      -> Result<nlohmann::json>;

  [[nodiscard]] auto render(std::string_view text,
                            const ExtraVariables& extra_vars = {}) const
      -> Result<std::string>;

  [[nodiscard]] auto variables() const noexcept -> const VariableContainer& {
    return *variables_;
  }

  [[nodiscard]] auto base_path() const noexcept
      -> const std::filesystem::path& {
    return base_path_;
  }

 private:
  std::shared_ptr<const VariableContainer> variables_;
  std::filesystem::path base_path_;
  TemplateRenderer renderer_;
};

}  // namespace shipyard
