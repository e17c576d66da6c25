#include "shipyard/config/config_helper.hpp"

#include "shipyard/util/log.hpp"

#include <fstream>
#include <sstream>

namespace shipyard {

ConfigHelper::ConfigHelper(std::shared_ptr<const VariableContainer> variables,
                           std::filesystem::path base_path)
    : variables_(std::move(variables)),
      base_path_(std::move(base_path)),
      renderer_(*variables_) {}

auto ConfigHelper::abspath(const std::filesystem::path& path) const
    -> std::filesystem::path {
  return std::filesystem::absolute(base_path_ / path).lexically_normal();
}

auto ConfigHelper::read_file(const std::filesystem::path& path,
                             bool render_variables,
                             const ExtraVariables& extra_vars) const
    -> Result<std::string> {
  auto filepath = abspath(path);
  std::ifstream file(filepath);
  if (!file.is_open()) {
    log::error("Failed to open file: {}", filepath.string());
    return fail(Error::FileNotFound);
  }

  std::stringstream buffer;
  buffer << file.rdbuf();
  if (!render_variables) {
    return buffer.str();
  }

  auto rendered = renderer_.render(buffer.str(), extra_vars);
  if (!rendered) {
    log::error("Failed to render {}", filepath.string());
  }
  return rendered;
}

auto ConfigHelper::read_yaml(const std::filesystem::path& path,
                             bool render_variables,
                             const ExtraVariables& extra_vars) const
    -> Result<YAML::Node> {
  auto content = read_file(path, render_variables, extra_vars);
  if (!content) {
    return fail(content.error());
  }
  try {
    return YAML::Load(*content);
  } catch (const YAML::Exception& e) {
    log::error("YAML parse error in {}: {}", path.string(), e.what());
    return fail(Error::ParseError);
  }
}

auto ConfigHelper::read_json(const std::filesystem::path& path,
                             bool render_variables,
                             const ExtraVariables& extra_vars) const
    -> Result<nlohmann::json> {
  auto content = read_file(path, render_variables, extra_vars);
  if (!content) {
    return fail(content.error());
  }
  try {
    return nlohmann::json::parse(*content);
  } catch (const nlohmann::json::parse_error& e) {
    log::error("JSON parse error in {}: {}", path.string(), e.what());
    return fail(Error::ParseError);
  }
}

auto ConfigHelper::render(std::string_view text,
                          const ExtraVariables& extra_vars) const
    -> Result<std::string> {
  return renderer_.render(text, extra_vars);
}

}  // namespace shipyard
