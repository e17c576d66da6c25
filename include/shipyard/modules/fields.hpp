#pragma once

#include "shipyard/config/config_helper.hpp"
#include "shipyard/config/yaml_utils.hpp"
#include "shipyard/core/error.hpp"
#include "shipyard/util/log.hpp"

#include <yaml-cpp/yaml.h>

#include <optional>
#include <string>
#include <string_view>

namespace shipyard {

// Rendered value of a scalar field; nullopt when the field is absent.
[[nodiscard]] inline auto render_field(const YAML::Node& config,
                                       std::string_view key,
                                       const ConfigHelper& helper,
                                       const ExtraVariables& vars)
    -> Result<std::optional<std::string>> {
  auto raw = yaml_scalar(config, key);
  if (!raw) {
    return std::optional<std::string>{};
  }
  auto rendered = helper.render(*raw, vars);
  if (!rendered) {
    return fail(rendered.error());
  }
  return std::optional<std::string>{std::move(*rendered)};
}

[[nodiscard]] inline auto require_field(std::string_view entity,
                                        const YAML::Node& config,
                                        std::string_view key,
                                        const ConfigHelper& helper,
                                        const ExtraVariables& vars)
    -> Result<std::string> {
  auto value = render_field(config, key, helper, vars);
  if (!value) {
    return fail(value.error());
  }
  if (!*value || (*value)->empty()) {
    log::error("Entity {}: missing required field '{}'", entity, key);
    return fail(Error::InvalidEntity);
  }
  return std::move(**value);
}

}  // namespace shipyard
