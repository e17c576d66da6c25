#pragma once

#include "shipyard/config/variables.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace shipyard::cli {

struct PlanOptions {
  std::string config_file;
  VariableMap variables;
  std::vector<std::filesystem::path> plugin_paths;
};

struct ValidateOptions {
  std::string config_file;
  VariableMap variables;
  std::vector<std::filesystem::path> plugin_paths;
};

[[nodiscard]] auto cmd_plan(const PlanOptions& opts) -> int;
[[nodiscard]] auto cmd_validate(const ValidateOptions& opts) -> int;

}  // namespace shipyard::cli
