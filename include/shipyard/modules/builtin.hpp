#pragma once

#include "shipyard/module/entity_module.hpp"

#include <nlohmann/json.hpp>

#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace shipyard {

inline constexpr std::string_view kSecretsManagerKey = "secrets";
inline constexpr std::string_view kAppsManagerKey = "apps";
inline constexpr std::string_view kJobsManagerKey = "jobs";

struct Secret : DeploymentObject {
  std::string name;
  std::string path;
  std::string value;
  bool from_file{false};

  [[nodiscard]] auto manager_key() const -> std::string_view override {
    return kSecretsManagerKey;
  }
};

struct App : DeploymentObject {
  std::string name;
  std::string path;
  nlohmann::json definition;

  [[nodiscard]] auto manager_key() const -> std::string_view override {
    return kAppsManagerKey;
  }
};

struct Job : DeploymentObject {
  std::string name;
  std::string path;
  nlohmann::json definition;
  std::optional<nlohmann::json> schedule;

  [[nodiscard]] auto manager_key() const -> std::string_view override {
    return kJobsManagerKey;
  }
};

[[nodiscard]] auto create_secret_module() -> std::unique_ptr<IEntityModule>;
[[nodiscard]] auto create_app_module() -> std::unique_ptr<IEntityModule>;
[[nodiscard]] auto create_job_module() -> std::unique_ptr<IEntityModule>;

}  // namespace shipyard
