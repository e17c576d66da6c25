#include "shipyard/modules/builtin.hpp"

#include "shipyard/modules/fields.hpp"
#include "shipyard/modules/loop.hpp"

#include <format>

namespace shipyard {

namespace {

class SecretsManager : public IManager {
public:
  [[nodiscard]] auto key() const -> std::string_view override {
    return kSecretsManagerKey;
  }

  [[nodiscard]] auto describe(const DeploymentObject& object) const
      -> std::string override {
    const auto& secret = static_cast<const Secret&>(object);
    return std::format("secret {} ({} bytes{})", secret.path,
                       secret.value.size(),
                       secret.from_file ? ", from file" : "");
  }
};

class SecretModule : public IEntityModule {
public:
  [[nodiscard]] auto section_type() const -> std::string_view override {
    return "secret";
  }

  [[nodiscard]] auto manager_key() const -> std::string_view override {
    return kSecretsManagerKey;
  }

  [[nodiscard]] auto create_manager() const
      -> std::unique_ptr<IManager> override {
    return std::make_unique<SecretsManager>();
  }

  [[nodiscard]] auto has_preprocessor() const noexcept -> bool override {
    return true;
  }

  [[nodiscard]] auto preprocess(std::string_view name, const YAML::Node& config,
                                const ConfigHelper& helper) const
      -> Result<std::vector<EntityDefinition>> override {
    return expand_loop(name, config, helper);
  }

  [[nodiscard]] auto parse(std::string_view name, const YAML::Node& config,
                           const ConfigHelper& helper) const
      -> Result<std::shared_ptr<DeploymentObject>> override {
    auto vars = extra_variables(config);
    auto secret = std::make_shared<Secret>();
    secret->name = std::string(name);

    auto path = require_field(name, config, "path", helper, vars);
    if (!path) {
      return fail(path.error());
    }
    secret->path = std::move(*path);

    bool has_value = yaml_has(config, "value");
    bool has_file = yaml_has(config, "file");
    if (has_value == has_file) {
      log::error("Secret {}: exactly one of 'value' or 'file' is required",
                 name);
      return fail(Error::InvalidEntity);
    }

    if (has_value) {
      auto value = require_field(name, config, "value", helper, vars);
      if (!value) {
        return fail(value.error());
      }
      secret->value = std::move(*value);
    } else {
      auto file = require_field(name, config, "file", helper, vars);
      if (!file) {
        return fail(file.error());
      }
      bool render = yaml_get_or(config, "render", false);
      auto content = helper.read_file(*file, render, vars);
      if (!content) {
        return fail(content.error());
      }
      secret->value = std::move(*content);
      secret->from_file = true;
    }

    return secret;
  }
};

}  // namespace

auto create_secret_module() -> std::unique_ptr<IEntityModule> {
  return std::make_unique<SecretModule>();
}

}  // namespace shipyard
