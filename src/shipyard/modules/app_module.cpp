#include "shipyard/modules/builtin.hpp"

#include "shipyard/modules/fields.hpp"
#include "shipyard/modules/loop.hpp"

#include <cstdint>
#include <format>

namespace shipyard {

namespace {

class AppsManager : public IManager {
public:
  [[nodiscard]] auto key() const -> std::string_view override {
    return kAppsManagerKey;
  }

  [[nodiscard]] auto describe(const DeploymentObject& object) const
      -> std::string override {
    const auto& app = static_cast<const App&>(object);
    auto it = app.definition.find("instances");
    std::int64_t instances = 1;
    if (it != app.definition.end() && it->is_number_integer()) {
      instances = it->get<std::int64_t>();
    }
    return std::format("app {} ({} instance{})", app.path, instances,
                       instances == 1 ? "" : "s");
  }
};

class AppModule : public IEntityModule {
public:
  [[nodiscard]] auto section_type() const -> std::string_view override {
    return "app";
  }

  [[nodiscard]] auto manager_key() const -> std::string_view override {
    return kAppsManagerKey;
  }

  [[nodiscard]] auto create_manager() const
      -> std::unique_ptr<IManager> override {
    return std::make_unique<AppsManager>();
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
    auto app = std::make_shared<App>();
    app->name = std::string(name);

    auto marathon = require_field(name, config, "marathon", helper, vars);
    if (!marathon) {
      return fail(marathon.error());
    }
    auto definition = helper.read_json(*marathon, true, vars);
    if (!definition) {
      return fail(definition.error());
    }
    if (!definition->is_object()) {
      log::error("App {}: {} must contain a JSON object", name, *marathon);
      return fail(Error::InvalidEntity);
    }
    app->definition = std::move(*definition);

    auto path = render_field(config, "path", helper, vars);
    if (!path) {
      return fail(path.error());
    }
    if (*path) {
      app->path = std::move(**path);
      app->definition["id"] = app->path;
    } else if (auto id = app->definition.find("id");
               id != app->definition.end() && id->is_string()) {
      app->path = id->get<std::string>();
    } else {
      log::error("App {}: neither 'path' nor an 'id' in {}", name, *marathon);
      return fail(Error::InvalidEntity);
    }

    return app;
  }
};

}  // namespace

auto create_app_module() -> std::unique_ptr<IEntityModule> {
  return std::make_unique<AppModule>();
}

}  // namespace shipyard
