#include "shipyard/modules/builtin.hpp"

#include "shipyard/modules/fields.hpp"
#include "shipyard/modules/loop.hpp"

#include <format>
#include <string>
#include <string_view>

namespace shipyard {

namespace {

class JobsManager : public IManager {
public:
  [[nodiscard]] auto key() const -> std::string_view override {
    return kJobsManagerKey;
  }

  [[nodiscard]] auto describe(const DeploymentObject& object) const
      -> std::string override {
    const auto& job = static_cast<const Job&>(object);
    if (job.schedule) {
      auto it = job.schedule->find("cron");
      std::string_view cron = "?";
      if (it != job.schedule->end() && it->is_string()) {
        cron = it->get_ref<const std::string&>();
      }
      return std::format("job {} (schedule {})", job.path, cron);
    }
    return std::format("job {}", job.path);
  }
};

class JobModule : public IEntityModule {
public:
  [[nodiscard]] auto section_type() const -> std::string_view override {
    return "job";
  }

  [[nodiscard]] auto manager_key() const -> std::string_view override {
    return kJobsManagerKey;
  }

  [[nodiscard]] auto create_manager() const
      -> std::unique_ptr<IManager> override {
    return std::make_unique<JobsManager>();
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
    auto job = std::make_shared<Job>();
    job->name = std::string(name);

    auto definition_file = require_field(name, config, "definition", helper, vars);
    if (!definition_file) {
      return fail(definition_file.error());
    }
    auto definition = helper.read_json(*definition_file, true, vars);
    if (!definition) {
      return fail(definition.error());
    }
    if (!definition->is_object()) {
      log::error("Job {}: {} must contain a JSON object", name, *definition_file);
      return fail(Error::InvalidEntity);
    }
    job->definition = std::move(*definition);

    auto schedule_file = render_field(config, "schedule", helper, vars);
    if (!schedule_file) {
      return fail(schedule_file.error());
    }
    if (*schedule_file) {
      auto schedule = helper.read_json(**schedule_file, true, vars);
      if (!schedule) {
        return fail(schedule.error());
      }
      if (!schedule->is_object()) {
        log::error("Job {}: {} must contain a JSON object", name, **schedule_file);
        return fail(Error::InvalidEntity);
      }
      job->schedule = std::move(*schedule);
    }

    auto path = render_field(config, "path", helper, vars);
    if (!path) {
      return fail(path.error());
    }
    if (*path) {
      job->path = std::move(**path);
      job->definition["id"] = job->path;
    } else if (auto id = job->definition.find("id");
               id != job->definition.end() && id->is_string()) {
      job->path = id->get<std::string>();
    } else {
      log::error("Job {}: neither 'path' nor an 'id' in {}", name,
                 *definition_file);
      return fail(Error::InvalidEntity);
    }

    return job;
  }
};

}  // namespace

auto create_job_module() -> std::unique_ptr<IEntityModule> {
  return std::make_unique<JobModule>();
}

}  // namespace shipyard
