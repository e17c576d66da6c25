#include "shipyard/modules/builtin.hpp"
#include "shipyard/modules/loop.hpp"

#include "test_utils.hpp"

#include "gtest/gtest.h"

using namespace shipyard;
using shipyard::test::LogCapture;
using shipyard::test::make_helper;
using shipyard::test::TempDir;

class BuiltinModulesTest : public ::testing::Test {
protected:
  template <typename T>
  auto parse_as(const IEntityModule& module, std::string_view name,
                std::string_view yaml) -> std::shared_ptr<T> {
    auto object = module.parse(name, YAML::Load(std::string(yaml)), helper_);
    EXPECT_TRUE(object.has_value());
    if (!object) {
      return nullptr;
    }
    return std::dynamic_pointer_cast<T>(*object);
  }

  TempDir dir_;
  ConfigHelper helper_ = make_helper({{"env", "prod"}}, dir_.path());
};

TEST_F(BuiltinModulesTest, LoopWithoutLoopKeyKeepsEntity) {
  auto entities = expand_loop("api", YAML::Load("{type: app}"), helper_);
  ASSERT_TRUE(entities.has_value());
  ASSERT_EQ(entities->size(), 1);
  EXPECT_EQ((*entities)[0].name, "api");
  EXPECT_FALSE((*entities)[0].config["extra_vars"].IsDefined());
}

TEST_F(BuiltinModulesTest, LoopCartesianProduct) {
  auto entities = expand_loop(
      "api-{{region}}-{{slot}}",
      YAML::Load("{type: app, loop: {region: [us, eu], slot: [a, b, c]}}"),
      helper_);
  ASSERT_TRUE(entities.has_value());
  ASSERT_EQ(entities->size(), 6);
  EXPECT_EQ((*entities)[0].name, "api-us-a");
  EXPECT_EQ((*entities)[1].name, "api-us-b");
  EXPECT_EQ((*entities)[5].name, "api-eu-c");

  const auto& config = (*entities)[5].config;
  EXPECT_FALSE(config["loop"].IsDefined());
  EXPECT_EQ(config["extra_vars"]["region"].as<std::string>(), "eu");
  EXPECT_EQ(config["extra_vars"]["slot"].as<std::string>(), "c");
}

TEST_F(BuiltinModulesTest, LoopKeepsExistingExtraVars) {
  auto entities = expand_loop(
      "w{{i}}",
      YAML::Load("{extra_vars: {team: core, i: x}, loop: {i: ['1', '2']}}"),
      helper_);
  ASSERT_TRUE(entities.has_value());
  ASSERT_EQ(entities->size(), 2);

  auto vars = extra_variables((*entities)[1].config);
  EXPECT_EQ(vars.at("team"), "core");
  EXPECT_EQ(vars.at("i"), "2");
}

TEST_F(BuiltinModulesTest, LoopDoesNotModifySource) {
  auto config = YAML::Load("{loop: {i: [a]}}");
  auto entities = expand_loop("e{{i}}", config, helper_);
  ASSERT_TRUE(entities.has_value());
  EXPECT_TRUE(config["loop"].IsDefined());
  EXPECT_FALSE(config["extra_vars"].IsDefined());
}

TEST_F(BuiltinModulesTest, LoopEmptyListExpandsToNothing) {
  auto entities = expand_loop("e{{i}}", YAML::Load("{loop: {i: []}}"), helper_);
  ASSERT_TRUE(entities.has_value());
  EXPECT_TRUE(entities->empty());
}

TEST_F(BuiltinModulesTest, LoopRejectsScalarValues) {
  LogCapture capture;
  auto entities = expand_loop("e", YAML::Load("{loop: {i: a}}"), helper_);
  ASSERT_FALSE(entities.has_value());
  EXPECT_EQ(entities.error(), Error::InvalidEntity);
}

TEST_F(BuiltinModulesTest, LoopNameWithUnknownVariableFails) {
  LogCapture capture;
  auto entities =
      expand_loop("e{{nope}}", YAML::Load("{loop: {i: [a]}}"), helper_);
  ASSERT_FALSE(entities.has_value());
  EXPECT_EQ(entities.error(), Error::UnresolvedPlaceholder);
}

TEST_F(BuiltinModulesTest, SecretFromValue) {
  auto module = create_secret_module();
  EXPECT_EQ(module->section_type(), "secret");
  EXPECT_EQ(module->manager_key(), kSecretsManagerKey);
  EXPECT_TRUE(module->has_preprocessor());

  auto secret = parse_as<Secret>(
      *module, "db-password",
      "{path: '/{{env}}/db/password', value: 'hunter2-{{env}}'}");
  ASSERT_NE(secret, nullptr);
  EXPECT_EQ(secret->name, "db-password");
  EXPECT_EQ(secret->path, "/prod/db/password");
  EXPECT_EQ(secret->value, "hunter2-prod");
  EXPECT_FALSE(secret->from_file);

  auto manager = module->create_manager();
  EXPECT_EQ(manager->key(), "secrets");
  EXPECT_EQ(manager->describe(*secret), "secret /prod/db/password (12 bytes)");
}

TEST_F(BuiltinModulesTest, SecretFromFile) {
  dir_.write("secrets/key.pem", "KEY-{{env}}");
  auto module = create_secret_module();

  auto raw = parse_as<Secret>(*module, "key",
                              "{path: /key, file: secrets/key.pem}");
  ASSERT_NE(raw, nullptr);
  EXPECT_EQ(raw->value, "KEY-{{env}}");
  EXPECT_TRUE(raw->from_file);

  auto rendered = parse_as<Secret>(
      *module, "key", "{path: /key, file: secrets/key.pem, render: true}");
  ASSERT_NE(rendered, nullptr);
  EXPECT_EQ(rendered->value, "KEY-prod");
}

TEST_F(BuiltinModulesTest, SecretNeedsExactlyOneSource) {
  LogCapture capture;
  auto module = create_secret_module();

  auto neither = module->parse("s", YAML::Load("{path: /s}"), helper_);
  ASSERT_FALSE(neither.has_value());
  EXPECT_EQ(neither.error(), Error::InvalidEntity);

  auto both = module->parse("s", YAML::Load("{path: /s, value: v, file: f}"),
                            helper_);
  ASSERT_FALSE(both.has_value());
  EXPECT_EQ(both.error(), Error::InvalidEntity);
}

TEST_F(BuiltinModulesTest, SecretRequiresPath) {
  LogCapture capture;
  auto module = create_secret_module();
  auto result = module->parse("s", YAML::Load("{value: v}"), helper_);
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error(), Error::InvalidEntity);
  EXPECT_TRUE(capture.any_error_contains("'path'"));
}

TEST_F(BuiltinModulesTest, SecretUsesLoopVariables) {
  auto module = create_secret_module();
  auto entities = module->preprocess(
      "token-{{svc}}",
      YAML::Load("{path: '/tokens/{{svc}}', value: 't-{{svc}}', loop: {svc: [a, b]}}"),
      helper_);
  ASSERT_TRUE(entities.has_value());
  ASSERT_EQ(entities->size(), 2);

  auto object = module->parse((*entities)[1].name, (*entities)[1].config, helper_);
  ASSERT_TRUE(object.has_value());
  auto secret = std::dynamic_pointer_cast<Secret>(*object);
  ASSERT_NE(secret, nullptr);
  EXPECT_EQ(secret->name, "token-b");
  EXPECT_EQ(secret->path, "/tokens/b");
  EXPECT_EQ(secret->value, "t-b");
}

TEST_F(BuiltinModulesTest, AppPathOverridesId) {
  dir_.write("apps/api.json", R"({"id": "/old", "instances": {{count}}})");
  auto module = create_app_module();

  auto app = parse_as<App>(
      *module, "api",
      "{marathon: apps/api.json, path: '/{{env}}/api', extra_vars: {count: '3'}}");
  ASSERT_NE(app, nullptr);
  EXPECT_EQ(app->path, "/prod/api");
  EXPECT_EQ(app->definition["id"], "/prod/api");
  EXPECT_EQ(app->definition["instances"], 3);

  auto manager = module->create_manager();
  EXPECT_EQ(manager->key(), "apps");
  EXPECT_EQ(manager->describe(*app), "app /prod/api (3 instances)");
}

TEST_F(BuiltinModulesTest, AppPathFromDefinition) {
  dir_.write("apps/web.json", R"({"id": "/{{env}}/web"})");
  auto module = create_app_module();

  auto app = parse_as<App>(*module, "web", "{marathon: apps/web.json}");
  ASSERT_NE(app, nullptr);
  EXPECT_EQ(app->path, "/prod/web");
  EXPECT_EQ(module->create_manager()->describe(*app), "app /prod/web (1 instance)");
}

TEST_F(BuiltinModulesTest, AppDescribeIgnoresNonIntegerInstances) {
  App app;
  app.path = "/a";
  app.definition = nlohmann::json{{"id", "/a"}, {"instances", "2"}};
  auto manager = create_app_module()->create_manager();
  EXPECT_EQ(manager->describe(app), "app /a (1 instance)");

  app.definition["instances"] = 1.5;
  EXPECT_EQ(manager->describe(app), "app /a (1 instance)");
}

TEST_F(BuiltinModulesTest, AppWithoutPathOrIdFails) {
  LogCapture capture;
  dir_.write("apps/anon.json", R"({"cmd": "sleep 1"})");
  auto module = create_app_module();
  auto result = module->parse("anon", YAML::Load("{marathon: apps/anon.json}"),
                              helper_);
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error(), Error::InvalidEntity);
}

TEST_F(BuiltinModulesTest, AppDefinitionMustBeObject) {
  LogCapture capture;
  dir_.write("apps/list.json", "[1, 2]");
  auto module = create_app_module();
  auto result = module->parse("list", YAML::Load("{marathon: apps/list.json}"),
                              helper_);
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error(), Error::InvalidEntity);
}

TEST_F(BuiltinModulesTest, AppMissingDefinitionFile) {
  LogCapture capture;
  auto module = create_app_module();
  auto result = module->parse("ghost", YAML::Load("{marathon: apps/ghost.json}"),
                              helper_);
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error(), Error::FileNotFound);
}

TEST_F(BuiltinModulesTest, JobWithSchedule) {
  dir_.write("jobs/cleanup.json", R"({"id": "cleanup-{{env}}"})");
  dir_.write("jobs/nightly.json", R"({"id": "nightly", "cron": "0 2 * * *"})");
  auto module = create_job_module();

  auto job = parse_as<Job>(
      *module, "cleanup",
      "{definition: jobs/cleanup.json, schedule: jobs/nightly.json}");
  ASSERT_NE(job, nullptr);
  EXPECT_EQ(job->path, "cleanup-prod");
  ASSERT_TRUE(job->schedule.has_value());

  auto manager = module->create_manager();
  EXPECT_EQ(manager->key(), "jobs");
  EXPECT_EQ(manager->describe(*job), "job cleanup-prod (schedule 0 2 * * *)");
}

TEST_F(BuiltinModulesTest, JobWithoutSchedule) {
  dir_.write("jobs/once.json", R"({"id": "once"})");
  auto module = create_job_module();

  auto job = parse_as<Job>(*module, "once",
                           "{definition: jobs/once.json, path: batch.once}");
  ASSERT_NE(job, nullptr);
  EXPECT_EQ(job->path, "batch.once");
  EXPECT_EQ(job->definition["id"], "batch.once");
  EXPECT_FALSE(job->schedule.has_value());
  EXPECT_EQ(module->create_manager()->describe(*job), "job batch.once");
}

TEST_F(BuiltinModulesTest, JobDescribeIgnoresNonStringCron) {
  Job job;
  job.path = "nightly";
  job.definition = nlohmann::json{{"id", "nightly"}};
  job.schedule = nlohmann::json{{"id", "nightly"}, {"cron", 5}};
  auto manager = create_job_module()->create_manager();
  EXPECT_EQ(manager->describe(job), "job nightly (schedule ?)");

  job.schedule = nlohmann::json::array({"0 2 * * *"});
  EXPECT_EQ(manager->describe(job), "job nightly (schedule ?)");
}

TEST_F(BuiltinModulesTest, JobRequiresDefinition) {
  LogCapture capture;
  auto module = create_job_module();
  auto result = module->parse("j", YAML::Load("{path: x}"), helper_);
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error(), Error::InvalidEntity);
}
