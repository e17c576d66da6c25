#include "shipyard/pipeline/entity_pipeline.hpp"
#include "shipyard/modules/loop.hpp"

#include "test_utils.hpp"

#include "gtest/gtest.h"

using namespace shipyard;
using shipyard::test::FakeModule;
using shipyard::test::FakeObject;
using shipyard::test::LogCapture;

namespace {

class NullObjectModule : public FakeModule {
public:
  NullObjectModule() : FakeModule("hollow", "hollows") {}

  [[nodiscard]] auto parse(std::string_view, const YAML::Node&,
                           const ConfigHelper&) const
      -> Result<std::shared_ptr<DeploymentObject>> override {
    return std::shared_ptr<DeploymentObject>{};
  }
};

// Reads `required_field` with YAML's throwing accessor.
class StrictModule : public FakeModule {
public:
  StrictModule() : FakeModule("strict", "stricts") {}

  [[nodiscard]] auto parse(std::string_view name, const YAML::Node& config,
                           const ConfigHelper& helper) const
      -> Result<std::shared_ptr<DeploymentObject>> override {
    (void)config["required_field"].as<int>();
    return FakeModule::parse(name, config, helper);
  }
};

}  // namespace

class EntityPipelineTest : public ::testing::Test {
protected:
  void SetUp() override {
    auto catalog = ModuleCatalog::with_builtins();
    catalog.add("fake", [] { return std::make_unique<FakeModule>(); });
    catalog.add("looped", [] {
      return std::make_unique<FakeModule>("looped", "fakes", expand_loop);
    });
    catalog.add("hollow", [] { return std::make_unique<NullObjectModule>(); });
    catalog.add("strict", [] { return std::make_unique<StrictModule>(); });
    registry_ = std::make_unique<ModuleRegistry>(std::move(catalog));
    ASSERT_TRUE(registry_->load({"fake", "looped", "hollow", "strict"}).has_value());
  }

  auto process(std::string_view yaml) -> Result<PipelineOutput> {
    return EntityPipeline::process(*registry_, *variables_,
                                   YAML::Load(std::string(yaml)), helper_);
  }

  auto parsed_by_fake() const -> const std::vector<std::string>& {
    const auto* module = dynamic_cast<const FakeModule*>(registry_->find("fake"));
    return *module->parsed();
  }

  std::unique_ptr<ModuleRegistry> registry_;
  std::shared_ptr<const VariableContainer> variables_ =
      std::make_shared<const VariableContainer>(
          VariableContainer::Values{{"env", "prod"}});
  ConfigHelper helper_{variables_, "."};
};

TEST(ReservedKeysTest, Recognized) {
  EXPECT_TRUE(is_reserved_key("variables"));
  EXPECT_TRUE(is_reserved_key("modules"));
  EXPECT_TRUE(is_reserved_key("includes"));
  EXPECT_FALSE(is_reserved_key("api"));
}

TEST_F(EntityPipelineTest, EmptyDocument) {
  auto output = process("{}");
  ASSERT_TRUE(output.has_value());
  EXPECT_TRUE(output->objects.empty());
  EXPECT_TRUE(output->dependencies.empty());
}

TEST_F(EntityPipelineTest, ReservedKeysAreNotEntities) {
  auto output = process(R"(
variables:
  env: {default: dev}
modules: [fake]
includes: []
api:
  type: fake
)");
  ASSERT_TRUE(output.has_value());
  ASSERT_EQ(output->objects.size(), 1);
  EXPECT_TRUE(output->objects.contains("api"));
  EXPECT_EQ(parsed_by_fake(), (std::vector<std::string>{"api"}));
}

TEST_F(EntityPipelineTest, ModuleWithoutPreprocessorParsesOnce) {
  auto output = process("{api: {type: fake, loop: {i: [a, b]}}}");
  ASSERT_TRUE(output.has_value());
  EXPECT_EQ(output->objects.size(), 1);
}

TEST_F(EntityPipelineTest, PreprocessorFansOut) {
  auto output = process(R"(
"worker-{{i}}":
  type: looped
  loop:
    i: ["1", "2", "3"]
)");
  ASSERT_TRUE(output.has_value());
  ASSERT_EQ(output->objects.size(), 3);
  EXPECT_TRUE(output->objects.contains("worker-1"));
  EXPECT_TRUE(output->objects.contains("worker-2"));
  EXPECT_TRUE(output->objects.contains("worker-3"));

  auto worker = std::dynamic_pointer_cast<FakeObject>(output->objects.at("worker-2"));
  ASSERT_NE(worker, nullptr);
  EXPECT_EQ(worker->config["extra_vars"]["i"].as<std::string>(), "2");
}

TEST_F(EntityPipelineTest, EmptyLoopProducesNothing) {
  auto output = process("{\"w-{{i}}\": {type: looped, loop: {i: []}}}");
  ASSERT_TRUE(output.has_value());
  EXPECT_TRUE(output->objects.empty());
}

TEST_F(EntityPipelineTest, SkippedEntitiesAreNeverParsed) {
  auto output = process(R"(
prod-only:
  type: fake
  only: {env: prod}
dev-only:
  type: fake
  only: {env: dev}
not-prod:
  type: fake
  except: {env: prod}
)");
  ASSERT_TRUE(output.has_value());
  ASSERT_EQ(output->objects.size(), 1);
  EXPECT_TRUE(output->objects.contains("prod-only"));
  EXPECT_EQ(parsed_by_fake(), (std::vector<std::string>{"prod-only"}));
}

TEST_F(EntityPipelineTest, RestrictionsApplyPerExpandedEntity) {
  auto output = process(R"(
"w-{{i}}":
  type: looped
  loop: {i: [a, b]}
  only: {env: prod}
)");
  ASSERT_TRUE(output.has_value());
  EXPECT_EQ(output->objects.size(), 2);
}

TEST_F(EntityPipelineTest, MissingType) {
  LogCapture capture;
  auto output = process("{api: {image: nginx}}");
  ASSERT_FALSE(output.has_value());
  EXPECT_EQ(output.error(), Error::MissingEntityType);
  EXPECT_TRUE(capture.any_error_contains("api"));
}

TEST_F(EntityPipelineTest, UnknownType) {
  LogCapture capture;
  auto output = process("{api: {type: deployment}}");
  ASSERT_FALSE(output.has_value());
  EXPECT_EQ(output.error(), Error::UnknownEntityType);
  EXPECT_TRUE(capture.any_error_contains("deployment"));
}

TEST_F(EntityPipelineTest, NonMapEntity) {
  LogCapture capture;
  auto output = process("{api: just-a-string}");
  ASSERT_FALSE(output.has_value());
  EXPECT_EQ(output.error(), Error::InvalidEntity);
}

TEST_F(EntityPipelineTest, RecordsDependencies) {
  auto output = process(R"(
db:
  type: fake
api:
  type: fake
  dependencies:
    - db:create
    - {name: cache, kind: update}
worker:
  type: fake
  dependencies: []
)");
  ASSERT_TRUE(output.has_value());
  ASSERT_EQ(output->dependencies.size(), 1);
  const auto& deps = output->dependencies.at("api");
  ASSERT_EQ(deps.size(), 2);
  EXPECT_EQ(deps[0], (DependencyRef{"db", "create"}));
  EXPECT_EQ(deps[1], (DependencyRef{"cache", "update"}));
}

TEST_F(EntityPipelineTest, InvalidDependencies) {
  LogCapture capture;
  auto output = process("{api: {type: fake, dependencies: {kind: x}}}");
  ASSERT_FALSE(output.has_value());
  EXPECT_EQ(output.error(), Error::InvalidEntity);
}

TEST_F(EntityPipelineTest, LaterDefinitionReplacesObjectButKeepsDependencies) {
  auto output = process(R"(
"svc-{{i}}":
  type: looped
  loop: {i: [a, b]}
  dependencies: [db]
svc-b:
  type: fake
db:
  type: fake
)");
  ASSERT_TRUE(output.has_value());
  ASSERT_EQ(output->objects.size(), 3);

  auto svc_b = std::dynamic_pointer_cast<FakeObject>(output->objects.at("svc-b"));
  ASSERT_NE(svc_b, nullptr);
  EXPECT_EQ(svc_b->type, "fake");
  EXPECT_TRUE(output->dependencies.contains("svc-a"));
  ASSERT_TRUE(output->dependencies.contains("svc-b"));
  EXPECT_EQ(output->dependencies.at("svc-b"),
            (std::vector<DependencyRef>{{"db", "create"}}));
}

TEST_F(EntityPipelineTest, RedefinitionWithDependenciesReplacesThem) {
  auto output = process(R"(
"svc-{{i}}":
  type: looped
  loop: {i: [a]}
  dependencies: [db]
svc-a:
  type: fake
  dependencies: ["cache:update"]
db:
  type: fake
cache:
  type: fake
)");
  ASSERT_TRUE(output.has_value());
  EXPECT_EQ(output->dependencies.at("svc-a"),
            (std::vector<DependencyRef>{{"cache", "update"}}));
}

TEST_F(EntityPipelineTest, NullObjectIsContractViolation) {
  LogCapture capture;
  auto output = process("{api: {type: hollow}}");
  ASSERT_FALSE(output.has_value());
  EXPECT_EQ(output.error(), Error::ModuleContractViolation);
  EXPECT_FALSE(is_configuration_error(output.error()));
}

TEST_F(EntityPipelineTest, YamlExceptionInParseIsInvalidEntity) {
  LogCapture capture;
  auto output = process("{api: {type: strict, required_field: not-a-number}}");
  ASSERT_FALSE(output.has_value());
  EXPECT_EQ(output.error(), Error::InvalidEntity);
}

TEST_F(EntityPipelineTest, ModuleErrorPropagates) {
  LogCapture capture;
  auto output = process("{key: {type: secret, path: /k}}");
  ASSERT_FALSE(output.has_value());
  EXPECT_EQ(output.error(), Error::InvalidEntity);
  EXPECT_TRUE(capture.any_error_contains("key"));
}
