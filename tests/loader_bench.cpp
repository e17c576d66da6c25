#include "shipyard/config/config_loader.hpp"
#include "shipyard/config/template_renderer.hpp"
#include "shipyard/graph/dag.hpp"

#include <benchmark/benchmark.h>

#include "test_utils.hpp"

#include <format>
#include <string>

using namespace shipyard;

namespace {

[[nodiscard]] auto make_deployment(int secrets, int fan_out) -> std::string {
  std::string doc = "variables:\n  env: {default: prod}\n";
  for (int i = 0; i < secrets; ++i) {
    doc += std::format(
        "secret-{}:\n  type: secret\n  path: \"/{{{{env}}}}/s{}\"\n"
        "  value: v{}\n",
        i, i, i);
    if (i > 0) {
      doc += std::format("  dependencies: [secret-{}]\n", i - 1);
    }
  }
  doc += "\"token-{{i}}\":\n  type: secret\n  path: \"/tokens/{{i}}\"\n"
         "  value: t\n  loop:\n    i: [";
  for (int i = 0; i < fan_out; ++i) {
    doc += std::format("{}\"{}\"", i == 0 ? "" : ", ", i);
  }
  doc += "]\n";
  return doc;
}

}  // namespace

static void BM_RenderTemplate(benchmark::State& state) {
  VariableContainer variables{VariableContainer::Values{
      {"env", "prod"}, {"region", "us-east"}, {"name", "api"}}};
  TemplateRenderer renderer(variables);
  std::string tmpl;
  for (int i = 0; i < state.range(0); ++i) {
    tmpl += R"({"id": "/{{env}}/{{name}}", "region": "{{ region }}"})";
  }

  for (auto _ : state) {
    auto result = renderer.render(tmpl);
    benchmark::DoNotOptimize(result);
  }

  state.SetBytesProcessed(static_cast<int64_t>(tmpl.size()) * state.iterations());
}

static void BM_DAGTopologicalOrder(benchmark::State& state) {
  const int num_nodes = state.range(0);
  DAG dag;
  for (int i = 0; i < num_nodes; ++i) {
    dag.add_node(std::format("entity_{}", i));
  }
  for (int i = 1; i < num_nodes; ++i) {
    (void)dag.add_edge(static_cast<NodeIndex>(i / 2), static_cast<NodeIndex>(i));
  }

  for (auto _ : state) {
    auto order = dag.get_topological_order();
    benchmark::DoNotOptimize(order);
  }

  state.SetItemsProcessed(num_nodes * state.iterations());
}

static void BM_LoadDeployment(benchmark::State& state) {
  shipyard::log::set_level(shipyard::log::Level::Error);
  shipyard::test::TempDir dir;
  auto path = dir.write(
      "deploy.yml",
      make_deployment(static_cast<int>(state.range(0)), static_cast<int>(state.range(1))));
  LoadOptions options;
  options.environment = shipyard::test::fake_environment({});

  for (auto _ : state) {
    auto config = ConfigLoader::load(path, options);
    if (!config) {
      state.SkipWithError("load failed");
      break;
    }
    benchmark::DoNotOptimize(config);
  }

  state.SetItemsProcessed((state.range(0) + state.range(1)) * state.iterations());
}

BENCHMARK(BM_RenderTemplate)->Arg(1)->Arg(64)->Arg(1024);
BENCHMARK(BM_DAGTopologicalOrder)->Arg(100)->Arg(1000)->Arg(10000);
BENCHMARK(BM_LoadDeployment)->Args({10, 10})->Args({100, 100})->Args({500, 50});
