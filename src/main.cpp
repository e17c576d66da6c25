#include "shipyard/cli/commands.hpp"
#include "shipyard/util/log.hpp"

#include <cstdlib>
#include <filesystem>
#include <print>
#include <string>
#include <string_view>
#include <vector>

namespace {

void print_usage(const char* prog) {
  std::println("Shipyard - declarative deployment config resolver");
  std::println("Usage: {} [OPTIONS] <config.yml>", prog);
  std::println("");
  std::println("Options:");
  std::println("  -e, --var <name=value>    Provide a variable (repeatable)");
  std::println("  -p, --plugin-path <dir>   Search <dir> for module plugins");
  std::println("      --validate            Only check that the config loads");
  std::println("      --log-level <level>   trace, debug, info, warn, error");
  std::println("  -v, --version             Show version and exit");
  std::println("  -h, --help                Show this help message");
  std::println("");
  std::println("Examples:");
  std::println("  {} deploy.yml -e env=prod     # print the deployment plan",
               prog);
  std::println("  {} --validate deploy.yml      # check only", prog);
}

void print_version() {
  std::println("Shipyard v0.1.0");
}

struct Options {
  std::string config_file;
  shipyard::VariableMap variables;
  std::vector<std::filesystem::path> plugin_paths;
  std::string log_level = "warn";
  bool validate_only = false;
};

auto require_value(int& i, int argc, char* argv[], std::string_view flag)
    -> std::string_view {
  if (++i >= argc) {
    std::println(stderr, "Error: {} requires an argument", flag);
    std::exit(1);
  }
  return argv[i];
}

auto parse_args(int argc, char* argv[]) -> Options {
  Options opts;

  for (int i = 1; i < argc; ++i) {
    std::string_view arg = argv[i];

    if (arg == "-h" || arg == "--help") {
      print_usage(argv[0]);
      std::exit(0);
    } else if (arg == "-v" || arg == "--version") {
      print_version();
      std::exit(0);
    } else if (arg == "-e" || arg == "--var") {
      auto assignment = require_value(i, argc, argv, arg);
      auto eq = assignment.find('=');
      if (eq == std::string_view::npos || eq == 0) {
        std::println(stderr, "Error: --var expects name=value, got '{}'",
                     assignment);
        std::exit(1);
      }
      opts.variables.insert_or_assign(std::string(assignment.substr(0, eq)),
                                      std::string(assignment.substr(eq + 1)));
    } else if (arg == "-p" || arg == "--plugin-path") {
      opts.plugin_paths.emplace_back(require_value(i, argc, argv, arg));
    } else if (arg == "--log-level") {
      opts.log_level = require_value(i, argc, argv, arg);
    } else if (arg == "--validate") {
      opts.validate_only = true;
    } else if (arg.starts_with("-")) {
      std::println(stderr, "Unknown option: {}", arg);
      print_usage(argv[0]);
      std::exit(1);
    } else if (opts.config_file.empty()) {
      opts.config_file = arg;
    } else {
      std::println(stderr, "Error: only one config file may be given");
      std::exit(1);
    }
  }

  return opts;
}

}  // namespace

int main(int argc, char* argv[]) {
  auto opts = parse_args(argc, argv);

  if (opts.config_file.empty()) {
    std::println(stderr, "Error: config file required");
    print_usage(argv[0]);
    return 1;
  }

  if (!std::filesystem::exists(opts.config_file)) {
    std::println(stderr, "Error: Config file not found: {}", opts.config_file);
    return 1;
  }

  shipyard::log::set_level(opts.log_level);

  if (opts.validate_only) {
    return shipyard::cli::cmd_validate(shipyard::cli::ValidateOptions{
        .config_file = opts.config_file,
        .variables = opts.variables,
        .plugin_paths = opts.plugin_paths,
    });
  }
  return shipyard::cli::cmd_plan(shipyard::cli::PlanOptions{
      .config_file = opts.config_file,
      .variables = opts.variables,
      .plugin_paths = opts.plugin_paths,
  });
}
