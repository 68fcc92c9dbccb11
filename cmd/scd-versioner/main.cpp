#include <cstdint>
#include <iostream>
#include <optional>
#include <string>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/time.hpp"

namespace {

constexpr int kExitOk         = 0;
constexpr int kExitUsage      = 1;
constexpr int kExitFatal      = 2;
constexpr int kExitRunAborted = 3;

struct Arguments {
  std::string                         config_path;
  std::optional<scd::util::TimePoint> as_of;
};

void PrintUsage() {
  std::cerr << "Usage: scd-versioner <config.yaml> OR scd-versioner --config <config.yaml> [--as-of \"YYYY-MM-DD HH:MM:SS[.ffffff]\"]"
            << std::endl;
}

std::optional<Arguments> ParseArguments(int argc, char** argv) {
  Arguments args;
  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--config" && i + 1 < argc) {
      args.config_path = argv[++i];
    } else if (arg == "--as-of" && i + 1 < argc) {
      args.as_of = scd::util::ParseTimestamp(argv[++i]);
      if (!args.as_of) {
        std::cerr << "Invalid --as-of timestamp: " << argv[i] << std::endl;
        return std::nullopt;
      }
    } else if (argc == 2 && arg.rfind("--", 0) != 0) {
      args.config_path = arg;
    } else {
      return std::nullopt;
    }
  }

  if (args.config_path.empty()) {
    return std::nullopt;
  }
  return args;
}

} // namespace

int main(int argc, char** argv) {
  const auto args = ParseArguments(argc, argv);
  if (!args) {
    PrintUsage();
    return kExitUsage;
  }

  int exit_code = kExitOk;
  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = scd::config::ConfigLoader::LoadFromYaml(args->config_path);

    scd::observability::InitializeLogging(config);

    // ------------------------------------------------------------
    // Build application (dependency graph)
    // ------------------------------------------------------------
    auto app = scd::factory::Build(config);
    if (args->as_of) {
      app.options.as_of = args->as_of;
    }

    SCD_LOG_INFO("scd-versioner started", {scd::observability::StringField("config", args->config_path),
                                           scd::observability::IntField("tables", static_cast<std::int64_t>(app.tables.size()))});

    // ------------------------------------------------------------
    // One pass per configured table
    // ------------------------------------------------------------
    for (const auto& summary : app.orchestrator->RunAll(app.tables, app.options)) {
      if (!summary.Succeeded()) {
        exit_code = kExitRunAborted;
      }
    }

    scd::observability::ShutdownLogging();
  } catch (const std::exception& e) {
    SCD_LOG_ERROR("Fatal error", {scd::observability::StringField("error", e.what())});
    scd::observability::ShutdownLogging();
    return kExitFatal;
  }

  return exit_code;
}
