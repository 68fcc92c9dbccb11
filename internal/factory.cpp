#include "factory.hpp"

#include <chrono>
#include <memory>
#include <string>

#include "internal/config/config_loader.hpp"
#include "internal/core/report_sink.hpp"
#include "internal/util/errors.hpp"
#if SCD_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif

namespace scd::factory {

namespace {

#if SCD_DB_SQLITE
constexpr int kDefaultBusyTimeoutMs = 5000;
#endif

core::RunOptions BuildRunOptions(const scd::runtime::config::RuntimeConfig& config) {
  core::RunOptions options;
  options.max_attempts = config.retry().max_attempts() == 0 ? 1 : config.retry().max_attempts();
  options.backoff      = std::chrono::milliseconds(config.retry().backoff_ms());
  return options;
}

} // namespace

std::shared_ptr<db::Repository> BuildRepository(const scd::runtime::config::RuntimeConfig& config) {
  if (!config.has_database() || !config.database().has_sqlite()) {
    throw util::InvalidConfiguration("database.sqlite must be configured");
  }
#if SCD_DB_SQLITE
  const auto& sqlite_config = config.database().sqlite();
  if (sqlite_config.path().empty()) {
    throw util::InvalidConfiguration("database.sqlite.path must not be empty");
  }
  const int busy_timeout_ms = sqlite_config.busy_timeout_ms() == 0 ? kDefaultBusyTimeoutMs : static_cast<int>(sqlite_config.busy_timeout_ms());
  auto      sqlite_db       = std::make_shared<db::sqlite::SqliteDB>(sqlite_config.path(), busy_timeout_ms);
  return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
#else
  throw util::InvalidConfiguration("sqlite backend requested but not enabled at build time");
#endif
}

/*
    Build full application dependency graph
*/
Application Build(const scd::runtime::config::RuntimeConfig& config) {
  Application app;

  if (config.tables_size() == 0) {
    throw util::InvalidConfiguration("no tables configured");
  }

  app.repository   = BuildRepository(config);
  app.sink         = std::make_shared<core::LogReportSink>();
  app.orchestrator = std::make_shared<core::RunOrchestrator>(app.repository, app.sink);

  app.tables  = scd::config::ConfigLoader::TableSpecs(config);
  app.options = BuildRunOptions(config);

  return app;
}

} // namespace scd::factory
