#include "internal/factory.hpp"

#include <cassert>
#include <chrono>
#include <filesystem>
#include <iostream>
#include <string>

#include "internal/util/errors.hpp"

namespace {

using scd::runtime::config::RuntimeConfig;

template <typename Fn>
bool ThrowsInvalidConfiguration(Fn&& fn) {
  try {
    fn();
  } catch (const scd::util::InvalidConfiguration&) {
    return true;
  }
  return false;
}

RuntimeConfig ConfigWithOneTable() {
  RuntimeConfig config;
  auto*         table = config.add_tables();
  table->set_source_table("sales_records");
  table->set_history_table("sales_records_cdc");
  table->set_business_key("id");
  table->add_monitored_attributes("price");
  return config;
}

void TestMissingDatabaseIsRejected() {
  const auto config = ConfigWithOneTable();
  assert(!config.has_database());
  assert(ThrowsInvalidConfiguration([&] { (void)scd::factory::Build(config); }));
  assert(ThrowsInvalidConfiguration([&] { (void)scd::factory::BuildRepository(config); }));

  auto empty_database = config;
  empty_database.mutable_database();
  assert(ThrowsInvalidConfiguration([&] { (void)scd::factory::Build(empty_database); }));
}

void TestNoTablesIsRejected() {
  RuntimeConfig config;
  config.mutable_database()->mutable_sqlite()->set_path("unused.db");
  assert(ThrowsInvalidConfiguration([&] { (void)scd::factory::Build(config); }));
}

#if SCD_DB_SQLITE
void TestEmptySqlitePathIsRejected() {
  auto config = ConfigWithOneTable();
  config.mutable_database()->mutable_sqlite()->set_path("");
  assert(ThrowsInvalidConfiguration([&] { (void)scd::factory::Build(config); }));
}

void TestSqliteApplicationIsWired() {
  const auto path = (std::filesystem::temp_directory_path() / "scd_versioner_factory_test.db").string();
  std::filesystem::remove(path);

  auto config = ConfigWithOneTable();
  config.mutable_database()->mutable_sqlite()->set_path(path);
  config.mutable_retry()->set_max_attempts(0);
  config.mutable_retry()->set_backoff_ms(25);

  {
    const auto app = scd::factory::Build(config);
    assert(app.repository);
    assert(app.sink);
    assert(app.orchestrator);
    assert(app.tables.size() == 1);
    assert(app.tables[0].history_table == "sales_records_cdc");
    assert(app.options.max_attempts == 1);
    assert(app.options.backoff == std::chrono::milliseconds(25));
  }

  std::filesystem::remove(path);
  std::filesystem::remove(path + "-wal");
  std::filesystem::remove(path + "-shm");
}
#endif

} // namespace

int main() {
  TestMissingDatabaseIsRejected();
  TestNoTablesIsRejected();
#if SCD_DB_SQLITE
  TestEmptySqlitePathIsRejected();
  TestSqliteApplicationIsWired();
#endif

  std::cout << "scd_unit_factory: pass\n";
  return 0;
}
