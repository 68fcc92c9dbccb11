#include "internal/config/config_loader.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

#include "internal/core/table_spec.hpp"
#include "internal/util/errors.hpp"

namespace {

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "scd_versioner_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

template <typename Fn>
bool ThrowsInvalidConfiguration(Fn&& fn) {
  try {
    fn();
  } catch (const scd::util::InvalidConfiguration&) {
    return true;
  }
  return false;
}

void TestFullConfigLoads() {
  const auto yaml_path = WriteYaml("full",
                                   R"(database:
  sqlite:
    path: ./data/scd.db
    busy_timeout_ms: 2500
logging:
  level: debug
retry:
  max_attempts: 4
  backoff_ms: 150
tables:
  - source_table: sales_records
    history_table: sales_records_cdc
    business_key: id
    monitored_attributes: [product_name, price]
    detect_removed: true
  - source_table: customers
    history_table: customers_history
    business_key: customer_id
    monitored_attributes:
      - email
)");

  const auto config = scd::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.database().has_sqlite());
  assert(config.database().sqlite().path() == "./data/scd.db");
  assert(config.database().sqlite().busy_timeout_ms() == 2500);
  assert(config.logging().level() == "debug");
  assert(config.retry().max_attempts() == 4);
  assert(config.retry().backoff_ms() == 150);
  assert(config.tables_size() == 2);

  const auto specs = scd::config::ConfigLoader::TableSpecs(config);
  assert(specs.size() == 2);
  assert(specs[0].source_table == "sales_records");
  assert(specs[0].history_table == "sales_records_cdc");
  assert(specs[0].business_key == "id");
  assert((specs[0].monitored_attributes == std::vector<std::string>{"product_name", "price"}));
  assert(specs[0].detect_removed);
  assert(specs[1].business_key == "customer_id");
  assert(!specs[1].detect_removed);

  scd::core::ValidateTableSpec(specs[0]);
  scd::core::ValidateTableSpec(specs[1]);
}

void TestQuotedNumericNamesStayStrings() {
  const auto yaml_path = WriteYaml("quoted_numeric",
                                   R"(database:
  sqlite:
    path: "2024.db"
tables:
  - source_table: "2024"
    history_table: "2024_history"
    business_key: "1"
    monitored_attributes: ["10", price]
)");

  const auto config = scd::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.database().sqlite().path() == "2024.db");
  assert(config.tables(0).source_table() == "2024");
  assert(config.tables(0).business_key() == "1");
  assert(config.tables(0).monitored_attributes(0) == "10");
}

void TestScalarEscapingForQuotedAndBackslashValues() {
  const auto yaml_path = WriteYaml("quoted_backslash",
                                   R"(database:
  sqlite:
    path: "C:\\scd\\\"quoted\"\\db.sqlite"
)");

  const auto config = scd::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.database().sqlite().path() == "C:\\scd\\\"quoted\"\\db.sqlite");
}

void TestUnknownFieldsAreRejected() {
  const auto yaml_path = WriteYaml("unknown_field",
                                   R"(database:
  sqlite:
    path: "/tmp/data"
tables:
  - source_table: a
    history_table: b
    business_key: id
    monitored_attributes: [x]
    track_deletes: true
)");

  assert(ThrowsInvalidConfiguration([&] { (void)scd::config::ConfigLoader::LoadFromYaml(yaml_path.string()); }) &&
         "ConfigLoader must reject unknown fields.");
}

void TestUnknownBackendIsRejected() {
  const auto yaml_path = WriteYaml("unknown_backend",
                                   R"(database:
  memory: {}
tables:
  - source_table: a
    history_table: b
    business_key: id
    monitored_attributes: [x]
)");

  assert(ThrowsInvalidConfiguration([&] { (void)scd::config::ConfigLoader::LoadFromYaml(yaml_path.string()); }));
}

void TestMissingFileIsRejected() {
  const auto missing = std::filesystem::temp_directory_path() / "scd_versioner_config_loader_tests" / "does_not_exist.yaml";
  assert(ThrowsInvalidConfiguration([&] { (void)scd::config::ConfigLoader::LoadFromYaml(missing.string()); }));
}

void TestTableSpecValidation() {
  scd::core::TableSpec good;
  good.source_table         = "sales_records";
  good.history_table        = "sales_records_cdc";
  good.business_key         = "id";
  good.monitored_attributes = {"price"};
  scd::core::ValidateTableSpec(good);

  auto empty_key         = good;
  empty_key.business_key = "";
  assert(ThrowsInvalidConfiguration([&] { scd::core::ValidateTableSpec(empty_key); }));

  auto no_attributes = good;
  no_attributes.monitored_attributes.clear();
  assert(ThrowsInvalidConfiguration([&] { scd::core::ValidateTableSpec(no_attributes); }));

  auto key_monitored                 = good;
  key_monitored.monitored_attributes = {"price", "id"};
  assert(ThrowsInvalidConfiguration([&] { scd::core::ValidateTableSpec(key_monitored); }));

  auto repeated                 = good;
  repeated.monitored_attributes = {"price", "price"};
  assert(ThrowsInvalidConfiguration([&] { scd::core::ValidateTableSpec(repeated); }));

  auto audit_column                 = good;
  audit_column.monitored_attributes = {"row_hash"};
  assert(ThrowsInvalidConfiguration([&] { scd::core::ValidateTableSpec(audit_column); }));

  auto same_table          = good;
  same_table.history_table = good.source_table;
  assert(ThrowsInvalidConfiguration([&] { scd::core::ValidateTableSpec(same_table); }));

  auto no_history          = good;
  no_history.history_table = "";
  assert(ThrowsInvalidConfiguration([&] { scd::core::ValidateTableSpec(no_history); }));
}

} // namespace

int main() {
  TestFullConfigLoads();
  TestQuotedNumericNamesStayStrings();
  TestScalarEscapingForQuotedAndBackslashValues();
  TestUnknownFieldsAreRejected();
  TestUnknownBackendIsRejected();
  TestMissingFileIsRejected();
  TestTableSpecValidation();

  std::cout << "scd_unit_config_loader: pass\n";
  return 0;
}
