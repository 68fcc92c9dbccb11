#pragma once

#include <string>
#include <vector>

#include "internal/db/api/history_table.hpp"

namespace scd::core {

/*
  What one pass tracks: where the snapshot comes from, where versions go,
  which attribute identifies an entity and which attributes are watched.
*/
struct TableSpec {
  std::string              source_table;
  std::string              history_table;
  std::string              business_key;
  std::vector<std::string> monitored_attributes;  // order is part of the fingerprint
  bool                     detect_removed = false;

  db::HistoryTable History() const {
    return {history_table, business_key};
  }
};

// Throws util::InvalidConfiguration on an empty key, empty or duplicated
// monitored attributes, a monitored key, or an empty table name.
void ValidateTableSpec(const TableSpec& spec);

} // namespace scd::core
