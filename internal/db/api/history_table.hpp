#pragma once

#include <string>

namespace scd::db {

/*
  Addresses one versioned history table and names its business key
  column. Every other non-audit column is a business attribute.
*/
struct HistoryTable {
  std::string table;
  std::string business_key;
};

} // namespace scd::db
