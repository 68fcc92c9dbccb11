#pragma once

#include <string>

#include "internal/model/value.hpp"
#include "internal/util/time.hpp"

namespace scd::model {

/*
  One historical instance of an entity.

  IMPORTANT:
  - [valid_from, valid_to) is the validity interval; valid_to is
    util::EndOfTime() while the row is current.
  - Once superseded a row is immutable. Only valid_to / is_current are
    ever changed, and only by the close-out that accompanies the insert
    of the replacement row.
  - (key, valid_from) is the effective primary key.
*/
struct VersionRow {
  Value  key;
  Record attributes;  // every business attribute, key column included

  std::string row_hash;  // hex fingerprint of the monitored attributes

  util::TimePoint valid_from{};
  util::TimePoint valid_to{};
  bool            is_current = false;
};

// Audit columns every history table carries next to its business columns.
inline constexpr const char* kRowHashColumn   = "row_hash";
inline constexpr const char* kValidFromColumn = "valid_from";
inline constexpr const char* kValidToColumn   = "valid_to";
inline constexpr const char* kIsCurrentColumn = "is_current";

inline bool IsAuditColumn(const std::string& name) {
  return name == kRowHashColumn || name == kValidFromColumn || name == kValidToColumn || name == kIsCurrentColumn;
}

} // namespace scd::model
