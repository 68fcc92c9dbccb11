#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/api/history_table.hpp"
#include "internal/model/value.hpp"
#include "internal/model/version_row.hpp"
#include "internal/util/time.hpp"

namespace scd::db {

/*
  Storage connector.

  CRITICAL GUARANTEES:

  - All reads and writes happen inside a Transaction
  - Reads inside a transaction see its writes
  - CloseOut + InsertVersion issued in one transaction are applied
    together or not at all

  Read methods throw util::StorageUnavailable / util::StorageFailure.
  Write methods report through Result; callers use ThrowIfError.
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // Source snapshot
  // ---------------------------------------------------------------------

  virtual std::vector<model::Record> FetchAll(Transaction&, const std::string& source_table) = 0;

  // ---------------------------------------------------------------------
  // History reads
  // ---------------------------------------------------------------------

  // Only rows with is_current = true. Returned as a list, not a map, so
  // the caller can detect duplicate current rows.
  virtual std::vector<model::VersionRow> FetchCurrent(Transaction&, const HistoryTable&) = 0;

  // Every version of one key, ordered by valid_from ascending.
  virtual std::vector<model::VersionRow> FetchVersions(Transaction&, const HistoryTable&, const model::Value& key) = 0;

  // Rows whose interval contains t: valid_from <= t < valid_to.
  virtual std::vector<model::VersionRow> FetchAsOf(Transaction&, const HistoryTable&, util::TimePoint t) = 0;

  // Greatest valid_from / non-sentinel valid_to stored in the table.
  virtual std::optional<util::TimePoint> LatestBoundary(Transaction&, const HistoryTable&) = 0;

  // Missing key or audit columns are reported as Result::Err(NotFound).
  virtual Result VerifyHistorySchema(Transaction&, const HistoryTable&) = 0;

  // ---------------------------------------------------------------------
  // History writes
  // ---------------------------------------------------------------------

  // Sets valid_to = as_of, is_current = false on the current row of key.
  // Err(NotFound) unless exactly one current row was closed.
  virtual Result CloseOut(Transaction&, const HistoryTable&, const model::Value& key, util::TimePoint as_of) = 0;

  virtual Result InsertVersion(Transaction&, const HistoryTable&, const model::VersionRow& row) = 0;

  // Replaces attributes and row_hash of the current row opened at
  // row.valid_from. Used when two passes collide on the same as-of.
  virtual Result SupersedeVersion(Transaction&, const HistoryTable&, const model::VersionRow& row) = 0;
};

} // namespace scd::db
