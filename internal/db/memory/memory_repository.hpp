#pragma once

#include <cstdint>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace scd::db::memory {

class MemoryTransaction;

/*
  In-process backend: committed state plus one snapshot per transaction.

  Used by tests. Source tables are loaded directly with LoadSource();
  history tables must be created before a pass reads them.
*/
class MemoryRepository final : public db::Repository {
public:
  MemoryRepository();

  std::unique_ptr<Transaction> Begin() override;

  std::vector<model::Record> FetchAll(Transaction&, const std::string& source_table) override;

  std::vector<model::VersionRow> FetchCurrent(Transaction&, const HistoryTable&) override;
  std::vector<model::VersionRow> FetchVersions(Transaction&, const HistoryTable&, const model::Value& key) override;
  std::vector<model::VersionRow> FetchAsOf(Transaction&, const HistoryTable&, util::TimePoint t) override;
  std::optional<util::TimePoint> LatestBoundary(Transaction&, const HistoryTable&) override;
  Result VerifyHistorySchema(Transaction&, const HistoryTable&) override;

  Result CloseOut(Transaction&, const HistoryTable&, const model::Value& key, util::TimePoint as_of) override;
  Result InsertVersion(Transaction&, const HistoryTable&, const model::VersionRow& row) override;
  Result SupersedeVersion(Transaction&, const HistoryTable&, const model::VersionRow& row) override;

  // Replaces the committed contents of a source table.
  void LoadSource(const std::string& table, std::vector<model::Record> rows);

  // Registers an empty history table keyed by business_key; no-op if it
  // already exists.
  void CreateHistoryTable(const std::string& table, const std::string& business_key);

private:
  friend class MemoryTransaction;

  struct State {
    std::unordered_map<std::string, std::vector<model::Record>>     sources;
    std::unordered_map<std::string, std::vector<model::VersionRow>> histories;
    // history table -> business key column
    std::unordered_map<std::string, std::string> history_keys;
  };

  std::mutex mutex_;
  State      committed_;
  uint64_t   committed_version_ = 0;
};

}
