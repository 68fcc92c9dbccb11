#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace scd::db::sqlite {

class SqliteRepository final : public db::Repository {
public:
  explicit SqliteRepository(std::shared_ptr<SqliteDB> db);

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

private:
  std::shared_ptr<SqliteDB> db_;

  static SqliteTransaction& TX(Transaction& t);
  static Result Translate(sqlite3* db, int rc);
  static std::vector<model::VersionRow> ReadVersions(sqlite3_stmt* st, const HistoryTable& history);
};

}
