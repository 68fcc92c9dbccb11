#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include <algorithm>
#include <set>

#include "internal/util/errors.hpp"

namespace scd::db::sqlite {

using scd::db::ErrorCode;
using scd::db::Result;

namespace {

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
  sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

void BindTime(sqlite3_stmt* st, int idx, util::TimePoint tp) {
  BindText(st, idx, util::FormatTimestamp(tp));
}

void BindValue(sqlite3_stmt* st, int idx, const model::Value& v) {
  switch (v.index()) {
    case 0:
      sqlite3_bind_null(st, idx);
      break;
    case 1:
      sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(std::get<int64_t>(v)));
      break;
    case 2:
      sqlite3_bind_double(st, idx, std::get<double>(v));
      break;
    default:
      BindText(st, idx, std::get<std::string>(v));
      break;
  }
}

std::string ColText(sqlite3_stmt* st, int col) {
  const unsigned char* t = sqlite3_column_text(st, col);
  return t ? reinterpret_cast<const char*>(t) : "";
}

model::Value ColValue(sqlite3_stmt* st, int col) {
  switch (sqlite3_column_type(st, col)) {
    case SQLITE_INTEGER:
      return static_cast<int64_t>(sqlite3_column_int64(st, col));
    case SQLITE_FLOAT:
      return sqlite3_column_double(st, col);
    case SQLITE_NULL:
      return std::monostate{};
    case SQLITE_BLOB: {
      const auto* data = static_cast<const char*>(sqlite3_column_blob(st, col));
      return std::string(data ? data : "", static_cast<std::size_t>(sqlite3_column_bytes(st, col)));
    }
    default:
      return ColText(st, col);
  }
}

util::TimePoint ColTime(sqlite3_stmt* st, int col, const char* column) {
  const auto text   = ColText(st, col);
  const auto parsed = util::ParseTimestamp(text);
  if (!parsed) {
    throw util::StorageFailure(std::string("corrupt timestamp in column ") + column + ": '" + text + "'");
  }
  return *parsed;
}

std::vector<std::string> BusinessColumns(const model::Record& attributes) {
  std::vector<std::string> cols;
  for (const auto& name : attributes.Names()) {
    if (!model::IsAuditColumn(name)) cols.push_back(name);
  }
  return cols;
}

} // namespace

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db)
    : db_(std::move(db)) {}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
  return std::make_unique<SqliteTransaction>(db_);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
  return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
  if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW)
    return Result::Ok();

  switch (rc & 0xff) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
    case SQLITE_CONSTRAINT:
      return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
    case SQLITE_IOERR:
      return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
    case SQLITE_CORRUPT:
      return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
    default:
      return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  }
}

std::vector<model::VersionRow> SqliteRepository::ReadVersions(sqlite3_stmt* st, const HistoryTable& history) {
  std::vector<model::VersionRow> out;
  const int                      columns = sqlite3_column_count(st);

  int rc = SQLITE_ROW;
  while ((rc = sqlite3_step(st)) == SQLITE_ROW) {
    model::VersionRow row;
    for (int col = 0; col < columns; ++col) {
      const std::string name = sqlite3_column_name(st, col);
      if (name == model::kRowHashColumn) {
        row.row_hash = ColText(st, col);
      } else if (name == model::kValidFromColumn) {
        row.valid_from = ColTime(st, col, model::kValidFromColumn);
      } else if (name == model::kValidToColumn) {
        row.valid_to = ColTime(st, col, model::kValidToColumn);
      } else if (name == model::kIsCurrentColumn) {
        row.is_current = sqlite3_column_int(st, col) != 0;
      } else {
        row.attributes.Set(name, ColValue(st, col));
      }
    }

    const auto* key = row.attributes.Find(history.business_key);
    if (!key) {
      throw util::StorageFailure("history table " + history.table + " has no column " + history.business_key);
    }
    row.key = *key;
    out.push_back(std::move(row));
  }

  if (rc != SQLITE_DONE) {
    SqliteDB::Throw(sqlite3_db_handle(st), rc, "read " + history.table);
  }
  return out;
}

// ------------------------------------------------------------------
// Source
// ------------------------------------------------------------------

std::vector<model::Record> SqliteRepository::FetchAll(Transaction& t, const std::string& source_table) {
  auto st = TX(t).DB().Prepare("SELECT * FROM " + QuoteIdent(source_table) + ";");

  const int                  columns = sqlite3_column_count(st.get());
  std::vector<model::Record> out;

  int rc = SQLITE_ROW;
  while ((rc = sqlite3_step(st.get())) == SQLITE_ROW) {
    model::Record r;
    for (int col = 0; col < columns; ++col) {
      r.Set(sqlite3_column_name(st.get(), col), ColValue(st.get(), col));
    }
    out.push_back(std::move(r));
  }

  if (rc != SQLITE_DONE) {
    SqliteDB::Throw(TX(t).Handle(), rc, "read " + source_table);
  }
  return out;
}

// ------------------------------------------------------------------
// History reads
// ------------------------------------------------------------------

std::vector<model::VersionRow> SqliteRepository::FetchCurrent(Transaction& t, const HistoryTable& history) {
  auto st = TX(t).DB().Prepare("SELECT * FROM " + QuoteIdent(history.table) + " WHERE is_current=1;");
  return ReadVersions(st.get(), history);
}

std::vector<model::VersionRow> SqliteRepository::FetchVersions(Transaction& t, const HistoryTable& history, const model::Value& key) {
  auto st = TX(t).DB().Prepare("SELECT * FROM " + QuoteIdent(history.table) + " WHERE " + QuoteIdent(history.business_key) +
                               "=? ORDER BY valid_from ASC;");
  BindValue(st.get(), 1, key);
  return ReadVersions(st.get(), history);
}

std::vector<model::VersionRow> SqliteRepository::FetchAsOf(Transaction& t, const HistoryTable& history, util::TimePoint at) {
  auto st = TX(t).DB().Prepare("SELECT * FROM " + QuoteIdent(history.table) + " WHERE valid_from<=? AND valid_to>?;");
  BindTime(st.get(), 1, at);
  BindTime(st.get(), 2, at);
  return ReadVersions(st.get(), history);
}

std::optional<util::TimePoint> SqliteRepository::LatestBoundary(Transaction& t, const HistoryTable& history) {
  auto st = TX(t).DB().Prepare("SELECT MAX(valid_from), MAX(CASE WHEN valid_to<? THEN valid_to END) FROM " + QuoteIdent(history.table) + ";");
  BindTime(st.get(), 1, util::EndOfTime());

  int rc = sqlite3_step(st.get());
  if (rc != SQLITE_ROW) {
    SqliteDB::Throw(TX(t).Handle(), rc, "read " + history.table);
  }

  std::optional<util::TimePoint> latest;
  for (int col = 0; col < 2; ++col) {
    if (sqlite3_column_type(st.get(), col) == SQLITE_NULL) continue;
    const auto tp = ColTime(st.get(), col, col == 0 ? model::kValidFromColumn : model::kValidToColumn);
    if (!latest || tp > *latest) latest = tp;
  }
  return latest;
}

Result SqliteRepository::VerifyHistorySchema(Transaction& t, const HistoryTable& history) {
  auto* db = TX(t).Handle();

  sqlite3_stmt* raw = nullptr;
  const auto    sql = "PRAGMA table_info(" + QuoteIdent(history.table) + ");";
  if (sqlite3_prepare_v2(db, sql.c_str(), -1, &raw, nullptr) != SQLITE_OK) {
    sqlite3_finalize(raw);
    return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  }
  Statement st(raw);

  std::set<std::string> columns;
  int                   rc = SQLITE_ROW;
  while ((rc = sqlite3_step(st.get())) == SQLITE_ROW) {
    columns.insert(ColText(st.get(), 1));
  }
  if (rc != SQLITE_DONE) return Translate(db, rc);

  if (columns.empty()) {
    return Result::Err(ErrorCode::NotFound, "no such table: " + history.table);
  }

  for (const std::string required : {history.business_key, std::string(model::kRowHashColumn), std::string(model::kValidFromColumn),
                                     std::string(model::kValidToColumn), std::string(model::kIsCurrentColumn)}) {
    if (!columns.contains(required)) {
      return Result::Err(ErrorCode::NotFound, "history table " + history.table + " has no column " + required);
    }
  }
  return Result::Ok();
}

// ------------------------------------------------------------------
// History writes
// ------------------------------------------------------------------

Result SqliteRepository::CloseOut(Transaction& t, const HistoryTable& history, const model::Value& key, util::TimePoint as_of) {
  auto* db = TX(t).Handle();

  const auto sql = "UPDATE " + QuoteIdent(history.table) + " SET valid_to=?, is_current=0 WHERE " + QuoteIdent(history.business_key) +
                   "=? AND is_current=1;";

  sqlite3_stmt* raw = nullptr;
  if (sqlite3_prepare_v2(db, sql.c_str(), -1, &raw, nullptr) != SQLITE_OK) {
    sqlite3_finalize(raw);
    return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  }
  Statement st(raw);

  BindTime(st.get(), 1, as_of);
  BindValue(st.get(), 2, key);

  int rc = sqlite3_step(st.get());
  if (rc != SQLITE_DONE) return Translate(db, rc);

  const int changed = sqlite3_changes(db);
  if (changed != 1) {
    return Result::Err(ErrorCode::NotFound, "expected exactly one current row, found " + std::to_string(changed));
  }
  return Result::Ok();
}

Result SqliteRepository::InsertVersion(Transaction& t, const HistoryTable& history, const model::VersionRow& row) {
  auto* db = TX(t).Handle();

  const auto  columns = BusinessColumns(row.attributes);
  std::string sql     = "INSERT INTO " + QuoteIdent(history.table) + "(";
  for (const auto& col : columns) {
    sql += QuoteIdent(col) + ",";
  }
  sql += "row_hash,valid_from,valid_to,is_current) VALUES(";
  for (std::size_t i = 0; i < columns.size(); ++i) {
    sql += "?,";
  }
  sql += "?,?,?,?);";

  sqlite3_stmt* raw = nullptr;
  if (sqlite3_prepare_v2(db, sql.c_str(), -1, &raw, nullptr) != SQLITE_OK) {
    sqlite3_finalize(raw);
    return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  }
  Statement st(raw);

  int idx = 1;
  for (const auto& col : columns) {
    BindValue(st.get(), idx++, row.attributes.At(col));
  }
  BindText(st.get(), idx++, row.row_hash);
  BindTime(st.get(), idx++, row.valid_from);
  BindTime(st.get(), idx++, row.valid_to);
  sqlite3_bind_int(st.get(), idx++, row.is_current ? 1 : 0);

  return Translate(db, sqlite3_step(st.get()));
}

Result SqliteRepository::SupersedeVersion(Transaction& t, const HistoryTable& history, const model::VersionRow& row) {
  auto* db = TX(t).Handle();

  const auto  columns = BusinessColumns(row.attributes);
  std::string sql     = "UPDATE " + QuoteIdent(history.table) + " SET ";
  for (const auto& col : columns) {
    sql += QuoteIdent(col) + "=?,";
  }
  sql += "row_hash=? WHERE " + QuoteIdent(history.business_key) + "=? AND valid_from=? AND is_current=1;";

  sqlite3_stmt* raw = nullptr;
  if (sqlite3_prepare_v2(db, sql.c_str(), -1, &raw, nullptr) != SQLITE_OK) {
    sqlite3_finalize(raw);
    return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  }
  Statement st(raw);

  int idx = 1;
  for (const auto& col : columns) {
    BindValue(st.get(), idx++, row.attributes.At(col));
  }
  BindText(st.get(), idx++, row.row_hash);
  BindValue(st.get(), idx++, row.key);
  BindTime(st.get(), idx++, row.valid_from);

  int rc = sqlite3_step(st.get());
  if (rc != SQLITE_DONE) return Translate(db, rc);

  if (sqlite3_changes(db) != 1) {
    return Result::Err(ErrorCode::NotFound, "no current version at valid_from");
  }
  return Result::Ok();
}

}
