#pragma once

#include <sqlite3.h>

#include <memory>
#include <string>

namespace scd::db::sqlite {

struct StatementFinalizer {
  void operator()(sqlite3_stmt* stmt) const {
    sqlite3_finalize(stmt);
  }
};

using Statement = std::unique_ptr<sqlite3_stmt, StatementFinalizer>;

/*
  Thin RAII wrapper around sqlite3*.

  Errors surface as util::StorageUnavailable (BUSY / LOCKED) or
  util::StorageFailure (everything else).
*/
class SqliteDB {
 public:
  explicit SqliteDB(std::string path, int busy_timeout_ms = 5000);
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  const std::string& Path() const {
    return path_;
  }

  // Execute a SQL string (used for pragmas and transaction control)
  void Exec(const std::string& sql);

  // Prepare a statement; finalized when the returned handle is destroyed
  Statement Prepare(const std::string& sql);

  // Configure recommended PRAGMAs (WAL, busy timeout, etc.)
  void Configure(int busy_timeout_ms);

  // Throws the util:: error matching rc, prefixed with what.
  [[noreturn]] static void Throw(sqlite3* db, int rc, const std::string& what);

 private:
  sqlite3*    db_ = nullptr;
  std::string path_;
};

// Identifier quoting for table and column names taken from configuration.
std::string QuoteIdent(const std::string& name);

} // namespace scd::db::sqlite
