#include "memory_repository.hpp"

#include <algorithm>

#include "internal/util/errors.hpp"
#include "memory_tx.hpp"

namespace scd::db::memory {

namespace {

MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

} // namespace

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

void MemoryRepository::LoadSource(const std::string& table, std::vector<model::Record> rows) {
  std::scoped_lock lock(mutex_);
  committed_.sources[table] = std::move(rows);
  committed_version_++;
}

void MemoryRepository::CreateHistoryTable(const std::string& table, const std::string& business_key) {
  std::scoped_lock lock(mutex_);
  if (committed_.histories.try_emplace(table).second) {
    committed_.history_keys[table] = business_key;
  }
  committed_version_++;
}

std::vector<model::Record> MemoryRepository::FetchAll(Transaction& t, const std::string& source_table) {
  const auto& s  = TX(t).View();
  const auto  it = s.sources.find(source_table);
  if (it == s.sources.end()) throw util::StorageFailure("no such table: " + source_table);
  return it->second;
}

std::vector<model::VersionRow> MemoryRepository::FetchCurrent(Transaction& t, const HistoryTable& history) {
  const auto& s  = TX(t).View();
  const auto  it = s.histories.find(history.table);
  if (it == s.histories.end()) throw util::StorageFailure("no such table: " + history.table);

  std::vector<model::VersionRow> out;
  for (const auto& row : it->second) {
    if (row.is_current) out.push_back(row);
  }
  return out;
}

std::vector<model::VersionRow> MemoryRepository::FetchVersions(Transaction& t, const HistoryTable& history, const model::Value& key) {
  const auto& s  = TX(t).View();
  const auto  it = s.histories.find(history.table);
  if (it == s.histories.end()) throw util::StorageFailure("no such table: " + history.table);

  std::vector<model::VersionRow> out;
  for (const auto& row : it->second) {
    if (row.key == key) out.push_back(row);
  }
  std::sort(out.begin(), out.end(), [](const model::VersionRow& a, const model::VersionRow& b) { return a.valid_from < b.valid_from; });
  return out;
}

std::vector<model::VersionRow> MemoryRepository::FetchAsOf(Transaction& t, const HistoryTable& history, util::TimePoint at) {
  const auto& s  = TX(t).View();
  const auto  it = s.histories.find(history.table);
  if (it == s.histories.end()) throw util::StorageFailure("no such table: " + history.table);

  std::vector<model::VersionRow> out;
  for (const auto& row : it->second) {
    if (row.valid_from <= at && at < row.valid_to) out.push_back(row);
  }
  return out;
}

std::optional<util::TimePoint> MemoryRepository::LatestBoundary(Transaction& t, const HistoryTable& history) {
  const auto& s  = TX(t).View();
  const auto  it = s.histories.find(history.table);
  if (it == s.histories.end()) throw util::StorageFailure("no such table: " + history.table);

  const auto                     end_of_time = util::EndOfTime();
  std::optional<util::TimePoint> latest;
  for (const auto& row : it->second) {
    if (!latest || row.valid_from > *latest) latest = row.valid_from;
    if (row.valid_to != end_of_time && row.valid_to > *latest) latest = row.valid_to;
  }
  return latest;
}

Result MemoryRepository::VerifyHistorySchema(Transaction& t, const HistoryTable& history) {
  const auto& s  = TX(t).View();
  const auto  it = s.history_keys.find(history.table);
  if (it == s.history_keys.end()) {
    return Result::Err(ErrorCode::NotFound, "no such table: " + history.table);
  }
  // Audit columns are part of every memory row; only the key column can differ.
  if (it->second != history.business_key) {
    return Result::Err(ErrorCode::NotFound, "history table " + history.table + " has no column " + history.business_key);
  }
  return Result::Ok();
}

Result MemoryRepository::CloseOut(Transaction& t, const HistoryTable& history, const model::Value& key, util::TimePoint as_of) {
  auto& s  = TX(t).Mutable();
  auto  it = s.histories.find(history.table);
  if (it == s.histories.end()) return Result::Err(ErrorCode::NotFound, "no such table: " + history.table);

  std::vector<model::VersionRow*> current;
  for (auto& row : it->second) {
    if (row.is_current && row.key == key) current.push_back(&row);
  }
  if (current.size() != 1) {
    return Result::Err(ErrorCode::NotFound, "expected exactly one current row, found " + std::to_string(current.size()));
  }

  current.front()->valid_to   = as_of;
  current.front()->is_current = false;
  return Result::Ok();
}

Result MemoryRepository::InsertVersion(Transaction& t, const HistoryTable& history, const model::VersionRow& row) {
  auto& s  = TX(t).Mutable();
  auto  it = s.histories.find(history.table);
  if (it == s.histories.end()) return Result::Err(ErrorCode::NotFound, "no such table: " + history.table);

  for (const auto& existing : it->second) {
    if (existing.key != row.key) continue;
    if (existing.valid_from == row.valid_from) {
      return Result::Err(ErrorCode::AlreadyExists, "version already exists at valid_from");
    }
    if (existing.is_current && row.is_current) {
      return Result::Err(ErrorCode::ConstraintViolation, "key already has a current version");
    }
  }

  it->second.push_back(row);
  return Result::Ok();
}

Result MemoryRepository::SupersedeVersion(Transaction& t, const HistoryTable& history, const model::VersionRow& row) {
  auto& s  = TX(t).Mutable();
  auto  it = s.histories.find(history.table);
  if (it == s.histories.end()) return Result::Err(ErrorCode::NotFound, "no such table: " + history.table);

  for (auto& existing : it->second) {
    if (existing.is_current && existing.key == row.key && existing.valid_from == row.valid_from) {
      existing.attributes = row.attributes;
      existing.row_hash   = row.row_hash;
      return Result::Ok();
    }
  }
  return Result::Err(ErrorCode::NotFound, "no current version at valid_from");
}

} // namespace scd::db::memory
