#include "internal/core/version_merger.hpp"

#include <cassert>
#include <chrono>
#include <cstdint>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "internal/core/delta_classifier.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/util/errors.hpp"

namespace {

using scd::core::Classification;
using scd::core::Classify;
using scd::core::MergeResult;
using scd::core::Outcome;
using scd::core::VersionMerger;
using scd::db::HistoryTable;
using scd::db::memory::MemoryRepository;
using scd::model::Record;
using scd::model::RunContext;
using scd::model::Value;
using scd::model::VersionRow;
using scd::util::TimePoint;

const HistoryTable             kHistory{"products_history", "id"};
const std::vector<std::string> kMonitored = {"price"};

TimePoint At(const char* text) {
  return *scd::util::ParseTimestamp(text);
}

Record Product(int64_t id, double price) {
  return Record{{"id", id}, {"price", price}};
}

std::shared_ptr<MemoryRepository> MakeRepository() {
  auto repo = std::make_shared<MemoryRepository>();
  repo->CreateHistoryTable(kHistory.table, kHistory.business_key);
  return repo;
}

Classification ClassifyAgainst(MemoryRepository& repo, const std::vector<Record>& source, bool detect_removed = false) {
  auto tx      = repo.Begin();
  auto current = repo.FetchCurrent(*tx, kHistory);
  return Classify(source, current, kHistory.business_key, kMonitored, detect_removed);
}

std::vector<VersionRow> Versions(MemoryRepository& repo, int64_t id) {
  auto tx = repo.Begin();
  return repo.FetchVersions(*tx, kHistory, Value{id});
}

void TestNewOpensCurrentVersion() {
  auto          repo = MakeRepository();
  VersionMerger merger(repo);

  const auto t0     = At("2024-01-01 00:00:00");
  const auto plan   = ClassifyAgainst(*repo, {Product(1, 999.99)});
  const auto result = merger.ApplyAll(kHistory, plan, RunContext{t0});
  assert(result.inserted == 1);
  assert(result.closed == 0);

  const auto versions = Versions(*repo, 1);
  assert(versions.size() == 1);
  assert(versions[0].is_current);
  assert(versions[0].valid_from == t0);
  assert(versions[0].valid_to == scd::util::EndOfTime());
  assert(versions[0].row_hash == plan.items[0].fingerprint);
  assert(std::get<double>(versions[0].attributes.At("price")) == 999.99);
}

void TestChangedClosesPriorAndOpensReplacement() {
  auto          repo = MakeRepository();
  VersionMerger merger(repo);

  const auto t0 = At("2024-01-01 00:00:00");
  const auto t1 = At("2024-02-01 00:00:00");
  (void)merger.ApplyAll(kHistory, ClassifyAgainst(*repo, {Product(1, 999.99)}), RunContext{t0});

  const auto plan = ClassifyAgainst(*repo, {Product(1, 1299.99)});
  assert(plan.items[0].outcome == Outcome::kChanged);
  const auto result = merger.ApplyAll(kHistory, plan, RunContext{t1});
  assert(result.closed == 1);
  assert(result.inserted == 1);

  const auto versions = Versions(*repo, 1);
  assert(versions.size() == 2);
  assert(!versions[0].is_current);
  assert(versions[0].valid_from == t0);
  assert(versions[0].valid_to == t1);
  assert(std::get<double>(versions[0].attributes.At("price")) == 999.99);
  assert(versions[1].is_current);
  assert(versions[1].valid_from == t1);
  assert(versions[1].valid_to == scd::util::EndOfTime());
  assert(std::get<double>(versions[1].attributes.At("price")) == 1299.99);
}

void TestUnchangedIssuesNoMutation() {
  auto          repo = MakeRepository();
  VersionMerger merger(repo);

  const auto t0 = At("2024-01-01 00:00:00");
  (void)merger.ApplyAll(kHistory, ClassifyAgainst(*repo, {Product(1, 5.0), Product(2, 6.0)}), RunContext{t0});

  const auto result = merger.ApplyAll(kHistory, ClassifyAgainst(*repo, {Product(1, 5.0), Product(2, 6.0)}), RunContext{At("2024-03-01 00:00:00")});
  assert(result.untouched == 2);
  assert(result.inserted == 0);
  assert(result.closed == 0);
  assert(Versions(*repo, 1).size() == 1);
  assert(Versions(*repo, 2).size() == 1);
}

void TestRemovedClosesWithoutInsert() {
  auto          repo = MakeRepository();
  VersionMerger merger(repo);

  const auto t0 = At("2024-01-01 00:00:00");
  const auto t2 = At("2024-04-01 00:00:00");
  (void)merger.ApplyAll(kHistory, ClassifyAgainst(*repo, {Product(1, 5.0), Product(2, 6.0)}), RunContext{t0});

  const auto plan = ClassifyAgainst(*repo, {Product(1, 5.0)}, true);
  assert(plan.Count(Outcome::kRemoved) == 1);
  const auto result = merger.ApplyAll(kHistory, plan, RunContext{t2});
  assert(result.closed == 1);
  assert(result.inserted == 0);

  const auto versions = Versions(*repo, 2);
  assert(versions.size() == 1);
  assert(!versions[0].is_current);
  assert(versions[0].valid_to == t2);

  auto tx = repo->Begin();
  for (const auto& row : repo->FetchCurrent(*tx, kHistory)) {
    assert(std::get<int64_t>(row.key) != 2);
  }
}

void TestAsOfBeforePriorVersionIsRejected() {
  auto          repo = MakeRepository();
  VersionMerger merger(repo);

  (void)merger.ApplyAll(kHistory, ClassifyAgainst(*repo, {Product(1, 5.0)}), RunContext{At("2024-05-01 00:00:00")});

  bool threw = false;
  try {
    (void)merger.ApplyAll(kHistory, ClassifyAgainst(*repo, {Product(1, 7.0)}), RunContext{At("2024-04-01 00:00:00")});
  } catch (const scd::util::InvariantViolation& e) {
    threw = e.Keys().size() == 1 && e.Keys().front() == "1";
  }
  assert(threw && "Time travel must be rejected.");

  const auto versions = Versions(*repo, 1);
  assert(versions.size() == 1);
  assert(versions[0].is_current);
  assert(std::get<double>(versions[0].attributes.At("price")) == 5.0);
}

void TestCollidingAsOfSupersedesInPlace() {
  auto          repo = MakeRepository();
  VersionMerger merger(repo);

  const auto t0 = At("2024-01-01 00:00:00");
  (void)merger.ApplyAll(kHistory, ClassifyAgainst(*repo, {Product(1, 5.0)}), RunContext{t0});

  const auto plan   = ClassifyAgainst(*repo, {Product(1, 8.0)});
  const auto result = merger.ApplyAll(kHistory, plan, RunContext{t0});
  assert(result.superseded == 1);
  assert(result.closed == 0);
  assert(result.inserted == 0);

  const auto versions = Versions(*repo, 1);
  assert(versions.size() == 1);
  assert(versions[0].is_current);
  assert(versions[0].valid_from == t0);
  assert(versions[0].row_hash == plan.items[0].fingerprint);
  assert(std::get<double>(versions[0].attributes.At("price")) == 8.0);
}

void TestStaleCloseOutAbandonsWholeBatch() {
  auto          repo = MakeRepository();
  VersionMerger merger(repo);

  const auto t0 = At("2024-01-01 00:00:00");
  (void)merger.ApplyAll(kHistory, ClassifyAgainst(*repo, {Product(1, 5.0)}), RunContext{t0});
  const auto stale = ClassifyAgainst(*repo, {Product(2, 1.0), Product(1, 6.0)});

  // Another pass closes key 1 after the plan above was computed.
  (void)merger.ApplyAll(kHistory, ClassifyAgainst(*repo, {}, true), RunContext{At("2024-02-01 00:00:00")});

  bool threw = false;
  try {
    (void)merger.ApplyAll(kHistory, stale, RunContext{At("2024-03-01 00:00:00")});
  } catch (const scd::util::TransactionConflict& e) {
    threw = !e.Keys().empty() && e.Keys().front() == "1";
  }
  assert(threw && "Close-out of a row that is no longer current must abort.");

  // Key 2 was inserted before the failing close-out; it must not be visible.
  assert(Versions(*repo, 2).empty());
  assert(Versions(*repo, 1).size() == 1);
}

void TestApplyJoinsCallerTransaction() {
  auto          repo = MakeRepository();
  VersionMerger merger(repo);

  const auto plan = ClassifyAgainst(*repo, {Product(1, 5.0), Product(2, 6.0)});
  {
    auto        tx = repo->Begin();
    MergeResult total;
    for (const auto& item : plan.items) {
      total += merger.Apply(*tx, kHistory, item, RunContext{At("2024-01-01 00:00:00")});
    }
    assert(total.inserted == 2);
    // Dropped without commit.
  }
  assert(Versions(*repo, 1).empty());
  assert(Versions(*repo, 2).empty());
}

} // namespace

int main() {
  TestNewOpensCurrentVersion();
  TestChangedClosesPriorAndOpensReplacement();
  TestUnchangedIssuesNoMutation();
  TestRemovedClosesWithoutInsert();
  TestAsOfBeforePriorVersionIsRejected();
  TestCollidingAsOfSupersedesInPlace();
  TestStaleCloseOutAbandonsWholeBatch();
  TestApplyJoinsCallerTransaction();

  std::cout << "scd_unit_version_merger: pass\n";
  return 0;
}
