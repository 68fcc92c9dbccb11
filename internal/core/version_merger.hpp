#pragma once

#include <cstddef>
#include <memory>

#include "internal/core/delta_classifier.hpp"
#include "internal/db/api/history_table.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/model/run_context.hpp"

namespace scd::core {

// Mutations issued against the history table.
struct MergeResult {
  std::size_t inserted   = 0;
  std::size_t closed     = 0;
  std::size_t superseded = 0;
  std::size_t untouched  = 0;

  MergeResult& operator+=(const MergeResult& other);
};

/*
  Turns a Classification into history mutations.

    New        insert [as_of, end-of-time), current
    Changed    close the prior row at as_of, insert the replacement
    Unchanged  nothing
    Removed    close the prior row at as_of, nothing inserted

  A Changed item whose prior row was opened at exactly as_of comes from a
  pass that collided on the same timestamp; its row is superseded in place
  instead, so no zero-length interval is written.

  Every mutation of a pass shares one transaction. Nothing is visible
  until ApplyAll commits; any exception leaves history untouched.
*/
class VersionMerger {
 public:
  explicit VersionMerger(std::shared_ptr<db::Repository> repository);

  // Applies one item inside the caller's transaction.
  MergeResult Apply(db::Transaction& tx, const db::HistoryTable& history, const ClassifiedItem& item, const model::RunContext& ctx);

  // Applies every item in a single transaction and commits it.
  MergeResult ApplyAll(const db::HistoryTable& history, const Classification& classification, const model::RunContext& ctx);

 private:
  void CheckNotBeforePrior(const ClassifiedItem& item, const model::RunContext& ctx) const;

  std::shared_ptr<db::Repository> repository_;
};

} // namespace scd::core
