#include "version_merger.hpp"

#include <stdexcept>
#include <utility>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace scd::core {

namespace {

model::VersionRow OpenVersion(const ClassifiedItem& item, const model::RunContext& ctx) {
  model::VersionRow row;
  row.key        = item.key;
  row.attributes = *item.source;
  row.row_hash   = item.fingerprint;
  row.valid_from = ctx.as_of;
  row.valid_to   = util::EndOfTime();
  row.is_current = true;
  return row;
}

} // namespace

MergeResult& MergeResult::operator+=(const MergeResult& other) {
  inserted += other.inserted;
  closed += other.closed;
  superseded += other.superseded;
  untouched += other.untouched;
  return *this;
}

VersionMerger::VersionMerger(std::shared_ptr<db::Repository> repository) : repository_(std::move(repository)) {
  if (!repository_) {
    throw std::invalid_argument("VersionMerger requires a repository");
  }
}

void VersionMerger::CheckNotBeforePrior(const ClassifiedItem& item, const model::RunContext& ctx) const {
  if (ctx.as_of < item.prior->valid_from) {
    const auto key = model::DisplayText(item.key);
    throw util::InvariantViolation("as-of " + util::FormatTimestamp(ctx.as_of) + " precedes current version of key " + key + " opened at " +
                                       util::FormatTimestamp(item.prior->valid_from),
                                   {key});
  }
}

MergeResult VersionMerger::Apply(db::Transaction& tx, const db::HistoryTable& history, const ClassifiedItem& item, const model::RunContext& ctx) {
  MergeResult result;
  const auto  key = model::DisplayText(item.key);

  switch (item.outcome) {
    case Outcome::kUnchanged:
      result.untouched++;
      break;

    case Outcome::kNew:
      db::ThrowIfError(repository_->InsertVersion(tx, history, OpenVersion(item, ctx)), "insert version of key " + key, {key});
      result.inserted++;
      break;

    case Outcome::kChanged: {
      if (!item.prior || !item.source) {
        throw std::logic_error("changed item without prior row or source record");
      }
      CheckNotBeforePrior(item, ctx);

      if (item.prior->valid_from == ctx.as_of) {
        db::ThrowIfError(repository_->SupersedeVersion(tx, history, OpenVersion(item, ctx)), "supersede version of key " + key, {key});
        result.superseded++;
        SCD_LOG_WARN("superseded version opened at the same as-of",
                     {observability::StringField("table", history.table), observability::StringField("key", key),
                      observability::StringField("as_of", util::FormatTimestamp(ctx.as_of))});
        break;
      }

      db::ThrowIfError(repository_->CloseOut(tx, history, item.prior->key, ctx.as_of), "close out key " + key, {key});
      db::ThrowIfError(repository_->InsertVersion(tx, history, OpenVersion(item, ctx)), "insert version of key " + key, {key});
      result.closed++;
      result.inserted++;
      break;
    }

    case Outcome::kRemoved:
      if (!item.prior) {
        throw std::logic_error("removed item without prior row");
      }
      CheckNotBeforePrior(item, ctx);
      db::ThrowIfError(repository_->CloseOut(tx, history, item.prior->key, ctx.as_of), "close out removed key " + key, {key});
      result.closed++;
      break;
  }

  return result;
}

MergeResult VersionMerger::ApplyAll(const db::HistoryTable& history, const Classification& classification, const model::RunContext& ctx) {
  MergeResult total;

  auto tx = repository_->Begin();
  for (const auto& item : classification.items) {
    total += Apply(*tx, history, item, ctx);
  }
  tx->Commit();

  SCD_LOG_DEBUG("merge committed", {observability::StringField("table", history.table), observability::IntField("inserted", total.inserted),
                                    observability::IntField("closed", total.closed), observability::IntField("superseded", total.superseded)});
  return total;
}

} // namespace scd::core
