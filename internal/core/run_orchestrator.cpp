#include "run_orchestrator.hpp"

#include <stdexcept>
#include <string_view>
#include <thread>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace scd::core {

using observability::IntField;
using observability::StringField;

namespace {

void Transition(RunSummary& summary, model::RunState next) {
  if (!model::CanTransition(summary.state, next)) {
    throw std::logic_error("illegal run state transition " + std::string(model::RunStateName(summary.state)) + " -> " +
                           std::string(model::RunStateName(next)));
  }
  SCD_LOG_DEBUG("run state", {StringField("history", summary.history_table), StringField("from", model::RunStateName(summary.state)),
                              StringField("to", model::RunStateName(next))});
  summary.state = next;
}

// Retries fn while the storage layer reports itself unavailable.
template <typename Fn>
auto WithRetry(std::string_view phase, const RunOptions& options, RunSummary& summary, Fn&& fn) -> decltype(fn()) {
  for (std::size_t attempt = 1;; ++attempt) {
    try {
      return fn();
    } catch (const util::StorageUnavailable& e) {
      if (attempt >= options.max_attempts) {
        throw;
      }
      SCD_LOG_WARN("storage unavailable, retrying", {StringField("phase", phase), StringField("history", summary.history_table),
                                                     IntField("attempt", static_cast<std::int64_t>(attempt)), StringField("error", e.what())});
      summary.retries++;
      std::this_thread::sleep_for(options.backoff);
    }
  }
}

void Tally(RunSummary& summary, const Classification& classification) {
  for (const auto& item : classification.items) {
    auto key = model::DisplayText(item.key);
    switch (item.outcome) {
      case Outcome::kNew:
        summary.new_count++;
        SCD_LOG_DEBUG("new key", {StringField("history", summary.history_table), StringField("key", key)});
        summary.new_keys.push_back(std::move(key));
        break;
      case Outcome::kChanged:
        summary.changed_count++;
        SCD_LOG_DEBUG("changed key", {StringField("history", summary.history_table), StringField("key", key)});
        summary.changed_keys.push_back(std::move(key));
        break;
      case Outcome::kUnchanged:
        summary.unchanged_count++;
        summary.unchanged_keys.push_back(std::move(key));
        break;
      case Outcome::kRemoved:
        summary.removed_count++;
        SCD_LOG_DEBUG("removed key", {StringField("history", summary.history_table), StringField("key", key)});
        summary.removed_keys.push_back(std::move(key));
        break;
    }
  }
  summary.total = classification.items.size();
}

} // namespace

RunOrchestrator::RunOrchestrator(std::shared_ptr<db::Repository> repository, std::shared_ptr<ReportSink> sink, ClockFn clock)
    : repository_(repository), sink_(std::move(sink)), clock_(std::move(clock)), merger_(repository) {
  if (!sink_) {
    sink_ = std::make_shared<LogReportSink>();
  }
  if (!clock_) {
    throw std::invalid_argument("RunOrchestrator requires a clock");
  }
}

RunOrchestrator::Snapshot RunOrchestrator::Extract(const TableSpec& spec, const RunOptions& options) {
  const auto history = spec.History();
  auto       tx      = repository_->Begin();

  const auto schema = repository_->VerifyHistorySchema(*tx, history);
  if (!schema) {
    if (schema.code == db::ErrorCode::NotFound) {
      throw util::InvalidConfiguration("history table " + spec.history_table + ": " + schema.message);
    }
    db::ThrowIfError(schema, "verify history table " + spec.history_table);
  }

  Snapshot snapshot;
  snapshot.source  = repository_->FetchAll(*tx, spec.source_table);
  snapshot.current = repository_->FetchCurrent(*tx, history);

  const auto latest = repository_->LatestBoundary(*tx, history);
  if (options.as_of) {
    if (latest && *options.as_of < *latest) {
      throw util::InvariantViolation("as-of " + util::FormatTimestamp(*options.as_of) + " precedes latest history boundary " +
                                     util::FormatTimestamp(*latest));
    }
    snapshot.as_of = *options.as_of;
  } else {
    snapshot.as_of = clock_();
    if (latest && snapshot.as_of <= *latest) {
      snapshot.as_of = *latest + util::kTick;
    }
  }

  tx->Rollback();
  return snapshot;
}

void RunOrchestrator::Publish(const RunSummary& summary) {
  try {
    sink_->Publish(summary);
  } catch (const std::exception& e) {
    SCD_LOG_ERROR("report sink failed", {StringField("history", summary.history_table), StringField("error", e.what())});
  }
}

RunSummary RunOrchestrator::RunOnce(const TableSpec& spec, const RunOptions& options) {
  const auto started = std::chrono::steady_clock::now();

  RunSummary summary;
  summary.source_table  = spec.source_table;
  summary.history_table = spec.history_table;

  try {
    ValidateTableSpec(spec);
    if (options.max_attempts == 0) {
      throw util::InvalidConfiguration("max_attempts must be at least 1");
    }

    Transition(summary, model::RunState::kExtracting);
    auto snapshot = WithRetry("extract", options, summary, [&] { return Extract(spec, options); });
    summary.as_of = snapshot.as_of;

    Transition(summary, model::RunState::kClassifying);
    const auto classification = Classify(snapshot.source, snapshot.current, spec.business_key, spec.monitored_attributes, spec.detect_removed);
    Tally(summary, classification);

    Transition(summary, model::RunState::kMerging);
    const model::RunContext ctx{snapshot.as_of};
    WithRetry("merge", options, summary, [&] { return merger_.ApplyAll(spec.History(), classification, ctx); });

    Transition(summary, model::RunState::kCommitted);
  } catch (const util::Error& e) {
    summary.error = RunError{e.Kind(), e.what(), e.Keys()};
    SCD_LOG_ERROR("run failed", {StringField("history", summary.history_table), StringField("state", model::RunStateName(summary.state)),
                                 StringField("kind", util::ErrorKindName(e.Kind())), StringField("error", e.what())});
    Transition(summary, model::RunState::kAborted);
  }

  summary.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started);
  Publish(summary);
  return summary;
}

std::vector<RunSummary> RunOrchestrator::RunAll(const std::vector<TableSpec>& specs, const RunOptions& options) {
  std::vector<RunSummary> summaries;
  summaries.reserve(specs.size());
  for (const auto& spec : specs) {
    summaries.push_back(RunOnce(spec, options));
  }
  return summaries;
}

} // namespace scd::core
