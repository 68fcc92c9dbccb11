#include "report_sink.hpp"

#include <spdlog/fmt/fmt.h>
#include <spdlog/fmt/ranges.h>

#include <string>
#include <vector>

#include "internal/observability/logging.hpp"

namespace scd::core {

namespace {

std::string JoinKeys(const std::vector<std::string>& keys) {
  return fmt::format("[{}]", fmt::join(keys, ","));
}

} // namespace

void LogReportSink::Publish(const RunSummary& summary) {
  using observability::IntField;
  using observability::StringField;

  if (!summary.Succeeded()) {
    const auto& error = summary.error;
    SCD_LOG_ERROR("run aborted", {StringField("source", summary.source_table), StringField("history", summary.history_table),
                                  StringField("as_of", util::FormatTimestamp(summary.as_of)),
                                  StringField("kind", error ? util::ErrorKindName(error->kind) : "unknown"),
                                  StringField("error", error ? error->message : ""), StringField("keys", JoinKeys(error ? error->keys : std::vector<std::string>{})),
                                  IntField("retries", static_cast<std::int64_t>(summary.retries)),
                                  IntField("elapsed_ms", summary.elapsed.count())});
    return;
  }

  SCD_LOG_INFO("run committed", {StringField("source", summary.source_table), StringField("history", summary.history_table),
                                 StringField("as_of", util::FormatTimestamp(summary.as_of)),
                                 IntField("new", static_cast<std::int64_t>(summary.new_count)),
                                 IntField("changed", static_cast<std::int64_t>(summary.changed_count)),
                                 IntField("unchanged", static_cast<std::int64_t>(summary.unchanged_count)),
                                 IntField("removed", static_cast<std::int64_t>(summary.removed_count)),
                                 IntField("total", static_cast<std::int64_t>(summary.total)),
                                 IntField("elapsed_ms", summary.elapsed.count())});

  if (!summary.changed_keys.empty()) {
    SCD_LOG_DEBUG("changed keys", {StringField("history", summary.history_table), StringField("keys", JoinKeys(summary.changed_keys))});
  }
  if (!summary.removed_keys.empty()) {
    SCD_LOG_DEBUG("removed keys", {StringField("history", summary.history_table), StringField("keys", JoinKeys(summary.removed_keys))});
  }
}

} // namespace scd::core
