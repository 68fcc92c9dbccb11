#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/core/delta_classifier.hpp"
#include "internal/core/report_sink.hpp"
#include "internal/core/run_summary.hpp"
#include "internal/core/table_spec.hpp"
#include "internal/core/version_merger.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/util/time.hpp"

namespace scd::core {

struct RunOptions {
  // Fixed as-of for the pass. When unset the clock is read and the value
  // is forced strictly past every boundary already stored in history.
  std::optional<util::TimePoint> as_of;

  std::size_t               max_attempts = 3;
  std::chrono::milliseconds backoff{200};
};

/*
  Drives one pass over one table:

    validate -> snapshot source + current slice -> classify -> merge -> publish

  Every failure ends the pass in kAborted with an error in the summary;
  RunOnce itself only throws for programming errors. The history table
  is expected to have a single writer.
*/
class RunOrchestrator {
 public:
  using ClockFn = std::function<util::TimePoint()>;

  RunOrchestrator(std::shared_ptr<db::Repository> repository, std::shared_ptr<ReportSink> sink, ClockFn clock = util::Now);

  RunSummary RunOnce(const TableSpec& spec, const RunOptions& options = {});

  // Runs every table in order; a failed table does not stop the others.
  std::vector<RunSummary> RunAll(const std::vector<TableSpec>& specs, const RunOptions& options = {});

 private:
  struct Snapshot {
    std::vector<model::Record>     source;
    std::vector<model::VersionRow> current;
    util::TimePoint                as_of{};
  };

  Snapshot Extract(const TableSpec& spec, const RunOptions& options);
  void     Publish(const RunSummary& summary);

  std::shared_ptr<db::Repository> repository_;
  std::shared_ptr<ReportSink>     sink_;
  ClockFn                         clock_;
  VersionMerger                   merger_;
};

} // namespace scd::core
