#pragma once

#include "internal/core/run_summary.hpp"

namespace scd::core {

/*
  Receives the summary of every finished pass.

  Publish runs after the merge transaction is settled. A sink that throws
  does not change the outcome of the pass.
*/
class ReportSink {
 public:
  virtual ~ReportSink() = default;

  virtual void Publish(const RunSummary& summary) = 0;
};

// Writes the summary through the process logger.
class LogReportSink final : public ReportSink {
 public:
  void Publish(const RunSummary& summary) override;
};

} // namespace scd::core
