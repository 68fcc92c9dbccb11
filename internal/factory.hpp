#pragma once

#include <memory>
#include <vector>

#include "config/config.pb.h"

#include "internal/core/run_orchestrator.hpp"
#include "internal/core/table_spec.hpp"
#include "internal/db/api/repository.hpp"

namespace scd::factory {

/*
  Application

  Owns everything one invocation needs. Lives for the lifetime of the
  process.
*/
struct Application {
  std::shared_ptr<db::Repository>        repository;
  std::shared_ptr<core::ReportSink>      sink;
  std::shared_ptr<core::RunOrchestrator> orchestrator;

  std::vector<core::TableSpec> tables;
  core::RunOptions             options;
};

/*
  Build

  Constructs the dependency graph from the runtime config.

  NOTE:
  This is the composition root of the application.
  It is the ONLY place allowed to know concrete DB types.
*/
Application Build(const scd::runtime::config::RuntimeConfig& config);

// Storage backend from config.database. Throws util::InvalidConfiguration
// when no usable backend is configured.
std::shared_ptr<db::Repository> BuildRepository(const scd::runtime::config::RuntimeConfig& config);

} // namespace scd::factory
