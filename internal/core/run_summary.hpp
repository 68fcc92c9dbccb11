#pragma once

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "internal/model/run_state.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace scd::core {

struct RunError {
  util::ErrorKind          kind = util::ErrorKind::kStorageFailure;
  std::string              message;
  std::vector<std::string> keys;
};

/*
  Terminal outcome of one pass, handed to the report sink.

  A summary in state kAborted carries an error and reports zero applied
  mutations: the counts describe what was classified, not what was
  written.
*/
struct RunSummary {
  std::string source_table;
  std::string history_table;

  model::RunState state = model::RunState::kIdle;
  util::TimePoint as_of{};

  std::size_t new_count       = 0;
  std::size_t changed_count   = 0;
  std::size_t unchanged_count = 0;
  std::size_t removed_count   = 0;
  std::size_t total           = 0;

  std::vector<std::string> new_keys;
  std::vector<std::string> changed_keys;
  std::vector<std::string> unchanged_keys;
  std::vector<std::string> removed_keys;

  std::size_t               retries = 0;  // storage-unavailable retries across all phases
  std::chrono::milliseconds elapsed{0};

  std::optional<RunError> error;

  bool Succeeded() const {
    return state == model::RunState::kCommitted;
  }
};

} // namespace scd::core
