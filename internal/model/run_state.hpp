#pragma once

#include <cstdint>
#include <string_view>

namespace scd::model {

/*
  Lifecycle of one pass.

    Idle -> Extracting -> Classifying -> Merging -> Committed
    any non-terminal state -> Aborted
*/
enum class RunState : std::uint8_t {
  kIdle        = 0,
  kExtracting  = 1,
  kClassifying = 2,
  kMerging     = 3,
  kCommitted   = 4,
  kAborted     = 5,
};

constexpr bool IsTerminal(RunState state) {
  return state == RunState::kCommitted || state == RunState::kAborted;
}

constexpr bool CanTransition(RunState from, RunState to) {
  if (IsTerminal(from)) {
    return false;
  }
  if (to == RunState::kAborted) {
    return true;
  }

  return static_cast<std::uint8_t>(to) == static_cast<std::uint8_t>(from) + 1;
}

constexpr std::string_view RunStateName(RunState state) {
  switch (state) {
    case RunState::kIdle:
      return "idle";
    case RunState::kExtracting:
      return "extracting";
    case RunState::kClassifying:
      return "classifying";
    case RunState::kMerging:
      return "merging";
    case RunState::kCommitted:
      return "committed";
    case RunState::kAborted:
      return "aborted";
  }
  return "unknown";
}

} // namespace scd::model
