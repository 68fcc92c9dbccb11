#pragma once

#include "internal/util/time.hpp"

namespace scd::model {

/*
  Per-pass context. Every row closed or opened in one pass carries
  as_of as its boundary, so a point-in-time query sees a consistent cut.
  Created by the orchestrator, passed explicitly, discarded after the pass.
*/
struct RunContext {
  util::TimePoint as_of{};
};

} // namespace scd::model
