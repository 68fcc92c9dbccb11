#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <string_view>

namespace scd::util {

/*
  Time utilities: single place to control clock source and the
  persisted timestamp representation.

  History boundaries are kept at microsecond resolution and persisted as
  fixed-width UTC text ("YYYY-MM-DD HH:MM:SS.ffffff"), so lexicographic
  order of the stored text equals time order.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = std::chrono::time_point<Clock, std::chrono::microseconds>;

// Smallest step between two distinct persisted timestamps.
constexpr std::chrono::microseconds kTick{1};

TimePoint Now();

// Sentinel valid_to of a current version row: 9999-12-31 23:59:59.999999.
TimePoint EndOfTime();

std::string FormatTimestamp(TimePoint tp);

// Accepts "YYYY-MM-DD HH:MM:SS", an optional ".f" to ".ffffff" fraction,
// 'T' instead of the space and a trailing 'Z'.
std::optional<TimePoint> ParseTimestamp(std::string_view text);

} // namespace scd::util
