#include "internal/util/time.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <string>

namespace {

using scd::util::EndOfTime;
using scd::util::FormatTimestamp;
using scd::util::ParseTimestamp;
using scd::util::TimePoint;

void TestFormatIsFixedWidthUtc() {
  const TimePoint epoch{};
  assert(FormatTimestamp(epoch) == "1970-01-01 00:00:00.000000");

  const TimePoint later{std::chrono::microseconds{1'700'000'000'123'456}};
  assert(FormatTimestamp(later) == "2023-11-14 22:13:20.123456");
}

void TestEndOfTimeSentinel() {
  assert(FormatTimestamp(EndOfTime()) == "9999-12-31 23:59:59.999999");
  assert(ParseTimestamp("9999-12-31 23:59:59.999999") == EndOfTime());
}

void TestParseAcceptsIsoVariants() {
  const auto plain = ParseTimestamp("2024-02-29 12:30:45");
  assert(plain.has_value());
  assert(FormatTimestamp(*plain) == "2024-02-29 12:30:45.000000");

  const auto iso = ParseTimestamp("2024-02-29T12:30:45.5Z");
  assert(iso.has_value());
  assert(FormatTimestamp(*iso) == "2024-02-29 12:30:45.500000");
}

void TestParseRejectsMalformedText() {
  assert(!ParseTimestamp(""));
  assert(!ParseTimestamp("2023-02-29 00:00:00"));
  assert(!ParseTimestamp("2024-13-01 00:00:00"));
  assert(!ParseTimestamp("2024-01-01 24:00:00"));
  assert(!ParseTimestamp("2024-01-01 00:00:00."));
  assert(!ParseTimestamp("2024-01-01 00:00:00.1234567"));
  assert(!ParseTimestamp("2024-01-01 00:00:00 extra"));
}

void TestTextOrderMatchesTimeOrder() {
  const auto a = *ParseTimestamp("2024-01-01 09:59:59.999999");
  const auto b = a + scd::util::kTick;
  assert(b > a);
  assert(FormatTimestamp(a) < FormatTimestamp(b));
  assert(FormatTimestamp(b) == "2024-01-01 10:00:00.000000");
  assert(FormatTimestamp(b) < FormatTimestamp(EndOfTime()));
}

void TestCalendarEdges() {
  assert(ParseTimestamp("2000-02-29 00:00:00").has_value());
  assert(!ParseTimestamp("1900-02-29 00:00:00"));
  assert(!ParseTimestamp("2024-04-31 00:00:00"));
  assert(!ParseTimestamp("2024-01-00 00:00:00"));

  const TimePoint before_epoch{std::chrono::microseconds{-1}};
  assert(FormatTimestamp(before_epoch) == "1969-12-31 23:59:59.999999");
  assert(ParseTimestamp("1969-12-31 23:59:59.999999") == before_epoch);
}

} // namespace

int main() {
  TestFormatIsFixedWidthUtc();
  TestEndOfTimeSentinel();
  TestParseAcceptsIsoVariants();
  TestParseRejectsMalformedText();
  TestTextOrderMatchesTimeOrder();
  TestCalendarEdges();

  std::cout << "scd_unit_time: pass\n";
  return 0;
}
