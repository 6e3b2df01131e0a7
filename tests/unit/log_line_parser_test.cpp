#include "internal/stream/log_line_parser.hpp"

#include <cassert>
#include <iostream>

#include "internal/util/time.hpp"

namespace {

using releaselog::stream::ParseLogLine;
using releaselog::util::FormatRfc3339;
using releaselog::util::ParseRfc3339Millis;

void TestRfc3339Parsing() {
  assert(ParseRfc3339Millis("1970-01-01T00:00:00Z") == 0);
  assert(ParseRfc3339Millis("2024-03-01T12:00:00Z") == 1709294400000);
  assert(ParseRfc3339Millis("2024-03-01T12:00:00.123456789Z") == 1709294400123);
  assert(ParseRfc3339Millis("2024-03-01T12:00:00.5Z") == 1709294400500);
  assert(ParseRfc3339Millis("2024-03-01T14:30:00+02:30") == 1709294400000);
  assert(ParseRfc3339Millis("2024-03-01T09:00:00-03:00") == 1709294400000);
  assert(ParseRfc3339Millis("2024-03-01T13:00:00.999999999+01:00") == 1709294400999);

  assert(!ParseRfc3339Millis("2024-03-01 12:00:00Z"));
  assert(!ParseRfc3339Millis("2024-03-01T12:00:00"));
  assert(!ParseRfc3339Millis("2024-13-01T12:00:00Z"));
  assert(!ParseRfc3339Millis("2023-02-29T12:00:00Z"));
  assert(!ParseRfc3339Millis("2024-03-01T12:00:00.Z"));
  assert(!ParseRfc3339Millis("2024-03-01T12:00:00Zjunk"));
}

void TestRfc3339Formatting() {
  assert(FormatRfc3339(0) == "1970-01-01T00:00:00Z");
  assert(FormatRfc3339(1709294400999) == "2024-03-01T12:00:00Z");
  assert(FormatRfc3339(-1) == "1969-12-31T23:59:59Z");
  assert(ParseRfc3339Millis(FormatRfc3339(1709294400999)) == 1709294400000);
}

void TestTimestampedLine() {
  const auto parsed = ParseLogLine("2024-03-01T12:00:00.250000000Z GET /healthz 200", 42);
  assert(parsed.has_timestamp);
  assert(parsed.timestamp_millis == 1709294400250);
  assert(parsed.text == "GET /healthz 200");
}

void TestTimestampOnlyLine() {
  const auto parsed = ParseLogLine("2024-03-01T12:00:00Z", 42);
  assert(parsed.has_timestamp);
  assert(parsed.text.empty());
}

void TestUntimestampedLineUsesReceiptTime() {
  const auto parsed = ParseLogLine("panic: runtime error", 42);
  assert(!parsed.has_timestamp);
  assert(parsed.timestamp_millis == 42);
  assert(parsed.text == "panic: runtime error");

  const auto almost = ParseLogLine("2024-03-01T99:00:00Z not a time", 7);
  assert(!almost.has_timestamp);
  assert(almost.text == "2024-03-01T99:00:00Z not a time");
}

} // namespace

int main() {
  TestRfc3339Parsing();
  TestRfc3339Formatting();
  TestTimestampedLine();
  TestTimestampOnlyLine();
  TestUntimestampedLineUsesReceiptTime();

  std::cout << "log_line_parser_test: pass\n";
  return 0;
}
