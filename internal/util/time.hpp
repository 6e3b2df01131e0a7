#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace releaselog::util {

/*
  Wall-clock helpers and RFC 3339 conversion for log timestamps.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

TimePoint Now();

int64_t ToUnixMillis(TimePoint tp);
int64_t NowMillis();

// Parses an RFC 3339 date-time ("2024-05-01T10:00:00.123456789Z",
// "...+02:00") into unix millis through protobuf's TimeUtil. Fractional
// digits beyond millis are truncated. Returns nullopt when the text is not
// a complete timestamp.
std::optional<int64_t> ParseRfc3339Millis(std::string_view text);

// Formats unix millis as RFC 3339 in UTC with second precision, the form the
// cluster log API accepts for sinceTime.
std::string FormatRfc3339(int64_t unix_millis);

} // namespace releaselog::util
