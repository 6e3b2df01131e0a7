#pragma once

#include <cstdint>
#include <string_view>

namespace releaselog::stream {

struct ParsedLogLine {
  int64_t          timestamp_millis = 0;
  std::string_view text;

  // false when the receipt time was used
  bool has_timestamp = false;
};

// Splits a "timestamps=true" log line into its leading RFC 3339 token and
// the message. Lines without a valid leading timestamp are kept intact and
// stamped with `receipt_millis`.
ParsedLogLine ParseLogLine(std::string_view line, int64_t receipt_millis);

} // namespace releaselog::stream
