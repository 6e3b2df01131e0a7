#include "log_line_parser.hpp"

#include "internal/util/time.hpp"

namespace releaselog::stream {

ParsedLogLine ParseLogLine(std::string_view line, int64_t receipt_millis) {
  ParsedLogLine out;
  out.timestamp_millis = receipt_millis;
  out.text             = line;

  const auto space = line.find(' ');
  const auto token = line.substr(0, space);

  // shortest accepted form: "2006-01-02T15:04:05Z"
  if (token.size() < 20 || token[4] != '-' || token[10] != 'T') {
    return out;
  }

  auto millis = util::ParseRfc3339Millis(token);
  if (!millis) {
    return out;
  }

  out.timestamp_millis = *millis;
  out.has_timestamp    = true;
  out.text             = space == std::string_view::npos ? std::string_view{} : line.substr(space + 1);
  return out;
}

} // namespace releaselog::stream
