#include "time.hpp"

#include "google/protobuf/util/time_util.h"

namespace releaselog::util {

using google::protobuf::util::TimeUtil;

TimePoint Now() {
  return Clock::now();
}

int64_t ToUnixMillis(TimePoint tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

int64_t NowMillis() {
  return ToUnixMillis(Now());
}

std::optional<int64_t> ParseRfc3339Millis(std::string_view text) {
  google::protobuf::Timestamp ts;
  if (!TimeUtil::FromString(std::string(text), &ts)) {
    return std::nullopt;
  }
  return TimeUtil::TimestampToMilliseconds(ts);
}

std::string FormatRfc3339(int64_t unix_millis) {
  const int64_t seconds = unix_millis >= 0 ? unix_millis / 1000 : (unix_millis - 999) / 1000;
  return TimeUtil::ToString(TimeUtil::SecondsToTimestamp(seconds));
}

} // namespace releaselog::util
