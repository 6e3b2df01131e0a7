#pragma once

#include <optional>
#include <string>
#include <string_view>

#include "internal/model/label_selector.hpp"
#include "releaselog/v1/types.pb.h"

namespace releaselog::model {

using SourceType = releaselog::v1::SourceType;

/*
  A version-scoped group of pods to tail.

  `id` derives from the concrete generation ("rs/<ns>/<replicaset>",
  "job/<ns>/<job>"), never from the release, so a new rollout iteration
  produces a new Target.
*/
struct Target {
  std::string                id;
  std::string                namespace_;
  LabelSelector              selector;
  SourceType                 kind = releaselog::v1::SOURCE_TYPE_WORKLOAD;
  std::optional<std::string> container_hint;
};

// "workload" / "job", the names used on the wire and in logs.
inline std::string_view SourceTypeName(SourceType type) {
  switch (type) {
    case releaselog::v1::SOURCE_TYPE_WORKLOAD:
      return "workload";
    case releaselog::v1::SOURCE_TYPE_JOB:
      return "job";
    default:
      return "unspecified";
  }
}

inline std::string MakeStreamKey(std::string_view pod, std::string_view container) {
  std::string key;
  key.reserve(pod.size() + container.size() + 1);
  key.append(pod).append("/").append(container);
  return key;
}

} // namespace releaselog::model
