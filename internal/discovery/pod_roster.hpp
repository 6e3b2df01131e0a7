#pragma once

#include <map>
#include <mutex>
#include <string>
#include <vector>

#include "releaselog/v1/types.pb.h"

namespace releaselog::discovery {

/*
  Release-wide view of the pods currently being followed.

  Each Target contributes its own pod list; a pod stays in the snapshot
  while at least one Target still reports it.
*/
class PodRoster {
 public:
  void Update(const std::string& target_id, std::vector<releaselog::v1::PodInfo> pods);
  void Remove(const std::string& target_id);

  // Union of every contribution, unique by namespace/name, sorted.
  std::vector<releaselog::v1::PodInfo> Snapshot() const;

  std::size_t target_count() const;

 private:
  mutable std::mutex                                          mutex_;
  std::map<std::string, std::vector<releaselog::v1::PodInfo>> by_target_;
};

} // namespace releaselog::discovery
