#include "pod_roster.hpp"

namespace releaselog::discovery {

void PodRoster::Update(const std::string& target_id, std::vector<releaselog::v1::PodInfo> pods) {
  std::lock_guard lock(mutex_);
  by_target_[target_id] = std::move(pods);
}

void PodRoster::Remove(const std::string& target_id) {
  std::lock_guard lock(mutex_);
  by_target_.erase(target_id);
}

std::vector<releaselog::v1::PodInfo> PodRoster::Snapshot() const {
  std::map<std::string, releaselog::v1::PodInfo> unique;
  {
    std::lock_guard lock(mutex_);
    for (const auto& [id, pods] : by_target_) {
      for (const auto& pod : pods) {
        unique.emplace(pod.namespace_() + "/" + pod.name(), pod);
      }
    }
  }

  std::vector<releaselog::v1::PodInfo> out;
  out.reserve(unique.size());
  for (auto& [key, pod] : unique) {
    out.push_back(std::move(pod));
  }
  return out;
}

std::size_t PodRoster::target_count() const {
  std::lock_guard lock(mutex_);
  return by_target_.size();
}

} // namespace releaselog::discovery
