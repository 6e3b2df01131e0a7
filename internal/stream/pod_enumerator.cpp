#include "pod_enumerator.hpp"

#include <algorithm>

namespace releaselog::stream {

PodEnumerator::PodEnumerator(std::shared_ptr<cluster::ClusterApi> api) : api_(std::move(api)) {
}

std::vector<model::Pod> PodEnumerator::Enumerate(const std::string& namespace_, const model::LabelSelector& selector) const {
  auto pods = api_->GetPods(namespace_, selector);

  // server-side filtering is not trusted to be exact
  pods.erase(std::remove_if(pods.begin(), pods.end(), [&](const model::Pod& pod) { return !selector.Matches(pod.labels); }), pods.end());

  for (auto& pod : pods) {
    if (pod.namespace_.empty()) pod.namespace_ = namespace_;
  }

  std::sort(pods.begin(), pods.end(), [](const model::Pod& a, const model::Pod& b) { return a.name < b.name; });
  pods.erase(std::unique(pods.begin(), pods.end(), [](const model::Pod& a, const model::Pod& b) { return a.name == b.name; }), pods.end());
  return pods;
}

} // namespace releaselog::stream
