#pragma once

#include <memory>
#include <string>
#include <vector>

#include "internal/cluster/cluster_api.hpp"

namespace releaselog::stream {

/*
  Point-in-time list of the pods matching a Target's selector.

  Read-only and without retries; a failure propagates to the caller, which
  treats it as a pass with no changes.
*/
class PodEnumerator {
 public:
  explicit PodEnumerator(std::shared_ptr<cluster::ClusterApi> api);

  std::vector<model::Pod> Enumerate(const std::string& namespace_, const model::LabelSelector& selector) const;

 private:
  std::shared_ptr<cluster::ClusterApi> api_;
};

} // namespace releaselog::stream
