#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "internal/model/cluster_objects.hpp"
#include "internal/model/label_selector.hpp"
#include "internal/util/cancellation.hpp"
#include "releaselog/v1/types.pb.h"

namespace releaselog::cluster {

struct LogStreamOptions {
  bool follow     = true;
  bool timestamps = true;

  // Mutually exclusive in practice: the tailer sends one or the other.
  std::optional<int64_t>  since_millis;
  std::optional<uint32_t> tail_lines;
};

using LineHandler = std::function<void(std::string_view line)>;

/*
  Cluster API collaborator.

  Reliable-but-fallible: every call may throw util::ClusterError (or
  util::NotFound). Implementations must be safe for concurrent use; the
  engine calls them from reconciler, supervisor and tailer threads at once.
*/
class ClusterApi {
 public:
  virtual ~ClusterApi() = default;

  // ------------------------------------------------------------------
  // Pods and logs
  // ------------------------------------------------------------------

  virtual std::vector<model::Pod> GetPods(const std::string& namespace_, const model::LabelSelector& selector) = 0;

  /*
    Opens a log read for one container and hands every complete line to
    `on_line` until the stream ends or `scope` is cancelled.

    Throws when the stream cannot be opened. Cancellation and natural end
    both return normally.
  */
  virtual void StreamContainerLogs(const std::string& namespace_, const std::string& pod, const std::string& container,
                                   const LogStreamOptions& options, const util::CancellationScope& scope, const LineHandler& on_line) = 0;

  // ------------------------------------------------------------------
  // Release inventory
  // ------------------------------------------------------------------

  virtual std::vector<model::Descriptor> GetDescriptorsForRelease(const releaselog::v1::ReleaseRef& release) = 0;

  virtual std::vector<model::ManagedResource> GetManagedResourcesForDescriptor(const model::Descriptor& descriptor) = 0;

  // Child generations of workloads (ReplicaSets) in a namespace.
  virtual std::vector<model::ResourceObject> ListWorkloadGenerations(const std::string& namespace_) = 0;

  // Release test resources in a namespace.
  virtual std::vector<model::ResourceObject> ListReleaseTests(const std::string& namespace_) = 0;
};

/*
  Release Metadata collaborator: the revision token a release currently
  wants. Empty when the release has not recorded one yet.
*/
class ReleaseMetadata {
 public:
  virtual ~ReleaseMetadata() = default;

  virtual std::string GetWantedRevision(const releaselog::v1::ReleaseRef& release) = 0;
};

} // namespace releaselog::cluster
