#pragma once

#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "internal/cluster/cluster_api.hpp"
#include "internal/model/target.hpp"

namespace releaselog::discovery {

inline constexpr char kPodTemplateHashLabel[] = "pod-template-hash";
inline constexpr char kJobNameLabel[]         = "batch.kubernetes.io/job-name";

/*
  Computes the version-scoped Targets of a release.

  Walks release → descriptors → managed resources → workload generations
  and test jobs. One failing descriptor only costs its own Targets; a
  failure to read the release itself throws.
*/
class TargetResolver {
 public:
  TargetResolver(std::shared_ptr<cluster::ClusterApi> api, std::shared_ptr<cluster::ReleaseMetadata> metadata);

  // `filter` UNSPECIFIED yields both workload and job Targets.
  std::vector<model::Target> Resolve(const releaselog::v1::ReleaseRef& release,
                                     model::SourceType                 filter = releaselog::v1::SOURCE_TYPE_UNSPECIFIED) const;

 private:
  void ResolveDescriptor(const model::Descriptor& descriptor, const std::string& revision, bool want_workloads, bool want_jobs,
                         std::vector<model::Target>& out) const;

  void ResolveWorkload(const model::ResourceObject& workload, const model::Descriptor& descriptor, const std::string& revision,
                       std::vector<model::Target>& out) const;

  void ResolveReleaseTests(const releaselog::v1::ReleaseRef& release, std::vector<model::Target>& out) const;

  std::shared_ptr<cluster::ClusterApi>      api_;
  std::shared_ptr<cluster::ReleaseMetadata> metadata_;
};

// Replaces "${KEY}" and "$(KEY)" for every substitution.
std::string ExpandSubstitutions(std::string text, const std::map<std::string, std::string>& substitutions);

// Generation belongs to a workload by owner reference, or failing that by
// the workload's selector. A workload without a selector matches nothing.
bool BelongsToWorkload(const model::ResourceObject& generation, const model::ResourceObject& workload);

// Empty revision matches. Otherwise the revision must appear in a label or
// annotation key/value, or a container image, after substitution.
bool MatchesRevision(const model::ResourceObject& generation, const std::string& revision,
                     const std::map<std::string, std::string>& substitutions);

// A release test belongs to the release it names, or loosely to any
// release whose name contains the test's "app" label.
bool ReleaseTestMatches(const model::ResourceObject& test, std::string_view release_name);

model::Target MakeJobTarget(const std::string& namespace_, const std::string& job_name);

} // namespace releaselog::discovery
