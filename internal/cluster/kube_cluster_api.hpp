#pragma once

#include <memory>
#include <string>

#include "internal/cluster/cluster_api.hpp"
#include "internal/cluster/kube_client.hpp"

namespace releaselog::cluster {

// group/version/resource of a custom resource type.
struct ApiResource {
  std::string group;
  std::string version;
  std::string resource;

  std::string CollectionPath(const std::string& namespace_) const;
};

/*
  ClusterApi backed by the Kubernetes REST API.

  Descriptors are Flux Kustomizations in the release namespace that either
  take substitutions from the release ("rollout.kuberik.com/substitute.<VAR>.from")
  or build from an OCIRepository annotated with the release name
  ("rollout.kuberik.com/rollout").
*/
class KubeClusterApi final : public ClusterApi {
 public:
  KubeClusterApi(std::shared_ptr<KubeClient> client, ApiResource release_test_api);

  std::vector<model::Pod> GetPods(const std::string& namespace_, const model::LabelSelector& selector) override;

  void StreamContainerLogs(const std::string& namespace_, const std::string& pod, const std::string& container, const LogStreamOptions& options,
                           const util::CancellationScope& scope, const LineHandler& on_line) override;

  std::vector<model::Descriptor> GetDescriptorsForRelease(const releaselog::v1::ReleaseRef& release) override;

  std::vector<model::ManagedResource> GetManagedResourcesForDescriptor(const model::Descriptor& descriptor) override;

  std::vector<model::ResourceObject> ListWorkloadGenerations(const std::string& namespace_) override;

  std::vector<model::ResourceObject> ListReleaseTests(const std::string& namespace_) override;

 private:
  // Object path for a managed resource whose kind the resolver consumes;
  // empty for every other kind.
  std::string ObjectPathFor(const model::ManagedResource& resource) const;

  std::shared_ptr<KubeClient> client_;
  ApiResource                 release_test_api_;
};

/*
  Reads the wanted revision from the release resource's newest history entry.
*/
class KubeReleaseMetadata final : public ReleaseMetadata {
 public:
  KubeReleaseMetadata(std::shared_ptr<KubeClient> client, ApiResource release_api);

  std::string GetWantedRevision(const releaselog::v1::ReleaseRef& release) override;

 private:
  std::shared_ptr<KubeClient> client_;
  ApiResource                 release_api_;
};

} // namespace releaselog::cluster
