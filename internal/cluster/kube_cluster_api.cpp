#include "kube_cluster_api.hpp"

#include <set>

#include "internal/cluster/kube_objects.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace releaselog::cluster {

namespace {

constexpr char kSubstitutePrefix[]  = "rollout.kuberik.com/substitute.";
constexpr char kSubstituteSuffix[]  = ".from";
constexpr char kRolloutAnnotation[] = "rollout.kuberik.com/rollout";
constexpr char kOciRepositoryKind[] = "OCIRepository";

const ApiResource kKustomizations{"kustomize.toolkit.fluxcd.io", "v1", "kustomizations"};
const ApiResource kOciRepositories{"source.toolkit.fluxcd.io", "v1beta2", "ocirepositories"};
const ApiResource kReplicaSets{"apps", "v1", "replicasets"};

std::string PodsPath(const std::string& namespace_) {
  return "/api/v1/namespaces/" + namespace_ + "/pods";
}

bool HasSuffix(std::string_view s, std::string_view suffix) {
  return s.size() >= suffix.size() && s.substr(s.size() - suffix.size()) == suffix;
}

bool TakesSubstitutionsFrom(const DescriptorCandidate& candidate, const std::string& release_name) {
  for (const auto& [key, value] : candidate.annotations) {
    if (key.rfind(kSubstitutePrefix, 0) == 0 && HasSuffix(key, kSubstituteSuffix) && value == release_name) {
      return true;
    }
  }
  return false;
}

std::vector<model::ResourceObject> DecodeItems(const google::protobuf::Struct& list) {
  std::vector<model::ResourceObject> out;
  for (const auto* item : ListItems(list)) {
    out.push_back(DecodeResourceObject(*item));
  }
  return out;
}

} // namespace

// ------------------------------------------------------------------
// ApiResource
// ------------------------------------------------------------------

std::string ApiResource::CollectionPath(const std::string& namespace_) const {
  std::string path = group.empty() ? "/api/" + version : "/apis/" + group + "/" + version;
  return path + "/namespaces/" + namespace_ + "/" + resource;
}

// ------------------------------------------------------------------
// KubeClusterApi
// ------------------------------------------------------------------

KubeClusterApi::KubeClusterApi(std::shared_ptr<KubeClient> client, ApiResource release_test_api)
    : client_(std::move(client)), release_test_api_(std::move(release_test_api)) {
}

std::vector<model::Pod> KubeClusterApi::GetPods(const std::string& namespace_, const model::LabelSelector& selector) {
  QueryParams query;
  if (!selector.Empty()) {
    query.emplace_back("labelSelector", selector.ToString());
  }

  auto                    list = client_->GetJson(PodsPath(namespace_), query);
  std::vector<model::Pod> pods;
  for (const auto* item : ListItems(list)) {
    pods.push_back(DecodePod(*item));
  }
  return pods;
}

void KubeClusterApi::StreamContainerLogs(const std::string& namespace_, const std::string& pod, const std::string& container,
                                         const LogStreamOptions& options, const util::CancellationScope& scope, const LineHandler& on_line) {
  QueryParams query;
  if (!container.empty()) query.emplace_back("container", container);
  if (options.follow) query.emplace_back("follow", "true");
  if (options.timestamps) query.emplace_back("timestamps", "true");
  if (options.since_millis) {
    // the API rounds sinceTime down to whole seconds
    query.emplace_back("sinceTime", util::FormatRfc3339(*options.since_millis));
  }
  if (options.tail_lines) {
    query.emplace_back("tailLines", std::to_string(*options.tail_lines));
  }

  client_->StreamLines(PodsPath(namespace_) + "/" + pod + "/log", query, scope, on_line);
}

std::vector<model::Descriptor> KubeClusterApi::GetDescriptorsForRelease(const releaselog::v1::ReleaseRef& release) {
  const auto kustomizations = client_->GetJson(kKustomizations.CollectionPath(release.namespace_()));
  const auto repositories   = client_->GetJson(kOciRepositories.CollectionPath(release.namespace_()));

  std::set<std::string> release_sources;
  for (const auto* repo : ListItems(repositories)) {
    auto object = DecodeResourceObject(*repo);
    auto it     = object.annotations.find(kRolloutAnnotation);
    if (it != object.annotations.end() && it->second == release.name()) {
      release_sources.insert(object.name);
    }
  }

  std::vector<model::Descriptor> out;
  for (const auto* item : ListItems(kustomizations)) {
    auto candidate = DecodeDescriptorCandidate(*item);

    const bool from_source = candidate.source_kind == kOciRepositoryKind && !candidate.source_name.empty() &&
                             release_sources.count(candidate.source_name) > 0;
    if (TakesSubstitutionsFrom(candidate, release.name()) || from_source) {
      out.push_back(std::move(candidate.descriptor));
    }
  }

  RELEASELOG_LOG_DEBUG("descriptors resolved", {observability::StringField("release", release.namespace_() + "/" + release.name()),
                                                observability::IntField("count", static_cast<int64_t>(out.size()))});
  return out;
}

std::vector<model::ManagedResource> KubeClusterApi::GetManagedResourcesForDescriptor(const model::Descriptor& descriptor) {
  const auto kustomization = client_->GetJson(kKustomizations.CollectionPath(descriptor.namespace_) + "/" + descriptor.name);
  auto       resources     = DecodeInventory(kustomization);

  for (auto& resource : resources) {
    const auto path = ObjectPathFor(resource);
    if (path.empty()) continue;

    try {
      resource.object = DecodeResourceObject(client_->GetJson(path));
    } catch (const util::NotFound&) {
      // inventory can trail deletions
      RELEASELOG_LOG_DEBUG("managed resource gone", {observability::StringField("kind", resource.group_version_kind),
                                                     observability::StringField("name", resource.namespace_ + "/" + resource.name)});
    }
  }
  return resources;
}

std::vector<model::ResourceObject> KubeClusterApi::ListWorkloadGenerations(const std::string& namespace_) {
  return DecodeItems(client_->GetJson(kReplicaSets.CollectionPath(namespace_)));
}

std::vector<model::ResourceObject> KubeClusterApi::ListReleaseTests(const std::string& namespace_) {
  return DecodeItems(client_->GetJson(release_test_api_.CollectionPath(namespace_)));
}

std::string KubeClusterApi::ObjectPathFor(const model::ManagedResource& resource) const {
  const auto& gvk = resource.group_version_kind;
  const auto  ns  = resource.namespace_;
  if (ns.empty()) return {};

  if (gvk == "apps/v1/Deployment") {
    return ApiResource{"apps", "v1", "deployments"}.CollectionPath(ns) + "/" + resource.name;
  }
  if (gvk == "batch/v1/Job") {
    return ApiResource{"batch", "v1", "jobs"}.CollectionPath(ns) + "/" + resource.name;
  }

  const auto last_slash = gvk.rfind('/');
  const auto first      = gvk.find('/');
  if (last_slash == std::string::npos || first == last_slash) return {};

  const auto group = gvk.substr(0, first);
  const auto kind  = gvk.substr(last_slash + 1);
  if (group == release_test_api_.group && PluralForKind(kind) == release_test_api_.resource) {
    return ApiResource{group, gvk.substr(first + 1, last_slash - first - 1), release_test_api_.resource}.CollectionPath(ns) + "/" + resource.name;
  }
  return {};
}

// ------------------------------------------------------------------
// KubeReleaseMetadata
// ------------------------------------------------------------------

KubeReleaseMetadata::KubeReleaseMetadata(std::shared_ptr<KubeClient> client, ApiResource release_api)
    : client_(std::move(client)), release_api_(std::move(release_api)) {
}

std::string KubeReleaseMetadata::GetWantedRevision(const releaselog::v1::ReleaseRef& release) {
  return DecodeWantedRevision(client_->GetJson(release_api_.CollectionPath(release.namespace_()) + "/" + release.name()));
}

} // namespace releaselog::cluster
