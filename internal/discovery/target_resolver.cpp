#include "target_resolver.hpp"

#include <set>

#include "internal/observability/logging.hpp"
#include "internal/observability/metrics.hpp"

namespace releaselog::discovery {

namespace {

constexpr char kDeploymentGvk[]   = "apps/v1/Deployment";
constexpr char kJobGvk[]          = "batch/v1/Job";
constexpr char kReleaseTestKind[] = "RolloutTest";

void ReplaceAll(std::string& text, const std::string& from, const std::string& to) {
  if (from.empty()) return;
  for (auto pos = text.find(from); pos != std::string::npos; pos = text.find(from, pos + to.size())) {
    text.replace(pos, from.size(), to);
  }
}

bool KindIs(const std::string& gvk, std::string_view kind) {
  const auto slash = gvk.rfind('/');
  return std::string_view(gvk).substr(slash == std::string::npos ? 0 : slash + 1) == kind;
}

std::string ReleaseKey(const releaselog::v1::ReleaseRef& release) {
  return release.namespace_() + "/" + release.name();
}

} // namespace

std::string ExpandSubstitutions(std::string text, const std::map<std::string, std::string>& substitutions) {
  if (text.find('$') == std::string::npos) return text;
  for (const auto& [key, value] : substitutions) {
    ReplaceAll(text, "${" + key + "}", value);
    ReplaceAll(text, "$(" + key + ")", value);
  }
  return text;
}

bool BelongsToWorkload(const model::ResourceObject& generation, const model::ResourceObject& workload) {
  for (const auto& ref : generation.owner_references) {
    if (ref.kind == "Deployment" && ref.name == workload.name) return true;
  }
  if (!workload.selector || workload.selector->Empty()) return false;
  return workload.selector->Matches(generation.labels);
}

bool MatchesRevision(const model::ResourceObject& generation, const std::string& revision,
                     const std::map<std::string, std::string>& substitutions) {
  if (revision.empty()) return true;

  auto contains = [&](const std::string& text) { return ExpandSubstitutions(text, substitutions).find(revision) != std::string::npos; };

  for (const auto* map : {&generation.labels, &generation.annotations}) {
    for (const auto& [key, value] : *map) {
      if (contains(key) || contains(value)) return true;
    }
  }
  for (const auto& image : generation.container_images) {
    if (contains(image)) return true;
  }
  return false;
}

bool ReleaseTestMatches(const model::ResourceObject& test, std::string_view release_name) {
  if (test.release_name == release_name) return true;

  auto app = test.labels.find("app");
  return app != test.labels.end() && !app->second.empty() && release_name.find(app->second) != std::string_view::npos;
}

model::Target MakeJobTarget(const std::string& namespace_, const std::string& job_name) {
  model::Target target;
  target.id         = "job/" + namespace_ + "/" + job_name;
  target.namespace_ = namespace_;
  target.selector.AddMatchLabel(kJobNameLabel, job_name);
  target.kind = releaselog::v1::SOURCE_TYPE_JOB;
  return target;
}

// ------------------------------------------------------------------
// TargetResolver
// ------------------------------------------------------------------

TargetResolver::TargetResolver(std::shared_ptr<cluster::ClusterApi> api, std::shared_ptr<cluster::ReleaseMetadata> metadata)
    : api_(std::move(api)), metadata_(std::move(metadata)) {
}

std::vector<model::Target> TargetResolver::Resolve(const releaselog::v1::ReleaseRef& release, model::SourceType filter) const {
  const bool want_workloads = filter != releaselog::v1::SOURCE_TYPE_JOB;
  const bool want_jobs      = filter != releaselog::v1::SOURCE_TYPE_WORKLOAD;

  const auto revision    = metadata_->GetWantedRevision(release);
  const auto descriptors = api_->GetDescriptorsForRelease(release);

  std::vector<model::Target> found;
  for (const auto& descriptor : descriptors) {
    try {
      ResolveDescriptor(descriptor, revision, want_workloads, want_jobs, found);
    } catch (const std::exception& e) {
      observability::Metrics::Instance().RecordResolveFailure("descriptor");
      RELEASELOG_LOG_WARN("descriptor skipped", {observability::StringField("release", ReleaseKey(release)),
                                                 observability::StringField("descriptor", descriptor.namespace_ + "/" + descriptor.name),
                                                 observability::StringField("error", e.what())});
    }
  }

  if (want_jobs) {
    try {
      ResolveReleaseTests(release, found);
    } catch (const std::exception& e) {
      observability::Metrics::Instance().RecordResolveFailure("release_tests");
      RELEASELOG_LOG_WARN("release tests skipped", {observability::StringField("release", ReleaseKey(release)),
                                                    observability::StringField("error", e.what())});
    }
  }

  std::set<std::string>      seen;
  std::vector<model::Target> targets;
  for (auto& target : found) {
    if (seen.insert(target.id).second) targets.push_back(std::move(target));
  }

  RELEASELOG_LOG_DEBUG("release resolved", {observability::StringField("release", ReleaseKey(release)),
                                            observability::StringField("revision", revision),
                                            observability::IntField("descriptors", static_cast<int64_t>(descriptors.size())),
                                            observability::IntField("targets", static_cast<int64_t>(targets.size()))});
  return targets;
}

void TargetResolver::ResolveDescriptor(const model::Descriptor& descriptor, const std::string& revision, bool want_workloads, bool want_jobs,
                                       std::vector<model::Target>& out) const {
  for (const auto& resource : api_->GetManagedResourcesForDescriptor(descriptor)) {
    if (!resource.object) continue;

    if (resource.group_version_kind == kDeploymentGvk) {
      if (want_workloads) ResolveWorkload(*resource.object, descriptor, revision, out);
    } else if (resource.group_version_kind == kJobGvk) {
      if (want_jobs) out.push_back(MakeJobTarget(resource.object->namespace_, resource.object->name));
    } else if (KindIs(resource.group_version_kind, kReleaseTestKind)) {
      if (want_jobs && !resource.object->job_name.empty()) {
        out.push_back(MakeJobTarget(resource.object->namespace_, resource.object->job_name));
      }
    }
  }
}

void TargetResolver::ResolveWorkload(const model::ResourceObject& workload, const model::Descriptor& descriptor, const std::string& revision,
                                     std::vector<model::Target>& out) const {
  for (const auto& generation : api_->ListWorkloadGenerations(workload.namespace_)) {
    if (!BelongsToWorkload(generation, workload)) continue;
    if (!MatchesRevision(generation, revision, descriptor.substitutions)) continue;

    auto hash = generation.labels.find(kPodTemplateHashLabel);
    if (hash == generation.labels.end() || hash->second.empty()) continue;

    model::Target target;
    target.id         = "rs/" + generation.namespace_ + "/" + generation.name;
    target.namespace_ = generation.namespace_;
    target.selector.AddMatchLabel(kPodTemplateHashLabel, hash->second);
    target.kind = releaselog::v1::SOURCE_TYPE_WORKLOAD;
    out.push_back(std::move(target));
  }
}

void TargetResolver::ResolveReleaseTests(const releaselog::v1::ReleaseRef& release, std::vector<model::Target>& out) const {
  for (const auto& test : api_->ListReleaseTests(release.namespace_())) {
    if (!ReleaseTestMatches(test, release.name())) continue;
    if (test.job_name.empty()) continue;

    const auto& ns = test.namespace_.empty() ? release.namespace_() : test.namespace_;
    out.push_back(MakeJobTarget(ns, test.job_name));
  }
}

} // namespace releaselog::discovery
