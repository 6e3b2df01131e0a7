#include "internal/discovery/target_resolver.hpp"

#include <algorithm>
#include <cassert>
#include <iostream>
#include <memory>
#include <set>

#include "fake_cluster.hpp"
#include "internal/util/errors.hpp"

namespace {

using releaselog::discovery::TargetResolver;
using releaselog::model::ResourceObject;
using releaselog::model::Target;
using releaselog::testing::FakeCluster;
using releaselog::testing::MakeDeployment;
using releaselog::testing::MakeRelease;
using releaselog::testing::MakeReplicaSet;
using releaselog::testing::Manage;

ResourceObject MakeReleaseTest(const std::string& name, const std::string& release_name, const std::string& app, const std::string& job) {
  ResourceObject test;
  test.api_version  = "kuberik.com/v1alpha1";
  test.kind         = "RolloutTest";
  test.namespace_   = "shop";
  test.name         = name;
  test.release_name = release_name;
  test.job_name     = job;
  if (!app.empty()) test.labels["app"] = app;
  return test;
}

std::shared_ptr<FakeCluster> BuildCluster() {
  auto cluster = std::make_shared<FakeCluster>();
  cluster->SetRevision("1.2.3");

  ResourceObject migrate;
  migrate.api_version = "batch/v1";
  migrate.kind        = "Job";
  migrate.namespace_  = "shop";
  migrate.name        = "migrate";

  releaselog::model::ManagedResource config_map;
  config_map.group_version_kind = "/v1/ConfigMap";
  config_map.namespace_         = "shop";
  config_map.name               = "settings";

  cluster->AddDescriptor({"shop", "broken", {}}, {});
  cluster->FailDescriptor("broken");
  cluster->AddDescriptor({"shop", "web", {{"VERSION", "1.2.3"}}},
                         {Manage(MakeDeployment("shop", "web", {{"app", "web"}})), config_map, Manage(migrate),
                          Manage(MakeReleaseTest("smoke", "web", "", "smoke-1"))});

  auto adopted                   = MakeReplicaSet("shop", "web-ccc", "", "ccc", {"registry/web:0.0.1"});
  adopted.labels["app"]          = "web";
  adopted.annotations["version"] = "1.2.3";

  cluster->SetGenerations({
      MakeReplicaSet("shop", "web-aaa", "web", "aaa", {"registry/web:${VERSION}"}),
      MakeReplicaSet("shop", "web-bbb", "web", "bbb", {"registry/web:1.2.2"}),
      adopted,
      MakeReplicaSet("shop", "other-ddd", "other", "ddd", {"registry/other:1.2.3"}),
  });

  cluster->SetReleaseTests({
      MakeReleaseTest("smoke", "web", "", "smoke-1"),
      MakeReleaseTest("loose", "other", "web", "loose-1"),
      MakeReleaseTest("billing", "billing", "billing", "billing-1"),
      MakeReleaseTest("pending", "web", "", ""),
  });
  return cluster;
}

std::set<std::string> Ids(const std::vector<Target>& targets) {
  std::set<std::string> ids;
  for (const auto& t : targets) ids.insert(t.id);
  return ids;
}

const Target& Find(const std::vector<Target>& targets, const std::string& id) {
  auto it = std::find_if(targets.begin(), targets.end(), [&](const Target& t) { return t.id == id; });
  assert(it != targets.end());
  return *it;
}

void TestResolvesWorkloadsAndJobs() {
  auto           cluster = BuildCluster();
  TargetResolver resolver(cluster, cluster);

  const auto targets = resolver.Resolve(MakeRelease("shop", "web"));

  // the failing descriptor costs nothing but its own targets; duplicates collapse
  assert(targets.size() == 5);
  assert((Ids(targets) == std::set<std::string>{"rs/shop/web-aaa", "rs/shop/web-ccc", "job/shop/migrate", "job/shop/smoke-1", "job/shop/loose-1"}));

  const auto& rs = Find(targets, "rs/shop/web-aaa");
  assert(rs.kind == releaselog::v1::SOURCE_TYPE_WORKLOAD);
  assert(rs.namespace_ == "shop");
  assert(rs.selector.ToString() == "pod-template-hash=aaa");
  assert(!rs.container_hint);

  const auto& job = Find(targets, "job/shop/smoke-1");
  assert(job.kind == releaselog::v1::SOURCE_TYPE_JOB);
  assert(job.selector.ToString() == "batch.kubernetes.io/job-name=smoke-1");
}

void TestSourceTypeFilter() {
  auto           cluster = BuildCluster();
  TargetResolver resolver(cluster, cluster);

  const auto workloads = resolver.Resolve(MakeRelease("shop", "web"), releaselog::v1::SOURCE_TYPE_WORKLOAD);
  assert((Ids(workloads) == std::set<std::string>{"rs/shop/web-aaa", "rs/shop/web-ccc"}));

  const auto jobs = resolver.Resolve(MakeRelease("shop", "web"), releaselog::v1::SOURCE_TYPE_JOB);
  assert((Ids(jobs) == std::set<std::string>{"job/shop/migrate", "job/shop/smoke-1", "job/shop/loose-1"}));
}

void TestEmptyRevisionKeepsEveryOwnedGeneration() {
  auto cluster = BuildCluster();
  cluster->SetRevision("");
  TargetResolver resolver(cluster, cluster);

  const auto workloads = resolver.Resolve(MakeRelease("shop", "web"), releaselog::v1::SOURCE_TYPE_WORKLOAD);
  assert((Ids(workloads) == std::set<std::string>{"rs/shop/web-aaa", "rs/shop/web-bbb", "rs/shop/web-ccc"}));
}

void TestReleaseReadFailurePropagates() {
  auto cluster = BuildCluster();
  cluster->FailRevision(true);
  TargetResolver resolver(cluster, cluster);

  bool threw = false;
  try {
    (void)resolver.Resolve(MakeRelease("shop", "web"));
  } catch (const releaselog::util::ClusterError& e) {
    threw = e.http_status() == 503;
  }
  assert(threw);
}

void TestUnknownReleaseResolvesToNothing() {
  auto           cluster = BuildCluster();
  TargetResolver resolver(cluster, cluster);

  assert(resolver.Resolve(MakeRelease("elsewhere", "web")).empty());
}

void TestHelpers() {
  using namespace releaselog::discovery;

  assert(ExpandSubstitutions("img:${A}-$(A)-${B}", {{"A", "1"}}) == "img:1-1-${B}");
  assert(ExpandSubstitutions("no vars", {{"A", "1"}}) == "no vars");

  auto workload        = MakeDeployment("shop", "web", {});
  auto orphan          = MakeReplicaSet("shop", "web-x", "", "x", {});
  orphan.labels["app"] = "web";
  assert(!BelongsToWorkload(orphan, workload));

  workload.selector.reset();
  assert(!BelongsToWorkload(orphan, workload));
  assert(BelongsToWorkload(MakeReplicaSet("shop", "web-y", "web", "y", {}), workload));

  auto labelled = MakeReplicaSet("shop", "web-z", "web", "z", {});
  labelled.labels["app.kubernetes.io/version"] = "v2.0.0";
  assert(MatchesRevision(labelled, "v2.0.0", {}));
  assert(MatchesRevision(labelled, "", {}));
  assert(!MatchesRevision(labelled, "v3", {}));
  assert(MatchesRevision(labelled, "pod-template", {}));

  auto test = MakeReleaseTest("t", "web-app", "", "j");
  assert(ReleaseTestMatches(test, "web-app"));
  assert(!ReleaseTestMatches(test, "web"));
  test.labels["app"] = "web";
  assert(ReleaseTestMatches(test, "hello-web-app"));

  const auto job = MakeJobTarget("shop", "smoke-1");
  assert(job.id == "job/shop/smoke-1");
  assert(job.selector.Matches({{"batch.kubernetes.io/job-name", "smoke-1"}}));
}

} // namespace

int main() {
  TestResolvesWorkloadsAndJobs();
  TestSourceTypeFilter();
  TestEmptyRevisionKeepsEveryOwnedGeneration();
  TestReleaseReadFailurePropagates();
  TestUnknownReleaseResolvesToNothing();
  TestHelpers();

  std::cout << "target_resolver_test: pass\n";
  return 0;
}
