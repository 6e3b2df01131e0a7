#include "internal/discovery/discovery_reconciler.hpp"

#include <cassert>
#include <iostream>
#include <memory>
#include <vector>

#include "fake_cluster.hpp"

namespace {

using releaselog::discovery::DiscoveryReconciler;
using releaselog::discovery::PodRoster;
using releaselog::discovery::ReconcilerOptions;
using releaselog::discovery::TargetResolver;
using releaselog::stream::EventMultiplexer;
using releaselog::testing::FakeCluster;
using releaselog::testing::MakeDeployment;
using releaselog::testing::MakePod;
using releaselog::testing::MakeRelease;
using releaselog::testing::MakeReplicaSet;
using releaselog::testing::Manage;
using releaselog::testing::WaitUntil;
using releaselog::util::CancellationScope;

struct Fixture {
  std::shared_ptr<FakeCluster>       cluster = std::make_shared<FakeCluster>();
  std::shared_ptr<EventMultiplexer>  events  = std::make_shared<EventMultiplexer>(256);
  std::shared_ptr<PodRoster>         roster  = std::make_shared<PodRoster>();
  std::shared_ptr<CancellationScope> root    = CancellationScope::CreateRoot();

  Fixture() {
    cluster->AddDescriptor({"shop", "web", {}}, {Manage(MakeDeployment("shop", "web", {{"app", "web"}}))});
    cluster->SetGenerations({MakeReplicaSet("shop", "web-h1", "web", "h1", {})});
    cluster->AddPod(MakePod("shop", "p1", {{"pod-template-hash", "h1"}}, {"app"}));
    cluster->AddPod(MakePod("shop", "p2", {{"pod-template-hash", "h1"}}, {"app"}));
  }

  std::shared_ptr<DiscoveryReconciler> Start(std::chrono::milliseconds interval) {
    ReconcilerOptions options;
    options.interval                 = interval;
    options.supervisor.poll_interval = std::chrono::milliseconds(20);

    auto resolver   = std::make_shared<TargetResolver>(cluster, cluster);
    auto reconciler = std::make_shared<DiscoveryReconciler>(MakeRelease("shop", "web"), resolver, cluster, events, roster, options);
    reconciler->Start(root);
    return reconciler;
  }
};

void TestInitialTargetsStartBeforeStartReturns() {
  Fixture f;
  auto    reconciler = f.Start(std::chrono::hours(1));

  assert((reconciler->ActiveTargetIds() == std::vector<std::string>{"rs/shop/web-h1"}));
  assert(f.roster->Snapshot().size() == 2);
  assert(reconciler->SupervisorFor("rs/shop/web-h1"));
  assert(!reconciler->SupervisorFor("rs/shop/missing"));

  reconciler->Stop(std::chrono::steady_clock::now() + std::chrono::seconds(5));
}

void TestNewGenerationReplacesOldWithinOneInterval() {
  Fixture f;
  auto    reconciler = f.Start(std::chrono::milliseconds(100));
  auto    old        = reconciler->SupervisorFor("rs/shop/web-h1");
  assert(old && old->ActiveStreamKeys().size() == 2);

  f.cluster->AddPod(MakePod("shop", "p3", {{"pod-template-hash", "h2"}}, {"app"}));
  f.cluster->SetGenerations({MakeReplicaSet("shop", "web-h2", "web", "h2", {})});

  const auto changed = std::chrono::steady_clock::now();
  assert(WaitUntil([&] { return reconciler->ActiveTargetIds() == std::vector<std::string>{"rs/shop/web-h2"}; }));
  assert(std::chrono::steady_clock::now() - changed < std::chrono::milliseconds(1000));

  // the old generation's streams are gone and its pods left the roster
  assert(WaitUntil([&] { return old->ActiveStreamKeys().empty(); }));
  assert(WaitUntil([&] {
    const auto pods = f.roster->Snapshot();
    return pods.size() == 1 && pods[0].name() == "p3";
  }));

  reconciler->Stop(std::chrono::steady_clock::now() + std::chrono::seconds(5));
}

void TestFailedResolutionKeepsCurrentTargets() {
  Fixture f;
  auto    reconciler = f.Start(std::chrono::hours(1));

  f.cluster->FailRevision(true);
  reconciler->Reconcile();
  assert((reconciler->ActiveTargetIds() == std::vector<std::string>{"rs/shop/web-h1"}));

  f.cluster->FailRevision(false);
  f.cluster->SetGenerations({});
  reconciler->Reconcile();
  assert(reconciler->ActiveTargetIds().empty());
  assert(f.roster->Snapshot().empty());

  reconciler->Stop(std::chrono::steady_clock::now() + std::chrono::seconds(5));
}

void TestStopTearsEverythingDown() {
  Fixture f;
  auto    reconciler = f.Start(std::chrono::milliseconds(20));
  auto    supervisor = reconciler->SupervisorFor("rs/shop/web-h1");

  const auto start = std::chrono::steady_clock::now();
  reconciler->Stop(start + std::chrono::seconds(5));
  assert(std::chrono::steady_clock::now() - start < std::chrono::seconds(2));

  assert(reconciler->ActiveTargetIds().empty());
  assert(supervisor->ActiveStreamKeys().empty());
  assert(f.roster->Snapshot().empty());

  // late passes are ignored
  reconciler->Reconcile();
  assert(reconciler->ActiveTargetIds().empty());
}

} // namespace

int main() {
  TestInitialTargetsStartBeforeStartReturns();
  TestNewGenerationReplacesOldWithinOneInterval();
  TestFailedResolutionKeepsCurrentTargets();
  TestStopTearsEverythingDown();

  std::cout << "discovery_reconciler_test: pass\n";
  return 0;
}
