#include "internal/engine/log_stream_engine.hpp"

#include <cassert>
#include <functional>
#include <iostream>
#include <map>
#include <memory>
#include <set>
#include <string>

#include "fake_cluster.hpp"

namespace {

using releaselog::engine::EngineOptions;
using releaselog::engine::LogStreamEngine;
using releaselog::model::ResourceObject;
using releaselog::stream::PopStatus;
using releaselog::testing::FakeCluster;
using releaselog::testing::MakeDeployment;
using releaselog::testing::MakePod;
using releaselog::testing::MakeRelease;
using releaselog::testing::MakeReplicaSet;
using releaselog::testing::Manage;
using releaselog::v1::StreamEvent;

using SteadyClock = std::chrono::steady_clock;

std::shared_ptr<FakeCluster> BuildCluster() {
  auto cluster = std::make_shared<FakeCluster>();
  cluster->AddDescriptor({"shop", "web", {}}, {Manage(MakeDeployment("shop", "web", {{"app", "web"}}))});
  cluster->SetGenerations({MakeReplicaSet("shop", "web-h1", "web", "h1", {})});

  ResourceObject smoke;
  smoke.kind         = "RolloutTest";
  smoke.namespace_   = "shop";
  smoke.name         = "smoke";
  smoke.release_name = "web";
  smoke.job_name     = "smoke-1";
  cluster->SetReleaseTests({smoke});

  cluster->AddPod(MakePod("shop", "p1", {{"pod-template-hash", "h1"}}, {"app"}));
  cluster->AddPod(MakePod("shop", "p2", {{"pod-template-hash", "h1"}}, {"app"}));
  cluster->AddPod(MakePod("shop", "p3", {{"batch.kubernetes.io/job-name", "smoke-1"}}, {"test"}));

  cluster->AppendLine("p1", "app", "2024-03-01T12:00:00.000Z hello from p1");
  cluster->AppendLine("p3", "test", "2024-03-01T12:00:01.000Z test passed");
  return cluster;
}

EngineOptions FastOptions() {
  EngineOptions options;
  options.snapshot_interval                   = std::chrono::milliseconds(100);
  options.shutdown_timeout                    = std::chrono::seconds(5);
  options.reconciler.interval                 = std::chrono::milliseconds(100);
  options.reconciler.supervisor.poll_interval = std::chrono::milliseconds(20);
  return options;
}

// Reads until `done` holds or `timeout` passes; returns whether it held.
bool ReadUntil(LogStreamEngine& engine, std::chrono::milliseconds timeout, const std::function<bool(const StreamEvent&)>& done) {
  const auto  deadline = SteadyClock::now() + timeout;
  StreamEvent event;
  while (SteadyClock::now() < deadline) {
    if (engine.events()->PopFor(std::chrono::milliseconds(20), &event) != PopStatus::kEvent) continue;
    if (done(event)) return true;
  }
  return false;
}

void TestPodsAndLogsOfEveryTarget() {
  auto            cluster = BuildCluster();
  LogStreamEngine engine(MakeRelease("shop", "web"), cluster, cluster, FastOptions());
  const auto      start = SteadyClock::now();
  engine.Start();

  std::map<std::string, releaselog::v1::SourceType> pods;
  std::map<std::string, releaselog::v1::SourceType> logs;

  const bool complete = ReadUntil(engine, std::chrono::milliseconds(2000), [&](const StreamEvent& event) {
    if (event.has_pods()) {
      pods.clear();
      for (const auto& pod : event.pods().pods()) pods[pod.name()] = pod.type();
    }
    if (event.has_log()) logs[event.log().text()] = event.log().source_type();
    return pods.size() == 3 && logs.size() == 2;
  });
  assert(complete);
  assert(SteadyClock::now() - start < std::chrono::seconds(2));

  assert(pods.at("p1") == releaselog::v1::SOURCE_TYPE_WORKLOAD);
  assert(pods.at("p2") == releaselog::v1::SOURCE_TYPE_WORKLOAD);
  assert(pods.at("p3") == releaselog::v1::SOURCE_TYPE_JOB);
  assert(logs.at("hello from p1") == releaselog::v1::SOURCE_TYPE_WORKLOAD);
  assert(logs.at("test passed") == releaselog::v1::SOURCE_TYPE_JOB);

  engine.Stop();
}

void TestJobFilter() {
  auto cluster              = BuildCluster();
  auto options              = FastOptions();
  options.reconciler.filter = releaselog::v1::SOURCE_TYPE_JOB;
  LogStreamEngine engine(MakeRelease("shop", "web"), cluster, cluster, options);
  engine.Start();

  assert((engine.reconciler()->ActiveTargetIds() == std::vector<std::string>{"job/shop/smoke-1"}));

  std::set<std::string> pods;
  assert(ReadUntil(engine, std::chrono::milliseconds(2000), [&](const StreamEvent& event) {
    if (!event.has_pods()) return false;
    for (const auto& pod : event.pods().pods()) pods.insert(pod.name());
    return true;
  }));
  assert((pods == std::set<std::string>{"p3"}));

  engine.Stop();
}

void TestStopClosesFeedAfterDrain() {
  auto            cluster = BuildCluster();
  LogStreamEngine engine(MakeRelease("shop", "web"), cluster, cluster, FastOptions());
  engine.Start();
  assert(engine.SendKeepalive());

  const auto start = SteadyClock::now();
  engine.Stop();
  assert(SteadyClock::now() - start < std::chrono::seconds(2));
  assert(engine.events()->IsClosed());
  assert(engine.roster()->Snapshot().empty());

  bool        saw_ping = false;
  StreamEvent event;
  while (engine.events()->PopFor(std::chrono::milliseconds(10), &event) == PopStatus::kEvent) {
    saw_ping = saw_ping || event.has_ping();
  }
  assert(saw_ping);
  assert(engine.events()->PopFor(std::chrono::milliseconds(10), &event) == PopStatus::kClosed);

  // idempotent; nothing is pushed after close
  engine.Stop();
  assert(!engine.SendKeepalive());
}

void TestUnreadableReleaseRecovers() {
  auto cluster = BuildCluster();
  cluster->FailRevision(true);

  LogStreamEngine engine(MakeRelease("shop", "web"), cluster, cluster, FastOptions());
  engine.Start();
  assert(engine.reconciler()->ActiveTargetIds().empty());

  // the first snapshot is published even with nothing to follow
  StreamEvent event;
  assert(engine.events()->PopFor(std::chrono::milliseconds(500), &event) == PopStatus::kEvent);
  assert(event.has_pods() && event.pods().pods_size() == 0);

  cluster->FailRevision(false);
  assert(ReadUntil(engine, std::chrono::milliseconds(2000), [](const StreamEvent& e) { return e.has_pods() && e.pods().pods_size() == 3; }));

  engine.Stop();
}

} // namespace

int main() {
  TestPodsAndLogsOfEveryTarget();
  TestJobFilter();
  TestStopClosesFeedAfterDrain();
  TestUnreadableReleaseRecovers();

  std::cout << "log_stream_engine_test: pass\n";
  return 0;
}
