#include "internal/stream/stream_supervisor.hpp"

#include <algorithm>
#include <cassert>
#include <iostream>
#include <memory>
#include <vector>

#include "fake_cluster.hpp"

namespace {

using releaselog::discovery::PodRoster;
using releaselog::model::LabelSelector;
using releaselog::model::Target;
using releaselog::stream::EventMultiplexer;
using releaselog::stream::StreamSupervisor;
using releaselog::stream::SupervisorOptions;
using releaselog::testing::FakeCluster;
using releaselog::testing::MakePod;
using releaselog::testing::WaitUntil;
using releaselog::util::CancellationScope;

constexpr int64_t kT0 = 1709294400000; // 2024-03-01T12:00:00Z

struct Fixture {
  std::shared_ptr<FakeCluster>       cluster = std::make_shared<FakeCluster>();
  std::shared_ptr<EventMultiplexer>  events  = std::make_shared<EventMultiplexer>(256);
  std::shared_ptr<PodRoster>         roster  = std::make_shared<PodRoster>();
  std::shared_ptr<CancellationScope> root    = CancellationScope::CreateRoot();

  std::shared_ptr<StreamSupervisor> Start(Target target) {
    SupervisorOptions options;
    // ticks are driven by the test
    options.poll_interval = std::chrono::hours(1);
    auto supervisor       = std::make_shared<StreamSupervisor>(std::move(target), cluster, events, roster, options);
    supervisor->Start(root);
    return supervisor;
  }

  std::vector<std::string> Texts() {
    std::vector<std::string>    out;
    releaselog::v1::StreamEvent event;
    while (events->PopFor(std::chrono::milliseconds(0), &event) == releaselog::stream::PopStatus::kEvent) {
      if (event.has_log()) out.push_back(event.log().pod() + "/" + event.log().container() + ":" + event.log().text());
    }
    return out;
  }
};

Target WorkloadTarget() {
  Target target;
  target.id         = "rs/shop/web-h1";
  target.namespace_ = "shop";
  target.selector   = LabelSelector::Parse("pod-template-hash=h1");
  target.kind       = releaselog::v1::SOURCE_TYPE_WORKLOAD;
  return target;
}

std::vector<std::string> Sorted(std::vector<std::string> v) {
  std::sort(v.begin(), v.end());
  return v;
}

void TestOneTailerPerContainer() {
  Fixture f;

  auto p1            = MakePod("shop", "p1", {{"pod-template-hash", "h1"}}, {"app", "sidecar"});
  p1.init_containers = {"migrate"};
  f.cluster->AddPod(p1);
  f.cluster->AddPod(MakePod("shop", "p2", {{"pod-template-hash", "h1"}}, {"app"}));
  f.cluster->AddPod(MakePod("shop", "p3", {{"pod-template-hash", "h2"}}, {"app"}));

  auto supervisor = f.Start(WorkloadTarget());
  assert((Sorted(supervisor->ActiveStreamKeys()) == std::vector<std::string>{"p1/app", "p1/migrate", "p1/sidecar", "p2/app"}));

  for (int i = 0; i < 5; ++i) supervisor->Tick();

  assert(supervisor->ActiveStreamKeys().size() == 4);
  assert(f.cluster->OpenCount("p1", "app") == 1);
  assert(f.cluster->OpenCount("p2", "app") == 1);
  assert(f.cluster->OpenCount("p3", "app") == 0);

  const auto pods = f.roster->Snapshot();
  assert(pods.size() == 2);
  assert(pods[0].name() == "p1" && pods[0].type() == releaselog::v1::SOURCE_TYPE_WORKLOAD);

  supervisor->Stop(std::chrono::steady_clock::now() + std::chrono::seconds(5));
  assert(supervisor->ActiveStreamKeys().empty());
}

void TestVanishedPodIsDroppedWithinOneTick() {
  Fixture f;
  f.cluster->AddPod(MakePod("shop", "p1", {{"pod-template-hash", "h1"}}, {"app"}));
  f.cluster->AddPod(MakePod("shop", "p2", {{"pod-template-hash", "h1"}}, {"app"}));

  auto supervisor = f.Start(WorkloadTarget());
  assert(supervisor->ActiveStreamKeys().size() == 2);

  f.cluster->RemovePod("shop", "p2");
  supervisor->Tick();

  assert((supervisor->ActiveStreamKeys() == std::vector<std::string>{"p1/app"}));
  const auto pods = f.roster->Snapshot();
  assert(pods.size() == 1 && pods[0].name() == "p1");

  supervisor->Stop(std::chrono::steady_clock::now() + std::chrono::seconds(5));
}

void TestReconnectResumesAfterCursor() {
  Fixture f;
  f.cluster->AddPod(MakePod("shop", "p1", {{"pod-template-hash", "h1"}}, {"app"}));
  f.cluster->AppendLine("p1", "app", "2024-03-01T12:00:00.100Z one");
  f.cluster->AppendLine("p1", "app", "2024-03-01T12:00:00.200Z two");

  auto supervisor = f.Start(WorkloadTarget());
  assert(WaitUntil([&] { return f.events->size() == 2; }));

  f.cluster->BreakStream("p1", "app");
  assert(WaitUntil([&] { return supervisor->ActiveStreamKeys().empty(); }));
  f.cluster->AppendLine("p1", "app", "2024-03-01T12:00:00.300Z three");

  supervisor->Tick();
  assert(supervisor->CursorFor("p1/app") == kT0 + 200);
  assert(WaitUntil([&] { return f.events->size() == 3; }));

  assert((f.Texts() == std::vector<std::string>{"p1/app:one", "p1/app:two", "p1/app:three"}));

  const auto opened = f.cluster->opened();
  assert(opened.size() == 2);
  assert(opened[1].options.since_millis == kT0 + 200);
  assert(!opened[1].options.tail_lines);

  supervisor->Stop(std::chrono::steady_clock::now() + std::chrono::seconds(5));
}

void TestFinishedPodIsNotReopened() {
  Fixture f;
  f.cluster->AddPod(MakePod("shop", "job-1", {{"pod-template-hash", "h1"}}, {"app"}));

  auto supervisor = f.Start(WorkloadTarget());
  f.cluster->AddPod(MakePod("shop", "job-1", {{"pod-template-hash", "h1"}}, {"app"}, "Succeeded"));
  f.cluster->BreakStream("job-1", "app");
  assert(WaitUntil([&] { return supervisor->ActiveStreamKeys().empty(); }));

  supervisor->Tick();
  supervisor->Tick();
  assert(f.cluster->OpenCount("job-1", "app") == 1);
  assert(supervisor->ActiveStreamKeys().empty());

  // still listed while the pod exists
  assert(f.roster->Snapshot().size() == 1);
  supervisor->Stop(std::chrono::steady_clock::now() + std::chrono::seconds(5));
}

void TestTerminatedInitContainerIsReadOnce() {
  Fixture f;
  auto p1                  = MakePod("shop", "p1", {{"pod-template-hash", "h1"}}, {"app"});
  p1.init_containers       = {"migrate"};
  p1.terminated_containers = {"migrate"};
  f.cluster->AddPod(p1);
  f.cluster->AppendLine("p1", "migrate", "2024-03-01T12:00:00.100Z schema up to date");

  auto supervisor = f.Start(WorkloadTarget());
  assert(WaitUntil([&] { return supervisor->ActiveStreamKeys() == std::vector<std::string>{"p1/app"}; }));

  for (int i = 0; i < 5; ++i) supervisor->Tick();

  assert(f.cluster->OpenCount("p1", "migrate") == 1);
  assert(f.cluster->OpenCount("p1", "app") == 1);
  assert((f.Texts() == std::vector<std::string>{"p1/migrate:schema up to date"}));

  // a restarted container is followed again after its last line
  p1.terminated_containers.clear();
  f.cluster->AddPod(p1);
  f.cluster->AppendLine("p1", "migrate", "2024-03-01T12:00:00.200Z rerun");
  supervisor->Tick();

  assert(f.cluster->OpenCount("p1", "migrate") == 2);
  assert(supervisor->CursorFor("p1/migrate") == kT0 + 100);
  assert(WaitUntil([&] { return f.events->size() == 1; }));
  assert((f.Texts() == std::vector<std::string>{"p1/migrate:rerun"}));

  supervisor->Stop(std::chrono::steady_clock::now() + std::chrono::seconds(5));
}

void TestRepeatedListingEntriesShareOneTailer() {
  Fixture f;
  auto p1            = MakePod("shop", "p1", {{"pod-template-hash", "h1"}}, {"app", "sidecar"});
  p1.init_containers = {"migrate"};
  f.cluster->AddPod(p1);
  f.cluster->AddPod(MakePod("shop", "p2", {{"pod-template-hash", "h1"}}, {"app"}));
  f.cluster->DuplicatePodListing(true);

  auto supervisor = f.Start(WorkloadTarget());
  for (int i = 0; i < 3; ++i) supervisor->Tick();

  assert((Sorted(supervisor->ActiveStreamKeys()) == std::vector<std::string>{"p1/app", "p1/migrate", "p1/sidecar", "p2/app"}));
  assert(f.cluster->OpenCount("p1", "app") == 1);
  assert(f.cluster->OpenCount("p1", "sidecar") == 1);
  assert(f.cluster->OpenCount("p1", "migrate") == 1);
  assert(f.cluster->OpenCount("p2", "app") == 1);
  assert(f.cluster->opened().size() == 4);

  const auto pods = f.roster->Snapshot();
  assert(pods.size() == 2);
  assert(pods[0].name() == "p1" && pods[1].name() == "p2");

  supervisor->Stop(std::chrono::steady_clock::now() + std::chrono::seconds(5));
}

void TestContainerHintLimitsStreams() {
  Fixture f;
  f.cluster->AddPod(MakePod("shop", "p1", {{"pod-template-hash", "h1"}}, {"app", "sidecar"}));

  auto target           = WorkloadTarget();
  target.container_hint = "sidecar";
  auto supervisor       = f.Start(target);

  assert((supervisor->ActiveStreamKeys() == std::vector<std::string>{"p1/sidecar"}));
  supervisor->Stop(std::chrono::steady_clock::now() + std::chrono::seconds(5));
}

void TestEnumerationFailureKeepsCurrentStreams() {
  Fixture f;
  f.cluster->AddPod(MakePod("shop", "p1", {{"pod-template-hash", "h1"}}, {"app"}));

  auto supervisor = f.Start(WorkloadTarget());
  f.cluster->FailPodListing(true);
  supervisor->Tick();

  assert((supervisor->ActiveStreamKeys() == std::vector<std::string>{"p1/app"}));
  supervisor->Stop(std::chrono::steady_clock::now() + std::chrono::seconds(5));
}

void TestCancelledParentStopsTailers() {
  Fixture f;
  f.cluster->AddPod(MakePod("shop", "p1", {{"pod-template-hash", "h1"}}, {"app"}));

  auto supervisor = f.Start(WorkloadTarget());
  f.root->Cancel();
  assert(WaitUntil([&] { return supervisor->ActiveStreamKeys().empty(); }));

  // ticks after cancellation start nothing
  supervisor->Tick();
  assert(f.cluster->OpenCount("p1", "app") == 1);
  supervisor->Stop(std::chrono::steady_clock::now() + std::chrono::seconds(5));
}

} // namespace

int main() {
  TestOneTailerPerContainer();
  TestVanishedPodIsDroppedWithinOneTick();
  TestReconnectResumesAfterCursor();
  TestFinishedPodIsNotReopened();
  TestTerminatedInitContainerIsReadOnce();
  TestRepeatedListingEntriesShareOneTailer();
  TestContainerHintLimitsStreams();
  TestEnumerationFailureKeepsCurrentStreams();
  TestCancelledParentStopsTailers();

  std::cout << "stream_supervisor_test: pass\n";
  return 0;
}
