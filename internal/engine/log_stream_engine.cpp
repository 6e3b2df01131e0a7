#include "log_stream_engine.hpp"

#include "internal/observability/logging.hpp"
#include "internal/util/threads.hpp"
#include "internal/util/time.hpp"

namespace releaselog::engine {

namespace {

releaselog::v1::StreamEvent MakeSnapshotEvent(const discovery::PodRoster& roster) {
  releaselog::v1::StreamEvent event;
  auto*                       pods = event.mutable_pods();
  for (auto& pod : roster.Snapshot()) {
    *pods->add_pods() = std::move(pod);
  }
  return event;
}

} // namespace

LogStreamEngine::LogStreamEngine(releaselog::v1::ReleaseRef release, std::shared_ptr<cluster::ClusterApi> api,
                                 std::shared_ptr<cluster::ReleaseMetadata> metadata, EngineOptions options)
    : options_(std::move(options)),
      root_(util::CancellationScope::CreateRoot()),
      events_(std::make_shared<stream::EventMultiplexer>(options_.channel_capacity)),
      roster_(std::make_shared<discovery::PodRoster>()),
      snapshot_done_(std::make_shared<util::DoneFlag>()) {
  auto resolver = std::make_shared<discovery::TargetResolver>(api, std::move(metadata));
  reconciler_   = std::make_shared<discovery::DiscoveryReconciler>(std::move(release), std::move(resolver), std::move(api), events_, roster_,
                                                                   options_.reconciler);
}

LogStreamEngine::~LogStreamEngine() {
  Stop();
}

void LogStreamEngine::Start() {
  if (started_.exchange(true)) return;

  reconciler_->Start(root_);
  PublishSnapshot();

  // captures no `this`: a straggling loop may outlive the engine
  snapshot_thread_ = std::thread([scope = root_->CreateChild(), roster = roster_, events = events_, done = snapshot_done_,
                                  interval = options_.snapshot_interval] {
    while (!scope->WaitFor(interval)) {
      events->TryPush(MakeSnapshotEvent(*roster));
    }
    done->Set();
  });
}

void LogStreamEngine::Stop() {
  if (stopped_.exchange(true)) return;

  root_->Cancel();

  const auto deadline = std::chrono::steady_clock::now() + options_.shutdown_timeout;
  reconciler_->Stop(deadline);

  if (snapshot_thread_.joinable()) {
    util::JoinUntil(snapshot_thread_, *snapshot_done_, deadline);
  }

  events_->Close();
  RELEASELOG_LOG_DEBUG("engine stopped", {observability::IntField("dropped", static_cast<int64_t>(events_->dropped()))});
}

bool LogStreamEngine::SendKeepalive() {
  releaselog::v1::StreamEvent event;
  event.mutable_ping()->set_sent_at_millis(util::NowMillis());
  return events_->TryPush(std::move(event));
}

bool LogStreamEngine::PublishSnapshot() {
  return events_->TryPush(MakeSnapshotEvent(*roster_));
}

} // namespace releaselog::engine
