#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <thread>

#include "internal/cluster/cluster_api.hpp"
#include "internal/discovery/discovery_reconciler.hpp"
#include "internal/discovery/pod_roster.hpp"
#include "internal/stream/event_multiplexer.hpp"
#include "internal/util/cancellation.hpp"
#include "internal/util/threads.hpp"

namespace releaselog::engine {

struct EngineOptions {
  std::size_t               channel_capacity = 1000;
  std::chrono::milliseconds snapshot_interval{2000};
  std::chrono::milliseconds shutdown_timeout{5000};

  discovery::ReconcilerOptions reconciler;
};

/*
  Lifecycle owner of one release subscription.

  Start() resolves the release, starts every supervisor, publishes a first
  pods snapshot and then one per snapshot interval. Stop() cancels the whole
  task tree, waits up to the shutdown timeout and closes the event feed
  exactly once; consumers drain what is left and then see end-of-stream.
*/
class LogStreamEngine {
 public:
  LogStreamEngine(releaselog::v1::ReleaseRef release, std::shared_ptr<cluster::ClusterApi> api, std::shared_ptr<cluster::ReleaseMetadata> metadata,
                  EngineOptions options);
  ~LogStreamEngine();

  LogStreamEngine(const LogStreamEngine&)            = delete;
  LogStreamEngine& operator=(const LogStreamEngine&) = delete;

  void Start();
  void Stop();

  bool SendKeepalive();
  bool PublishSnapshot();

  const std::shared_ptr<stream::EventMultiplexer>& events() const {
    return events_;
  }

  const std::shared_ptr<discovery::PodRoster>& roster() const {
    return roster_;
  }

  const std::shared_ptr<discovery::DiscoveryReconciler>& reconciler() const {
    return reconciler_;
  }

 private:
  EngineOptions options_;

  util::CancellationScopePtr                      root_;
  std::shared_ptr<stream::EventMultiplexer>       events_;
  std::shared_ptr<discovery::PodRoster>           roster_;
  std::shared_ptr<discovery::DiscoveryReconciler> reconciler_;

  std::thread                     snapshot_thread_;
  std::shared_ptr<util::DoneFlag> snapshot_done_;

  std::atomic<bool> started_{false};
  std::atomic<bool> stopped_{false};
};

} // namespace releaselog::engine
