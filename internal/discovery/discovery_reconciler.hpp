#pragma once

#include <atomic>
#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "internal/discovery/pod_roster.hpp"
#include "internal/discovery/target_resolver.hpp"
#include "internal/stream/stream_supervisor.hpp"
#include "internal/util/cancellation.hpp"
#include "internal/util/threads.hpp"

namespace releaselog::discovery {

struct ReconcilerOptions {
  std::chrono::milliseconds interval{5000};

  // Budget for tearing down the supervisor of a vanished Target.
  std::chrono::milliseconds teardown_timeout{5000};

  model::SourceType         filter = releaselog::v1::SOURCE_TYPE_UNSPECIFIED;
  stream::SupervisorOptions supervisor;
};

/*
  Keeps one StreamSupervisor per Target of a release.

  Re-resolves on a fixed interval and diffs by Target id: new ids get a
  supervisor, vanished ids have theirs stopped and their pods dropped from
  the roster. A failed resolution keeps the current set.

  Must be owned by a shared_ptr.
*/
class DiscoveryReconciler : public std::enable_shared_from_this<DiscoveryReconciler> {
 public:
  DiscoveryReconciler(releaselog::v1::ReleaseRef release, std::shared_ptr<TargetResolver> resolver, std::shared_ptr<cluster::ClusterApi> api,
                      std::shared_ptr<stream::EventMultiplexer> sink, std::shared_ptr<PodRoster> roster, ReconcilerOptions options);
  ~DiscoveryReconciler();

  // Resolves once and starts the initial supervisors before returning.
  void Start(const util::CancellationScopePtr& parent);

  // One resolve-and-diff pass. Exposed for tests; never throws.
  void Reconcile();

  void Stop(std::chrono::steady_clock::time_point deadline);

  std::vector<std::string> ActiveTargetIds() const;

  std::shared_ptr<stream::StreamSupervisor> SupervisorFor(const std::string& target_id) const;

 private:
  void Loop();

  releaselog::v1::ReleaseRef                release_;
  std::shared_ptr<TargetResolver>           resolver_;
  std::shared_ptr<cluster::ClusterApi>      api_;
  std::shared_ptr<stream::EventMultiplexer> sink_;
  std::shared_ptr<PodRoster>                roster_;
  ReconcilerOptions                         options_;

  util::CancellationScopePtr scope_;
  std::thread                loop_thread_;
  util::DoneFlag             loop_done_;

  mutable std::mutex                                               mutex_;
  std::map<std::string, std::shared_ptr<stream::StreamSupervisor>> supervisors_;
  bool                                                             stopped_ = false;
};

} // namespace releaselog::discovery
