#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <thread>
#include <vector>

#include "internal/cluster/cluster_api.hpp"
#include "internal/discovery/pod_roster.hpp"
#include "internal/model/target.hpp"
#include "internal/stream/container_tailer.hpp"
#include "internal/stream/event_multiplexer.hpp"
#include "internal/stream/pod_enumerator.hpp"
#include "internal/util/cancellation.hpp"
#include "internal/util/threads.hpp"

namespace releaselog::stream {

struct SupervisorOptions {
  std::chrono::milliseconds poll_interval{2000};
  std::chrono::milliseconds idle_warning{60000};
  std::optional<int64_t>    since_millis;
  uint32_t                  initial_tail_lines = 500;
};

/*
  Keeps exactly one tailer per live (pod, container) of a Target.

  Every tick re-enumerates the Target's pods, starts tailers for new
  containers (resuming from the key's cursor), cancels tailers whose pod is
  gone and publishes the Target's pods to the roster. The first tick runs
  inside Start().

  A stream that ended on its own is not reopened while its container stays
  terminated (or its pod finished); a restarted container is tailed again.

  Must be owned by a shared_ptr; the loop thread holds a reference until it
  exits.
*/
class StreamSupervisor : public std::enable_shared_from_this<StreamSupervisor> {
 public:
  StreamSupervisor(model::Target target, std::shared_ptr<cluster::ClusterApi> api, std::shared_ptr<EventMultiplexer> sink,
                   std::shared_ptr<discovery::PodRoster> roster, SupervisorOptions options);
  ~StreamSupervisor();

  void Start(const util::CancellationScopePtr& parent);

  // One reconciliation pass. Exposed for tests; never throws.
  void Tick();

  // Cancels everything and waits for tailers up to `deadline`; stragglers
  // are detached.
  void Stop(std::chrono::steady_clock::time_point deadline);

  std::vector<std::string> ActiveStreamKeys() const;

  std::optional<int64_t> CursorFor(const std::string& stream_key) const;

  const model::Target& target() const {
    return target_;
  }

 private:
  struct TailerEntry {
    std::string                     pod;
    util::CancellationScopePtr      scope;
    std::shared_ptr<TailerProgress> progress;
    std::thread                     thread;
    bool                            idle_warned = false;
  };

  struct DesiredStream {
    std::string pod;
    std::string container;
    std::string phase;
    bool        terminated = false;
  };

  void Loop();

  // Caller holds mutex_.
  void StartTailerLocked(const std::string& key, const DesiredStream& desired);
  void ReapLocked(const std::map<std::string, DesiredStream>& desired);
  void WarnIdleLocked();

  model::Target                         target_;
  std::shared_ptr<cluster::ClusterApi>  api_;
  std::shared_ptr<EventMultiplexer>     sink_;
  std::shared_ptr<discovery::PodRoster> roster_;
  PodEnumerator                         enumerator_;
  SupervisorOptions                     options_;

  util::CancellationScopePtr scope_;
  std::thread                loop_thread_;
  util::DoneFlag             loop_done_;

  mutable std::mutex                 mutex_;
  std::map<std::string, TailerEntry> tailers_;
  std::vector<TailerEntry>           retiring_;
  std::map<std::string, int64_t>     cursors_;
  std::set<std::string>              completed_;
  bool                               stopped_ = false;
};

} // namespace releaselog::stream
