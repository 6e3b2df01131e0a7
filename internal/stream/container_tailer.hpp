#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include "internal/cluster/cluster_api.hpp"
#include "internal/model/target.hpp"
#include "internal/stream/event_multiplexer.hpp"
#include "internal/util/cancellation.hpp"
#include "internal/util/threads.hpp"

namespace releaselog::stream {

struct TailerOptions {
  // Lines stamped before this are dropped (inclusive lower bound).
  std::optional<int64_t> since_millis;

  // Timestamp of the last line a previous tailer read for the same key;
  // lines at or before it are dropped. Takes precedence over since_millis.
  std::optional<int64_t> cursor_millis;

  uint32_t initial_tail_lines = 500;
};

/*
  Progress shared between a running tailer and its supervisor. The tailer
  writes, the supervisor reads; `done` is set last.
*/
struct TailerProgress {
  util::DoneFlag        done;
  std::atomic<bool>     failed{false};
  std::atomic<bool>     has_timestamp{false};
  std::atomic<int64_t>  last_timestamp_millis{0};
  std::atomic<int64_t>  last_activity_millis{0};
  std::atomic<uint64_t> lines{0};

  // open failure; written before `done`, read only after it
  std::string error;

  std::optional<int64_t> Cursor() const;
};

/*
  Follows one container's log stream and forwards every line to the
  multiplexer as a LogEvent.

  Run() returns on cancellation, on natural end of stream and on open
  failure; it never throws. Owns nothing the supervisor has to outlive, so
  a straggling tailer can be detached safely.
*/
class ContainerTailer {
 public:
  ContainerTailer(std::shared_ptr<cluster::ClusterApi> api, std::shared_ptr<EventMultiplexer> sink, std::string namespace_, std::string pod,
                  std::string container, model::SourceType source_type, TailerOptions options,
                  std::shared_ptr<TailerProgress> progress = std::make_shared<TailerProgress>());

  void Run(const util::CancellationScope& scope);

  const std::shared_ptr<TailerProgress>& progress() const {
    return progress_;
  }

 private:
  void HandleLine(std::string_view line);

  bool Admit(int64_t timestamp_millis) const;

  std::shared_ptr<cluster::ClusterApi> api_;
  std::shared_ptr<EventMultiplexer>    sink_;

  std::string       namespace_;
  std::string       pod_;
  std::string       container_;
  model::SourceType source_type_;
  TailerOptions     options_;

  std::shared_ptr<TailerProgress> progress_;
};

} // namespace releaselog::stream
