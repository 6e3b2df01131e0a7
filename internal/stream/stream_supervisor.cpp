#include "stream_supervisor.hpp"

#include "internal/observability/logging.hpp"
#include "internal/util/threads.hpp"
#include "internal/util/time.hpp"

namespace releaselog::stream {

namespace {

using SteadyClock = std::chrono::steady_clock;

bool IsTerminalPhase(const std::string& phase) {
  return phase == "Succeeded" || phase == "Failed";
}

template <typename Stream>
bool HasFinished(const Stream& stream) {
  return stream.terminated || IsTerminalPhase(stream.phase);
}

} // namespace

StreamSupervisor::StreamSupervisor(model::Target target, std::shared_ptr<cluster::ClusterApi> api, std::shared_ptr<EventMultiplexer> sink,
                                   std::shared_ptr<discovery::PodRoster> roster, SupervisorOptions options)
    : target_(std::move(target)),
      api_(std::move(api)),
      sink_(std::move(sink)),
      roster_(std::move(roster)),
      enumerator_(api_),
      options_(options) {
}

StreamSupervisor::~StreamSupervisor() {
  Stop(SteadyClock::now());
}

void StreamSupervisor::Start(const util::CancellationScopePtr& parent) {
  scope_ = parent->CreateChild();

  RELEASELOG_LOG_INFO("supervisor started", {observability::StringField("target", target_.id),
                                             observability::StringField("selector", target_.selector.ToString())});

  Tick();

  loop_thread_ = std::thread([self = shared_from_this()] { self->Loop(); });
}

void StreamSupervisor::Loop() {
  while (!scope_->WaitFor(options_.poll_interval)) {
    Tick();
  }
  loop_done_.Set();
}

void StreamSupervisor::Tick() {
  if (!scope_ || scope_->IsCancelled()) return;

  std::vector<model::Pod> pods;
  try {
    pods = enumerator_.Enumerate(target_.namespace_, target_.selector);
  } catch (const std::exception& e) {
    RELEASELOG_LOG_WARN("pod enumeration failed", {observability::StringField("target", target_.id), observability::StringField("error", e.what())});
    return;
  }

  std::map<std::string, DesiredStream> desired;
  for (const auto& pod : pods) {
    auto add = [&](const std::string& container) {
      if (target_.container_hint && *target_.container_hint != container) return;
      desired.emplace(model::MakeStreamKey(pod.name, container),
                      DesiredStream{pod.name, container, pod.phase, pod.terminated_containers.count(container) > 0});
    };
    for (const auto& c : pod.init_containers) add(c);
    for (const auto& c : pod.containers) add(c);
  }

  {
    std::lock_guard lock(mutex_);
    if (stopped_ || scope_->IsCancelled()) return;

    ReapLocked(desired);

    for (const auto& [key, stream] : desired) {
      if (tailers_.count(key) || completed_.count(key)) continue;
      StartTailerLocked(key, stream);
    }

    WarnIdleLocked();
  }

  std::vector<releaselog::v1::PodInfo> infos;
  infos.reserve(pods.size());
  for (const auto& pod : pods) {
    releaselog::v1::PodInfo info;
    info.set_name(pod.name);
    info.set_namespace_(pod.namespace_);
    info.set_type(target_.kind);
    infos.push_back(std::move(info));
  }
  roster_->Update(target_.id, std::move(infos));
}

void StreamSupervisor::ReapLocked(const std::map<std::string, DesiredStream>& desired) {
  for (auto it = retiring_.begin(); it != retiring_.end();) {
    if (it->progress->done.IsSet()) {
      it->thread.join();
      it = retiring_.erase(it);
    } else {
      ++it;
    }
  }

  for (auto it = tailers_.begin(); it != tailers_.end();) {
    const auto& key   = it->first;
    auto&       entry = it->second;
    const auto  want  = desired.find(key);

    if (entry.progress->done.IsSet()) {
      if (auto cursor = entry.progress->Cursor()) cursors_[key] = *cursor;

      if (!entry.progress->failed.load() && want != desired.end() && HasFinished(want->second)) {
        completed_.insert(key);
      }
      entry.thread.join();
      it = tailers_.erase(it);
      continue;
    }

    if (want == desired.end()) {
      RELEASELOG_LOG_INFO("stream removed", {observability::StringField("target", target_.id), observability::StringField("stream", key)});
      entry.scope->Cancel();
      retiring_.push_back(std::move(entry));
      it = tailers_.erase(it);
      continue;
    }
    ++it;
  }

  for (auto it = cursors_.begin(); it != cursors_.end();) {
    it = desired.count(it->first) ? std::next(it) : cursors_.erase(it);
  }
  for (auto it = completed_.begin(); it != completed_.end();) {
    const auto want = desired.find(*it);
    it              = want != desired.end() && HasFinished(want->second) ? std::next(it) : completed_.erase(it);
  }
}

void StreamSupervisor::StartTailerLocked(const std::string& key, const DesiredStream& desired) {
  TailerOptions tailer_options;
  tailer_options.since_millis       = options_.since_millis;
  tailer_options.initial_tail_lines = options_.initial_tail_lines;
  if (auto it = cursors_.find(key); it != cursors_.end()) {
    tailer_options.cursor_millis = it->second;
  }

  TailerEntry entry;
  entry.pod      = desired.pod;
  entry.scope    = scope_->CreateChild();
  entry.progress = std::make_shared<TailerProgress>();

  ContainerTailer tailer(api_, sink_, target_.namespace_, desired.pod, desired.container, target_.kind, tailer_options, entry.progress);
  entry.thread = std::thread([tailer = std::move(tailer), scope = entry.scope]() mutable { tailer.Run(*scope); });

  RELEASELOG_LOG_INFO("stream added", {observability::StringField("target", target_.id), observability::StringField("stream", key)});
  tailers_.emplace(key, std::move(entry));
}

void StreamSupervisor::WarnIdleLocked() {
  if (options_.idle_warning.count() <= 0) return;

  const auto now = util::NowMillis();
  for (auto& [key, entry] : tailers_) {
    if (entry.idle_warned) continue;
    const auto idle = now - entry.progress->last_activity_millis.load(std::memory_order_relaxed);
    if (idle > options_.idle_warning.count()) {
      entry.idle_warned = true;
      RELEASELOG_LOG_WARN("no log lines received", {observability::StringField("stream", key),
                                                    observability::DurationField("idle", std::chrono::milliseconds(idle)),
                                                    observability::IntField("lines", static_cast<int64_t>(entry.progress->lines.load()))});
    }
  }
}

void StreamSupervisor::Stop(SteadyClock::time_point deadline) {
  if (scope_) scope_->Cancel();

  if (loop_thread_.joinable()) {
    util::JoinUntil(loop_thread_, loop_done_, deadline);
  }

  std::vector<TailerEntry> draining;
  {
    std::lock_guard lock(mutex_);
    stopped_ = true;
    for (auto& [key, entry] : tailers_) draining.push_back(std::move(entry));
    tailers_.clear();
    for (auto& entry : retiring_) draining.push_back(std::move(entry));
    retiring_.clear();
  }

  std::size_t stragglers = 0;
  for (auto& entry : draining) {
    entry.scope->Cancel();
    if (!util::JoinUntil(entry.thread, entry.progress->done, deadline)) ++stragglers;
  }

  if (stragglers > 0) {
    RELEASELOG_LOG_WARN("tailers still running at shutdown deadline", {observability::StringField("target", target_.id),
                                                                       observability::IntField("detached", static_cast<int64_t>(stragglers))});
  }
}

std::vector<std::string> StreamSupervisor::ActiveStreamKeys() const {
  std::lock_guard          lock(mutex_);
  std::vector<std::string> keys;
  keys.reserve(tailers_.size());
  for (const auto& [key, entry] : tailers_) {
    if (!entry.progress->done.IsSet()) keys.push_back(key);
  }
  return keys;
}

std::optional<int64_t> StreamSupervisor::CursorFor(const std::string& stream_key) const {
  std::lock_guard lock(mutex_);
  if (auto it = cursors_.find(stream_key); it != cursors_.end()) return it->second;
  return std::nullopt;
}

} // namespace releaselog::stream
