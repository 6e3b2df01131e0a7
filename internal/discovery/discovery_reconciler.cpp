#include "discovery_reconciler.hpp"

#include "internal/observability/logging.hpp"
#include "internal/observability/metrics.hpp"
#include "internal/util/threads.hpp"

namespace releaselog::discovery {

namespace {

using SteadyClock = std::chrono::steady_clock;

} // namespace

DiscoveryReconciler::DiscoveryReconciler(releaselog::v1::ReleaseRef release, std::shared_ptr<TargetResolver> resolver,
                                         std::shared_ptr<cluster::ClusterApi> api, std::shared_ptr<stream::EventMultiplexer> sink,
                                         std::shared_ptr<PodRoster> roster, ReconcilerOptions options)
    : release_(std::move(release)),
      resolver_(std::move(resolver)),
      api_(std::move(api)),
      sink_(std::move(sink)),
      roster_(std::move(roster)),
      options_(std::move(options)) {
}

DiscoveryReconciler::~DiscoveryReconciler() {
  Stop(SteadyClock::now());
}

void DiscoveryReconciler::Start(const util::CancellationScopePtr& parent) {
  scope_ = parent->CreateChild();

  Reconcile();

  loop_thread_ = std::thread([self = shared_from_this()] { self->Loop(); });
}

void DiscoveryReconciler::Loop() {
  while (!scope_->WaitFor(options_.interval)) {
    Reconcile();
  }
  loop_done_.Set();
}

void DiscoveryReconciler::Reconcile() {
  if (!scope_ || scope_->IsCancelled()) return;

  std::vector<model::Target> targets;
  try {
    targets = resolver_->Resolve(release_, options_.filter);
  } catch (const std::exception& e) {
    observability::Metrics::Instance().RecordResolveFailure("release");
    RELEASELOG_LOG_WARN("release resolution failed", {observability::StringField("release", release_.namespace_() + "/" + release_.name()),
                                                      observability::StringField("error", e.what())});
    return;
  }

  std::map<std::string, model::Target> desired;
  for (auto& target : targets) {
    auto id = target.id;
    desired.emplace(std::move(id), std::move(target));
  }

  std::vector<std::shared_ptr<stream::StreamSupervisor>> removed;
  std::vector<model::Target>                             added;
  {
    std::lock_guard lock(mutex_);
    if (stopped_) return;

    for (auto it = supervisors_.begin(); it != supervisors_.end();) {
      if (desired.count(it->first)) {
        ++it;
        continue;
      }
      removed.push_back(std::move(it->second));
      it = supervisors_.erase(it);
    }
    for (auto& [id, target] : desired) {
      if (!supervisors_.count(id)) added.push_back(target);
    }
  }

  for (const auto& supervisor : removed) {
    RELEASELOG_LOG_INFO("target removed", {observability::StringField("target", supervisor->target().id)});
    supervisor->Stop(SteadyClock::now() + options_.teardown_timeout);
    roster_->Remove(supervisor->target().id);
  }

  for (auto& target : added) {
    RELEASELOG_LOG_INFO("target added", {observability::StringField("target", target.id),
                                         observability::StringField("kind", model::SourceTypeName(target.kind))});

    auto supervisor = std::make_shared<stream::StreamSupervisor>(target, api_, sink_, roster_, options_.supervisor);
    supervisor->Start(scope_);

    bool accepted = false;
    {
      std::lock_guard lock(mutex_);
      accepted = !stopped_ && supervisors_.emplace(target.id, supervisor).second;
    }
    if (!accepted) {
      supervisor->Stop(SteadyClock::now());
      std::lock_guard lock(mutex_);
      if (stopped_ || !supervisors_.count(target.id)) roster_->Remove(target.id);
    }
  }
}

void DiscoveryReconciler::Stop(SteadyClock::time_point deadline) {
  if (scope_) scope_->Cancel();

  if (loop_thread_.joinable()) {
    if (!util::JoinUntil(loop_thread_, loop_done_, deadline)) {
      RELEASELOG_LOG_WARN("discovery loop still running at shutdown deadline",
                          {observability::StringField("release", release_.namespace_() + "/" + release_.name())});
    }
  }

  std::map<std::string, std::shared_ptr<stream::StreamSupervisor>> supervisors;
  {
    std::lock_guard lock(mutex_);
    stopped_ = true;
    supervisors.swap(supervisors_);
  }

  for (auto& [id, supervisor] : supervisors) {
    supervisor->Stop(deadline);
    roster_->Remove(id);
  }
}

std::vector<std::string> DiscoveryReconciler::ActiveTargetIds() const {
  std::lock_guard          lock(mutex_);
  std::vector<std::string> ids;
  ids.reserve(supervisors_.size());
  for (const auto& [id, supervisor] : supervisors_) ids.push_back(id);
  return ids;
}

std::shared_ptr<stream::StreamSupervisor> DiscoveryReconciler::SupervisorFor(const std::string& target_id) const {
  std::lock_guard lock(mutex_);
  auto            it = supervisors_.find(target_id);
  return it == supervisors_.end() ? nullptr : it->second;
}

} // namespace releaselog::discovery
