#include "service_context.hpp"

#include "config/config.pb.h"

namespace releaselog::service {

ServiceContext BuildServiceContext(const releaselog::runtime::config::RuntimeConfig& config, std::shared_ptr<releaselog::cluster::ClusterApi> cluster,
                                   std::shared_ptr<releaselog::cluster::ReleaseMetadata> metadata) {
  using std::chrono::milliseconds;

  const auto& engine = config.engine();

  ServiceContext ctx;
  ctx.cluster            = std::move(cluster);
  ctx.metadata           = std::move(metadata);
  ctx.keepalive_interval = milliseconds(engine.keepalive_interval_ms());

  auto& options             = ctx.engine;
  options.channel_capacity  = engine.channel_capacity();
  options.snapshot_interval = milliseconds(engine.snapshot_interval_ms());
  options.shutdown_timeout  = milliseconds(engine.shutdown_timeout_ms());

  options.reconciler.interval         = milliseconds(engine.discovery_interval_ms());
  options.reconciler.teardown_timeout = milliseconds(engine.shutdown_timeout_ms());

  options.reconciler.supervisor.poll_interval      = milliseconds(engine.pod_poll_interval_ms());
  options.reconciler.supervisor.idle_warning       = milliseconds(engine.idle_warning_ms());
  options.reconciler.supervisor.initial_tail_lines = engine.initial_tail_lines();

  return ctx;
}

} // namespace releaselog::service
