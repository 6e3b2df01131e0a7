#pragma once

#include <chrono>
#include <memory>

#include "internal/engine/log_stream_engine.hpp"

namespace releaselog::cluster {
class ClusterApi;
class ReleaseMetadata;
} // namespace releaselog::cluster

namespace releaselog::runtime::config {
class RuntimeConfig;
}

namespace releaselog::service {

/*
  Dependency container shared by all services.
*/
struct ServiceContext {
  std::shared_ptr<releaselog::cluster::ClusterApi>      cluster;
  std::shared_ptr<releaselog::cluster::ReleaseMetadata> metadata;

  // Template for every subscription; request fields override parts of it.
  releaselog::engine::EngineOptions engine;
  std::chrono::milliseconds         keepalive_interval{15000};
};

// Engine and keepalive settings from the `engine` config section.
ServiceContext BuildServiceContext(const releaselog::runtime::config::RuntimeConfig&    config,
                                   std::shared_ptr<releaselog::cluster::ClusterApi>      cluster,
                                   std::shared_ptr<releaselog::cluster::ReleaseMetadata> metadata);

} // namespace releaselog::service
