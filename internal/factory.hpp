#pragma once

#include <memory>
#include <vector>

#include <grpcpp/grpcpp.h>

#include "config/config.pb.h"
#include "internal/service/log_stream_service.hpp"

namespace releaselog::factory {

/*
  Application

  Owns all long-lived objects used by the server.
  Everything here lives for the lifetime of the process.
*/
struct Application {
  std::shared_ptr<service::LogStreamService>    log_stream_service;
  std::vector<std::unique_ptr<::grpc::Service>> grpc_services;
};

/*
  Build

  Constructs the entire backend from runtime config. This is the
  composition root: the only place that knows the concrete cluster client.
*/
Application Build(const releaselog::runtime::config::RuntimeConfig& config);

// The Kubernetes-backed collaborators alone, for the service and tools.
service::ServiceContext BuildKubeServiceContext(const releaselog::runtime::config::RuntimeConfig& config);

} // namespace releaselog::factory
