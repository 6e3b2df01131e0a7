#include "factory.hpp"

#include <memory>

#include "internal/cluster/kube_client.hpp"
#include "internal/cluster/kube_cluster_api.hpp"
#include "internal/grpc/log_stream_server.hpp"
#include "internal/observability/logging.hpp"
#include "internal/service/service_context.hpp"

namespace releaselog::factory {

namespace {

cluster::ApiResource ToApiResource(const releaselog::runtime::config::ResourceApi& api) {
  return {api.group(), api.version(), api.resource()};
}

} // namespace

service::ServiceContext BuildKubeServiceContext(const releaselog::runtime::config::RuntimeConfig& config) {
  // ------------------------------------------------------------------
  // Cluster collaborators
  // ------------------------------------------------------------------
  auto client_options = cluster::ResolveKubeClientOptions(config.cluster());
  RELEASELOG_LOG_INFO("cluster api", {observability::StringField("server", client_options.api_server),
                                      observability::BoolField("token", !client_options.bearer_token.empty()),
                                      observability::BoolField("insecure", client_options.insecure_skip_tls_verify)});

  auto client      = std::make_shared<cluster::KubeClient>(std::move(client_options));
  auto cluster_api = std::make_shared<cluster::KubeClusterApi>(client, ToApiResource(config.cluster().release_test_api()));
  auto metadata    = std::make_shared<cluster::KubeReleaseMetadata>(client, ToApiResource(config.cluster().release_api()));

  return service::BuildServiceContext(config, std::move(cluster_api), std::move(metadata));
}

/*
    Build full application dependency graph
*/
Application Build(const releaselog::runtime::config::RuntimeConfig& config) {
  Application app;

  // ------------------------------------------------------------------
  // Services
  // ------------------------------------------------------------------
  app.log_stream_service = std::make_shared<service::LogStreamService>(BuildKubeServiceContext(config));

  // ------------------------------------------------------------------
  // gRPC servers
  // ------------------------------------------------------------------
  app.grpc_services.push_back(std::make_unique<grpc::LogStreamServer>(app.log_stream_service));

  return app;
}

} // namespace releaselog::factory
