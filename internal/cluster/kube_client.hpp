#pragma once

#include <google/protobuf/struct.pb.h>

#include <chrono>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "internal/cluster/cluster_api.hpp"
#include "internal/util/cancellation.hpp"

namespace releaselog::runtime::config {
class ClusterConfig;
}

namespace releaselog::cluster {

struct KubeClientOptions {
  std::string               api_server; // "https://10.0.0.1:443"
  std::string               bearer_token;
  std::string               ca_file;
  bool                      insecure_skip_tls_verify = false;
  std::chrono::milliseconds request_timeout{10000};
};

using QueryParams = std::vector<std::pair<std::string, std::string>>;

// Explicit settings from config, falling back to the pod's service account.
KubeClientOptions ResolveKubeClientOptions(const releaselog::runtime::config::ClusterConfig& config);

/*
  Minimal Kubernetes REST client over libcurl.

  One easy handle per call, so a single client is safe to share between
  threads. JSON bodies are decoded into google::protobuf::Struct.
*/
class KubeClient {
 public:
  explicit KubeClient(KubeClientOptions options);

  // GET returning a decoded JSON object. 404 → util::NotFound, other
  // failures → util::ClusterError.
  google::protobuf::Struct GetJson(std::string_view path, const QueryParams& query = {}) const;

  // Long-lived GET delivering newline-delimited lines until the body ends
  // or `scope` is cancelled.
  void StreamLines(std::string_view path, const QueryParams& query, const util::CancellationScope& scope, const LineHandler& on_line) const;

  std::string BuildUrl(std::string_view path, const QueryParams& query) const;

 private:
  KubeClientOptions options_;
};

} // namespace releaselog::cluster
