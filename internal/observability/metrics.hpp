#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

namespace releaselog::runtime::config {
class RuntimeConfig;
}

namespace releaselog::observability {

enum class OtlpTransport {
  kGrpc,
  kHttpProtobuf,
};

struct OtlpConfig {
  std::string   service_name{"release-log-streamer"};
  std::string   endpoint{};
  OtlpTransport transport{OtlpTransport::kGrpc};
  bool          insecure{true};
  std::uint32_t collection_interval_ms{1000};
};

bool InitializeMetrics(const releaselog::runtime::config::RuntimeConfig& config);
void ShutdownMetrics();

/*
  Process-wide engine counters. All calls are cheap no-ops unless the
  binary was built with ENABLE_OTEL and metrics were initialised.
*/
class Metrics {
 public:
  static Metrics& Instance();

  void RecordEventPushed(std::string_view kind);
  void RecordEventDropped(std::string_view kind);
  void RecordTailerStarted(std::string_view source_type);
  void RecordResolveFailure(std::string_view stage);

  // +1 when a tailer starts, -1 when it exits.
  void AddActiveTailers(std::int64_t delta);

 private:
  Metrics();
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

#ifndef ENABLE_OTEL
inline bool InitializeMetrics(const releaselog::runtime::config::RuntimeConfig&) {
  return false;
}

inline void ShutdownMetrics() {
}

inline Metrics::Metrics() {
}

inline Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

inline void Metrics::RecordEventPushed(std::string_view) {
}

inline void Metrics::RecordEventDropped(std::string_view) {
}

inline void Metrics::RecordTailerStarted(std::string_view) {
}

inline void Metrics::RecordResolveFailure(std::string_view) {
}

inline void Metrics::AddActiveTailers(std::int64_t) {
}
#endif

} // namespace releaselog::observability
