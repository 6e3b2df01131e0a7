#include "internal/observability/metrics.hpp"

#ifdef ENABLE_OTEL

#include <opentelemetry/common/attribute_value.h>
#include <opentelemetry/context/context.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_metric_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_metric_exporter_options.h>
#include <opentelemetry/exporters/otlp/otlp_http_metric_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_http_metric_exporter_options.h>
#include <opentelemetry/metrics/provider.h>
#include <opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader_factory.h>
#include <opentelemetry/sdk/metrics/meter_provider.h>
#include <opentelemetry/sdk/resource/resource.h>

#include <chrono>
#include <cstdlib>
#include <utility>

#include "config/config.pb.h"

namespace releaselog::observability {
namespace otlp        = opentelemetry::exporter::otlp;
namespace metrics_api = opentelemetry::metrics;
namespace sdkmetrics  = opentelemetry::sdk::metrics;
namespace resource    = opentelemetry::sdk::resource;

namespace {
using AttributePair = std::pair<opentelemetry::nostd::string_view, opentelemetry::common::AttributeValue>;
std::shared_ptr<sdkmetrics::MeterProvider> g_provider;

std::string ResolveEndpoint(const OtlpConfig& config) {
  if (!config.endpoint.empty()) {
    return config.endpoint;
  }

  if (const char* endpoint = std::getenv("OTEL_EXPORTER_OTLP_METRICS_ENDPOINT")) {
    return endpoint;
  }
  if (const char* endpoint = std::getenv("OTEL_EXPORTER_OTLP_ENDPOINT")) {
    return endpoint;
  }

  return config.transport == OtlpTransport::kHttpProtobuf ? "http://localhost:4318/v1/metrics" : "localhost:4317";
}

template <typename Provider>
void AddMetricReaderCompat(const std::shared_ptr<Provider>& provider, std::unique_ptr<sdkmetrics::MetricReader> reader) {
  if constexpr (requires { provider->AddMetricReader(std::move(reader)); }) {
    provider->AddMetricReader(std::move(reader));
  } else {
    provider->AddMetricReader(std::shared_ptr<sdkmetrics::MetricReader>(std::move(reader)));
  }
}

template <typename Instrument, typename Value, typename Attributes>
void AddWithAttributes(const opentelemetry::nostd::shared_ptr<Instrument>& instrument, Value value, Attributes&& attributes) {
  if constexpr (requires { instrument->Add(value, std::forward<Attributes>(attributes), opentelemetry::context::Context{}); }) {
    instrument->Add(value, std::forward<Attributes>(attributes), opentelemetry::context::Context{});
  } else {
    instrument->Add(value, std::forward<Attributes>(attributes));
  }
}

} // namespace

struct Metrics::Impl {
  opentelemetry::nostd::shared_ptr<metrics_api::Meter> meter;

  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>>  events_pushed;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>>  events_dropped;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>>  tailers_started;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>>  resolve_failures;
  opentelemetry::nostd::shared_ptr<metrics_api::UpDownCounter<int64_t>> active_tailers;
};

bool InitializeMetrics(const releaselog::runtime::config::RuntimeConfig& config) {
  const auto& observability = config.observability();
  if (!observability.metrics_enabled()) {
    ShutdownMetrics();
    return false;
  }

  OtlpConfig otlp_config;
  otlp_config.endpoint  = observability.otlp_endpoint();
  otlp_config.transport = observability.transport() == releaselog::runtime::config::OTLP_TRANSPORT_HTTP ? OtlpTransport::kHttpProtobuf
                                                                                                         : OtlpTransport::kGrpc;
  if (observability.collection_interval_ms() > 0) {
    otlp_config.collection_interval_ms = observability.collection_interval_ms();
  }

  auto endpoint = ResolveEndpoint(otlp_config);

  std::unique_ptr<sdkmetrics::PushMetricExporter> exporter;
  if (otlp_config.transport == OtlpTransport::kHttpProtobuf) {
    otlp::OtlpHttpMetricExporterOptions options;
    options.url = endpoint;
    exporter    = otlp::OtlpHttpMetricExporterFactory::Create(options);
  } else {
    otlp::OtlpGrpcMetricExporterOptions options;
    options.endpoint            = endpoint;
    options.use_ssl_credentials = !otlp_config.insecure;
    exporter                    = otlp::OtlpGrpcMetricExporterFactory::Create(options);
  }

  sdkmetrics::PeriodicExportingMetricReaderOptions reader_options;
  reader_options.export_interval_millis = std::chrono::milliseconds(otlp_config.collection_interval_ms);
  auto reader = sdkmetrics::PeriodicExportingMetricReaderFactory::Create(std::move(exporter), reader_options);

  resource::ResourceAttributes attrs = {{"service.name", otlp_config.service_name}};
  g_provider = std::make_shared<sdkmetrics::MeterProvider>(std::unique_ptr<sdkmetrics::ViewRegistry>(new sdkmetrics::ViewRegistry()),
                                                           resource::Resource::Create(attrs));
  AddMetricReaderCompat(g_provider, std::move(reader));

  metrics_api::Provider::SetMeterProvider(opentelemetry::nostd::shared_ptr<metrics_api::MeterProvider>(g_provider));
  return true;
}

void ShutdownMetrics() {
  if (g_provider) {
    g_provider->ForceFlush();
    g_provider->Shutdown();
  }
  g_provider.reset();
}

Metrics::Metrics() : impl_(std::make_unique<Impl>()) {
  auto provider = metrics_api::Provider::GetMeterProvider();
  impl_->meter  = provider->GetMeter("release-log-streamer", "0.1.0");

  impl_->events_pushed    = impl_->meter->CreateUInt64Counter("releaselog.events.pushed", "Events accepted by a subscription feed", "1");
  impl_->events_dropped   = impl_->meter->CreateUInt64Counter("releaselog.events.dropped", "Events dropped on a full or closed feed", "1");
  impl_->tailers_started  = impl_->meter->CreateUInt64Counter("releaselog.tailers.started", "Container log streams opened", "1");
  impl_->resolve_failures = impl_->meter->CreateUInt64Counter("releaselog.resolve.failures", "Failed discovery steps", "1");
  impl_->active_tailers   = impl_->meter->CreateInt64UpDownCounter("releaselog.tailers.active", "Container log streams currently open", "1");
}

Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

void Metrics::RecordEventPushed(std::string_view kind) {
  const std::initializer_list<AttributePair> attributes = {{"kind", opentelemetry::nostd::string_view(kind.data(), kind.size())}};
  AddWithAttributes(impl_->events_pushed, static_cast<std::uint64_t>(1), attributes);
}

void Metrics::RecordEventDropped(std::string_view kind) {
  const std::initializer_list<AttributePair> attributes = {{"kind", opentelemetry::nostd::string_view(kind.data(), kind.size())}};
  AddWithAttributes(impl_->events_dropped, static_cast<std::uint64_t>(1), attributes);
}

void Metrics::RecordTailerStarted(std::string_view source_type) {
  const std::initializer_list<AttributePair> attributes = {{"source_type", opentelemetry::nostd::string_view(source_type.data(), source_type.size())}};
  AddWithAttributes(impl_->tailers_started, static_cast<std::uint64_t>(1), attributes);
}

void Metrics::RecordResolveFailure(std::string_view stage) {
  const std::initializer_list<AttributePair> attributes = {{"stage", opentelemetry::nostd::string_view(stage.data(), stage.size())}};
  AddWithAttributes(impl_->resolve_failures, static_cast<std::uint64_t>(1), attributes);
}

void Metrics::AddActiveTailers(std::int64_t delta) {
  AddWithAttributes(impl_->active_tailers, delta, std::initializer_list<AttributePair>{});
}

} // namespace releaselog::observability

#endif
