#include "container_tailer.hpp"

#include <exception>

#include "internal/observability/logging.hpp"
#include "internal/observability/metrics.hpp"
#include "internal/stream/log_line_parser.hpp"
#include "internal/util/time.hpp"

namespace releaselog::stream {

std::optional<int64_t> TailerProgress::Cursor() const {
  if (!has_timestamp.load(std::memory_order_acquire)) return std::nullopt;
  return last_timestamp_millis.load(std::memory_order_relaxed);
}

ContainerTailer::ContainerTailer(std::shared_ptr<cluster::ClusterApi> api, std::shared_ptr<EventMultiplexer> sink, std::string namespace_,
                                 std::string pod, std::string container, model::SourceType source_type, TailerOptions options,
                                 std::shared_ptr<TailerProgress> progress)
    : api_(std::move(api)),
      sink_(std::move(sink)),
      namespace_(std::move(namespace_)),
      pod_(std::move(pod)),
      container_(std::move(container)),
      source_type_(source_type),
      options_(options),
      progress_(std::move(progress)) {
}

void ContainerTailer::Run(const util::CancellationScope& scope) {
  cluster::LogStreamOptions stream_options;
  if (options_.cursor_millis) {
    stream_options.since_millis = options_.cursor_millis;
  } else if (options_.since_millis) {
    stream_options.since_millis = options_.since_millis;
  } else {
    stream_options.tail_lines = options_.initial_tail_lines;
  }

  progress_->last_activity_millis.store(util::NowMillis(), std::memory_order_relaxed);
  observability::Metrics::Instance().RecordTailerStarted(model::SourceTypeName(source_type_));
  observability::Metrics::Instance().AddActiveTailers(1);

  RELEASELOG_LOG_DEBUG("tailer started", {observability::StringField("pod", pod_), observability::StringField("container", container_),
                                          observability::BoolField("resumed", options_.cursor_millis.has_value())});

  try {
    api_->StreamContainerLogs(namespace_, pod_, container_, stream_options, scope, [this](std::string_view line) { HandleLine(line); });
  } catch (const std::exception& e) {
    progress_->error = e.what();
    progress_->failed.store(true, std::memory_order_relaxed);
    if (!scope.IsCancelled()) {
      RELEASELOG_LOG_WARN("log stream failed", {observability::StringField("namespace", namespace_), observability::StringField("pod", pod_),
                                                observability::StringField("container", container_), observability::StringField("error", e.what())});
    }
  }

  observability::Metrics::Instance().AddActiveTailers(-1);

  RELEASELOG_LOG_DEBUG("tailer finished", {observability::StringField("pod", pod_), observability::StringField("container", container_),
                                           observability::IntField("lines", static_cast<int64_t>(progress_->lines.load())),
                                           observability::BoolField("cancelled", scope.IsCancelled())});

  progress_->done.Set();
}

bool ContainerTailer::Admit(int64_t timestamp_millis) const {
  if (options_.cursor_millis) return timestamp_millis > *options_.cursor_millis;
  if (options_.since_millis) return timestamp_millis >= *options_.since_millis;
  return true;
}

void ContainerTailer::HandleLine(std::string_view line) {
  if (line.empty()) return;

  const auto now    = util::NowMillis();
  const auto parsed = ParseLogLine(line, now);

  progress_->last_activity_millis.store(now, std::memory_order_relaxed);

  // the API's since filter has whole-second granularity
  if (parsed.has_timestamp && !Admit(parsed.timestamp_millis)) return;

  if (parsed.has_timestamp) {
    progress_->last_timestamp_millis.store(parsed.timestamp_millis, std::memory_order_relaxed);
    progress_->has_timestamp.store(true, std::memory_order_release);
  }
  progress_->lines.fetch_add(1, std::memory_order_relaxed);

  releaselog::v1::StreamEvent event;
  auto*                       log = event.mutable_log();
  log->set_pod(pod_);
  log->set_namespace_(namespace_);
  log->set_container(container_);
  log->set_source_type(source_type_);
  log->set_text(std::string(parsed.text));
  log->set_timestamp_millis(parsed.timestamp_millis);

  sink_->TryPush(std::move(event));
}

} // namespace releaselog::stream
