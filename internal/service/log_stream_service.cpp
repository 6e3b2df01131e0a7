#include "log_stream_service.hpp"

#include <algorithm>
#include <thread>

#include "internal/observability/logging.hpp"
#include "internal/stream/container_tailer.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/threads.hpp"
#include "internal/util/time.hpp"

namespace releaselog::service {

namespace {

using SteadyClock = std::chrono::steady_clock;

constexpr std::chrono::milliseconds kPollSlice{250};

void Validate(const releaselog::v1::StreamLogsRequest& req) {
  if (req.release().namespace_().empty()) {
    throw util::InvalidArgument("release.namespace is required");
  }
  if (req.release().name().empty() && req.pod().empty()) {
    throw util::InvalidArgument("release.name is required");
  }
  if (!req.container().empty() && req.pod().empty()) {
    throw util::InvalidArgument("container requires pod");
  }
  if (req.since_millis() < 0) {
    throw util::InvalidArgument("since_millis must not be negative");
  }
}

std::string Describe(const releaselog::v1::StreamLogsRequest& req) {
  return req.release().namespace_() + "/" + (req.pod().empty() ? req.release().name() : req.pod());
}

/*
  Forwards the feed to the writer until it ends, the writer fails or the
  subscriber cancels. `keepalive` is called whenever the interval elapsed.
*/
void Pump(stream::EventMultiplexer& events, const EventWriter& write, const CancelProbe& cancelled, std::chrono::milliseconds keepalive_interval,
          const std::function<void()>& keepalive) {
  auto next_keepalive = SteadyClock::now() + keepalive_interval;

  releaselog::v1::StreamEvent event;
  while (!cancelled()) {
    if (keepalive_interval.count() > 0 && SteadyClock::now() >= next_keepalive) {
      keepalive();
      next_keepalive = SteadyClock::now() + keepalive_interval;
    }

    const auto status = events.PopFor(kPollSlice, &event);
    if (status == stream::PopStatus::kClosed) return;
    if (status == stream::PopStatus::kTimeout) continue;

    if (!write(event)) {
      RELEASELOG_LOG_DEBUG("subscriber write failed");
      return;
    }
  }
}

} // namespace

LogStreamService::LogStreamService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

engine::EngineOptions LogStreamService::EngineOptionsFor(const releaselog::v1::StreamLogsRequest& req) const {
  auto options              = ctx_.engine;
  options.reconciler.filter = req.source_type_filter();
  options.reconciler.supervisor.since_millis.reset();
  if (req.since_millis() > 0) {
    options.reconciler.supervisor.since_millis = req.since_millis();
  }
  return options;
}

void LogStreamService::StreamLogs(const releaselog::v1::StreamLogsRequest& req, const EventWriter& write, const CancelProbe& cancelled) {
  Validate(req);

  RELEASELOG_LOG_INFO("subscription opened", {observability::StringField("subject", Describe(req)),
                                              observability::BoolField("direct", !req.pod().empty()),
                                              observability::IntField("source_type", req.source_type_filter()),
                                              observability::IntField("since_millis", req.since_millis())});

  if (req.pod().empty()) {
    StreamRelease(req, write, cancelled);
  } else {
    StreamDirect(req, write, cancelled);
  }

  RELEASELOG_LOG_INFO("subscription closed", {observability::StringField("subject", Describe(req))});
}

void LogStreamService::StreamRelease(const releaselog::v1::StreamLogsRequest& req, const EventWriter& write, const CancelProbe& cancelled) {
  engine::LogStreamEngine engine(req.release(), ctx_.cluster, ctx_.metadata, EngineOptionsFor(req));
  engine.Start();

  Pump(*engine.events(), write, cancelled, ctx_.keepalive_interval, [&engine] { engine.SendKeepalive(); });

  engine.Stop();
}

void LogStreamService::StreamDirect(const releaselog::v1::StreamLogsRequest& req, const EventWriter& write, const CancelProbe& cancelled) {
  const auto options = EngineOptionsFor(req);

  auto events   = std::make_shared<stream::EventMultiplexer>(options.channel_capacity);
  auto scope    = util::CancellationScope::CreateRoot();
  auto progress = std::make_shared<stream::TailerProgress>();

  stream::TailerOptions tailer_options;
  tailer_options.since_millis       = options.reconciler.supervisor.since_millis;
  tailer_options.initial_tail_lines = options.reconciler.supervisor.initial_tail_lines;

  const auto source_type = req.source_type_filter() == releaselog::v1::SOURCE_TYPE_UNSPECIFIED ? releaselog::v1::SOURCE_TYPE_WORKLOAD
                                                                                                : req.source_type_filter();

  stream::ContainerTailer tailer(ctx_.cluster, events, req.release().namespace_(), req.pod(), req.container(), source_type, tailer_options,
                                 progress);
  std::thread worker([tailer = std::move(tailer), scope, events]() mutable {
    tailer.Run(*scope);
    events->Close();
  });

  auto send_ping = [&events] {
    releaselog::v1::StreamEvent ping;
    ping.mutable_ping()->set_sent_at_millis(util::NowMillis());
    events->TryPush(std::move(ping));
  };

  try {
    Pump(*events, write, cancelled, ctx_.keepalive_interval, send_ping);
  } catch (...) {
    scope->Cancel();
    util::JoinUntil(worker, progress->done, SteadyClock::now() + options.shutdown_timeout);
    throw;
  }

  scope->Cancel();
  util::JoinUntil(worker, progress->done, SteadyClock::now() + options.shutdown_timeout);

  if (progress->done.IsSet() && progress->failed.load() && progress->lines.load() == 0) {
    throw util::Unavailable("failed to stream logs: " + progress->error);
  }
}

} // namespace releaselog::service
