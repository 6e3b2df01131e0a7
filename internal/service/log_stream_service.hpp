#pragma once

#include <functional>

#include "internal/service/service_context.hpp"
#include "releaselog/v1/log_stream_service.pb.h"

namespace releaselog::service {

// Returns false once the subscriber is gone.
using EventWriter = std::function<bool(const releaselog::v1::StreamEvent&)>;
using CancelProbe = std::function<bool()>;

/*
  Runs one subscription to completion on the calling thread.

  Release mode builds a LogStreamEngine for the request and forwards its
  feed; direct mode (request.pod set) follows a single container without
  discovery. Keepalives are interleaved at the configured interval.
*/
class LogStreamService {
 public:
  explicit LogStreamService(ServiceContext ctx);

  // Blocks until the subscriber goes away or the feed ends. Throws
  // util::InvalidArgument for malformed requests and util::Unavailable when
  // a direct stream cannot be opened.
  void StreamLogs(const releaselog::v1::StreamLogsRequest& req, const EventWriter& write, const CancelProbe& cancelled);

  engine::EngineOptions EngineOptionsFor(const releaselog::v1::StreamLogsRequest& req) const;

 private:
  void StreamRelease(const releaselog::v1::StreamLogsRequest& req, const EventWriter& write, const CancelProbe& cancelled);
  void StreamDirect(const releaselog::v1::StreamLogsRequest& req, const EventWriter& write, const CancelProbe& cancelled);

  ServiceContext ctx_;
};

} // namespace releaselog::service
