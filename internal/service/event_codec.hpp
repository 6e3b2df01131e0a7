#pragma once

#include <string>

#include "releaselog/v1/types.pb.h"

namespace releaselog::service {

/*
  Server-sent-events rendering of the feed, for web adapters and the CLI.

    event: pods   data: [{"name":..,"namespace":..,"type":"workload"}]
    event: log    data: {"pod":..,"namespace":..,"container":..,"type":"job","line":..,"timestamp":..}
    event: ping   data: keepalive
*/
struct SseMessage {
  std::string event;
  std::string data;
};

SseMessage EncodeSse(const releaselog::v1::StreamEvent& event);

// "event: <event>\ndata: <data>\n\n"; multi-line data gets one data: field per line.
std::string FormatSse(const SseMessage& message);

} // namespace releaselog::service
