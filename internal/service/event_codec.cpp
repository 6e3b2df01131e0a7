#include "event_codec.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>

#include <stdexcept>

#include "internal/model/target.hpp"
#include "internal/util/errors.hpp"

namespace releaselog::service {

namespace {

using google::protobuf::Struct;
using google::protobuf::Value;

void PutString(Struct& object, const std::string& key, const std::string& value) {
  (*object.mutable_fields())[key].set_string_value(value);
}

template <typename Message>
std::string ToJson(const Message& message) {
  std::string out;
  auto        status = google::protobuf::util::MessageToJsonString(message, &out);
  if (!status.ok()) {
    throw std::runtime_error("failed to encode event: " + std::string(status.message()));
  }
  return out;
}

} // namespace

SseMessage EncodeSse(const releaselog::v1::StreamEvent& event) {
  switch (event.event_case()) {
    case releaselog::v1::StreamEvent::kPods: {
      Value list;
      auto* values = list.mutable_list_value();
      for (const auto& pod : event.pods().pods()) {
        Struct entry;
        PutString(entry, "name", pod.name());
        PutString(entry, "namespace", pod.namespace_());
        PutString(entry, "type", std::string(model::SourceTypeName(pod.type())));
        *values->add_values()->mutable_struct_value() = std::move(entry);
      }
      return {"pods", ToJson(list)};
    }

    case releaselog::v1::StreamEvent::kLog: {
      const auto& log = event.log();
      Struct      entry;
      PutString(entry, "pod", log.pod());
      PutString(entry, "namespace", log.namespace_());
      PutString(entry, "container", log.container());
      PutString(entry, "type", std::string(model::SourceTypeName(log.source_type())));
      PutString(entry, "line", log.text());
      (*entry.mutable_fields())["timestamp"].set_number_value(static_cast<double>(log.timestamp_millis()));
      return {"log", ToJson(entry)};
    }

    case releaselog::v1::StreamEvent::kPing:
      return {"ping", "keepalive"};

    default:
      throw util::InvalidArgument("stream event has no payload");
  }
}

std::string FormatSse(const SseMessage& message) {
  std::string out = "event: " + message.event + "\n";

  std::size_t start = 0;
  while (true) {
    const auto nl = message.data.find('\n', start);
    out.append("data: ").append(message.data, start, nl == std::string::npos ? std::string::npos : nl - start).append("\n");
    if (nl == std::string::npos) break;
    start = nl + 1;
  }
  out.append("\n");
  return out;
}

} // namespace releaselog::service
