#include <grpcpp/grpcpp.h>

#include <csignal>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <optional>
#include <string>

#include "internal/service/event_codec.hpp"
#include "internal/util/time.hpp"
#include "releaselog/v1/log_stream_service.grpc.pb.h"

using namespace releaselog::v1;

static grpc::ClientContext* g_active_call = nullptr;

static void HandleSignal(int) {
  if (g_active_call) g_active_call->TryCancel();
}

static void Usage() {
  std::cout << "Usage:\n"
            << "  releaselogctl <addr> stream <namespace> <release> [options]\n"
            << "  releaselogctl <addr> pods <namespace> <release> [--type workload|job]\n"
            << "\n"
            << "Options:\n"
            << "  --type workload|job     only one kind of source\n"
            << "  --since <time>          RFC 3339 timestamp or unix millis\n"
            << "  --pod <pod>             tail a single pod without discovery\n"
            << "  --container <name>      container of --pod\n"
            << "  --format text|sse       output format (default text)\n";
}

static std::optional<SourceType> ParseSourceType(const std::string& value) {
  if (value == "workload") {
    return SOURCE_TYPE_WORKLOAD;
  }
  if (value == "job") {
    return SOURCE_TYPE_JOB;
  }
  return std::nullopt;
}

static std::optional<int64_t> ParseSince(const std::string& value) {
  if (auto millis = releaselog::util::ParseRfc3339Millis(value)) {
    return millis;
  }

  char*      endptr = nullptr;
  const auto parsed = std::strtoll(value.c_str(), &endptr, 10);
  if (!value.empty() && endptr && *endptr == '\0' && parsed >= 0) {
    return parsed;
  }
  return std::nullopt;
}

static void PrintText(const StreamEvent& event) {
  switch (event.event_case()) {
    case StreamEvent::kPods:
      std::cout << "# pods:";
      for (const auto& pod : event.pods().pods()) std::cout << ' ' << pod.name();
      std::cout << std::endl;
      break;
    case StreamEvent::kLog:
      std::cout << releaselog::util::FormatRfc3339(event.log().timestamp_millis()) << ' ' << event.log().pod() << '/' << event.log().container()
                << ": " << event.log().text() << '\n';
      break;
    default:
      break;
  }
}

int main(int argc, char** argv) {
  if (argc < 5) {
    Usage();
    return 1;
  }

  std::string addr = argv[1];
  std::string cmd  = argv[2];

  StreamLogsRequest req;
  req.mutable_release()->set_namespace_(argv[3]);
  req.mutable_release()->set_name(argv[4]);

  bool sse = false;
  for (int i = 5; i < argc; ++i) {
    const std::string flag = argv[i];
    if (i + 1 >= argc) {
      std::cerr << "missing value for " << flag << "\n";
      return 1;
    }
    const std::string value = argv[++i];

    if (flag == "--type") {
      auto parsed = ParseSourceType(value);
      if (!parsed) {
        std::cerr << "unsupported type: " << value << "\n";
        return 1;
      }
      req.set_source_type_filter(*parsed);
    } else if (flag == "--since") {
      auto parsed = ParseSince(value);
      if (!parsed) {
        std::cerr << "invalid --since: " << value << "\n";
        return 1;
      }
      req.set_since_millis(*parsed);
    } else if (flag == "--pod") {
      req.set_pod(value);
    } else if (flag == "--container") {
      req.set_container(value);
    } else if (flag == "--format") {
      if (value != "text" && value != "sse") {
        std::cerr << "unsupported format: " << value << "\n";
        return 1;
      }
      sse = value == "sse";
    } else {
      Usage();
      return 1;
    }
  }

  auto channel = grpc::CreateChannel(addr, grpc::InsecureChannelCredentials());
  auto stub    = ReleaseLogService::NewStub(channel);

  grpc::ClientContext ctx;
  g_active_call = &ctx;
  std::signal(SIGINT, HandleSignal);
  std::signal(SIGTERM, HandleSignal);

  // ------------------------------------------------------------

  if (cmd == "stream") {
    auto        reader = stub->StreamLogs(&ctx, req);
    StreamEvent event;
    while (reader->Read(&event)) {
      if (sse) {
        std::cout << releaselog::service::FormatSse(releaselog::service::EncodeSse(event)) << std::flush;
      } else {
        PrintText(event);
      }
    }

    auto status = reader->Finish();
    if (!status.ok() && status.error_code() != grpc::StatusCode::CANCELLED) {
      std::cerr << status.error_message() << "\n";
      return 2;
    }
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "pods") {
    auto        reader = stub->StreamLogs(&ctx, req);
    StreamEvent event;
    while (reader->Read(&event)) {
      if (event.event_case() != StreamEvent::kPods) continue;
      for (const auto& pod : event.pods().pods()) {
        std::cout << pod.namespace_() << '/' << pod.name() << '\t' << (pod.type() == SOURCE_TYPE_JOB ? "job" : "workload") << "\n";
      }
      ctx.TryCancel();
      break;
    }

    auto status = reader->Finish();
    if (!status.ok() && status.error_code() != grpc::StatusCode::CANCELLED) {
      std::cerr << status.error_message() << "\n";
      return 2;
    }
    return 0;
  }

  Usage();
  return 1;
}
