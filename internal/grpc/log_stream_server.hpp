#pragma once

#include <memory>

#include <grpcpp/grpcpp.h>

#include "internal/service/log_stream_service.hpp"
#include "releaselog/v1/log_stream_service.grpc.pb.h"

namespace releaselog::grpc {

class LogStreamServer final : public releaselog::v1::ReleaseLogService::Service {
 public:
  explicit LogStreamServer(std::shared_ptr<releaselog::service::LogStreamService> svc);

  ::grpc::Status StreamLogs(::grpc::ServerContext*, const releaselog::v1::StreamLogsRequest*,
                            ::grpc::ServerWriter<releaselog::v1::StreamEvent>*) override;

 private:
  std::shared_ptr<releaselog::service::LogStreamService> service_;
};

} // namespace releaselog::grpc
