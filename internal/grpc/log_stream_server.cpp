#include "log_stream_server.hpp"

#include "grpc_error.hpp"

namespace releaselog::grpc {

LogStreamServer::LogStreamServer(std::shared_ptr<releaselog::service::LogStreamService> svc) : service_(std::move(svc)) {
}

::grpc::Status LogStreamServer::StreamLogs(::grpc::ServerContext* ctx, const releaselog::v1::StreamLogsRequest* req,
                                           ::grpc::ServerWriter<releaselog::v1::StreamEvent>* writer) {
  try {
    service_->StreamLogs(
        *req, [writer](const releaselog::v1::StreamEvent& event) { return writer->Write(event); }, [ctx] { return ctx->IsCancelled(); });
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace releaselog::grpc
