#include "relay_server.hpp"

#include "grpc_error.hpp"

namespace recsync::grpc {

using namespace recsync::relay::v1;

RelayServer::RelayServer(std::shared_ptr<recsync::service::RelayService> svc) : service_(std::move(svc)) {
}

::grpc::Status RelayServer::Count(::grpc::ServerContext*, const CountRequest* req, CountResponse* resp) {
  try {
    *resp = service_->Count(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status RelayServer::Watermark(::grpc::ServerContext*, const WatermarkRequest* req, WatermarkResponse* resp) {
  try {
    *resp = service_->Watermark(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status RelayServer::FetchPage(::grpc::ServerContext*, const FetchPageRequest* req, FetchPageResponse* resp) {
  try {
    *resp = service_->FetchPage(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status RelayServer::PostBatch(::grpc::ServerContext*, const PostBatchRequest* req, PostBatchResponse* resp) {
  try {
    *resp = service_->PostBatch(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace recsync::grpc
