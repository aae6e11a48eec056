#pragma once

#include <grpcpp/grpcpp.h>

#include <memory>

#include "internal/service/relay_service.hpp"
#include "recsync/relay/v1/relay_service.grpc.pb.h"

namespace recsync::grpc {

class RelayServer final : public recsync::relay::v1::RecordRelayService::Service {
 public:
  explicit RelayServer(std::shared_ptr<recsync::service::RelayService> svc);

  ::grpc::Status Count(::grpc::ServerContext*, const recsync::relay::v1::CountRequest*, recsync::relay::v1::CountResponse*) override;

  ::grpc::Status Watermark(::grpc::ServerContext*, const recsync::relay::v1::WatermarkRequest*,
                           recsync::relay::v1::WatermarkResponse*) override;

  ::grpc::Status FetchPage(::grpc::ServerContext*, const recsync::relay::v1::FetchPageRequest*,
                           recsync::relay::v1::FetchPageResponse*) override;

  ::grpc::Status PostBatch(::grpc::ServerContext*, const recsync::relay::v1::PostBatchRequest*,
                           recsync::relay::v1::PostBatchResponse*) override;

 private:
  std::shared_ptr<recsync::service::RelayService> service_;
};

} // namespace recsync::grpc
