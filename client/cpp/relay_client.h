#pragma once

#include <grpcpp/channel.h>

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

#include "internal/relay/relay_client.hpp"
#include "recsync/relay/v1/relay_service.grpc.pb.h"

namespace recsync::client {

/*
  RelayClient over the RecordRelayService gRPC API. Every call carries the
  configured deadline; a non-OK status becomes util::TransportFailure.
*/
class GrpcRelayClient final : public relay::RelayClient {
 public:
  GrpcRelayClient(std::shared_ptr<::grpc::Channel> channel, std::chrono::milliseconds timeout);

  // Insecure channel to "host:port".
  static std::shared_ptr<GrpcRelayClient> Connect(const std::string& address, std::chrono::milliseconds timeout);

  uint64_t                            Count(const std::string& scope) override;
  uint64_t                            Watermark() override;
  std::vector<model::EncryptedRecord> FetchPage(const relay::PageRequest& request) override;
  uint64_t                            PostBatch(const std::vector<model::EncryptedRecord>& records) override;

 private:
  void PrepareContext(::grpc::ClientContext& context) const;

  std::unique_ptr<recsync::relay::v1::RecordRelayService::Stub> stub_;
  std::chrono::milliseconds                                     timeout_;
};

} // namespace recsync::client
