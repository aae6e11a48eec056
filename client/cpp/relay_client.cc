#include "relay_client.h"

#include <grpcpp/client_context.h>
#include <grpcpp/create_channel.h>
#include <grpcpp/security/credentials.h>

#include "internal/grpc/grpc_error.hpp"
#include "internal/relay/record_proto.hpp"
#include "internal/util/errors.hpp"

namespace recsync::client {

using namespace recsync::relay::v1;

GrpcRelayClient::GrpcRelayClient(std::shared_ptr<::grpc::Channel> channel, std::chrono::milliseconds timeout)
    : stub_(RecordRelayService::NewStub(std::move(channel))), timeout_(timeout) {
}

std::shared_ptr<GrpcRelayClient> GrpcRelayClient::Connect(const std::string& address, std::chrono::milliseconds timeout) {
  return std::make_shared<GrpcRelayClient>(::grpc::CreateChannel(address, ::grpc::InsecureChannelCredentials()), timeout);
}

void GrpcRelayClient::PrepareContext(::grpc::ClientContext& context) const {
  if (timeout_.count() > 0) {
    context.set_deadline(std::chrono::system_clock::now() + timeout_);
  }
}

uint64_t GrpcRelayClient::Count(const std::string& scope) {
  CountRequest req;
  req.set_scope(scope);

  CountResponse       resp;
  ::grpc::ClientContext ctx;
  PrepareContext(ctx);
  recsync::grpc::ThrowIfNotOk(stub_->Count(&ctx, req, &resp), "Count");
  return resp.count();
}

uint64_t GrpcRelayClient::Watermark() {
  WatermarkResponse     resp;
  ::grpc::ClientContext ctx;
  PrepareContext(ctx);
  recsync::grpc::ThrowIfNotOk(stub_->Watermark(&ctx, WatermarkRequest{}, &resp), "Watermark");
  return resp.watermark_ns();
}

std::vector<model::EncryptedRecord> GrpcRelayClient::FetchPage(const relay::PageRequest& request) {
  FetchPageRequest req;
  req.set_scope(request.scope);
  req.set_last_sync_ns(request.last_sync_ns);
  req.set_after_timestamp_ns(request.after_timestamp_ns);
  req.set_page_size(request.page_size);

  FetchPageResponse   resp;
  ::grpc::ClientContext ctx;
  PrepareContext(ctx);
  recsync::grpc::ThrowIfNotOk(stub_->FetchPage(&ctx, req, &resp), "FetchPage");

  std::vector<model::EncryptedRecord> out;
  out.reserve(resp.records_size());
  for (const auto& record : resp.records()) {
    try {
      out.push_back(relay::FromProto(record));
    } catch (const util::SerializationFailure& ex) {
      throw util::TransportFailure(std::string("FetchPage returned a malformed record: ") + ex.what());
    }
  }
  return out;
}

uint64_t GrpcRelayClient::PostBatch(const std::vector<model::EncryptedRecord>& records) {
  PostBatchRequest req;
  for (const auto& record : records) {
    *req.add_records() = relay::ToProto(record);
  }

  PostBatchResponse   resp;
  ::grpc::ClientContext ctx;
  PrepareContext(ctx);
  recsync::grpc::ThrowIfNotOk(stub_->PostBatch(&ctx, req, &resp), "PostBatch");
  return resp.accepted();
}

} // namespace recsync::client
