#include <grpcpp/grpcpp.h>

#include <cassert>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>

#include "internal/grpc/grpc_error.hpp"
#include "internal/grpc/relay_server.hpp"
#include "internal/relay/memory_relay.hpp"
#include "internal/service/relay_service.hpp"
#include "internal/util/errors.hpp"

namespace {

using namespace recsync::relay::v1;

class ConflictingRelay final : public recsync::relay::RelayClient {
 public:
  uint64_t Count(const std::string&) override {
    throw recsync::util::NotFound("scope missing");
  }
  uint64_t Watermark() override {
    throw recsync::util::StoreIoFailure("disk gone");
  }
  std::vector<recsync::model::EncryptedRecord> FetchPage(const recsync::relay::PageRequest&) override {
    throw recsync::util::StoreIoFailure("disk gone");
  }
  uint64_t PostBatch(const std::vector<recsync::model::EncryptedRecord>&) override {
    throw recsync::util::Conflict("busy");
  }
};

recsync::grpc::RelayServer MakeServer(std::shared_ptr<recsync::relay::RelayClient> backend) {
  return recsync::grpc::RelayServer(std::make_shared<recsync::service::RelayService>(std::move(backend)));
}

void TestExceptionMapping() {
  using namespace recsync::util;
  assert(recsync::grpc::ToStatus(NotFound("x")).error_code() == ::grpc::StatusCode::NOT_FOUND);
  assert(recsync::grpc::ToStatus(AlreadyExists("x")).error_code() == ::grpc::StatusCode::ALREADY_EXISTS);
  assert(recsync::grpc::ToStatus(Conflict("x")).error_code() == ::grpc::StatusCode::ABORTED);
  assert(recsync::grpc::ToStatus(SerializationFailure("x")).error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);
  assert(recsync::grpc::ToStatus(StoreIoFailure("x")).error_code() == ::grpc::StatusCode::INTERNAL);
  assert(recsync::grpc::ToStatus(std::runtime_error("x")).error_code() == ::grpc::StatusCode::INTERNAL);
}

void TestClientStatusBecomesTransportFailure() {
  recsync::grpc::ThrowIfNotOk(::grpc::Status::OK, "Count");

  bool threw = false;
  try {
    recsync::grpc::ThrowIfNotOk({::grpc::StatusCode::UNAVAILABLE, "connection refused"}, "FetchPage");
  } catch (const recsync::util::TransportFailure& e) {
    threw = std::string(e.what()).find("connection refused") != std::string::npos;
  }
  assert(threw);
}

void TestPostAndFetchThroughServer() {
  auto server = MakeServer(std::make_shared<recsync::relay::MemoryRelay>());

  WatermarkRequest      mark;
  WatermarkResponse     empty_mark;
  ::grpc::ServerContext empty_mark_ctx;
  assert(server.Watermark(&empty_mark_ctx, &mark, &empty_mark).ok());
  assert(empty_mark.watermark_ns() == 0);

  PostBatchRequest post;
  for (const auto* id : {"r1", "r2"}) {
    auto* record = post.add_records();
    record->set_id(id);
    record->set_host_id("host");
    record->set_category("kv");
    record->set_version("v0");
    record->set_timestamp_ns(id[1] == '1' ? 10 : 20);
  }

  PostBatchResponse     posted;
  ::grpc::ServerContext post_ctx;
  assert(server.PostBatch(&post_ctx, &post, &posted).ok());
  assert(posted.accepted() == 2);

  ::grpc::ServerContext repost_ctx;
  assert(server.PostBatch(&repost_ctx, &post, &posted).ok());
  assert(posted.accepted() == 0);

  WatermarkResponse     marked;
  ::grpc::ServerContext mark_ctx;
  assert(server.Watermark(&mark_ctx, &mark, &marked).ok());
  assert(marked.watermark_ns() > 0);

  CountRequest          count;
  CountResponse         counted;
  ::grpc::ServerContext count_ctx;
  assert(server.Count(&count_ctx, &count, &counted).ok());
  assert(counted.count() == 2);

  FetchPageRequest fetch;
  fetch.set_after_timestamp_ns(15);
  FetchPageResponse     page;
  ::grpc::ServerContext fetch_ctx;
  assert(server.FetchPage(&fetch_ctx, &fetch, &page).ok());
  assert(page.records_size() == 1);
  assert(page.records(0).id() == "r2");
}

void TestMalformedRecordIsInvalidArgument() {
  auto server = MakeServer(std::make_shared<recsync::relay::MemoryRelay>());

  PostBatchRequest post;
  post.add_records()->set_id("no-host");

  PostBatchResponse     resp;
  ::grpc::ServerContext ctx;
  assert(server.PostBatch(&ctx, &post, &resp).error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);
}

void TestBackendErrorsMapToStatus() {
  auto server = MakeServer(std::make_shared<ConflictingRelay>());

  CountRequest          count;
  CountResponse         counted;
  ::grpc::ServerContext count_ctx;
  assert(server.Count(&count_ctx, &count, &counted).error_code() == ::grpc::StatusCode::NOT_FOUND);

  WatermarkRequest      mark;
  WatermarkResponse     marked;
  ::grpc::ServerContext mark_ctx;
  assert(server.Watermark(&mark_ctx, &mark, &marked).error_code() == ::grpc::StatusCode::INTERNAL);

  FetchPageRequest      fetch;
  FetchPageResponse     page;
  ::grpc::ServerContext fetch_ctx;
  assert(server.FetchPage(&fetch_ctx, &fetch, &page).error_code() == ::grpc::StatusCode::INTERNAL);

  PostBatchRequest      post;
  PostBatchResponse     posted;
  ::grpc::ServerContext post_ctx;
  assert(server.PostBatch(&post_ctx, &post, &posted).error_code() == ::grpc::StatusCode::ABORTED);
}

} // namespace

int main() {
  TestExceptionMapping();
  TestClientStatusBecomesTransportFailure();
  TestPostAndFetchThroughServer();
  TestMalformedRecordIsInvalidArgument();
  TestBackendErrorsMapToStatus();

  std::cout << "recsync_unit_grpc_status: pass\n";
  return 0;
}
