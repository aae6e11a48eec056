#include "internal/service/relay_service.hpp"

#include <algorithm>
#include <chrono>
#include <type_traits>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/relay/record_proto.hpp"

namespace recsync::service {

using namespace recsync::relay::v1;

namespace {

// Largest page the relay hands out regardless of what the client asks for.
constexpr uint32_t kMaxPageSize = 1000;

template <typename Fn>
auto ObserveRpc(std::string_view route, Fn&& fn) {
  observability::SpanScope span(route);

  const auto started_at = std::chrono::steady_clock::now();
  const auto elapsed_ms = [&] { return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_at).count(); };
  try {
    auto result = fn();
    observability::Metrics::Instance().RecordRequest(route, true);
    observability::Metrics::Instance().ObserveRequestLatencyMs(route, elapsed_ms());
    return result;
  } catch (const std::exception& ex) {
    span.RecordException(ex.what());
    RECSYNC_LOG_ERROR("RPC failed", {observability::StringField("route", route), observability::StringField("error", ex.what())});
    observability::Metrics::Instance().RecordRequest(route, false);
    observability::Metrics::Instance().ObserveRequestLatencyMs(route, elapsed_ms());
    throw;
  }
}

} // namespace

RelayService::RelayService(std::shared_ptr<relay::RelayClient> backend) : backend_(std::move(backend)) {
}

CountResponse RelayService::Count(const CountRequest& req) {
  return ObserveRpc("relay.Count", [&] {
    CountResponse resp;
    resp.set_count(backend_->Count(req.scope()));
    return resp;
  });
}

WatermarkResponse RelayService::Watermark(const WatermarkRequest&) {
  return ObserveRpc("relay.Watermark", [&] {
    WatermarkResponse resp;
    resp.set_watermark_ns(backend_->Watermark());
    return resp;
  });
}

FetchPageResponse RelayService::FetchPage(const FetchPageRequest& req) {
  return ObserveRpc("relay.FetchPage", [&] {
    relay::PageRequest page;
    page.scope              = req.scope();
    page.last_sync_ns       = req.last_sync_ns();
    page.after_timestamp_ns = req.after_timestamp_ns();
    page.page_size          = req.page_size() == 0 ? 100 : std::min(req.page_size(), kMaxPageSize);

    FetchPageResponse resp;
    for (const auto& record : backend_->FetchPage(page)) {
      *resp.add_records() = relay::ToProto(record);
    }
    return resp;
  });
}

PostBatchResponse RelayService::PostBatch(const PostBatchRequest& req) {
  return ObserveRpc("relay.PostBatch", [&] {
    std::vector<model::EncryptedRecord> records;
    records.reserve(req.records_size());
    for (const auto& record : req.records()) {
      records.push_back(relay::FromProto(record));
    }

    PostBatchResponse resp;
    resp.set_accepted(backend_->PostBatch(records));
    RECSYNC_LOG_DEBUG("batch posted", {observability::UintField("records", records.size()),
                                       observability::UintField("accepted", resp.accepted())});
    return resp;
  });
}

} // namespace recsync::service
