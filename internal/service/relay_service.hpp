#pragma once

#include <memory>

#include "internal/relay/relay_client.hpp"
#include "recsync/relay/v1/relay_service.pb.h"

namespace recsync::service {

/*
  Server side of the relay protocol, independent of the transport.
  Records are stored by whatever RelayClient backs it.
*/
class RelayService {
 public:
  explicit RelayService(std::shared_ptr<relay::RelayClient> backend);

  recsync::relay::v1::CountResponse     Count(const recsync::relay::v1::CountRequest& req);
  recsync::relay::v1::WatermarkResponse Watermark(const recsync::relay::v1::WatermarkRequest& req);
  recsync::relay::v1::FetchPageResponse FetchPage(const recsync::relay::v1::FetchPageRequest& req);
  recsync::relay::v1::PostBatchResponse PostBatch(const recsync::relay::v1::PostBatchRequest& req);

 private:
  std::shared_ptr<relay::RelayClient> backend_;
};

} // namespace recsync::service
