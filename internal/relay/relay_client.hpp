#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "internal/model/record.hpp"

namespace recsync::relay {

struct PageRequest {
  // Category filter; empty covers every category.
  std::string scope;
  // Only records the relay received at or after this time.
  uint64_t last_sync_ns = 0;
  // Only records with timestamp >= this value.
  uint64_t after_timestamp_ns = 0;
  uint32_t page_size          = 100;
};

/*
  Untrusted mirror of encrypted records.

  Pages come back ascending by (timestamp, id). Posting a record the relay
  already holds is a no-op. Transport problems raise util::TransportFailure.
*/
class RelayClient {
 public:
  virtual ~RelayClient() = default;

  virtual uint64_t Count(const std::string& scope) = 0;

  // Ingest time of the newest record on the relay's own clock, 0 when empty.
  // Anything accepted later is stamped strictly above it, which makes it the
  // only safe value to hand back as PageRequest::last_sync_ns.
  virtual uint64_t Watermark() = 0;

  virtual std::vector<model::EncryptedRecord> FetchPage(const PageRequest& request) = 0;

  // Returns how many records were new to the relay.
  virtual uint64_t PostBatch(const std::vector<model::EncryptedRecord>& records) = 0;
};

} // namespace recsync::relay
