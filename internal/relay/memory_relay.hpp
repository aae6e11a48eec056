#pragma once

#include <functional>
#include <map>
#include <mutex>
#include <string>

#include "internal/db/model/record_cursor.hpp"
#include "internal/relay/relay_client.hpp"

namespace recsync::relay {

/*
  In-process relay. Backs the relay server and tests; keeps nothing on disk.
*/
class MemoryRelay final : public RelayClient {
 public:
  // `clock` stamps ingest times; defaults to the wall clock.
  explicit MemoryRelay(std::function<uint64_t()> clock = {});

  uint64_t                            Count(const std::string& scope) override;
  uint64_t                            Watermark() override;
  std::vector<model::EncryptedRecord> FetchPage(const PageRequest& request) override;
  uint64_t                            PostBatch(const std::vector<model::EncryptedRecord>& records) override;

  // Ingest time of a stored record, 0 if unknown.
  uint64_t IngestTime(const std::string& id);

 private:
  struct Stored {
    model::EncryptedRecord record;
    uint64_t               ingest_ns = 0;
  };

  std::function<uint64_t()>                       clock_;
  std::mutex                                      mutex_;
  std::map<std::string, Stored>                   records_;
  std::map<db::model::RecordCursor, std::string> ordered_;
  uint64_t                                        last_ingest_ns_ = 0;
};

} // namespace recsync::relay
