#pragma once

#include <cstdint>
#include <string>

namespace recsync::db::model {

// Download watermark for one relay scope ("" = every category). last_sync_ns
// is a relay ingest time, never a local clock reading.
struct SyncStateRecord {
  std::string scope;
  uint64_t    last_sync_ns = 0;
  uint64_t    updated_at_ns = 0;
};

} // namespace recsync::db::model
