#pragma once

#include <cstdint>
#include <limits>
#include <string>
#include <tuple>

namespace recsync::db::model {

// Timestamps are persisted as signed 64-bit columns; nothing larger survives a
// round trip through the SQL stores.
inline constexpr uint64_t kMaxTimestampNs = static_cast<uint64_t>(std::numeric_limits<int64_t>::max());

/*
  Position in the global (timestamp, id) order. Ids break timestamp ties so
  records written in the same nanosecond on different hosts are never skipped.
*/
struct RecordCursor {
  uint64_t    timestamp_ns = 0;
  std::string id;

  // Start of a newest-first walk with Before().
  static RecordCursor Newest() {
    return {kMaxTimestampNs, ""};
  }

  // Same position with the timestamp brought into the storable range.
  RecordCursor Clamped() const {
    return timestamp_ns > kMaxTimestampNs ? RecordCursor{kMaxTimestampNs, id} : *this;
  }

  bool operator<(const RecordCursor& other) const {
    return std::tie(timestamp_ns, id) < std::tie(other.timestamp_ns, other.id);
  }
};

} // namespace recsync::db::model
