#include "internal/relay/memory_relay.hpp"

#include <algorithm>

#include "internal/util/time.hpp"

namespace recsync::relay {

MemoryRelay::MemoryRelay(std::function<uint64_t()> clock) : clock_(std::move(clock)) {
  if (!clock_) {
    clock_ = util::NowNanos;
  }
}

uint64_t MemoryRelay::Count(const std::string& scope) {
  std::lock_guard lock(mutex_);
  if (scope.empty()) return records_.size();
  return static_cast<uint64_t>(std::count_if(records_.begin(), records_.end(),
                                             [&](const auto& entry) { return entry.second.record.category == scope; }));
}

uint64_t MemoryRelay::Watermark() {
  std::lock_guard lock(mutex_);
  return last_ingest_ns_;
}

std::vector<model::EncryptedRecord> MemoryRelay::FetchPage(const PageRequest& request) {
  std::lock_guard                     lock(mutex_);
  std::vector<model::EncryptedRecord> out;

  for (auto it = ordered_.lower_bound({request.after_timestamp_ns, ""}); it != ordered_.end() && out.size() < request.page_size; ++it) {
    const auto& stored = records_.at(it->second);
    if (stored.ingest_ns < request.last_sync_ns) continue;
    if (!request.scope.empty() && stored.record.category != request.scope) continue;
    out.push_back(stored.record);
  }
  return out;
}

uint64_t MemoryRelay::PostBatch(const std::vector<model::EncryptedRecord>& records) {
  std::lock_guard lock(mutex_);
  uint64_t        accepted = 0;
  for (const auto& record : records) {
    if (records_.contains(record.id)) continue;

    // Strictly increasing so a watermark taken between two posts splits them.
    last_ingest_ns_ = std::max(clock_(), last_ingest_ns_ + 1);
    records_.emplace(record.id, Stored{record, last_ingest_ns_});
    ordered_.emplace(db::model::RecordCursor{record.timestamp_ns, record.id}, record.id);
    ++accepted;
  }
  return accepted;
}

uint64_t MemoryRelay::IngestTime(const std::string& id) {
  std::lock_guard lock(mutex_);
  const auto      it = records_.find(id);
  return it == records_.end() ? 0 : it->second.ingest_ns;
}

} // namespace recsync::relay
