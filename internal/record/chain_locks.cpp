#include "internal/record/chain_locks.hpp"

#include <functional>

namespace recsync::record {

std::size_t ChainLocks::ShardIndex(const std::string& host_id, const std::string& category) const {
  const std::size_t h = std::hash<std::string>{}(host_id) ^ (std::hash<std::string>{}(category) << 1);
  return h % kChainLockShardCount;
}

std::shared_mutex& ChainLocks::Shard(const std::string& host_id, const std::string& category) {
  return shards_[ShardIndex(host_id, category)];
}

std::unique_lock<std::shared_mutex> ChainLocks::LockForWrite(const std::string& host_id, const std::string& category) {
  return std::unique_lock<std::shared_mutex>(Shard(host_id, category));
}

std::shared_lock<std::shared_mutex> ChainLocks::LockForRead(const std::string& host_id, const std::string& category) {
  return std::shared_lock<std::shared_mutex>(Shard(host_id, category));
}

} // namespace recsync::record
