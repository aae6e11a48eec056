#pragma once

#include <array>
#include <cstddef>
#include <mutex>
#include <shared_mutex>
#include <string>

namespace recsync::record {

/*
  Per-chain writer serialization. Chains hash onto a fixed set of shards;
  unrelated chains that share a shard only contend on writes.
*/
class ChainLocks {
 public:
  static constexpr std::size_t kChainLockShardCount = 64;

  std::unique_lock<std::shared_mutex> LockForWrite(const std::string& host_id, const std::string& category);
  std::shared_lock<std::shared_mutex> LockForRead(const std::string& host_id, const std::string& category);

 private:
  std::size_t        ShardIndex(const std::string& host_id, const std::string& category) const;
  std::shared_mutex& Shard(const std::string& host_id, const std::string& category);

  std::array<std::shared_mutex, kChainLockShardCount> shards_;
};

} // namespace recsync::record
