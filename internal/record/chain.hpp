#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "internal/crypto/encryptor.hpp"
#include "internal/db/api/record_store.hpp"
#include "internal/model/record.hpp"
#include "internal/record/chain_locks.hpp"

namespace recsync::record {

/*
  Chain operations on top of RecordStore.

  The store returns optionals and result codes; these helpers raise the
  matching util:: exceptions instead.
*/

// Bounded retry for pushes that lost a race for the chain tail.
inline constexpr int kMaxPushAttempts = 8;

uint64_t               Len(db::RecordStore& store, db::Transaction& tx, const std::string& host_id, const std::string& category);
model::EncryptedRecord Last(db::RecordStore& store, db::Transaction& tx, const std::string& host_id, const std::string& category);
model::EncryptedRecord Get(db::RecordStore& store, db::Transaction& tx, const std::string& id);
void                   Push(db::RecordStore& store, db::Transaction& tx, const model::EncryptedRecord& record);

// Builds the record that follows `tail` (or starts a chain). The timestamp
// is max(now, tail + 1) so it strictly increases along the chain.
model::DecryptedRecord NextRecord(const std::optional<model::EncryptedRecord>& tail, const std::string& host_id,
                                  const std::string& category, const std::string& version, std::string bytes);

struct AppendRequest {
  std::string host_id;
  std::string category;
  std::string version;
  std::string bytes;
};

/*
  Encrypts and appends one record as the new tail of its chain.

  Holds the chain's write lock across read-tail and push, and retries with
  a freshly read tail if the push or commit still conflicts (another process
  on the same store). Throws util::Conflict once attempts run out.
*/
model::EncryptedRecord AppendToChain(db::RecordStore& store, ChainLocks& locks, const crypto::Encryptor& encryptor,
                                     const crypto::SecretKey& key, const AppendRequest& request);

struct ChainReport {
  std::string              host_id;
  std::string              category;
  uint64_t                 length = 0;
  uint64_t                 walked = 0;
  std::vector<std::string> problems;

  bool Ok() const {
    return problems.empty();
  }
};

// Walks tail to head and checks linkage, membership, ordering and length.
ChainReport VerifyChain(db::RecordStore& store, const std::string& host_id, const std::string& category);

} // namespace recsync::record
