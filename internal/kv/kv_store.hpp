#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "internal/crypto/encryptor.hpp"
#include "internal/crypto/secret_key.hpp"
#include "internal/db/api/record_store.hpp"
#include "internal/kv/kv_index.hpp"
#include "internal/record/chain_locks.hpp"

namespace recsync::kv {

/*
  Typed key/value service over a host's "kv" chain.

  Every Set appends one record; the latest record for a key wins. Get answers
  from an in-memory index, Scan walks the chain directly. Both agree.
*/
class KvStore {
 public:
  KvStore(std::shared_ptr<db::RecordStore> store, std::shared_ptr<record::ChainLocks> locks,
          std::shared_ptr<const crypto::Encryptor> encryptor);

  // Returns the id of the appended record.
  std::string Set(const std::string& host_id, const crypto::SecretKey& master_key, const std::string& key, const std::string& value);

  std::optional<std::string> Get(const std::string& host_id, const crypto::SecretKey& master_key, const std::string& key);

  // Linear tail-to-head walk without the index.
  std::optional<std::string> Scan(const std::string& host_id, const crypto::SecretKey& master_key, const std::string& key);

  std::map<std::string, std::string> List(const std::string& host_id, const crypto::SecretKey& master_key);

 private:
  KvIndex& CaughtUpIndex(const std::string& host_id, const crypto::SecretKey& master_key);

  std::shared_ptr<db::RecordStore>         store_;
  std::shared_ptr<record::ChainLocks>      locks_;
  std::shared_ptr<const crypto::Encryptor> encryptor_;

  std::mutex                     index_mu_;
  // Keyed by host id and master key id.
  std::map<std::string, KvIndex> indices_;
};

} // namespace recsync::kv
