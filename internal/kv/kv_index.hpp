#pragma once

#include <map>
#include <optional>
#include <string>

#include "internal/crypto/encryptor.hpp"
#include "internal/crypto/secret_key.hpp"
#include "internal/db/api/record_store.hpp"
#include "internal/kv/kv_record.hpp"

namespace recsync::kv {

/*
  Key -> latest value for one host's kv chain.

  Remembers the chain tail it was built against. CatchUp walks back from the
  current tail only as far as that remembered tail, so records appended
  out-of-band (sync downloads, other processes) cost one decrypt each.
  An index that has never been built walks the whole chain.

  Not thread-safe; KvStore serializes access.
*/
class KvIndex {
 public:
  struct Entry {
    std::string value;
    std::string record_id;
  };

  void CatchUp(db::RecordStore& store, db::Transaction& tx, const crypto::Encryptor& encryptor, const crypto::SecretKey& master_key,
               const std::string& host_id);

  // Applies a record just pushed by this process. Returns false (and leaves
  // the index untouched) if `parent` is not the indexed tail.
  bool Advance(const std::optional<std::string>& parent, const std::string& record_id, const KvRecord& record);

  std::optional<Entry> Lookup(const std::string& key) const;

  const std::map<std::string, Entry>& Entries() const {
    return entries_;
  }

  const std::optional<std::string>& IndexedTail() const {
    return tail_id_;
  }

 private:
  std::optional<std::string>   tail_id_;
  bool                         built_ = false;
  std::map<std::string, Entry> entries_;
};

} // namespace recsync::kv
