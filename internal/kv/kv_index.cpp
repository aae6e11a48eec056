#include "internal/kv/kv_index.hpp"

#include "internal/observability/logging.hpp"
#include "internal/record/chain.hpp"
#include "internal/record/record_crypto.hpp"

namespace recsync::kv {

void KvIndex::CatchUp(db::RecordStore& store, db::Transaction& tx, const crypto::Encryptor& encryptor,
                      const crypto::SecretKey& master_key, const std::string& host_id) {
  const std::string category(kKvCategory);

  auto tail = store.Last(tx, host_id, category);
  if (!tail) {
    tail_id_.reset();
    entries_.clear();
    built_ = true;
    return;
  }
  if (built_ && tail_id_ == tail->id) {
    return;
  }

  // Newest first; the first sighting of a key wins.
  std::map<std::string, Entry> fresh;
  bool                         reached_indexed_tail = false;
  uint64_t                     walked               = 0;

  std::optional<model::EncryptedRecord> current = std::move(tail);
  const std::string                     new_tail = current->id;
  while (current) {
    if (built_ && tail_id_ == current->id) {
      reached_indexed_tail = true;
      break;
    }
    const auto plain = record::DecryptRecord(encryptor, *current, master_key);
    auto       kv    = DecodeKvRecord(plain.version, plain.data.bytes);
    fresh.try_emplace(kv.key, Entry{std::move(kv.value), current->id});
    ++walked;

    if (!current->parent) break;
    current = record::Get(store, tx, *current->parent);
  }

  if (!reached_indexed_tail) {
    entries_.clear();
  }
  for (auto& [key, entry] : fresh) {
    entries_[key] = std::move(entry);
  }
  tail_id_ = new_tail;
  built_   = true;

  RECSYNC_LOG_DEBUG("kv index caught up", {observability::UintField("records", walked), observability::BoolField("rebuilt", !reached_indexed_tail)});
}

bool KvIndex::Advance(const std::optional<std::string>& parent, const std::string& record_id, const KvRecord& record) {
  if (!built_ || parent != tail_id_) {
    return false;
  }
  entries_[record.key] = Entry{record.value, record_id};
  tail_id_             = record_id;
  return true;
}

std::optional<KvIndex::Entry> KvIndex::Lookup(const std::string& key) const {
  const auto it = entries_.find(key);
  if (it == entries_.end()) return std::nullopt;
  return it->second;
}

} // namespace recsync::kv
