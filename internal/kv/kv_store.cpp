#include "internal/kv/kv_store.hpp"

#include "internal/crypto/key_wrap.hpp"
#include "internal/observability/logging.hpp"
#include "internal/record/chain.hpp"
#include "internal/record/record_crypto.hpp"

namespace recsync::kv {

namespace {

// One index per (host, master key); values cached under one key are never
// served to a caller holding another.
std::string IndexKey(const std::string& host_id, const crypto::SecretKey& master_key) {
  return host_id + "/" + crypto::KeyId(master_key);
}

} // namespace

KvStore::KvStore(std::shared_ptr<db::RecordStore> store, std::shared_ptr<record::ChainLocks> locks,
                 std::shared_ptr<const crypto::Encryptor> encryptor)
    : store_(std::move(store)), locks_(std::move(locks)), encryptor_(std::move(encryptor)) {
}

std::string KvStore::Set(const std::string& host_id, const crypto::SecretKey& master_key, const std::string& key, const std::string& value) {
  const KvRecord kv{key, value};

  record::AppendRequest request;
  request.host_id  = host_id;
  request.category = std::string(kKvCategory);
  request.version  = std::string(kKvVersion);
  request.bytes    = EncodeKvRecord(kv);

  const auto appended = record::AppendToChain(*store_, *locks_, *encryptor_, master_key, request);

  {
    std::lock_guard lock(index_mu_);
    auto            it = indices_.find(IndexKey(host_id, master_key));
    if (it != indices_.end()) {
      it->second.Advance(appended.parent, appended.id, kv);
    }
  }

  RECSYNC_LOG_DEBUG("kv set", {observability::StringField("record_id", appended.id)});
  return appended.id;
}

KvIndex& KvStore::CaughtUpIndex(const std::string& host_id, const crypto::SecretKey& master_key) {
  auto& index = indices_[IndexKey(host_id, master_key)];
  auto  tx    = store_->Begin();
  index.CatchUp(*store_, *tx, *encryptor_, master_key, host_id);
  tx->Commit();
  return index;
}

std::optional<std::string> KvStore::Get(const std::string& host_id, const crypto::SecretKey& master_key, const std::string& key) {
  std::lock_guard lock(index_mu_);
  const auto      entry = CaughtUpIndex(host_id, master_key).Lookup(key);
  if (!entry) return std::nullopt;
  return entry->value;
}

std::optional<std::string> KvStore::Scan(const std::string& host_id, const crypto::SecretKey& master_key, const std::string& key) {
  auto tx      = store_->Begin();
  auto current = store_->Last(*tx, host_id, std::string(kKvCategory));

  std::optional<std::string> found;
  while (current) {
    const auto plain = record::DecryptRecord(*encryptor_, *current, master_key);
    auto       kv    = DecodeKvRecord(plain.version, plain.data.bytes);
    if (kv.key == key) {
      found = std::move(kv.value);
      break;
    }
    if (!current->parent) break;
    current = record::Get(*store_, *tx, *current->parent);
  }

  tx->Commit();
  return found;
}

std::map<std::string, std::string> KvStore::List(const std::string& host_id, const crypto::SecretKey& master_key) {
  std::lock_guard                    lock(index_mu_);
  std::map<std::string, std::string> out;
  for (const auto& [key, entry] : CaughtUpIndex(host_id, master_key).Entries()) {
    out.emplace(key, entry.value);
  }
  return out;
}

} // namespace recsync::kv
