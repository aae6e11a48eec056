#include <cassert>
#include <iostream>
#include <memory>
#include <string>

#include "internal/crypto/encryptor.hpp"
#include "internal/db/memory/memory_store.hpp"
#include "internal/kv/kv_store.hpp"
#include "internal/record/chain.hpp"
#include "internal/record/key_rotation.hpp"
#include "internal/record/record_crypto.hpp"

namespace {

using recsync::crypto::Encryptor;
using recsync::crypto::Scheme;
using recsync::crypto::SecretKey;

const std::string kHost = "0c1d2e3f-0000-4000-8000-000000000001";

void TestRotationRewrapsEveryRecord() {
  auto store     = std::make_shared<recsync::db::memory::MemoryStore>();
  auto locks     = std::make_shared<recsync::record::ChainLocks>();
  auto encryptor = std::make_shared<const Encryptor>(Scheme::kChaCha20Poly1305);
  recsync::kv::KvStore kv(store, locks, encryptor);

  const auto old_key = SecretKey::Generate();
  const auto new_key = SecretKey::Generate();

  for (int i = 0; i < 7; ++i) {
    kv.Set(kHost, old_key, "k" + std::to_string(i % 3), std::to_string(i));
  }

  std::vector<recsync::model::EncryptedRecord> before;
  {
    auto tx = store->Begin();
    before  = store->Page(*tx, 0, 100);
  }
  assert(before.size() == 7);

  // Small pages exercise the paging loop.
  const auto report = recsync::record::RotateMasterKey(*store, *encryptor, old_key, new_key, 3);
  assert(report.rotated == 7);
  assert(report.already_rotated == 0);
  assert(report.failed.empty());

  auto tx = store->Begin();
  for (const auto& original : before) {
    const auto rotated = store->Get(*tx, original.id);
    assert(rotated.has_value());
    assert(rotated->data.data == original.data.data);
    assert(rotated->data.content_encryption_key != original.data.content_encryption_key);
    assert(Encryptor::IsWrappedWith(rotated->data, new_key));
    assert(recsync::record::DecryptRecord(*encryptor, *rotated, new_key).data ==
           recsync::record::DecryptRecord(*encryptor, original, old_key).data);
  }
  tx->Commit();

  assert(kv.Get(kHost, new_key, "k0") == std::string("6"));
  assert(kv.Scan(kHost, new_key, "k2") == std::string("5"));
}

void TestRotationResumes() {
  recsync::db::memory::MemoryStore store;
  recsync::record::ChainLocks      locks;
  const Encryptor                  encryptor;
  const auto                       old_key = SecretKey::Generate();
  const auto                       new_key = SecretKey::Generate();

  for (int i = 0; i < 4; ++i) {
    recsync::record::AppendToChain(store, locks, encryptor, old_key, {kHost, "history", "v0", "cmd " + std::to_string(i)});
  }

  assert(recsync::record::RotateMasterKey(store, encryptor, old_key, new_key).rotated == 4);

  const auto again = recsync::record::RotateMasterKey(store, encryptor, old_key, new_key);
  assert(again.rotated == 0);
  assert(again.already_rotated == 4);
  assert(again.failed.empty());
}

void TestRecordsUnderAnotherKeyAreReported() {
  recsync::db::memory::MemoryStore store;
  recsync::record::ChainLocks      locks;
  const Encryptor                  encryptor;
  const auto                       old_key  = SecretKey::Generate();
  const auto                       new_key  = SecretKey::Generate();
  const auto                       stranger = SecretKey::Generate();

  recsync::record::AppendToChain(store, locks, encryptor, old_key, {kHost, "history", "v0", "mine"});
  const auto foreign = recsync::record::AppendToChain(store, locks, encryptor, stranger, {kHost, "history", "v0", "not mine"});

  const auto report = recsync::record::RotateMasterKey(store, encryptor, old_key, new_key);
  assert(report.rotated == 1);
  assert(report.failed.size() == 1);
  assert(report.failed[0] == foreign.id);

  auto tx = store.Begin();
  assert(store.Get(*tx, foreign.id)->data == foreign.data);
}

} // namespace

int main() {
  TestRotationRewrapsEveryRecord();
  TestRotationResumes();
  TestRecordsUnderAnotherKeyAreReported();

  std::cout << "recsync_unit_key_rotation: pass\n";
  return 0;
}
