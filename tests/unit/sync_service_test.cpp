#include <cassert>
#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <set>
#include <stop_token>
#include <string>
#include <vector>

#include "internal/crypto/encryptor.hpp"
#include "internal/db/memory/memory_store.hpp"
#include "internal/factory.hpp"
#include "internal/kv/kv_store.hpp"
#include "internal/record/chain.hpp"
#include "internal/relay/memory_relay.hpp"
#include "internal/sync/sync_service.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"

namespace {

using recsync::crypto::Encryptor;
using recsync::crypto::SecretKey;
using recsync::db::RecordStore;
using recsync::relay::MemoryRelay;
using recsync::sync::SyncOptions;
using recsync::sync::SyncService;

struct Host {
  explicit Host(std::shared_ptr<RecordStore> s = std::make_shared<recsync::db::memory::MemoryStore>()) : store(std::move(s)) {
  }

  std::string                                  id = recsync::util::NewHostId();
  std::shared_ptr<RecordStore>                 store;
  std::shared_ptr<recsync::record::ChainLocks> locks     = std::make_shared<recsync::record::ChainLocks>();
  std::shared_ptr<const Encryptor>             encryptor = std::make_shared<const Encryptor>();
  recsync::kv::KvStore                         kv{store, locks, encryptor};

  std::set<std::string> Ids() {
    auto                  tx = store->Begin();
    std::set<std::string> out;
    for (const auto& r : store->Page(*tx, 0, 10000)) out.insert(r.id);
    return out;
  }
};

// Hands out a fresh, empty store per call.
struct StoreBackend {
  std::string                                   name;
  std::function<std::shared_ptr<RecordStore>()> make_store;
  std::function<void()>                         cleanup;
};

StoreBackend MakeMemoryBackend() {
  return StoreBackend{
      .name       = "memory",
      .make_store = []() -> std::shared_ptr<RecordStore> { return std::make_shared<recsync::db::memory::MemoryStore>(); },
      .cleanup    = []() {},
  };
}

#if RECSYNC_DB_SQLITE
StoreBackend MakeSqliteBackend() {
  auto paths = std::make_shared<std::vector<std::string>>();

  auto make_store = [paths]() {
    const auto name = "recsync_sync_sqlite_" + std::to_string(recsync::util::NowNanos()) + "_" + std::to_string(paths->size()) + ".db";
    paths->push_back((std::filesystem::temp_directory_path() / name).string());

    recsync::runtime::config::RuntimeConfig config;
    config.mutable_database()->mutable_sqlite()->set_path(paths->back());
    return recsync::factory::BuildStore(config);
  };

  return StoreBackend{
      .name       = "sqlite",
      .make_store = make_store,
      .cleanup    = [paths]() {
        for (const auto& path : *paths) std::filesystem::remove(path);
      },
  };
}
#endif

// Requests a stop once the first page has been handed out.
class StopAfterFirstPage final : public recsync::relay::RelayClient {
 public:
  StopAfterFirstPage(std::shared_ptr<MemoryRelay> inner, std::stop_source& source) : inner_(std::move(inner)), source_(source) {
  }

  uint64_t Count(const std::string& scope) override {
    return inner_->Count(scope);
  }
  uint64_t Watermark() override {
    return inner_->Watermark();
  }
  std::vector<recsync::model::EncryptedRecord> FetchPage(const recsync::relay::PageRequest& request) override {
    auto page = inner_->FetchPage(request);
    source_.request_stop();
    return page;
  }
  uint64_t PostBatch(const std::vector<recsync::model::EncryptedRecord>& records) override {
    return inner_->PostBatch(records);
  }

 private:
  std::shared_ptr<MemoryRelay> inner_;
  std::stop_source&            source_;
};

class UnreachableForPosts final : public recsync::relay::RelayClient {
 public:
  explicit UnreachableForPosts(std::shared_ptr<MemoryRelay> inner) : inner_(std::move(inner)) {
  }

  uint64_t Count(const std::string& scope) override {
    return inner_->Count(scope);
  }
  uint64_t Watermark() override {
    return inner_->Watermark();
  }
  std::vector<recsync::model::EncryptedRecord> FetchPage(const recsync::relay::PageRequest& request) override {
    return inner_->FetchPage(request);
  }
  uint64_t PostBatch(const std::vector<recsync::model::EncryptedRecord>&) override {
    throw recsync::util::TransportFailure("relay unreachable");
  }

 private:
  std::shared_ptr<MemoryRelay> inner_;
};

void TestTwoHostsConverge(const StoreBackend& backend) {
  const auto key   = SecretKey::Generate();
  auto       relay = std::make_shared<MemoryRelay>();
  Host       a(backend.make_store());
  Host       b(backend.make_store());

  for (int i = 0; i < 5; ++i) {
    a.kv.Set(a.id, key, "k" + std::to_string(i), "v" + std::to_string(i));
  }

  SyncService sync_a(a.store, relay, a.encryptor);
  const auto  up = sync_a.Sync(key, {});
  assert(up.Ok());
  assert(up.uploaded == 5);
  assert(up.downloaded == 0);
  assert(up.remote_count == 5);
  assert(relay->Count("") == 5);

  SyncService sync_b(b.store, relay, b.encryptor);
  const auto  down = sync_b.Sync(key, {});
  assert(down.Ok());
  assert(down.downloaded == 5);
  assert(down.uploaded == 0);
  assert(down.local_count == 5);
  assert(a.Ids() == b.Ids());

  // The downloaded chain reads back on the other host.
  assert(b.kv.Get(a.id, key, "k3") == std::string("v3"));
  assert(b.kv.List(a.id, key).size() == 5);
  assert(recsync::record::VerifyChain(*b.store, a.id, "kv").Ok());

  auto tx    = b.store->Begin();
  auto state = b.store->GetSyncState(*tx, "");
  assert(state.has_value());
  assert(state->last_sync_ns > 0);
  assert(state->last_sync_ns == relay->Watermark());
}

void TestSyncIsIdempotentAndIncremental(const StoreBackend& backend) {
  const auto key   = SecretKey::Generate();
  auto       relay = std::make_shared<MemoryRelay>();
  Host       a(backend.make_store());
  Host       b(backend.make_store());
  SyncService sync_a(a.store, relay, a.encryptor);
  SyncService sync_b(b.store, relay, b.encryptor);

  a.kv.Set(a.id, key, "x", "1");
  a.kv.Set(a.id, key, "y", "2");
  assert(sync_a.Sync(key, {}).Ok());
  assert(sync_b.Sync(key, {}).Ok());

  const auto again = sync_a.Sync(key, {});
  assert(again.Ok());
  assert(again.uploaded == 0);
  assert(again.downloaded == 0);

  b.kv.Set(b.id, key, "z", "3");
  b.kv.Set(b.id, key, "w", "4");
  const auto push = sync_b.Sync(key, {});
  assert(push.uploaded == 2);

  const auto pull = sync_a.Sync(key, {});
  assert(pull.Ok());
  assert(pull.downloaded == 2);
  assert(a.Ids() == b.Ids());
  assert(a.kv.Get(b.id, key, "z") == std::string("3"));
  assert(relay->Count("") == 4);
}

void TestCancellationKeepsProgress() {
  const auto key   = SecretKey::Generate();
  auto       relay = std::make_shared<MemoryRelay>();
  Host       a;
  Host       b;

  for (int i = 0; i < 5; ++i) a.kv.Set(a.id, key, "k", std::to_string(i));
  assert(SyncService(a.store, relay, a.encryptor).Sync(key, {}).Ok());

  std::stop_source source;
  SyncService      stopping(b.store, std::make_shared<StopAfterFirstPage>(relay, source), b.encryptor);

  SyncOptions options;
  options.page_size = 2;

  const auto partial = stopping.Sync(key, options, source.get_token());
  assert(partial.cancelled);
  assert(!partial.Ok());
  assert(partial.downloaded == 2);
  {
    auto tx = b.store->Begin();
    assert(!b.store->GetSyncState(*tx, "").has_value());
  }

  const auto rest = SyncService(b.store, relay, b.encryptor).Sync(key, options);
  assert(rest.Ok());
  assert(rest.downloaded == 3);
  assert(b.Ids() == a.Ids());
}

void TestVerifyDownloadsRejectsTamperedRecords() {
  const auto key   = SecretKey::Generate();
  auto       relay = std::make_shared<MemoryRelay>();
  Host       a;
  Host       b;

  for (int i = 0; i < 3; ++i) a.kv.Set(a.id, key, "k" + std::to_string(i), "v");
  assert(SyncService(a.store, relay, a.encryptor).Sync(key, {}).Ok());

  // Same ciphertext relabelled as another host's record.
  auto forged = relay->FetchPage({"", 0, 0, 1}).front();
  forged.id      = recsync::util::NewRecordId();
  forged.host_id = b.id;
  forged.parent.reset();
  relay->PostBatch({forged});

  SyncOptions options;
  options.verify_downloads = true;

  const auto report = SyncService(b.store, relay, b.encryptor).Sync(key, options);
  assert(report.Ok());
  assert(report.rejected >= 1);
  assert(report.downloaded == 3);

  auto tx = b.store->Begin();
  assert(!b.store->Get(*tx, forged.id).has_value());
  assert(b.store->Count(*tx, "") == 3);
}

void TestScopeLimitsSync() {
  const auto key   = SecretKey::Generate();
  auto       relay = std::make_shared<MemoryRelay>();
  Host       a;

  a.kv.Set(a.id, key, "k", "v");
  recsync::record::AppendToChain(*a.store, *a.locks, *a.encryptor, key, {a.id, "history", "v0", "ls -la"});

  SyncOptions options;
  options.scope = "history";
  const auto report = SyncService(a.store, relay, a.encryptor).Sync(key, options);
  assert(report.Ok());
  assert(report.uploaded == 1);
  assert(relay->Count("") == 1);
  assert(relay->Count("kv") == 0);
}

// The relay stamps ingest times an hour behind the hosts. Records another
// host posts after a sync must still come down on the next one.
void TestRelayClockBehindHosts() {
  constexpr uint64_t kSkewNs = 3600ULL * 1000000000ULL;

  const auto key   = SecretKey::Generate();
  auto       relay = std::make_shared<MemoryRelay>([] { return recsync::util::NowNanos() - kSkewNs; });
  Host       a;
  Host       b;
  SyncService sync_a(a.store, relay, a.encryptor);
  SyncService sync_b(b.store, relay, b.encryptor);

  a.kv.Set(a.id, key, "x", "1");
  assert(sync_a.Sync(key, {}).uploaded == 1);
  assert(sync_a.Sync(key, {}).Ok());
  {
    auto       tx        = a.store->Begin();
    const auto last_sync = a.store->GetSyncState(*tx, "")->last_sync_ns;
    assert(last_sync == relay->Watermark());
    assert(last_sync < recsync::util::NowNanos() - kSkewNs / 2);
  }

  b.kv.Set(b.id, key, "y", "2");
  const auto posted = sync_b.Sync(key, {});
  assert(posted.Ok());
  assert(posted.downloaded == 1);
  assert(posted.uploaded == 1);

  const auto pulled = sync_a.Sync(key, {});
  assert(pulled.Ok());
  assert(pulled.downloaded == 1);
  assert(pulled.local_count == pulled.remote_count);
  assert(a.kv.Get(b.id, key, "y") == std::string("2"));
  assert(a.Ids() == b.Ids());
}

void TestTransportFailureIsReported() {
  const auto key   = SecretKey::Generate();
  auto       relay = std::make_shared<MemoryRelay>();
  Host       a;

  a.kv.Set(a.id, key, "k", "v");

  const auto report = SyncService(a.store, std::make_shared<UnreachableForPosts>(relay), a.encryptor).Sync(key, {});
  assert(!report.Ok());
  assert(!report.cancelled);
  assert(report.error.find("relay unreachable") != std::string::npos);
  assert(report.uploaded == 0);

  auto tx = a.store->Begin();
  assert(!a.store->GetSyncState(*tx, "").has_value());
}

} // namespace

int main() {
  std::vector<StoreBackend> backends;
  backends.push_back(MakeMemoryBackend());
#if RECSYNC_DB_SQLITE
  backends.push_back(MakeSqliteBackend());
#endif

  for (const auto& backend : backends) {
    std::cout << "running sync over: " << backend.name << "\n";
    TestTwoHostsConverge(backend);
    TestSyncIsIdempotentAndIncremental(backend);
    backend.cleanup();
  }

  TestCancellationKeepsProgress();
  TestVerifyDownloadsRejectsTamperedRecords();
  TestScopeLimitsSync();
  TestRelayClockBehindHosts();
  TestTransportFailureIsReported();

  std::cout << "recsync_unit_sync_service: pass\n";
  return 0;
}
