#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <string>

#include "client/cpp/relay_client.h"
#include "internal/db/memory/memory_store.hpp"
#include "internal/factory.hpp"
#include "internal/kv/kv_store.hpp"
#include "internal/record/chain.hpp"
#include "internal/runtime/server.hpp"
#include "internal/sync/sync_service.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace {

using recsync::client::GrpcRelayClient;
using recsync::crypto::Encryptor;
using recsync::crypto::SecretKey;
using recsync::sync::SyncService;

constexpr std::chrono::milliseconds kTimeout{2000};

struct Host {
  std::string                                       id        = recsync::util::NewHostId();
  std::shared_ptr<recsync::db::memory::MemoryStore> store     = std::make_shared<recsync::db::memory::MemoryStore>();
  std::shared_ptr<recsync::record::ChainLocks>      locks     = std::make_shared<recsync::record::ChainLocks>();
  std::shared_ptr<const Encryptor>                  encryptor = std::make_shared<const Encryptor>();
  recsync::kv::KvStore                              kv{store, locks, encryptor};
};

std::unique_ptr<recsync::runtime::Server> StartRelay() {
  recsync::runtime::config::RuntimeConfig config;
  config.mutable_server()->set_bind_address("127.0.0.1:0");

  auto server = std::make_unique<recsync::runtime::Server>(config.server().bind_address(), recsync::factory::BuildRelayServices(config));
  server->Start();
  assert(server->Port() > 0);
  return server;
}

std::string Address(const recsync::runtime::Server& server) {
  return "127.0.0.1:" + std::to_string(server.Port());
}

void TestTwoHostsSyncThroughRelay() {
  auto       server = StartRelay();
  const auto key    = SecretKey::Generate();
  Host       a;
  Host       b;

  for (int i = 0; i < 7; ++i) {
    a.kv.Set(a.id, key, "k" + std::to_string(i % 3), "v" + std::to_string(i));
  }
  b.kv.Set(b.id, key, "theme", "dark");

  recsync::sync::SyncOptions options;
  options.page_size        = 3;
  options.verify_downloads = true;

  SyncService sync_a(a.store, GrpcRelayClient::Connect(Address(*server), kTimeout), a.encryptor);
  SyncService sync_b(b.store, GrpcRelayClient::Connect(Address(*server), kTimeout), b.encryptor);

  const auto first = sync_a.Sync(key, options);
  assert(first.Ok());
  assert(first.uploaded == 7);
  assert(first.remote_count == 7);

  const auto second = sync_b.Sync(key, options);
  assert(second.Ok());
  assert(second.downloaded == 7);
  assert(second.uploaded == 1);
  assert(second.rejected == 0);
  assert(second.local_count == 8);

  const auto third = sync_a.Sync(key, options);
  assert(third.Ok());
  assert(third.downloaded == 1);
  assert(third.uploaded == 0);

  // last_sync is the relay's ingest watermark, read back over the wire.
  {
    auto tx = a.store->Begin();
    assert(a.store->GetSyncState(*tx, "")->last_sync_ns == GrpcRelayClient::Connect(Address(*server), kTimeout)->Watermark());
  }

  assert(a.kv.Get(b.id, key, "theme") == std::string("dark"));
  assert(b.kv.Get(a.id, key, "k0") == std::string("v6"));
  assert(b.kv.List(a.id, key).size() == 3);
  assert(recsync::record::VerifyChain(*b.store, a.id, "kv").Ok());

  server->Stop();
}

void TestStoppedRelayReportsTransportError() {
  auto       server  = StartRelay();
  const auto address = Address(*server);
  server->Stop();

  const auto key = SecretKey::Generate();
  Host       a;
  a.kv.Set(a.id, key, "k", "v");

  auto client = GrpcRelayClient::Connect(address, std::chrono::milliseconds(500));

  bool threw = false;
  try {
    (void)client->Count("");
  } catch (const recsync::util::TransportFailure&) {
    threw = true;
  }
  assert(threw);

  const auto report = SyncService(a.store, client, a.encryptor).Sync(key, {});
  assert(!report.Ok());
  assert(!report.error.empty());
  assert(report.uploaded == 0);

  // A failed run leaves no watermark behind.
  auto tx = a.store->Begin();
  assert(!a.store->GetSyncState(*tx, "").has_value());
}

} // namespace

int main() {
  TestTwoHostsSyncThroughRelay();
  TestStoppedRelayReportsTransportError();

  std::cout << "recsync_integration_grpc_relay: pass\n";
  return 0;
}
