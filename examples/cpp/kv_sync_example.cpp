#include <chrono>
#include <iostream>
#include <memory>
#include <string>

#include "internal/crypto/secret_key.hpp"
#include "internal/factory.hpp"
#include "internal/relay/memory_relay.hpp"
#include "internal/sync/sync_service.hpp"
#include "internal/util/errors.hpp"

#if RECSYNC_WITH_GRPC
#include "client/cpp/relay_client.h"
#endif

namespace {

recsync::factory::Runtime MakeHost(const std::string& host_id) {
  recsync::runtime::config::RuntimeConfig config;
  config.mutable_host()->set_id(host_id);
  config.mutable_database()->mutable_memory();
  config.mutable_encryption()->set_scheme("chacha20-poly1305");
  return recsync::factory::BuildRuntime(config);
}

} // namespace

int main(int argc, char** argv) {
  // With an address, both hosts sync through a running record-relay.
  std::shared_ptr<recsync::relay::RelayClient> relay;
  if (argc > 1) {
#if RECSYNC_WITH_GRPC
    relay = recsync::client::GrpcRelayClient::Connect(argv[1], std::chrono::seconds(5));
#else
    std::cerr << "built without gRPC; run without arguments for an in-process relay\n";
    return 1;
#endif
  } else {
    relay = std::make_shared<recsync::relay::MemoryRelay>();
  }

  // Both hosts share one master key; the relay only ever sees ciphertext.
  const auto key    = recsync::crypto::SecretKey::Generate();
  auto       laptop = MakeHost("3f6d1c2a-8b4e-4f0a-9c1d-2e7b5a6c8d90");
  auto       server = MakeHost("a1b2c3d4-e5f6-4a7b-8c9d-0e1f2a3b4c5d");

  try {
    laptop.kv->Set(laptop.host_id, key, "editor", "vim");
    laptop.kv->Set(laptop.host_id, key, "shell", "zsh");
    laptop.kv->Set(laptop.host_id, key, "editor", "helix");

    recsync::sync::SyncService push(laptop.store, relay, laptop.encryptor);
    const auto                 uploaded = push.Sync(key, {});
    if (!uploaded.Ok()) {
      std::cerr << "upload failed: " << uploaded.error << '\n';
      return 1;
    }

    recsync::sync::SyncService pull(server.store, relay, server.encryptor);
    const auto                 downloaded = pull.Sync(key, {});
    if (!downloaded.Ok()) {
      std::cerr << "download failed: " << downloaded.error << '\n';
      return 1;
    }

    std::cout << "uploaded " << uploaded.uploaded << " records, downloaded " << downloaded.downloaded << '\n';
    for (const auto& [name, value] : server.kv->List(laptop.host_id, key)) {
      std::cout << "  " << name << " = " << value << '\n';
    }
  } catch (const std::exception& e) {
    std::cerr << "example failed: " << e.what() << '\n';
    return 1;
  }

  return 0;
}
