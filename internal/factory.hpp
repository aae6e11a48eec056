#pragma once

#include <memory>
#include <string>
#include <vector>

#include "config/config.pb.h"
#include "internal/crypto/encryptor.hpp"
#include "internal/crypto/secret_key.hpp"
#include "internal/db/api/record_store.hpp"
#include "internal/kv/kv_store.hpp"
#include "internal/record/chain_locks.hpp"
#include "internal/relay/relay_client.hpp"
#include "internal/sync/sync_service.hpp"
#if RECSYNC_WITH_GRPC
#include <grpcpp/impl/service_type.h>
#endif

namespace recsync::factory {

/*
  Runtime

  Owns the long-lived objects a client process works with. The master key
  is deliberately not part of it: callers load it once and pass it to each
  operation.
*/
struct Runtime {
  std::string host_id;

  std::shared_ptr<db::RecordStore>         store;
  std::shared_ptr<record::ChainLocks>      locks;
  std::shared_ptr<const crypto::Encryptor> encryptor;
  std::shared_ptr<kv::KvStore>             kv;
};

/*
  Composition root. The only place that knows concrete store and relay
  types.
*/

std::shared_ptr<db::RecordStore> BuildStore(const recsync::runtime::config::RuntimeConfig& config);

std::shared_ptr<const crypto::Encryptor> BuildEncryptor(const recsync::runtime::config::RuntimeConfig& config);

// host.id if set, otherwise the id stored at host.id_path (generated and
// written there on first use).
std::string LoadOrCreateHostId(const recsync::runtime::config::RuntimeConfig& config);

crypto::SecretKey LoadOrCreateMasterKey(const recsync::runtime::config::RuntimeConfig& config);

// "memory" gives a process-local relay; anything else is a gRPC address.
std::shared_ptr<relay::RelayClient> BuildRelayClient(const recsync::runtime::config::RuntimeConfig& config);

sync::SyncOptions BuildSyncOptions(const recsync::runtime::config::RuntimeConfig& config);

Runtime BuildRuntime(const recsync::runtime::config::RuntimeConfig& config);

#if RECSYNC_WITH_GRPC
// gRPC services of the relay server, backed by an in-memory relay.
std::vector<std::unique_ptr<::grpc::Service>> BuildRelayServices(const recsync::runtime::config::RuntimeConfig& config);
#endif

} // namespace recsync::factory
