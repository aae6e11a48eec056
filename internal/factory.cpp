#include "factory.hpp"

#include <chrono>
#include <filesystem>
#include <fstream>

#include "internal/crypto/master_key.hpp"
#include "internal/db/memory/memory_store.hpp"
#include "internal/db/sql/sql_queries.hpp"
#include "internal/observability/logging.hpp"
#include "internal/relay/memory_relay.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"
#if RECSYNC_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_store.hpp"
#endif
#if RECSYNC_DB_POSTGRES
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_store.hpp"
#endif
#if RECSYNC_WITH_GRPC
#include "client/cpp/relay_client.h"
#include "internal/grpc/relay_server.hpp"
#include "internal/service/relay_service.hpp"
#endif

namespace recsync::factory {

using recsync::runtime::config::RuntimeConfig;

namespace {

#if RECSYNC_DB_SQLITE
void BootstrapSqliteSchema(const std::shared_ptr<db::sqlite::SqliteDB>& sqlite_db) {
  for (const auto& sql : db::sql::SqliteSchema()) {
    sqlite_db->Exec(sql);
  }

  sqlite_db->Exec("SELECT id,host,parent,tag,version,timestamp,data,cek FROM records LIMIT 1;");
  sqlite_db->Exec("SELECT scope,last_sync,updated_at FROM sync_state LIMIT 1;");
}
#endif

#if RECSYNC_DB_POSTGRES
void BootstrapPostgresSchema(const std::shared_ptr<db::postgres::PgPool>& pool) {
  auto       conn = pool->Acquire();
  pqxx::work tx(*conn);

  for (const auto& sql : db::sql::PostgresSchema()) {
    tx.exec(sql);
  }

  tx.exec("SELECT id,host,parent,tag,version,timestamp,data,cek FROM records LIMIT 1;");
  tx.exec("SELECT scope,last_sync,updated_at FROM sync_state LIMIT 1;");
  tx.commit();
}
#endif

std::string Trim(std::string text) {
  const auto first = text.find_first_not_of(" \t\r\n");
  if (first == std::string::npos) return {};
  const auto last = text.find_last_not_of(" \t\r\n");
  return text.substr(first, last - first + 1);
}

} // namespace

std::shared_ptr<db::RecordStore> BuildStore(const RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
#if RECSYNC_DB_SQLITE
    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(database.sqlite().path(), database.sqlite().wal_mode());
    BootstrapSqliteSchema(sqlite_db);
    RECSYNC_LOG_INFO("opened sqlite store", {observability::StringField("path", database.sqlite().path())});
    return std::make_shared<db::sqlite::SqliteStore>(std::move(sqlite_db));
#else
    throw util::StoreIoFailure("sqlite backend requested but not enabled at build time");
#endif
  }

  if (database.has_postgres()) {
#if RECSYNC_DB_POSTGRES
    auto pool = std::make_shared<db::postgres::PgPool>(database.postgres().connection_uri(), database.postgres().max_connections());
    BootstrapPostgresSchema(pool);
    RECSYNC_LOG_INFO("opened postgres store");
    return std::make_shared<db::postgres::PgStore>(std::move(pool));
#else
    throw util::StoreIoFailure("postgres backend requested but not enabled at build time");
#endif
  }

  return std::make_shared<db::memory::MemoryStore>();
}

std::shared_ptr<const crypto::Encryptor> BuildEncryptor(const RuntimeConfig& config) {
  return std::make_shared<const crypto::Encryptor>(crypto::ParseScheme(config.encryption().scheme()));
}

std::string LoadOrCreateHostId(const RuntimeConfig& config) {
  if (!config.host().id().empty()) {
    return config.host().id();
  }

  const auto& path = config.host().id_path();
  if (path.empty()) {
    throw util::SerializationFailure("config needs host.id or host.id_path");
  }

  if (std::filesystem::exists(path)) {
    std::ifstream in(path);
    if (!in) throw util::StoreIoFailure("cannot read host id file " + path);
    std::string id;
    std::getline(in, id);
    id = Trim(std::move(id));
    if (!util::IsUUID(id)) throw util::SerializationFailure("host id file " + path + " does not hold a uuid");
    return id;
  }

  auto          id = util::NewHostId();
  std::ofstream out(path, std::ios::trunc);
  if (!(out << id << '\n')) throw util::StoreIoFailure("cannot write host id file " + path);
  RECSYNC_LOG_INFO("generated host id", {observability::StringField("host_id", id), observability::StringField("path", path)});
  return id;
}

crypto::SecretKey LoadOrCreateMasterKey(const RuntimeConfig& config) {
  if (config.key().path().empty()) {
    throw util::SerializationFailure("config needs key.path");
  }
  return crypto::LoadOrCreateKey(config.key().path());
}

std::shared_ptr<relay::RelayClient> BuildRelayClient(const RuntimeConfig& config) {
  const auto& address = config.relay().address();
  if (address.empty() || address == "memory") {
    return std::make_shared<relay::MemoryRelay>();
  }

#if RECSYNC_WITH_GRPC
  return client::GrpcRelayClient::Connect(address, std::chrono::milliseconds(config.relay().timeout_ms()));
#else
  throw util::TransportFailure("gRPC relay client not enabled at build time");
#endif
}

sync::SyncOptions BuildSyncOptions(const RuntimeConfig& config) {
  sync::SyncOptions options;
  options.scope            = config.relay().scope();
  options.page_size        = config.relay().page_size();
  options.verify_downloads = config.relay().verify_downloads();
  return options;
}

Runtime BuildRuntime(const RuntimeConfig& config) {
  Runtime runtime;
  runtime.host_id   = LoadOrCreateHostId(config);
  runtime.store     = BuildStore(config);
  runtime.locks     = std::make_shared<record::ChainLocks>();
  runtime.encryptor = BuildEncryptor(config);
  runtime.kv        = std::make_shared<kv::KvStore>(runtime.store, runtime.locks, runtime.encryptor);
  return runtime;
}

#if RECSYNC_WITH_GRPC
std::vector<std::unique_ptr<::grpc::Service>> BuildRelayServices(const RuntimeConfig&) {
  auto backend       = std::make_shared<relay::MemoryRelay>();
  auto relay_service = std::make_shared<service::RelayService>(backend);

  std::vector<std::unique_ptr<::grpc::Service>> services;
  services.push_back(std::make_unique<recsync::grpc::RelayServer>(relay_service));
  return services;
}
#endif

} // namespace recsync::factory
