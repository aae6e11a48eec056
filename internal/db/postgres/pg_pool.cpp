#include "pg_pool.hpp"

namespace recsync::db::postgres {

namespace {

constexpr const char* kRecordColumns = "id,host,parent,tag,version,timestamp,data,cek";

std::string Select(const std::string& tail) {
  return std::string("SELECT ") + kRecordColumns + " FROM records " + tail;
}

} // namespace

PgPool::PgPool(std::string conninfo, std::size_t max_connections)
    : conninfo_(std::move(conninfo)), max_connections_(max_connections == 0 ? 1 : max_connections) {
}

std::shared_ptr<pqxx::connection> PgPool::Acquire() {
  std::unique_lock lock(mutex_);
  cv_.wait(lock, [this] { return !idle_.empty() || live_connections_ < max_connections_; });

  if (!idle_.empty()) {
    auto conn = std::move(idle_.back());
    idle_.pop_back();
    return Wrap(conn.release());
  }

  ++live_connections_;
  lock.unlock();

  try {
    auto conn = std::make_unique<pqxx::connection>(conninfo_);
    PrepareStatements(*conn);
    return Wrap(conn.release());
  } catch (const std::exception&) {
    std::lock_guard rollback_lock(mutex_);
    --live_connections_;
    cv_.notify_one();
    throw;
  }
}

void PgPool::PrepareStatements(pqxx::connection& conn) {
  conn.prepare("insert_record", std::string("INSERT INTO records(") + kRecordColumns + ") VALUES($1,$2,$3,$4,$5,$6,$7,$8)");
  conn.prepare("insert_record_if_absent",
               std::string("INSERT INTO records(") + kRecordColumns + ") VALUES($1,$2,$3,$4,$5,$6,$7,$8) ON CONFLICT(id) DO NOTHING");
  conn.prepare("get_record", Select("WHERE id=$1"));
  conn.prepare("chain_last", Select("WHERE host=$1 AND tag=$2 ORDER BY timestamp DESC, id DESC LIMIT 1"));
  conn.prepare("chain_first", Select("WHERE host=$1 AND tag=$2 ORDER BY timestamp ASC, id ASC LIMIT 1"));
  conn.prepare("chain_len", "SELECT COUNT(*) FROM records WHERE host=$1 AND tag=$2");
  conn.prepare("chain_lock", "SELECT pg_advisory_xact_lock(hashtext($1 || '/' || $2))");
  conn.prepare("chains", "SELECT host,tag,COUNT(*) FROM records GROUP BY host,tag ORDER BY host,tag");
  conn.prepare("count_all", "SELECT COUNT(*) FROM records");
  conn.prepare("count_tag", "SELECT COUNT(*) FROM records WHERE tag=$1");
  conn.prepare("before_all", Select("WHERE (timestamp < $1 OR (timestamp = $1 AND id < $2)) ORDER BY timestamp DESC, id DESC LIMIT $3"));
  conn.prepare("before_tag",
               Select("WHERE tag=$4 AND (timestamp < $1 OR (timestamp = $1 AND id < $2)) ORDER BY timestamp DESC, id DESC LIMIT $3"));
  conn.prepare("page", Select("ORDER BY timestamp ASC, id ASC LIMIT $1 OFFSET $2"));
  conn.prepare("update_cek", "UPDATE records SET cek=$2 WHERE id=$1");
  conn.prepare("get_sync_state", "SELECT scope,last_sync,updated_at FROM sync_state WHERE scope=$1");
  conn.prepare("upsert_sync_state",
               "INSERT INTO sync_state(scope,last_sync,updated_at) VALUES($1,$2,$3)"
               " ON CONFLICT(scope) DO UPDATE SET last_sync=excluded.last_sync, updated_at=excluded.updated_at");
}

std::shared_ptr<pqxx::connection> PgPool::Wrap(pqxx::connection* conn) {
  std::weak_ptr<PgPool> weak_self = shared_from_this();
  return std::shared_ptr<pqxx::connection>(conn, [weak_self](pqxx::connection* released_conn) {
    if (auto self = weak_self.lock()) {
      self->Release(released_conn);
      return;
    }
    delete released_conn;
  });
}

void PgPool::Release(pqxx::connection* conn) {
  {
    std::lock_guard lock(mutex_);
    idle_.emplace_back(conn);
  }
  cv_.notify_one();
}

} // namespace recsync::db::postgres
