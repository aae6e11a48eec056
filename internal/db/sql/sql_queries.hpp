#pragma once

#include <string>
#include <vector>

namespace recsync::db::sql {

/*
  Canonical SQL for the SQLite backend. The Postgres backend prepares the
  same statements with $n placeholders (see pg_pool.cpp).

  Column order of every SELECT on records matches RECORD_COLUMNS.
*/

#define RECSYNC_RECORD_COLUMNS "id,host,parent,tag,version,timestamp,data,cek"

static constexpr const char* INSERT_RECORD =
    "INSERT INTO records(" RECSYNC_RECORD_COLUMNS ") VALUES(?,?,?,?,?,?,?,?);";

static constexpr const char* INSERT_RECORD_IF_ABSENT =
    "INSERT INTO records(" RECSYNC_RECORD_COLUMNS ") VALUES(?,?,?,?,?,?,?,?)"
    " ON CONFLICT(id) DO NOTHING;";

static constexpr const char* SELECT_RECORD =
    "SELECT " RECSYNC_RECORD_COLUMNS " FROM records WHERE id=?;";

static constexpr const char* SELECT_CHAIN_LAST =
    "SELECT " RECSYNC_RECORD_COLUMNS " FROM records WHERE host=? AND tag=?"
    " ORDER BY timestamp DESC, id DESC LIMIT 1;";

static constexpr const char* SELECT_CHAIN_FIRST =
    "SELECT " RECSYNC_RECORD_COLUMNS " FROM records WHERE host=? AND tag=?"
    " ORDER BY timestamp ASC, id ASC LIMIT 1;";

static constexpr const char* COUNT_CHAIN =
    "SELECT COUNT(*) FROM records WHERE host=? AND tag=?;";

static constexpr const char* COUNT_ALL =
    "SELECT COUNT(*) FROM records;";

static constexpr const char* COUNT_TAG =
    "SELECT COUNT(*) FROM records WHERE tag=?;";

static constexpr const char* SELECT_CHAINS =
    "SELECT host,tag,COUNT(*) FROM records GROUP BY host,tag ORDER BY host,tag;";

// ?1 timestamp, ?2 id, ?3 limit
static constexpr const char* SELECT_BEFORE_ALL =
    "SELECT " RECSYNC_RECORD_COLUMNS " FROM records"
    " WHERE (timestamp < ?1 OR (timestamp = ?1 AND id < ?2))"
    " ORDER BY timestamp DESC, id DESC LIMIT ?3;";

// ?4 tag
static constexpr const char* SELECT_BEFORE_TAG =
    "SELECT " RECSYNC_RECORD_COLUMNS " FROM records"
    " WHERE tag=?4 AND (timestamp < ?1 OR (timestamp = ?1 AND id < ?2))"
    " ORDER BY timestamp DESC, id DESC LIMIT ?3;";

static constexpr const char* SELECT_PAGE =
    "SELECT " RECSYNC_RECORD_COLUMNS " FROM records ORDER BY timestamp ASC, id ASC LIMIT ? OFFSET ?;";

static constexpr const char* UPDATE_WRAPPED_KEY =
    "UPDATE records SET cek=? WHERE id=?;";

static constexpr const char* SELECT_SYNC_STATE =
    "SELECT scope,last_sync,updated_at FROM sync_state WHERE scope=?;";

static constexpr const char* UPSERT_SYNC_STATE =
    "INSERT INTO sync_state(scope,last_sync,updated_at) VALUES(?,?,?)"
    " ON CONFLICT(scope) DO UPDATE SET last_sync=excluded.last_sync, updated_at=excluded.updated_at;";

inline const std::vector<std::string>& SqliteSchema() {
  static const std::vector<std::string> kSchema = {
      "CREATE TABLE IF NOT EXISTS records (id TEXT PRIMARY KEY, host TEXT NOT NULL, parent TEXT, tag TEXT NOT NULL,"
      " version TEXT NOT NULL, timestamp INTEGER NOT NULL, data TEXT NOT NULL, cek TEXT NOT NULL);",
      "CREATE INDEX IF NOT EXISTS records_chain_idx ON records(host, tag, timestamp);",
      "CREATE INDEX IF NOT EXISTS records_order_idx ON records(timestamp, id);",
      "CREATE TABLE IF NOT EXISTS sync_state (scope TEXT PRIMARY KEY, last_sync INTEGER NOT NULL, updated_at INTEGER NOT NULL);"};
  return kSchema;
}

inline const std::vector<std::string>& PostgresSchema() {
  static const std::vector<std::string> kSchema = {
      "CREATE TABLE IF NOT EXISTS records (id TEXT PRIMARY KEY, host TEXT NOT NULL, parent TEXT, tag TEXT NOT NULL,"
      " version TEXT NOT NULL, timestamp BIGINT NOT NULL, data TEXT NOT NULL, cek TEXT NOT NULL);",
      "CREATE INDEX IF NOT EXISTS records_chain_idx ON records(host, tag, timestamp);",
      "CREATE INDEX IF NOT EXISTS records_order_idx ON records(timestamp, id);",
      "CREATE TABLE IF NOT EXISTS sync_state (scope TEXT PRIMARY KEY, last_sync BIGINT NOT NULL, updated_at BIGINT NOT NULL);"};
  return kSchema;
}

} // namespace recsync::db::sql
