#include "sqlite_store.hpp"

#include <sqlite3.h>

#include "internal/db/sql/sql_queries.hpp"
#include "internal/util/errors.hpp"

namespace recsync::db::sqlite {

using recsync::model::EncryptedRecord;

static void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
  sqlite3_bind_text(st, idx, s.c_str(), static_cast<int>(s.size()), SQLITE_TRANSIENT);
}

static void BindOptionalText(sqlite3_stmt* st, int idx, const std::optional<std::string>& s) {
  if (s) {
    BindText(st, idx, *s);
  } else {
    sqlite3_bind_null(st, idx);
  }
}

static void BindU64(sqlite3_stmt* st, int idx, uint64_t v) {
  sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

static std::string ColText(sqlite3_stmt* st, int col) {
  const unsigned char* t = sqlite3_column_text(st, col);
  return t ? std::string(reinterpret_cast<const char*>(t), static_cast<size_t>(sqlite3_column_bytes(st, col))) : "";
}

static std::optional<std::string> ColOptionalText(sqlite3_stmt* st, int col) {
  if (sqlite3_column_type(st, col) == SQLITE_NULL) return std::nullopt;
  return ColText(st, col);
}

static uint64_t ColU64(sqlite3_stmt* st, int col) {
  return static_cast<uint64_t>(sqlite3_column_int64(st, col));
}

static void BindRecord(sqlite3_stmt* st, const EncryptedRecord& r) {
  BindText(st, 1, r.id);
  BindText(st, 2, r.host_id);
  BindOptionalText(st, 3, r.parent);
  BindText(st, 4, r.category);
  BindText(st, 5, r.version);
  BindU64(st, 6, r.timestamp_ns);
  BindText(st, 7, r.data.data);
  BindText(st, 8, r.data.content_encryption_key);
}

static EncryptedRecord ReadRecord(sqlite3_stmt* st) {
  EncryptedRecord r;
  r.id                          = ColText(st, 0);
  r.host_id                     = ColText(st, 1);
  r.parent                      = ColOptionalText(st, 2);
  r.category                    = ColText(st, 3);
  r.version                     = ColText(st, 4);
  r.timestamp_ns                = ColU64(st, 5);
  r.data.data                   = ColText(st, 6);
  r.data.content_encryption_key = ColText(st, 7);
  return r;
}

// Steps a read statement to completion, throwing on backend errors.
static std::vector<EncryptedRecord> ReadRecords(sqlite3* db, sqlite3_stmt* st) {
  std::vector<EncryptedRecord> out;
  for (;;) {
    const int rc = sqlite3_step(st);
    if (rc == SQLITE_ROW) {
      out.push_back(ReadRecord(st));
      continue;
    }
    if (rc == SQLITE_DONE) return out;
    throw util::StoreIoFailure(std::string("sqlite read: ") + sqlite3_errmsg(db));
  }
}

static std::optional<EncryptedRecord> ReadOne(sqlite3* db, sqlite3_stmt* st) {
  auto rows = ReadRecords(db, st);
  if (rows.empty()) return std::nullopt;
  return std::move(rows.front());
}

static uint64_t ReadCount(sqlite3* db, sqlite3_stmt* st) {
  const int rc = sqlite3_step(st);
  if (rc != SQLITE_ROW) {
    throw util::StoreIoFailure(std::string("sqlite count: ") + sqlite3_errmsg(db));
  }
  return ColU64(st, 0);
}

SqliteStore::SqliteStore(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {
}

std::unique_ptr<db::Transaction> SqliteStore::Begin() {
  return std::make_unique<SqliteTransaction>(db_);
}

SqliteTransaction& SqliteStore::TX(Transaction& t) {
  return static_cast<SqliteTransaction&>(t);
}

Result SqliteStore::Translate(sqlite3* db, int rc) {
  if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW) return Result::Ok();

  switch (rc & 0xFF) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
    case SQLITE_CONSTRAINT:
      return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
    case SQLITE_IOERR:
    case SQLITE_FULL:
      return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
    case SQLITE_CORRUPT:
      return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
    default:
      return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  }
}

// ------------------------------------------------------------------
// Chains
// ------------------------------------------------------------------

uint64_t SqliteStore::Len(Transaction& t, const std::string& host_id, const std::string& category) {
  auto& db = TX(t).DB();
  auto  st = db.Prepare(sql::COUNT_CHAIN);
  BindText(st.get(), 1, host_id);
  BindText(st.get(), 2, category);
  return ReadCount(db.Handle(), st.get());
}

std::optional<EncryptedRecord> SqliteStore::Last(Transaction& t, const std::string& host_id, const std::string& category) {
  auto& db = TX(t).DB();
  auto  st = db.Prepare(sql::SELECT_CHAIN_LAST);
  BindText(st.get(), 1, host_id);
  BindText(st.get(), 2, category);
  return ReadOne(db.Handle(), st.get());
}

std::optional<EncryptedRecord> SqliteStore::First(Transaction& t, const std::string& host_id, const std::string& category) {
  auto& db = TX(t).DB();
  auto  st = db.Prepare(sql::SELECT_CHAIN_FIRST);
  BindText(st.get(), 1, host_id);
  BindText(st.get(), 2, category);
  return ReadOne(db.Handle(), st.get());
}

std::optional<EncryptedRecord> SqliteStore::Get(Transaction& t, const std::string& id) {
  auto& db = TX(t).DB();
  auto  st = db.Prepare(sql::SELECT_RECORD);
  BindText(st.get(), 1, id);
  return ReadOne(db.Handle(), st.get());
}

Result SqliteStore::Insert(SqliteDB& db, const char* sql, const EncryptedRecord& r, bool& inserted) {
  auto st = db.Prepare(sql);
  BindRecord(st.get(), r);
  const int rc = sqlite3_step(st.get());
  inserted     = rc == SQLITE_DONE && sqlite3_changes(db.Handle()) > 0;
  return Translate(db.Handle(), rc);
}

Result SqliteStore::Push(Transaction& t, const EncryptedRecord& r) {
  auto& db = TX(t).DB();

  if (Get(t, r.id)) {
    return Result::Err(ErrorCode::AlreadyExists, r.id);
  }

  const auto tail = Last(t, r.host_id, r.category);
  if (!tail) {
    if (r.parent) return Result::Err(ErrorCode::Conflict, "chain is empty but record has a parent");
  } else {
    if (!r.parent || *r.parent != tail->id) {
      return Result::Err(ErrorCode::Conflict, "parent is not the chain tail " + tail->id);
    }
    if (r.timestamp_ns <= tail->timestamp_ns) {
      return Result::Err(ErrorCode::ConstraintViolation, "timestamp does not advance past parent");
    }
  }

  bool inserted = false;
  return Insert(db, sql::INSERT_RECORD, r, inserted);
}

std::vector<model::ChainRecord> SqliteStore::Chains(Transaction& t) {
  auto& db = TX(t).DB();
  auto  st = db.Prepare(sql::SELECT_CHAINS);

  std::vector<model::ChainRecord> out;
  for (;;) {
    const int rc = sqlite3_step(st.get());
    if (rc == SQLITE_ROW) {
      out.push_back({ColText(st.get(), 0), ColText(st.get(), 1), ColU64(st.get(), 2)});
      continue;
    }
    if (rc == SQLITE_DONE) return out;
    throw util::StoreIoFailure(std::string("sqlite chains: ") + sqlite3_errmsg(db.Handle()));
  }
}

// ------------------------------------------------------------------
// Sync
// ------------------------------------------------------------------

uint64_t SqliteStore::Count(Transaction& t, const std::string& scope) {
  auto& db = TX(t).DB();
  if (scope.empty()) {
    auto st = db.Prepare(sql::COUNT_ALL);
    return ReadCount(db.Handle(), st.get());
  }
  auto st = db.Prepare(sql::COUNT_TAG);
  BindText(st.get(), 1, scope);
  return ReadCount(db.Handle(), st.get());
}

std::vector<EncryptedRecord> SqliteStore::Before(Transaction& t, const std::string& scope, const model::RecordCursor& before,
                                                 uint32_t limit) {
  auto& db = TX(t).DB();
  auto  st = db.Prepare(scope.empty() ? sql::SELECT_BEFORE_ALL : sql::SELECT_BEFORE_TAG);
  // An unclamped cursor past INT64_MAX binds as a negative number and matches nothing.
  const auto cursor = before.Clamped();
  BindU64(st.get(), 1, cursor.timestamp_ns);
  BindText(st.get(), 2, cursor.id);
  BindU64(st.get(), 3, limit);
  if (!scope.empty()) {
    BindText(st.get(), 4, scope);
  }
  return ReadRecords(db.Handle(), st.get());
}

Result SqliteStore::SaveBatch(Transaction& t, const std::vector<EncryptedRecord>& records, uint64_t& inserted) {
  auto& db = TX(t).DB();
  inserted = 0;
  for (const auto& r : records) {
    bool added = false;
    auto res   = Insert(db, sql::INSERT_RECORD_IF_ABSENT, r, added);
    if (!res) return res;
    if (added) ++inserted;
  }
  return Result::Ok();
}

std::optional<model::SyncStateRecord> SqliteStore::GetSyncState(Transaction& t, const std::string& scope) {
  auto& db = TX(t).DB();
  auto  st = db.Prepare(sql::SELECT_SYNC_STATE);
  BindText(st.get(), 1, scope);

  const int rc = sqlite3_step(st.get());
  if (rc == SQLITE_DONE) return std::nullopt;
  if (rc != SQLITE_ROW) {
    throw util::StoreIoFailure(std::string("sqlite sync state: ") + sqlite3_errmsg(db.Handle()));
  }

  model::SyncStateRecord r;
  r.scope         = ColText(st.get(), 0);
  r.last_sync_ns  = ColU64(st.get(), 1);
  r.updated_at_ns = ColU64(st.get(), 2);
  return r;
}

Result SqliteStore::CommitSyncState(Transaction& t, const model::SyncStateRecord& r) {
  auto& db = TX(t).DB();
  auto  st = db.Prepare(sql::UPSERT_SYNC_STATE);
  BindText(st.get(), 1, r.scope);
  BindU64(st.get(), 2, r.last_sync_ns);
  BindU64(st.get(), 3, r.updated_at_ns);
  return Translate(db.Handle(), sqlite3_step(st.get()));
}

// ------------------------------------------------------------------
// Maintenance
// ------------------------------------------------------------------

std::vector<EncryptedRecord> SqliteStore::Page(Transaction& t, uint64_t offset, uint32_t limit) {
  auto& db = TX(t).DB();
  auto  st = db.Prepare(sql::SELECT_PAGE);
  BindU64(st.get(), 1, limit);
  BindU64(st.get(), 2, offset);
  return ReadRecords(db.Handle(), st.get());
}

Result SqliteStore::UpdateWrappedKey(Transaction& t, const std::string& id, const std::string& content_encryption_key) {
  auto& db = TX(t).DB();
  auto  st = db.Prepare(sql::UPDATE_WRAPPED_KEY);
  BindText(st.get(), 1, content_encryption_key);
  BindText(st.get(), 2, id);

  const int rc = sqlite3_step(st.get());
  if (rc == SQLITE_DONE && sqlite3_changes(db.Handle()) == 0) {
    return Result::Err(ErrorCode::NotFound, id);
  }
  return Translate(db.Handle(), rc);
}

} // namespace recsync::db::sqlite
