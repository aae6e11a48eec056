#include "pg_store.hpp"

#include "internal/util/errors.hpp"

namespace recsync::db::postgres {

using recsync::model::EncryptedRecord;

namespace {

EncryptedRecord ReadRecord(const pqxx::row& row) {
  EncryptedRecord r;
  r.id = row[0].as<std::string>();
  r.host_id = row[1].as<std::string>();
  if (!row[2].is_null()) r.parent = row[2].as<std::string>();
  r.category                    = row[3].as<std::string>();
  r.version                     = row[4].as<std::string>();
  r.timestamp_ns                = static_cast<uint64_t>(row[5].as<int64_t>());
  r.data.data                   = row[6].as<std::string>();
  r.data.content_encryption_key = row[7].as<std::string>();
  return r;
}

std::vector<EncryptedRecord> ReadRecords(const pqxx::result& res) {
  std::vector<EncryptedRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) {
    out.push_back(ReadRecord(row));
  }
  return out;
}

std::optional<EncryptedRecord> ReadOne(const pqxx::result& res) {
  if (res.empty()) return std::nullopt;
  return ReadRecord(res[0]);
}

// Reads surface backend failures as util::StoreIoFailure.
template <typename Fn>
auto Read(const char* what, Fn&& fn) -> decltype(fn()) {
  try {
    return fn();
  } catch (const pqxx::failure& e) {
    throw util::StoreIoFailure(std::string("postgres ") + what + ": " + e.what());
  } catch (const pqxx::conversion_error& e) {
    throw util::StoreIoFailure(std::string("postgres ") + what + ": " + e.what());
  }
}

int64_t AsParam(uint64_t value) {
  return static_cast<int64_t>(value);
}

} // namespace

PgStore::PgStore(std::shared_ptr<PgPool> pool) : pool_(std::move(pool)) {
}

std::unique_ptr<db::Transaction> PgStore::Begin() {
  return std::make_unique<PgTransaction>(pool_);
}

PgTransaction& PgStore::TX(Transaction& t) {
  return static_cast<PgTransaction&>(t);
}

Result PgStore::Translate(const std::exception& e) {
  if (dynamic_cast<const pqxx::unique_violation*>(&e)) {
    return Result::Err(ErrorCode::AlreadyExists, e.what());
  }
  if (dynamic_cast<const pqxx::integrity_constraint_violation*>(&e)) {
    return Result::Err(ErrorCode::ConstraintViolation, e.what());
  }
  if (dynamic_cast<const pqxx::serialization_failure*>(&e) || dynamic_cast<const pqxx::deadlock_detected*>(&e)) {
    return Result::Err(ErrorCode::Conflict, e.what());
  }
  if (dynamic_cast<const pqxx::broken_connection*>(&e)) {
    return Result::Err(ErrorCode::IOError, e.what());
  }
  return Result::Err(ErrorCode::InternalError, e.what());
}

uint64_t PgStore::Len(Transaction& t, const std::string& host_id, const std::string& category) {
  return Read("len", [&] { return TX(t).Work().exec_prepared1("chain_len", host_id, category)[0].as<uint64_t>(); });
}

std::optional<EncryptedRecord> PgStore::Last(Transaction& t, const std::string& host_id, const std::string& category) {
  return Read("last", [&] { return ReadOne(TX(t).Work().exec_prepared("chain_last", host_id, category)); });
}

std::optional<EncryptedRecord> PgStore::First(Transaction& t, const std::string& host_id, const std::string& category) {
  return Read("first", [&] { return ReadOne(TX(t).Work().exec_prepared("chain_first", host_id, category)); });
}

std::optional<EncryptedRecord> PgStore::Get(Transaction& t, const std::string& id) {
  return Read("get", [&] { return ReadOne(TX(t).Work().exec_prepared("get_record", id)); });
}

Result PgStore::Push(Transaction& t, const EncryptedRecord& r) {
  try {
    auto& work = TX(t).Work();
    // Serializes pushes to one chain until this transaction ends.
    work.exec_prepared("chain_lock", r.host_id, r.category);

    if (!work.exec_prepared("get_record", r.id).empty()) {
      return Result::Err(ErrorCode::AlreadyExists, r.id);
    }

    const auto tail = ReadOne(work.exec_prepared("chain_last", r.host_id, r.category));
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

    work.exec_prepared("insert_record", r.id, r.host_id, r.parent, r.category, r.version, AsParam(r.timestamp_ns), r.data.data,
                       r.data.content_encryption_key);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::ChainRecord> PgStore::Chains(Transaction& t) {
  return Read("chains", [&] {
    std::vector<model::ChainRecord> out;
    for (const auto& row : TX(t).Work().exec_prepared("chains")) {
      out.push_back({row[0].as<std::string>(), row[1].as<std::string>(), row[2].as<uint64_t>()});
    }
    return out;
  });
}

uint64_t PgStore::Count(Transaction& t, const std::string& scope) {
  return Read("count", [&] {
    auto& work = TX(t).Work();
    auto  row  = scope.empty() ? work.exec_prepared1("count_all") : work.exec_prepared1("count_tag", scope);
    return row[0].as<uint64_t>();
  });
}

std::vector<EncryptedRecord> PgStore::Before(Transaction& t, const std::string& scope, const model::RecordCursor& before, uint32_t limit) {
  const auto cursor = before.Clamped();
  return Read("before", [&] {
    auto& work = TX(t).Work();
    if (scope.empty()) {
      return ReadRecords(work.exec_prepared("before_all", AsParam(cursor.timestamp_ns), cursor.id, static_cast<int64_t>(limit)));
    }
    return ReadRecords(work.exec_prepared("before_tag", AsParam(cursor.timestamp_ns), cursor.id, static_cast<int64_t>(limit), scope));
  });
}

Result PgStore::SaveBatch(Transaction& t, const std::vector<EncryptedRecord>& records, uint64_t& inserted) {
  inserted = 0;
  try {
    auto& work = TX(t).Work();
    for (const auto& r : records) {
      auto res = work.exec_prepared("insert_record_if_absent", r.id, r.host_id, r.parent, r.category, r.version, AsParam(r.timestamp_ns),
                                    r.data.data, r.data.content_encryption_key);
      inserted += static_cast<uint64_t>(res.affected_rows());
    }
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::SyncStateRecord> PgStore::GetSyncState(Transaction& t, const std::string& scope) {
  return Read("sync state", [&]() -> std::optional<model::SyncStateRecord> {
    auto res = TX(t).Work().exec_prepared("get_sync_state", scope);
    if (res.empty()) return std::nullopt;

    model::SyncStateRecord r;
    r.scope         = res[0][0].as<std::string>();
    r.last_sync_ns  = static_cast<uint64_t>(res[0][1].as<int64_t>());
    r.updated_at_ns = static_cast<uint64_t>(res[0][2].as<int64_t>());
    return r;
  });
}

Result PgStore::CommitSyncState(Transaction& t, const model::SyncStateRecord& r) {
  try {
    TX(t).Work().exec_prepared("upsert_sync_state", r.scope, AsParam(r.last_sync_ns), AsParam(r.updated_at_ns));
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<EncryptedRecord> PgStore::Page(Transaction& t, uint64_t offset, uint32_t limit) {
  return Read("page", [&] { return ReadRecords(TX(t).Work().exec_prepared("page", static_cast<int64_t>(limit), AsParam(offset))); });
}

Result PgStore::UpdateWrappedKey(Transaction& t, const std::string& id, const std::string& content_encryption_key) {
  try {
    auto res = TX(t).Work().exec_prepared("update_cek", id, content_encryption_key);
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::NotFound, id);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

} // namespace recsync::db::postgres
