#pragma once

#include <memory>

#include "internal/db/api/record_store.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace recsync::db::sqlite {

class SqliteStore final : public db::RecordStore {
 public:
  explicit SqliteStore(std::shared_ptr<SqliteDB> db);

  std::unique_ptr<Transaction> Begin() override;

  uint64_t Len(Transaction&, const std::string& host_id, const std::string& category) override;
  std::optional<recsync::model::EncryptedRecord> Last(Transaction&, const std::string& host_id, const std::string& category) override;
  std::optional<recsync::model::EncryptedRecord> First(Transaction&, const std::string& host_id, const std::string& category) override;
  std::optional<recsync::model::EncryptedRecord> Get(Transaction&, const std::string& id) override;
  Result Push(Transaction&, const recsync::model::EncryptedRecord&) override;
  std::vector<model::ChainRecord> Chains(Transaction&) override;

  uint64_t Count(Transaction&, const std::string& scope) override;
  std::vector<recsync::model::EncryptedRecord> Before(Transaction&, const std::string& scope, const model::RecordCursor& before,
                                                      uint32_t limit) override;
  Result SaveBatch(Transaction&, const std::vector<recsync::model::EncryptedRecord>& records, uint64_t& inserted) override;
  std::optional<model::SyncStateRecord> GetSyncState(Transaction&, const std::string& scope) override;
  Result CommitSyncState(Transaction&, const model::SyncStateRecord&) override;

  std::vector<recsync::model::EncryptedRecord> Page(Transaction&, uint64_t offset, uint32_t limit) override;
  Result UpdateWrappedKey(Transaction&, const std::string& id, const std::string& content_encryption_key) override;

 private:
  static SqliteTransaction& TX(Transaction&);
  static Result             Translate(sqlite3* db, int rc);

  Result Insert(SqliteDB& db, const char* sql, const recsync::model::EncryptedRecord& r, bool& inserted);

  std::shared_ptr<SqliteDB> db_;
};

} // namespace recsync::db::sqlite
