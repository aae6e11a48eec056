#pragma once

#include <memory>

#include "internal/db/api/record_store.hpp"
#include "pg_pool.hpp"
#include "pg_tx.hpp"

namespace recsync::db::postgres {

class PgStore final : public db::RecordStore {
 public:
  explicit PgStore(std::shared_ptr<PgPool> pool);

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
  static PgTransaction& TX(Transaction&);
  static Result         Translate(const std::exception& e);

  std::shared_ptr<PgPool> pool_;
};

} // namespace recsync::db::postgres
