#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <utility>

#include "internal/db/api/record_store.hpp"

namespace recsync::db::memory {

class MemoryTransaction;

class MemoryStore final : public db::RecordStore {
 public:
  MemoryStore();

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
  friend class MemoryTransaction;

  using ChainKey = std::pair<std::string, std::string>;

  struct State {
    std::map<std::string, recsync::model::EncryptedRecord> records;
    // (timestamp, id) order, per chain and global.
    std::map<ChainKey, std::map<model::RecordCursor, std::string>> chains;
    std::map<model::RecordCursor, std::string>                     ordered;
    std::map<std::string, model::SyncStateRecord>                  sync_state;
  };

  static void Insert(State& s, const recsync::model::EncryptedRecord& record);

  std::mutex                   mutex_;
  std::shared_ptr<const State> committed_;
  uint64_t                     committed_version_ = 0;
};

} // namespace recsync::db::memory
