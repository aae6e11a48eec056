#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/chain_record.hpp"
#include "internal/db/model/record_cursor.hpp"
#include "internal/db/model/sync_state_record.hpp"
#include "internal/model/record.hpp"

namespace recsync::db {

/*
  Local record store.

  CRITICAL GUARANTEES:

  - All calls take a Transaction from Begin()
  - Reads inside a transaction see its writes
  - Push is a compare-and-swap on the chain tail: a record whose parent is
    not the current tail (or that has no parent while the chain is
    non-empty) is rejected with ErrorCode::Conflict
  - Ids are never reused: a second record with a known id is rejected with
    ErrorCode::AlreadyExists
  - Records are never modified, except UpdateWrappedKey during rotation

  The tail of a chain is its record with the greatest (timestamp, id).
  Read failures of the backend throw util::StoreIoFailure.

  A scope is a category name; the empty scope covers every category.
*/

class RecordStore {
 public:
  virtual ~RecordStore() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // Chains
  // ---------------------------------------------------------------------

  virtual uint64_t Len(Transaction&, const std::string& host_id, const std::string& category) = 0;

  virtual std::optional<recsync::model::EncryptedRecord> Last(Transaction&, const std::string& host_id, const std::string& category) = 0;

  virtual std::optional<recsync::model::EncryptedRecord> First(Transaction&, const std::string& host_id, const std::string& category) = 0;

  virtual std::optional<recsync::model::EncryptedRecord> Get(Transaction&, const std::string& id) = 0;

  virtual Result Push(Transaction&, const recsync::model::EncryptedRecord&) = 0;

  virtual std::vector<model::ChainRecord> Chains(Transaction&) = 0;

  // ---------------------------------------------------------------------
  // Sync
  // ---------------------------------------------------------------------

  virtual uint64_t Count(Transaction&, const std::string& scope) = 0;

  // Newest first, strictly older than `before`.
  virtual std::vector<recsync::model::EncryptedRecord> Before(Transaction&, const std::string& scope, const model::RecordCursor& before,
                                                              uint32_t limit) = 0;

  // Inserts records with unknown ids; known ids are skipped. Chain linkage is
  // not checked: downloaded chains may arrive in any order.
  virtual Result SaveBatch(Transaction&, const std::vector<recsync::model::EncryptedRecord>& records, uint64_t& inserted) = 0;

  virtual std::optional<model::SyncStateRecord> GetSyncState(Transaction&, const std::string& scope) = 0;

  virtual Result CommitSyncState(Transaction&, const model::SyncStateRecord&) = 0;

  // ---------------------------------------------------------------------
  // Maintenance
  // ---------------------------------------------------------------------

  // Oldest first in (timestamp, id) order.
  virtual std::vector<recsync::model::EncryptedRecord> Page(Transaction&, uint64_t offset, uint32_t limit) = 0;

  virtual Result UpdateWrappedKey(Transaction&, const std::string& id, const std::string& content_encryption_key) = 0;
};

} // namespace recsync::db
