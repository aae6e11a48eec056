#pragma once

#include <memory>

#include "internal/db/api/transaction.hpp"
#include "memory_store.hpp"

namespace recsync::db::memory {

/*
  Transaction = shared snapshot + private copy made on first write.

  Read-only transactions never copy and never conflict.
*/

class MemoryTransaction final : public db::Transaction {
 public:
  explicit MemoryTransaction(MemoryStore& store);
  ~MemoryTransaction() override;

  void Commit() override;
  void Rollback() override;

  MemoryStore::State& Mutable();
  const MemoryStore::State& View() const {
    return working_ ? *working_ : *snapshot_;
  }

 private:
  MemoryStore&                              store_;
  std::shared_ptr<const MemoryStore::State> snapshot_;
  std::unique_ptr<MemoryStore::State>       working_;
  uint64_t                                  snapshot_version_ = 0;
  bool                                      committed_        = false;
};

} // namespace recsync::db::memory
