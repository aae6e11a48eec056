#include "memory_tx.hpp"

#include "internal/util/errors.hpp"

namespace recsync::db::memory {

MemoryTransaction::MemoryTransaction(MemoryStore& store) : store_(store) {
  std::scoped_lock lock(store_.mutex_);
  snapshot_         = store_.committed_;
  snapshot_version_ = store_.committed_version_;
}

MemoryTransaction::~MemoryTransaction() {
  if (!committed_) Rollback();
}

MemoryStore::State& MemoryTransaction::Mutable() {
  if (!working_) {
    working_ = std::make_unique<MemoryStore::State>(*snapshot_);
  }
  return *working_;
}

void MemoryTransaction::Commit() {
  if (committed_) {
    return;
  }
  if (working_) {
    std::scoped_lock lock(store_.mutex_);
    if (store_.committed_version_ != snapshot_version_) {
      throw util::Conflict("transaction conflict: store was modified by a concurrent transaction");
    }
    store_.committed_ = std::shared_ptr<const MemoryStore::State>(std::move(working_));
    store_.committed_version_++;
  }
  committed_ = true;
}

void MemoryTransaction::Rollback() {
  working_.reset();
  committed_ = true;
}

} // namespace recsync::db::memory
