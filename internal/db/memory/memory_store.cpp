#include "memory_store.hpp"

#include <iterator>

#include "memory_tx.hpp"

namespace recsync::db::memory {

namespace {

model::RecordCursor CursorOf(const recsync::model::EncryptedRecord& r) {
  return {r.timestamp_ns, r.id};
}

} // namespace

MemoryStore::MemoryStore() : committed_(std::make_shared<State>()) {
}

std::unique_ptr<db::Transaction> MemoryStore::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

void MemoryStore::Insert(State& s, const recsync::model::EncryptedRecord& r) {
  s.records[r.id] = r;
  s.chains[{r.host_id, r.category}][CursorOf(r)] = r.id;
  s.ordered[CursorOf(r)]                         = r.id;
}

uint64_t MemoryStore::Len(Transaction& t, const std::string& host_id, const std::string& category) {
  const auto& s  = TX(t).View();
  const auto  it = s.chains.find({host_id, category});
  return it == s.chains.end() ? 0 : it->second.size();
}

std::optional<recsync::model::EncryptedRecord> MemoryStore::Last(Transaction& t, const std::string& host_id, const std::string& category) {
  const auto& s  = TX(t).View();
  const auto  it = s.chains.find({host_id, category});
  if (it == s.chains.end() || it->second.empty()) return std::nullopt;
  return s.records.at(it->second.rbegin()->second);
}

std::optional<recsync::model::EncryptedRecord> MemoryStore::First(Transaction& t, const std::string& host_id, const std::string& category) {
  const auto& s  = TX(t).View();
  const auto  it = s.chains.find({host_id, category});
  if (it == s.chains.end() || it->second.empty()) return std::nullopt;
  return s.records.at(it->second.begin()->second);
}

std::optional<recsync::model::EncryptedRecord> MemoryStore::Get(Transaction& t, const std::string& id) {
  const auto& s  = TX(t).View();
  const auto  it = s.records.find(id);
  if (it == s.records.end()) return std::nullopt;
  return it->second;
}

Result MemoryStore::Push(Transaction& t, const recsync::model::EncryptedRecord& r) {
  const auto& view = TX(t).View();
  if (view.records.contains(r.id)) {
    return Result::Err(ErrorCode::AlreadyExists, r.id);
  }

  const auto chain = view.chains.find({r.host_id, r.category});
  if (chain == view.chains.end() || chain->second.empty()) {
    if (r.parent) return Result::Err(ErrorCode::Conflict, "chain is empty but record has a parent");
  } else {
    const auto& [tail_cursor, tail_id] = *chain->second.rbegin();
    if (!r.parent || *r.parent != tail_id) {
      return Result::Err(ErrorCode::Conflict, "parent is not the chain tail " + tail_id);
    }
    if (r.timestamp_ns <= tail_cursor.timestamp_ns) {
      return Result::Err(ErrorCode::ConstraintViolation, "timestamp does not advance past parent");
    }
  }

  Insert(TX(t).Mutable(), r);
  return Result::Ok();
}

std::vector<model::ChainRecord> MemoryStore::Chains(Transaction& t) {
  std::vector<model::ChainRecord> out;
  for (const auto& [key, chain] : TX(t).View().chains) {
    out.push_back({key.first, key.second, chain.size()});
  }
  return out;
}

uint64_t MemoryStore::Count(Transaction& t, const std::string& scope) {
  const auto& s = TX(t).View();
  if (scope.empty()) return s.records.size();

  uint64_t total = 0;
  for (const auto& [key, chain] : s.chains) {
    if (key.second == scope) total += chain.size();
  }
  return total;
}

std::vector<recsync::model::EncryptedRecord> MemoryStore::Before(Transaction& t, const std::string& scope,
                                                                 const model::RecordCursor& before, uint32_t limit) {
  const auto&                                  s = TX(t).View();
  std::vector<recsync::model::EncryptedRecord> out;

  auto it = s.ordered.lower_bound(before);
  while (it != s.ordered.begin() && out.size() < limit) {
    --it;
    const auto& record = s.records.at(it->second);
    if (scope.empty() || record.category == scope) {
      out.push_back(record);
    }
  }
  return out;
}

Result MemoryStore::SaveBatch(Transaction& t, const std::vector<recsync::model::EncryptedRecord>& records, uint64_t& inserted) {
  inserted = 0;
  for (const auto& r : records) {
    if (TX(t).View().records.contains(r.id)) continue;
    Insert(TX(t).Mutable(), r);
    ++inserted;
  }
  return Result::Ok();
}

std::optional<model::SyncStateRecord> MemoryStore::GetSyncState(Transaction& t, const std::string& scope) {
  const auto& s  = TX(t).View();
  const auto  it = s.sync_state.find(scope);
  if (it == s.sync_state.end()) return std::nullopt;
  return it->second;
}

Result MemoryStore::CommitSyncState(Transaction& t, const model::SyncStateRecord& r) {
  TX(t).Mutable().sync_state[r.scope] = r;
  return Result::Ok();
}

std::vector<recsync::model::EncryptedRecord> MemoryStore::Page(Transaction& t, uint64_t offset, uint32_t limit) {
  const auto&                                  s = TX(t).View();
  std::vector<recsync::model::EncryptedRecord> out;
  if (offset >= s.ordered.size()) return out;

  auto it = std::next(s.ordered.begin(), static_cast<std::ptrdiff_t>(offset));
  for (; it != s.ordered.end() && out.size() < limit; ++it) {
    out.push_back(s.records.at(it->second));
  }
  return out;
}

Result MemoryStore::UpdateWrappedKey(Transaction& t, const std::string& id, const std::string& content_encryption_key) {
  if (!TX(t).View().records.contains(id)) return Result::Err(ErrorCode::NotFound, id);
  TX(t).Mutable().records.at(id).data.content_encryption_key = content_encryption_key;
  return Result::Ok();
}

} // namespace recsync::db::memory
