#include "internal/record/chain.hpp"

#include <algorithm>
#include <unordered_set>

#include "internal/observability/logging.hpp"
#include "internal/record/record_crypto.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"

namespace recsync::record {

uint64_t Len(db::RecordStore& store, db::Transaction& tx, const std::string& host_id, const std::string& category) {
  return store.Len(tx, host_id, category);
}

model::EncryptedRecord Last(db::RecordStore& store, db::Transaction& tx, const std::string& host_id, const std::string& category) {
  auto record = store.Last(tx, host_id, category);
  if (!record) {
    throw util::NotFound("chain is empty: " + host_id + "/" + category);
  }
  return std::move(*record);
}

model::EncryptedRecord Get(db::RecordStore& store, db::Transaction& tx, const std::string& id) {
  auto record = store.Get(tx, id);
  if (!record) {
    throw util::NotFound("record not found: " + id);
  }
  return std::move(*record);
}

void Push(db::RecordStore& store, db::Transaction& tx, const model::EncryptedRecord& record) {
  db::ThrowIfError(store.Push(tx, record), "push record " + record.id);
}

model::DecryptedRecord NextRecord(const std::optional<model::EncryptedRecord>& tail, const std::string& host_id,
                                  const std::string& category, const std::string& version, std::string bytes) {
  model::DecryptedRecord record;
  record.id           = util::NewRecordId();
  record.host_id      = host_id;
  record.category     = category;
  record.version      = version;
  record.timestamp_ns = util::NowNanos();
  record.data.bytes   = std::move(bytes);
  if (tail) {
    record.parent       = tail->id;
    record.timestamp_ns = std::max(record.timestamp_ns, tail->timestamp_ns + 1);
  }
  return record;
}

model::EncryptedRecord AppendToChain(db::RecordStore& store, ChainLocks& locks, const crypto::Encryptor& encryptor,
                                     const crypto::SecretKey& key, const AppendRequest& request) {
  auto lock = locks.LockForWrite(request.host_id, request.category);

  for (int attempt = 1; attempt <= kMaxPushAttempts; ++attempt) {
    auto tx   = store.Begin();
    auto tail = store.Last(*tx, request.host_id, request.category);

    auto encrypted =
        EncryptRecord(encryptor, NextRecord(tail, request.host_id, request.category, request.version, request.bytes), key);

    auto result = store.Push(*tx, encrypted);
    if (result.code == db::ErrorCode::Conflict) {
      tx->Rollback();
      RECSYNC_LOG_DEBUG("chain tail moved, retrying push",
                        {observability::StringField("category", request.category), observability::IntField("attempt", attempt)});
      continue;
    }
    db::ThrowIfError(result, "push record " + encrypted.id);

    try {
      tx->Commit();
    } catch (const util::Conflict& e) {
      RECSYNC_LOG_DEBUG("commit conflicted, retrying push",
                        {observability::StringField("category", request.category), observability::StringField("error", e.what())});
      continue;
    }
    return encrypted;
  }

  throw util::Conflict("could not append to " + request.host_id + "/" + request.category + " after " +
                       std::to_string(kMaxPushAttempts) + " attempts");
}

ChainReport VerifyChain(db::RecordStore& store, const std::string& host_id, const std::string& category) {
  ChainReport report;
  report.host_id  = host_id;
  report.category = category;

  auto tx       = store.Begin();
  report.length = store.Len(*tx, host_id, category);

  auto current = store.Last(*tx, host_id, category);
  if (!current) {
    if (report.length != 0) {
      report.problems.push_back("chain has records but no tail");
    }
    tx->Commit();
    return report;
  }

  std::unordered_set<std::string> seen;
  while (current) {
    if (!seen.insert(current->id).second) {
      report.problems.push_back("cycle at record " + current->id);
      break;
    }
    ++report.walked;

    if (current->host_id != host_id || current->category != category) {
      report.problems.push_back("record " + current->id + " belongs to " + current->host_id + "/" + current->category);
    }
    if (!current->parent) {
      break;
    }

    auto parent = store.Get(*tx, *current->parent);
    if (!parent) {
      report.problems.push_back("record " + current->id + " references missing parent " + *current->parent);
      break;
    }
    if (parent->timestamp_ns >= current->timestamp_ns) {
      report.problems.push_back("timestamp does not increase at record " + current->id);
    }
    current = std::move(parent);
  }

  if (report.walked != report.length) {
    report.problems.push_back("length mismatch: store has " + std::to_string(report.length) + ", walk reached " +
                              std::to_string(report.walked));
  }

  tx->Commit();
  return report;
}

} // namespace recsync::record
