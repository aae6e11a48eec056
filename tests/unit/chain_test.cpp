#include <cassert>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "internal/crypto/encryptor.hpp"
#include "internal/db/memory/memory_store.hpp"
#include "internal/record/chain.hpp"
#include "internal/record/chain_locks.hpp"
#include "internal/record/record_crypto.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace {

using recsync::crypto::Encryptor;
using recsync::crypto::SecretKey;
using recsync::db::ErrorCode;
using recsync::db::memory::MemoryStore;
using recsync::record::AppendRequest;
using recsync::record::AppendToChain;
using recsync::record::ChainLocks;

const std::string kHost = "0c1d2e3f-0000-4000-8000-000000000001";

AppendRequest Request(const std::string& bytes, const std::string& category = "history") {
  return {kHost, category, "v0", bytes};
}

void TestAppendBuildsLinkedChain() {
  MemoryStore     store;
  ChainLocks      locks;
  const Encryptor encryptor;
  const auto      key = SecretKey::Generate();

  const auto first  = AppendToChain(store, locks, encryptor, key, Request("one"));
  const auto second = AppendToChain(store, locks, encryptor, key, Request("two"));
  const auto third  = AppendToChain(store, locks, encryptor, key, Request("three"));

  assert(!first.parent.has_value());
  assert(second.parent == first.id);
  assert(third.parent == second.id);
  assert(first.timestamp_ns < second.timestamp_ns);
  assert(second.timestamp_ns < third.timestamp_ns);

  auto tx = store.Begin();
  assert(recsync::record::Len(store, *tx, kHost, "history") == 3);
  assert(recsync::record::Last(store, *tx, kHost, "history").id == third.id);
  assert(store.First(*tx, kHost, "history")->id == first.id);
  assert(recsync::record::Len(store, *tx, kHost, "other") == 0);

  const auto plain = recsync::record::DecryptRecord(encryptor, recsync::record::Get(store, *tx, second.id), key);
  assert(plain.data.bytes == "two");
  assert(plain.host_id == kHost);
  assert(plain.parent == first.id);

  const auto chains = store.Chains(*tx);
  assert(chains.size() == 1);
  assert(chains[0].length == 3);
  tx->Commit();

  const auto report = recsync::record::VerifyChain(store, kHost, "history");
  assert(report.Ok());
  assert(report.walked == 3);
}

void TestMissingRecordsAreNotFound() {
  MemoryStore store;
  auto        tx = store.Begin();

  bool threw = false;
  try {
    (void)recsync::record::Last(store, *tx, kHost, "history");
  } catch (const recsync::util::NotFound&) {
    threw = true;
  }
  assert(threw);

  threw = false;
  try {
    (void)recsync::record::Get(store, *tx, "missing");
  } catch (const recsync::util::NotFound&) {
    threw = true;
  }
  assert(threw);
}

void TestPushIsCompareAndSwap() {
  MemoryStore     store;
  ChainLocks      locks;
  const Encryptor encryptor;
  const auto      key = SecretKey::Generate();

  const auto head = AppendToChain(store, locks, encryptor, key, Request("head"));
  const auto tail = AppendToChain(store, locks, encryptor, key, Request("tail"));

  auto tx = store.Begin();

  // Stale parent: would fork the chain.
  auto fork   = recsync::record::EncryptRecord(encryptor, recsync::record::NextRecord(head, kHost, "history", "v0", "fork"), key);
  auto result = store.Push(*tx, fork);
  assert(result.code == ErrorCode::Conflict);

  // Second head on a non-empty chain.
  auto orphan = recsync::record::EncryptRecord(encryptor, recsync::record::NextRecord(std::nullopt, kHost, "history", "v0", "x"), key);
  assert(store.Push(*tx, orphan).code == ErrorCode::Conflict);

  // Reused id.
  auto duplicate = recsync::record::EncryptRecord(encryptor, recsync::record::NextRecord(tail, kHost, "history", "v0", "dup"), key);
  duplicate.id   = head.id;
  assert(store.Push(*tx, duplicate).code == ErrorCode::AlreadyExists);

  bool threw = false;
  try {
    recsync::record::Push(store, *tx, fork);
  } catch (const recsync::util::Conflict&) {
    threw = true;
  }
  assert(threw);

  auto next = recsync::record::EncryptRecord(encryptor, recsync::record::NextRecord(tail, kHost, "history", "v0", "next"), key);
  assert(store.Push(*tx, next));
  tx->Commit();

  auto check = store.Begin();
  assert(store.Len(*check, kHost, "history") == 3);
  assert(store.Last(*check, kHost, "history")->id == next.id);
}

void TestConcurrentTransactionsConflictOnCommit() {
  MemoryStore     store;
  const Encryptor encryptor;
  const auto      key = SecretKey::Generate();

  auto a = store.Begin();
  auto b = store.Begin();

  auto ra = recsync::record::EncryptRecord(encryptor, recsync::record::NextRecord(std::nullopt, kHost, "history", "v0", "a"), key);
  auto rb = recsync::record::EncryptRecord(encryptor, recsync::record::NextRecord(std::nullopt, kHost, "history", "v0", "b"), key);
  assert(store.Push(*a, ra));
  assert(store.Push(*b, rb));

  a->Commit();

  bool threw = false;
  try {
    b->Commit();
  } catch (const recsync::util::Conflict&) {
    threw = true;
  }
  assert(threw);

  auto check = store.Begin();
  assert(store.Len(*check, kHost, "history") == 1);
  assert(store.Last(*check, kHost, "history")->id == ra.id);
}

// A transaction that goes out of scope without Commit() leaves nothing behind.
void TestDroppedTransactionDiscardsWrites() {
  MemoryStore     store;
  const Encryptor encryptor;
  const auto      key = SecretKey::Generate();

  const auto head = recsync::record::EncryptRecord(encryptor, recsync::record::NextRecord(std::nullopt, kHost, "history", "v0", "x"), key);
  {
    auto tx = store.Begin();
    assert(store.Push(*tx, head));
    assert(store.Len(*tx, kHost, "history") == 1);
  }

  auto tx = store.Begin();
  assert(store.Len(*tx, kHost, "history") == 0);
  assert(!store.Get(*tx, head.id).has_value());

  // With the head gone the same record is a valid first push again.
  assert(store.Push(*tx, head));
  tx->Commit();
}

void TestStoreResultsRaiseMatchingErrors() {
  using recsync::db::Result;
  using recsync::db::ThrowIfError;

  ThrowIfError(Result::Ok(), "push");

  const auto raises_conflict = [](ErrorCode code) {
    try {
      ThrowIfError(Result::Err(code, "tail moved"), "push");
    } catch (const recsync::util::Conflict& e) {
      return std::string(e.what()).find("push: ") == 0 && std::string(e.what()).find("tail moved") != std::string::npos;
    }
    return false;
  };
  assert(raises_conflict(ErrorCode::Conflict));
  assert(raises_conflict(ErrorCode::Busy));

  bool not_found = false;
  try {
    ThrowIfError(Result::Err(ErrorCode::NotFound), "rotate");
  } catch (const recsync::util::NotFound&) {
    not_found = true;
  }
  assert(not_found);

  bool io = false;
  try {
    ThrowIfError(Result::Err(ErrorCode::ConstraintViolation, "timestamp"), "push");
  } catch (const recsync::util::StoreIoFailure&) {
    io = true;
  }
  assert(io);
}

void TestParallelAppendersKeepOneChain() {
  auto            store = std::make_shared<MemoryStore>();
  ChainLocks      locks;
  const Encryptor encryptor;
  const auto      key = SecretKey::Generate();

  constexpr int kThreads   = 4;
  constexpr int kPerThread = 25;

  std::vector<std::thread> workers;
  for (int t = 0; t < kThreads; ++t) {
    workers.emplace_back([&, t] {
      for (int i = 0; i < kPerThread; ++i) {
        AppendToChain(*store, locks, encryptor, key, Request(std::to_string(t) + ":" + std::to_string(i)));
      }
    });
  }
  for (auto& worker : workers) worker.join();

  const auto report = recsync::record::VerifyChain(*store, kHost, "history");
  assert(report.Ok());
  assert(report.length == kThreads * kPerThread);
  assert(report.walked == kThreads * kPerThread);
}

void TestVerifyReportsMissingParent() {
  MemoryStore     store;
  const Encryptor encryptor;
  const auto      key = SecretKey::Generate();

  auto record   = recsync::record::EncryptRecord(encryptor, recsync::record::NextRecord(std::nullopt, kHost, "history", "v0", "late"), key);
  record.parent = recsync::util::NewRecordId();

  // Downloads are stored without linkage checks.
  auto     tx       = store.Begin();
  uint64_t inserted = 0;
  assert(store.SaveBatch(*tx, {record}, inserted));
  assert(inserted == 1);
  tx->Commit();

  const auto report = recsync::record::VerifyChain(store, kHost, "history");
  assert(!report.Ok());
  assert(report.walked == 1);
}

void TestIdentityIsAuthenticated() {
  MemoryStore     store;
  ChainLocks      locks;
  const Encryptor encryptor;
  const auto      key = SecretKey::Generate();

  auto record    = AppendToChain(store, locks, encryptor, key, Request("mine"));
  record.host_id = "0c1d2e3f-0000-4000-8000-0000000000ff";

  bool threw = false;
  try {
    (void)recsync::record::DecryptRecord(encryptor, record, key);
  } catch (const recsync::util::AuthenticationFailure&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestAppendBuildsLinkedChain();
  TestMissingRecordsAreNotFound();
  TestPushIsCompareAndSwap();
  TestConcurrentTransactionsConflictOnCommit();
  TestDroppedTransactionDiscardsWrites();
  TestStoreResultsRaiseMatchingErrors();
  TestParallelAppendersKeepOneChain();
  TestVerifyReportsMissingParent();
  TestIdentityIsAuthenticated();

  std::cout << "recsync_unit_chain: pass\n";
  return 0;
}
