#pragma once

namespace recsync::db {

/*
  Unit of work over a RecordStore. Every store call takes one.

  A chain push, a downloaded page, a sync-state commit or a key rotation
  lands whole or not at all. Two pushes racing for the same chain tail
  cannot both commit: the loser sees ErrorCode::Conflict from Push, or
  util::Conflict from Commit() when the backend only notices at the end
  (the memory store's version check, a Postgres serialization failure).

  Dropping an uncommitted transaction discards its writes.
*/
class Transaction {
 public:
  virtual ~Transaction() = default;

  virtual void Commit() = 0;

  // Discards every write so far; the transaction is finished afterwards.
  virtual void Rollback() = 0;
};

} // namespace recsync::db
