#pragma once

namespace chatlog::db {

/*
  Abstract transaction.

  Semantics guaranteed for ALL backends:

  - Changes are invisible until Commit()
  - After Commit() all reads see the change
  - Rollback() discards all writes
  - Destructor MUST rollback if not committed
  - Opening a transaction waits a bounded time for the backend and
    throws util::StorageError when that expires

  SQLite: BEGIN IMMEDIATE under an in-process writer lock
  Postgres: pqxx::work on a pooled connection
  Memory: exclusive lock + working copy
*/

class Transaction {
public:
  virtual ~Transaction() = default;

  // commit changes atomically
  virtual void Commit() = 0;

  // explicit rollback
  virtual void Rollback() = 0;

  // true once Commit() or Rollback() has completed
  virtual bool IsFinished() const = 0;
};

} // namespace chatlog::db
