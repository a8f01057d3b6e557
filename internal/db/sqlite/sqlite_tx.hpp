#pragma once

#include <memory>
#include <mutex>

#include "internal/db/api/transaction.hpp"
#include "sqlite_db.hpp"

namespace chatlog::db::sqlite {

/*
  SQLite transaction wrapper.

  Holds the in-process writer lock for its lifetime and uses
  BEGIN IMMEDIATE so the file write lock is taken up front.
*/
class SqliteTransaction final : public db::Transaction {
public:
  explicit SqliteTransaction(std::shared_ptr<SqliteDB> db);
  ~SqliteTransaction();

  sqlite3* Handle() const { return db_->Handle(); }
  SqliteDB& DB() const { return *db_; }

  void Commit() override;
  void Rollback() override;
  bool IsFinished() const override { return finished_; }

private:
  void Finish();

  std::shared_ptr<SqliteDB>          db_;
  std::unique_lock<std::timed_mutex> writer_;
  bool finished_ = false;
};

} // namespace chatlog::db::sqlite
