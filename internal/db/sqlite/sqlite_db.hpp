#pragma once

#include <sqlite3.h>

#include <chrono>
#include <memory>
#include <mutex>
#include <string>

namespace chatlog::db::sqlite {

struct SqliteOptions {
  std::string               path;
  bool                      wal_mode        = true;
  std::chrono::milliseconds busy_timeout    = std::chrono::milliseconds(5000);
  std::chrono::milliseconds writer_wait     = std::chrono::milliseconds(5000);
};

/*
  Thin RAII wrapper around one shared sqlite3* connection.

  The connection is opened FULLMUTEX, but a transaction spans several
  calls, so transactions are serialized in-process through the writer
  lock. busy_timeout covers other processes on the same file.
*/
class SqliteDB {
 public:
  explicit SqliteDB(SqliteOptions options);
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  const std::string& Path() const {
    return options_.path;
  }

  // Execute a SQL string (used for pragmas/migrations)
  void Exec(const std::string& sql);

  // Prepare a statement (caller must sqlite3_finalize)
  sqlite3_stmt* Prepare(const std::string& sql);

  // Throws util::StorageError when the lock is not free within writer_wait.
  std::unique_lock<std::timed_mutex> AcquireWriter();

 private:
  void Configure();

  sqlite3*         db_ = nullptr;
  SqliteOptions    options_;
  std::timed_mutex writer_;
};

} // namespace chatlog::db::sqlite
