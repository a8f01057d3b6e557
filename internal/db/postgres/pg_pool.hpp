#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <pqxx/pqxx>
#include <string>
#include <vector>

namespace chatlog::db::postgres {

struct PgOptions {
  std::string               conninfo;
  std::size_t               max_connections   = 16;
  std::chrono::milliseconds statement_timeout = std::chrono::milliseconds(30000);
  std::chrono::milliseconds acquire_timeout   = std::chrono::milliseconds(10000);
};

/*
  PgPool

  Bounded connection pool used by PgRepository.

  - Each transaction gets its own connection.
  - libpqxx connections are NOT thread-safe; never share one.
  - Acquire() waits at most acquire_timeout for a free slot and
    throws util::StorageError after that.

  Lifetime:
    Repository owns shared_ptr<PgPool>
    Transaction acquires shared_ptr<pqxx::connection>; dropping it
    returns the connection to the pool (or closes it if the pool
    is gone).
*/

class PgPool : public std::enable_shared_from_this<PgPool> {
 public:
  explicit PgPool(PgOptions options);

  std::shared_ptr<pqxx::connection> Acquire();

  std::chrono::milliseconds StatementTimeout() const {
    return options_.statement_timeout;
  }

 private:
  std::shared_ptr<pqxx::connection> Wrap(pqxx::connection* conn);
  void                              Release(pqxx::connection* conn);

  PgOptions options_;

  std::mutex                                     mutex_;
  std::condition_variable                        cv_;
  std::vector<std::unique_ptr<pqxx::connection>> idle_;
  std::size_t                                    live_connections_ = 0;
};

} // namespace chatlog::db::postgres
