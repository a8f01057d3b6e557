#include "pg_pool.hpp"

#include "internal/util/errors.hpp"

namespace chatlog::db::postgres {

PgPool::PgPool(PgOptions options) : options_(std::move(options)) {
  if (options_.max_connections == 0) options_.max_connections = 1;
}

std::shared_ptr<pqxx::connection> PgPool::Acquire() {
  const auto deadline = std::chrono::steady_clock::now() + options_.acquire_timeout;

  std::unique_lock lock(mutex_);
  for (;;) {
    while (!idle_.empty()) {
      auto conn = std::move(idle_.back());
      idle_.pop_back();
      if (conn->is_open()) return Wrap(conn.release());
      --live_connections_;
    }

    if (live_connections_ < options_.max_connections) {
      ++live_connections_;
      lock.unlock();

      try {
        return Wrap(new pqxx::connection(options_.conninfo));
      } catch (const pqxx::broken_connection& e) {
        std::lock_guard rollback_lock(mutex_);
        --live_connections_;
        cv_.notify_one();
        throw util::StorageError(std::string("postgres connect: ") + e.what());
      }
    }

    if (!cv_.wait_until(lock, deadline, [this] { return !idle_.empty() || live_connections_ < options_.max_connections; })) {
      throw util::StorageError("postgres: timed out waiting for a pooled connection");
    }
  }
}

std::shared_ptr<pqxx::connection> PgPool::Wrap(pqxx::connection* conn) {
  std::weak_ptr<PgPool> weak_self = shared_from_this();
  return std::shared_ptr<pqxx::connection>(conn, [weak_self](pqxx::connection* released_conn) {
    if (auto self = weak_self.lock()) {
      self->Release(released_conn);
      return;
    }
    delete released_conn;
  });
}

void PgPool::Release(pqxx::connection* conn) {
  {
    std::lock_guard lock(mutex_);
    idle_.emplace_back(conn);
  }
  cv_.notify_one();
}

} // namespace chatlog::db::postgres
