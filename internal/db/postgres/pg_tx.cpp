#include "pg_tx.hpp"

#include <string>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace chatlog::db::postgres {

PgTransaction::PgTransaction(std::shared_ptr<PgPool> pool)
{
  conn_ = pool->Acquire();
  try {
    tx_ = std::make_unique<pqxx::work>(*conn_);
    tx_->exec("SET LOCAL statement_timeout = " + std::to_string(pool->StatementTimeout().count()));
  } catch (const pqxx::failure& e) {
    throw util::StorageError(std::string("postgres begin: ") + e.what());
  }
}

PgTransaction::~PgTransaction() {
  if (finished_ || !tx_) return;
  try {
    tx_->abort();
  } catch (const std::exception& e) {
    CHATLOG_LOG_WARN("postgres rollback failed", {observability::StringField("error", e.what())});
  }
}

void PgTransaction::Commit() {
  if (finished_) throw util::StorageError("postgres transaction: commit after finish");
  try {
    tx_->commit();
  } catch (const pqxx::failure& e) {
    finished_ = true;
    throw util::StorageError(std::string("postgres commit: ") + e.what());
  }
  finished_ = true;
}

void PgTransaction::Rollback() {
  if (finished_) return;
  finished_ = true;
  tx_->abort();
}

} // namespace chatlog::db::postgres
