#include "memory_tx.hpp"

#include "internal/util/errors.hpp"

namespace chatlog::db::memory {

MemoryTransaction::MemoryTransaction(MemoryRepository& repo, std::unique_lock<std::timed_mutex> lock)
    : repo_(repo), lock_(std::move(lock)), working_(repo_.committed_) {
}

MemoryTransaction::~MemoryTransaction() {
  if (!finished_) Rollback();
}

void MemoryTransaction::Commit() {
  if (finished_) {
    throw util::StorageError("memory transaction: commit after finish");
  }
  repo_.committed_ = std::move(working_);
  finished_        = true;
  lock_.unlock();
}

void MemoryTransaction::Rollback() {
  if (finished_) return;
  finished_ = true;
  lock_.unlock();
}

MemoryRepository::State& MemoryTransaction::Mutable() {
  if (finished_) {
    throw util::StorageError("memory transaction: use after finish");
  }
  return working_;
}

const MemoryRepository::State& MemoryTransaction::View() const {
  if (finished_) {
    throw util::StorageError("memory transaction: use after finish");
  }
  return working_;
}

} // namespace chatlog::db::memory
