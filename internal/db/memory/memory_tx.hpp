#pragma once

#include <mutex>

#include "internal/db/api/transaction.hpp"
#include "memory_repository.hpp"

namespace chatlog::db::memory {

/*
  Transaction = exclusive lock + working copy

  Writes go to the copy; Commit() swaps it in.
*/

class MemoryTransaction final : public db::Transaction {
 public:
  MemoryTransaction(MemoryRepository& repo, std::unique_lock<std::timed_mutex> lock);
  ~MemoryTransaction();

  void Commit() override;
  void Rollback() override;
  bool IsFinished() const override {
    return finished_;
  }

  MemoryRepository::State&       Mutable();
  const MemoryRepository::State& View() const;

 private:
  MemoryRepository&                  repo_;
  std::unique_lock<std::timed_mutex> lock_;
  MemoryRepository::State            working_;
  bool                               finished_ = false;
};

} // namespace chatlog::db::memory
