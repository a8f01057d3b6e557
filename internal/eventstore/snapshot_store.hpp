#pragma once

#include <memory>
#include <optional>
#include <string>

#include "internal/db/api/repository.hpp"

namespace chatlog::eventstore {

using Snapshot = db::model::SnapshotRecord;

/*
  SnapshotStore

  Cache of aggregate state at a stream version. Only the highest
  version per stream is read. Deleting every snapshot must never
  change what Load returns.
*/
class SnapshotStore {
 public:
  explicit SnapshotStore(std::shared_ptr<db::Repository> repository);

  // A snapshot already present at this version counts as success.
  // Throws util::StorageError on backend failure.
  void Save(const std::string& stream_id, uint64_t version, const std::string& snapshot_type, const std::string& data);

  std::optional<Snapshot> Latest(const std::string& stream_id);

 private:
  std::shared_ptr<db::Repository> repository_;
};

} // namespace chatlog::eventstore
