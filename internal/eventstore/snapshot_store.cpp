#include "snapshot_store.hpp"

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace chatlog::eventstore {

SnapshotStore::SnapshotStore(std::shared_ptr<db::Repository> repository) : repository_(std::move(repository)) {
  if (!repository_) throw std::invalid_argument("SnapshotStore requires a repository");
}

void SnapshotStore::Save(const std::string& stream_id, uint64_t version, const std::string& snapshot_type, const std::string& data) {
  Snapshot record;
  record.stream_id      = stream_id;
  record.stream_version = version;
  record.snapshot_type  = snapshot_type;
  record.data           = data;

  auto       tx     = repository_->Begin();
  const auto result = repository_->InsertSnapshot(*tx, record);
  if (db::IsUniquenessViolation(result)) {
    CHATLOG_LOG_DEBUG("snapshot already present", {observability::StringField("stream_id", stream_id),
                                                   observability::IntField("version", static_cast<int64_t>(version))});
    tx->Rollback();
    return;
  }
  if (!result) {
    throw util::StorageError("snapshot save for " + stream_id + " failed: " + db::ToString(result.code) + " " + result.message);
  }
  tx->Commit();
}

std::optional<Snapshot> SnapshotStore::Latest(const std::string& stream_id) {
  auto tx       = repository_->Begin();
  auto snapshot = repository_->GetLatestSnapshot(*tx, stream_id);
  tx->Commit();
  return snapshot;
}

} // namespace chatlog::eventstore
