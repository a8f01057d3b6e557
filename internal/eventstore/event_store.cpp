#include "event_store.hpp"

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"

namespace chatlog::eventstore {

std::string StreamKind(const std::string& stream_id) {
  const auto dash = stream_id.find('-');
  return dash == std::string::npos ? stream_id : stream_id.substr(0, dash);
}

EventStore::EventStore(std::shared_ptr<db::Repository> repository, std::shared_ptr<EventBus> bus)
    : repository_(std::move(repository)), bus_(std::move(bus)) {
  if (!repository_) throw std::invalid_argument("EventStore requires a repository");
}

std::vector<StoredEvent> EventStore::Append(const std::string& stream_id, uint64_t expected_version, const std::vector<EventData>& events) {
  if (stream_id.empty()) throw util::InvalidArgument("stream_id must not be empty");
  if (events.empty()) return {};

  std::vector<StoredEvent> stored;
  stored.reserve(events.size());

  {
    auto tx = repository_->Begin();

    const auto current = repository_->GetStreamVersion(*tx, stream_id);
    if (current != expected_version) {
      observability::Metrics::Instance().RecordVersionConflict(StreamKind(stream_id));
      throw util::VersionConflict(stream_id, expected_version, "stream is at version " + std::to_string(current));
    }

    uint64_t version = expected_version;
    for (const auto& event : events) {
      StoredEvent record;
      record.stream_id      = stream_id;
      record.stream_version = ++version;
      record.event_type     = event.event_type;
      record.data           = event.data;
      record.metadata       = event.metadata;

      const auto result = repository_->InsertEvent(*tx, record);
      if (db::IsUniquenessViolation(result)) {
        // Lost the race between the version read and the insert.
        observability::Metrics::Instance().RecordVersionConflict(StreamKind(stream_id));
        throw util::VersionConflict(stream_id, expected_version, result.message);
      }
      if (!result) {
        throw util::StorageError("append to " + stream_id + " failed: " + db::ToString(result.code) + " " + result.message);
      }
      stored.push_back(std::move(record));
    }

    tx->Commit();
  }

  CHATLOG_LOG_DEBUG("appended events",
                    {observability::StringField("stream_id", stream_id), observability::IntField("from_version", static_cast<int64_t>(expected_version + 1)),
                     observability::IntField("count", static_cast<int64_t>(stored.size()))});

  if (bus_) bus_->Publish(stream_id, stored);
  return stored;
}

std::vector<StoredEvent> EventStore::ReadForward(const std::string& stream_id, uint64_t from_version, std::optional<uint64_t> max_count) {
  auto tx     = repository_->Begin();
  auto events = repository_->ReadEvents(*tx, stream_id, from_version == 0 ? 1 : from_version, max_count);
  tx->Commit();
  return events;
}

uint64_t EventStore::CurrentVersion(const std::string& stream_id) {
  auto       tx      = repository_->Begin();
  const auto version = repository_->GetStreamVersion(*tx, stream_id);
  tx->Commit();
  return version;
}

std::vector<db::model::StreamHeadRecord> EventStore::ListStreams(const std::string& stream_prefix) {
  auto tx      = repository_->Begin();
  auto streams = repository_->ListStreams(*tx, stream_prefix);
  tx->Commit();
  return streams;
}

} // namespace chatlog::eventstore
