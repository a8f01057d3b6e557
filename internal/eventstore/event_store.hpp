#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/eventstore/event.hpp"
#include "internal/eventstore/event_bus.hpp"

namespace chatlog::eventstore {

/*
  EventStore

  Append-only log of events partitioned by stream id.

  Append is optimistic: the caller names the version it last saw and
  the whole batch is rejected with util::VersionConflict if another
  writer got there first. Versions are 1-based and gapless per stream.

  After a successful commit the stored batch is published once on the
  bus (if any). Publication happens outside the transaction.
*/
class EventStore {
 public:
  EventStore(std::shared_ptr<db::Repository> repository, std::shared_ptr<EventBus> bus);

  std::vector<StoredEvent> Append(const std::string& stream_id, uint64_t expected_version, const std::vector<EventData>& events);

  std::vector<StoredEvent> ReadForward(const std::string& stream_id, uint64_t from_version = 1,
                                       std::optional<uint64_t> max_count = std::nullopt);

  uint64_t CurrentVersion(const std::string& stream_id);

  std::vector<db::model::StreamHeadRecord> ListStreams(const std::string& stream_prefix);

  const std::shared_ptr<db::Repository>& repository() const {
    return repository_;
  }

 private:
  std::shared_ptr<db::Repository> repository_;
  std::shared_ptr<EventBus>       bus_;
};

// "conversation-1234" -> "conversation"
std::string StreamKind(const std::string& stream_id);

} // namespace chatlog::eventstore
