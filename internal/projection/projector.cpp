#include "internal/projection/projector.hpp"

#include "config/config.pb.h"
#include "internal/chat/conversation_events.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace chatlog::projection {

using observability::IntField;
using observability::StringField;

ProjectorOptions ProjectorOptionsFromConfig(const chatlog::runtime::config::ProjectorConfig& config) {
  ProjectorOptions options;
  if (config.catch_up_interval_ms() > 0) options.catch_up_interval = std::chrono::milliseconds(config.catch_up_interval_ms());
  if (config.catch_up_batch_size() > 0) options.batch_size = config.catch_up_batch_size();
  if (config.retry_backoff_ms() > 0) options.retry_backoff = std::chrono::milliseconds(config.retry_backoff_ms());
  return options;
}

Projector::Projector(std::shared_ptr<eventstore::EventStore> events, std::shared_ptr<eventstore::EventBus> bus, ProjectorOptions options)
    : events_(std::move(events)),
      bus_(std::move(bus)),
      repository_(events_ ? events_->repository() : nullptr),
      options_(std::move(options)),
      projection_(repository_) {
  if (!events_) throw std::invalid_argument("Projector requires an event store");
  if (options_.batch_size == 0) options_.batch_size = ProjectorOptions{}.batch_size;
}

Projector::~Projector() {
  Stop();
}

void Projector::Start() {
  if (thread_.joinable()) return;

  {
    std::lock_guard lock(stop_mutex_);
    stopping_ = false;
  }
  // A previous Stop() shut the queue down and dropped any queued catch-up.
  queue_.Reopen();
  catch_up_queued_ = false;

  // Subscribe first so nothing appended during the initial catch-up is missed.
  if (bus_) {
    subscription_ = bus_->Subscribe(options_.stream_prefix, [this](const std::string& stream_id, const std::vector<eventstore::StoredEvent>& events) {
      queue_.Enqueue({stream_id, events, false});
    });
  }
  ScheduleCatchUp();

  thread_ = std::thread(&Projector::Run, this);
  CHATLOG_LOG_INFO("projector started", {StringField("projector", options_.name), StringField("stream_prefix", options_.stream_prefix)});
}

void Projector::Stop() {
  subscription_.reset();
  {
    std::lock_guard lock(stop_mutex_);
    stopping_ = true;
  }
  stop_cv_.notify_all();
  queue_.Shutdown();

  if (thread_.joinable()) {
    thread_.join();
    CHATLOG_LOG_INFO("projector stopped", {StringField("projector", options_.name)});
  }
}

bool Projector::WaitForIdle(std::chrono::milliseconds timeout) {
  return queue_.WaitIdle(timeout);
}

void Projector::Run() {
  while (!queue_.IsShutdown()) {
    auto notification = queue_.Dequeue(options_.catch_up_interval);
    if (!notification) {
      if (queue_.IsShutdown()) break;
      // Idle: sweep for writes made by other processes.
      Process(Notification{{}, {}, true});
      continue;
    }

    Process(*notification);
    queue_.TaskDone();
  }
}

void Projector::Process(const Notification& notification) {
  if (notification.catch_up) catch_up_queued_ = false;

  try {
    if (notification.catch_up) {
      std::size_t failed_streams = 0;
      CatchUp(failed_streams);
      if (failed_streams > 0) {
        Backoff();
        ScheduleCatchUp();
      }
    } else {
      HandleNotification(notification.stream_id, notification.events);
    }
  } catch (const std::exception& e) {
    observability::Metrics::Instance().RecordProjectionFailure(options_.name);
    CHATLOG_LOG_ERROR("projection failed", {StringField("projector", options_.name), StringField("stream_id", notification.stream_id),
                                            StringField("error", e.what())});
    Backoff();
    ScheduleCatchUp();
  }
}

void Projector::ScheduleCatchUp() {
  if (catch_up_queued_.exchange(true)) return;
  queue_.Enqueue({{}, {}, true});
}

void Projector::Backoff() {
  std::unique_lock lock(stop_mutex_);
  stop_cv_.wait_for(lock, options_.retry_backoff, [&] { return stopping_; });
}

uint64_t Projector::CatchUp() {
  std::size_t failed_streams = 0;
  return CatchUp(failed_streams);
}

uint64_t Projector::CatchUp(std::size_t& failed_streams) {
  uint64_t applied = 0;
  for (const auto& head : events_->ListStreams(options_.stream_prefix)) {
    try {
      applied += CatchUpStream(head.stream_id, head.version);
    } catch (const std::exception& e) {
      ++failed_streams;
      observability::Metrics::Instance().RecordProjectionFailure(options_.name);
      CHATLOG_LOG_ERROR("stream catch-up failed",
                        {StringField("projector", options_.name), StringField("stream_id", head.stream_id), StringField("error", e.what())});
    }
  }

  if (applied > 0 || failed_streams > 0) {
    CHATLOG_LOG_INFO("projector caught up", {StringField("projector", options_.name), IntField("events", static_cast<int64_t>(applied)),
                                             IntField("failed_streams", static_cast<int64_t>(failed_streams))});
  }
  return applied;
}

uint64_t Projector::CatchUpStream(const std::string& stream_id, uint64_t head) {
  std::lock_guard lock(project_mutex_);

  uint64_t applied = 0;
  for (;;) {
    auto           tx         = repository_->Begin();
    const uint64_t checkpoint = ReadCheckpoint(*tx, stream_id);
    if (checkpoint >= head) {
      tx->Rollback();
      break;
    }

    const auto batch = repository_->ReadEvents(*tx, stream_id, checkpoint + 1, options_.batch_size);
    if (batch.empty()) {
      tx->Rollback();
      break;
    }

    const uint64_t count = ApplyBatch(*tx, stream_id, checkpoint, batch);
    tx->Commit();
    observability::Metrics::Instance().RecordProjectedEvents(options_.name, count);
    applied += count;
  }
  return applied;
}

uint64_t Projector::HandleNotification(const std::string& stream_id, const std::vector<eventstore::StoredEvent>& events) {
  if (events.empty()) return 0;

  std::lock_guard lock(project_mutex_);

  auto           tx         = repository_->Begin();
  const uint64_t checkpoint = ReadCheckpoint(*tx, stream_id);

  std::vector<eventstore::StoredEvent> pending;
  for (const auto& event : events) {
    if (event.stream_version > checkpoint) pending.push_back(event);
  }
  if (pending.empty()) {
    tx->Rollback();
    return 0;
  }

  const uint64_t first = pending.front().stream_version;
  if (first > checkpoint + 1) {
    const uint64_t missing = first - checkpoint - 1;
    auto           gap     = repository_->ReadEvents(*tx, stream_id, checkpoint + 1, missing);
    if (gap.size() != missing) {
      throw util::StorageError("projector: " + stream_id + " is missing events " + std::to_string(checkpoint + 1) + ".." +
                               std::to_string(first - 1));
    }
    CHATLOG_LOG_DEBUG("filled projection gap", {StringField("stream_id", stream_id), IntField("count", static_cast<int64_t>(missing))});
    pending.insert(pending.begin(), gap.begin(), gap.end());
  }

  const uint64_t count = ApplyBatch(*tx, stream_id, checkpoint, pending);
  tx->Commit();
  observability::Metrics::Instance().RecordProjectedEvents(options_.name, count);
  return count;
}

uint64_t Projector::ApplyBatch(db::Transaction& tx, const std::string& stream_id, uint64_t checkpoint,
                               const std::vector<eventstore::StoredEvent>& events) {
  uint64_t version = checkpoint;
  uint64_t applied = 0;

  for (const auto& event : events) {
    if (event.stream_version <= version) continue;
    if (event.stream_version != version + 1) {
      throw util::StorageError("projector: " + stream_id + " expected version " + std::to_string(version + 1) + ", got " +
                               std::to_string(event.stream_version));
    }

    if (chat::IsConversationEventType(event.event_type)) {
      projection_.Apply(tx, event);
      ++applied;
    } else {
      CHATLOG_LOG_WARN("skipping unknown event type", {StringField("stream_id", stream_id), StringField("event_type", event.event_type)});
    }
    version = event.stream_version;
  }

  if (version == checkpoint) return 0;

  db::model::ProjectionCheckpointRecord record;
  record.projector     = options_.name;
  record.stream_id     = stream_id;
  record.version       = version;
  record.updated_at_ms = util::NowMs();

  const auto result = repository_->CommitProjectionCheckpoint(tx, record);
  if (!result) {
    throw util::StorageError("projector: checkpoint for " + stream_id + " failed: " + db::ToString(result.code) + " " + result.message);
  }
  return applied;
}

uint64_t Projector::ReadCheckpoint(db::Transaction& tx, const std::string& stream_id) {
  const auto checkpoint = repository_->GetProjectionCheckpoint(tx, options_.name, stream_id);
  return checkpoint ? checkpoint->version : 0;
}

} // namespace chatlog::projection
