#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "internal/eventstore/event_bus.hpp"
#include "internal/eventstore/event_store.hpp"
#include "internal/projection/conversation_projection.hpp"
#include "internal/projection/notification_queue.hpp"

namespace chatlog::runtime::config {
class ProjectorConfig;
}

namespace chatlog::projection {

struct ProjectorOptions {
  // Checkpoint key.
  std::string name          = "conversations";
  std::string stream_prefix = "conversation-";

  std::chrono::milliseconds catch_up_interval{5000};
  uint32_t                  batch_size = 500;
  std::chrono::milliseconds retry_backoff{1000};
};

ProjectorOptions ProjectorOptionsFromConfig(const chatlog::runtime::config::ProjectorConfig& config);

/*
  Projector

  Single background consumer that keeps the read tables in step with
  the event log.

    bus -> NotificationQueue -> worker -> ConversationProjection

  Each stream batch is applied in one transaction together with its
  checkpoint, so a crash between the two is impossible and redelivered
  events are skipped. A notification that starts past the checkpoint
  is preceded by the missing events read from the log.

  The worker never lets an exception escape. A failed batch is rolled
  back and logged, the worker waits retry_backoff and then queues a
  full catch-up. A catch-up also runs whenever the queue stays empty
  for catch_up_interval, which picks up writes from other processes.
*/
class Projector {
 public:
  Projector(std::shared_ptr<eventstore::EventStore> events, std::shared_ptr<eventstore::EventBus> bus, ProjectorOptions options = {});
  ~Projector();

  Projector(const Projector&)            = delete;
  Projector& operator=(const Projector&) = delete;

  // Subscribes, then queues an initial catch-up and starts the worker.
  void Start();
  void Stop();

  // Synchronous entry points, also used by the worker. Return the
  // number of events applied. A stream that fails to project is logged
  // and skipped so the streams after it still converge.
  uint64_t CatchUp();
  uint64_t HandleNotification(const std::string& stream_id, const std::vector<eventstore::StoredEvent>& events);

  // True once every queued notification has been processed.
  bool WaitForIdle(std::chrono::milliseconds timeout);

  const ProjectorOptions& options() const {
    return options_;
  }

 private:
  void Run();
  void Process(const Notification& notification);
  void ScheduleCatchUp();
  void Backoff();

  uint64_t CatchUp(std::size_t& failed_streams);
  uint64_t CatchUpStream(const std::string& stream_id, uint64_t head);

  // Applies events above the checkpoint and advances it. Caller commits.
  uint64_t ApplyBatch(db::Transaction& tx, const std::string& stream_id, uint64_t checkpoint,
                      const std::vector<eventstore::StoredEvent>& events);

  uint64_t ReadCheckpoint(db::Transaction& tx, const std::string& stream_id);

  std::shared_ptr<eventstore::EventStore> events_;
  std::shared_ptr<eventstore::EventBus>   bus_;
  std::shared_ptr<db::Repository>         repository_;
  ProjectorOptions                        options_;
  ConversationProjection                  projection_;

  NotificationQueue                          queue_;
  std::unique_ptr<eventstore::Subscription> subscription_;

  std::mutex project_mutex_;

  std::atomic<bool> catch_up_queued_{false};

  std::mutex              stop_mutex_;
  std::condition_variable stop_cv_;
  bool                    stopping_ = false;

  std::thread thread_;
};

} // namespace chatlog::projection
