#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "internal/eventstore/event.hpp"

namespace chatlog::projection {

struct Notification {
  std::string                           stream_id;
  std::vector<eventstore::StoredEvent> events;
  // Replay every stream from its checkpoint instead of one batch.
  bool catch_up = false;
};

/*
  Thread-safe blocking queue between the event bus and the projector
  worker.

  Every item handed out by Dequeue() is in flight until TaskDone();
  WaitIdle() returns once the queue is empty and nothing is in flight.
*/
class NotificationQueue {
 public:
  void Enqueue(Notification notification);

  // nullopt on timeout or after Shutdown().
  std::optional<Notification> Dequeue(std::chrono::milliseconds timeout);

  void TaskDone();

  bool WaitIdle(std::chrono::milliseconds timeout);

  void Shutdown();
  // Accepts notifications again after Shutdown(), starting empty.
  void Reopen();
  bool IsShutdown() const;

  std::size_t Size() const;

 private:
  mutable std::mutex       mutex_;
  std::condition_variable  cv_;
  std::condition_variable  idle_cv_;
  std::deque<Notification> queue_;
  std::size_t              in_flight_ = 0;
  bool                     shutdown_  = false;
};

} // namespace chatlog::projection
