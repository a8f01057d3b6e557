#include "notification_queue.hpp"

namespace chatlog::projection {

void NotificationQueue::Enqueue(Notification notification) {
  {
    std::lock_guard lock(mutex_);
    if (shutdown_) return;
    queue_.push_back(std::move(notification));
  }
  cv_.notify_one();
}

std::optional<Notification> NotificationQueue::Dequeue(std::chrono::milliseconds timeout) {
  std::unique_lock lock(mutex_);

  cv_.wait_for(lock, timeout, [&] { return shutdown_ || !queue_.empty(); });

  if (shutdown_ || queue_.empty()) return std::nullopt;

  Notification notification = std::move(queue_.front());
  queue_.pop_front();
  ++in_flight_;
  return notification;
}

void NotificationQueue::TaskDone() {
  {
    std::lock_guard lock(mutex_);
    if (in_flight_ > 0) --in_flight_;
  }
  idle_cv_.notify_all();
}

bool NotificationQueue::WaitIdle(std::chrono::milliseconds timeout) {
  std::unique_lock lock(mutex_);
  return idle_cv_.wait_for(lock, timeout, [&] { return queue_.empty() && in_flight_ == 0; });
}

void NotificationQueue::Shutdown() {
  {
    std::lock_guard lock(mutex_);
    shutdown_ = true;
    queue_.clear();
  }
  cv_.notify_all();
  idle_cv_.notify_all();
}

void NotificationQueue::Reopen() {
  std::lock_guard lock(mutex_);
  shutdown_  = false;
  in_flight_ = 0;
  queue_.clear();
}

bool NotificationQueue::IsShutdown() const {
  std::lock_guard lock(mutex_);
  return shutdown_;
}

std::size_t NotificationQueue::Size() const {
  std::lock_guard lock(mutex_);
  return queue_.size();
}

} // namespace chatlog::projection
