#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "internal/eventstore/event.hpp"

namespace chatlog::eventstore {

using EventHandler = std::function<void(const std::string& stream_id, const std::vector<StoredEvent>& events)>;

class EventBus;

/*
  Live subscription handle. Destroying it unsubscribes; it may
  outlive the bus.
*/
class Subscription {
 public:
  Subscription(std::weak_ptr<EventBus> bus, uint64_t id);
  ~Subscription();

  Subscription(const Subscription&)            = delete;
  Subscription& operator=(const Subscription&) = delete;

  void Unsubscribe();

 private:
  std::weak_ptr<EventBus> bus_;
  uint64_t                id_;
};

/*
  EventBus

  In-process change notification fed by EventStore::Append after
  commit. Delivery is synchronous on the publishing thread, so
  handlers must be cheap (enqueue and return). A throwing handler
  is logged and does not affect the publisher or other handlers.

  Once Unsubscribe() returns the handler is not running and will not
  be called again, so it may capture objects that die right after.

  Must be owned by a shared_ptr.
*/
class EventBus : public std::enable_shared_from_this<EventBus> {
 public:
  // Handler receives every publish whose stream id starts with prefix.
  std::unique_ptr<Subscription> Subscribe(std::string stream_prefix, EventHandler handler);

  void Publish(const std::string& stream_id, const std::vector<StoredEvent>& events);

  std::size_t SubscriberCount() const;

 private:
  friend class Subscription;

  // Calls run under guard; Remove() takes it too, so it returns only
  // after in-flight calls finish. Recursive so a handler can drop its
  // own subscription.
  struct Slot {
    explicit Slot(EventHandler h) : handler(std::move(h)) {
    }

    std::recursive_mutex guard;
    bool                 active = true;
    EventHandler         handler;
  };

  struct Entry {
    uint64_t              id;
    std::string           prefix;
    std::shared_ptr<Slot> slot;
  };

  void Remove(uint64_t id);

  mutable std::mutex mutex_;
  std::vector<Entry> entries_;
  uint64_t           next_id_ = 1;
};

} // namespace chatlog::eventstore
