#include "event_bus.hpp"

#include <algorithm>

#include "internal/observability/logging.hpp"

namespace chatlog::eventstore {

Subscription::Subscription(std::weak_ptr<EventBus> bus, uint64_t id) : bus_(std::move(bus)), id_(id) {
}

Subscription::~Subscription() {
  Unsubscribe();
}

void Subscription::Unsubscribe() {
  if (auto bus = bus_.lock()) bus->Remove(id_);
  bus_.reset();
}

std::unique_ptr<Subscription> EventBus::Subscribe(std::string stream_prefix, EventHandler handler) {
  std::lock_guard lock(mutex_);
  const uint64_t  id = next_id_++;
  entries_.push_back({id, std::move(stream_prefix), std::make_shared<Slot>(std::move(handler))});
  return std::make_unique<Subscription>(weak_from_this(), id);
}

void EventBus::Publish(const std::string& stream_id, const std::vector<StoredEvent>& events) {
  std::vector<std::shared_ptr<Slot>> matched;
  {
    std::lock_guard lock(mutex_);
    for (const auto& entry : entries_) {
      if (stream_id.starts_with(entry.prefix)) matched.push_back(entry.slot);
    }
  }

  for (const auto& slot : matched) {
    std::lock_guard guard(slot->guard);
    if (!slot->active) continue;
    try {
      slot->handler(stream_id, events);
    } catch (const std::exception& e) {
      CHATLOG_LOG_ERROR("event bus handler failed", {observability::StringField("stream_id", stream_id), observability::StringField("error", e.what())});
    }
  }
}

std::size_t EventBus::SubscriberCount() const {
  std::lock_guard lock(mutex_);
  return entries_.size();
}

void EventBus::Remove(uint64_t id) {
  std::shared_ptr<Slot> slot;
  {
    std::lock_guard lock(mutex_);
    auto it = std::find_if(entries_.begin(), entries_.end(), [id](const Entry& e) { return e.id == id; });
    if (it == entries_.end()) return;
    slot = std::move(it->slot);
    entries_.erase(it);
  }

  // Bus lock released first: a running handler may itself publish or subscribe.
  std::lock_guard guard(slot->guard);
  slot->active = false;
}

} // namespace chatlog::eventstore
