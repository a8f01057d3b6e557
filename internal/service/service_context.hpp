#pragma once

#include <memory>

#include "internal/aggregate/loader.hpp"

namespace chatlog::eventstore {
class EventStore;
class SnapshotStore;
} // namespace chatlog::eventstore

namespace chatlog::service {

/*
  Dependencies shared by the services.
*/
struct ServiceContext {
  std::shared_ptr<chatlog::eventstore::EventStore>    events;
  std::shared_ptr<chatlog::eventstore::SnapshotStore> snapshots;
  chatlog::aggregate::LoaderOptions                   loader;
};

} // namespace chatlog::service
