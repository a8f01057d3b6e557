#pragma once

#include <memory>

#include "config/config.pb.h"

#include "internal/db/api/repository.hpp"
#include "internal/eventstore/event_bus.hpp"
#include "internal/eventstore/event_store.hpp"
#include "internal/eventstore/snapshot_store.hpp"
#include "internal/projection/projector.hpp"
#include "internal/projection/stream_recovery.hpp"
#include "internal/service/conversation_service.hpp"

namespace chatlog::factory {

/*
  Application

  Owns every long-lived component. Background workers are built but
  not started; the host decides which to run.
*/
struct Application {
  std::shared_ptr<db::Repository> repository;

  std::shared_ptr<eventstore::EventBus>      bus;
  std::shared_ptr<eventstore::EventStore>    events;
  std::shared_ptr<eventstore::SnapshotStore> snapshots;

  std::shared_ptr<service::ConversationService> conversations;

  std::shared_ptr<projection::Projector>      projector;
  std::shared_ptr<projection::StreamRecovery> recovery;
};

/*
  Opens the configured backend and brings its schema up to date.

  NOTE:
  This is the ONLY place allowed to know concrete DB types.
*/
std::shared_ptr<db::Repository> BuildRepository(const chatlog::runtime::config::RuntimeConfig& config);

Application Build(const chatlog::runtime::config::RuntimeConfig& config);

} // namespace chatlog::factory
