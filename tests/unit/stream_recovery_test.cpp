#include "internal/projection/stream_recovery.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

#include "config/config.pb.h"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/eventstore/event_store.hpp"
#include "internal/projection/conversation_projection.hpp"
#include "internal/projection/projector.hpp"
#include "internal/service/conversation_service.hpp"

namespace {

namespace v1   = chatlog::v1;
namespace chat = chatlog::chat;
using chatlog::projection::StreamRecovery;
using chatlog::projection::StreamRecoveryOptions;

struct Fixture {
  Fixture()
      : repo(std::make_shared<chatlog::db::memory::MemoryRepository>()),
        events(std::make_shared<chatlog::eventstore::EventStore>(repo, nullptr)),
        service(std::make_shared<chatlog::service::ConversationService>(chatlog::service::ServiceContext{events, nullptr, {}})),
        projector(events, nullptr) {
  }

  // Conversation left streaming by a writer that went away.
  std::string Abandoned(const std::string& message_id) {
    auto created      = service->Create({"u1", "Trip", "model-a", ""});
    const auto stream = chatlog::service::ConversationStreamId(created.state.conversation_id());

    chat::AddUserMessage say;
    say.message_id = message_id + "-q";
    service->Execute(stream, say);

    chat::StartAssistantStream start;
    start.message_id = message_id;
    service->Execute(stream, start);
    return stream;
  }

  std::string ProjectedStatus(const std::string& stream) {
    auto tx  = repo->Begin();
    auto row = repo->GetConversationByStream(*tx, stream);
    tx->Commit();
    return row ? row->status : std::string{};
  }

  std::shared_ptr<chatlog::db::memory::MemoryRepository>  repo;
  std::shared_ptr<chatlog::eventstore::EventStore>        events;
  std::shared_ptr<chatlog::service::ConversationService>  service;
  chatlog::projection::Projector                          projector;
};

StreamRecoveryOptions Immediate() {
  StreamRecoveryOptions options;
  options.sweep_interval    = std::chrono::milliseconds(10);
  options.streaming_timeout = std::chrono::milliseconds(0);
  return options;
}

void WaitPastNow() {
  std::this_thread::sleep_for(std::chrono::milliseconds(5));
}

void TestSweepClosesStuckStreams() {
  Fixture f;
  const auto stuck = f.Abandoned("a1");
  f.projector.CatchUp();
  assert(f.ProjectedStatus(stuck) == chatlog::projection::kConversationStreaming);

  WaitPastNow();
  StreamRecovery recovery(f.repo, f.service, Immediate());
  assert(recovery.SweepOnce() == 1);

  auto state = f.service->Load(stuck).state;
  assert(state.status() == v1::CONVERSATION_STATUS_ACTIVE);

  auto last   = f.events->ReadForward(stuck, 4);
  auto failed = std::get<v1::AssistantStreamFailed>(chat::Decode(last.at(0)));
  assert(failed.message_id() == "a1");
  assert(failed.error_type() == chatlog::projection::kStreamTimeout);

  f.projector.CatchUp();
  assert(f.ProjectedStatus(stuck) == chatlog::projection::kConversationActive);
  WaitPastNow();
  assert(recovery.SweepOnce() == 0);
}

void TestLaggingProjectionIsHarmless() {
  Fixture f;
  const auto stream = f.Abandoned("a1");
  f.projector.CatchUp();

  // The stream completes after the projection last ran.
  chat::CompleteAssistantStream done;
  done.message_id = "a1";
  f.service->Execute(stream, done);

  WaitPastNow();
  StreamRecovery recovery(f.repo, f.service, Immediate());
  assert(recovery.SweepOnce() == 0);
  assert(f.events->CurrentVersion(stream) == 4);
}

void TestRecentStreamsAreLeftAlone() {
  Fixture f;
  const auto stream = f.Abandoned("a1");
  f.projector.CatchUp();

  StreamRecoveryOptions options;
  options.streaming_timeout = std::chrono::minutes(5);
  StreamRecovery recovery(f.repo, f.service, options);
  assert(recovery.SweepOnce() == 0);
  assert(f.service->Load(stream).state.status() == v1::CONVERSATION_STATUS_STREAMING);
}

void TestWorkerSweepsPeriodically() {
  Fixture f;
  const auto stream = f.Abandoned("a1");
  f.projector.CatchUp();
  WaitPastNow();

  StreamRecovery recovery(f.repo, f.service, Immediate());
  recovery.Start();

  const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
  while (f.service->Load(stream).state.status() == v1::CONVERSATION_STATUS_STREAMING && std::chrono::steady_clock::now() < deadline) {
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
  }
  recovery.Stop();
  recovery.Stop();

  assert(f.service->Load(stream).state.status() == v1::CONVERSATION_STATUS_ACTIVE);
}

void TestOptionsFromConfig() {
  chatlog::runtime::config::RecoveryConfig config;
  auto defaults = chatlog::projection::StreamRecoveryOptionsFromConfig(config);
  assert(defaults.sweep_interval == StreamRecoveryOptions{}.sweep_interval);
  assert(defaults.streaming_timeout == StreamRecoveryOptions{}.streaming_timeout);

  config.set_sweep_interval_ms(100);
  config.set_streaming_timeout_ms(2000);
  auto options = chatlog::projection::StreamRecoveryOptionsFromConfig(config);
  assert(options.sweep_interval == std::chrono::milliseconds(100));
  assert(options.streaming_timeout == std::chrono::milliseconds(2000));
}

} // namespace

int main() {
  TestSweepClosesStuckStreams();
  TestLaggingProjectionIsHarmless();
  TestRecentStreamsAreLeftAlone();
  TestWorkerSweepsPeriodically();
  TestOptionsFromConfig();

  std::cout << "chatlog_unit_stream_recovery: pass\n";
  return 0;
}
