#include "internal/service/conversation_service.hpp"

#include <cassert>
#include <iostream>
#include <memory>
#include <string>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/eventstore/event_store.hpp"
#include "internal/eventstore/snapshot_store.hpp"
#include "internal/util/errors.hpp"

namespace {

namespace v1   = chatlog::v1;
namespace chat = chatlog::chat;
using chatlog::service::ConversationService;
using chatlog::service::ConversationStreamId;

struct Fixture {
  Fixture() {
    auto repo = std::make_shared<chatlog::db::memory::MemoryRepository>();
    events    = std::make_shared<chatlog::eventstore::EventStore>(repo, nullptr);
    snapshots = std::make_shared<chatlog::eventstore::SnapshotStore>(repo);
    service   = std::make_shared<ConversationService>(chatlog::service::ServiceContext{events, snapshots, {100, 3}});
  }

  std::string NewConversation() {
    auto created = service->Create({"u1", "Trip", "model-a", "Be brief."});
    return ConversationStreamId(created.state.conversation_id());
  }

  std::shared_ptr<chatlog::eventstore::EventStore>    events;
  std::shared_ptr<chatlog::eventstore::SnapshotStore> snapshots;
  std::shared_ptr<ConversationService>                service;
};

chat::AddUserMessage Say(const std::string& id) {
  chat::AddUserMessage c;
  c.message_id = id;
  c.content    = "content of " + id;
  return c;
}

chat::StartAssistantStream Start(const std::string& id) {
  chat::StartAssistantStream c;
  c.message_id = id;
  return c;
}

template <typename Fn>
std::string RejectionReason(Fn&& fn) {
  try {
    fn();
  } catch (const chatlog::util::CommandRejected& e) {
    return e.reason();
  }
  return {};
}

template <typename Fn>
bool ThrowsInvalidArgument(Fn&& fn) {
  try {
    fn();
  } catch (const chatlog::util::InvalidArgument&) {
    return true;
  }
  return false;
}

void TestCreateMintsIdAndStream() {
  Fixture f;
  auto created = f.service->Create({"u1", "Trip", "model-a", ""}, "corr-1");

  assert(!created.state.conversation_id().empty());
  assert(created.version == 1);
  assert(created.events.size() == 1);
  assert(created.events[0].stream_id == ConversationStreamId(created.state.conversation_id()));
  assert(created.events[0].metadata.at("command") == "CreateConversation");
  assert(created.events[0].metadata.at("correlation_id") == "corr-1");
  assert(created.state.status() == v1::CONVERSATION_STATUS_CREATED);

  auto other = f.service->Create({"u1", "Trip", "model-a", ""});
  assert(other.state.conversation_id() != created.state.conversation_id());
  assert(!other.events[0].metadata.at("correlation_id").empty());
}

void TestExecuteStampsCommandTime() {
  Fixture f;
  const auto stream = f.NewConversation();

  const auto before = chatlog::util::NowMs();
  auto said         = f.service->Execute(stream, Say("m1"));
  assert(said.version == 2);
  assert(said.state.message_count() == 1);
  assert(said.events[0].metadata.at("command") == "AddUserMessage");

  auto event = std::get<v1::UserMessageAdded>(chat::Decode(said.events[0]));
  assert(chatlog::util::ToUnixMillis(chatlog::util::FromProto(event.timestamp())) >= before);

  // Redelivered message: nothing appended.
  auto again = f.service->Execute(stream, Say("m1"));
  assert(again.events.empty());
  assert(again.version == 2);

  assert(f.service->Load(stream).version == 2);
  assert(f.service->LoadAt(stream, 1).state.message_count() == 0);
}

void TestRejectionsAndBadRequests() {
  Fixture f;
  const auto stream = f.NewConversation();

  assert(RejectionReason([&] { f.service->Execute("conversation-missing", Say("m1")); }) == chat::reasons::kConversationNotFound);
  assert(RejectionReason([&] { f.service->Execute(stream, Start("a1")); }) == chat::reasons::kNoUserMessage);
  assert(ThrowsInvalidArgument([&] { f.service->Execute("", Say("m1")); }));
  assert(ThrowsInvalidArgument([&] { f.service->Load(""); }));

  // A rejected command leaves the stream untouched.
  assert(f.events->CurrentVersion(stream) == 1);
}

void TestForkRules() {
  Fixture f;
  const auto parent = f.NewConversation();
  f.service->Execute(parent, Say("m1"));           // 2
  f.service->Execute(parent, Start("a1"));         // 3
  chat::CompleteAssistantStream done;
  done.message_id   = "a1";
  done.full_content = "reply";
  f.service->Execute(parent, done);                // 4
  f.service->Execute(parent, Say("m2"));           // 5

  auto fork = f.service->Fork(parent, 2, "", "corr-fork");
  assert(fork.version == 1);
  assert(fork.state.parent_stream_id() == parent);
  assert(fork.state.fork_at_version() == 2);
  assert(fork.state.message_count() == 1);
  assert(fork.state.title() == "Trip");
  assert(fork.state.status() == v1::CONVERSATION_STATUS_ACTIVE);
  assert(fork.events[0].metadata.at("command") == "ForkConversation");
  assert(fork.events[0].metadata.at("correlation_id") == "corr-fork");

  auto titled = f.service->Fork(parent, 5, "Second try");
  assert(titled.state.message_count() == 3);
  assert(titled.state.title() == "Second try");

  // At version 3 the parent was streaming.
  assert(RejectionReason([&] { f.service->Fork(parent, 3); }) == chat::reasons::kStreamInProgress);
  assert(RejectionReason([&] { f.service->Fork("conversation-missing", 1); }) == chat::reasons::kConversationNotFound);
  assert(ThrowsInvalidArgument([&] { f.service->Fork(parent, 0); }));
  assert(ThrowsInvalidArgument([&] { f.service->Fork(parent, 6); }));
  assert(ThrowsInvalidArgument([&] { f.service->Fork("", 1); }));

  // The parent is unchanged by forking.
  assert(f.events->CurrentVersion(parent) == 5);
}

void TestSnapshotsAreWritten() {
  Fixture f;
  const auto stream = f.NewConversation();
  f.service->Execute(stream, Say("m1"));
  f.service->Execute(stream, Start("a1"));

  auto snapshot = f.snapshots->Latest(stream);
  assert(snapshot.has_value());
  assert(snapshot->stream_version == 3);
  assert(snapshot->snapshot_type == chat::ConversationAggregate::kSnapshotType);

  auto loaded = f.service->Load(stream);
  assert(loaded.version == 3);
  assert(loaded.state.streaming_message_id() == "a1");
}

void TestRecoverStream() {
  Fixture f;
  const auto stream = f.NewConversation();
  assert(!f.service->RecoverStream(stream, "stream_timeout"));

  f.service->Execute(stream, Say("m1"));
  f.service->Execute(stream, Start("a1"));
  assert(f.service->RecoverStream(stream, "stream_timeout"));

  const auto events = f.events->ReadForward(stream, 4);
  assert(events.size() == 1);
  auto failed = std::get<v1::AssistantStreamFailed>(chat::Decode(events[0]));
  assert(failed.message_id() == "a1");
  assert(failed.error_type() == "stream_timeout");
  assert(events[0].metadata.at("command") == "FailAssistantStream");

  assert(f.service->Load(stream).state.status() == v1::CONVERSATION_STATUS_ACTIVE);
  assert(!f.service->RecoverStream(stream, "stream_timeout"));
}

} // namespace

int main() {
  TestCreateMintsIdAndStream();
  TestExecuteStampsCommandTime();
  TestRejectionsAndBadRequests();
  TestForkRules();
  TestSnapshotsAreWritten();
  TestRecoverStream();

  std::cout << "chatlog_unit_conversation_service: pass\n";
  return 0;
}
