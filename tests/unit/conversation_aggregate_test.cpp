#include "internal/chat/conversation_aggregate.hpp"

#include <google/protobuf/util/message_differencer.h>

#include <cassert>
#include <iostream>
#include <string>
#include <vector>

#include "internal/util/errors.hpp"

namespace {

namespace v1 = chatlog::v1;
using chatlog::chat::ConversationAggregate;
using chatlog::chat::ConversationCommand;
using State = ConversationAggregate::State;

/*
  Decide and fold, the way the Loader does it but without a store.
*/
struct Harness {
  State state = ConversationAggregate::Init();

  std::vector<chatlog::eventstore::EventData> Run(const ConversationCommand& command) {
    auto events = ConversationAggregate::HandleCommand(state, command);
    for (const auto& e : events) state = ConversationAggregate::Apply(state, chatlog::chat::Decode(e.event_type, e.data));
    return events;
  }
};

std::string Rejection(Harness& h, const ConversationCommand& command) {
  const State before = h.state;
  try {
    h.Run(command);
  } catch (const chatlog::util::CommandRejected& e) {
    assert(google::protobuf::util::MessageDifferencer::Equals(before, h.state));
    return e.reason();
  }
  return {};
}

chatlog::chat::CreateConversation Create(const std::string& id = "c1") {
  chatlog::chat::CreateConversation c;
  c.conversation_id = id;
  c.user_id         = "u1";
  c.title           = "Trip";
  c.model_id        = "model-a";
  c.system_prompt   = "Be brief.";
  return c;
}

chatlog::chat::AddUserMessage Say(const std::string& id, const std::string& content = "hi") {
  return {id, content, {}};
}

chatlog::chat::StartAssistantStream Start(const std::string& id) {
  chatlog::chat::StartAssistantStream c;
  c.message_id = id;
  return c;
}

chatlog::chat::RecordAssistantChunk Chunk(const std::string& id, int32_t index, const std::string& text) {
  chatlog::chat::RecordAssistantChunk c;
  c.message_id  = id;
  c.chunk_index = index;
  c.delta_type  = "text_delta";
  c.delta_text  = text;
  return c;
}

chatlog::chat::CompleteAssistantStream Complete(const std::string& id) {
  chatlog::chat::CompleteAssistantStream c;
  c.message_id    = id;
  c.full_content  = "Hello there";
  c.stop_reason   = "end_turn";
  c.input_tokens  = 5;
  c.output_tokens = 7;
  return c;
}

void TestConversationLifecycle() {
  Harness h;
  assert(h.state.status() == v1::CONVERSATION_STATUS_UNSPECIFIED);

  auto created = h.Run(Create());
  assert(created.size() == 1 && created[0].event_type == "ConversationCreated");
  assert(h.state.status() == v1::CONVERSATION_STATUS_CREATED);
  assert(h.state.conversation_id() == "c1");
  assert(h.state.model_id() == "model-a");

  h.Run(Say("m1"));
  assert(h.state.status() == v1::CONVERSATION_STATUS_ACTIVE);
  assert(h.state.message_count() == 1);
  assert(h.state.last_user_message_id() == "m1");

  auto started = h.Run(Start("a1"));
  assert(h.state.status() == v1::CONVERSATION_STATUS_STREAMING);
  assert(h.state.streaming_message_id() == "a1");
  assert(h.state.message_count() == 2);
  // Model defaults to the conversation's.
  auto started_event = std::get<v1::AssistantStreamStarted>(chatlog::chat::Decode(started[0].event_type, started[0].data));
  assert(started_event.model_id() == "model-a");

  h.Run(Chunk("a1", 0, "Hel"));
  h.Run(Chunk("a1", 1, "lo"));
  assert(h.state.next_chunk_index() == 2);

  h.Run(Complete("a1"));
  assert(h.state.status() == v1::CONVERSATION_STATUS_ACTIVE);
  assert(h.state.streaming_message_id().empty());
  assert(h.state.next_chunk_index() == 0);
  assert(h.state.message_count() == 2);

  chatlog::chat::UpdateTitle rename;
  rename.title = "Trip to Lisbon";
  h.Run(rename);
  assert(h.state.title() == "Trip to Lisbon");

  h.Run(chatlog::chat::ArchiveConversation{});
  assert(h.state.status() == v1::CONVERSATION_STATUS_ARCHIVED);
}

void TestArchiveWhileStreamingClosesTheStream() {
  Harness h;
  h.Run(Create());
  h.Run(Say("m1"));
  h.Run(Start("a1"));

  auto events = h.Run(chatlog::chat::ArchiveConversation{});
  assert(events.size() == 2);
  assert(events[0].event_type == "AssistantStreamFailed");
  assert(events[1].event_type == "ConversationArchived");

  auto failed = std::get<v1::AssistantStreamFailed>(chatlog::chat::Decode(events[0].event_type, events[0].data));
  assert(failed.message_id() == "a1");
  assert(failed.error_type() == chatlog::chat::reasons::kConversationArchived);

  assert(h.state.status() == v1::CONVERSATION_STATUS_ARCHIVED);
  assert(h.state.streaming_message_id().empty());
}

void TestRejections() {
  Harness h;
  assert(Rejection(h, Say("m1")) == chatlog::chat::reasons::kConversationNotFound);
  assert(Rejection(h, chatlog::chat::ArchiveConversation{}) == chatlog::chat::reasons::kConversationNotFound);

  auto missing_user = Create();
  missing_user.user_id.clear();
  assert(Rejection(h, missing_user) == chatlog::chat::reasons::kInvalidCommand);

  h.Run(Create());
  assert(Rejection(h, Create()) == chatlog::chat::reasons::kConversationExists);
  assert(Rejection(h, Start("a1")) == chatlog::chat::reasons::kNoUserMessage);
  assert(Rejection(h, Chunk("a1", 0, "x")) == chatlog::chat::reasons::kNotStreaming);
  assert(Rejection(h, Say("")) == chatlog::chat::reasons::kInvalidCommand);

  h.Run(Say("m1"));
  h.Run(Start("a1"));
  assert(Rejection(h, Say("m2")) == chatlog::chat::reasons::kStreamInProgress);
  assert(Rejection(h, Start("a2")) == chatlog::chat::reasons::kStreamInProgress);
  assert(Rejection(h, Chunk("a2", 0, "x")) == chatlog::chat::reasons::kMessageMismatch);
  assert(Rejection(h, Complete("a2")) == chatlog::chat::reasons::kMessageMismatch);

  chatlog::chat::FailAssistantStream wrong_fail;
  wrong_fail.message_id = "a2";
  assert(Rejection(h, wrong_fail) == chatlog::chat::reasons::kMessageMismatch);

  chatlog::chat::CompleteToolCall unknown_tool;
  unknown_tool.tool_use_id = "t9";
  assert(Rejection(h, unknown_tool) == chatlog::chat::reasons::kUnknownToolCall);

  h.Run(chatlog::chat::ArchiveConversation{});
  assert(Rejection(h, Say("m3")) == chatlog::chat::reasons::kConversationArchived);
  chatlog::chat::UpdateTitle rename;
  rename.title = "new";
  assert(Rejection(h, rename) == chatlog::chat::reasons::kConversationArchived);
}

void TestRedeliveredCommandsAreNoOps() {
  Harness h;
  h.Run(Create());
  h.Run(Say("m1"));
  assert(h.Run(Say("m1")).empty());
  assert(h.state.message_count() == 1);

  h.Run(Start("a1"));
  assert(h.Run(Start("a1")).empty());

  h.Run(Chunk("a1", 0, "a"));
  h.Run(Chunk("a1", 1, "b"));
  assert(h.Run(Chunk("a1", 0, "a")).empty());
  assert(h.state.next_chunk_index() == 2);

  h.Run(Complete("a1"));
  assert(h.Run(Complete("a1")).empty());
  // Nothing to fail once the stream closed.
  chatlog::chat::FailAssistantStream fail;
  fail.error_type = "stream_timeout";
  assert(h.Run(fail).empty());

  chatlog::chat::UpdateTitle same;
  same.title = h.state.title();
  assert(h.Run(same).empty());

  h.Run(chatlog::chat::ArchiveConversation{});
  assert(h.Run(chatlog::chat::ArchiveConversation{}).empty());
}

void TestCompletionOfUnknownMessageIsRejected() {
  Harness h;
  h.Run(Create());
  h.Run(Say("m1"));
  assert(Rejection(h, Complete("never-started")) == chatlog::chat::reasons::kNotStreaming);

  h.Run(Start("a1"));
  h.Run(Complete("a1"));
  assert(h.state.last_completed_message_id() == "a1");
  assert(h.Run(Complete("a1")).empty());
  assert(Rejection(h, Complete("a0")) == chatlog::chat::reasons::kNotStreaming);

  // A failed stream never counts as completed.
  h.Run(Say("m2"));
  h.Run(Start("a2"));
  h.Run(chatlog::chat::FailAssistantStream{});
  assert(Rejection(h, Complete("a2")) == chatlog::chat::reasons::kNotStreaming);
  assert(h.state.last_completed_message_id() == "a1");
}

void TestFailWithoutMessageIdTargetsOpenStream() {
  Harness h;
  h.Run(Create());
  h.Run(Say("m1"));
  h.Run(Start("a1"));

  chatlog::chat::FailAssistantStream fail;
  fail.error_type    = "stream_timeout";
  fail.error_message = "no chunk for 5m";
  auto events        = h.Run(fail);
  assert(events.size() == 1);
  auto failed = std::get<v1::AssistantStreamFailed>(chatlog::chat::Decode(events[0].event_type, events[0].data));
  assert(failed.message_id() == "a1");
  assert(h.state.status() == v1::CONVERSATION_STATUS_ACTIVE);

  // A new answer can start after the failure.
  h.Run(Start("a2"));
  assert(h.state.streaming_message_id() == "a2");
}

void TestToolCalls() {
  Harness h;
  h.Run(Create());
  h.Run(Say("m1"));

  chatlog::chat::StartToolCall start;
  start.message_id  = "m1";
  start.tool_use_id = "t1";
  start.tool_name   = "search";
  (*start.input.mutable_fields())["q"].set_string_value("weather");
  assert(h.Run(start).size() == 1);
  assert(h.state.pending_tool_use_ids_size() == 1);
  assert(h.Run(start).empty());

  chatlog::chat::CompleteToolCall done;
  done.message_id  = "m1";
  done.tool_use_id = "t1";
  done.tool_name   = "search";
  done.duration_ms = 12;
  (*done.output.mutable_fields())["temp"].set_number_value(21);
  assert(h.Run(done).size() == 1);
  assert(h.state.pending_tool_use_ids_size() == 0);
}

void TestForkInheritsParent() {
  Harness parent;
  parent.Run(Create("p"));
  parent.Run(Say("m1"));

  chatlog::chat::ForkConversation fork;
  fork.new_conversation_id = "f";
  fork.parent_stream_id    = "conversation-p";
  fork.fork_at_version     = 2;
  fork.parent              = parent.state;

  Harness child;
  auto events = child.Run(fork);
  assert(events.size() == 1 && events[0].event_type == "ConversationForked");
  assert(child.state.conversation_id() == "f");
  assert(child.state.title() == "Trip");
  assert(child.state.user_id() == "u1");
  assert(child.state.message_count() == 1);
  assert(child.state.status() == v1::CONVERSATION_STATUS_ACTIVE);
  assert(child.state.parent_stream_id() == "conversation-p");
  assert(child.state.fork_at_version() == 2);

  // A fork of a conversation with no messages starts out created.
  Harness empty_parent;
  empty_parent.Run(Create("e"));
  fork.new_conversation_id = "g";
  fork.fork_at_version     = 1;
  fork.parent              = empty_parent.state;
  fork.title               = "Branch";
  Harness empty_child;
  empty_child.Run(fork);
  assert(empty_child.state.status() == v1::CONVERSATION_STATUS_CREATED);
  assert(empty_child.state.title() == "Branch");

  Harness refused;
  fork.parent = State{};
  assert(Rejection(refused, fork) == chatlog::chat::reasons::kConversationNotFound);

  parent.Run(Start("a1"));
  fork.parent = parent.state;
  assert(Rejection(refused, fork) == chatlog::chat::reasons::kStreamInProgress);

  assert(Rejection(child, fork) == chatlog::chat::reasons::kConversationExists);
}

void TestStateSnapshotCodec() {
  Harness h;
  h.Run(Create());
  h.Run(Say("m1"));
  h.Run(Start("a1"));
  h.Run(Chunk("a1", 0, "x"));

  auto data     = ConversationAggregate::SerializeState(h.state);
  auto restored = ConversationAggregate::DeserializeState(data);
  assert(google::protobuf::util::MessageDifferencer::Equals(h.state, restored));

  bool threw = false;
  try {
    (void)ConversationAggregate::DeserializeState("not json");
  } catch (const std::exception&) {
    threw = true;
  }
  assert(threw);
}

void TestUnknownStoredEventIsRejected() {
  chatlog::eventstore::StoredEvent stored;
  stored.event_type = "SomethingElse";
  stored.data       = "{}";

  bool threw = false;
  try {
    (void)ConversationAggregate::ApplyEvent(ConversationAggregate::Init(), stored);
  } catch (const chatlog::util::UnknownEventType&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestConversationLifecycle();
  TestArchiveWhileStreamingClosesTheStream();
  TestRejections();
  TestRedeliveredCommandsAreNoOps();
  TestCompletionOfUnknownMessageIsRejected();
  TestFailWithoutMessageIdTargetsOpenStream();
  TestToolCalls();
  TestForkInheritsParent();
  TestStateSnapshotCodec();
  TestUnknownStoredEventIsRejected();

  std::cout << "chatlog_unit_conversation_aggregate: pass\n";
  return 0;
}
