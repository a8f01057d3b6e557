#include "internal/chat/conversation_events.hpp"

#include <google/protobuf/util/message_differencer.h>

#include <cassert>
#include <iostream>
#include <string>
#include <vector>

#include "internal/util/errors.hpp"
#include "internal/util/json.hpp"
#include "internal/util/time.hpp"

namespace {

namespace v1 = chatlog::v1;
using chatlog::chat::ConversationEvent;
using google::protobuf::util::MessageDifferencer;

google::protobuf::Timestamp At(uint64_t ms) {
  return chatlog::util::ToProto(chatlog::util::FromUnixMillis(ms));
}

std::vector<ConversationEvent> OneOfEach() {
  v1::ConversationCreated created;
  created.set_conversation_id("c1");
  created.set_user_id("u1");
  created.set_title("Trip planning");
  created.set_model_id("model-large");
  created.set_system_prompt("Be brief.");
  *created.mutable_timestamp() = At(1700000000000);

  v1::ConversationForked forked;
  forked.set_new_conversation_id("c2");
  forked.set_parent_stream_id("conversation-c1");
  forked.set_fork_at_version(4);
  forked.set_message_count(2);

  v1::UserMessageAdded user;
  user.set_message_id("m1");
  user.set_content("héllo \"world\"\n");

  v1::AssistantStreamStarted started;
  started.set_message_id("m2");
  started.set_model_id("model-large");

  v1::AssistantChunkReceived chunk;
  chunk.set_message_id("m2");
  chunk.set_chunk_index(3);
  chunk.set_content_block_index(1);
  chunk.set_delta_type("text_delta");
  chunk.set_delta_text("Hel");

  v1::AssistantStreamCompleted completed;
  completed.set_message_id("m2");
  completed.set_full_content("Hello");
  completed.set_stop_reason("end_turn");
  completed.set_input_tokens(12);
  completed.set_output_tokens(34);
  completed.set_latency_ms(560);

  v1::AssistantStreamFailed failed;
  failed.set_message_id("m2");
  failed.set_error_type("stream_timeout");
  failed.set_retry_count(2);

  v1::ToolCallStarted tool_started;
  tool_started.set_message_id("m2");
  tool_started.set_tool_use_id("t1");
  tool_started.set_tool_name("search");
  (*tool_started.mutable_input()->mutable_fields())["query"].set_string_value("weather");
  (*tool_started.mutable_input()->mutable_fields())["limit"].set_number_value(3);

  v1::ToolCallCompleted tool_completed;
  tool_completed.set_message_id("m2");
  tool_completed.set_tool_use_id("t1");
  (*tool_completed.mutable_output()->mutable_fields())["ok"].set_bool_value(true);
  tool_completed.set_duration_ms(41);

  v1::ConversationTitleUpdated title;
  title.set_title("Renamed");

  v1::ConversationArchived archived;
  *archived.mutable_timestamp() = At(1700000005000);

  return {created, forked, user, started, chunk, completed, failed, tool_started, tool_completed, title, archived};
}

void TestEveryEventSurvivesEncoding() {
  const auto events = OneOfEach();
  assert(events.size() == std::variant_size_v<ConversationEvent>);

  for (const auto& event : events) {
    auto encoded = chatlog::chat::Encode(event);
    assert(encoded.event_type == chatlog::chat::EventTypeOf(event));
    assert(chatlog::chat::IsConversationEventType(encoded.event_type));
    assert(encoded.metadata.empty());

    auto decoded = chatlog::chat::Decode(encoded.event_type, encoded.data);
    assert(decoded.index() == event.index());
    std::visit(
        [&](const auto& original) {
          using T = std::decay_t<decltype(original)>;
          assert(MessageDifferencer::Equals(original, std::get<T>(decoded)));
        },
        event);
  }
}

void TestTagsAreMessageNames() {
  v1::UserMessageAdded user;
  assert(chatlog::chat::EventTypeOf(user) == "UserMessageAdded");
  assert(chatlog::chat::EventTypeOf(v1::ConversationArchived{}) == "ConversationArchived");
  assert(!chatlog::chat::IsConversationEventType("ConversationState"));
  assert(!chatlog::chat::IsConversationEventType(""));
}

void TestPayloadUsesSnakeCaseFieldNames() {
  v1::AssistantChunkReceived chunk;
  chunk.set_message_id("m2");
  chunk.set_chunk_index(0);

  auto fields = chatlog::util::JsonToStringMap(chatlog::chat::Encode(chunk).data);
  assert(fields.at("message_id") == "m2");
  // Zero values are written out.
  assert(fields.count("chunk_index") == 1);
  assert(fields.count("content_block_index") == 1);
  assert(fields.count("messageId") == 0);
}

void TestStoredEventDecode() {
  chatlog::eventstore::StoredEvent stored;
  stored.event_type = "ConversationTitleUpdated";
  stored.data       = R"({"title":"From the log"})";

  auto decoded = chatlog::chat::Decode(stored);
  assert(std::get<v1::ConversationTitleUpdated>(decoded).title() == "From the log");
}

void TestUnknownFieldsAreIgnored() {
  auto decoded = chatlog::chat::Decode("UserMessageAdded", R"({"message_id":"m1","content":"hi","added_by_newer_writer":42})");
  assert(std::get<v1::UserMessageAdded>(decoded).content() == "hi");
}

void TestBadInputs() {
  bool unknown = false;
  try {
    chatlog::chat::Decode("ConversationExploded", "{}");
  } catch (const chatlog::util::UnknownEventType& e) {
    unknown = e.event_type() == "ConversationExploded";
  }
  assert(unknown);

  bool invalid = false;
  try {
    chatlog::chat::Decode("UserMessageAdded", "{not json");
  } catch (const chatlog::util::InvalidArgument&) {
    invalid = true;
  }
  assert(invalid);
}

} // namespace

int main() {
  TestEveryEventSurvivesEncoding();
  TestTagsAreMessageNames();
  TestPayloadUsesSnakeCaseFieldNames();
  TestStoredEventDecode();
  TestUnknownFieldsAreIgnored();
  TestBadInputs();

  std::cout << "chatlog_unit_conversation_events: pass\n";
  return 0;
}
