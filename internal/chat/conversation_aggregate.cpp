#include "internal/chat/conversation_aggregate.hpp"

#include <algorithm>

#include "internal/aggregate/aggregate.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/json.hpp"
#include "internal/util/overloaded.hpp"

namespace chatlog::chat {

static_assert(aggregate::Aggregate<ConversationAggregate>);

namespace {

[[noreturn]] void Reject(const char* reason, const std::string& message) {
  throw util::CommandRejected(reason, message);
}

void RequireExists(const v1::ConversationState& s) {
  if (s.status() == v1::CONVERSATION_STATUS_UNSPECIFIED) Reject(reasons::kConversationNotFound, "conversation does not exist");
}

void RequireNotArchived(const v1::ConversationState& s) {
  if (s.status() == v1::CONVERSATION_STATUS_ARCHIVED) Reject(reasons::kConversationArchived, "conversation " + s.conversation_id() + " is archived");
}

bool HasPendingTool(const v1::ConversationState& s, const std::string& tool_use_id) {
  return std::find(s.pending_tool_use_ids().begin(), s.pending_tool_use_ids().end(), tool_use_id) != s.pending_tool_use_ids().end();
}

using Events = std::vector<eventstore::EventData>;

Events One(const ConversationEvent& event) {
  return {Encode(event)};
}

// ------------------------------------------------------------------
// Decisions
// ------------------------------------------------------------------

Events Decide(const v1::ConversationState& s, const CreateConversation& c) {
  if (s.status() != v1::CONVERSATION_STATUS_UNSPECIFIED) Reject(reasons::kConversationExists, "conversation already exists");
  if (c.conversation_id.empty() || c.user_id.empty()) Reject(reasons::kInvalidCommand, "conversation_id and user_id are required");

  v1::ConversationCreated e;
  e.set_conversation_id(c.conversation_id);
  e.set_user_id(c.user_id);
  e.set_title(c.title);
  e.set_model_id(c.model_id);
  e.set_system_prompt(c.system_prompt);
  *e.mutable_timestamp() = util::ToProto(c.at);
  return One(e);
}

Events Decide(const v1::ConversationState& s, const ForkConversation& c) {
  if (s.status() != v1::CONVERSATION_STATUS_UNSPECIFIED) Reject(reasons::kConversationExists, "conversation already exists");
  if (c.new_conversation_id.empty() || c.parent_stream_id.empty()) Reject(reasons::kInvalidCommand, "new_conversation_id and parent_stream_id are required");
  if (c.parent.status() == v1::CONVERSATION_STATUS_UNSPECIFIED) Reject(reasons::kConversationNotFound, "parent conversation does not exist");
  if (c.parent.status() == v1::CONVERSATION_STATUS_STREAMING) {
    Reject(reasons::kStreamInProgress, "parent is streaming at version " + std::to_string(c.fork_at_version));
  }

  v1::ConversationForked e;
  e.set_new_conversation_id(c.new_conversation_id);
  e.set_parent_stream_id(c.parent_stream_id);
  e.set_fork_at_version(static_cast<int64_t>(c.fork_at_version));
  e.set_user_id(c.parent.user_id());
  e.set_title(c.title.empty() ? c.parent.title() : c.title);
  e.set_model_id(c.parent.model_id());
  e.set_system_prompt(c.parent.system_prompt());
  e.set_message_count(c.parent.message_count());
  *e.mutable_timestamp() = util::ToProto(c.at);
  return One(e);
}

Events Decide(const v1::ConversationState& s, const AddUserMessage& c) {
  RequireExists(s);
  if (!c.message_id.empty() && c.message_id == s.last_user_message_id()) return {};
  RequireNotArchived(s);
  if (s.status() == v1::CONVERSATION_STATUS_STREAMING) Reject(reasons::kStreamInProgress, "assistant is still streaming " + s.streaming_message_id());
  if (c.message_id.empty()) Reject(reasons::kInvalidCommand, "message_id is required");

  v1::UserMessageAdded e;
  e.set_message_id(c.message_id);
  e.set_content(c.content);
  *e.mutable_timestamp() = util::ToProto(c.at);
  return One(e);
}

Events Decide(const v1::ConversationState& s, const StartAssistantStream& c) {
  RequireExists(s);
  RequireNotArchived(s);
  if (s.status() == v1::CONVERSATION_STATUS_STREAMING) {
    if (s.streaming_message_id() == c.message_id) return {};
    Reject(reasons::kStreamInProgress, "assistant is already streaming " + s.streaming_message_id());
  }
  if (s.status() != v1::CONVERSATION_STATUS_ACTIVE) Reject(reasons::kNoUserMessage, "no user message to answer");
  if (c.message_id.empty()) Reject(reasons::kInvalidCommand, "message_id is required");

  v1::AssistantStreamStarted e;
  e.set_message_id(c.message_id);
  e.set_model_id(c.model_id.empty() ? s.model_id() : c.model_id);
  *e.mutable_timestamp() = util::ToProto(c.at);
  return One(e);
}

Events Decide(const v1::ConversationState& s, const RecordAssistantChunk& c) {
  RequireExists(s);
  RequireNotArchived(s);
  if (s.status() != v1::CONVERSATION_STATUS_STREAMING) Reject(reasons::kNotStreaming, "no assistant stream is open");
  if (s.streaming_message_id() != c.message_id) {
    Reject(reasons::kMessageMismatch, "chunk for " + c.message_id + " while streaming " + s.streaming_message_id());
  }
  // Redelivered chunk.
  if (c.chunk_index < s.next_chunk_index()) return {};

  v1::AssistantChunkReceived e;
  e.set_message_id(c.message_id);
  e.set_chunk_index(c.chunk_index);
  e.set_content_block_index(c.content_block_index);
  e.set_delta_type(c.delta_type);
  e.set_delta_text(c.delta_text);
  *e.mutable_timestamp() = util::ToProto(c.at);
  return One(e);
}

Events Decide(const v1::ConversationState& s, const CompleteAssistantStream& c) {
  RequireExists(s);
  if (!c.message_id.empty() && c.message_id == s.last_completed_message_id()) return {};
  RequireNotArchived(s);
  if (s.status() != v1::CONVERSATION_STATUS_STREAMING) Reject(reasons::kNotStreaming, "no assistant stream is open");
  if (s.streaming_message_id() != c.message_id) {
    Reject(reasons::kMessageMismatch, "completion for " + c.message_id + " while streaming " + s.streaming_message_id());
  }

  v1::AssistantStreamCompleted e;
  e.set_message_id(c.message_id);
  e.set_full_content(c.full_content);
  e.set_stop_reason(c.stop_reason);
  e.set_input_tokens(c.input_tokens);
  e.set_output_tokens(c.output_tokens);
  e.set_latency_ms(c.latency_ms);
  *e.mutable_timestamp() = util::ToProto(c.at);
  return One(e);
}

v1::AssistantStreamFailed FailedEvent(const v1::ConversationState& s, const FailAssistantStream& c) {
  v1::AssistantStreamFailed e;
  e.set_message_id(s.streaming_message_id());
  e.set_error_type(c.error_type);
  e.set_error_message(c.error_message);
  e.set_retry_count(c.retry_count);
  *e.mutable_timestamp() = util::ToProto(c.at);
  return e;
}

Events Decide(const v1::ConversationState& s, const FailAssistantStream& c) {
  RequireExists(s);
  if (s.status() != v1::CONVERSATION_STATUS_STREAMING) return {};
  if (!c.message_id.empty() && c.message_id != s.streaming_message_id()) {
    Reject(reasons::kMessageMismatch, "failure for " + c.message_id + " while streaming " + s.streaming_message_id());
  }
  return One(FailedEvent(s, c));
}

void RequireToolState(const v1::ConversationState& s) {
  RequireExists(s);
  RequireNotArchived(s);
  if (s.status() != v1::CONVERSATION_STATUS_ACTIVE && s.status() != v1::CONVERSATION_STATUS_STREAMING) {
    Reject(reasons::kNoUserMessage, "tool calls need an active conversation");
  }
}

Events Decide(const v1::ConversationState& s, const StartToolCall& c) {
  RequireToolState(s);
  if (c.tool_use_id.empty()) Reject(reasons::kInvalidCommand, "tool_use_id is required");
  if (HasPendingTool(s, c.tool_use_id)) return {};

  v1::ToolCallStarted e;
  e.set_message_id(c.message_id);
  e.set_tool_use_id(c.tool_use_id);
  e.set_tool_name(c.tool_name);
  *e.mutable_input()     = c.input;
  *e.mutable_timestamp() = util::ToProto(c.at);
  return One(e);
}

Events Decide(const v1::ConversationState& s, const CompleteToolCall& c) {
  RequireToolState(s);
  if (!HasPendingTool(s, c.tool_use_id)) Reject(reasons::kUnknownToolCall, "no pending tool call " + c.tool_use_id);

  v1::ToolCallCompleted e;
  e.set_message_id(c.message_id);
  e.set_tool_use_id(c.tool_use_id);
  e.set_tool_name(c.tool_name);
  *e.mutable_input()     = c.input;
  *e.mutable_output()    = c.output;
  e.set_duration_ms(c.duration_ms);
  *e.mutable_timestamp() = util::ToProto(c.at);
  return One(e);
}

Events Decide(const v1::ConversationState& s, const UpdateTitle& c) {
  RequireExists(s);
  RequireNotArchived(s);
  if (c.title == s.title()) return {};

  v1::ConversationTitleUpdated e;
  e.set_title(c.title);
  *e.mutable_timestamp() = util::ToProto(c.at);
  return One(e);
}

Events Decide(const v1::ConversationState& s, const ArchiveConversation& c) {
  RequireExists(s);
  if (s.status() == v1::CONVERSATION_STATUS_ARCHIVED) return {};

  Events events;
  if (s.status() == v1::CONVERSATION_STATUS_STREAMING) {
    FailAssistantStream fail;
    fail.error_type    = reasons::kConversationArchived;
    fail.error_message = "conversation archived while streaming";
    fail.at            = c.at;
    events.push_back(Encode(FailedEvent(s, fail)));
  }

  v1::ConversationArchived e;
  *e.mutable_timestamp() = util::ToProto(c.at);
  events.push_back(Encode(e));
  return events;
}

void CloseStream(v1::ConversationState& s) {
  s.set_status(v1::CONVERSATION_STATUS_ACTIVE);
  s.clear_streaming_message_id();
  s.set_next_chunk_index(0);
}

} // namespace

ConversationAggregate::State ConversationAggregate::Init() {
  return State{};
}

ConversationAggregate::State ConversationAggregate::ApplyEvent(const State& state, const eventstore::StoredEvent& event) {
  return Apply(state, Decode(event));
}

ConversationAggregate::State ConversationAggregate::Apply(const State& state, const ConversationEvent& event) {
  State s = state;
  std::visit(util::Overloaded{
                 [&](const v1::ConversationCreated& e) {
                   s.set_conversation_id(e.conversation_id());
                   s.set_user_id(e.user_id());
                   s.set_title(e.title());
                   s.set_model_id(e.model_id());
                   s.set_system_prompt(e.system_prompt());
                   s.set_status(v1::CONVERSATION_STATUS_CREATED);
                 },
                 [&](const v1::ConversationForked& e) {
                   s.set_conversation_id(e.new_conversation_id());
                   s.set_user_id(e.user_id());
                   s.set_title(e.title());
                   s.set_model_id(e.model_id());
                   s.set_system_prompt(e.system_prompt());
                   s.set_message_count(e.message_count());
                   s.set_parent_stream_id(e.parent_stream_id());
                   s.set_fork_at_version(e.fork_at_version());
                   s.set_status(e.message_count() > 0 ? v1::CONVERSATION_STATUS_ACTIVE : v1::CONVERSATION_STATUS_CREATED);
                 },
                 [&](const v1::UserMessageAdded& e) {
                   s.set_status(v1::CONVERSATION_STATUS_ACTIVE);
                   s.set_message_count(s.message_count() + 1);
                   s.set_last_user_message_id(e.message_id());
                 },
                 [&](const v1::AssistantStreamStarted& e) {
                   s.set_status(v1::CONVERSATION_STATUS_STREAMING);
                   s.set_message_count(s.message_count() + 1);
                   s.set_streaming_message_id(e.message_id());
                   s.set_next_chunk_index(0);
                 },
                 [&](const v1::AssistantChunkReceived& e) {
                   s.set_next_chunk_index(std::max(s.next_chunk_index(), e.chunk_index() + 1));
                 },
                 [&](const v1::AssistantStreamCompleted& e) {
                   CloseStream(s);
                   s.set_last_completed_message_id(e.message_id());
                 },
                 [&](const v1::AssistantStreamFailed&) { CloseStream(s); },
                 [&](const v1::ToolCallStarted& e) {
                   if (!HasPendingTool(s, e.tool_use_id())) s.add_pending_tool_use_ids(e.tool_use_id());
                 },
                 [&](const v1::ToolCallCompleted& e) {
                   auto* pending = s.mutable_pending_tool_use_ids();
                   pending->erase(std::remove(pending->begin(), pending->end(), e.tool_use_id()), pending->end());
                 },
                 [&](const v1::ConversationTitleUpdated& e) { s.set_title(e.title()); },
                 [&](const v1::ConversationArchived&) {
                   s.set_status(v1::CONVERSATION_STATUS_ARCHIVED);
                   s.clear_streaming_message_id();
                   s.set_next_chunk_index(0);
                 },
             },
             event);
  return s;
}

std::vector<eventstore::EventData> ConversationAggregate::HandleCommand(const State& state, const Command& command) {
  return std::visit([&](const auto& c) { return Decide(state, c); }, command);
}

std::string ConversationAggregate::SerializeState(const State& state) {
  return util::MessageToJson(state);
}

ConversationAggregate::State ConversationAggregate::DeserializeState(const std::string& data) {
  State state;
  util::JsonToMessage(data, &state);
  return state;
}

} // namespace chatlog::chat
