#include "internal/projection/conversation_projection.hpp"

#include <algorithm>

#include "internal/chat/conversation_events.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/json.hpp"
#include "internal/util/overloaded.hpp"

namespace chatlog::projection {

namespace {

void Check(const db::Result& result, const char* what) {
  if (!result) {
    throw util::StorageError(std::string("projection ") + what + ": " + db::ToString(result.code) + " " + result.message);
  }
}

db::model::MessageRecord* FindMessage(std::vector<db::model::MessageRecord>& messages, const std::string& id) {
  auto it = std::find_if(messages.begin(), messages.end(), [&](const auto& m) { return m.id == id; });
  return it == messages.end() ? nullptr : &*it;
}

} // namespace

ConversationProjection::ConversationProjection(std::shared_ptr<db::Repository> repository) : repository_(std::move(repository)) {
}

void ConversationProjection::Apply(db::Transaction& tx, const eventstore::StoredEvent& event) {
  const auto decoded = chat::Decode(event);

  std::visit(util::Overloaded{
                 [&](const v1::ConversationCreated& e) { OnCreated(tx, event, e); },
                 [&](const v1::ConversationForked& e) { OnForked(tx, event, e); },
                 [&](const v1::UserMessageAdded& e) { OnUserMessage(tx, event, e); },
                 [&](const v1::AssistantStreamStarted& e) { OnStreamStarted(tx, event, e); },
                 [&](const v1::AssistantChunkReceived& e) { OnChunk(tx, event, e); },
                 [&](const v1::AssistantStreamCompleted& e) { OnStreamCompleted(tx, event, e); },
                 [&](const v1::AssistantStreamFailed& e) { OnStreamFailed(tx, event, e); },
                 [&](const v1::ToolCallStarted& e) { OnToolStarted(tx, event, e); },
                 [&](const v1::ToolCallCompleted& e) { OnToolCompleted(tx, event, e); },
                 [&](const v1::ConversationTitleUpdated& e) {
                   auto row  = LoadConversation(tx, event.stream_id);
                   row.title = e.title();
                   SaveConversation(tx, row, event);
                 },
                 [&](const v1::ConversationArchived&) {
                   auto row   = LoadConversation(tx, event.stream_id);
                   row.status = kConversationArchived;
                   SaveConversation(tx, row, event);
                 },
             },
             decoded);
}

// ------------------------------------------------------------------
// Conversations
// ------------------------------------------------------------------

void ConversationProjection::OnCreated(db::Transaction& tx, const eventstore::StoredEvent& event, const v1::ConversationCreated& e) {
  db::model::ConversationRecord row;
  if (auto existing = repository_->GetConversation(tx, e.conversation_id())) row = *existing;

  row.id            = e.conversation_id();
  row.stream_id     = event.stream_id;
  row.user_id       = e.user_id();
  row.title         = e.title();
  row.model_id      = e.model_id();
  row.system_prompt = e.system_prompt();
  row.status        = kConversationActive;
  if (row.created_at_ms == 0) row.created_at_ms = event.inserted_at_ms;
  SaveConversation(tx, row, event);
}

void ConversationProjection::OnForked(db::Transaction& tx, const eventstore::StoredEvent& event, const v1::ConversationForked& e) {
  const auto& new_id  = e.new_conversation_id();
  auto        history = HistoryAt(tx, e.parent_stream_id(), static_cast<uint64_t>(e.fork_at_version()));

  uint64_t last_message_at = 0;
  uint64_t position        = 0;
  for (auto& message : history.messages) {
    message.id              = new_id + ":" + message.id;
    message.conversation_id = new_id;
    message.position        = ++position;
    last_message_at         = std::max(last_message_at, message.created_at_ms);
    Check(repository_->UpsertMessage(tx, message), "copy forked message");
  }

  db::model::ConversationRecord row;
  if (auto existing = repository_->GetConversation(tx, new_id)) row = *existing;

  row.id                     = new_id;
  row.stream_id              = event.stream_id;
  row.user_id                = e.user_id();
  row.title                  = e.title();
  row.model_id               = e.model_id();
  row.system_prompt          = e.system_prompt();
  row.status                 = kConversationActive;
  row.parent_conversation_id = history.conversation_id;
  row.fork_at_version        = static_cast<uint64_t>(e.fork_at_version());
  row.last_message_at_ms     = last_message_at;
  if (row.created_at_ms == 0) row.created_at_ms = event.inserted_at_ms;
  SaveConversation(tx, row, event);
}

db::model::ConversationRecord ConversationProjection::LoadConversation(db::Transaction& tx, const std::string& stream_id) {
  auto row = repository_->GetConversationByStream(tx, stream_id);
  if (!row) throw util::StorageError("projection: no conversation row for " + stream_id);
  return *row;
}

void ConversationProjection::SaveConversation(db::Transaction& tx, db::model::ConversationRecord& row, const eventstore::StoredEvent& event) {
  row.message_count = repository_->CountMessages(tx, row.id);
  row.updated_at_ms = event.inserted_at_ms;
  Check(repository_->UpsertConversation(tx, row), "upsert conversation");
}

// ------------------------------------------------------------------
// Messages
// ------------------------------------------------------------------

db::model::MessageRecord ConversationProjection::LoadOrNewMessage(db::Transaction& tx, const std::string& message_id,
                                                                  const std::string& conversation_id) {
  if (auto existing = repository_->GetMessage(tx, message_id)) return *existing;

  db::model::MessageRecord row;
  row.id              = message_id;
  row.conversation_id = conversation_id;
  row.position        = repository_->CountMessages(tx, conversation_id) + 1;
  return row;
}

void ConversationProjection::OnUserMessage(db::Transaction& tx, const eventstore::StoredEvent& event, const v1::UserMessageAdded& e) {
  auto conversation = LoadConversation(tx, event.stream_id);

  auto message    = LoadOrNewMessage(tx, e.message_id(), conversation.id);
  message.role    = "user";
  message.content = e.content();
  message.status  = kMessageComplete;
  if (message.stream_version == 0) message.stream_version = event.stream_version;
  if (message.created_at_ms == 0) message.created_at_ms = event.inserted_at_ms;
  message.updated_at_ms = event.inserted_at_ms;
  Check(repository_->UpsertMessage(tx, message), "upsert user message");

  conversation.status             = kConversationActive;
  conversation.last_message_at_ms = event.inserted_at_ms;
  SaveConversation(tx, conversation, event);
}

void ConversationProjection::OnStreamStarted(db::Transaction& tx, const eventstore::StoredEvent& event, const v1::AssistantStreamStarted& e) {
  auto conversation = LoadConversation(tx, event.stream_id);

  auto message     = LoadOrNewMessage(tx, e.message_id(), conversation.id);
  message.role     = "assistant";
  message.model_id = e.model_id();
  if (message.status.empty()) message.status = kMessageStreaming;
  if (message.stream_version == 0) message.stream_version = event.stream_version;
  if (message.created_at_ms == 0) message.created_at_ms = event.inserted_at_ms;
  message.updated_at_ms = event.inserted_at_ms;
  Check(repository_->UpsertMessage(tx, message), "upsert assistant message");

  conversation.status             = kConversationStreaming;
  conversation.last_message_at_ms = event.inserted_at_ms;
  SaveConversation(tx, conversation, event);
}

void ConversationProjection::OnChunk(db::Transaction& tx, const eventstore::StoredEvent& event, const v1::AssistantChunkReceived& e) {
  db::model::MessageChunkRecord chunk;
  chunk.message_id          = e.message_id();
  chunk.chunk_index         = static_cast<uint64_t>(e.chunk_index());
  chunk.content_block_index = static_cast<uint64_t>(e.content_block_index());
  chunk.delta_type          = e.delta_type();
  chunk.delta_text          = e.delta_text();
  chunk.created_at_ms       = event.inserted_at_ms;
  Check(repository_->UpsertMessageChunk(tx, chunk), "upsert chunk");

  // Keeps updated_at moving while a stream is alive.
  auto conversation = LoadConversation(tx, event.stream_id);
  SaveConversation(tx, conversation, event);
}

void ConversationProjection::OnStreamCompleted(db::Transaction& tx, const eventstore::StoredEvent& event,
                                               const v1::AssistantStreamCompleted& e) {
  auto conversation = LoadConversation(tx, event.stream_id);

  auto message          = LoadOrNewMessage(tx, e.message_id(), conversation.id);
  message.role          = "assistant";
  message.content       = e.full_content();
  message.status        = kMessageComplete;
  message.stop_reason   = e.stop_reason();
  message.input_tokens  = static_cast<uint64_t>(e.input_tokens());
  message.output_tokens = static_cast<uint64_t>(e.output_tokens());
  message.total_tokens  = message.input_tokens + message.output_tokens;
  message.latency_ms    = static_cast<uint64_t>(e.latency_ms());
  if (message.stream_version == 0) message.stream_version = event.stream_version;
  if (message.created_at_ms == 0) message.created_at_ms = event.inserted_at_ms;
  message.updated_at_ms = event.inserted_at_ms;
  Check(repository_->UpsertMessage(tx, message), "complete assistant message");

  if (conversation.status != kConversationArchived) conversation.status = kConversationActive;
  conversation.last_message_at_ms = event.inserted_at_ms;
  SaveConversation(tx, conversation, event);
}

void ConversationProjection::OnStreamFailed(db::Transaction& tx, const eventstore::StoredEvent& event, const v1::AssistantStreamFailed& e) {
  auto conversation = LoadConversation(tx, event.stream_id);

  if (!e.message_id().empty()) {
    auto message   = LoadOrNewMessage(tx, e.message_id(), conversation.id);
    message.role   = "assistant";
    message.status = kMessageFailed;
    if (message.stream_version == 0) message.stream_version = event.stream_version;
    if (message.created_at_ms == 0) message.created_at_ms = event.inserted_at_ms;
    message.updated_at_ms = event.inserted_at_ms;
    Check(repository_->UpsertMessage(tx, message), "fail assistant message");
  }

  if (conversation.status != kConversationArchived) conversation.status = kConversationActive;
  SaveConversation(tx, conversation, event);
}

// ------------------------------------------------------------------
// Tool calls
// ------------------------------------------------------------------

void ConversationProjection::OnToolStarted(db::Transaction& tx, const eventstore::StoredEvent& event, const v1::ToolCallStarted& e) {
  db::model::ToolCallRecord row;
  if (auto existing = repository_->GetToolCall(tx, e.message_id(), e.tool_use_id())) row = *existing;

  row.message_id  = e.message_id();
  row.tool_use_id = e.tool_use_id();
  row.tool_name   = e.tool_name();
  row.input       = util::MessageToJson(e.input());
  if (row.status != kToolCompleted) row.status = kToolStarted;
  if (row.created_at_ms == 0) row.created_at_ms = event.inserted_at_ms;
  row.updated_at_ms = std::max(row.updated_at_ms, event.inserted_at_ms);
  Check(repository_->UpsertToolCall(tx, row), "upsert tool call");

  auto conversation = LoadConversation(tx, event.stream_id);
  SaveConversation(tx, conversation, event);
}

void ConversationProjection::OnToolCompleted(db::Transaction& tx, const eventstore::StoredEvent& event, const v1::ToolCallCompleted& e) {
  db::model::ToolCallRecord row;
  if (auto existing = repository_->GetToolCall(tx, e.message_id(), e.tool_use_id())) row = *existing;

  row.message_id  = e.message_id();
  row.tool_use_id = e.tool_use_id();
  if (!e.tool_name().empty()) row.tool_name = e.tool_name();
  if (e.input().fields_size() > 0 || row.input.empty()) row.input = util::MessageToJson(e.input());
  row.output      = util::MessageToJson(e.output());
  row.status      = kToolCompleted;
  row.duration_ms = static_cast<uint64_t>(e.duration_ms());
  if (row.created_at_ms == 0) row.created_at_ms = event.inserted_at_ms;
  row.updated_at_ms = event.inserted_at_ms;
  Check(repository_->UpsertToolCall(tx, row), "complete tool call");

  auto conversation = LoadConversation(tx, event.stream_id);
  SaveConversation(tx, conversation, event);
}

// ------------------------------------------------------------------
// Fork lineage
// ------------------------------------------------------------------

ConversationProjection::History ConversationProjection::HistoryAt(db::Transaction& tx, const std::string& stream_id, uint64_t version) {
  History history;
  if (version == 0) return history;

  const auto events = repository_->ReadEvents(tx, stream_id, 1, version);
  if (events.empty()) throw util::StorageError("projection: fork parent " + stream_id + " has no events");

  auto& messages = history.messages;
  for (const auto& event : events) {
    auto new_message = [&](const std::string& id, const char* role, const char* status) {
      db::model::MessageRecord m;
      m.id              = id;
      m.conversation_id = history.conversation_id;
      m.role            = role;
      m.status          = status;
      m.stream_version  = event.stream_version;
      m.created_at_ms   = event.inserted_at_ms;
      m.updated_at_ms   = event.inserted_at_ms;
      return m;
    };

    std::visit(util::Overloaded{
                   [&](const v1::ConversationCreated& e) { history.conversation_id = e.conversation_id(); },
                   [&](const v1::ConversationForked& e) {
                     history.conversation_id = e.new_conversation_id();
                     auto inherited          = HistoryAt(tx, e.parent_stream_id(), static_cast<uint64_t>(e.fork_at_version()));
                     for (auto& m : inherited.messages) {
                       m.id              = history.conversation_id + ":" + m.id;
                       m.conversation_id = history.conversation_id;
                       messages.push_back(std::move(m));
                     }
                   },
                   [&](const v1::UserMessageAdded& e) {
                     auto m    = new_message(e.message_id(), "user", kMessageComplete);
                     m.content = e.content();
                     messages.push_back(std::move(m));
                   },
                   [&](const v1::AssistantStreamStarted& e) {
                     auto m     = new_message(e.message_id(), "assistant", kMessageStreaming);
                     m.model_id = e.model_id();
                     messages.push_back(std::move(m));
                   },
                   [&](const v1::AssistantStreamCompleted& e) {
                     if (auto* m = FindMessage(messages, e.message_id())) {
                       m->content       = e.full_content();
                       m->status        = kMessageComplete;
                       m->stop_reason   = e.stop_reason();
                       m->input_tokens  = static_cast<uint64_t>(e.input_tokens());
                       m->output_tokens = static_cast<uint64_t>(e.output_tokens());
                       m->total_tokens  = m->input_tokens + m->output_tokens;
                       m->latency_ms    = static_cast<uint64_t>(e.latency_ms());
                       m->updated_at_ms = event.inserted_at_ms;
                     }
                   },
                   [&](const v1::AssistantStreamFailed& e) {
                     if (auto* m = FindMessage(messages, e.message_id())) {
                       m->status        = kMessageFailed;
                       m->updated_at_ms = event.inserted_at_ms;
                     }
                   },
                   [](const auto&) {},
               },
               chat::Decode(event));
  }

  return history;
}

} // namespace chatlog::projection
