#pragma once

#include <memory>
#include <string>
#include <vector>

#include "chatlog/v1.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/eventstore/event.hpp"

namespace chatlog::projection {

// Read-side status strings.
inline constexpr const char* kConversationActive    = "active";
inline constexpr const char* kConversationStreaming = "streaming";
inline constexpr const char* kConversationArchived  = "archived";

inline constexpr const char* kMessageComplete  = "complete";
inline constexpr const char* kMessageStreaming = "streaming";
inline constexpr const char* kMessageFailed    = "failed";

inline constexpr const char* kToolStarted   = "started";
inline constexpr const char* kToolCompleted = "completed";

/*
  ConversationProjection

  Maps conversation events onto the conversations / messages /
  message_chunks / tool_calls tables inside the caller's transaction.

  Every mutation is an upsert keyed by stable ids, and counters are
  recomputed from rows, so applying an event twice leaves the same
  rows. Conversation updated_at is the inserted_at of the last event
  applied to it.

  The read side has no "created" status: a new or forked conversation
  is projected as "active" even when it has no messages yet, while the
  aggregate reports CONVERSATION_STATUS_CREATED until the first user
  message. Readers that need the distinction check message_count.

  A fork copies the parent's user and assistant messages up to the
  fork version, read from the parent's event log (not its possibly
  lagging projection). Copied ids are "<new conversation id>:<id>".
*/
class ConversationProjection {
 public:
  explicit ConversationProjection(std::shared_ptr<db::Repository> repository);

  // Throws util::StorageError on a failed write.
  void Apply(db::Transaction& tx, const eventstore::StoredEvent& event);

 private:
  void OnCreated(db::Transaction& tx, const eventstore::StoredEvent& event, const v1::ConversationCreated& e);
  void OnForked(db::Transaction& tx, const eventstore::StoredEvent& event, const v1::ConversationForked& e);
  void OnUserMessage(db::Transaction& tx, const eventstore::StoredEvent& event, const v1::UserMessageAdded& e);
  void OnStreamStarted(db::Transaction& tx, const eventstore::StoredEvent& event, const v1::AssistantStreamStarted& e);
  void OnChunk(db::Transaction& tx, const eventstore::StoredEvent& event, const v1::AssistantChunkReceived& e);
  void OnStreamCompleted(db::Transaction& tx, const eventstore::StoredEvent& event, const v1::AssistantStreamCompleted& e);
  void OnStreamFailed(db::Transaction& tx, const eventstore::StoredEvent& event, const v1::AssistantStreamFailed& e);
  void OnToolStarted(db::Transaction& tx, const eventstore::StoredEvent& event, const v1::ToolCallStarted& e);
  void OnToolCompleted(db::Transaction& tx, const eventstore::StoredEvent& event, const v1::ToolCallCompleted& e);

  db::model::ConversationRecord LoadConversation(db::Transaction& tx, const std::string& stream_id);
  void                          SaveConversation(db::Transaction& tx, db::model::ConversationRecord& row, const eventstore::StoredEvent& event);

  db::model::MessageRecord LoadOrNewMessage(db::Transaction& tx, const std::string& message_id, const std::string& conversation_id);

  struct History {
    std::string                           conversation_id;
    std::vector<db::model::MessageRecord> messages;
  };

  // Messages a stream's projection holds at `version`, with the ids
  // they carry there. Follows fork lineage.
  History HistoryAt(db::Transaction& tx, const std::string& stream_id, uint64_t version);

  std::shared_ptr<db::Repository> repository_;
};

} // namespace chatlog::projection
