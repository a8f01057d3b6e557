#pragma once

#include <chrono>
#include <map>
#include <mutex>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace chatlog::db::memory {

class MemoryTransaction;

/*
  In-process backend for tests and ephemeral deployments.

  Transactions are serialized: Begin() takes the repository lock and
  holds it until Commit()/Rollback(), waiting at most lock_timeout.
*/
class MemoryRepository final : public db::Repository {
public:
  explicit MemoryRepository(std::chrono::milliseconds lock_timeout = std::chrono::milliseconds(5000));

  std::unique_ptr<Transaction> Begin() override;

  Result InsertEvent(Transaction&, model::EventRecord&) override;
  std::vector<model::EventRecord> ReadEvents(Transaction&, const std::string& stream_id, uint64_t from_version,
                                             std::optional<uint64_t> max_count) override;
  uint64_t GetStreamVersion(Transaction&, const std::string& stream_id) override;
  std::vector<model::StreamHeadRecord> ListStreams(Transaction&, const std::string& stream_prefix) override;

  Result InsertSnapshot(Transaction&, model::SnapshotRecord&) override;
  std::optional<model::SnapshotRecord> GetLatestSnapshot(Transaction&, const std::string& stream_id) override;

  Result UpsertConversation(Transaction&, const model::ConversationRecord&) override;
  std::optional<model::ConversationRecord> GetConversation(Transaction&, const std::string& id) override;
  std::optional<model::ConversationRecord> GetConversationByStream(Transaction&, const std::string& stream_id) override;
  std::vector<model::ConversationRecord> ListConversationsByStatus(Transaction&, const std::string& status,
                                                                   uint64_t updated_before_ms) override;

  Result UpsertMessage(Transaction&, const model::MessageRecord&) override;
  std::optional<model::MessageRecord> GetMessage(Transaction&, const std::string& id) override;
  std::vector<model::MessageRecord> ListMessages(Transaction&, const std::string& conversation_id) override;
  uint64_t CountMessages(Transaction&, const std::string& conversation_id) override;

  Result UpsertMessageChunk(Transaction&, const model::MessageChunkRecord&) override;
  std::vector<model::MessageChunkRecord> ListMessageChunks(Transaction&, const std::string& message_id) override;

  Result UpsertToolCall(Transaction&, const model::ToolCallRecord&) override;
  std::optional<model::ToolCallRecord> GetToolCall(Transaction&, const std::string& message_id,
                                                   const std::string& tool_use_id) override;
  std::vector<model::ToolCallRecord> ListToolCalls(Transaction&, const std::string& message_id) override;

  Result CommitProjectionCheckpoint(Transaction&, const model::ProjectionCheckpointRecord&) override;
  std::optional<model::ProjectionCheckpointRecord> GetProjectionCheckpoint(Transaction&, const std::string& projector,
                                                                           const std::string& stream_id) override;

private:
  friend class MemoryTransaction;

  using StreamEvents = std::map<uint64_t, model::EventRecord>;

  struct State {
    std::map<std::string, StreamEvents> events;
    std::map<std::string, std::map<uint64_t, model::SnapshotRecord>> snapshots;

    std::unordered_map<std::string, model::ConversationRecord> conversations;
    std::unordered_map<std::string, model::MessageRecord> messages;
    std::map<std::pair<std::string, uint64_t>, model::MessageChunkRecord> chunks;
    std::map<std::pair<std::string, std::string>, model::ToolCallRecord> tool_calls;
    std::map<std::pair<std::string, std::string>, model::ProjectionCheckpointRecord> checkpoints;
  };

  std::timed_mutex          mutex_;
  std::chrono::milliseconds lock_timeout_;
  State                     committed_;
};

} // namespace chatlog::db::memory
