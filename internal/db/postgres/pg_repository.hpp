#pragma once

#include "internal/db/api/repository.hpp"
#include "pg_pool.hpp"
#include "pg_tx.hpp"

namespace chatlog::db::postgres {

class PgRepository final : public db::Repository {
public:
  explicit PgRepository(std::shared_ptr<PgPool> pool);

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
  std::shared_ptr<PgPool> pool_;

  static PgTransaction& TX(Transaction& t);
  static Result Translate(const pqxx::failure& e);
};

} // namespace chatlog::db::postgres
