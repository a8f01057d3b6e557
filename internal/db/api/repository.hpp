#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/conversation_record.hpp"
#include "internal/db/model/event_record.hpp"
#include "internal/db/model/message_chunk_record.hpp"
#include "internal/db/model/message_record.hpp"
#include "internal/db/model/projection_checkpoint_record.hpp"
#include "internal/db/model/snapshot_record.hpp"
#include "internal/db/model/stream_head_record.hpp"
#include "internal/db/model/tool_call_record.hpp"

namespace chatlog::db {

/*
  Repository abstraction.

  CRITICAL GUARANTEES:

  - All reads and writes run inside a Transaction
  - Reads inside a transaction see its writes
  - (stream_id, stream_version) is unique for events and snapshots;
    a duplicate insert returns ConstraintViolation and the caller
    must abandon the transaction
  - Backend errors are translated into ErrorCode; driver exceptions
    never escape the Result-returning methods
  - Read methods throw util::StorageError on backend failure

  The event log is the source of truth. Projection tables and
  checkpoints are derived data owned by the projector.
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // Event log
  // ---------------------------------------------------------------------

  // Fills id and inserted_at_ms when they are empty.
  virtual Result InsertEvent(Transaction&, model::EventRecord& record) = 0;

  // Ascending version order, starting at from_version.
  virtual std::vector<model::EventRecord> ReadEvents(Transaction&, const std::string& stream_id, uint64_t from_version,
                                                     std::optional<uint64_t> max_count) = 0;

  // 0 when the stream has no events.
  virtual uint64_t GetStreamVersion(Transaction&, const std::string& stream_id) = 0;

  virtual std::vector<model::StreamHeadRecord> ListStreams(Transaction&, const std::string& stream_prefix) = 0;

  // ---------------------------------------------------------------------
  // Snapshots
  // ---------------------------------------------------------------------

  virtual Result InsertSnapshot(Transaction&, model::SnapshotRecord& record) = 0;

  virtual std::optional<model::SnapshotRecord> GetLatestSnapshot(Transaction&, const std::string& stream_id) = 0;

  // ---------------------------------------------------------------------
  // Projections
  // ---------------------------------------------------------------------

  virtual Result UpsertConversation(Transaction&, const model::ConversationRecord&) = 0;

  virtual std::optional<model::ConversationRecord> GetConversation(Transaction&, const std::string& id) = 0;

  virtual std::optional<model::ConversationRecord> GetConversationByStream(Transaction&, const std::string& stream_id) = 0;

  // Conversations in `status` last updated strictly before updated_before_ms.
  virtual std::vector<model::ConversationRecord> ListConversationsByStatus(Transaction&, const std::string& status,
                                                                           uint64_t updated_before_ms) = 0;

  virtual Result UpsertMessage(Transaction&, const model::MessageRecord&) = 0;

  virtual std::optional<model::MessageRecord> GetMessage(Transaction&, const std::string& id) = 0;

  // Ordered by position.
  virtual std::vector<model::MessageRecord> ListMessages(Transaction&, const std::string& conversation_id) = 0;

  virtual uint64_t CountMessages(Transaction&, const std::string& conversation_id) = 0;

  // Keyed by (message_id, chunk_index); an existing row keeps its id.
  virtual Result UpsertMessageChunk(Transaction&, const model::MessageChunkRecord&) = 0;

  virtual std::vector<model::MessageChunkRecord> ListMessageChunks(Transaction&, const std::string& message_id) = 0;

  // Keyed by (message_id, tool_use_id); an existing row keeps its id.
  virtual Result UpsertToolCall(Transaction&, const model::ToolCallRecord&) = 0;

  virtual std::optional<model::ToolCallRecord> GetToolCall(Transaction&, const std::string& message_id, const std::string& tool_use_id) = 0;

  virtual std::vector<model::ToolCallRecord> ListToolCalls(Transaction&, const std::string& message_id) = 0;

  // ---------------------------------------------------------------------
  // Projection checkpoints
  // ---------------------------------------------------------------------

  virtual Result CommitProjectionCheckpoint(Transaction&, const model::ProjectionCheckpointRecord& record) = 0;

  virtual std::optional<model::ProjectionCheckpointRecord> GetProjectionCheckpoint(Transaction&, const std::string& projector,
                                                                                   const std::string& stream_id) = 0;
};

} // namespace chatlog::db
