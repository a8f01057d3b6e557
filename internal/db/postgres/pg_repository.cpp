#include "pg_repository.hpp"

#include "internal/util/errors.hpp"
#include "internal/util/json.hpp"
#include "internal/util/uuid.hpp"

namespace chatlog::db::postgres {

namespace {

// Timestamps are TIMESTAMPTZ in the event tables; rows carry epoch millis.
constexpr const char* kEventColumns =
    "id::text,stream_id,stream_version,event_type,data::text,metadata::text,"
    "(extract(epoch FROM inserted_at) * 1000)::bigint";

constexpr const char* kConversationSelect =
    "SELECT id,stream_id,user_id,title,model_id,system_prompt,status,parent_conversation_id,"
    "fork_at_version,message_count,last_message_at_ms,created_at_ms,updated_at_ms FROM conversations ";

constexpr const char* kMessageSelect =
    "SELECT id,conversation_id,role,content,status,model_id,stop_reason,input_tokens,output_tokens,"
    "total_tokens,latency_ms,stream_version,position,created_at_ms,updated_at_ms FROM messages ";

constexpr const char* kToolCallSelect =
    "SELECT id,message_id,tool_use_id,tool_name,input::text,COALESCE(output::text,''),status,duration_ms,"
    "created_at_ms,updated_at_ms FROM tool_calls ";

model::EventRecord ReadEvent(const pqxx::row& row) {
  model::EventRecord r;
  r.id             = row[0].c_str();
  r.stream_id      = row[1].c_str();
  r.stream_version = row[2].as<uint64_t>();
  r.event_type     = row[3].c_str();
  r.data           = row[4].c_str();
  r.metadata       = util::JsonToStringMap(row[5].c_str());
  r.inserted_at_ms = row[6].as<uint64_t>();
  return r;
}

model::ConversationRecord ReadConversation(const pqxx::row& row) {
  model::ConversationRecord r;
  r.id                     = row[0].c_str();
  r.stream_id              = row[1].c_str();
  r.user_id                = row[2].c_str();
  r.title                  = row[3].c_str();
  r.model_id               = row[4].c_str();
  r.system_prompt          = row[5].c_str();
  r.status                 = row[6].c_str();
  r.parent_conversation_id = row[7].c_str();
  r.fork_at_version        = row[8].as<uint64_t>();
  r.message_count          = row[9].as<uint64_t>();
  r.last_message_at_ms     = row[10].as<uint64_t>();
  r.created_at_ms          = row[11].as<uint64_t>();
  r.updated_at_ms          = row[12].as<uint64_t>();
  return r;
}

model::MessageRecord ReadMessage(const pqxx::row& row) {
  model::MessageRecord r;
  r.id              = row[0].c_str();
  r.conversation_id = row[1].c_str();
  r.role            = row[2].c_str();
  r.content         = row[3].c_str();
  r.status          = row[4].c_str();
  r.model_id        = row[5].c_str();
  r.stop_reason     = row[6].c_str();
  r.input_tokens    = row[7].as<uint64_t>();
  r.output_tokens   = row[8].as<uint64_t>();
  r.total_tokens    = row[9].as<uint64_t>();
  r.latency_ms      = row[10].as<uint64_t>();
  r.stream_version  = row[11].as<uint64_t>();
  r.position        = row[12].as<uint64_t>();
  r.created_at_ms   = row[13].as<uint64_t>();
  r.updated_at_ms   = row[14].as<uint64_t>();
  return r;
}

model::ToolCallRecord ReadToolCall(const pqxx::row& row) {
  model::ToolCallRecord r;
  r.id            = row[0].c_str();
  r.message_id    = row[1].c_str();
  r.tool_use_id   = row[2].c_str();
  r.tool_name     = row[3].c_str();
  r.input         = row[4].c_str();
  r.output        = row[5].c_str();
  r.status        = row[6].c_str();
  r.duration_ms   = row[7].as<uint64_t>();
  r.created_at_ms = row[8].as<uint64_t>();
  r.updated_at_ms = row[9].as<uint64_t>();
  return r;
}

template <typename Fn>
auto Query(Fn&& fn) -> decltype(fn()) {
  try {
    return fn();
  } catch (const pqxx::failure& e) {
    throw util::StorageError(std::string("postgres: ") + e.what());
  }
}

// Empty tool output is stored as SQL NULL.
std::optional<std::string> NullIfEmpty(const std::string& s) {
  if (s.empty()) return std::nullopt;
  return s;
}

} // namespace

PgRepository::PgRepository(std::shared_ptr<PgPool> pool) : pool_(std::move(pool)) {
}

std::unique_ptr<db::Transaction> PgRepository::Begin() {
  return std::make_unique<PgTransaction>(pool_);
}

PgTransaction& PgRepository::TX(Transaction& t) {
  return static_cast<PgTransaction&>(t);
}

Result PgRepository::Translate(const pqxx::failure& e) {
  if (dynamic_cast<const pqxx::unique_violation*>(&e) || dynamic_cast<const pqxx::integrity_constraint_violation*>(&e)) {
    return Result::Err(ErrorCode::ConstraintViolation, e.what());
  }
  if (dynamic_cast<const pqxx::serialization_failure*>(&e) || dynamic_cast<const pqxx::deadlock_detected*>(&e)) {
    return Result::Err(ErrorCode::SerializationFailure, e.what());
  }
  if (dynamic_cast<const pqxx::broken_connection*>(&e)) {
    return Result::Err(ErrorCode::IOError, e.what());
  }
  if (const auto* sql = dynamic_cast<const pqxx::sql_error*>(&e); sql && sql->sqlstate() == "57014") {
    return Result::Err(ErrorCode::Busy, e.what()); // statement_timeout
  }
  return Result::Err(ErrorCode::InternalError, e.what());
}

// ------------------------------------------------------------------
// Event log
// ------------------------------------------------------------------

Result PgRepository::InsertEvent(Transaction& t, model::EventRecord& r) {
  if (r.id.empty()) r.id = util::NewId();
  try {
    auto res = TX(t).Work().exec_params(
        "INSERT INTO events(id,stream_id,stream_version,event_type,data,metadata,inserted_at) "
        "VALUES($1::uuid,$2,$3,$4,$5::jsonb,$6::jsonb,"
        "CASE WHEN $7::bigint = 0 THEN now() ELSE to_timestamp($7::bigint / 1000.0) END) "
        "RETURNING (extract(epoch FROM inserted_at) * 1000)::bigint;",
        r.id, r.stream_id, r.stream_version, r.event_type, r.data, util::StringMapToJson(r.metadata), r.inserted_at_ms);
    r.inserted_at_ms = res[0][0].as<uint64_t>();
    return Result::Ok();
  } catch (const pqxx::failure& e) {
    return Translate(e);
  }
}

std::vector<model::EventRecord> PgRepository::ReadEvents(Transaction& t, const std::string& stream_id, uint64_t from_version,
                                                         std::optional<uint64_t> max_count) {
  return Query([&] {
    // LIMIT NULL is LIMIT ALL
    std::optional<int64_t> limit;
    if (max_count) limit = static_cast<int64_t>(*max_count);

    auto res = TX(t).Work().exec_params(std::string("SELECT ") + kEventColumns +
                                            " FROM events WHERE stream_id=$1 AND stream_version>=$2 "
                                            "ORDER BY stream_version ASC LIMIT $3;",
                                        stream_id, from_version, limit);

    std::vector<model::EventRecord> out;
    out.reserve(res.size());
    for (const auto& row : res) out.push_back(ReadEvent(row));
    return out;
  });
}

uint64_t PgRepository::GetStreamVersion(Transaction& t, const std::string& stream_id) {
  return Query([&] {
    auto res = TX(t).Work().exec_params("SELECT COALESCE(MAX(stream_version),0) FROM events WHERE stream_id=$1;", stream_id);
    return res[0][0].as<uint64_t>();
  });
}

std::vector<model::StreamHeadRecord> PgRepository::ListStreams(Transaction& t, const std::string& stream_prefix) {
  return Query([&] {
    auto res = TX(t).Work().exec_params(
        "SELECT stream_id,MAX(stream_version) FROM events WHERE left(stream_id,length($1))=$1 "
        "GROUP BY stream_id ORDER BY stream_id;",
        stream_prefix);

    std::vector<model::StreamHeadRecord> out;
    out.reserve(res.size());
    for (const auto& row : res) out.push_back({row[0].c_str(), row[1].as<uint64_t>()});
    return out;
  });
}

// ------------------------------------------------------------------
// Snapshots
// ------------------------------------------------------------------

Result PgRepository::InsertSnapshot(Transaction& t, model::SnapshotRecord& r) {
  if (r.id.empty()) r.id = util::NewId();
  try {
    auto res = TX(t).Work().exec_params(
        "INSERT INTO snapshots(id,stream_id,stream_version,snapshot_type,data) VALUES($1::uuid,$2,$3,$4,$5::jsonb) "
        "RETURNING (extract(epoch FROM inserted_at) * 1000)::bigint;",
        r.id, r.stream_id, r.stream_version, r.snapshot_type, r.data);
    r.inserted_at_ms = res[0][0].as<uint64_t>();
    return Result::Ok();
  } catch (const pqxx::failure& e) {
    return Translate(e);
  }
}

std::optional<model::SnapshotRecord> PgRepository::GetLatestSnapshot(Transaction& t, const std::string& stream_id) {
  return Query([&]() -> std::optional<model::SnapshotRecord> {
    auto res = TX(t).Work().exec_params(
        "SELECT id::text,stream_id,stream_version,snapshot_type,data::text,(extract(epoch FROM inserted_at) * 1000)::bigint "
        "FROM snapshots WHERE stream_id=$1 ORDER BY stream_version DESC LIMIT 1;",
        stream_id);
    if (res.empty()) return std::nullopt;

    model::SnapshotRecord r;
    r.id             = res[0][0].c_str();
    r.stream_id      = res[0][1].c_str();
    r.stream_version = res[0][2].as<uint64_t>();
    r.snapshot_type  = res[0][3].c_str();
    r.data           = res[0][4].c_str();
    r.inserted_at_ms = res[0][5].as<uint64_t>();
    return r;
  });
}

// ------------------------------------------------------------------
// Conversations
// ------------------------------------------------------------------

Result PgRepository::UpsertConversation(Transaction& t, const model::ConversationRecord& r) {
  try {
    TX(t).Work().exec_params(
        "INSERT INTO conversations(id,stream_id,user_id,title,model_id,system_prompt,status,parent_conversation_id,"
        "fork_at_version,message_count,last_message_at_ms,created_at_ms,updated_at_ms) "
        "VALUES($1,$2,$3,$4,$5,$6,$7,$8,$9,$10,$11,$12,$13) "
        "ON CONFLICT(id) DO UPDATE SET stream_id=EXCLUDED.stream_id,user_id=EXCLUDED.user_id,title=EXCLUDED.title,"
        "model_id=EXCLUDED.model_id,system_prompt=EXCLUDED.system_prompt,status=EXCLUDED.status,"
        "parent_conversation_id=EXCLUDED.parent_conversation_id,fork_at_version=EXCLUDED.fork_at_version,"
        "message_count=EXCLUDED.message_count,last_message_at_ms=EXCLUDED.last_message_at_ms,"
        "created_at_ms=EXCLUDED.created_at_ms,updated_at_ms=EXCLUDED.updated_at_ms;",
        r.id, r.stream_id, r.user_id, r.title, r.model_id, r.system_prompt, r.status, r.parent_conversation_id, r.fork_at_version,
        r.message_count, r.last_message_at_ms, r.created_at_ms, r.updated_at_ms);
    return Result::Ok();
  } catch (const pqxx::failure& e) {
    return Translate(e);
  }
}

std::optional<model::ConversationRecord> PgRepository::GetConversation(Transaction& t, const std::string& id) {
  return Query([&]() -> std::optional<model::ConversationRecord> {
    auto res = TX(t).Work().exec_params(std::string(kConversationSelect) + "WHERE id=$1;", id);
    if (res.empty()) return std::nullopt;
    return ReadConversation(res[0]);
  });
}

std::optional<model::ConversationRecord> PgRepository::GetConversationByStream(Transaction& t, const std::string& stream_id) {
  return Query([&]() -> std::optional<model::ConversationRecord> {
    auto res = TX(t).Work().exec_params(std::string(kConversationSelect) + "WHERE stream_id=$1;", stream_id);
    if (res.empty()) return std::nullopt;
    return ReadConversation(res[0]);
  });
}

std::vector<model::ConversationRecord> PgRepository::ListConversationsByStatus(Transaction& t, const std::string& status,
                                                                               uint64_t updated_before_ms) {
  return Query([&] {
    auto res = TX(t).Work().exec_params(std::string(kConversationSelect) + "WHERE status=$1 AND updated_at_ms<$2 ORDER BY updated_at_ms ASC;",
                                        status, updated_before_ms);
    std::vector<model::ConversationRecord> out;
    out.reserve(res.size());
    for (const auto& row : res) out.push_back(ReadConversation(row));
    return out;
  });
}

// ------------------------------------------------------------------
// Messages
// ------------------------------------------------------------------

Result PgRepository::UpsertMessage(Transaction& t, const model::MessageRecord& r) {
  try {
    TX(t).Work().exec_params(
        "INSERT INTO messages(id,conversation_id,role,content,status,model_id,stop_reason,input_tokens,output_tokens,"
        "total_tokens,latency_ms,stream_version,position,created_at_ms,updated_at_ms) "
        "VALUES($1,$2,$3,$4,$5,$6,$7,$8,$9,$10,$11,$12,$13,$14,$15) "
        "ON CONFLICT(id) DO UPDATE SET conversation_id=EXCLUDED.conversation_id,role=EXCLUDED.role,content=EXCLUDED.content,"
        "status=EXCLUDED.status,model_id=EXCLUDED.model_id,stop_reason=EXCLUDED.stop_reason,"
        "input_tokens=EXCLUDED.input_tokens,output_tokens=EXCLUDED.output_tokens,total_tokens=EXCLUDED.total_tokens,"
        "latency_ms=EXCLUDED.latency_ms,stream_version=EXCLUDED.stream_version,position=EXCLUDED.position,"
        "created_at_ms=EXCLUDED.created_at_ms,updated_at_ms=EXCLUDED.updated_at_ms;",
        r.id, r.conversation_id, r.role, r.content, r.status, r.model_id, r.stop_reason, r.input_tokens, r.output_tokens,
        r.total_tokens, r.latency_ms, r.stream_version, r.position, r.created_at_ms, r.updated_at_ms);
    return Result::Ok();
  } catch (const pqxx::failure& e) {
    return Translate(e);
  }
}

std::optional<model::MessageRecord> PgRepository::GetMessage(Transaction& t, const std::string& id) {
  return Query([&]() -> std::optional<model::MessageRecord> {
    auto res = TX(t).Work().exec_params(std::string(kMessageSelect) + "WHERE id=$1;", id);
    if (res.empty()) return std::nullopt;
    return ReadMessage(res[0]);
  });
}

std::vector<model::MessageRecord> PgRepository::ListMessages(Transaction& t, const std::string& conversation_id) {
  return Query([&] {
    auto res = TX(t).Work().exec_params(std::string(kMessageSelect) + "WHERE conversation_id=$1 ORDER BY position ASC;", conversation_id);
    std::vector<model::MessageRecord> out;
    out.reserve(res.size());
    for (const auto& row : res) out.push_back(ReadMessage(row));
    return out;
  });
}

uint64_t PgRepository::CountMessages(Transaction& t, const std::string& conversation_id) {
  return Query([&] {
    auto res = TX(t).Work().exec_params("SELECT COUNT(*) FROM messages WHERE conversation_id=$1;", conversation_id);
    return res[0][0].as<uint64_t>();
  });
}

Result PgRepository::UpsertMessageChunk(Transaction& t, const model::MessageChunkRecord& r) {
  try {
    TX(t).Work().exec_params(
        "INSERT INTO message_chunks(id,message_id,chunk_index,content_block_index,delta_type,delta_text,created_at_ms) "
        "VALUES($1,$2,$3,$4,$5,$6,$7) "
        "ON CONFLICT(message_id,chunk_index) DO UPDATE SET content_block_index=EXCLUDED.content_block_index,"
        "delta_type=EXCLUDED.delta_type,delta_text=EXCLUDED.delta_text,created_at_ms=EXCLUDED.created_at_ms;",
        r.id.empty() ? util::NewId() : r.id, r.message_id, r.chunk_index, r.content_block_index, r.delta_type, r.delta_text,
        r.created_at_ms);
    return Result::Ok();
  } catch (const pqxx::failure& e) {
    return Translate(e);
  }
}

std::vector<model::MessageChunkRecord> PgRepository::ListMessageChunks(Transaction& t, const std::string& message_id) {
  return Query([&] {
    auto res = TX(t).Work().exec_params(
        "SELECT id,message_id,chunk_index,content_block_index,delta_type,delta_text,created_at_ms "
        "FROM message_chunks WHERE message_id=$1 ORDER BY chunk_index ASC;",
        message_id);

    std::vector<model::MessageChunkRecord> out;
    out.reserve(res.size());
    for (const auto& row : res) {
      model::MessageChunkRecord r;
      r.id                  = row[0].c_str();
      r.message_id          = row[1].c_str();
      r.chunk_index         = row[2].as<uint64_t>();
      r.content_block_index = row[3].as<uint64_t>();
      r.delta_type          = row[4].c_str();
      r.delta_text          = row[5].c_str();
      r.created_at_ms       = row[6].as<uint64_t>();
      out.push_back(std::move(r));
    }
    return out;
  });
}

// ------------------------------------------------------------------
// Tool calls
// ------------------------------------------------------------------

Result PgRepository::UpsertToolCall(Transaction& t, const model::ToolCallRecord& r) {
  try {
    TX(t).Work().exec_params(
        "INSERT INTO tool_calls(id,message_id,tool_use_id,tool_name,input,output,status,duration_ms,created_at_ms,updated_at_ms) "
        "VALUES($1,$2,$3,$4,$5::jsonb,$6::jsonb,$7,$8,$9,$10) "
        "ON CONFLICT(message_id,tool_use_id) DO UPDATE SET tool_name=EXCLUDED.tool_name,input=EXCLUDED.input,"
        "output=EXCLUDED.output,status=EXCLUDED.status,duration_ms=EXCLUDED.duration_ms,"
        "created_at_ms=EXCLUDED.created_at_ms,updated_at_ms=EXCLUDED.updated_at_ms;",
        r.id.empty() ? util::NewId() : r.id, r.message_id, r.tool_use_id, r.tool_name, r.input.empty() ? std::string("{}") : r.input,
        NullIfEmpty(r.output), r.status, r.duration_ms, r.created_at_ms, r.updated_at_ms);
    return Result::Ok();
  } catch (const pqxx::failure& e) {
    return Translate(e);
  }
}

std::optional<model::ToolCallRecord> PgRepository::GetToolCall(Transaction& t, const std::string& message_id,
                                                               const std::string& tool_use_id) {
  return Query([&]() -> std::optional<model::ToolCallRecord> {
    auto res = TX(t).Work().exec_params(std::string(kToolCallSelect) + "WHERE message_id=$1 AND tool_use_id=$2;", message_id, tool_use_id);
    if (res.empty()) return std::nullopt;
    return ReadToolCall(res[0]);
  });
}

std::vector<model::ToolCallRecord> PgRepository::ListToolCalls(Transaction& t, const std::string& message_id) {
  return Query([&] {
    auto res = TX(t).Work().exec_params(std::string(kToolCallSelect) + "WHERE message_id=$1 ORDER BY created_at_ms ASC, tool_use_id ASC;",
                                        message_id);
    std::vector<model::ToolCallRecord> out;
    out.reserve(res.size());
    for (const auto& row : res) out.push_back(ReadToolCall(row));
    return out;
  });
}

// ------------------------------------------------------------------
// Projection checkpoints
// ------------------------------------------------------------------

Result PgRepository::CommitProjectionCheckpoint(Transaction& t, const model::ProjectionCheckpointRecord& r) {
  try {
    TX(t).Work().exec_params(
        "INSERT INTO projection_checkpoints(projector,stream_id,version,updated_at_ms) VALUES($1,$2,$3,$4) "
        "ON CONFLICT(projector,stream_id) DO UPDATE SET version=EXCLUDED.version,updated_at_ms=EXCLUDED.updated_at_ms;",
        r.projector, r.stream_id, r.version, r.updated_at_ms);
    return Result::Ok();
  } catch (const pqxx::failure& e) {
    return Translate(e);
  }
}

std::optional<model::ProjectionCheckpointRecord> PgRepository::GetProjectionCheckpoint(Transaction& t, const std::string& projector,
                                                                                       const std::string& stream_id) {
  return Query([&]() -> std::optional<model::ProjectionCheckpointRecord> {
    auto res = TX(t).Work().exec_params(
        "SELECT projector,stream_id,version,updated_at_ms FROM projection_checkpoints WHERE projector=$1 AND stream_id=$2;", projector,
        stream_id);
    if (res.empty()) return std::nullopt;
    return model::ProjectionCheckpointRecord{res[0][0].c_str(), res[0][1].c_str(), res[0][2].as<uint64_t>(), res[0][3].as<uint64_t>()};
  });
}

} // namespace chatlog::db::postgres
