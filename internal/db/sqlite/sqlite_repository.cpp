#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include "internal/util/errors.hpp"
#include "internal/util/json.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"

namespace chatlog::db::sqlite {

using chatlog::db::ErrorCode;
using chatlog::db::Result;

namespace {

using Stmt = std::unique_ptr<sqlite3_stmt, decltype(&sqlite3_finalize)>;

Stmt Prepare(sqlite3* db, const char* sql) {
    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK) {
        sqlite3_finalize(st);
        return Stmt(nullptr, &sqlite3_finalize);
    }
    return Stmt(st, &sqlite3_finalize);
}

// Read paths have no Result to carry the failure.
Stmt PrepareOrThrow(sqlite3* db, const char* sql) {
    auto st = Prepare(db, sql);
    if (!st) throw util::StorageError(std::string("sqlite prepare: ") + sqlite3_errmsg(db));
    return st;
}

[[noreturn]] void ThrowStep(sqlite3* db) {
    throw util::StorageError(std::string("sqlite step: ") + sqlite3_errmsg(db));
}

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
    sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

void BindU64(sqlite3_stmt* st, int idx, uint64_t v) {
    sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

std::string ColText(sqlite3_stmt* st, int col) {
    const unsigned char* t = sqlite3_column_text(st, col);
    return t ? reinterpret_cast<const char*>(t) : "";
}

uint64_t ColU64(sqlite3_stmt* st, int col) {
    return static_cast<uint64_t>(sqlite3_column_int64(st, col));
}

constexpr const char* kEventColumns = "id,stream_id,stream_version,event_type,data,metadata,inserted_at_ms";

model::EventRecord ReadEvent(sqlite3_stmt* st) {
    model::EventRecord r;
    r.id = ColText(st, 0);
    r.stream_id = ColText(st, 1);
    r.stream_version = ColU64(st, 2);
    r.event_type = ColText(st, 3);
    r.data = ColText(st, 4);
    r.metadata = util::JsonToStringMap(ColText(st, 5));
    r.inserted_at_ms = ColU64(st, 6);
    return r;
}

model::SnapshotRecord ReadSnapshot(sqlite3_stmt* st) {
    model::SnapshotRecord r;
    r.id = ColText(st, 0);
    r.stream_id = ColText(st, 1);
    r.stream_version = ColU64(st, 2);
    r.snapshot_type = ColText(st, 3);
    r.data = ColText(st, 4);
    r.inserted_at_ms = ColU64(st, 5);
    return r;
}

constexpr const char* kConversationSelect =
    "SELECT id,stream_id,user_id,title,model_id,system_prompt,status,parent_conversation_id,"
    "fork_at_version,message_count,last_message_at_ms,created_at_ms,updated_at_ms FROM conversations ";

model::ConversationRecord ReadConversation(sqlite3_stmt* st) {
    model::ConversationRecord r;
    r.id = ColText(st, 0);
    r.stream_id = ColText(st, 1);
    r.user_id = ColText(st, 2);
    r.title = ColText(st, 3);
    r.model_id = ColText(st, 4);
    r.system_prompt = ColText(st, 5);
    r.status = ColText(st, 6);
    r.parent_conversation_id = ColText(st, 7);
    r.fork_at_version = ColU64(st, 8);
    r.message_count = ColU64(st, 9);
    r.last_message_at_ms = ColU64(st, 10);
    r.created_at_ms = ColU64(st, 11);
    r.updated_at_ms = ColU64(st, 12);
    return r;
}

constexpr const char* kMessageSelect =
    "SELECT id,conversation_id,role,content,status,model_id,stop_reason,input_tokens,output_tokens,"
    "total_tokens,latency_ms,stream_version,position,created_at_ms,updated_at_ms FROM messages ";

model::MessageRecord ReadMessage(sqlite3_stmt* st) {
    model::MessageRecord r;
    r.id = ColText(st, 0);
    r.conversation_id = ColText(st, 1);
    r.role = ColText(st, 2);
    r.content = ColText(st, 3);
    r.status = ColText(st, 4);
    r.model_id = ColText(st, 5);
    r.stop_reason = ColText(st, 6);
    r.input_tokens = ColU64(st, 7);
    r.output_tokens = ColU64(st, 8);
    r.total_tokens = ColU64(st, 9);
    r.latency_ms = ColU64(st, 10);
    r.stream_version = ColU64(st, 11);
    r.position = ColU64(st, 12);
    r.created_at_ms = ColU64(st, 13);
    r.updated_at_ms = ColU64(st, 14);
    return r;
}

constexpr const char* kToolCallSelect =
    "SELECT id,message_id,tool_use_id,tool_name,input,output,status,duration_ms,created_at_ms,updated_at_ms FROM tool_calls ";

model::ToolCallRecord ReadToolCall(sqlite3_stmt* st) {
    model::ToolCallRecord r;
    r.id = ColText(st, 0);
    r.message_id = ColText(st, 1);
    r.tool_use_id = ColText(st, 2);
    r.tool_name = ColText(st, 3);
    r.input = ColText(st, 4);
    r.output = ColText(st, 5);
    r.status = ColText(st, 6);
    r.duration_ms = ColU64(st, 7);
    r.created_at_ms = ColU64(st, 8);
    r.updated_at_ms = ColU64(st, 9);
    return r;
}

template <typename Row, typename Reader>
std::vector<Row> CollectRows(sqlite3* db, sqlite3_stmt* st, Reader read) {
    std::vector<Row> out;
    int rc;
    while ((rc = sqlite3_step(st)) == SQLITE_ROW) out.push_back(read(st));
    if (rc != SQLITE_DONE) ThrowStep(db);
    return out;
}

template <typename Row, typename Reader>
std::optional<Row> FirstRow(sqlite3* db, sqlite3_stmt* st, Reader read) {
    int rc = sqlite3_step(st);
    if (rc == SQLITE_ROW) return read(st);
    if (rc != SQLITE_DONE) ThrowStep(db);
    return std::nullopt;
}

} // namespace

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db)
    : db_(std::move(db)) {}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
    return std::make_unique<SqliteTransaction>(db_);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
    return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
    if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW)
        return Result::Ok();

    switch (rc & 0xff) {
        case SQLITE_BUSY:
        case SQLITE_LOCKED:
            return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
        case SQLITE_CONSTRAINT:
            return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
        case SQLITE_IOERR:
            return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
        case SQLITE_CORRUPT:
            return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
        default:
            return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    }
}

// ------------------------------------------------------------------
// Event log
// ------------------------------------------------------------------

Result SqliteRepository::InsertEvent(Transaction& t, model::EventRecord& r) {
    auto* db = TX(t).Handle();

    auto st = Prepare(db,
        "INSERT INTO events(id,stream_id,stream_version,event_type,data,metadata,inserted_at_ms)"
        " VALUES(?,?,?,?,?,?,?);");
    if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    if (r.id.empty()) r.id = util::NewId();
    if (r.inserted_at_ms == 0) r.inserted_at_ms = util::NowMs();

    BindText(st.get(), 1, r.id);
    BindText(st.get(), 2, r.stream_id);
    BindU64(st.get(), 3, r.stream_version);
    BindText(st.get(), 4, r.event_type);
    BindText(st.get(), 5, r.data);
    BindText(st.get(), 6, util::StringMapToJson(r.metadata));
    BindU64(st.get(), 7, r.inserted_at_ms);

    return Translate(db, sqlite3_step(st.get()));
}

std::vector<model::EventRecord> SqliteRepository::ReadEvents(Transaction& t, const std::string& stream_id,
                                                             uint64_t from_version, std::optional<uint64_t> max_count) {
    auto* db = TX(t).Handle();

    const std::string sql = std::string("SELECT ") + kEventColumns +
                            " FROM events WHERE stream_id=? AND stream_version>=? ORDER BY stream_version ASC LIMIT ?;";
    auto st = PrepareOrThrow(db, sql.c_str());

    BindText(st.get(), 1, stream_id);
    BindU64(st.get(), 2, from_version);
    // LIMIT -1 means unbounded in sqlite
    sqlite3_bind_int64(st.get(), 3, max_count ? static_cast<sqlite3_int64>(*max_count) : -1);

    return CollectRows<model::EventRecord>(db, st.get(), ReadEvent);
}

uint64_t SqliteRepository::GetStreamVersion(Transaction& t, const std::string& stream_id) {
    auto* db = TX(t).Handle();

    auto st = PrepareOrThrow(db, "SELECT COALESCE(MAX(stream_version),0) FROM events WHERE stream_id=?;");
    BindText(st.get(), 1, stream_id);

    if (sqlite3_step(st.get()) != SQLITE_ROW) ThrowStep(db);
    return ColU64(st.get(), 0);
}

std::vector<model::StreamHeadRecord> SqliteRepository::ListStreams(Transaction& t, const std::string& stream_prefix) {
    auto* db = TX(t).Handle();

    // substr() keeps '%' and '_' in the prefix literal
    auto st = PrepareOrThrow(db,
        "SELECT stream_id,MAX(stream_version) FROM events"
        " WHERE substr(stream_id,1,length(?1))=?1 GROUP BY stream_id ORDER BY stream_id;");
    BindText(st.get(), 1, stream_prefix);

    return CollectRows<model::StreamHeadRecord>(db, st.get(), [](sqlite3_stmt* s) {
        return model::StreamHeadRecord{ColText(s, 0), ColU64(s, 1)};
    });
}

// ------------------------------------------------------------------
// Snapshots
// ------------------------------------------------------------------

Result SqliteRepository::InsertSnapshot(Transaction& t, model::SnapshotRecord& r) {
    auto* db = TX(t).Handle();

    auto st = Prepare(db,
        "INSERT INTO snapshots(id,stream_id,stream_version,snapshot_type,data,inserted_at_ms) VALUES(?,?,?,?,?,?);");
    if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    if (r.id.empty()) r.id = util::NewId();
    if (r.inserted_at_ms == 0) r.inserted_at_ms = util::NowMs();

    BindText(st.get(), 1, r.id);
    BindText(st.get(), 2, r.stream_id);
    BindU64(st.get(), 3, r.stream_version);
    BindText(st.get(), 4, r.snapshot_type);
    BindText(st.get(), 5, r.data);
    BindU64(st.get(), 6, r.inserted_at_ms);

    return Translate(db, sqlite3_step(st.get()));
}

std::optional<model::SnapshotRecord> SqliteRepository::GetLatestSnapshot(Transaction& t, const std::string& stream_id) {
    auto* db = TX(t).Handle();

    auto st = PrepareOrThrow(db,
        "SELECT id,stream_id,stream_version,snapshot_type,data,inserted_at_ms FROM snapshots"
        " WHERE stream_id=? ORDER BY stream_version DESC LIMIT 1;");
    BindText(st.get(), 1, stream_id);

    return FirstRow<model::SnapshotRecord>(db, st.get(), ReadSnapshot);
}

// ------------------------------------------------------------------
// Conversations
// ------------------------------------------------------------------

Result SqliteRepository::UpsertConversation(Transaction& t, const model::ConversationRecord& r) {
    auto* db = TX(t).Handle();

    auto st = Prepare(db,
        "INSERT INTO conversations(id,stream_id,user_id,title,model_id,system_prompt,status,parent_conversation_id,"
        "fork_at_version,message_count,last_message_at_ms,created_at_ms,updated_at_ms)"
        " VALUES(?,?,?,?,?,?,?,?,?,?,?,?,?)"
        " ON CONFLICT(id) DO UPDATE SET"
        " stream_id=excluded.stream_id,"
        " user_id=excluded.user_id,"
        " title=excluded.title,"
        " model_id=excluded.model_id,"
        " system_prompt=excluded.system_prompt,"
        " status=excluded.status,"
        " parent_conversation_id=excluded.parent_conversation_id,"
        " fork_at_version=excluded.fork_at_version,"
        " message_count=excluded.message_count,"
        " last_message_at_ms=excluded.last_message_at_ms,"
        " created_at_ms=excluded.created_at_ms,"
        " updated_at_ms=excluded.updated_at_ms;");
    if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st.get(), 1, r.id);
    BindText(st.get(), 2, r.stream_id);
    BindText(st.get(), 3, r.user_id);
    BindText(st.get(), 4, r.title);
    BindText(st.get(), 5, r.model_id);
    BindText(st.get(), 6, r.system_prompt);
    BindText(st.get(), 7, r.status);
    BindText(st.get(), 8, r.parent_conversation_id);
    BindU64(st.get(), 9, r.fork_at_version);
    BindU64(st.get(), 10, r.message_count);
    BindU64(st.get(), 11, r.last_message_at_ms);
    BindU64(st.get(), 12, r.created_at_ms);
    BindU64(st.get(), 13, r.updated_at_ms);

    return Translate(db, sqlite3_step(st.get()));
}

std::optional<model::ConversationRecord> SqliteRepository::GetConversation(Transaction& t, const std::string& id) {
    auto* db = TX(t).Handle();

    const std::string sql = std::string(kConversationSelect) + "WHERE id=?;";
    auto st = PrepareOrThrow(db, sql.c_str());
    BindText(st.get(), 1, id);

    return FirstRow<model::ConversationRecord>(db, st.get(), ReadConversation);
}

std::optional<model::ConversationRecord> SqliteRepository::GetConversationByStream(Transaction& t, const std::string& stream_id) {
    auto* db = TX(t).Handle();

    const std::string sql = std::string(kConversationSelect) + "WHERE stream_id=?;";
    auto st = PrepareOrThrow(db, sql.c_str());
    BindText(st.get(), 1, stream_id);

    return FirstRow<model::ConversationRecord>(db, st.get(), ReadConversation);
}

std::vector<model::ConversationRecord> SqliteRepository::ListConversationsByStatus(Transaction& t, const std::string& status,
                                                                                   uint64_t updated_before_ms) {
    auto* db = TX(t).Handle();

    const std::string sql = std::string(kConversationSelect) + "WHERE status=? AND updated_at_ms<? ORDER BY updated_at_ms ASC;";
    auto st = PrepareOrThrow(db, sql.c_str());
    BindText(st.get(), 1, status);
    BindU64(st.get(), 2, updated_before_ms);

    return CollectRows<model::ConversationRecord>(db, st.get(), ReadConversation);
}

// ------------------------------------------------------------------
// Messages
// ------------------------------------------------------------------

Result SqliteRepository::UpsertMessage(Transaction& t, const model::MessageRecord& r) {
    auto* db = TX(t).Handle();

    auto st = Prepare(db,
        "INSERT INTO messages(id,conversation_id,role,content,status,model_id,stop_reason,input_tokens,output_tokens,"
        "total_tokens,latency_ms,stream_version,position,created_at_ms,updated_at_ms)"
        " VALUES(?,?,?,?,?,?,?,?,?,?,?,?,?,?,?)"
        " ON CONFLICT(id) DO UPDATE SET"
        " conversation_id=excluded.conversation_id,"
        " role=excluded.role,"
        " content=excluded.content,"
        " status=excluded.status,"
        " model_id=excluded.model_id,"
        " stop_reason=excluded.stop_reason,"
        " input_tokens=excluded.input_tokens,"
        " output_tokens=excluded.output_tokens,"
        " total_tokens=excluded.total_tokens,"
        " latency_ms=excluded.latency_ms,"
        " stream_version=excluded.stream_version,"
        " position=excluded.position,"
        " created_at_ms=excluded.created_at_ms,"
        " updated_at_ms=excluded.updated_at_ms;");
    if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st.get(), 1, r.id);
    BindText(st.get(), 2, r.conversation_id);
    BindText(st.get(), 3, r.role);
    BindText(st.get(), 4, r.content);
    BindText(st.get(), 5, r.status);
    BindText(st.get(), 6, r.model_id);
    BindText(st.get(), 7, r.stop_reason);
    BindU64(st.get(), 8, r.input_tokens);
    BindU64(st.get(), 9, r.output_tokens);
    BindU64(st.get(), 10, r.total_tokens);
    BindU64(st.get(), 11, r.latency_ms);
    BindU64(st.get(), 12, r.stream_version);
    BindU64(st.get(), 13, r.position);
    BindU64(st.get(), 14, r.created_at_ms);
    BindU64(st.get(), 15, r.updated_at_ms);

    return Translate(db, sqlite3_step(st.get()));
}

std::optional<model::MessageRecord> SqliteRepository::GetMessage(Transaction& t, const std::string& id) {
    auto* db = TX(t).Handle();

    const std::string sql = std::string(kMessageSelect) + "WHERE id=?;";
    auto st = PrepareOrThrow(db, sql.c_str());
    BindText(st.get(), 1, id);

    return FirstRow<model::MessageRecord>(db, st.get(), ReadMessage);
}

std::vector<model::MessageRecord> SqliteRepository::ListMessages(Transaction& t, const std::string& conversation_id) {
    auto* db = TX(t).Handle();

    const std::string sql = std::string(kMessageSelect) + "WHERE conversation_id=? ORDER BY position ASC;";
    auto st = PrepareOrThrow(db, sql.c_str());
    BindText(st.get(), 1, conversation_id);

    return CollectRows<model::MessageRecord>(db, st.get(), ReadMessage);
}

uint64_t SqliteRepository::CountMessages(Transaction& t, const std::string& conversation_id) {
    auto* db = TX(t).Handle();

    auto st = PrepareOrThrow(db, "SELECT COUNT(*) FROM messages WHERE conversation_id=?;");
    BindText(st.get(), 1, conversation_id);

    if (sqlite3_step(st.get()) != SQLITE_ROW) ThrowStep(db);
    return ColU64(st.get(), 0);
}

Result SqliteRepository::UpsertMessageChunk(Transaction& t, const model::MessageChunkRecord& r) {
    auto* db = TX(t).Handle();

    auto st = Prepare(db,
        "INSERT INTO message_chunks(id,message_id,chunk_index,content_block_index,delta_type,delta_text,created_at_ms)"
        " VALUES(?,?,?,?,?,?,?)"
        " ON CONFLICT(message_id,chunk_index) DO UPDATE SET"
        " content_block_index=excluded.content_block_index,"
        " delta_type=excluded.delta_type,"
        " delta_text=excluded.delta_text,"
        " created_at_ms=excluded.created_at_ms;");
    if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st.get(), 1, r.id.empty() ? util::NewId() : r.id);
    BindText(st.get(), 2, r.message_id);
    BindU64(st.get(), 3, r.chunk_index);
    BindU64(st.get(), 4, r.content_block_index);
    BindText(st.get(), 5, r.delta_type);
    BindText(st.get(), 6, r.delta_text);
    BindU64(st.get(), 7, r.created_at_ms);

    return Translate(db, sqlite3_step(st.get()));
}

std::vector<model::MessageChunkRecord> SqliteRepository::ListMessageChunks(Transaction& t, const std::string& message_id) {
    auto* db = TX(t).Handle();

    auto st = PrepareOrThrow(db,
        "SELECT id,message_id,chunk_index,content_block_index,delta_type,delta_text,created_at_ms"
        " FROM message_chunks WHERE message_id=? ORDER BY chunk_index ASC;");
    BindText(st.get(), 1, message_id);

    return CollectRows<model::MessageChunkRecord>(db, st.get(), [](sqlite3_stmt* s) {
        model::MessageChunkRecord r;
        r.id = ColText(s, 0);
        r.message_id = ColText(s, 1);
        r.chunk_index = ColU64(s, 2);
        r.content_block_index = ColU64(s, 3);
        r.delta_type = ColText(s, 4);
        r.delta_text = ColText(s, 5);
        r.created_at_ms = ColU64(s, 6);
        return r;
    });
}

// ------------------------------------------------------------------
// Tool calls
// ------------------------------------------------------------------

Result SqliteRepository::UpsertToolCall(Transaction& t, const model::ToolCallRecord& r) {
    auto* db = TX(t).Handle();

    auto st = Prepare(db,
        "INSERT INTO tool_calls(id,message_id,tool_use_id,tool_name,input,output,status,duration_ms,created_at_ms,updated_at_ms)"
        " VALUES(?,?,?,?,?,?,?,?,?,?)"
        " ON CONFLICT(message_id,tool_use_id) DO UPDATE SET"
        " tool_name=excluded.tool_name,"
        " input=excluded.input,"
        " output=excluded.output,"
        " status=excluded.status,"
        " duration_ms=excluded.duration_ms,"
        " created_at_ms=excluded.created_at_ms,"
        " updated_at_ms=excluded.updated_at_ms;");
    if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st.get(), 1, r.id.empty() ? util::NewId() : r.id);
    BindText(st.get(), 2, r.message_id);
    BindText(st.get(), 3, r.tool_use_id);
    BindText(st.get(), 4, r.tool_name);
    BindText(st.get(), 5, r.input);
    BindText(st.get(), 6, r.output);
    BindText(st.get(), 7, r.status);
    BindU64(st.get(), 8, r.duration_ms);
    BindU64(st.get(), 9, r.created_at_ms);
    BindU64(st.get(), 10, r.updated_at_ms);

    return Translate(db, sqlite3_step(st.get()));
}

std::optional<model::ToolCallRecord> SqliteRepository::GetToolCall(Transaction& t, const std::string& message_id,
                                                                   const std::string& tool_use_id) {
    auto* db = TX(t).Handle();

    const std::string sql = std::string(kToolCallSelect) + "WHERE message_id=? AND tool_use_id=?;";
    auto st = PrepareOrThrow(db, sql.c_str());
    BindText(st.get(), 1, message_id);
    BindText(st.get(), 2, tool_use_id);

    return FirstRow<model::ToolCallRecord>(db, st.get(), ReadToolCall);
}

std::vector<model::ToolCallRecord> SqliteRepository::ListToolCalls(Transaction& t, const std::string& message_id) {
    auto* db = TX(t).Handle();

    const std::string sql = std::string(kToolCallSelect) + "WHERE message_id=? ORDER BY created_at_ms ASC, tool_use_id ASC;";
    auto st = PrepareOrThrow(db, sql.c_str());
    BindText(st.get(), 1, message_id);

    return CollectRows<model::ToolCallRecord>(db, st.get(), ReadToolCall);
}

// ------------------------------------------------------------------
// Projection checkpoints
// ------------------------------------------------------------------

Result SqliteRepository::CommitProjectionCheckpoint(Transaction& t, const model::ProjectionCheckpointRecord& r) {
    auto* db = TX(t).Handle();

    auto st = Prepare(db,
        "INSERT INTO projection_checkpoints(projector,stream_id,version,updated_at_ms) VALUES(?,?,?,?)"
        " ON CONFLICT(projector,stream_id) DO UPDATE SET"
        " version=excluded.version,"
        " updated_at_ms=excluded.updated_at_ms;");
    if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st.get(), 1, r.projector);
    BindText(st.get(), 2, r.stream_id);
    BindU64(st.get(), 3, r.version);
    BindU64(st.get(), 4, r.updated_at_ms);

    return Translate(db, sqlite3_step(st.get()));
}

std::optional<model::ProjectionCheckpointRecord>
SqliteRepository::GetProjectionCheckpoint(Transaction& t, const std::string& projector, const std::string& stream_id) {
    auto* db = TX(t).Handle();

    auto st = PrepareOrThrow(db,
        "SELECT projector,stream_id,version,updated_at_ms FROM projection_checkpoints WHERE projector=? AND stream_id=?;");
    BindText(st.get(), 1, projector);
    BindText(st.get(), 2, stream_id);

    return FirstRow<model::ProjectionCheckpointRecord>(db, st.get(), [](sqlite3_stmt* s) {
        return model::ProjectionCheckpointRecord{ColText(s, 0), ColText(s, 1), ColU64(s, 2), ColU64(s, 3)};
    });
}

} // namespace chatlog::db::sqlite
