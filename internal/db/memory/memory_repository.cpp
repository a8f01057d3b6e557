#include "memory_repository.hpp"

#include <algorithm>

#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"
#include "memory_tx.hpp"

namespace chatlog::db::memory {

MemoryRepository::MemoryRepository(std::chrono::milliseconds lock_timeout) : lock_timeout_(lock_timeout) {
}

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  std::unique_lock<std::timed_mutex> lock(mutex_, std::defer_lock);
  if (!lock.try_lock_for(lock_timeout_)) {
    throw util::StorageError("memory repository: timed out waiting for transaction lock");
  }
  return std::make_unique<MemoryTransaction>(*this, std::move(lock));
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

// ------------------------------------------------------------------
// Event log
// ------------------------------------------------------------------

Result MemoryRepository::InsertEvent(Transaction& t, model::EventRecord& r) {
  auto& s      = TX(t).Mutable();
  auto& stream = s.events[r.stream_id];
  if (stream.contains(r.stream_version)) {
    return Result::Err(ErrorCode::ConstraintViolation, "duplicate (stream_id, stream_version)");
  }
  if (r.id.empty()) r.id = util::NewId();
  if (r.inserted_at_ms == 0) r.inserted_at_ms = util::NowMs();
  stream.emplace(r.stream_version, r);
  return Result::Ok();
}

std::vector<model::EventRecord> MemoryRepository::ReadEvents(Transaction& t, const std::string& stream_id, uint64_t from_version,
                                                             std::optional<uint64_t> max_count) {
  std::vector<model::EventRecord> out;
  const auto&                     s  = TX(t).View();
  const auto                      it = s.events.find(stream_id);
  if (it == s.events.end()) return out;

  for (auto e = it->second.lower_bound(from_version); e != it->second.end(); ++e) {
    if (max_count && out.size() >= *max_count) break;
    out.push_back(e->second);
  }
  return out;
}

uint64_t MemoryRepository::GetStreamVersion(Transaction& t, const std::string& stream_id) {
  const auto& s  = TX(t).View();
  const auto  it = s.events.find(stream_id);
  if (it == s.events.end() || it->second.empty()) return 0;
  return it->second.rbegin()->first;
}

std::vector<model::StreamHeadRecord> MemoryRepository::ListStreams(Transaction& t, const std::string& stream_prefix) {
  std::vector<model::StreamHeadRecord> out;
  const auto&                          s = TX(t).View();
  for (auto it = s.events.lower_bound(stream_prefix); it != s.events.end(); ++it) {
    if (!it->first.starts_with(stream_prefix)) break;
    if (it->second.empty()) continue;
    out.push_back({it->first, it->second.rbegin()->first});
  }
  return out;
}

// ------------------------------------------------------------------
// Snapshots
// ------------------------------------------------------------------

Result MemoryRepository::InsertSnapshot(Transaction& t, model::SnapshotRecord& r) {
  auto& snapshots = TX(t).Mutable().snapshots[r.stream_id];
  if (snapshots.contains(r.stream_version)) {
    return Result::Err(ErrorCode::ConstraintViolation, "duplicate snapshot version");
  }
  if (r.id.empty()) r.id = util::NewId();
  if (r.inserted_at_ms == 0) r.inserted_at_ms = util::NowMs();
  snapshots.emplace(r.stream_version, r);
  return Result::Ok();
}

std::optional<model::SnapshotRecord> MemoryRepository::GetLatestSnapshot(Transaction& t, const std::string& stream_id) {
  const auto& s  = TX(t).View();
  const auto  it = s.snapshots.find(stream_id);
  if (it == s.snapshots.end() || it->second.empty()) return std::nullopt;
  return it->second.rbegin()->second;
}

// ------------------------------------------------------------------
// Projections
// ------------------------------------------------------------------

Result MemoryRepository::UpsertConversation(Transaction& t, const model::ConversationRecord& r) {
  TX(t).Mutable().conversations[r.id] = r;
  return Result::Ok();
}

std::optional<model::ConversationRecord> MemoryRepository::GetConversation(Transaction& t, const std::string& id) {
  const auto& s  = TX(t).View();
  const auto  it = s.conversations.find(id);
  if (it == s.conversations.end()) return std::nullopt;
  return it->second;
}

std::optional<model::ConversationRecord> MemoryRepository::GetConversationByStream(Transaction& t, const std::string& stream_id) {
  for (const auto& [_, c] : TX(t).View().conversations)
    if (c.stream_id == stream_id) return c;
  return std::nullopt;
}

std::vector<model::ConversationRecord> MemoryRepository::ListConversationsByStatus(Transaction& t, const std::string& status,
                                                                                   uint64_t updated_before_ms) {
  std::vector<model::ConversationRecord> out;
  for (const auto& [_, c] : TX(t).View().conversations) {
    if (c.status == status && c.updated_at_ms < updated_before_ms) out.push_back(c);
  }
  std::sort(out.begin(), out.end(), [](const auto& a, const auto& b) { return a.updated_at_ms < b.updated_at_ms; });
  return out;
}

Result MemoryRepository::UpsertMessage(Transaction& t, const model::MessageRecord& r) {
  TX(t).Mutable().messages[r.id] = r;
  return Result::Ok();
}

std::optional<model::MessageRecord> MemoryRepository::GetMessage(Transaction& t, const std::string& id) {
  const auto& s  = TX(t).View();
  const auto  it = s.messages.find(id);
  if (it == s.messages.end()) return std::nullopt;
  return it->second;
}

std::vector<model::MessageRecord> MemoryRepository::ListMessages(Transaction& t, const std::string& conversation_id) {
  std::vector<model::MessageRecord> out;
  for (const auto& [_, m] : TX(t).View().messages)
    if (m.conversation_id == conversation_id) out.push_back(m);
  std::sort(out.begin(), out.end(), [](const auto& a, const auto& b) { return a.position < b.position; });
  return out;
}

uint64_t MemoryRepository::CountMessages(Transaction& t, const std::string& conversation_id) {
  const auto& s = TX(t).View();
  return static_cast<uint64_t>(
      std::count_if(s.messages.begin(), s.messages.end(), [&](const auto& kv) { return kv.second.conversation_id == conversation_id; }));
}

Result MemoryRepository::UpsertMessageChunk(Transaction& t, const model::MessageChunkRecord& r) {
  auto&      chunks = TX(t).Mutable().chunks;
  const auto key    = std::make_pair(r.message_id, r.chunk_index);
  auto       it     = chunks.find(key);
  if (it == chunks.end()) {
    auto row = r;
    if (row.id.empty()) row.id = util::NewId();
    chunks.emplace(key, std::move(row));
    return Result::Ok();
  }
  const auto id = it->second.id;
  it->second    = r;
  it->second.id = id;
  return Result::Ok();
}

std::vector<model::MessageChunkRecord> MemoryRepository::ListMessageChunks(Transaction& t, const std::string& message_id) {
  std::vector<model::MessageChunkRecord> out;
  const auto&                            chunks = TX(t).View().chunks;
  for (auto it = chunks.lower_bound({message_id, 0}); it != chunks.end() && it->first.first == message_id; ++it) {
    out.push_back(it->second);
  }
  return out;
}

Result MemoryRepository::UpsertToolCall(Transaction& t, const model::ToolCallRecord& r) {
  auto&      calls = TX(t).Mutable().tool_calls;
  const auto key   = std::make_pair(r.message_id, r.tool_use_id);
  auto       it    = calls.find(key);
  if (it == calls.end()) {
    auto row = r;
    if (row.id.empty()) row.id = util::NewId();
    calls.emplace(key, std::move(row));
    return Result::Ok();
  }
  const auto id = it->second.id;
  it->second    = r;
  it->second.id = id;
  return Result::Ok();
}

std::optional<model::ToolCallRecord> MemoryRepository::GetToolCall(Transaction& t, const std::string& message_id,
                                                                   const std::string& tool_use_id) {
  const auto& calls = TX(t).View().tool_calls;
  const auto  it    = calls.find({message_id, tool_use_id});
  if (it == calls.end()) return std::nullopt;
  return it->second;
}

std::vector<model::ToolCallRecord> MemoryRepository::ListToolCalls(Transaction& t, const std::string& message_id) {
  std::vector<model::ToolCallRecord> out;
  for (const auto& [key, call] : TX(t).View().tool_calls)
    if (key.first == message_id) out.push_back(call);
  std::stable_sort(out.begin(), out.end(), [](const auto& a, const auto& b) { return a.created_at_ms < b.created_at_ms; });
  return out;
}

// ------------------------------------------------------------------
// Projection checkpoints
// ------------------------------------------------------------------

Result MemoryRepository::CommitProjectionCheckpoint(Transaction& t, const model::ProjectionCheckpointRecord& r) {
  TX(t).Mutable().checkpoints[{r.projector, r.stream_id}] = r;
  return Result::Ok();
}

std::optional<model::ProjectionCheckpointRecord> MemoryRepository::GetProjectionCheckpoint(Transaction& t, const std::string& projector,
                                                                                           const std::string& stream_id) {
  const auto& s  = TX(t).View();
  const auto  it = s.checkpoints.find({projector, stream_id});
  if (it == s.checkpoints.end()) return std::nullopt;
  return it->second;
}

} // namespace chatlog::db::memory
