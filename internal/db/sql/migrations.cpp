#include "migrations.hpp"

#include <stdexcept>

#include "internal/observability/logging.hpp"

namespace chatlog::db::sql {

namespace {

constexpr const char* kCreateSchemaMigrations =
    "CREATE TABLE IF NOT EXISTS schema_migrations (version INTEGER PRIMARY KEY, applied_at_ms BIGINT NOT NULL);";

} // namespace

int RunMigrations(MigrationExecutor& executor, const std::vector<Migration>& ordered) {
  executor.ExecuteSQL(kCreateSchemaMigrations);

  const int current = executor.CurrentVersion();
  int       last    = current;
  int       applied = 0;

  for (const auto& migration : ordered) {
    if (migration.version <= current) continue;
    if (migration.version <= last) {
      throw std::logic_error("migrations out of order at version " + std::to_string(migration.version));
    }

    for (const auto& statement : migration.statements) {
      executor.ExecuteSQL(statement);
    }
    executor.RecordVersion(migration.version);
    last = migration.version;
    ++applied;

    CHATLOG_LOG_INFO("applied schema migration", {observability::IntField("version", migration.version)});
  }

  return applied;
}

const std::vector<Migration>& SqliteMigrations() {
  static const std::vector<Migration> kMigrations = {
      {1,
       {
           "CREATE TABLE IF NOT EXISTS events (id TEXT PRIMARY KEY, stream_id TEXT NOT NULL, stream_version INTEGER NOT NULL, "
           "event_type TEXT NOT NULL, data TEXT NOT NULL, metadata TEXT NOT NULL DEFAULT '{}', inserted_at_ms INTEGER NOT NULL, "
           "UNIQUE(stream_id, stream_version));",
           "CREATE INDEX IF NOT EXISTS events_event_type_idx ON events(event_type);",
           "CREATE TABLE IF NOT EXISTS snapshots (id TEXT PRIMARY KEY, stream_id TEXT NOT NULL, stream_version INTEGER NOT NULL, "
           "snapshot_type TEXT NOT NULL, data TEXT NOT NULL, inserted_at_ms INTEGER NOT NULL, UNIQUE(stream_id, stream_version));",
       }},
      {2,
       {
           "CREATE TABLE IF NOT EXISTS conversations (id TEXT PRIMARY KEY, stream_id TEXT NOT NULL UNIQUE, user_id TEXT NOT NULL, "
           "title TEXT NOT NULL DEFAULT '', model_id TEXT NOT NULL DEFAULT '', system_prompt TEXT NOT NULL DEFAULT '', "
           "status TEXT NOT NULL, parent_conversation_id TEXT NOT NULL DEFAULT '', fork_at_version INTEGER NOT NULL DEFAULT 0, "
           "message_count INTEGER NOT NULL DEFAULT 0, last_message_at_ms INTEGER NOT NULL DEFAULT 0, "
           "created_at_ms INTEGER NOT NULL, updated_at_ms INTEGER NOT NULL);",
           "CREATE INDEX IF NOT EXISTS conversations_status_idx ON conversations(status, updated_at_ms);",
           "CREATE INDEX IF NOT EXISTS conversations_user_idx ON conversations(user_id);",
           "CREATE TABLE IF NOT EXISTS messages (id TEXT PRIMARY KEY, conversation_id TEXT NOT NULL, role TEXT NOT NULL, "
           "content TEXT NOT NULL DEFAULT '', status TEXT NOT NULL, model_id TEXT NOT NULL DEFAULT '', stop_reason TEXT NOT NULL DEFAULT '', "
           "input_tokens INTEGER NOT NULL DEFAULT 0, output_tokens INTEGER NOT NULL DEFAULT 0, total_tokens INTEGER NOT NULL DEFAULT 0, "
           "latency_ms INTEGER NOT NULL DEFAULT 0, stream_version INTEGER NOT NULL, position INTEGER NOT NULL, "
           "created_at_ms INTEGER NOT NULL, updated_at_ms INTEGER NOT NULL);",
           "CREATE INDEX IF NOT EXISTS messages_conversation_idx ON messages(conversation_id, position);",
           "CREATE TABLE IF NOT EXISTS message_chunks (id TEXT PRIMARY KEY, message_id TEXT NOT NULL, chunk_index INTEGER NOT NULL, "
           "content_block_index INTEGER NOT NULL DEFAULT 0, delta_type TEXT NOT NULL DEFAULT '', delta_text TEXT NOT NULL DEFAULT '', "
           "created_at_ms INTEGER NOT NULL, UNIQUE(message_id, chunk_index));",
           "CREATE TABLE IF NOT EXISTS tool_calls (id TEXT PRIMARY KEY, message_id TEXT NOT NULL, tool_use_id TEXT NOT NULL, "
           "tool_name TEXT NOT NULL, input TEXT NOT NULL DEFAULT '{}', output TEXT NOT NULL DEFAULT '', status TEXT NOT NULL, "
           "duration_ms INTEGER NOT NULL DEFAULT 0, created_at_ms INTEGER NOT NULL, updated_at_ms INTEGER NOT NULL, "
           "UNIQUE(message_id, tool_use_id));",
           "CREATE TABLE IF NOT EXISTS projection_checkpoints (projector TEXT NOT NULL, stream_id TEXT NOT NULL, "
           "version INTEGER NOT NULL, updated_at_ms INTEGER NOT NULL, PRIMARY KEY (projector, stream_id));",
       }},
  };
  return kMigrations;
}

const std::vector<Migration>& PostgresMigrations() {
  static const std::vector<Migration> kMigrations = {
      {1,
       {
           "CREATE TABLE IF NOT EXISTS events (id UUID PRIMARY KEY, stream_id TEXT NOT NULL, stream_version BIGINT NOT NULL, "
           "event_type TEXT NOT NULL, data JSONB NOT NULL, metadata JSONB NOT NULL DEFAULT '{}'::jsonb, "
           "inserted_at TIMESTAMPTZ NOT NULL DEFAULT now(), UNIQUE(stream_id, stream_version));",
           "CREATE INDEX IF NOT EXISTS events_event_type_idx ON events(event_type);",
           "CREATE TABLE IF NOT EXISTS snapshots (id UUID PRIMARY KEY, stream_id TEXT NOT NULL, stream_version BIGINT NOT NULL, "
           "snapshot_type TEXT NOT NULL, data JSONB NOT NULL, inserted_at TIMESTAMPTZ NOT NULL DEFAULT now(), "
           "UNIQUE(stream_id, stream_version));",
       }},
      {2,
       {
           "CREATE TABLE IF NOT EXISTS conversations (id TEXT PRIMARY KEY, stream_id TEXT NOT NULL UNIQUE, user_id TEXT NOT NULL, "
           "title TEXT NOT NULL DEFAULT '', model_id TEXT NOT NULL DEFAULT '', system_prompt TEXT NOT NULL DEFAULT '', "
           "status TEXT NOT NULL, parent_conversation_id TEXT NOT NULL DEFAULT '', fork_at_version BIGINT NOT NULL DEFAULT 0, "
           "message_count BIGINT NOT NULL DEFAULT 0, last_message_at_ms BIGINT NOT NULL DEFAULT 0, "
           "created_at_ms BIGINT NOT NULL, updated_at_ms BIGINT NOT NULL);",
           "CREATE INDEX IF NOT EXISTS conversations_status_idx ON conversations(status, updated_at_ms);",
           "CREATE INDEX IF NOT EXISTS conversations_user_idx ON conversations(user_id);",
           "CREATE TABLE IF NOT EXISTS messages (id TEXT PRIMARY KEY, conversation_id TEXT NOT NULL, role TEXT NOT NULL, "
           "content TEXT NOT NULL DEFAULT '', status TEXT NOT NULL, model_id TEXT NOT NULL DEFAULT '', stop_reason TEXT NOT NULL DEFAULT '', "
           "input_tokens BIGINT NOT NULL DEFAULT 0, output_tokens BIGINT NOT NULL DEFAULT 0, total_tokens BIGINT NOT NULL DEFAULT 0, "
           "latency_ms BIGINT NOT NULL DEFAULT 0, stream_version BIGINT NOT NULL, position BIGINT NOT NULL, "
           "created_at_ms BIGINT NOT NULL, updated_at_ms BIGINT NOT NULL);",
           "CREATE INDEX IF NOT EXISTS messages_conversation_idx ON messages(conversation_id, position);",
           "CREATE TABLE IF NOT EXISTS message_chunks (id TEXT PRIMARY KEY, message_id TEXT NOT NULL, chunk_index BIGINT NOT NULL, "
           "content_block_index BIGINT NOT NULL DEFAULT 0, delta_type TEXT NOT NULL DEFAULT '', delta_text TEXT NOT NULL DEFAULT '', "
           "created_at_ms BIGINT NOT NULL, UNIQUE(message_id, chunk_index));",
           "CREATE TABLE IF NOT EXISTS tool_calls (id TEXT PRIMARY KEY, message_id TEXT NOT NULL, tool_use_id TEXT NOT NULL, "
           "tool_name TEXT NOT NULL, input JSONB NOT NULL DEFAULT '{}'::jsonb, output JSONB, status TEXT NOT NULL, "
           "duration_ms BIGINT NOT NULL DEFAULT 0, created_at_ms BIGINT NOT NULL, updated_at_ms BIGINT NOT NULL, "
           "UNIQUE(message_id, tool_use_id));",
           "CREATE TABLE IF NOT EXISTS projection_checkpoints (projector TEXT NOT NULL, stream_id TEXT NOT NULL, "
           "version BIGINT NOT NULL, updated_at_ms BIGINT NOT NULL, PRIMARY KEY (projector, stream_id));",
       }},
  };
  return kMigrations;
}

} // namespace chatlog::db::sql
