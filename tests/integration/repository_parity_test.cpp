#include <cassert>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "config/config.pb.h"
#include "internal/db/api/repository.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/factory.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/json.hpp"
#include "internal/util/time.hpp"

namespace {

using chatlog::db::Repository;
using chatlog::db::memory::MemoryRepository;
using chatlog::db::model::ConversationRecord;
using chatlog::db::model::EventRecord;
using chatlog::db::model::MessageChunkRecord;
using chatlog::db::model::MessageRecord;
using chatlog::db::model::ProjectionCheckpointRecord;
using chatlog::db::model::SnapshotRecord;
using chatlog::db::model::ToolCallRecord;
using chatlog::runtime::config::RuntimeConfig;
using chatlog::util::NowMs;

struct BackendFactory {
  std::string                                       name;
  std::function<std::shared_ptr<Repository>()>      make_repository;
  std::function<bool()>                             supports_restart;
  std::function<void(std::shared_ptr<Repository>&)> restart;
  std::function<void()>                             cleanup;
  bool                                              supports_parallel_transactions = true;
};

// Postgres keeps rows between runs.
std::string RunToken() {
  static const std::string token = std::to_string(NowMs());
  return token;
}

EventRecord MakeEvent(const std::string& stream_id, uint64_t version, const std::string& type = "UserMessageAdded") {
  EventRecord event;
  event.stream_id      = stream_id;
  event.stream_version = version;
  event.event_type     = type;
  event.data           = R"({"message_id":"m)" + std::to_string(version) + R"(","content":"hello"})";
  event.metadata       = {{"command", "AddUserMessage"}, {"correlation_id", "c-" + std::to_string(version)}};
  return event;
}

void VerifyEventAppendAndRead(Repository& repo, const std::string& stream_id) {
  {
    auto tx = repo.Begin();
    assert(repo.GetStreamVersion(*tx, stream_id) == 0);
    for (uint64_t v = 1; v <= 3; ++v) {
      auto event = MakeEvent(stream_id, v);
      assert(repo.InsertEvent(*tx, event));
      assert(!event.id.empty());
      assert(event.inserted_at_ms > 0);
    }
    tx->Commit();
  }

  auto tx  = repo.Begin();
  auto all = repo.ReadEvents(*tx, stream_id, 1, std::nullopt);
  assert(all.size() == 3);
  for (size_t i = 0; i < all.size(); ++i) {
    assert(all[i].stream_version == i + 1);
    assert(all[i].event_type == "UserMessageAdded");
    // JSONB may reformat the text; compare decoded.
    assert(chatlog::util::JsonToStringMap(all[i].data).at("message_id") == "m" + std::to_string(i + 1));
    assert(all[i].metadata.at("command") == "AddUserMessage");
  }

  auto page = repo.ReadEvents(*tx, stream_id, 2, 1);
  assert(page.size() == 1);
  assert(page[0].stream_version == 2);
  assert(page[0].id == all[1].id);

  assert(repo.ReadEvents(*tx, stream_id, 4, std::nullopt).empty());
  assert(repo.GetStreamVersion(*tx, stream_id) == 3);
  tx->Commit();
}

void VerifyDuplicateVersionRejected(Repository& repo, const std::string& stream_id) {
  auto tx    = repo.Begin();
  auto event = MakeEvent(stream_id, 2);
  auto rc    = repo.InsertEvent(*tx, event);
  assert(!rc);
  assert(chatlog::db::IsUniquenessViolation(rc));
  tx->Rollback();

  auto verify = repo.Begin();
  assert(repo.GetStreamVersion(*verify, stream_id) == 3);
  verify->Commit();
}

void VerifyRollbackBehavior(Repository& repo, const std::string& stream_id) {
  {
    auto tx    = repo.Begin();
    auto event = MakeEvent(stream_id, 1);
    assert(repo.InsertEvent(*tx, event));
    tx->Rollback();
  }
  {
    // Destructor rolls back too.
    auto tx    = repo.Begin();
    auto event = MakeEvent(stream_id, 1);
    assert(repo.InsertEvent(*tx, event));
  }

  auto tx = repo.Begin();
  assert(repo.GetStreamVersion(*tx, stream_id) == 0);
  assert(repo.ReadEvents(*tx, stream_id, 1, std::nullopt).empty());
  tx->Commit();
}

void VerifyListStreams(Repository& repo, const std::string& prefix) {
  {
    auto tx = repo.Begin();
    for (uint64_t v = 1; v <= 2; ++v) {
      auto e = MakeEvent(prefix + "a", v);
      assert(repo.InsertEvent(*tx, e));
    }
    auto b = MakeEvent(prefix + "b", 1);
    assert(repo.InsertEvent(*tx, b));
    auto other = MakeEvent("other-" + prefix, 1);
    assert(repo.InsertEvent(*tx, other));
    tx->Commit();
  }

  auto tx      = repo.Begin();
  auto streams = repo.ListStreams(*tx, prefix);
  tx->Commit();

  assert(streams.size() == 2);
  for (const auto& head : streams) {
    if (head.stream_id == prefix + "a") {
      assert(head.version == 2);
    } else {
      assert(head.stream_id == prefix + "b");
      assert(head.version == 1);
    }
  }
}

void VerifySnapshots(Repository& repo, const std::string& stream_id) {
  {
    auto tx = repo.Begin();
    assert(!repo.GetLatestSnapshot(*tx, stream_id).has_value());

    SnapshotRecord early{.stream_id = stream_id, .stream_version = 2, .snapshot_type = "ConversationState", .data = R"({"title":"two"})"};
    SnapshotRecord late{.stream_id = stream_id, .stream_version = 5, .snapshot_type = "ConversationState", .data = R"({"title":"five"})"};
    assert(repo.InsertSnapshot(*tx, late));
    assert(repo.InsertSnapshot(*tx, early));
    assert(!late.id.empty());
    tx->Commit();
  }
  {
    auto tx     = repo.Begin();
    auto latest = repo.GetLatestSnapshot(*tx, stream_id);
    assert(latest.has_value());
    assert(latest->stream_version == 5);
    assert(latest->snapshot_type == "ConversationState");
    assert(chatlog::util::JsonToStringMap(latest->data).at("title") == "five");
    tx->Commit();
  }

  auto           tx = repo.Begin();
  SnapshotRecord duplicate{.stream_id = stream_id, .stream_version = 5, .snapshot_type = "ConversationState", .data = "{}"};
  assert(chatlog::db::IsUniquenessViolation(repo.InsertSnapshot(*tx, duplicate)));
  tx->Rollback();
}

void VerifyProjectionRows(Repository& repo, const std::string& conversation_id) {
  const auto stream_id  = "conversation-" + conversation_id;
  const auto message_id = conversation_id + "-m1";
  const auto now        = NowMs();

  {
    auto tx = repo.Begin();

    ConversationRecord conversation;
    conversation.id            = conversation_id;
    conversation.stream_id     = stream_id;
    conversation.user_id       = "u1";
    conversation.title         = "first";
    conversation.status        = "streaming";
    conversation.created_at_ms = now - 10000;
    conversation.updated_at_ms = now - 10000;
    assert(repo.UpsertConversation(*tx, conversation));

    conversation.title = "renamed";
    assert(repo.UpsertConversation(*tx, conversation));

    MessageRecord second{.id = conversation_id + "-m2", .conversation_id = conversation_id, .role = "assistant", .status = "streaming", .position = 2};
    MessageRecord first{.id = message_id, .conversation_id = conversation_id, .role = "user", .content = "hi", .status = "complete", .position = 1};
    assert(repo.UpsertMessage(*tx, second));
    assert(repo.UpsertMessage(*tx, first));

    MessageChunkRecord chunk{.message_id = conversation_id + "-m2", .chunk_index = 0, .delta_type = "text_delta", .delta_text = "Hel"};
    assert(repo.UpsertMessageChunk(*tx, chunk));
    chunk.delta_text = "Hello";
    assert(repo.UpsertMessageChunk(*tx, chunk));

    ToolCallRecord tool{.message_id = conversation_id + "-m2", .tool_use_id = "t1", .tool_name = "search", .input = R"({"q":"weather"})",
                        .status = "started", .created_at_ms = now};
    assert(repo.UpsertToolCall(*tx, tool));
    tool.output      = R"({"result":"sunny"})";
    tool.status      = "completed";
    tool.duration_ms = 42;
    assert(repo.UpsertToolCall(*tx, tool));

    tx->Commit();
  }

  auto tx = repo.Begin();

  auto by_id = repo.GetConversation(*tx, conversation_id);
  assert(by_id.has_value());
  assert(by_id->title == "renamed");
  auto by_stream = repo.GetConversationByStream(*tx, stream_id);
  assert(by_stream.has_value());
  assert(by_stream->id == conversation_id);

  bool listed = false;
  for (const auto& row : repo.ListConversationsByStatus(*tx, "streaming", now)) listed = listed || row.id == conversation_id;
  assert(listed);
  for (const auto& row : repo.ListConversationsByStatus(*tx, "streaming", now - 20000)) assert(row.id != conversation_id);

  auto messages = repo.ListMessages(*tx, conversation_id);
  assert(messages.size() == 2);
  assert(messages[0].id == message_id);
  assert(messages[1].position == 2);
  assert(repo.CountMessages(*tx, conversation_id) == 2);
  assert(repo.GetMessage(*tx, message_id)->content == "hi");

  auto chunks = repo.ListMessageChunks(*tx, conversation_id + "-m2");
  assert(chunks.size() == 1);
  assert(chunks[0].delta_text == "Hello");
  assert(!chunks[0].id.empty());

  auto tool = repo.GetToolCall(*tx, conversation_id + "-m2", "t1");
  assert(tool.has_value());
  assert(tool->status == "completed");
  assert(tool->duration_ms == 42);
  assert(chatlog::util::JsonToStringMap(tool->input).at("q") == "weather");
  assert(chatlog::util::JsonToStringMap(tool->output).at("result") == "sunny");
  assert(repo.ListToolCalls(*tx, conversation_id + "-m2").size() == 1);
  assert(!repo.GetToolCall(*tx, conversation_id + "-m2", "missing").has_value());

  tx->Commit();
}

void VerifyCheckpoints(Repository& repo, const std::string& stream_id) {
  {
    auto tx = repo.Begin();
    assert(!repo.GetProjectionCheckpoint(*tx, "conversations", stream_id).has_value());
    assert(repo.CommitProjectionCheckpoint(*tx, {"conversations", stream_id, 3, NowMs()}));
    assert(repo.CommitProjectionCheckpoint(*tx, {"conversations", stream_id, 7, NowMs()}));
    assert(repo.CommitProjectionCheckpoint(*tx, {"audit", stream_id, 1, NowMs()}));
    tx->Commit();
  }

  auto tx = repo.Begin();
  assert(repo.GetProjectionCheckpoint(*tx, "conversations", stream_id)->version == 7);
  assert(repo.GetProjectionCheckpoint(*tx, "audit", stream_id)->version == 1);
  tx->Commit();
}

// Two writers that both saw version 0: the second insert loses on the unique index.
void VerifyConcurrentAppend(Repository& repo, const std::string& stream_id, bool supports_parallel_transactions) {
  if (!supports_parallel_transactions) return;

  auto tx1 = repo.Begin();
  auto tx2 = repo.Begin();
  assert(repo.GetStreamVersion(*tx1, stream_id) == 0);
  assert(repo.GetStreamVersion(*tx2, stream_id) == 0);

  auto first = MakeEvent(stream_id, 1);
  assert(repo.InsertEvent(*tx1, first));
  tx1->Commit();

  auto second = MakeEvent(stream_id, 1);
  auto rc     = repo.InsertEvent(*tx2, second);
  assert(chatlog::db::IsUniquenessViolation(rc));
  tx2->Rollback();

  auto verify = repo.Begin();
  auto events = repo.ReadEvents(*verify, stream_id, 1, std::nullopt);
  assert(events.size() == 1);
  assert(events[0].id == first.id);
  verify->Commit();
}

void VerifyRestartDurability(BackendFactory& backend, const std::string& stream_id) {
  if (!backend.supports_restart()) {
    return;
  }

  auto repo = backend.make_repository();
  {
    auto tx = repo->Begin();
    for (uint64_t v = 1; v <= 2; ++v) {
      auto e = MakeEvent(stream_id, v);
      assert(repo->InsertEvent(*tx, e));
    }
    assert(repo->CommitProjectionCheckpoint(*tx, {"conversations", stream_id, 2, NowMs()}));
    tx->Commit();
  }

  backend.restart(repo);

  auto tx = repo->Begin();
  assert(repo->GetStreamVersion(*tx, stream_id) == 2);
  assert(repo->ReadEvents(*tx, stream_id, 1, std::nullopt).size() == 2);
  assert(repo->GetProjectionCheckpoint(*tx, "conversations", stream_id)->version == 2);
  tx->Commit();
}

void VerifyMemoryLockTimeout() {
  auto repo   = std::make_shared<MemoryRepository>(std::chrono::milliseconds(50));
  auto holder = repo->Begin();

  bool threw = false;
  std::thread waiter([&] {
    try {
      auto tx = repo->Begin();
    } catch (const chatlog::util::StorageError&) {
      threw = true;
    }
  });
  waiter.join();
  assert(threw);

  holder->Rollback();
  auto tx = repo->Begin();
  tx->Commit();
}

RuntimeConfig MemoryConfig() {
  RuntimeConfig config;
  config.mutable_database()->mutable_memory();
  return config;
}

BackendFactory MakeMemoryFactory() {
  return BackendFactory{
      .name                           = "memory",
      .make_repository                = []() { return chatlog::factory::BuildRepository(MemoryConfig()); },
      .supports_restart               = []() { return false; },
      .restart                        = [](std::shared_ptr<Repository>&) {},
      .cleanup                        = []() {},
      .supports_parallel_transactions = false,
  };
}

#if CHATLOG_DB_SQLITE
BackendFactory MakeSqliteFactory() {
  auto db_path = (std::filesystem::temp_directory_path() / ("chatlog_integration_sqlite_" + RunToken() + ".db")).string();

  auto make_repo = [db_path]() {
    RuntimeConfig config;
    config.mutable_database()->mutable_sqlite()->set_path(db_path);
    return chatlog::factory::BuildRepository(config);
  };

  return BackendFactory{
      .name                           = "sqlite",
      .make_repository                = make_repo,
      .supports_restart               = []() { return true; },
      .restart                        = [make_repo](std::shared_ptr<Repository>& repo) {
        repo.reset();
        repo = make_repo();
      },
      .cleanup = [db_path]() {
        std::filesystem::remove(db_path);
        std::filesystem::remove(db_path + "-wal");
        std::filesystem::remove(db_path + "-shm");
      },
      .supports_parallel_transactions = false,
  };
}
#endif

#if CHATLOG_DB_POSTGRES
BackendFactory MakePostgresFactory() {
  const char* uri = std::getenv("CHATLOG_TEST_POSTGRES_URI");
  if (uri == nullptr || std::string(uri).empty()) {
    throw std::runtime_error("CHATLOG_TEST_POSTGRES_URI is not set");
  }

  auto make_repo = [conninfo = std::string(uri)]() {
    RuntimeConfig config;
    config.mutable_database()->mutable_postgres()->set_connection_uri(conninfo);
    return chatlog::factory::BuildRepository(config);
  };

  return BackendFactory{
      .name                           = "postgres",
      .make_repository                = make_repo,
      .supports_restart               = []() { return true; },
      .restart                        = [make_repo](std::shared_ptr<Repository>& repo) { repo = make_repo(); },
      .cleanup                        = []() {},
      .supports_parallel_transactions = true,
  };
}
#endif

void RunBackendSuite(BackendFactory& backend) {
  std::cout << "running backend suite: " << backend.name << "\n";
  auto       repo   = backend.make_repository();
  const auto prefix = "parity" + RunToken() + "-" + backend.name + "-";

  VerifyEventAppendAndRead(*repo, prefix + "events");
  VerifyDuplicateVersionRejected(*repo, prefix + "events");
  VerifyRollbackBehavior(*repo, prefix + "rollback");
  VerifyListStreams(*repo, prefix + "list-");
  VerifySnapshots(*repo, prefix + "snapshots");
  VerifyProjectionRows(*repo, prefix + "conv");
  VerifyCheckpoints(*repo, prefix + "checkpoint");
  VerifyConcurrentAppend(*repo, prefix + "race", backend.supports_parallel_transactions);

  repo.reset();
  VerifyRestartDurability(backend, prefix + "durable");

  backend.cleanup();
}

} // namespace

int main() {
  VerifyMemoryLockTimeout();

  std::vector<BackendFactory> backends;
  backends.push_back(MakeMemoryFactory());

#if CHATLOG_DB_SQLITE
  backends.push_back(MakeSqliteFactory());
#endif

#if CHATLOG_DB_POSTGRES
  try {
    backends.push_back(MakePostgresFactory());
  } catch (const std::exception& ex) {
    std::cout << "skipping postgres integration suite: " << ex.what() << "\n";
  }
#endif

  for (auto& backend : backends) {
    RunBackendSuite(backend);
  }

  std::cout << "chatlog_integration_repository_parity: pass\n";
  return 0;
}
