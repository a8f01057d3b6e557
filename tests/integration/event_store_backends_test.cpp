#include <atomic>
#include <cassert>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <functional>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

#include "config/config.pb.h"
#include "internal/factory.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace {

namespace v1   = chatlog::v1;
namespace chat = chatlog::chat;
using chatlog::factory::Application;
using chatlog::runtime::config::RuntimeConfig;

struct Backend {
  std::string                    name;
  RuntimeConfig                  config;
  bool                           durable = false;
  std::function<void()>          cleanup = [] {};
};

RuntimeConfig WithTestTimings(RuntimeConfig config) {
  config.mutable_loader()->set_snapshot_every(4);
  config.mutable_projector()->set_catch_up_interval_ms(100);
  config.mutable_projector()->set_retry_backoff_ms(20);
  return config;
}

std::string Stream(const v1::ConversationState& state) {
  return chatlog::service::ConversationStreamId(state.conversation_id());
}

std::string RunConversation(Application& app) {
  auto created      = app.conversations->Create({"u-integration", "Backends", "model-a", "Be brief."});
  const auto stream = Stream(created.state);

  chat::AddUserMessage say;
  say.message_id = "q-" + created.state.conversation_id();
  say.content    = "How are you?";
  app.conversations->Execute(stream, say);

  chat::StartAssistantStream start;
  start.message_id = "a-" + created.state.conversation_id();
  app.conversations->Execute(stream, start);

  for (int i = 0; i < 3; ++i) {
    chat::RecordAssistantChunk chunk;
    chunk.message_id  = start.message_id;
    chunk.chunk_index = i;
    chunk.delta_type  = "text_delta";
    chunk.delta_text  = "part" + std::to_string(i);
    app.conversations->Execute(stream, chunk);
  }

  chat::CompleteAssistantStream done;
  done.message_id    = start.message_id;
  done.full_content  = "part0part1part2";
  done.stop_reason   = "end_turn";
  done.input_tokens  = 3;
  done.output_tokens = 3;
  auto completed     = app.conversations->Execute(stream, done);
  assert(completed.version == 7);
  return stream;
}

void VerifyCommandPipeline(Application& app, const std::string& stream) {
  auto loaded = app.conversations->Load(stream);
  assert(loaded.version == 7);
  assert(loaded.state.status() == v1::CONVERSATION_STATUS_ACTIVE);
  assert(loaded.state.message_count() == 2);

  // snapshot_every 4 crossed at version 4.
  auto snapshot = app.snapshots->Latest(stream);
  assert(snapshot.has_value());
  assert(snapshot->stream_version == 4);

  auto events = app.events->ReadForward(stream);
  assert(events.size() == 7);
  for (std::size_t i = 0; i < events.size(); ++i) {
    assert(events[i].stream_version == i + 1);
    assert(events[i].metadata.count("correlation_id") == 1);
  }

  bool conflict = false;
  try {
    app.events->Append(stream, 3, {chat::Encode(v1::ConversationTitleUpdated{})});
  } catch (const chatlog::util::VersionConflict&) {
    conflict = true;
  }
  assert(conflict);
  assert(app.events->CurrentVersion(stream) == 7);
}

void VerifyProjection(Application& app, const std::string& stream, const std::string& conversation_id) {
  assert(app.projector->WaitForIdle(std::chrono::seconds(10)));

  auto tx       = app.repository->Begin();
  auto row      = app.repository->GetConversationByStream(*tx, stream);
  auto messages = app.repository->ListMessages(*tx, conversation_id);
  auto chunks   = messages.size() == 2 ? app.repository->ListMessageChunks(*tx, messages[1].id) : std::vector<chatlog::db::model::MessageChunkRecord>{};
  auto mark     = app.repository->GetProjectionCheckpoint(*tx, app.projector->options().name, stream);
  tx->Commit();

  assert(row.has_value());
  assert(row->status == "active");
  assert(row->title == "Backends");
  assert(row->message_count == 2);
  assert(messages.size() == 2);
  assert(messages[0].role == "user" && messages[0].content == "How are you?");
  assert(messages[1].role == "assistant" && messages[1].content == "part0part1part2");
  assert(messages[1].total_tokens == 6);
  assert(chunks.size() == 3);
  assert(mark.has_value() && mark->version == 7);
}

void VerifyForkAndArchive(Application& app, const std::string& stream) {
  auto fork = app.conversations->Fork(stream, 2, "Branch");
  assert(fork.state.message_count() == 1);

  chat::ArchiveConversation archive;
  auto archived = app.conversations->Execute(stream, archive);
  assert(archived.state.status() == v1::CONVERSATION_STATUS_ARCHIVED);

  bool rejected = false;
  try {
    chat::AddUserMessage late;
    late.message_id = "late";
    app.conversations->Execute(stream, late);
  } catch (const chatlog::util::CommandRejected& e) {
    rejected = e.reason() == chat::reasons::kConversationArchived;
  }
  assert(rejected);

  assert(app.projector->WaitForIdle(std::chrono::seconds(10)));
  auto tx       = app.repository->Begin();
  auto forked   = app.repository->GetConversation(*tx, fork.state.conversation_id());
  auto copied   = app.repository->ListMessages(*tx, fork.state.conversation_id());
  auto original = app.repository->GetConversationByStream(*tx, stream);
  tx->Commit();

  assert(forked.has_value());
  assert(forked->title == "Branch");
  assert(forked->fork_at_version == 2);
  assert(copied.size() == 1);
  assert(copied[0].content == "How are you?");
  assert(original->status == "archived");
}

// Writers that retry on VersionConflict all get their message in.
void VerifyRacingWriters(Application& app) {
  auto created      = app.conversations->Create({"u-race", "Race", "model-a", ""});
  const auto stream = Stream(created.state);

  constexpr int          kWriters = 4;
  std::atomic<int>       conflicts{0};
  std::vector<std::thread> writers;
  for (int w = 0; w < kWriters; ++w) {
    writers.emplace_back([&, w] {
      chat::AddUserMessage say;
      say.message_id = "w" + std::to_string(w);
      for (int attempt = 0; attempt < 50; ++attempt) {
        try {
          app.conversations->Execute(stream, say);
          return;
        } catch (const chatlog::util::VersionConflict&) {
          ++conflicts;
        }
      }
    });
  }
  for (auto& t : writers) t.join();

  auto loaded = app.conversations->Load(stream);
  assert(loaded.version == 1 + kWriters);
  assert(loaded.state.message_count() == kWriters);
  std::cout << "  racing writers saw " << conflicts.load() << " conflicts\n";
}

void VerifyRestart(Backend& backend, const std::string& stream) {
  auto app    = chatlog::factory::Build(backend.config);
  auto loaded = app.conversations->Load(stream);
  assert(loaded.state.status() == v1::CONVERSATION_STATUS_ARCHIVED);

  // Checkpoints survived, so nothing is replayed for this stream.
  auto tx   = app.repository->Begin();
  auto mark = app.repository->GetProjectionCheckpoint(*tx, app.projector->options().name, stream);
  tx->Commit();
  assert(mark.has_value() && mark->version == loaded.version);
}

void RunBackend(Backend& backend) {
  std::cout << "running backend: " << backend.name << "\n";
  std::string stream;
  {
    auto app = chatlog::factory::Build(backend.config);
    app.projector->Start();

    stream = RunConversation(app);
    VerifyCommandPipeline(app, stream);
    VerifyProjection(app, stream, app.conversations->Load(stream).state.conversation_id());
    VerifyForkAndArchive(app, stream);
    VerifyRacingWriters(app);

    app.projector->Stop();
  }

  if (backend.durable) VerifyRestart(backend, stream);
  backend.cleanup();
}

} // namespace

int main() {
  std::vector<Backend> backends;

  {
    RuntimeConfig config;
    config.mutable_database()->mutable_memory();
    backends.push_back({"memory", WithTestTimings(config)});
  }

#if CHATLOG_DB_SQLITE
  {
    const auto path = (std::filesystem::temp_directory_path() / ("chatlog_backends_" + std::to_string(chatlog::util::NowMs()) + ".db")).string();
    RuntimeConfig config;
    config.mutable_database()->mutable_sqlite()->set_path(path);
    backends.push_back({"sqlite", WithTestTimings(config), true, [path] {
                          std::filesystem::remove(path);
                          std::filesystem::remove(path + "-wal");
                          std::filesystem::remove(path + "-shm");
                        }});
  }
#endif

#if CHATLOG_DB_POSTGRES
  if (const char* uri = std::getenv("CHATLOG_TEST_POSTGRES_URI"); uri != nullptr && *uri != '\0') {
    RuntimeConfig config;
    config.mutable_database()->mutable_postgres()->set_connection_uri(uri);
    backends.push_back({"postgres", WithTestTimings(config), true});
  } else {
    std::cout << "skipping postgres backend: CHATLOG_TEST_POSTGRES_URI is not set\n";
  }
#endif

  for (auto& backend : backends) RunBackend(backend);

  std::cout << "chatlog_integration_event_store_backends: pass\n";
  return 0;
}
