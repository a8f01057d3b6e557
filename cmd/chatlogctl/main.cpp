#include <cstdint>
#include <iostream>
#include <optional>
#include <string>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/json.hpp"
#include "internal/util/uuid.hpp"

using chatlog::factory::Application;

static void Usage() {
  std::cout << "Usage:\n"
            << "  chatlogctl <config.yaml> create <user_id> [title] [model_id]\n"
            << "  chatlogctl <config.yaml> say <stream_id> <text>\n"
            << "  chatlogctl <config.yaml> archive <stream_id>\n"
            << "  chatlogctl <config.yaml> fork <parent_stream_id> <version> [title]\n"
            << "  chatlogctl <config.yaml> show <stream_id>\n"
            << "  chatlogctl <config.yaml> events <stream_id> [from_version] [max_count]\n"
            << "  chatlogctl <config.yaml> snapshot <stream_id> [save]\n"
            << "  chatlogctl <config.yaml> conversation <stream_id>\n"
            << "  chatlogctl <config.yaml> project\n"
            << "  chatlogctl <config.yaml> recover\n";
}

static void PrintExecuted(const chatlog::service::ExecutedConversation& result) {
  std::cout << "version=" << result.version << "\n";
  std::cout << "appended=" << result.events.size() << "\n";
}

static int Run(Application& app, const std::string& cmd, int argc, char** argv) {
  // ------------------------------------------------------------

  if (cmd == "create") {
    if (argc < 4) return 1;

    chatlog::service::NewConversation request;
    request.user_id  = argv[3];
    request.title    = argc >= 5 ? argv[4] : "";
    request.model_id = argc >= 6 ? argv[5] : "";

    auto result = app.conversations->Create(request);
    std::cout << "conversation_id=" << result.state.conversation_id() << "\n";
    std::cout << "stream_id=" << chatlog::service::ConversationStreamId(result.state.conversation_id()) << "\n";
    PrintExecuted(result);
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "say") {
    if (argc < 5) return 1;

    chatlog::chat::AddUserMessage command;
    command.message_id = chatlog::util::NewId();
    command.content    = argv[4];

    auto result = app.conversations->Execute(argv[3], std::move(command));
    std::cout << "message_id=" << result.state.last_user_message_id() << "\n";
    PrintExecuted(result);
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "archive") {
    if (argc < 4) return 1;

    PrintExecuted(app.conversations->Execute(argv[3], chatlog::chat::ArchiveConversation{}));
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "fork") {
    if (argc < 5) return 1;

    auto result = app.conversations->Fork(argv[3], std::stoull(argv[4]), argc >= 6 ? argv[5] : "");
    std::cout << "conversation_id=" << result.state.conversation_id() << "\n";
    std::cout << "stream_id=" << chatlog::service::ConversationStreamId(result.state.conversation_id()) << "\n";
    PrintExecuted(result);
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "show") {
    if (argc < 4) return 1;

    auto loaded = app.conversations->Load(argv[3]);
    std::cout << "version=" << loaded.version << "\n";
    std::cout << chatlog::util::MessageToJson(loaded.state) << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "events") {
    if (argc < 4) return 1;

    const uint64_t from = argc >= 5 ? std::stoull(argv[4]) : 1;
    std::optional<uint64_t> max_count;
    if (argc >= 6) max_count = std::stoull(argv[5]);

    for (const auto& event : app.events->ReadForward(argv[3], from, max_count)) {
      std::cout << event.stream_version << " " << event.event_type << " " << event.data << " "
                << chatlog::util::StringMapToJson(event.metadata) << "\n";
    }
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "snapshot") {
    if (argc < 4) return 1;

    if (argc >= 5 && std::string(argv[4]) == "save") {
      auto loaded = app.conversations->Load(argv[3]);
      if (loaded.version == 0) {
        std::cerr << "stream has no events\n";
        return 2;
      }
      app.snapshots->Save(argv[3], loaded.version, std::string(chatlog::chat::ConversationAggregate::kSnapshotType),
                          chatlog::chat::ConversationAggregate::SerializeState(loaded.state));
    }

    auto snapshot = app.snapshots->Latest(argv[3]);
    if (!snapshot) {
      std::cout << "no snapshot\n";
      return 0;
    }
    std::cout << "version=" << snapshot->stream_version << "\n";
    std::cout << "type=" << snapshot->snapshot_type << "\n";
    std::cout << snapshot->data << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "conversation") {
    if (argc < 4) return 1;

    auto tx           = app.repository->Begin();
    auto conversation = app.repository->GetConversationByStream(*tx, argv[3]);
    if (!conversation) {
      std::cerr << "not projected: " << argv[3] << "\n";
      return 2;
    }

    std::cout << "id=" << conversation->id << "\n";
    std::cout << "status=" << conversation->status << "\n";
    std::cout << "title=" << conversation->title << "\n";
    std::cout << "message_count=" << conversation->message_count << "\n";
    if (!conversation->parent_conversation_id.empty()) {
      std::cout << "parent=" << conversation->parent_conversation_id << "@" << conversation->fork_at_version << "\n";
    }
    for (const auto& message : app.repository->ListMessages(*tx, conversation->id)) {
      std::cout << message.position << " " << message.role << " [" << message.status << "] " << message.content << "\n";
    }
    tx->Commit();
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "project") {
    std::cout << "projected=" << app.projector->CatchUp() << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "recover") {
    std::cout << "recovered=" << app.recovery->SweepOnce() << "\n";
    return 0;
  }

  return 1;
}

int main(int argc, char** argv) {
  if (argc < 3) {
    Usage();
    return 1;
  }

  const std::string config_path = argv[1];
  const std::string cmd         = argv[2];

  try {
    auto config = chatlog::config::ConfigLoader::LoadFromYaml(config_path);
    chatlog::observability::InitializeLogging(config, chatlog::observability::LogSink::kStderr);

    auto      app = chatlog::factory::Build(config);
    const int rc  = Run(app, cmd, argc, argv);
    if (rc == 1) Usage();

    chatlog::observability::ShutdownLogging();
    return rc;
  } catch (const chatlog::util::CommandRejected& e) {
    std::cerr << "rejected (" << e.reason() << "): " << e.what() << "\n";
  } catch (const chatlog::util::VersionConflict& e) {
    std::cerr << "conflict: " << e.what() << "\n";
  } catch (const std::exception& e) {
    std::cerr << e.what() << "\n";
  }

  chatlog::observability::ShutdownLogging();
  return 2;
}
