#pragma once

#include <cstdint>
#include <string>

#include "chatlog/v1.hpp"
#include "internal/aggregate/loader.hpp"
#include "internal/chat/conversation_aggregate.hpp"
#include "service_context.hpp"

namespace chatlog::service {

inline constexpr const char* kConversationStreamPrefix = "conversation-";

std::string ConversationStreamId(const std::string& conversation_id);

using ConversationLoader   = aggregate::Loader<chat::ConversationAggregate>;
using LoadedConversation   = aggregate::Loaded<v1::ConversationState>;
using ExecutedConversation = aggregate::Executed<v1::ConversationState>;

struct NewConversation {
  std::string user_id;
  std::string title;
  std::string model_id;
  std::string system_prompt;
};

/*
  ConversationService

  Typed entry points over the command pipeline for conversations.

  Every call stamps the command time, tags appended events with
  {command, correlation_id} metadata and is wrapped in a span plus
  command metrics. Failures are logged and rethrown unchanged:

    util::VersionConflict   stream moved; reload and retry
    util::CommandRejected   business rule refused the command
    util::InvalidArgument   malformed request
    util::StorageError      backend failure or timeout

  An empty correlation id is replaced by a fresh UUID.
*/
class ConversationService {
 public:
  explicit ConversationService(ServiceContext ctx);

  // Mints the conversation id; the stream is ConversationStreamId(id).
  ExecutedConversation Create(const NewConversation& request, const std::string& correlation_id = {});

  // New conversation holding the parent's history as of fork_at_version.
  ExecutedConversation Fork(const std::string& parent_stream_id, uint64_t fork_at_version, const std::string& title = {},
                            const std::string& correlation_id = {});

  ExecutedConversation Execute(const std::string& stream_id, chat::ConversationCommand command, const std::string& correlation_id = {});

  LoadedConversation Load(const std::string& stream_id);
  LoadedConversation LoadAt(const std::string& stream_id, uint64_t version);

  // Fails the open assistant stream, if any. False when nothing was streaming.
  bool RecoverStream(const std::string& stream_id, const std::string& error_type);

 private:
  ServiceContext     ctx_;
  ConversationLoader loader_;
};

} // namespace chatlog::service
