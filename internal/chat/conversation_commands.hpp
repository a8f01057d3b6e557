#pragma once

#include <cstdint>
#include <string>
#include <variant>

#include <google/protobuf/struct.pb.h>

#include "chatlog/v1.hpp"
#include "internal/util/time.hpp"

namespace chatlog::chat {

/*
  Commands accepted by ConversationAggregate.

  `at` becomes the event timestamp; callers (normally
  ConversationService) stamp it so the aggregate stays clock-free.
*/

struct CreateConversation {
  static constexpr const char* kName = "CreateConversation";
  std::string     conversation_id;
  std::string     user_id;
  std::string     title;
  std::string     model_id;
  std::string     system_prompt;
  util::TimePoint at{};
};

// Issued against the new stream with the parent's state at fork_at_version.
struct ForkConversation {
  static constexpr const char* kName = "ForkConversation";
  std::string           new_conversation_id;
  std::string           parent_stream_id;
  uint64_t              fork_at_version = 0;
  v1::ConversationState parent;
  // Empty keeps the parent's title.
  std::string     title;
  util::TimePoint at{};
};

struct AddUserMessage {
  static constexpr const char* kName = "AddUserMessage";
  std::string     message_id;
  std::string     content;
  util::TimePoint at{};
};

struct StartAssistantStream {
  static constexpr const char* kName = "StartAssistantStream";
  std::string message_id;
  // Empty uses the conversation's model.
  std::string     model_id;
  util::TimePoint at{};
};

struct RecordAssistantChunk {
  static constexpr const char* kName = "RecordAssistantChunk";
  std::string     message_id;
  int32_t         chunk_index         = 0;
  int32_t         content_block_index = 0;
  std::string     delta_type;
  std::string     delta_text;
  util::TimePoint at{};
};

struct CompleteAssistantStream {
  static constexpr const char* kName = "CompleteAssistantStream";
  std::string     message_id;
  std::string     full_content;
  std::string     stop_reason;
  int32_t         input_tokens  = 0;
  int32_t         output_tokens = 0;
  int32_t         latency_ms    = 0;
  util::TimePoint at{};
};

// An empty message_id targets whatever message is streaming.
struct FailAssistantStream {
  static constexpr const char* kName = "FailAssistantStream";
  std::string     message_id;
  std::string     error_type;
  std::string     error_message;
  int32_t         retry_count = 0;
  util::TimePoint at{};
};

struct StartToolCall {
  static constexpr const char* kName = "StartToolCall";
  std::string                 message_id;
  std::string                 tool_use_id;
  std::string                 tool_name;
  google::protobuf::Struct    input;
  util::TimePoint             at{};
};

struct CompleteToolCall {
  static constexpr const char* kName = "CompleteToolCall";
  std::string                 message_id;
  std::string                 tool_use_id;
  std::string                 tool_name;
  google::protobuf::Struct    input;
  google::protobuf::Struct    output;
  int32_t                     duration_ms = 0;
  util::TimePoint             at{};
};

struct UpdateTitle {
  static constexpr const char* kName = "UpdateTitle";
  std::string     title;
  util::TimePoint at{};
};

struct ArchiveConversation {
  static constexpr const char* kName = "ArchiveConversation";
  util::TimePoint at{};
};

using ConversationCommand = std::variant<CreateConversation,
                                         ForkConversation,
                                         AddUserMessage,
                                         StartAssistantStream,
                                         RecordAssistantChunk,
                                         CompleteAssistantStream,
                                         FailAssistantStream,
                                         StartToolCall,
                                         CompleteToolCall,
                                         UpdateTitle,
                                         ArchiveConversation>;

inline std::string CommandName(const ConversationCommand& command) {
  return std::visit([](const auto& c) { return std::string(std::decay_t<decltype(c)>::kName); }, command);
}

// Stamps `at` on any command.
inline void SetCommandTime(ConversationCommand& command, util::TimePoint at) {
  std::visit([at](auto& c) { c.at = at; }, command);
}

} // namespace chatlog::chat
