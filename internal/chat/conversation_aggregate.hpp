#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "chatlog/v1.hpp"
#include "internal/chat/conversation_commands.hpp"
#include "internal/chat/conversation_events.hpp"
#include "internal/eventstore/event.hpp"

namespace chatlog::chat {

// util::CommandRejected::reason() values.
namespace reasons {
inline constexpr const char* kConversationExists   = "conversation_exists";
inline constexpr const char* kConversationNotFound = "conversation_not_found";
inline constexpr const char* kConversationArchived = "conversation_archived";
inline constexpr const char* kStreamInProgress     = "stream_in_progress";
inline constexpr const char* kNotStreaming         = "not_streaming";
inline constexpr const char* kNoUserMessage        = "no_user_message";
inline constexpr const char* kMessageMismatch      = "message_mismatch";
inline constexpr const char* kUnknownToolCall      = "unknown_tool_call";
inline constexpr const char* kInvalidCommand       = "invalid_command";
} // namespace reasons

/*
  ConversationAggregate

  Lifecycle:

    unspecified -> created -> active <-> streaming
                                 \          |
                                  +--> archived (terminal)

  Streaming covers one assistant message from AssistantStreamStarted to
  AssistantStreamCompleted/Failed. Archiving while streaming first
  fails the open stream with error_type "conversation_archived".
*/
struct ConversationAggregate {
  using State   = v1::ConversationState;
  using Command = ConversationCommand;

  static constexpr std::string_view kSnapshotType = "ConversationState";

  static State Init();

  static State ApplyEvent(const State& state, const eventstore::StoredEvent& event);
  static State Apply(const State& state, const ConversationEvent& event);

  static std::vector<eventstore::EventData> HandleCommand(const State& state, const Command& command);

  static std::string SerializeState(const State& state);
  static State       DeserializeState(const std::string& data);
};

} // namespace chatlog::chat
