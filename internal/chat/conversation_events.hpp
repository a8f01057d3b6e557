#pragma once

#include <string>
#include <variant>

#include "chatlog/v1.hpp"
#include "internal/eventstore/event.hpp"

namespace chatlog::chat {

/*
  Every event the conversation aggregate records.

  The stored event_type is the protobuf message name and the payload is
  the message as JSON with its proto field names.
*/
using ConversationEvent = std::variant<v1::ConversationCreated,
                                       v1::ConversationForked,
                                       v1::UserMessageAdded,
                                       v1::AssistantStreamStarted,
                                       v1::AssistantChunkReceived,
                                       v1::AssistantStreamCompleted,
                                       v1::AssistantStreamFailed,
                                       v1::ToolCallStarted,
                                       v1::ToolCallCompleted,
                                       v1::ConversationTitleUpdated,
                                       v1::ConversationArchived>;

std::string EventTypeOf(const ConversationEvent& event);

bool IsConversationEventType(const std::string& event_type);

eventstore::EventData Encode(const ConversationEvent& event);

// Throws util::UnknownEventType for a tag outside ConversationEvent and
// util::InvalidArgument for a payload that is not valid JSON.
ConversationEvent Decode(const std::string& event_type, const std::string& data);

inline ConversationEvent Decode(const eventstore::StoredEvent& event) {
  return Decode(event.event_type, event.data);
}

} // namespace chatlog::chat
