#pragma once

#include <cstdint>
#include <string>

namespace chatlog::db::model {

/*
  Read-side row in `conversations`. Owned by the projector.

  status: "active" | "streaming" | "archived"
*/
struct ConversationRecord {
  std::string id;
  std::string stream_id;
  std::string user_id;
  std::string title;
  std::string model_id;
  std::string system_prompt;
  std::string status;
  std::string parent_conversation_id;
  uint64_t    fork_at_version    = 0;
  uint64_t    message_count      = 0;
  uint64_t    last_message_at_ms = 0;
  uint64_t    created_at_ms      = 0;
  uint64_t    updated_at_ms      = 0;
};

} // namespace chatlog::db::model
