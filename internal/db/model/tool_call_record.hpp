#pragma once

#include <cstdint>
#include <string>

namespace chatlog::db::model {

/*
  Read-side row in `tool_calls`, unique on (message_id, tool_use_id).

  input/output are JSON objects; status is "started" | "completed".
*/
struct ToolCallRecord {
  std::string id;
  std::string message_id;
  std::string tool_use_id;
  std::string tool_name;
  std::string input;
  std::string output;
  std::string status;
  uint64_t    duration_ms   = 0;
  uint64_t    created_at_ms = 0;
  uint64_t    updated_at_ms = 0;
};

} // namespace chatlog::db::model
