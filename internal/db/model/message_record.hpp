#pragma once

#include <cstdint>
#include <string>

namespace chatlog::db::model {

/*
  Read-side row in `messages`.

  role:   "user" | "assistant"
  status: "complete" | "streaming" | "failed"
  position is 1-based within the conversation and fixed at first insert.
*/
struct MessageRecord {
  std::string id;
  std::string conversation_id;
  std::string role;
  std::string content;
  std::string status;
  std::string model_id;
  std::string stop_reason;
  uint64_t    input_tokens   = 0;
  uint64_t    output_tokens  = 0;
  uint64_t    total_tokens   = 0;
  uint64_t    latency_ms     = 0;
  uint64_t    stream_version = 0;
  uint64_t    position       = 0;
  uint64_t    created_at_ms  = 0;
  uint64_t    updated_at_ms  = 0;
};

} // namespace chatlog::db::model
