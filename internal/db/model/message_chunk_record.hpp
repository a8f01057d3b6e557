#pragma once

#include <cstdint>
#include <string>

namespace chatlog::db::model {

// Unique on (message_id, chunk_index).
struct MessageChunkRecord {
  std::string id;
  std::string message_id;
  uint64_t    chunk_index         = 0;
  uint64_t    content_block_index = 0;
  std::string delta_type;
  std::string delta_text;
  uint64_t    created_at_ms = 0;
};

} // namespace chatlog::db::model
