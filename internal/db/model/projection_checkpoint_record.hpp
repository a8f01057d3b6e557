#pragma once

#include <cstdint>
#include <string>

namespace chatlog::db::model {

// Last stream version a projector has applied for one stream.
struct ProjectionCheckpointRecord {
  std::string projector;
  std::string stream_id;
  uint64_t    version       = 0;
  uint64_t    updated_at_ms = 0;
};

} // namespace chatlog::db::model
