#pragma once

#include <cstdint>
#include <string>

namespace chatlog::db::model {

struct SnapshotRecord {
  std::string id;
  std::string stream_id;
  uint64_t    stream_version = 0;
  std::string snapshot_type;
  std::string data; // JSON object
  uint64_t    inserted_at_ms = 0;
};

} // namespace chatlog::db::model
