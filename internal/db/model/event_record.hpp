#pragma once

#include <cstdint>
#include <map>
#include <string>

namespace chatlog::db::model {

/*
  One row of the append-only event log.

  (stream_id, stream_version) is unique; rows are never updated.
*/
struct EventRecord {
  std::string                        id;
  std::string                        stream_id;
  uint64_t                           stream_version = 0;
  std::string                        event_type;
  std::string                        data; // JSON object
  std::map<std::string, std::string> metadata;
  uint64_t                           inserted_at_ms = 0;
};

} // namespace chatlog::db::model
