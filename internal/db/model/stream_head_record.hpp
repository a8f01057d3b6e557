#pragma once

#include <cstdint>
#include <string>

namespace chatlog::db::model {

struct StreamHeadRecord {
  std::string stream_id;
  uint64_t    version = 0;
};

} // namespace chatlog::db::model
