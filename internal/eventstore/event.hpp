#pragma once

#include <string>

#include "internal/db/model/event_record.hpp"
#include "internal/util/json.hpp"

namespace chatlog::eventstore {

// An event before it is appended: no id, version or timestamp yet.
struct EventData {
  std::string     event_type;
  std::string     data; // JSON object
  util::StringMap metadata;
};

// An event as read back from the log.
using StoredEvent = db::model::EventRecord;

} // namespace chatlog::eventstore
