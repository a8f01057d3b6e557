#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

namespace chatlog::util {

/*
  Central error types.

  Repository code reports db::Result codes; everything above it
  throws one of these.
*/

// Another writer appended to the stream first. Reload and retry.
class VersionConflict : public std::runtime_error {
 public:
  VersionConflict(const std::string& stream_id, uint64_t expected_version, const std::string& detail = {})
      : std::runtime_error("version conflict on " + stream_id + " at expected version " + std::to_string(expected_version) +
                           (detail.empty() ? std::string{} : ": " + detail)),
        stream_id_(stream_id),
        expected_version_(expected_version) {
  }

  const std::string& stream_id() const {
    return stream_id_;
  }

  uint64_t expected_version() const {
    return expected_version_;
  }

 private:
  std::string stream_id_;
  uint64_t    expected_version_;
};

// A business rule refused the command. Never retried.
class CommandRejected : public std::runtime_error {
 public:
  CommandRejected(std::string reason, const std::string& msg) : std::runtime_error(msg), reason_(std::move(reason)) {
  }

  // Stable machine-readable code, e.g. "conversation_archived".
  const std::string& reason() const {
    return reason_;
  }

 private:
  std::string reason_;
};

class StorageError : public std::runtime_error {
 public:
  explicit StorageError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidArgument : public std::runtime_error {
 public:
  explicit InvalidArgument(const std::string& msg) : std::runtime_error(msg) {
  }
};

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

// An event tag with no decoder. Indicates a programming error.
class UnknownEventType : public std::logic_error {
 public:
  explicit UnknownEventType(const std::string& event_type) : std::logic_error("unknown event type: " + event_type), event_type_(event_type) {
  }

  const std::string& event_type() const {
    return event_type_;
  }

 private:
  std::string event_type_;
};

} // namespace chatlog::util
