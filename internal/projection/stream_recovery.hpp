#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <thread>

#include "internal/db/api/repository.hpp"

namespace chatlog::runtime::config {
class RecoveryConfig;
}

namespace chatlog::service {
class ConversationService;
}

namespace chatlog::projection {

inline constexpr const char* kStreamTimeout = "stream_timeout";

struct StreamRecoveryOptions {
  std::chrono::milliseconds sweep_interval{30000};
  // A conversation projected as streaming with no event for this long is stuck.
  std::chrono::milliseconds streaming_timeout{300000};
};

StreamRecoveryOptions StreamRecoveryOptionsFromConfig(const chatlog::runtime::config::RecoveryConfig& config);

/*
  StreamRecovery

  Periodic sweep that closes assistant streams whose writer went away.
  Candidates come from the read model; the close itself is a normal
  FailAssistantStream command, so a stream that moved on since the
  sweep read it turns into a no-op or a logged conflict that the next
  sweep retries.
*/
class StreamRecovery {
 public:
  StreamRecovery(std::shared_ptr<db::Repository> repository, std::shared_ptr<service::ConversationService> service,
                 StreamRecoveryOptions options = {});
  ~StreamRecovery();

  StreamRecovery(const StreamRecovery&)            = delete;
  StreamRecovery& operator=(const StreamRecovery&) = delete;

  void Start();
  void Stop();

  // Returns the number of streams closed.
  std::size_t SweepOnce();

 private:
  void Run();

  std::shared_ptr<db::Repository>               repository_;
  std::shared_ptr<service::ConversationService> service_;
  StreamRecoveryOptions                         options_;

  std::mutex              mutex_;
  std::condition_variable cv_;
  bool                    stopping_ = false;
  std::thread             thread_;
};

} // namespace chatlog::projection
