#include "internal/projection/stream_recovery.hpp"

#include "config/config.pb.h"
#include "internal/observability/logging.hpp"
#include "internal/projection/conversation_projection.hpp"
#include "internal/service/conversation_service.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace chatlog::projection {

using observability::StringField;

StreamRecoveryOptions StreamRecoveryOptionsFromConfig(const chatlog::runtime::config::RecoveryConfig& config) {
  StreamRecoveryOptions options;
  if (config.sweep_interval_ms() > 0) options.sweep_interval = std::chrono::milliseconds(config.sweep_interval_ms());
  if (config.streaming_timeout_ms() > 0) options.streaming_timeout = std::chrono::milliseconds(config.streaming_timeout_ms());
  return options;
}

StreamRecovery::StreamRecovery(std::shared_ptr<db::Repository> repository, std::shared_ptr<service::ConversationService> service,
                               StreamRecoveryOptions options)
    : repository_(std::move(repository)), service_(std::move(service)), options_(options) {
  if (!repository_ || !service_) throw std::invalid_argument("StreamRecovery requires a repository and a service");
}

StreamRecovery::~StreamRecovery() {
  Stop();
}

void StreamRecovery::Start() {
  if (thread_.joinable()) return;
  {
    std::lock_guard lock(mutex_);
    stopping_ = false;
  }
  thread_ = std::thread(&StreamRecovery::Run, this);
}

void StreamRecovery::Stop() {
  {
    std::lock_guard lock(mutex_);
    stopping_ = true;
  }
  cv_.notify_all();
  if (thread_.joinable()) thread_.join();
}

void StreamRecovery::Run() {
  std::unique_lock lock(mutex_);
  while (!stopping_) {
    if (cv_.wait_for(lock, options_.sweep_interval, [&] { return stopping_; })) break;

    lock.unlock();
    try {
      SweepOnce();
    } catch (const std::exception& e) {
      CHATLOG_LOG_ERROR("recovery sweep failed", {StringField("error", e.what())});
    }
    lock.lock();
  }
}

std::size_t StreamRecovery::SweepOnce() {
  const auto now    = util::NowMs();
  const auto window = static_cast<uint64_t>(options_.streaming_timeout.count());
  const auto cutoff = now > window ? now - window : 0;

  std::vector<db::model::ConversationRecord> stuck;
  {
    auto tx = repository_->Begin();
    stuck   = repository_->ListConversationsByStatus(*tx, kConversationStreaming, cutoff);
    tx->Commit();
  }

  std::size_t recovered = 0;
  for (const auto& conversation : stuck) {
    try {
      if (service_->RecoverStream(conversation.stream_id, kStreamTimeout)) ++recovered;
    } catch (const util::VersionConflict& e) {
      CHATLOG_LOG_WARN("recovery lost a race; retrying next sweep", {StringField("stream_id", conversation.stream_id), StringField("error", e.what())});
    } catch (const util::CommandRejected& e) {
      CHATLOG_LOG_WARN("recovery rejected", {StringField("stream_id", conversation.stream_id), StringField("reason", e.reason())});
    } catch (const std::exception& e) {
      CHATLOG_LOG_ERROR("recovery failed", {StringField("stream_id", conversation.stream_id), StringField("error", e.what())});
    }
  }

  if (!stuck.empty()) {
    CHATLOG_LOG_INFO("recovery sweep done", {observability::IntField("candidates", static_cast<int64_t>(stuck.size())),
                                             observability::IntField("recovered", static_cast<int64_t>(recovered))});
  }
  return recovered;
}

} // namespace chatlog::projection
