#include "conversation_service.hpp"

#include <chrono>
#include <string_view>
#include <type_traits>

#include "internal/eventstore/event_store.hpp"
#include "internal/eventstore/snapshot_store.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"

namespace chatlog::service {

namespace {

double ElapsedMs(std::chrono::steady_clock::time_point started_at) {
  return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_at).count();
}

template <typename Fn>
auto ObserveCommand(std::string_view command, const std::string& stream_id, Fn&& fn) {
  observability::SpanScope span(command);
  span.SetAttribute("chatlog.stream_id", stream_id);

  auto&      metrics    = observability::Metrics::Instance();
  const auto started_at = std::chrono::steady_clock::now();

  auto fail = [&](std::string_view outcome, const std::exception& ex) {
    span.RecordException(ex.what());
    CHATLOG_LOG_ERROR("command failed", {observability::StringField("command", command), observability::StringField("stream_id", stream_id),
                                         observability::StringField("outcome", outcome), observability::StringField("error", ex.what())});
    metrics.RecordCommand(command, outcome);
    metrics.ObserveCommandLatencyMs(command, ElapsedMs(started_at));
  };

  try {
    auto result = fn();
    if constexpr (std::is_same_v<std::decay_t<decltype(result)>, ExecutedConversation>) {
      metrics.RecordCommand(command, result.events.empty() ? "noop" : "ok");
      span.SetAttribute("chatlog.version", static_cast<std::int64_t>(result.version));
    } else {
      metrics.RecordCommand(command, "ok");
    }
    metrics.ObserveCommandLatencyMs(command, ElapsedMs(started_at));
    return result;
  } catch (const util::VersionConflict& ex) {
    fail("conflict", ex);
    throw;
  } catch (const util::CommandRejected& ex) {
    fail("rejected", ex);
    throw;
  } catch (const std::exception& ex) {
    fail("error", ex);
    throw;
  }
}

util::StringMap CommandMetadata(const std::string& command, const std::string& correlation_id) {
  return {{"command", command}, {"correlation_id", correlation_id.empty() ? util::NewId() : correlation_id}};
}

void RequireStream(const std::string& stream_id) {
  if (stream_id.empty()) throw util::InvalidArgument("stream_id must not be empty");
}

} // namespace

std::string ConversationStreamId(const std::string& conversation_id) {
  return kConversationStreamPrefix + conversation_id;
}

ConversationService::ConversationService(ServiceContext ctx) : ctx_(std::move(ctx)), loader_(ctx_.events, ctx_.snapshots, ctx_.loader) {
  if (!ctx_.events) throw std::invalid_argument("ConversationService requires an event store");
}

ExecutedConversation ConversationService::Create(const NewConversation& request, const std::string& correlation_id) {
  chat::CreateConversation command;
  command.conversation_id = util::NewId();
  command.user_id         = request.user_id;
  command.title           = request.title;
  command.model_id        = request.model_id;
  command.system_prompt   = request.system_prompt;

  return Execute(ConversationStreamId(command.conversation_id), std::move(command), correlation_id);
}

ExecutedConversation ConversationService::Fork(const std::string& parent_stream_id, uint64_t fork_at_version, const std::string& title,
                                               const std::string& correlation_id) {
  RequireStream(parent_stream_id);

  chat::ForkConversation command;
  command.new_conversation_id = util::NewId();
  command.parent_stream_id    = parent_stream_id;
  command.fork_at_version     = fork_at_version;
  command.title               = title;
  command.at                  = util::Now();

  const auto stream_id = ConversationStreamId(command.new_conversation_id);

  return ObserveCommand(chat::ForkConversation::kName, stream_id, [&] {
    if (fork_at_version == 0) throw util::InvalidArgument("fork_at_version must be at least 1");

    auto parent = loader_.LoadAt(parent_stream_id, fork_at_version);
    if (parent.state.status() == v1::CONVERSATION_STATUS_UNSPECIFIED) {
      throw util::CommandRejected(chat::reasons::kConversationNotFound, "no conversation on " + parent_stream_id);
    }
    if (parent.version < fork_at_version) {
      throw util::InvalidArgument("fork_at_version " + std::to_string(fork_at_version) + " is beyond " + parent_stream_id + " head " +
                                  std::to_string(parent.version));
    }
    command.parent = std::move(parent.state);

    return loader_.Execute(stream_id, chat::ConversationCommand{std::move(command)}, CommandMetadata(chat::ForkConversation::kName, correlation_id));
  });
}

ExecutedConversation ConversationService::Execute(const std::string& stream_id, chat::ConversationCommand command, const std::string& correlation_id) {
  const auto name = chat::CommandName(command);
  chat::SetCommandTime(command, util::Now());

  return ObserveCommand(name, stream_id, [&] {
    RequireStream(stream_id);
    return loader_.Execute(stream_id, command, CommandMetadata(name, correlation_id));
  });
}

LoadedConversation ConversationService::Load(const std::string& stream_id) {
  return ObserveCommand("Load", stream_id, [&] {
    RequireStream(stream_id);
    return loader_.Load(stream_id);
  });
}

LoadedConversation ConversationService::LoadAt(const std::string& stream_id, uint64_t version) {
  return ObserveCommand("LoadAt", stream_id, [&] {
    RequireStream(stream_id);
    return loader_.LoadAt(stream_id, version);
  });
}

bool ConversationService::RecoverStream(const std::string& stream_id, const std::string& error_type) {
  const auto loaded = Load(stream_id);
  if (loaded.state.status() != v1::CONVERSATION_STATUS_STREAMING) return false;

  chat::FailAssistantStream command;
  command.message_id    = loaded.state.streaming_message_id();
  command.error_type    = error_type;
  command.error_message = "assistant stream closed by recovery";

  const auto result = Execute(stream_id, std::move(command));
  if (result.events.empty()) return false;

  observability::Metrics::Instance().RecordRecoveredStream(error_type);
  CHATLOG_LOG_WARN("recovered stuck stream", {observability::StringField("stream_id", stream_id),
                                              observability::StringField("message_id", loaded.state.streaming_message_id()),
                                              observability::StringField("reason", error_type)});
  return true;
}

} // namespace chatlog::service
