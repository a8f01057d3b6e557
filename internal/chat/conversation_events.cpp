#include "internal/chat/conversation_events.hpp"

#include <unordered_map>

#include "internal/util/errors.hpp"
#include "internal/util/json.hpp"

namespace chatlog::chat {

namespace {

using Decoder = ConversationEvent (*)(const std::string& data);

template <typename T>
ConversationEvent DecodeAs(const std::string& data) {
  T message;
  util::JsonToMessage(data, &message);
  return message;
}

template <typename T>
std::string TypeName() {
  return std::string(T::descriptor()->name());
}

template <typename Variant>
struct DecoderTable;

// One entry per alternative, keyed by message name.
template <typename... Ts>
struct DecoderTable<std::variant<Ts...>> {
  static const std::unordered_map<std::string, Decoder>& Get() {
    static const std::unordered_map<std::string, Decoder> table = {{TypeName<Ts>(), &DecodeAs<Ts>}...};
    return table;
  }
};

const std::unordered_map<std::string, Decoder>& Decoders() {
  return DecoderTable<ConversationEvent>::Get();
}

} // namespace

std::string EventTypeOf(const ConversationEvent& event) {
  return std::visit([](const auto& message) { return std::string(message.GetDescriptor()->name()); }, event);
}

bool IsConversationEventType(const std::string& event_type) {
  return Decoders().contains(event_type);
}

eventstore::EventData Encode(const ConversationEvent& event) {
  return std::visit(
      [](const auto& message) {
        return eventstore::EventData{std::string(message.GetDescriptor()->name()), util::MessageToJson(message), {}};
      },
      event);
}

ConversationEvent Decode(const std::string& event_type, const std::string& data) {
  const auto& decoders = Decoders();
  const auto  it       = decoders.find(event_type);
  if (it == decoders.end()) throw util::UnknownEventType(event_type);
  return it->second(data);
}

} // namespace chatlog::chat
