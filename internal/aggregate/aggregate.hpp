#pragma once

#include <concepts>
#include <string>
#include <string_view>
#include <vector>

#include "internal/eventstore/event.hpp"

namespace chatlog::aggregate {

/*
  Aggregate contract.

  An aggregate is a set of pure static functions over a State value:

    Init()                    zero state before the first event
    ApplyEvent(state, event)  fold one stored event; throws
                              util::UnknownEventType for a tag it
                              does not know
    HandleCommand(state, cmd) decide; an empty result means "valid,
                              nothing to record". Business rule
                              violations throw util::CommandRejected
    SerializeState / DeserializeState
                              snapshot codec, tagged kSnapshotType

  No I/O and no clocks: timestamps arrive inside commands.
*/
template <typename A>
concept Aggregate = requires(const typename A::State& state, const eventstore::StoredEvent& event,
                             const typename A::Command& command, const std::string& data) {
  { A::kSnapshotType } -> std::convertible_to<std::string_view>;
  { A::Init() } -> std::same_as<typename A::State>;
  { A::ApplyEvent(state, event) } -> std::same_as<typename A::State>;
  { A::HandleCommand(state, command) } -> std::same_as<std::vector<eventstore::EventData>>;
  { A::SerializeState(state) } -> std::same_as<std::string>;
  { A::DeserializeState(data) } -> std::same_as<typename A::State>;
};

} // namespace chatlog::aggregate
