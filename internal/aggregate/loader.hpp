#pragma once

#include <algorithm>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/aggregate/aggregate.hpp"
#include "internal/eventstore/event_store.hpp"
#include "internal/eventstore/snapshot_store.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/json.hpp"

namespace chatlog::runtime::config {
class LoaderConfig;
}

namespace chatlog::aggregate {

struct LoaderOptions {
  // Events per ReadForward page. Load keeps paging until a short page.
  uint32_t page_size = 10000;
  // Snapshot whenever an append crosses a multiple of this. 0 = never.
  uint32_t snapshot_every = 0;
};

LoaderOptions LoaderOptionsFromConfig(const chatlog::runtime::config::LoaderConfig& config);

template <typename State>
struct Loaded {
  State    state;
  uint64_t version = 0;
};

template <typename State>
struct Executed {
  State                                 state;
  uint64_t                              version = 0;
  std::vector<eventstore::StoredEvent> events;
};

/*
  Loader

  Stateless command pipeline for one aggregate type:

    Load     latest snapshot (if usable) + replay of the tail
    LoadAt   the same, stopping at a given version
    Execute  Load, decide, Append at the loaded version, fold

  No locks are taken. Two concurrent Execute calls on one stream race
  at Append; the loser gets util::VersionConflict, which is not
  retried here.
*/
template <Aggregate A>
class Loader {
 public:
  using State   = typename A::State;
  using Command = typename A::Command;

  Loader(std::shared_ptr<eventstore::EventStore> events, std::shared_ptr<eventstore::SnapshotStore> snapshots, LoaderOptions options = {})
      : events_(std::move(events)), snapshots_(std::move(snapshots)), options_(options) {
    if (options_.page_size == 0) options_.page_size = LoaderOptions{}.page_size;
  }

  Loaded<State> Load(const std::string& stream_id) {
    return Restore(stream_id, std::nullopt);
  }

  // State as of `version`. Returns the stream head if it is lower.
  Loaded<State> LoadAt(const std::string& stream_id, uint64_t version) {
    return Restore(stream_id, version);
  }

  Executed<State> Execute(const std::string& stream_id, const Command& command, const util::StringMap& metadata = {}) {
    auto loaded = Load(stream_id);
    auto events = A::HandleCommand(loaded.state, command);
    if (events.empty()) {
      return {std::move(loaded.state), loaded.version, {}};
    }

    for (auto& event : events) {
      for (const auto& [key, value] : metadata) event.metadata.emplace(key, value);
    }

    auto stored = events_->Append(stream_id, loaded.version, events);

    State state = std::move(loaded.state);
    for (const auto& event : stored) state = A::ApplyEvent(state, event);
    const uint64_t version = stored.back().stream_version;

    MaybeSnapshot(stream_id, loaded.version, version, state);
    return {std::move(state), version, std::move(stored)};
  }

  const LoaderOptions& options() const {
    return options_;
  }

 private:
  Loaded<State> Restore(const std::string& stream_id, std::optional<uint64_t> upto) {
    Loaded<State> loaded{A::Init(), 0};
    if (upto && *upto == 0) return loaded;

    if (snapshots_) {
      if (auto snapshot = snapshots_->Latest(stream_id)) {
        if (snapshot->snapshot_type != A::kSnapshotType) {
          CHATLOG_LOG_WARN("ignoring snapshot of another type",
                           {observability::StringField("stream_id", stream_id), observability::StringField("snapshot_type", snapshot->snapshot_type)});
        } else if (!upto || snapshot->stream_version <= *upto) {
          try {
            loaded.state   = A::DeserializeState(snapshot->data);
            loaded.version = snapshot->stream_version;
          } catch (const std::exception& e) {
            CHATLOG_LOG_WARN("ignoring undecodable snapshot",
                             {observability::StringField("stream_id", stream_id), observability::StringField("error", e.what())});
            loaded = {A::Init(), 0};
          }
        }
      }
    }

    for (;;) {
      uint64_t limit = options_.page_size;
      if (upto) {
        if (loaded.version >= *upto) break;
        limit = std::min<uint64_t>(limit, *upto - loaded.version);
      }

      const auto page = events_->ReadForward(stream_id, loaded.version + 1, limit);
      for (const auto& event : page) {
        loaded.state   = A::ApplyEvent(loaded.state, event);
        loaded.version = event.stream_version;
      }
      if (page.size() < limit) break;
    }

    return loaded;
  }

  void MaybeSnapshot(const std::string& stream_id, uint64_t before, uint64_t after, const State& state) {
    const uint64_t every = options_.snapshot_every;
    if (every == 0 || !snapshots_ || after / every == before / every) return;

    try {
      snapshots_->Save(stream_id, after, std::string(A::kSnapshotType), A::SerializeState(state));
    } catch (const std::exception& e) {
      CHATLOG_LOG_WARN("snapshot save failed",
                       {observability::StringField("stream_id", stream_id), observability::IntField("version", static_cast<int64_t>(after)),
                        observability::StringField("error", e.what())});
    }
  }

  std::shared_ptr<eventstore::EventStore>    events_;
  std::shared_ptr<eventstore::SnapshotStore> snapshots_;
  LoaderOptions                              options_;
};

} // namespace chatlog::aggregate
