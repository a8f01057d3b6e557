#include "internal/eventstore/event_store.hpp"

#include <atomic>
#include <cassert>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/eventstore/snapshot_store.hpp"
#include "internal/util/errors.hpp"

namespace {

using chatlog::eventstore::EventBus;
using chatlog::eventstore::EventData;
using chatlog::eventstore::EventStore;
using chatlog::eventstore::SnapshotStore;
using chatlog::eventstore::StoredEvent;

struct Fixture {
  std::shared_ptr<chatlog::db::memory::MemoryRepository> repository = std::make_shared<chatlog::db::memory::MemoryRepository>();
  std::shared_ptr<EventBus>                              bus        = std::make_shared<EventBus>();
  std::shared_ptr<EventStore>                            store      = std::make_shared<EventStore>(repository, bus);
};

EventData Event(const std::string& type, const std::string& data = "{}") {
  return EventData{type, data, {{"command", "Test"}}};
}

// A fresh stream starts at 1; a stale expected version is refused.
void TestAppendAssignsVersionsAndRejectsStaleWriters() {
  Fixture f;

  auto stored = f.store->Append("s1", 0, {Event("ConversationCreated"), Event("UserMessageAdded")});
  assert(stored.size() == 2);
  assert(stored[0].stream_version == 1);
  assert(stored[1].stream_version == 2);
  assert(!stored[0].id.empty());
  assert(stored[0].metadata.at("command") == "Test");
  assert(f.store->CurrentVersion("s1") == 2);

  bool threw = false;
  try {
    f.store->Append("s1", 0, {Event("UserMessageAdded")});
  } catch (const chatlog::util::VersionConflict& e) {
    threw = true;
    assert(e.stream_id() == "s1");
    assert(e.expected_version() == 0);
  }
  assert(threw);

  // Nothing from the rejected batch was stored.
  assert(f.store->CurrentVersion("s1") == 2);
  assert(f.store->ReadForward("s1").size() == 2);
}

void TestVersionsAreGapless() {
  Fixture f;

  uint64_t expected = 0;
  for (int i = 0; i < 5; ++i) {
    auto stored = f.store->Append("conversation-g", expected, {Event("A"), Event("B")});
    expected    = stored.back().stream_version;
  }

  auto all = f.store->ReadForward("conversation-g");
  assert(all.size() == 10);
  for (size_t i = 0; i < all.size(); ++i) assert(all[i].stream_version == i + 1);

  auto tail = f.store->ReadForward("conversation-g", 8);
  assert(tail.size() == 3 && tail.front().stream_version == 8);

  auto page = f.store->ReadForward("conversation-g", 3, 2);
  assert(page.size() == 2 && page.back().stream_version == 4);
}

void TestEmptyAppendIsNoop() {
  Fixture f;
  int     published = 0;
  auto    sub       = f.bus->Subscribe("", [&](const std::string&, const std::vector<StoredEvent>&) { ++published; });

  assert(f.store->Append("s-empty", 0, {}).empty());
  assert(f.store->CurrentVersion("s-empty") == 0);
  assert(published == 0);
}

void TestPublishesOnceAfterCommit() {
  Fixture f;

  std::vector<std::vector<StoredEvent>> batches;
  auto sub = f.bus->Subscribe("conversation-", [&](const std::string& stream_id, const std::vector<StoredEvent>& events) {
    assert(stream_id == "conversation-p");
    // Committed before publication.
    assert(f.store->CurrentVersion(stream_id) == events.back().stream_version);
    batches.push_back(events);
  });

  f.store->Append("conversation-p", 0, {Event("A"), Event("B")});
  f.store->Append("conversation-p", 2, {Event("C")});

  try {
    f.store->Append("conversation-p", 1, {Event("D")});
  } catch (const chatlog::util::VersionConflict&) {
  }

  assert(batches.size() == 2);
  assert(batches[0].size() == 2);
  assert(batches[1].front().stream_version == 3);
}

void TestEmptyStreamIdIsRejected() {
  Fixture f;
  bool    threw = false;
  try {
    f.store->Append("", 0, {Event("A")});
  } catch (const chatlog::util::InvalidArgument&) {
    threw = true;
  }
  assert(threw);
}

void TestConcurrentAppendsSameExpectedVersion() {
  Fixture f;

  constexpr int    kWriters = 8;
  std::atomic<int> succeeded{0};
  std::atomic<int> conflicted{0};

  std::vector<std::thread> writers;
  for (int i = 0; i < kWriters; ++i) {
    writers.emplace_back([&, i] {
      try {
        f.store->Append("conversation-race", 0, {Event("W" + std::to_string(i))});
        ++succeeded;
      } catch (const chatlog::util::VersionConflict&) {
        ++conflicted;
      }
    });
  }
  for (auto& writer : writers) writer.join();

  assert(succeeded == 1);
  assert(conflicted == kWriters - 1);
  assert(f.store->CurrentVersion("conversation-race") == 1);
}

void TestListStreamsAndKind() {
  Fixture f;
  f.store->Append("conversation-a", 0, {Event("A"), Event("B")});
  f.store->Append("conversation-b", 0, {Event("A")});
  f.store->Append("invoice-c", 0, {Event("A")});

  auto heads = f.store->ListStreams("conversation-");
  assert(heads.size() == 2);
  for (const auto& head : heads) {
    assert(head.version == (head.stream_id == "conversation-a" ? 2u : 1u));
  }

  assert(chatlog::eventstore::StreamKind("conversation-1234-5678") == "conversation");
  assert(chatlog::eventstore::StreamKind("plain") == "plain");
}

void TestSnapshotStore() {
  Fixture       f;
  SnapshotStore snapshots(f.repository);

  assert(!snapshots.Latest("s1").has_value());

  snapshots.Save("s1", 2, "ConversationState", R"({"title":"a"})");
  snapshots.Save("s1", 4, "ConversationState", R"({"title":"b"})");
  // Same version again is success.
  snapshots.Save("s1", 4, "ConversationState", R"({"title":"b"})");

  auto latest = snapshots.Latest("s1");
  assert(latest.has_value());
  assert(latest->stream_version == 4);
  assert(latest->snapshot_type == "ConversationState");
}

} // namespace

int main() {
  TestAppendAssignsVersionsAndRejectsStaleWriters();
  TestVersionsAreGapless();
  TestEmptyAppendIsNoop();
  TestPublishesOnceAfterCommit();
  TestEmptyStreamIdIsRejected();
  TestConcurrentAppendsSameExpectedVersion();
  TestListStreamsAndKind();
  TestSnapshotStore();

  std::cout << "chatlog_unit_event_store: pass\n";
  return 0;
}
