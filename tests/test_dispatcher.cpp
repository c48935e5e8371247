#include "pollcast/codec.hpp"
#include "pollcast/dispatcher.hpp"

#include <algorithm>
#include <atomic>
#include <mutex>
#include <numeric>
#include <random>
#include <string>
#include <thread>
#include <vector>

#include <catch2/catch_test_macros.hpp>

using namespace pollcast;

namespace {

class RecordingChannel final : public Channel {
 public:
  expected<void, ErrorCode> send(std::string_view payload) override {
    std::lock_guard<std::mutex> lock(mutex_);
    frames_.emplace_back(payload);
    return expected<void, ErrorCode>::success();
  }
  void close() override { closed = true; }

  std::vector<Json::Value> frames() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Json::Value> out;
    for (const auto& f : frames_) out.push_back(codec::parse(f).value());
    return out;
  }

  std::vector<Json::Value> of_type(const std::string& type) const {
    std::vector<Json::Value> out;
    for (auto& v : frames()) {
      if (v["type"].asString() == type) out.push_back(v);
    }
    return out;
  }

  bool closed = false;

 private:
  mutable std::mutex mutex_;
  std::vector<std::string> frames_;
};

class FailingChannel final : public Channel {
 public:
  expected<void, ErrorCode> send(std::string_view) override {
    ++attempts;
    return expected<void, ErrorCode>::error(ErrorCode::kConnectionClosed);
  }
  void close() override { closed = true; }

  int attempts = 0;
  bool closed = false;
};

// Refuses with kBufferFull while full is set, like a slow reader's socket
class ThrottledChannel final : public Channel {
 public:
  expected<void, ErrorCode> send(std::string_view payload) override {
    if (full.load()) return expected<void, ErrorCode>::error(ErrorCode::kBufferFull);
    return inner.send(payload);
  }
  void close() override { closed = true; }

  std::atomic<bool> full{true};
  RecordingChannel inner;
  bool closed = false;
};

Poll make_poll(const std::string& id, uint64_t seq, int64_t a = 0) {
  Poll poll;
  poll.id = id;
  poll.question = "q";
  poll.options = {{"A", a}, {"B", 0}};
  poll.sequence = seq;
  return poll;
}

ChangeEvent update(const std::string& id, uint64_t seq, int64_t a = 0) {
  ChangeEvent event;
  event.kind = EventKind::kUpdated;
  event.poll_id = id;
  event.sequence = seq;
  event.snapshot = make_poll(id, seq, a);
  return event;
}

struct DispatchFixture {
  ConnectionRegistry registry;
  BroadcastDispatcher dispatcher{registry};

  RegistryId add(const std::shared_ptr<Channel>& channel, const std::string& poll = "") {
    RegistryId id = registry.register_channel(channel);
    if (!poll.empty()) REQUIRE(registry.subscribe(id, poll));
    return id;
  }
};

}  // namespace

// ============================================================================
// Updates
// ============================================================================

TEST_CASE("Dispatcher - update reaches subscribers of that poll only", "[dispatcher]") {
  DispatchFixture f;
  auto a = std::make_shared<RecordingChannel>();
  auto b = std::make_shared<RecordingChannel>();
  auto idle = std::make_shared<RecordingChannel>();
  f.add(a, "P");
  f.add(b, "Q");
  f.add(idle);

  REQUIRE(f.dispatcher.dispatch(update("P", 1, 1)) == 1);

  auto got = a->of_type("poll_update");
  REQUIRE(got.size() == 1);
  REQUIRE(got[0]["pollId"].asString() == "P");
  REQUIRE(got[0]["sequence"].asUInt64() == 1);
  REQUIRE(got[0]["options"][0]["count"].asInt64() == 1);
  REQUIRE(b->frames().empty());
  REQUIRE(idle->frames().empty());
  REQUIRE(f.dispatcher.stats().events.load() == 1);
  REQUIRE(f.dispatcher.stats().delivered.load() == 1);
}

TEST_CASE("Dispatcher - one failing subscriber does not block the rest", "[dispatcher]") {
  DispatchFixture f;
  auto good1 = std::make_shared<RecordingChannel>();
  auto good2 = std::make_shared<RecordingChannel>();
  auto bad = std::make_shared<FailingChannel>();
  f.add(good1, "P");
  auto bad_id = f.add(bad, "P");
  f.add(good2, "P");

  REQUIRE(f.dispatcher.dispatch(update("P", 1)) == 2);

  REQUIRE(good1->of_type("poll_update").size() == 1);
  REQUIRE(good2->of_type("poll_update").size() == 1);
  REQUIRE(bad->closed);
  REQUIRE(f.registry.find(bad_id) == nullptr);
  REQUIRE(f.registry.viewer_count("P") == 2);
  REQUIRE(f.dispatcher.stats().failed.load() == 1);

  // Remaining viewers learn the new audience size
  auto viewers = good1->of_type("viewers");
  REQUIRE(viewers.size() == 1);
  REQUIRE(viewers[0]["count"].asUInt64() == 2);

  // The dropped subscriber is not tried again
  f.dispatcher.dispatch(update("P", 2));
  REQUIRE(bad->attempts == 1);
  REQUIRE(good2->of_type("poll_update").size() == 2);
}

TEST_CASE("Dispatcher - older or repeated sequences are dropped", "[dispatcher]") {
  DispatchFixture f;
  auto ch = std::make_shared<RecordingChannel>();
  f.add(ch, "P");

  REQUIRE(f.dispatcher.dispatch(update("P", 5)) == 1);
  REQUIRE(f.dispatcher.dispatch(update("P", 3)) == 0);
  REQUIRE(f.dispatcher.dispatch(update("P", 5)) == 0);
  REQUIRE(f.dispatcher.dispatch(update("P", 6)) == 1);

  auto got = ch->of_type("poll_update");
  REQUIRE(got.size() == 2);
  REQUIRE(got[0]["sequence"].asUInt64() == 5);
  REQUIRE(got[1]["sequence"].asUInt64() == 6);
  REQUIRE(f.dispatcher.stats().dropped_stale.load() == 2);
}

TEST_CASE("Dispatcher - switching polls stops updates for the old one", "[dispatcher]") {
  DispatchFixture f;
  auto ch = std::make_shared<RecordingChannel>();
  auto id = f.add(ch, "X");
  REQUIRE(f.registry.subscribe(id, "Y").value() == "X");

  REQUIRE(f.dispatcher.dispatch(update("X", 1)) == 0);
  REQUIRE(f.dispatcher.dispatch(update("Y", 1)) == 1);

  auto got = ch->of_type("poll_update");
  REQUIRE(got.size() == 1);
  REQUIRE(got[0]["pollId"].asString() == "Y");
}

TEST_CASE("Dispatcher - sequence gate is per poll", "[dispatcher]") {
  DispatchFixture f;
  auto ch = std::make_shared<RecordingChannel>();
  auto id = f.add(ch, "X");

  REQUIRE(f.dispatcher.dispatch(update("X", 9)) == 1);
  REQUIRE(f.registry.subscribe(id, "Y"));
  REQUIRE(f.dispatcher.dispatch(update("Y", 2)) == 1);
}

// ============================================================================
// Snapshots
// ============================================================================

TEST_CASE("Dispatcher - snapshot goes through the gate", "[dispatcher]") {
  DispatchFixture f;
  auto ch = std::make_shared<RecordingChannel>();
  auto id = f.add(ch, "P");

  // A fresh poll at sequence 0 still gets its first snapshot
  REQUIRE(f.dispatcher.send_snapshot(id, make_poll("P", 0)));
  REQUIRE(ch->of_type("poll_update").size() == 1);

  // Same sequence again is a duplicate
  REQUIRE(f.dispatcher.send_snapshot(id, make_poll("P", 0)));
  REQUIRE(ch->of_type("poll_update").size() == 1);

  REQUIRE(f.dispatcher.dispatch(update("P", 3)) == 1);

  // A snapshot read before that update must not overwrite it
  REQUIRE(f.dispatcher.send_snapshot(id, make_poll("P", 2)));
  auto got = ch->of_type("poll_update");
  REQUIRE(got.size() == 2);
  REQUIRE(got.back()["sequence"].asUInt64() == 3);
}

TEST_CASE("Dispatcher - snapshot errors", "[dispatcher]") {
  DispatchFixture f;
  auto ch = std::make_shared<RecordingChannel>();
  auto id = f.add(ch, "P");

  REQUIRE(f.dispatcher.send_snapshot(id, make_poll("Q", 1)).get_error() == ErrorCode::kInvalidState);
  REQUIRE(ch->frames().empty());

  REQUIRE(f.dispatcher.send_snapshot(id + 100, make_poll("P", 1)).get_error() == ErrorCode::kUnknownSubscriber);

  auto bad = std::make_shared<FailingChannel>();
  auto bad_id = f.add(bad, "P");
  REQUIRE(f.dispatcher.send_snapshot(bad_id, make_poll("P", 1)).get_error() == ErrorCode::kConnectionClosed);
  REQUIRE(bad->closed);
  REQUIRE(f.registry.find(bad_id) == nullptr);
}

// ============================================================================
// Lifecycle events and viewers
// ============================================================================

TEST_CASE("Dispatcher - created and deleted reach every connection", "[dispatcher]") {
  DispatchFixture f;
  auto watching = std::make_shared<RecordingChannel>();
  auto idle = std::make_shared<RecordingChannel>();
  f.add(watching, "P");
  f.add(idle);

  ChangeEvent created;
  created.kind = EventKind::kCreated;
  created.poll_id = "N";
  created.snapshot = make_poll("N", 0);
  REQUIRE(f.dispatcher.dispatch(created) == 2);

  ChangeEvent deleted;
  deleted.kind = EventKind::kDeleted;
  deleted.poll_id = "P";
  deleted.snapshot = make_poll("P", 4);
  REQUIRE(f.dispatcher.dispatch(deleted) == 2);

  for (const auto& ch : {watching, idle}) {
    auto c = ch->of_type("poll_created");
    REQUIRE(c.size() == 1);
    REQUIRE(c[0]["poll"]["id"].asString() == "N");
    auto d = ch->of_type("poll_deleted");
    REQUIRE(d.size() == 1);
    REQUIRE(d[0]["pollId"].asString() == "P");
  }

  // Subscribers of a deleted poll stay subscribed
  REQUIRE(f.registry.viewer_count("P") == 1);
}

TEST_CASE("Dispatcher - notify_viewers sends the current count", "[dispatcher]") {
  DispatchFixture f;
  auto a = std::make_shared<RecordingChannel>();
  auto b = std::make_shared<RecordingChannel>();
  auto other = std::make_shared<RecordingChannel>();
  f.add(a, "P");
  f.add(b, "P");
  f.add(other, "Q");

  f.dispatcher.notify_viewers("P");
  f.dispatcher.notify_viewers("");

  for (const auto& ch : {a, b}) {
    auto v = ch->of_type("viewers");
    REQUIRE(v.size() == 1);
    REQUIRE(v[0]["pollId"].asString() == "P");
    REQUIRE(v[0]["count"].asUInt64() == 2);
  }
  REQUIRE(other->frames().empty());
}

TEST_CASE("Dispatcher - notify_viewers recounts after a failure", "[dispatcher]") {
  DispatchFixture f;
  auto good = std::make_shared<RecordingChannel>();
  auto bad = std::make_shared<FailingChannel>();
  f.add(good, "P");
  f.add(bad, "P");

  f.dispatcher.notify_viewers("P");

  auto v = good->of_type("viewers");
  REQUIRE(v.size() == 2);
  REQUIRE(v[0]["count"].asUInt64() == 2);
  REQUIRE(v[1]["count"].asUInt64() == 1);
  REQUIRE(bad->closed);
  REQUIRE(f.registry.size() == 1);
}

TEST_CASE("Dispatcher - send_to and drop", "[dispatcher]") {
  DispatchFixture f;
  auto a = std::make_shared<RecordingChannel>();
  auto b = std::make_shared<RecordingChannel>();
  auto a_id = f.add(a, "P");
  f.add(b, "P");

  REQUIRE(f.dispatcher.send_to(a_id, codec::encode_pong()));
  REQUIRE(a->of_type("pong").size() == 1);

  f.dispatcher.drop(a_id);
  REQUIRE(a->closed);
  REQUIRE(f.registry.find(a_id) == nullptr);
  auto v = b->of_type("viewers");
  REQUIRE(v.size() == 1);
  REQUIRE(v[0]["count"].asUInt64() == 1);

  REQUIRE(f.dispatcher.send_to(a_id, codec::encode_pong()).get_error() == ErrorCode::kUnknownSubscriber);

  // Dropping twice is harmless
  f.dispatcher.drop(a_id);
  REQUIRE(b->of_type("viewers").size() == 1);
}

// ============================================================================
// Slow subscribers
// ============================================================================

TEST_CASE("Dispatcher - full channel keeps the subscriber and coalesces updates", "[dispatcher]") {
  DispatchFixture f;
  auto slow = std::make_shared<ThrottledChannel>();
  auto id = f.add(slow, "P");

  REQUIRE(f.dispatcher.dispatch(update("P", 1, 1)) == 0);
  REQUIRE(f.dispatcher.dispatch(update("P", 2, 2)) == 0);
  REQUIRE(f.dispatcher.dispatch(update("P", 3, 3)) == 0);
  f.dispatcher.notify_viewers("P");

  REQUIRE(f.registry.find(id) != nullptr);
  REQUIRE(!slow->closed);
  REQUIRE(f.dispatcher.stats().failed.load() == 0);
  REQUIRE(f.dispatcher.stats().held.load() == 4);

  // Still full: flush keeps everything for the next drain
  f.dispatcher.flush(id);
  REQUIRE(slow->inner.frames().empty());

  slow->full = false;
  f.dispatcher.flush(id);
  auto got = slow->inner.of_type("poll_update");
  REQUIRE(got.size() == 1);
  REQUIRE(got[0]["sequence"].asUInt64() == 3);
  REQUIRE(got[0]["options"][0]["count"].asInt64() == 3);
  REQUIRE(slow->inner.of_type("viewers").size() == 1);

  // Nothing left to replay
  f.dispatcher.flush(id);
  REQUIRE(slow->inner.frames().size() == 2);

  REQUIRE(f.dispatcher.dispatch(update("P", 3)) == 0);
  REQUIRE(f.dispatcher.dispatch(update("P", 4)) == 1);
  REQUIRE(slow->inner.of_type("poll_update").back()["sequence"].asUInt64() == 4);
}

TEST_CASE("Dispatcher - a direct send supersedes the held update", "[dispatcher]") {
  DispatchFixture f;
  auto slow = std::make_shared<ThrottledChannel>();
  auto id = f.add(slow, "P");

  REQUIRE(f.dispatcher.dispatch(update("P", 1)) == 0);
  slow->full = false;
  REQUIRE(f.dispatcher.dispatch(update("P", 2)) == 1);

  f.dispatcher.flush(id);
  auto got = slow->inner.of_type("poll_update");
  REQUIRE(got.size() == 1);
  REQUIRE(got[0]["sequence"].asUInt64() == 2);
}

TEST_CASE("Dispatcher - held frames for a poll left behind are discarded", "[dispatcher]") {
  DispatchFixture f;
  auto slow = std::make_shared<ThrottledChannel>();
  auto id = f.add(slow, "P");

  REQUIRE(f.dispatcher.send_snapshot(id, make_poll("P", 5)));
  REQUIRE(f.registry.subscribe(id, "Q"));

  slow->full = false;
  f.dispatcher.flush(id);
  REQUIRE(slow->inner.frames().empty());

  // Back on P, the snapshot the peer never got is not treated as a duplicate
  REQUIRE(f.registry.subscribe(id, "P"));
  REQUIRE(f.dispatcher.send_snapshot(id, make_poll("P", 5)));
  auto got = slow->inner.of_type("poll_update");
  REQUIRE(got.size() == 1);
  REQUIRE(got[0]["sequence"].asUInt64() == 5);
}

TEST_CASE("Dispatcher - full channel misses lifecycle events and direct replies", "[dispatcher]") {
  DispatchFixture f;
  auto slow = std::make_shared<ThrottledChannel>();
  auto ok = std::make_shared<RecordingChannel>();
  auto id = f.add(slow);
  f.add(ok);

  ChangeEvent created;
  created.kind = EventKind::kCreated;
  created.poll_id = "N";
  created.snapshot = make_poll("N", 0);
  REQUIRE(f.dispatcher.dispatch(created) == 1);
  REQUIRE(f.dispatcher.stats().skipped.load() == 1);

  REQUIRE(f.dispatcher.send_to(id, codec::encode_pong()).get_error() == ErrorCode::kBufferFull);
  REQUIRE(f.registry.find(id) != nullptr);

  slow->full = false;
  f.dispatcher.flush(id);
  REQUIRE(slow->inner.frames().empty());
}

// ============================================================================
// Concurrency
// ============================================================================

TEST_CASE("Dispatcher - concurrent updates and snapshots reach a subscriber in order", "[dispatcher]") {
  DispatchFixture f;
  auto ch = std::make_shared<RecordingChannel>();
  auto id = f.add(ch, "P");

  static constexpr uint64_t kLast = 200;
  constexpr int kThreads = 4;
  std::vector<std::thread> threads;

  for (int t = 0; t < kThreads; ++t) {
    threads.emplace_back([&f, t]() {
      std::vector<uint64_t> order(kLast);
      std::iota(order.begin(), order.end(), 1);
      std::mt19937 rng(static_cast<uint32_t>(1234 + t));
      std::shuffle(order.begin(), order.end(), rng);
      for (uint64_t seq : order) f.dispatcher.dispatch(update("P", seq));
    });
  }
  threads.emplace_back([&f, id]() {
    for (uint64_t seq = 0; seq <= kLast; seq += 7) {
      // kOk or a stale drop; the subscriber never leaves P
      (void)f.dispatcher.send_snapshot(id, make_poll("P", seq));
    }
  });
  for (auto& th : threads) th.join();

  auto got = ch->of_type("poll_update");
  REQUIRE(!got.empty());
  for (size_t i = 1; i < got.size(); ++i) {
    REQUIRE(got[i - 1]["sequence"].asUInt64() < got[i]["sequence"].asUInt64());
  }
  REQUIRE(got.back()["sequence"].asUInt64() == kLast);
  REQUIRE(f.registry.find(id) != nullptr);
}
