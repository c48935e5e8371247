/**
 * @file dispatcher.hpp
 * @brief Fans ChangeEvents out to registry subscribers.
 *
 * A payload is encoded once per event. Each subscriber is served under its
 * own lock: the subscription and the sequence gate are checked and the frame
 * is queued in one step, so a subscriber never sees an older snapshot after
 * a newer one and never sees a poll it already left. A failed send drops
 * that subscriber only.
 *
 * A full channel (kBufferFull) is kept. The newest poll_update and viewers
 * frame for it are held and replayed by flush() once the channel drains;
 * older ones are overwritten. Lifecycle events it misses are not replayed.
 */

#ifndef POLLCAST_DISPATCHER_HPP_
#define POLLCAST_DISPATCHER_HPP_

#include "poll.hpp"
#include "registry.hpp"
#include "vocabulary.hpp"

#include <atomic>
#include <cstdint>
#include <string>
#include <string_view>

namespace pollcast {

struct DispatchStats {
  std::atomic<uint64_t> events{0};
  std::atomic<uint64_t> delivered{0};
  std::atomic<uint64_t> dropped_stale{0};
  std::atomic<uint64_t> failed{0};
  std::atomic<uint64_t> held{0};     // refused by a full channel
  std::atomic<uint64_t> skipped{0};  // lifecycle events a full channel missed
};

class BroadcastDispatcher {
 public:
  explicit BroadcastDispatcher(ConnectionRegistry& registry) : registry_(registry) {}

  BroadcastDispatcher(const BroadcastDispatcher&) = delete;
  BroadcastDispatcher& operator=(const BroadcastDispatcher&) = delete;

  // Any thread. Returns the number of subscribers the event reached.
  size_t dispatch(const ChangeEvent& event);

  // Initial state for a fresh subscriber, through the same gate as updates.
  // kUnknownSubscriber if the id is gone, kInvalidState if it no longer
  // watches poll.id. A subscriber already at this sequence gets nothing.
  expected<void, ErrorCode> send_snapshot(RegistryId id, const Poll& poll);

  // {"type":"viewers"} to every subscriber of poll_id
  void notify_viewers(const std::string& poll_id);

  // Ungated send to one subscriber, used for replies to control messages.
  // kBufferFull if the channel is full; nothing is held.
  expected<void, ErrorCode> send_to(RegistryId id, std::string_view payload);

  // Reactor, once id's channel has drained: sends the frames held for it.
  // Held frames for a poll it no longer watches are discarded.
  void flush(RegistryId id);

  // Deregisters, closes and tells the remaining viewers
  void drop(RegistryId id);

  const DispatchStats& stats() const { return stats_; }

 private:
  ConnectionRegistry& registry_;
  DispatchStats stats_;

  size_t dispatch_update(const ChangeEvent& event);
  ConnectionRegistry::Removal remove(RegistryId id);
  size_t dispatch_to_all(std::string_view payload);

  enum class Delivery : uint8_t { kSent, kHeld, kFailed };

  // Subscriber lock held. kFailed: sub must be dropped.
  Delivery deliver_locked(Subscriber& sub, std::string_view payload);
};

}  // namespace pollcast

#endif  // POLLCAST_DISPATCHER_HPP_
