#include "pollcast/dispatcher.hpp"

#include "pollcast/codec.hpp"
#include "pollcast/log.hpp"

#include <vector>

namespace pollcast {

namespace {

// Subscriber lock held for all of these.

bool is_stale_locked(const Subscriber& sub, const std::string& poll_id, uint64_t sequence) {
  auto gate = sub.last_sequence.find(poll_id);
  return gate != sub.last_sequence.end() && sequence <= gate->second;
}

// A held update never reached the peer, so its poll's gate goes back to the
// last frame that did.
void discard_held_locked(Subscriber& sub) {
  if (!sub.held_update.empty()) {
    if (sub.held_floor == 0) {
      sub.last_sequence.erase(sub.held_poll);
    } else {
      sub.last_sequence[sub.held_poll] = sub.held_floor;
    }
  }
  sub.held_poll.clear();
  sub.held_update.clear();
  sub.held_viewers.clear();
  sub.held_floor = 0;
}

void retarget_held_locked(Subscriber& sub, const std::string& poll_id) {
  if (sub.held_poll == poll_id) return;
  discard_held_locked(sub);
  sub.held_poll = poll_id;
}

void mark_sent_locked(Subscriber& sub, const std::string& poll_id, uint64_t sequence) {
  sub.last_sequence[poll_id] = sequence;
  if (sub.held_poll == poll_id) sub.held_update.clear();
}

// Replaces any older held update; the gate moves on so nothing older than
// the held frame is queued behind it.
void hold_update_locked(Subscriber& sub, const std::string& poll_id, uint64_t sequence, std::string_view payload) {
  retarget_held_locked(sub, poll_id);
  if (sub.held_update.empty()) {
    auto gate = sub.last_sequence.find(poll_id);
    sub.held_floor = gate == sub.last_sequence.end() ? 0 : gate->second;
  }
  sub.held_update.assign(payload.data(), payload.size());
  sub.last_sequence[poll_id] = sequence;
}

}  // namespace

size_t BroadcastDispatcher::dispatch(const ChangeEvent& event) {
  stats_.events.fetch_add(1, std::memory_order_relaxed);
  switch (event.kind) {
    case EventKind::kUpdated:
      return dispatch_update(event);
    case EventKind::kCreated:
      return dispatch_to_all(codec::encode_poll_created(event.snapshot));
    case EventKind::kDeleted:
      return dispatch_to_all(codec::encode_poll_deleted(event.poll_id));
  }
  return 0;
}

size_t BroadcastDispatcher::dispatch_update(const ChangeEvent& event) {
  auto subs = registry_.subscribers_of(event.poll_id);
  if (subs.empty()) return 0;

  const std::string payload = codec::encode_poll_update(event.snapshot);
  size_t reached = 0;
  std::vector<RegistryId> failed;

  for (const auto& sub : subs) {
    std::lock_guard<std::mutex> lock(sub->mutex);
    // Left (or switched poll) after the snapshot was taken
    if (sub->poll_id != event.poll_id) continue;

    if (is_stale_locked(*sub, event.poll_id, event.sequence)) {
      stats_.dropped_stale.fetch_add(1, std::memory_order_relaxed);
      continue;
    }
    switch (deliver_locked(*sub, payload)) {
      case Delivery::kSent:
        mark_sent_locked(*sub, event.poll_id, event.sequence);
        ++reached;
        break;
      case Delivery::kHeld:
        hold_update_locked(*sub, event.poll_id, event.sequence, payload);
        break;
      case Delivery::kFailed:
        failed.push_back(sub->id);
        break;
    }
  }

  for (RegistryId id : failed) drop(id);
  return reached;
}

size_t BroadcastDispatcher::dispatch_to_all(std::string_view payload) {
  auto subs = registry_.all();
  size_t reached = 0;
  std::vector<RegistryId> failed;

  for (const auto& sub : subs) {
    std::lock_guard<std::mutex> lock(sub->mutex);
    switch (deliver_locked(*sub, payload)) {
      case Delivery::kSent:
        ++reached;
        break;
      case Delivery::kHeld:
        // Lifecycle events do not coalesce, a full channel misses this one
        stats_.skipped.fetch_add(1, std::memory_order_relaxed);
        break;
      case Delivery::kFailed:
        failed.push_back(sub->id);
        break;
    }
  }

  for (RegistryId id : failed) drop(id);
  return reached;
}

expected<void, ErrorCode> BroadcastDispatcher::send_snapshot(RegistryId id, const Poll& poll) {
  auto sub = registry_.find(id);
  if (!sub) return expected<void, ErrorCode>::error(ErrorCode::kUnknownSubscriber);

  const std::string payload = codec::encode_poll_update(poll);
  {
    std::lock_guard<std::mutex> lock(sub->mutex);
    if (sub->poll_id != poll.id) return expected<void, ErrorCode>::error(ErrorCode::kInvalidState);

    if (is_stale_locked(*sub, poll.id, poll.sequence)) {
      stats_.dropped_stale.fetch_add(1, std::memory_order_relaxed);
      return expected<void, ErrorCode>::success();
    }
    switch (deliver_locked(*sub, payload)) {
      case Delivery::kSent:
        mark_sent_locked(*sub, poll.id, poll.sequence);
        return expected<void, ErrorCode>::success();
      case Delivery::kHeld:
        hold_update_locked(*sub, poll.id, poll.sequence, payload);
        return expected<void, ErrorCode>::success();
      case Delivery::kFailed:
        break;
    }
  }
  drop(id);
  return expected<void, ErrorCode>::error(ErrorCode::kConnectionClosed);
}

void BroadcastDispatcher::notify_viewers(const std::string& poll_id) {
  if (poll_id.empty()) return;

  // Every drop changes the audience again, so repeat until a pass is clean
  for (;;) {
    auto subs = registry_.subscribers_of(poll_id);
    if (subs.empty()) return;

    const std::string payload = codec::encode_viewers(poll_id, subs.size());
    std::vector<RegistryId> failed;
    for (const auto& sub : subs) {
      std::lock_guard<std::mutex> lock(sub->mutex);
      if (sub->poll_id != poll_id) continue;
      switch (deliver_locked(*sub, payload)) {
        case Delivery::kSent:
          if (sub->held_poll == poll_id) sub->held_viewers.clear();
          break;
        case Delivery::kHeld:
          retarget_held_locked(*sub, poll_id);
          sub->held_viewers = payload;
          break;
        case Delivery::kFailed:
          failed.push_back(sub->id);
          break;
      }
    }
    if (failed.empty()) return;
    for (RegistryId id : failed) remove(id);
  }
}

expected<void, ErrorCode> BroadcastDispatcher::send_to(RegistryId id, std::string_view payload) {
  auto sub = registry_.find(id);
  if (!sub) return expected<void, ErrorCode>::error(ErrorCode::kUnknownSubscriber);

  Delivery result;
  {
    std::lock_guard<std::mutex> lock(sub->mutex);
    result = deliver_locked(*sub, payload);
  }
  if (result == Delivery::kSent) return expected<void, ErrorCode>::success();
  if (result == Delivery::kHeld) return expected<void, ErrorCode>::error(ErrorCode::kBufferFull);
  drop(id);
  return expected<void, ErrorCode>::error(ErrorCode::kConnectionClosed);
}

void BroadcastDispatcher::flush(RegistryId id) {
  auto sub = registry_.find(id);
  if (!sub) return;

  bool failed = false;
  {
    std::lock_guard<std::mutex> lock(sub->mutex);
    if (sub->held_poll.empty()) return;
    if (sub->held_poll != sub->poll_id) {
      // Left that poll while its frames were held
      discard_held_locked(*sub);
      return;
    }
    for (std::string* slot : {&sub->held_update, &sub->held_viewers}) {
      if (slot->empty()) continue;
      Delivery result = deliver_locked(*sub, *slot);
      if (result == Delivery::kHeld) return;  // full again, the next drain retries
      if (result == Delivery::kFailed) {
        failed = true;
        break;
      }
      slot->clear();
    }
    if (!failed) {
      sub->held_poll.clear();
      sub->held_floor = 0;
    }
  }
  if (failed) drop(id);
}

void BroadcastDispatcher::drop(RegistryId id) {
  auto removal = remove(id);
  if (removal.removed) notify_viewers(removal.poll_id);
}

ConnectionRegistry::Removal BroadcastDispatcher::remove(RegistryId id) {
  auto removal = registry_.deregister(id);
  if (removal.removed && removal.channel) {
    POLLCAST_LOG_DEBUG("dropping subscriber " + std::to_string(id));
    removal.channel->close();
  }
  return removal;
}

BroadcastDispatcher::Delivery BroadcastDispatcher::deliver_locked(Subscriber& sub, std::string_view payload) {
  auto sent = sub.channel->send(payload);
  if (sent) {
    stats_.delivered.fetch_add(1, std::memory_order_relaxed);
    return Delivery::kSent;
  }
  if (!is_connection_failure(sent.get_error())) {
    stats_.held.fetch_add(1, std::memory_order_relaxed);
    POLLCAST_LOG_DEBUG("subscriber " + std::to_string(sub.id) + " is full, holding: " + to_string(sent.get_error()));
    return Delivery::kHeld;
  }
  stats_.failed.fetch_add(1, std::memory_order_relaxed);
  POLLCAST_LOG_WARN("send to subscriber " + std::to_string(sub.id) + " failed: " + to_string(sent.get_error()));
  return Delivery::kFailed;
}

}  // namespace pollcast
