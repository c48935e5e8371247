/**
 * @file event_bridge.hpp
 * @brief Store pub/sub -> BroadcastDispatcher, on a thread of its own.
 *
 * start() subscribes synchronously so the caller knows the bridge is live
 * before it lets vote traffic in. A lost stream is resubscribed with
 * bounded exponential backoff; the wait is cut short by stop().
 */

#ifndef POLLCAST_EVENT_BRIDGE_HPP_
#define POLLCAST_EVENT_BRIDGE_HPP_

#include "dispatcher.hpp"
#include "retry.hpp"
#include "store.hpp"
#include "vocabulary.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace pollcast {

class EventBridge {
 public:
  static constexpr std::chrono::milliseconds kPollInterval{100};

  EventBridge(Store& store, BroadcastDispatcher& dispatcher, RetryPolicy backoff = RetryPolicy{},
              std::string pattern = std::string(kEventPattern));
  ~EventBridge();

  EventBridge(const EventBridge&) = delete;
  EventBridge& operator=(const EventBridge&) = delete;

  // kBackendUnavailable if no subscription could be made within the
  // backoff policy's attempts. kInvalidState if already started.
  expected<void, ErrorCode> start();
  void stop();

  bool is_running() const { return running_.load(std::memory_order_acquire); }
  bool is_subscribed() const { return subscribed_.load(std::memory_order_acquire); }
  uint64_t forwarded() const { return forwarded_.load(std::memory_order_relaxed); }
  uint64_t reconnects() const { return reconnects_.load(std::memory_order_relaxed); }

 private:
  Store& store_;
  BroadcastDispatcher& dispatcher_;
  RetryPolicy backoff_;
  std::string pattern_;

  std::thread thread_;
  std::atomic<bool> running_{false};
  std::atomic<bool> subscribed_{false};
  std::atomic<uint64_t> forwarded_{0};
  std::atomic<uint64_t> reconnects_{0};

  std::mutex mutex_;
  std::condition_variable wake_;
  bool stopping_ = false;                // guarded by mutex_
  std::shared_ptr<EventStream> stream_;  // guarded by mutex_

  void loop();
  bool resubscribe();
  // false if stop() arrived during the wait
  bool wait_for(std::chrono::milliseconds delay);
  void set_stream(std::shared_ptr<EventStream> stream);
};

}  // namespace pollcast

#endif  // POLLCAST_EVENT_BRIDGE_HPP_
