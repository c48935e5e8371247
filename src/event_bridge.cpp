#include "pollcast/event_bridge.hpp"

#include "pollcast/log.hpp"

namespace pollcast {

EventBridge::EventBridge(Store& store, BroadcastDispatcher& dispatcher, RetryPolicy backoff, std::string pattern)
    : store_(store), dispatcher_(dispatcher), backoff_(backoff), pattern_(std::move(pattern)) {}

EventBridge::~EventBridge() { stop(); }

expected<void, ErrorCode> EventBridge::start() {
  if (running_.load(std::memory_order_acquire)) {
    return expected<void, ErrorCode>::error(ErrorCode::kInvalidState);
  }
  {
    std::lock_guard<std::mutex> lock(mutex_);
    stopping_ = false;
  }

  auto stream = retry_on_unavailable(backoff_, "subscribe", [&]() { return store_.subscribe(pattern_); });
  if (!stream) {
    POLLCAST_LOG_ERROR("event bridge: subscribe to " + pattern_ + " failed: " + to_string(stream.get_error()));
    return expected<void, ErrorCode>::error(stream.get_error());
  }
  set_stream(std::move(stream.value()));

  running_.store(true, std::memory_order_release);
  thread_ = std::thread(&EventBridge::loop, this);
  POLLCAST_LOG_INFO("event bridge subscribed to " + pattern_ + " on " + store_.name() + " store");
  return expected<void, ErrorCode>::success();
}

void EventBridge::stop() {
  std::shared_ptr<EventStream> stream;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    stopping_ = true;
    stream = stream_;
  }
  wake_.notify_all();
  if (stream) stream->close();

  if (thread_.joinable()) thread_.join();
  set_stream(nullptr);
  running_.store(false, std::memory_order_release);
}

void EventBridge::loop() {
  for (;;) {
    std::shared_ptr<EventStream> stream;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (stopping_) break;
      stream = stream_;
    }

    if (!stream) {
      if (!resubscribe()) break;
      continue;
    }

    auto event = stream->next(kPollInterval);
    if (event) {
      forwarded_.fetch_add(1, std::memory_order_relaxed);
      dispatcher_.dispatch(event.value());
      continue;
    }
    if (event.get_error() == ErrorCode::kTimeout) continue;

    // Stream is gone (backend dropped, or stop() closed it)
    set_stream(nullptr);
    std::lock_guard<std::mutex> lock(mutex_);
    if (stopping_) break;
    POLLCAST_LOG_WARN("event bridge: stream lost (" + std::string(to_string(event.get_error())) + ")");
  }
  POLLCAST_LOG_DEBUG("event bridge thread exiting");
}

// Backoff doubles up to max_delay and keeps trying until stop()
bool EventBridge::resubscribe() {
  for (uint32_t attempt = 1;; ++attempt) {
    if (!wait_for(backoff_.delay_for(attempt))) return false;

    auto stream = store_.subscribe(pattern_);
    if (stream) {
      reconnects_.fetch_add(1, std::memory_order_relaxed);
      set_stream(std::move(stream.value()));
      POLLCAST_LOG_INFO("event bridge resubscribed after " + std::to_string(attempt) + " attempt(s)");
      return true;
    }
    POLLCAST_LOG_WARN("event bridge: resubscribe attempt " + std::to_string(attempt) +
                      " failed: " + to_string(stream.get_error()));
  }
}

bool EventBridge::wait_for(std::chrono::milliseconds delay) {
  std::unique_lock<std::mutex> lock(mutex_);
  wake_.wait_for(lock, delay, [this]() { return stopping_; });
  return !stopping_;
}

void EventBridge::set_stream(std::shared_ptr<EventStream> stream) {
  std::shared_ptr<EventStream> old;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    old.swap(stream_);
    stream_ = std::move(stream);
    subscribed_.store(stream_ != nullptr, std::memory_order_release);
  }
  // Closing may block on the backend; do it outside the lock
  if (old && old != stream_) old->close();
}

}  // namespace pollcast
