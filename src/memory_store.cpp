#include "pollcast/memory_store.hpp"

#include "pollcast/log.hpp"

#include <algorithm>

namespace pollcast {

bool channel_matches(std::string_view pattern, std::string_view channel) {
  size_t p = 0;
  size_t c = 0;
  size_t star = std::string_view::npos;
  size_t mark = 0;
  while (c < channel.size()) {
    if (p < pattern.size() && (pattern[p] == '?' || pattern[p] == channel[c])) {
      ++p;
      ++c;
    } else if (p < pattern.size() && pattern[p] == '*') {
      star = p++;
      mark = c;
    } else if (star != std::string_view::npos) {
      p = star + 1;
      c = ++mark;
    } else {
      return false;
    }
  }
  while (p < pattern.size() && pattern[p] == '*') ++p;
  return p == pattern.size();
}

// ============================================================================
// Stream
// ============================================================================

class MemoryStore::Stream final : public EventStream {
 public:
  explicit Stream(std::string pattern) : pattern_(std::move(pattern)) {}

  expected<ChangeEvent, ErrorCode> next(std::chrono::milliseconds timeout) override {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait_for(lock, timeout, [this] { return closed_ || !queue_.empty(); });
    if (!queue_.empty()) {
      ChangeEvent event = std::move(queue_.front());
      queue_.pop_front();
      return expected<ChangeEvent, ErrorCode>::success(std::move(event));
    }
    if (closed_) return expected<ChangeEvent, ErrorCode>::error(ErrorCode::kBackendUnavailable);
    return expected<ChangeEvent, ErrorCode>::error(ErrorCode::kTimeout);
  }

  void close() override {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      closed_ = true;
      queue_.clear();
    }
    cv_.notify_all();
  }

  // Returns false once the stream is closed
  bool deliver(const ChangeEvent& event) {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (closed_) return false;
      if (queue_.size() >= kStreamQueueLimit) {
        queue_.pop_front();  // slow consumer loses the oldest snapshot
      }
      queue_.push_back(event);
    }
    cv_.notify_one();
    return true;
  }

  const std::string& pattern() const { return pattern_; }

 private:
  const std::string pattern_;
  std::mutex mutex_;
  std::condition_variable cv_;
  std::deque<ChangeEvent> queue_;
  bool closed_ = false;
};

// ============================================================================
// MemoryStore
// ============================================================================

MemoryStore::~MemoryStore() {
  std::vector<std::weak_ptr<Stream>> streams;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    streams.swap(streams_);
  }
  for (auto& weak : streams) {
    if (auto stream = weak.lock()) stream->close();
  }
}

expected<void, ErrorCode> MemoryStore::check_online() const {
  if (!online_.load(std::memory_order_acquire)) {
    return expected<void, ErrorCode>::error(ErrorCode::kBackendUnavailable);
  }
  return expected<void, ErrorCode>::success();
}

expected<void, ErrorCode> MemoryStore::create(const Poll& poll) {
  auto up = check_online();
  if (!up) return up;

  std::lock_guard<std::mutex> lock(mutex_);
  if (polls_.count(poll.id) != 0) {
    return expected<void, ErrorCode>::error(ErrorCode::kAlreadyExists);
  }
  polls_.emplace(poll.id, poll);
  order_.push_back(poll.id);
  return expected<void, ErrorCode>::success();
}

expected<Poll, ErrorCode> MemoryStore::read(const std::string& poll_id) {
  auto up = check_online();
  if (!up) return expected<Poll, ErrorCode>::error(up.get_error());

  std::lock_guard<std::mutex> lock(mutex_);
  auto it = polls_.find(poll_id);
  if (it == polls_.end()) return expected<Poll, ErrorCode>::error(ErrorCode::kPollNotFound);
  return expected<Poll, ErrorCode>::success(it->second);
}

expected<std::vector<Poll>, ErrorCode> MemoryStore::list() {
  auto up = check_online();
  if (!up) return expected<std::vector<Poll>, ErrorCode>::error(up.get_error());

  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<Poll> out;
  out.reserve(order_.size());
  for (const auto& id : order_) {
    auto it = polls_.find(id);
    if (it != polls_.end()) out.push_back(it->second);
  }
  return expected<std::vector<Poll>, ErrorCode>::success(std::move(out));
}

expected<VoteResult, ErrorCode> MemoryStore::increment(const std::string& poll_id, const std::string& label) {
  auto up = check_online();
  if (!up) return expected<VoteResult, ErrorCode>::error(up.get_error());

  std::lock_guard<std::mutex> lock(mutex_);
  auto it = polls_.find(poll_id);
  if (it == polls_.end()) return expected<VoteResult, ErrorCode>::error(ErrorCode::kPollNotFound);
  Poll& poll = it->second;
  if (poll.closed) return expected<VoteResult, ErrorCode>::error(ErrorCode::kPollClosed);

  auto opt = std::find_if(poll.options.begin(), poll.options.end(),
                          [&label](const PollOption& o) { return o.label == label; });
  if (opt == poll.options.end()) return expected<VoteResult, ErrorCode>::error(ErrorCode::kOptionNotFound);

  ++opt->count;
  ++poll.sequence;

  VoteResult result;
  result.new_count = opt->count;
  result.snapshot = poll;
  return expected<VoteResult, ErrorCode>::success(std::move(result));
}

expected<CloseResult, ErrorCode> MemoryStore::close(const std::string& poll_id) {
  auto up = check_online();
  if (!up) return expected<CloseResult, ErrorCode>::error(up.get_error());

  std::lock_guard<std::mutex> lock(mutex_);
  auto it = polls_.find(poll_id);
  if (it == polls_.end()) return expected<CloseResult, ErrorCode>::error(ErrorCode::kPollNotFound);

  CloseResult result;
  if (!it->second.closed) {
    it->second.closed = true;
    ++it->second.sequence;
    result.changed = true;
  }
  result.snapshot = it->second;
  return expected<CloseResult, ErrorCode>::success(std::move(result));
}

expected<Poll, ErrorCode> MemoryStore::remove(const std::string& poll_id) {
  auto up = check_online();
  if (!up) return expected<Poll, ErrorCode>::error(up.get_error());

  std::lock_guard<std::mutex> lock(mutex_);
  auto it = polls_.find(poll_id);
  if (it == polls_.end()) return expected<Poll, ErrorCode>::error(ErrorCode::kPollNotFound);
  Poll last = std::move(it->second);
  polls_.erase(it);
  order_.erase(std::remove(order_.begin(), order_.end(), poll_id), order_.end());
  return expected<Poll, ErrorCode>::success(std::move(last));
}

expected<void, ErrorCode> MemoryStore::publish(const ChangeEvent& event) {
  auto up = check_online();
  if (!up) return up;

  const std::string channel = channel_for(event.poll_id);
  std::vector<std::shared_ptr<Stream>> targets;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = streams_.begin();
    while (it != streams_.end()) {
      auto stream = it->lock();
      if (!stream) {
        it = streams_.erase(it);
        continue;
      }
      if (channel_matches(stream->pattern(), channel)) targets.push_back(std::move(stream));
      ++it;
    }
  }
  // Delivered outside the store lock
  for (auto& stream : targets) (void)stream->deliver(event);
  return expected<void, ErrorCode>::success();
}

expected<std::shared_ptr<EventStream>, ErrorCode> MemoryStore::subscribe(const std::string& pattern) {
  auto up = check_online();
  if (!up) return expected<std::shared_ptr<EventStream>, ErrorCode>::error(up.get_error());

  auto stream = std::make_shared<Stream>(pattern);
  {
    std::lock_guard<std::mutex> lock(mutex_);
    streams_.push_back(stream);
  }
  return expected<std::shared_ptr<EventStream>, ErrorCode>::success(std::shared_ptr<EventStream>(stream));
}

expected<void, ErrorCode> MemoryStore::ping() { return check_online(); }

void MemoryStore::set_online(bool online) {
  online_.store(online, std::memory_order_release);
  if (online) {
    POLLCAST_LOG_INFO("memory store back online");
    return;
  }

  POLLCAST_LOG_WARN("memory store offline");
  std::vector<std::weak_ptr<Stream>> streams;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    streams.swap(streams_);
  }
  for (auto& weak : streams) {
    if (auto stream = weak.lock()) stream->close();
  }
}

size_t MemoryStore::stream_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  size_t n = 0;
  for (const auto& weak : streams_) {
    if (!weak.expired()) ++n;
  }
  return n;
}

}  // namespace pollcast
