/**
 * @file memory_store.hpp
 * @brief In-process Store. One mutex stands in for the backend's atomic
 *        operations; published events fan out to bounded per-stream queues.
 */

#ifndef POLLCAST_MEMORY_STORE_HPP_
#define POLLCAST_MEMORY_STORE_HPP_

#include "store.hpp"

#include <atomic>
#include <condition_variable>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace pollcast {

class MemoryStore final : public Store {
 public:
  static constexpr size_t kStreamQueueLimit = 1024;

  MemoryStore() = default;
  ~MemoryStore() override;

  expected<void, ErrorCode> create(const Poll& poll) override;
  expected<Poll, ErrorCode> read(const std::string& poll_id) override;
  expected<std::vector<Poll>, ErrorCode> list() override;
  expected<VoteResult, ErrorCode> increment(const std::string& poll_id, const std::string& label) override;
  expected<CloseResult, ErrorCode> close(const std::string& poll_id) override;
  expected<Poll, ErrorCode> remove(const std::string& poll_id) override;
  expected<void, ErrorCode> publish(const ChangeEvent& event) override;
  expected<std::shared_ptr<EventStream>, ErrorCode> subscribe(const std::string& pattern) override;
  expected<void, ErrorCode> ping() override;
  const char* name() const override { return "memory"; }

  // Fault injection: offline makes every call fail with kBackendUnavailable
  // and ends every open stream, like a dropped backend connection.
  void set_online(bool online);
  bool online() const { return online_.load(std::memory_order_acquire); }

  size_t stream_count() const;

 private:
  class Stream;

  mutable std::mutex mutex_;
  std::map<std::string, Poll> polls_;
  std::vector<std::string> order_;  // insertion order for list()
  std::vector<std::weak_ptr<Stream>> streams_;
  std::atomic<bool> online_{true};

  expected<void, ErrorCode> check_online() const;
};

}  // namespace pollcast

#endif  // POLLCAST_MEMORY_STORE_HPP_
