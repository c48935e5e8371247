/**
 * @file poll_engine.hpp
 * @brief Poll invariants on top of a Store: valid options, reject after
 *        close, one ChangeEvent per committed change.
 *
 * The engine holds no lock of its own. Concurrent votes are serialized by
 * the store's atomic increment; a vote racing close_poll is decided by the
 * same atomic step.
 */

#ifndef POLLCAST_POLL_ENGINE_HPP_
#define POLLCAST_POLL_ENGINE_HPP_

#include "poll.hpp"
#include "retry.hpp"
#include "store.hpp"
#include "vocabulary.hpp"

#include <atomic>
#include <memory>
#include <string>
#include <vector>

namespace pollcast {

class PollEngine {
 public:
  explicit PollEngine(std::shared_ptr<Store> store, RetryPolicy retry = RetryPolicy{});

  // kInvalidArgument: no options, an empty label or a duplicate label
  expected<Poll, ErrorCode> create_poll(const std::vector<std::string>& options, const std::string& question = "",
                                        const std::string& description = "");

  // kPollNotFound, kPollClosed, kOptionNotFound, kBackendUnavailable
  expected<VoteResult, ErrorCode> cast_vote(const std::string& poll_id, const std::string& label);

  // Idempotent. Publishes an update only on the call that actually closes.
  expected<Poll, ErrorCode> close_poll(const std::string& poll_id);

  expected<Poll, ErrorCode> get_poll(const std::string& poll_id);
  expected<std::vector<Poll>, ErrorCode> list_polls();

  // Returns the last snapshot, publishes kDeleted
  expected<Poll, ErrorCode> delete_poll(const std::string& poll_id);

  // Events committed to the store but not published after all retries
  uint64_t publish_failures() const { return publish_failures_.load(std::memory_order_relaxed); }

  Store& store() { return *store_; }

 private:
  std::shared_ptr<Store> store_;
  RetryPolicy retry_;
  std::atomic<uint64_t> publish_failures_{0};

  void publish(EventKind kind, const Poll& snapshot);
  static std::string generate_id();
  static int64_t now_ms();
};

}  // namespace pollcast

#endif  // POLLCAST_POLL_ENGINE_HPP_
