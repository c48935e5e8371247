/**
 * @file store.hpp
 * @brief Backend store interface: atomic poll updates plus pub/sub.
 *
 * Every operation is safe under concurrent callers. A backend that cannot
 * be reached reports kBackendUnavailable; domain failures are
 * kPollNotFound, kOptionNotFound, kPollClosed and kAlreadyExists.
 */

#ifndef POLLCAST_STORE_HPP_
#define POLLCAST_STORE_HPP_

#include "poll.hpp"
#include "vocabulary.hpp"

#include <chrono>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace pollcast {

static constexpr std::string_view kEventChannelPrefix = "poll-events:";
static constexpr std::string_view kEventPattern = "poll-events:*";

inline std::string channel_for(const std::string& poll_id) {
  std::string channel(kEventChannelPrefix);
  channel += poll_id;
  return channel;
}

// Redis-style glob, '*' and '?' only
bool channel_matches(std::string_view pattern, std::string_view channel);

/**
 * A subscription to published ChangeEvents.
 *
 * next() blocks up to timeout. kTimeout means nothing arrived yet;
 * kBackendUnavailable means the stream is gone and the caller has to
 * subscribe again.
 */
class EventStream {
 public:
  virtual ~EventStream() = default;

  virtual expected<ChangeEvent, ErrorCode> next(std::chrono::milliseconds timeout) = 0;

  // Wakes a blocked next(), which then returns kBackendUnavailable
  virtual void close() = 0;
};

class Store {
 public:
  virtual ~Store() = default;

  virtual expected<void, ErrorCode> create(const Poll& poll) = 0;
  virtual expected<Poll, ErrorCode> read(const std::string& poll_id) = 0;
  virtual expected<std::vector<Poll>, ErrorCode> list() = 0;

  // One atomic step: check open, check label, add one, bump sequence
  virtual expected<VoteResult, ErrorCode> increment(const std::string& poll_id, const std::string& label) = 0;

  // Idempotent, bumps the sequence only on the first close
  virtual expected<CloseResult, ErrorCode> close(const std::string& poll_id) = 0;

  // Returns the last snapshot of the removed poll
  virtual expected<Poll, ErrorCode> remove(const std::string& poll_id) = 0;

  virtual expected<void, ErrorCode> publish(const ChangeEvent& event) = 0;
  virtual expected<std::shared_ptr<EventStream>, ErrorCode> subscribe(const std::string& pattern) = 0;

  virtual expected<void, ErrorCode> ping() = 0;
  virtual const char* name() const = 0;
};

}  // namespace pollcast

#endif  // POLLCAST_STORE_HPP_
