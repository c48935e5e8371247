/**
 * @file redis_store.hpp
 * @brief Store backed by Redis through redis-plus-plus.
 *
 * Layout: hash poll:{id} (question, description, closed, created_at,
 * sequence, options = JSON label array, count:{label} per option) and the
 * set `polls`. Votes, closes, creates and removes are Lua scripts so each
 * is one atomic step on the server. Events go out on poll-events:{id}.
 *
 * Only built with POLLCAST_WITH_REDIS.
 */

#ifndef POLLCAST_REDIS_STORE_HPP_
#define POLLCAST_REDIS_STORE_HPP_

#include "store.hpp"

#include <chrono>
#include <memory>
#include <string>

namespace sw {
namespace redis {
class Redis;
}  // namespace redis
}  // namespace sw

namespace pollcast {

class RedisStore final : public Store {
 public:
  // How long one subscriber read blocks before reporting kTimeout
  static constexpr std::chrono::milliseconds kSubscriberReadTimeout{100};

  // Throws std::runtime_error on a malformed URL. Connects lazily.
  explicit RedisStore(const std::string& url);
  ~RedisStore() override;

  expected<void, ErrorCode> create(const Poll& poll) override;
  expected<Poll, ErrorCode> read(const std::string& poll_id) override;
  expected<std::vector<Poll>, ErrorCode> list() override;
  expected<VoteResult, ErrorCode> increment(const std::string& poll_id, const std::string& label) override;
  expected<CloseResult, ErrorCode> close(const std::string& poll_id) override;
  expected<Poll, ErrorCode> remove(const std::string& poll_id) override;
  expected<void, ErrorCode> publish(const ChangeEvent& event) override;
  expected<std::shared_ptr<EventStream>, ErrorCode> subscribe(const std::string& pattern) override;
  expected<void, ErrorCode> ping() override;
  const char* name() const override { return "redis"; }

 private:
  class Stream;

  std::string url_;
  std::unique_ptr<sw::redis::Redis> redis_;      // commands, pooled
  std::unique_ptr<sw::redis::Redis> sub_redis_;  // subscribers, short socket timeout
};

}  // namespace pollcast

#endif  // POLLCAST_REDIS_STORE_HPP_
