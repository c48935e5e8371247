#include "pollcast/redis_store.hpp"

#include "pollcast/codec.hpp"
#include "pollcast/log.hpp"

#include <algorithm>
#include <atomic>
#include <deque>
#include <iterator>
#include <stdexcept>
#include <unordered_map>
#include <vector>

#include <sw/redis++/redis++.h>

namespace pollcast {

namespace {

constexpr const char* kPollSetKey = "polls";

// KEYS[1] poll hash, KEYS[2] id set; ARGV[1] id, ARGV[2..] field/value pairs
constexpr const char* kCreateScript = R"lua(
if redis.call('EXISTS', KEYS[1]) == 1 then return {'exists'} end
redis.call('HSET', KEYS[1], unpack(ARGV, 2))
redis.call('SADD', KEYS[2], ARGV[1])
return {'ok'}
)lua";

// KEYS[1] poll hash; ARGV[1] label
constexpr const char* kIncrementScript = R"lua(
if redis.call('EXISTS', KEYS[1]) == 0 then return {'not_found'} end
if redis.call('HGET', KEYS[1], 'closed') == '1' then return {'closed'} end
local field = 'count:' .. ARGV[1]
if redis.call('HEXISTS', KEYS[1], field) == 0 then return {'option_not_found'} end
redis.call('HINCRBY', KEYS[1], field, 1)
redis.call('HINCRBY', KEYS[1], 'sequence', 1)
local out = redis.call('HGETALL', KEYS[1])
table.insert(out, 1, 'ok')
return out
)lua";

// KEYS[1] poll hash
constexpr const char* kCloseScript = R"lua(
if redis.call('EXISTS', KEYS[1]) == 0 then return {'not_found'} end
local status = 'unchanged'
if redis.call('HGET', KEYS[1], 'closed') ~= '1' then
  redis.call('HSET', KEYS[1], 'closed', '1')
  redis.call('HINCRBY', KEYS[1], 'sequence', 1)
  status = 'changed'
end
local out = redis.call('HGETALL', KEYS[1])
table.insert(out, 1, status)
return out
)lua";

// KEYS[1] poll hash, KEYS[2] id set; ARGV[1] id
constexpr const char* kRemoveScript = R"lua(
if redis.call('EXISTS', KEYS[1]) == 0 then return {'not_found'} end
local out = redis.call('HGETALL', KEYS[1])
redis.call('DEL', KEYS[1])
redis.call('SREM', KEYS[2], ARGV[1])
table.insert(out, 1, 'ok')
return out
)lua";

std::string poll_key(const std::string& poll_id) { return "poll:" + poll_id; }

int64_t to_int64(const std::string& s) {
  try {
    return std::stoll(s);
  } catch (const std::exception&) {
    return 0;
  }
}

using FieldMap = std::unordered_map<std::string, std::string>;

// Script replies carry HGETALL as a flat field/value list after the status
FieldMap fields_from_flat(const std::vector<std::string>& flat, size_t offset) {
  FieldMap fields;
  for (size_t i = offset; i + 1 < flat.size(); i += 2) {
    fields[flat[i]] = flat[i + 1];
  }
  return fields;
}

expected<Poll, ErrorCode> poll_from_fields(const std::string& poll_id, FieldMap& fields) {
  auto labels = codec::decode_labels(fields["options"]);
  if (!labels) {
    POLLCAST_LOG_ERROR("redis: poll " + poll_id + " has a malformed options field");
    return expected<Poll, ErrorCode>::error(ErrorCode::kInternalError);
  }

  Poll poll;
  poll.id = poll_id;
  poll.question = fields["question"];
  poll.description = fields["description"];
  poll.closed = fields["closed"] == "1";
  poll.created_at_ms = to_int64(fields["created_at"]);
  poll.sequence = static_cast<uint64_t>(to_int64(fields["sequence"]));
  for (const auto& label : labels.value()) {
    PollOption opt;
    opt.label = label;
    opt.count = to_int64(fields["count:" + label]);
    poll.options.push_back(std::move(opt));
  }
  return expected<Poll, ErrorCode>::success(std::move(poll));
}

ErrorCode status_to_error(const std::string& status) {
  if (status == "not_found") return ErrorCode::kPollNotFound;
  if (status == "closed") return ErrorCode::kPollClosed;
  if (status == "option_not_found") return ErrorCode::kOptionNotFound;
  if (status == "exists") return ErrorCode::kAlreadyExists;
  return ErrorCode::kInternalError;
}

// Map redis++ exceptions onto ErrorCode. Reply errors are bugs (bad
// script, wrong type), everything else means the server is unreachable.
template <typename V, typename Op>
expected<V, ErrorCode> guarded(const char* what, Op&& op) {
  try {
    return op();
  } catch (const sw::redis::ReplyError& e) {
    POLLCAST_LOG_ERROR(std::string("redis ") + what + ": " + e.what());
    return expected<V, ErrorCode>::error(ErrorCode::kInternalError);
  } catch (const sw::redis::Error& e) {
    POLLCAST_LOG_WARN(std::string("redis ") + what + ": " + e.what());
    return expected<V, ErrorCode>::error(ErrorCode::kBackendUnavailable);
  }
}

}  // namespace

// ============================================================================
// Stream
// ============================================================================

class RedisStore::Stream final : public EventStream {
 public:
  explicit Stream(sw::redis::Subscriber&& sub) : sub_(std::move(sub)) {
    sub_.on_pmessage([this](std::string, std::string channel, std::string msg) {
      auto event = codec::decode_event(msg);
      if (!event) {
        POLLCAST_LOG_WARN("redis: dropping malformed event on " + channel);
        return;
      }
      pending_.push_back(std::move(event.value()));
    });
  }

  void psubscribe(const std::string& pattern) { sub_.psubscribe(pattern); }

  // Blocks for at most kSubscriberReadTimeout regardless of `timeout`
  expected<ChangeEvent, ErrorCode> next(std::chrono::milliseconds) override {
    if (closed_.load(std::memory_order_acquire)) {
      return expected<ChangeEvent, ErrorCode>::error(ErrorCode::kBackendUnavailable);
    }
    if (pending_.empty()) {
      try {
        sub_.consume();
      } catch (const sw::redis::TimeoutError&) {
        return expected<ChangeEvent, ErrorCode>::error(ErrorCode::kTimeout);
      } catch (const sw::redis::Error& e) {
        POLLCAST_LOG_WARN(std::string("redis subscriber lost: ") + e.what());
        closed_.store(true, std::memory_order_release);
        return expected<ChangeEvent, ErrorCode>::error(ErrorCode::kBackendUnavailable);
      }
    }
    if (pending_.empty()) {
      // psubscribe confirmation or a dropped malformed message
      return expected<ChangeEvent, ErrorCode>::error(ErrorCode::kTimeout);
    }
    ChangeEvent event = std::move(pending_.front());
    pending_.pop_front();
    return expected<ChangeEvent, ErrorCode>::success(std::move(event));
  }

  // The subscriber itself is only touched by the next() thread; the flag
  // is seen within one read timeout.
  void close() override { closed_.store(true, std::memory_order_release); }

 private:
  sw::redis::Subscriber sub_;
  std::deque<ChangeEvent> pending_;
  std::atomic<bool> closed_{false};
};

// ============================================================================
// RedisStore
// ============================================================================

RedisStore::RedisStore(const std::string& url) : url_(url) {
  try {
    sw::redis::ConnectionOptions opts(url_);
    sw::redis::ConnectionPoolOptions pool_opts;
    pool_opts.size = 4;
    redis_ = std::make_unique<sw::redis::Redis>(opts, pool_opts);

    sw::redis::ConnectionOptions sub_opts(url_);
    sub_opts.socket_timeout = kSubscriberReadTimeout;
    sub_redis_ = std::make_unique<sw::redis::Redis>(sub_opts);
  } catch (const sw::redis::Error& e) {
    POLLCAST_THROW(std::runtime_error("Invalid Redis URL " + url_ + ": " + e.what()));
  }
  POLLCAST_LOG_INFO("redis store using " + url_);
}

RedisStore::~RedisStore() = default;

expected<void, ErrorCode> RedisStore::create(const Poll& poll) {
  return guarded<void>("create", [&]() {
    std::vector<std::string> keys = {poll_key(poll.id), kPollSetKey};
    std::vector<std::string> args = {poll.id,
                                     "question", poll.question,
                                     "description", poll.description,
                                     "closed", poll.closed ? "1" : "0",
                                     "created_at", std::to_string(poll.created_at_ms),
                                     "sequence", std::to_string(poll.sequence),
                                     "options", codec::encode_labels(poll.options)};
    for (const auto& opt : poll.options) {
      args.push_back("count:" + opt.label);
      args.push_back(std::to_string(opt.count));
    }

    std::vector<std::string> reply;
    redis_->eval(kCreateScript, keys.begin(), keys.end(), args.begin(), args.end(), std::back_inserter(reply));
    if (reply.empty() || reply.front() != "ok") {
      return expected<void, ErrorCode>::error(status_to_error(reply.empty() ? "" : reply.front()));
    }
    return expected<void, ErrorCode>::success();
  });
}

expected<Poll, ErrorCode> RedisStore::read(const std::string& poll_id) {
  return guarded<Poll>("read", [&]() {
    FieldMap fields;
    redis_->hgetall(poll_key(poll_id), std::inserter(fields, fields.end()));
    if (fields.empty()) return expected<Poll, ErrorCode>::error(ErrorCode::kPollNotFound);
    return poll_from_fields(poll_id, fields);
  });
}

expected<std::vector<Poll>, ErrorCode> RedisStore::list() {
  using Result = expected<std::vector<Poll>, ErrorCode>;
  return guarded<std::vector<Poll>>("list", [&]() {
    std::vector<std::string> ids;
    redis_->smembers(kPollSetKey, std::back_inserter(ids));

    std::vector<Poll> polls;
    for (const auto& id : ids) {
      auto poll = read(id);
      if (poll) {
        polls.push_back(std::move(poll.value()));
      } else if (poll.get_error() != ErrorCode::kPollNotFound) {
        return Result::error(poll.get_error());
      }
    }
    std::sort(polls.begin(), polls.end(),
              [](const Poll& a, const Poll& b) { return a.created_at_ms < b.created_at_ms; });
    return Result::success(std::move(polls));
  });
}

expected<VoteResult, ErrorCode> RedisStore::increment(const std::string& poll_id, const std::string& label) {
  return guarded<VoteResult>("increment", [&]() {
    std::vector<std::string> reply;
    redis_->eval(kIncrementScript, {poll_key(poll_id)}, {label}, std::back_inserter(reply));
    if (reply.empty() || reply.front() != "ok") {
      return expected<VoteResult, ErrorCode>::error(status_to_error(reply.empty() ? "" : reply.front()));
    }
    FieldMap fields = fields_from_flat(reply, 1);
    auto poll = poll_from_fields(poll_id, fields);
    if (!poll) return expected<VoteResult, ErrorCode>::error(poll.get_error());

    VoteResult result;
    const PollOption* opt = poll.value().find_option(label);
    result.new_count = opt != nullptr ? opt->count : 0;
    result.snapshot = std::move(poll.value());
    return expected<VoteResult, ErrorCode>::success(std::move(result));
  });
}

expected<CloseResult, ErrorCode> RedisStore::close(const std::string& poll_id) {
  return guarded<CloseResult>("close", [&]() {
    std::vector<std::string> reply;
    redis_->eval(kCloseScript, {poll_key(poll_id)}, {}, std::back_inserter(reply));
    if (reply.empty() || (reply.front() != "changed" && reply.front() != "unchanged")) {
      return expected<CloseResult, ErrorCode>::error(status_to_error(reply.empty() ? "" : reply.front()));
    }
    FieldMap fields = fields_from_flat(reply, 1);
    auto poll = poll_from_fields(poll_id, fields);
    if (!poll) return expected<CloseResult, ErrorCode>::error(poll.get_error());

    CloseResult result;
    result.changed = reply.front() == "changed";
    result.snapshot = std::move(poll.value());
    return expected<CloseResult, ErrorCode>::success(std::move(result));
  });
}

expected<Poll, ErrorCode> RedisStore::remove(const std::string& poll_id) {
  return guarded<Poll>("remove", [&]() {
    std::vector<std::string> reply;
    redis_->eval(kRemoveScript, {poll_key(poll_id), std::string(kPollSetKey)}, {poll_id},
                 std::back_inserter(reply));
    if (reply.empty() || reply.front() != "ok") {
      return expected<Poll, ErrorCode>::error(status_to_error(reply.empty() ? "" : reply.front()));
    }
    FieldMap fields = fields_from_flat(reply, 1);
    return poll_from_fields(poll_id, fields);
  });
}

expected<void, ErrorCode> RedisStore::publish(const ChangeEvent& event) {
  return guarded<void>("publish", [&]() {
    redis_->publish(channel_for(event.poll_id), codec::encode_event(event));
    return expected<void, ErrorCode>::success();
  });
}

expected<std::shared_ptr<EventStream>, ErrorCode> RedisStore::subscribe(const std::string& pattern) {
  using Result = expected<std::shared_ptr<EventStream>, ErrorCode>;
  return guarded<std::shared_ptr<EventStream>>("subscribe", [&]() {
    auto stream = std::make_shared<Stream>(sub_redis_->subscriber());
    stream->psubscribe(pattern);
    return Result::success(std::shared_ptr<EventStream>(stream));
  });
}

expected<void, ErrorCode> RedisStore::ping() {
  return guarded<void>("ping", [&]() {
    redis_->ping();
    return expected<void, ErrorCode>::success();
  });
}

}  // namespace pollcast
