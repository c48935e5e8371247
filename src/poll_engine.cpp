#include "pollcast/poll_engine.hpp"

#include "pollcast/log.hpp"

#include <chrono>
#include <cstdio>
#include <random>
#include <set>
#include <stdexcept>

namespace pollcast {

PollEngine::PollEngine(std::shared_ptr<Store> store, RetryPolicy retry)
    : store_(std::move(store)), retry_(retry) {
  if (!store_) POLLCAST_THROW(std::invalid_argument("PollEngine needs a store"));
}

expected<Poll, ErrorCode> PollEngine::create_poll(const std::vector<std::string>& options,
                                                  const std::string& question, const std::string& description) {
  if (options.empty()) return expected<Poll, ErrorCode>::error(ErrorCode::kInvalidArgument);
  std::set<std::string> seen;
  for (const auto& label : options) {
    if (label.empty() || !seen.insert(label).second) {
      return expected<Poll, ErrorCode>::error(ErrorCode::kInvalidArgument);
    }
  }

  Poll poll;
  poll.question = question;
  poll.description = description;
  poll.created_at_ms = now_ms();
  for (const auto& label : options) poll.options.push_back(PollOption{label, 0});

  // A 128-bit id collision is not expected; one retry covers it anyway
  for (int attempt = 0; attempt < 2; ++attempt) {
    poll.id = generate_id();
    auto created = retry_on_unavailable(retry_, "create", [&]() { return store_->create(poll); });
    if (created) {
      POLLCAST_LOG_INFO("poll " + poll.id + " created with " + std::to_string(poll.options.size()) + " options");
      publish(EventKind::kCreated, poll);
      return expected<Poll, ErrorCode>::success(std::move(poll));
    }
    if (created.get_error() != ErrorCode::kAlreadyExists) {
      return expected<Poll, ErrorCode>::error(created.get_error());
    }
  }
  return expected<Poll, ErrorCode>::error(ErrorCode::kInternalError);
}

expected<VoteResult, ErrorCode> PollEngine::cast_vote(const std::string& poll_id, const std::string& label) {
  // Fast rejection from a read; the increment re-checks atomically
  auto current = retry_on_unavailable(retry_, "read", [&]() { return store_->read(poll_id); });
  if (!current) return expected<VoteResult, ErrorCode>::error(current.get_error());
  if (current.value().closed) return expected<VoteResult, ErrorCode>::error(ErrorCode::kPollClosed);
  if (current.value().find_option(label) == nullptr) {
    return expected<VoteResult, ErrorCode>::error(ErrorCode::kOptionNotFound);
  }

  // Not idempotent, never retried
  auto result = store_->increment(poll_id, label);
  if (!result) return result;

  POLLCAST_LOG_DEBUG("vote " + poll_id + "/" + label + " -> " + std::to_string(result.value().new_count) +
                     " seq " + std::to_string(result.value().snapshot.sequence));
  publish(EventKind::kUpdated, result.value().snapshot);
  return result;
}

expected<Poll, ErrorCode> PollEngine::close_poll(const std::string& poll_id) {
  auto result = retry_on_unavailable(retry_, "close", [&]() { return store_->close(poll_id); });
  if (!result) return expected<Poll, ErrorCode>::error(result.get_error());

  if (result.value().changed) {
    POLLCAST_LOG_INFO("poll " + poll_id + " closed");
    publish(EventKind::kUpdated, result.value().snapshot);
  }
  return expected<Poll, ErrorCode>::success(std::move(result.value().snapshot));
}

expected<Poll, ErrorCode> PollEngine::get_poll(const std::string& poll_id) {
  return retry_on_unavailable(retry_, "read", [&]() { return store_->read(poll_id); });
}

expected<std::vector<Poll>, ErrorCode> PollEngine::list_polls() {
  return retry_on_unavailable(retry_, "list", [&]() { return store_->list(); });
}

expected<Poll, ErrorCode> PollEngine::delete_poll(const std::string& poll_id) {
  auto removed = retry_on_unavailable(retry_, "remove", [&]() { return store_->remove(poll_id); });
  if (!removed) return removed;

  POLLCAST_LOG_INFO("poll " + poll_id + " deleted");
  publish(EventKind::kDeleted, removed.value());
  return removed;
}

// The change is already committed; a lost event only delays watchers until
// the next change carries the full state again.
void PollEngine::publish(EventKind kind, const Poll& snapshot) {
  ChangeEvent event;
  event.kind = kind;
  event.poll_id = snapshot.id;
  event.sequence = snapshot.sequence;
  event.snapshot = snapshot;

  auto published = retry_on_unavailable(retry_, "publish", [&]() { return store_->publish(event); });
  if (!published) {
    publish_failures_.fetch_add(1, std::memory_order_relaxed);
    POLLCAST_LOG_WARN(std::string("publish ") + to_string(kind) + " for " + snapshot.id +
                      " failed: " + to_string(published.get_error()));
  }
}

std::string PollEngine::generate_id() {
  thread_local std::mt19937_64 rng{std::random_device{}()};
  char buf[33];
  std::snprintf(buf, sizeof(buf), "%016llx%016llx", static_cast<unsigned long long>(rng()),
                static_cast<unsigned long long>(rng()));
  return std::string(buf, 32);
}

int64_t PollEngine::now_ms() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch())
      .count();
}

}  // namespace pollcast
