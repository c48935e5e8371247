/**
 * @file poll.hpp
 * @brief Poll value types and change events.
 */

#ifndef POLLCAST_POLL_HPP_
#define POLLCAST_POLL_HPP_

#include <cstdint>
#include <string>
#include <vector>

namespace pollcast {

struct PollOption {
  std::string label;
  int64_t count = 0;
};

/**
 * Snapshot of one poll as stored in the backend.
 *
 * sequence is bumped by every committed vote and by the first close, in the
 * same atomic step as the change itself, so it orders snapshots per poll.
 */
struct Poll {
  std::string id;
  std::string question;
  std::string description;
  std::vector<PollOption> options;
  bool closed = false;
  int64_t created_at_ms = 0;
  uint64_t sequence = 0;

  const PollOption* find_option(const std::string& label) const {
    for (const auto& opt : options) {
      if (opt.label == label) return &opt;
    }
    return nullptr;
  }

  int64_t total_votes() const {
    int64_t total = 0;
    for (const auto& opt : options) total += opt.count;
    return total;
  }
};

enum class EventKind : uint8_t {
  kUpdated = 0,  // vote or close, delivered to subscribers of poll_id
  kCreated = 1,  // delivered to every connection
  kDeleted = 2   // delivered to every connection, snapshot is the last state
};

const char* to_string(EventKind kind);

struct ChangeEvent {
  EventKind kind = EventKind::kUpdated;
  std::string poll_id;
  uint64_t sequence = 0;
  Poll snapshot;
};

struct VoteResult {
  int64_t new_count = 0;
  Poll snapshot;
};

struct CloseResult {
  bool changed = false;  // false if the poll was already closed
  Poll snapshot;
};

}  // namespace pollcast

#endif  // POLLCAST_POLL_HPP_
