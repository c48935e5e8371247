/**
 * @file registry.hpp
 * @brief Live connections and their (zero or one) poll subscription.
 *
 * Lock discipline:
 *   - mutex_ guards the id map and the per-poll index.
 *   - Subscriber::mutex guards that subscriber's poll_id, delivery gate and
 *     held frames, and serializes sends on its channel.
 *   - Order is always registry then subscriber. Nothing calls back into the
 *     registry while a subscriber lock is held.
 */

#ifndef POLLCAST_REGISTRY_HPP_
#define POLLCAST_REGISTRY_HPP_

#include "vocabulary.hpp"

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace pollcast {

// A live duplex connection as seen by the core. send() must be safe from
// any thread.
class Channel {
 public:
  virtual ~Channel() = default;

  virtual expected<void, ErrorCode> send(std::string_view payload) = 0;
  virtual void close() = 0;
};

using RegistryId = uint64_t;

struct Subscriber {
  Subscriber(RegistryId sid, std::shared_ptr<Channel> ch) : id(sid), channel(std::move(ch)) {}

  const RegistryId id;
  const std::shared_ptr<Channel> channel;

  std::mutex mutex;
  std::string poll_id;  // empty: not subscribed
  std::map<std::string, uint64_t> last_sequence;  // per poll, last delivered or held

  // Latest frames a full channel refused, replayed on drain. Only the newest
  // of each kind is kept, and only for held_poll.
  std::string held_poll;
  std::string held_update;
  std::string held_viewers;
  uint64_t held_floor = 0;  // last_sequence[held_poll] before the first hold
};

using SubscriberPtr = std::shared_ptr<Subscriber>;

class ConnectionRegistry {
 public:
  struct Removal {
    bool removed = false;  // false if the id was already gone
    std::string poll_id;   // subscription held at removal, may be empty
    std::shared_ptr<Channel> channel;
  };

  ConnectionRegistry() = default;
  ConnectionRegistry(const ConnectionRegistry&) = delete;
  ConnectionRegistry& operator=(const ConnectionRegistry&) = delete;

  RegistryId register_channel(std::shared_ptr<Channel> channel);

  // Replaces any existing subscription. Returns the poll left (may be empty).
  expected<std::string, ErrorCode> subscribe(RegistryId id, const std::string& poll_id);

  // Returns the poll left (may be empty)
  expected<std::string, ErrorCode> unsubscribe(RegistryId id);

  // Idempotent
  Removal deregister(RegistryId id);
  std::vector<Removal> deregister_all();

  // Snapshots, taken under the registry lock
  std::vector<SubscriberPtr> subscribers_of(const std::string& poll_id) const;
  std::vector<SubscriberPtr> all() const;
  SubscriberPtr find(RegistryId id) const;

  expected<std::string, ErrorCode> subscription_of(RegistryId id) const;
  size_t viewer_count(const std::string& poll_id) const;
  size_t size() const;

 private:
  mutable std::mutex mutex_;
  RegistryId next_id_ = 1;
  std::unordered_map<RegistryId, SubscriberPtr> subscribers_;
  std::unordered_map<std::string, std::set<RegistryId>> by_poll_;

  void unindex(const std::string& poll_id, RegistryId id);
};

}  // namespace pollcast

#endif  // POLLCAST_REGISTRY_HPP_
