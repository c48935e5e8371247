#include "pollcast/registry.hpp"

#include "pollcast/log.hpp"

namespace pollcast {

RegistryId ConnectionRegistry::register_channel(std::shared_ptr<Channel> channel) {
  std::lock_guard<std::mutex> lock(mutex_);
  RegistryId id = next_id_++;
  subscribers_.emplace(id, std::make_shared<Subscriber>(id, std::move(channel)));
  return id;
}

expected<std::string, ErrorCode> ConnectionRegistry::subscribe(RegistryId id, const std::string& poll_id) {
  if (poll_id.empty()) return expected<std::string, ErrorCode>::error(ErrorCode::kInvalidArgument);

  std::lock_guard<std::mutex> lock(mutex_);
  auto it = subscribers_.find(id);
  if (it == subscribers_.end()) return expected<std::string, ErrorCode>::error(ErrorCode::kUnknownSubscriber);

  std::string previous;
  {
    std::lock_guard<std::mutex> sub_lock(it->second->mutex);
    previous = it->second->poll_id;
    it->second->poll_id = poll_id;
  }
  if (previous != poll_id) {
    if (!previous.empty()) unindex(previous, id);
    by_poll_[poll_id].insert(id);
    POLLCAST_LOG_DEBUG("subscriber " + std::to_string(id) + " -> " + poll_id);
  }
  return expected<std::string, ErrorCode>::success(std::move(previous));
}

expected<std::string, ErrorCode> ConnectionRegistry::unsubscribe(RegistryId id) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = subscribers_.find(id);
  if (it == subscribers_.end()) return expected<std::string, ErrorCode>::error(ErrorCode::kUnknownSubscriber);

  std::string previous;
  {
    std::lock_guard<std::mutex> sub_lock(it->second->mutex);
    previous.swap(it->second->poll_id);
  }
  if (!previous.empty()) {
    unindex(previous, id);
    POLLCAST_LOG_DEBUG("subscriber " + std::to_string(id) + " left " + previous);
  }
  return expected<std::string, ErrorCode>::success(std::move(previous));
}

ConnectionRegistry::Removal ConnectionRegistry::deregister(RegistryId id) {
  Removal removal;
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = subscribers_.find(id);
  if (it == subscribers_.end()) return removal;

  SubscriberPtr sub = std::move(it->second);
  subscribers_.erase(it);
  {
    std::lock_guard<std::mutex> sub_lock(sub->mutex);
    removal.poll_id.swap(sub->poll_id);
  }
  if (!removal.poll_id.empty()) unindex(removal.poll_id, id);
  removal.removed = true;
  removal.channel = sub->channel;
  return removal;
}

std::vector<ConnectionRegistry::Removal> ConnectionRegistry::deregister_all() {
  std::vector<RegistryId> ids;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    ids.reserve(subscribers_.size());
    for (const auto& kv : subscribers_) ids.push_back(kv.first);
  }
  std::vector<Removal> out;
  for (RegistryId id : ids) {
    Removal removal = deregister(id);
    if (removal.removed) out.push_back(std::move(removal));
  }
  return out;
}

std::vector<SubscriberPtr> ConnectionRegistry::subscribers_of(const std::string& poll_id) const {
  std::vector<SubscriberPtr> out;
  std::lock_guard<std::mutex> lock(mutex_);
  auto idx = by_poll_.find(poll_id);
  if (idx == by_poll_.end()) return out;
  out.reserve(idx->second.size());
  for (RegistryId id : idx->second) {
    auto it = subscribers_.find(id);
    if (it != subscribers_.end()) out.push_back(it->second);
  }
  return out;
}

std::vector<SubscriberPtr> ConnectionRegistry::all() const {
  std::vector<SubscriberPtr> out;
  std::lock_guard<std::mutex> lock(mutex_);
  out.reserve(subscribers_.size());
  for (const auto& kv : subscribers_) out.push_back(kv.second);
  return out;
}

SubscriberPtr ConnectionRegistry::find(RegistryId id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = subscribers_.find(id);
  return it == subscribers_.end() ? nullptr : it->second;
}

expected<std::string, ErrorCode> ConnectionRegistry::subscription_of(RegistryId id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = subscribers_.find(id);
  if (it == subscribers_.end()) return expected<std::string, ErrorCode>::error(ErrorCode::kUnknownSubscriber);
  std::lock_guard<std::mutex> sub_lock(it->second->mutex);
  return expected<std::string, ErrorCode>::success(it->second->poll_id);
}

size_t ConnectionRegistry::viewer_count(const std::string& poll_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto idx = by_poll_.find(poll_id);
  return idx == by_poll_.end() ? 0 : idx->second.size();
}

size_t ConnectionRegistry::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return subscribers_.size();
}

// mutex_ held
void ConnectionRegistry::unindex(const std::string& poll_id, RegistryId id) {
  auto idx = by_poll_.find(poll_id);
  if (idx == by_poll_.end()) return;
  idx->second.erase(id);
  if (idx->second.empty()) by_poll_.erase(idx);
}

}  // namespace pollcast
