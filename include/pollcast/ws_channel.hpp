/**
 * @file ws_channel.hpp
 * @brief Registry Channel over a reactor Connection.
 */

#ifndef POLLCAST_WS_CHANNEL_HPP_
#define POLLCAST_WS_CHANNEL_HPP_

#include "connection.hpp"
#include "registry.hpp"

#include <memory>

namespace pollcast {

// Holds the connection weakly: the reactor owns sockets, the registry only
// owns the subscription.
class WsChannel final : public Channel {
 public:
  explicit WsChannel(const std::shared_ptr<Connection>& conn) : conn_(conn) {}

  expected<void, ErrorCode> send(std::string_view payload) override {
    auto conn = conn_.lock();
    if (!conn) return expected<void, ErrorCode>::error(ErrorCode::kConnectionClosed);
    return conn->send(payload);
  }

  // Executed by the reactor on its next pass (1008: policy violation, the
  // usual reason is a subscriber that cannot keep up)
  void close() override {
    if (auto conn = conn_.lock()) conn->request_close(1008);
  }

 private:
  std::weak_ptr<Connection> conn_;
};

}  // namespace pollcast

#endif  // POLLCAST_WS_CHANNEL_HPP_
