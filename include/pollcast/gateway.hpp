/**
 * @file gateway.hpp
 * @brief Binds the reactor to the poll core.
 *
 * WebSocket:  /ws, /ws/{pollId}; control messages subscribe, unsubscribe
 *             and ping.
 * REST:       /api/v1/polls[...] and /api/v1/health, JSON envelope
 *             {"status","message","data"}.
 *
 * All handlers run on the reactor thread.
 */

#ifndef POLLCAST_GATEWAY_HPP_
#define POLLCAST_GATEWAY_HPP_

#include "dispatcher.hpp"
#include "event_bridge.hpp"
#include "http.hpp"
#include "poll_engine.hpp"
#include "registry.hpp"
#include "server.hpp"

#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>

namespace pollcast {

class PollGateway {
 public:
  using ConnPtr = std::shared_ptr<Connection>;

  PollGateway(PollEngine& engine, ConnectionRegistry& registry, BroadcastDispatcher& dispatcher)
      : engine_(engine), registry_(registry), dispatcher_(dispatcher) {}

  PollGateway(const PollGateway&) = delete;
  PollGateway& operator=(const PollGateway&) = delete;

  // Installs the callbacks. The gateway must outlive server.run().
  void attach(Server& server);

  // Reported by the health route when set
  void set_bridge(const EventBridge* bridge) { bridge_ = bridge; }

  void handle_open(const ConnPtr& conn);
  void handle_message(const ConnPtr& conn, std::string_view msg);
  void handle_close(const ConnPtr& conn);
  void handle_drain(const ConnPtr& conn);
  HttpResponse handle_http(const HttpRequest& req);

 private:
  PollEngine& engine_;
  ConnectionRegistry& registry_;
  BroadcastDispatcher& dispatcher_;
  const EventBridge* bridge_ = nullptr;
  const Server* server_ = nullptr;

  // Connection id -> registry id (reactor thread only)
  std::unordered_map<uint64_t, RegistryId> ids_;

  void subscribe(RegistryId id, const std::string& poll_id);
  void unsubscribe(RegistryId id);
  void send_error(RegistryId id, std::string_view message);

  HttpResponse create_poll(const HttpRequest& req);
  HttpResponse list_polls();
  HttpResponse get_poll(const std::string& poll_id);
  HttpResponse vote(const std::string& poll_id, const HttpRequest& req);
  HttpResponse close_poll(const std::string& poll_id);
  HttpResponse delete_poll(const std::string& poll_id);
  HttpResponse health();
};

// HTTP status for an engine error
int http_status_for(ErrorCode code);

}  // namespace pollcast

#endif  // POLLCAST_GATEWAY_HPP_
