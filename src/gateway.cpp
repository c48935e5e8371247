#include "pollcast/gateway.hpp"

#include "pollcast/codec.hpp"
#include "pollcast/log.hpp"
#include "pollcast/ws_channel.hpp"

#include <vector>

namespace pollcast {

namespace {

const char* error_message(ErrorCode code) {
  switch (code) {
    case ErrorCode::kPollNotFound: return "Poll not found";
    case ErrorCode::kOptionNotFound: return "Option not found";
    case ErrorCode::kPollClosed: return "Poll is closed";
    case ErrorCode::kInvalidArgument: return "Invalid request";
    case ErrorCode::kBackendUnavailable: return "Store unavailable, try again later";
    default: return "Internal server error";
  }
}

HttpResponse error_response(ErrorCode code) {
  return HttpResponse::json(http_status_for(code), codec::envelope_error(error_message(code)));
}

HttpResponse bad_request(const std::string& message) {
  return HttpResponse::json(400, codec::envelope_error(message));
}

HttpResponse route_not_found() { return HttpResponse::json(404, codec::envelope_error("Route not found")); }

// "/ws" -> "", "/ws/abc" -> "abc". false for any other path.
bool poll_id_from_ws_path(const std::string& path, std::string& poll_id) {
  auto segments = split_path(path);
  if (segments.empty() || segments[0] != "ws") return false;
  if (segments.size() == 1) {
    poll_id.clear();
    return true;
  }
  if (segments.size() == 2) {
    poll_id = segments[1];
    return true;
  }
  return false;
}

}  // namespace

int http_status_for(ErrorCode code) {
  switch (code) {
    case ErrorCode::kPollNotFound: return 404;
    case ErrorCode::kPollClosed: return 409;
    case ErrorCode::kOptionNotFound:
    case ErrorCode::kInvalidArgument: return 400;
    case ErrorCode::kBackendUnavailable: return 503;
    default: return 500;
  }
}

void PollGateway::attach(Server& server) {
  server_ = &server;
  server.on_connect = [this](const ConnPtr& conn) { handle_open(conn); };
  server.on_message = [this](const ConnPtr& conn, std::string_view msg) { handle_message(conn, msg); };
  server.on_close = [this](const ConnPtr& conn, bool) { handle_close(conn); };
  server.on_error = [](const ConnPtr& conn) {
    POLLCAST_LOG_DEBUG("conn " + std::to_string(conn->get_id()) + " error: " + to_string(conn->get_last_error()));
  };
  server.on_backpressure = [](const ConnPtr& conn) {
    POLLCAST_LOG_WARN("conn " + std::to_string(conn->get_id()) + " is slow, TX buffer above high watermark");
  };
  server.on_drain = [this](const ConnPtr& conn) { handle_drain(conn); };
  server.on_http = [this](const ConnPtr&, const HttpRequest& req) { return handle_http(req); };
}

// ============================================================================
// WebSocket
// ============================================================================

void PollGateway::handle_open(const ConnPtr& conn) {
  std::string poll_id;
  if (!poll_id_from_ws_path(conn->path(), poll_id)) {
    POLLCAST_LOG_DEBUG("conn " + std::to_string(conn->get_id()) + ": no WebSocket endpoint at " + conn->path());
    conn->close(1008);
    return;
  }

  RegistryId id = registry_.register_channel(std::make_shared<WsChannel>(conn));
  ids_[conn->get_id()] = id;
  POLLCAST_LOG_DEBUG("conn " + std::to_string(conn->get_id()) + " registered as subscriber " + std::to_string(id));

  if (!poll_id.empty()) subscribe(id, poll_id);
}

void PollGateway::handle_message(const ConnPtr& conn, std::string_view msg) {
  auto it = ids_.find(conn->get_id());
  if (it == ids_.end()) return;
  RegistryId id = it->second;

  auto control = codec::parse_control(msg);
  if (!control) {
    send_error(id, "Malformed control message");
    return;
  }

  switch (control.value().type) {
    case codec::ControlMessage::Type::kSubscribe:
      subscribe(id, control.value().poll_id);
      break;
    case codec::ControlMessage::Type::kUnsubscribe:
      unsubscribe(id);
      break;
    case codec::ControlMessage::Type::kPing: {
      auto sent = dispatcher_.send_to(id, codec::encode_pong());
      if (!sent) POLLCAST_LOG_DEBUG("pong to subscriber " + std::to_string(id) + " failed");
      break;
    }
  }
}

void PollGateway::handle_close(const ConnPtr& conn) {
  auto it = ids_.find(conn->get_id());
  if (it == ids_.end()) return;  // HTTP request or rejected path
  RegistryId id = it->second;
  ids_.erase(it);

  // Already gone if the dispatcher dropped it after a failed send
  auto removal = registry_.deregister(id);
  if (removal.removed) {
    POLLCAST_LOG_DEBUG("subscriber " + std::to_string(id) + " disconnected");
    dispatcher_.notify_viewers(removal.poll_id);
  }
}

void PollGateway::handle_drain(const ConnPtr& conn) {
  auto it = ids_.find(conn->get_id());
  if (it == ids_.end()) return;
  dispatcher_.flush(it->second);
}

// Subscribe before reading so an update committed in between is delivered
// by the dispatcher; the sequence gate then discards whichever of the two
// snapshots is older.
void PollGateway::subscribe(RegistryId id, const std::string& poll_id) {
  auto previous = registry_.subscribe(id, poll_id);
  if (!previous) return;

  auto poll = engine_.get_poll(poll_id);
  if (!poll) {
    auto left = registry_.unsubscribe(id);
    if (!left) return;  // dropped meanwhile
    dispatcher_.notify_viewers(previous.value());
    send_error(id, poll.get_error() == ErrorCode::kPollNotFound ? "Poll not found" : "Poll unavailable");
    return;
  }

  auto sent = dispatcher_.send_snapshot(id, poll.value());
  if (!sent) return;  // dropped, viewers already told

  if (previous.value() != poll_id) {
    dispatcher_.notify_viewers(previous.value());
    dispatcher_.notify_viewers(poll_id);
  }
}

void PollGateway::unsubscribe(RegistryId id) {
  auto left = registry_.unsubscribe(id);
  if (left) dispatcher_.notify_viewers(left.value());
}

void PollGateway::send_error(RegistryId id, std::string_view message) {
  auto sent = dispatcher_.send_to(id, codec::encode_error(message));
  if (!sent) POLLCAST_LOG_DEBUG("error reply to subscriber " + std::to_string(id) + " failed");
}

// ============================================================================
// REST
// ============================================================================

HttpResponse PollGateway::handle_http(const HttpRequest& req) {
  auto segments = split_path(req.path);
  if (segments.size() < 3 || segments[0] != "api" || segments[1] != "v1") return route_not_found();

  if (segments[2] == "health") {
    if (segments.size() == 3 && req.method == "GET") return health();
    return route_not_found();
  }
  if (segments[2] != "polls") return route_not_found();

  if (segments.size() == 3) {
    if (req.method == "GET") return list_polls();
    if (req.method == "POST") return create_poll(req);
  } else if (segments.size() == 4) {
    if (req.method == "GET") return get_poll(segments[3]);
    if (req.method == "DELETE") return delete_poll(segments[3]);
  } else if (segments.size() == 5 && req.method == "POST") {
    if (segments[4] == "vote") return vote(segments[3], req);
    if (segments[4] == "close") return close_poll(segments[3]);
  }
  return route_not_found();
}

HttpResponse PollGateway::create_poll(const HttpRequest& req) {
  auto body = codec::parse(req.body);
  if (!body || !body.value().isObject()) return bad_request("Request body must be a JSON object");
  const Json::Value& root = body.value();

  if (!root["question"].isString()) return bad_request("Field 'question' is required");
  if (!root["description"].isNull() && !root["description"].isString()) {
    return bad_request("Field 'description' must be a string");
  }
  if (!root["options"].isArray()) return bad_request("Field 'options' must be an array of strings");

  std::vector<std::string> options;
  for (const auto& opt : root["options"]) {
    if (!opt.isString()) return bad_request("Field 'options' must be an array of strings");
    options.push_back(opt.asString());
  }

  auto poll = engine_.create_poll(options, root["question"].asString(), root["description"].asString());
  if (!poll) {
    if (poll.get_error() == ErrorCode::kInvalidArgument) {
      return bad_request("Options must be non-empty, unique and not blank");
    }
    return error_response(poll.get_error());
  }
  return HttpResponse::json(200,
                            codec::envelope_success("Poll created successfully", codec::poll_to_json(poll.value())));
}

HttpResponse PollGateway::list_polls() {
  auto polls = engine_.list_polls();
  if (!polls) return error_response(polls.get_error());

  Json::Value data(Json::arrayValue);
  for (const auto& poll : polls.value()) data.append(codec::poll_to_json(poll));
  std::string message = "Retrieved " + std::to_string(polls.value().size()) + " polls successfully";
  return HttpResponse::json(200, codec::envelope_success(message, data));
}

HttpResponse PollGateway::get_poll(const std::string& poll_id) {
  auto poll = engine_.get_poll(poll_id);
  if (!poll) return error_response(poll.get_error());
  return HttpResponse::json(200,
                            codec::envelope_success("Poll retrieved successfully", codec::poll_to_json(poll.value())));
}

HttpResponse PollGateway::vote(const std::string& poll_id, const HttpRequest& req) {
  auto body = codec::parse(req.body);
  if (!body || !body.value().isObject() || !body.value()["option"].isString()) {
    return bad_request("Field 'option' is required");
  }
  const std::string label = body.value()["option"].asString();

  auto result = engine_.cast_vote(poll_id, label);
  if (!result) return error_response(result.get_error());

  Json::Value data(Json::objectValue);
  data["pollId"] = poll_id;
  data["option"] = label;
  data["newCount"] = Json::Int64(result.value().new_count);
  data["sequence"] = Json::UInt64(result.value().snapshot.sequence);
  return HttpResponse::json(200, codec::envelope_success("Vote recorded for '" + label + "'", data));
}

HttpResponse PollGateway::close_poll(const std::string& poll_id) {
  auto poll = engine_.close_poll(poll_id);
  if (!poll) return error_response(poll.get_error());
  return HttpResponse::json(200,
                            codec::envelope_success("Poll " + poll_id + " closed", codec::poll_to_json(poll.value())));
}

HttpResponse PollGateway::delete_poll(const std::string& poll_id) {
  auto removed = engine_.delete_poll(poll_id);
  if (!removed) return error_response(removed.get_error());

  Json::Value data(Json::objectValue);
  data["pollId"] = poll_id;
  return HttpResponse::json(200, codec::envelope_success("Poll " + poll_id + " deleted successfully", data));
}

HttpResponse PollGateway::health() {
  const bool store_ok = static_cast<bool>(engine_.store().ping());

  Json::Value data(Json::objectValue);
  data["store"] = store_ok ? "connected" : "disconnected";
  data["backend"] = engine_.store().name();
  data["subscribers"] = Json::UInt64(registry_.size());
  data["publishFailures"] = Json::UInt64(engine_.publish_failures());

  const auto& ds = dispatcher_.stats();
  Json::Value dispatch(Json::objectValue);
  dispatch["events"] = Json::UInt64(ds.events.load(std::memory_order_relaxed));
  dispatch["delivered"] = Json::UInt64(ds.delivered.load(std::memory_order_relaxed));
  dispatch["droppedStale"] = Json::UInt64(ds.dropped_stale.load(std::memory_order_relaxed));
  dispatch["failed"] = Json::UInt64(ds.failed.load(std::memory_order_relaxed));
  dispatch["held"] = Json::UInt64(ds.held.load(std::memory_order_relaxed));
  dispatch["skipped"] = Json::UInt64(ds.skipped.load(std::memory_order_relaxed));
  data["dispatch"] = dispatch;

  if (bridge_ != nullptr) {
    Json::Value bridge(Json::objectValue);
    bridge["subscribed"] = bridge_->is_subscribed();
    bridge["forwarded"] = Json::UInt64(bridge_->forwarded());
    bridge["reconnects"] = Json::UInt64(bridge_->reconnects());
    data["bridge"] = bridge;
  }

  if (server_ != nullptr) {
    const auto& ss = server_->stats();
    Json::Value server(Json::objectValue);
    server["activeConnections"] = Json::UInt64(ss.active_connections.load(std::memory_order_relaxed));
    server["totalConnections"] = Json::UInt64(ss.total_connections.load(std::memory_order_relaxed));
    server["rejectedConnections"] = Json::UInt64(ss.rejected_connections.load(std::memory_order_relaxed));
    server["handshakeErrors"] = Json::UInt64(ss.handshake_errors.load(std::memory_order_relaxed));
    data["server"] = server;
  }

  if (!store_ok) {
    return HttpResponse::json(503, codec::envelope_error("Service is unhealthy - store connection failed", data));
  }
  return HttpResponse::json(200, codec::envelope_success("Service is healthy", data));
}

}  // namespace pollcast
