#include "pollcast/server.hpp"

#include "pollcast/log.hpp"

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <stdexcept>

#include <arpa/inet.h>
#include <fcntl.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <sys/socket.h>
#include <unistd.h>

namespace pollcast {

// --- WakePipe ---

WakePipe::WakePipe() {
  if (::pipe2(fds_, O_NONBLOCK | O_CLOEXEC) < 0) {
    POLLCAST_THROW(std::runtime_error(std::string("Failed to create wake pipe: ") + strerror(errno)));
  }
}

WakePipe::~WakePipe() {
  if (fds_[0] >= 0) ::close(fds_[0]);
  if (fds_[1] >= 0) ::close(fds_[1]);
}

void WakePipe::notify() const {
  const char byte = 1;
  // EAGAIN means the pipe is already full, the reactor will wake anyway
  ssize_t n = ::write(fds_[1], &byte, 1);
  (void)n;
}

void WakePipe::drain() const {
  char buf[64];
  while (::read(fds_[0], buf, sizeof(buf)) > 0) {
  }
}

// --- Server ---

Server::Server(uint16_t port, const std::string& bind_addr)
    : port_(port), bind_addr_(bind_addr), wake_(std::make_shared<WakePipe>()) {
  server_sock_ = ::socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
  if (server_sock_ < 0) POLLCAST_THROW(std::runtime_error("Failed to create socket"));

  int reuse = 1;
  setsockopt(server_sock_, SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse));

  struct sockaddr_in addr;
  memset(&addr, 0, sizeof(addr));
  addr.sin_family = AF_INET;
  addr.sin_port = htons(port_);
  if (bind_addr_.empty()) {
    addr.sin_addr.s_addr = htonl(INADDR_ANY);
  } else if (inet_pton(AF_INET, bind_addr_.c_str(), &addr.sin_addr) != 1) {
    ::close(server_sock_);
    POLLCAST_THROW(std::runtime_error("Invalid bind address: " + bind_addr_));
  }

  if (bind(server_sock_, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) < 0) {
    int err = errno;
    ::close(server_sock_);
    POLLCAST_THROW(std::runtime_error("Failed to bind port " + std::to_string(port_) + ": " + strerror(err)));
  }

  if (listen(server_sock_, 128) < 0) {
    ::close(server_sock_);
    POLLCAST_THROW(std::runtime_error("Failed to listen"));
  }

  socklen_t len = sizeof(addr);
  if (getsockname(server_sock_, reinterpret_cast<struct sockaddr*>(&addr), &len) == 0) {
    port_ = ntohs(addr.sin_port);
  }

  fcntl(server_sock_, F_SETFL, O_NONBLOCK);
  POLLCAST_LOG_INFO("Server listening on " + (bind_addr_.empty() ? std::string("0.0.0.0") : bind_addr_) + ":" +
                    std::to_string(port_));
}

Server::~Server() {
  for (auto& conn : connections_) conn->abort();
  connections_.clear();
  if (server_sock_ >= 0) ::close(server_sock_);
}

void Server::run() {
  is_running_.store(true, std::memory_order_release);
  stats_.reset();

  while (!stop_requested_.load(std::memory_order_acquire)) {
    poll_once(poll_timeout_ms_, true);
  }

  drain_connections();
  is_running_.store(false, std::memory_order_release);
  POLLCAST_LOG_INFO("Server stopped");
}

void Server::poll_once(int timeout_ms, bool accepting) {
  size_t nfds = 0;
  poll_fds_[nfds++] = {server_sock_, static_cast<short>(accepting ? POLLIN : 0), 0};
  poll_fds_[nfds++] = {wake_->read_fd(), POLLIN, 0};

  for (uint32_t i = 0; i < connections_.size(); ++i) {
    short events = POLLIN;
    if (connections_[i]->has_data_to_send()) events |= POLLOUT;
    poll_fds_[nfds++] = {connections_[i]->get_fd(), events, 0};
  }

  auto poll_start = std::chrono::steady_clock::now();
  int ret = ::poll(poll_fds_.data(), static_cast<nfds_t>(nfds), timeout_ms);
  auto poll_end = std::chrono::steady_clock::now();

  uint64_t poll_us =
      static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::microseconds>(poll_end - poll_start).count());
  stats_.last_poll_latency_us.store(poll_us, std::memory_order_relaxed);
  if (poll_us > stats_.max_poll_latency_us.load(std::memory_order_relaxed)) {
    stats_.max_poll_latency_us.store(poll_us, std::memory_order_relaxed);
  }

  if (ret < 0 && errno != EINTR) {
    POLLCAST_LOG_ERROR(std::string("poll() failed: ") + strerror(errno));
    stop_requested_.store(true, std::memory_order_release);
    return;
  }

  if (ret > 0) {
    if (poll_fds_[1].revents & POLLIN) wake_->drain();

    if (accepting && (poll_fds_[0].revents & POLLIN)) {
      auto accepted = accept_connection();
      if (!accepted) {
        POLLCAST_LOG_WARN(std::string("accept: ") + to_string(accepted.get_error()));
      }
    }

    // Connections accepted above are appended and have no pollfd yet
    for (size_t i = 2; i < nfds; ++i) {
      handle_connection_io(connections_[static_cast<uint32_t>(i - 2)], poll_fds_[i]);
    }
  }

  service_connections();
  remove_closed_connections();
}

expected<void, ErrorCode> Server::accept_connection() {
  struct sockaddr_in client_addr;
  socklen_t client_addr_len = sizeof(client_addr);
  int client_sock = ::accept(server_sock_, reinterpret_cast<struct sockaddr*>(&client_addr), &client_addr_len);

  if (client_sock < 0) {
    int err = errno;
    if (err != EAGAIN && err != EWOULDBLOCK && err != EINTR) {
      stats_.socket_errors.fetch_add(1, std::memory_order_relaxed);
      return expected<void, ErrorCode>::error(ErrorCode::kSocketError);
    }
    return expected<void, ErrorCode>::success();
  }

  if (connections_.size() >= max_connections_ || connections_.full()) {
    ::close(client_sock);
    stats_.rejected_connections.fetch_add(1, std::memory_order_relaxed);
    return expected<void, ErrorCode>::error(ErrorCode::kMaxConnectionsExceeded);
  }

  fcntl(client_sock, F_SETFL, O_NONBLOCK);
  apply_tcp_tuning(client_sock);

  auto conn = std::make_shared<Connection>(sockpp::tcp_socket(client_sock));
  conn->on_open = on_connect;
  conn->on_message = on_message;
  conn->on_close = on_close;
  conn->on_error = on_error;
  conn->on_backpressure = on_backpressure;
  conn->on_drain = on_drain;
  conn->on_http = on_http;
  std::shared_ptr<WakePipe> wake = wake_;
  conn->on_tx_ready = [wake]() { wake->notify(); };

  POLLCAST_LOG_DEBUG("conn " + std::to_string(conn->get_id()) + " accepted");
  connections_.push_back(std::move(conn));
  stats_.total_connections.fetch_add(1, std::memory_order_relaxed);
  stats_.active_connections.fetch_add(1, std::memory_order_relaxed);
  return expected<void, ErrorCode>::success();
}

void Server::handle_connection_io(const ConnPtr& conn, const pollfd& pfd) {
  if (conn->is_closed()) return;

  if (pfd.revents & POLLIN) {
    auto result = conn->handle_read();
    if (!result) handle_read_error(conn, result.get_error());
  }
  if (!conn->is_closed() && (pfd.revents & POLLOUT)) {
    auto result = conn->handle_write();
    if (!result) {
      stats_.socket_errors.fetch_add(1, std::memory_order_relaxed);
      if (conn->on_error) conn->on_error(conn);
      conn->abort();
    }
  }
  if (!conn->is_closed() && (pfd.revents & (POLLERR | POLLNVAL))) {
    stats_.socket_errors.fetch_add(1, std::memory_order_relaxed);
    if (conn->on_error) conn->on_error(conn);
    conn->abort();
  } else if (!conn->is_closed() && (pfd.revents & POLLHUP) && !(pfd.revents & POLLIN)) {
    conn->abort();
  }
}

void Server::handle_read_error(const ConnPtr& conn, ErrorCode code) {
  switch (code) {
    case ErrorCode::kHandshakeFailed:
      // A 400/413 response is queued, the connection closes once it is flushed
      stats_.handshake_errors.fetch_add(1, std::memory_order_relaxed);
      break;
    case ErrorCode::kFrameParseError:
      POLLCAST_LOG_DEBUG("conn " + std::to_string(conn->get_id()) + " protocol error");
      break;
    case ErrorCode::kConnectionClosed:
      conn->abort();
      break;
    default:
      stats_.socket_errors.fetch_add(1, std::memory_order_relaxed);
      POLLCAST_LOG_WARN("conn " + std::to_string(conn->get_id()) + " read failed: " + to_string(code));
      if (conn->on_error) conn->on_error(conn);
      conn->abort();
      break;
  }
}

void Server::service_connections() {
  for (auto& conn : connections_) {
    if (conn->is_closed()) continue;

    uint16_t code = conn->take_close_request();
    if (code != 0) {
      if (conn->get_state() == ConnectionState::kOpen) {
        conn->close(code);
      } else if (conn->get_state() == ConnectionState::kHandshaking) {
        conn->abort();
      }
    }

    if (conn->ready_to_finish()) {
      conn->finish_close();
    } else if (conn->is_handshake_timed_out() || conn->is_close_timed_out()) {
      POLLCAST_LOG_DEBUG("conn " + std::to_string(conn->get_id()) + " timed out");
      conn->abort();
    }
  }
}

void Server::drain_connections() {
  for (auto& conn : connections_) {
    if (conn->get_state() == ConnectionState::kOpen) {
      conn->close(1001);  // going away
    } else if (conn->get_state() == ConnectionState::kHandshaking) {
      conn->abort();
    }
  }
  remove_closed_connections();

  auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(shutdown_timeout_ms_);
  while (!connections_.empty()) {
    auto remaining =
        std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now()).count();
    if (remaining <= 0) break;
    poll_once(static_cast<int>(std::min<long long>(remaining, poll_timeout_ms_)), false);
  }

  if (!connections_.empty()) {
    POLLCAST_LOG_WARN(std::to_string(connections_.size()) + " connection(s) did not drain, forcing close");
  }
  for (auto& conn : connections_) conn->abort();
  remove_closed_connections();
}

void Server::remove_closed_connections() {
  uint32_t removed = 0;
  uint32_t i = 0;
  while (i < connections_.size()) {
    if (connections_[i]->is_closed()) {
      connections_.erase_unordered(i);
      ++removed;
    } else {
      ++i;
    }
  }
  if (removed > 0) stats_.active_connections.fetch_sub(removed, std::memory_order_relaxed);
}

void Server::apply_tcp_tuning(int fd) {
  int opt = 1;
  if (tcp_tuning_.tcp_nodelay) setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &opt, sizeof(opt));
  if (tcp_tuning_.so_keepalive) {
    setsockopt(fd, SOL_SOCKET, SO_KEEPALIVE, &opt, sizeof(opt));
#ifdef TCP_KEEPIDLE
    setsockopt(fd, IPPROTO_TCP, TCP_KEEPIDLE, &tcp_tuning_.keepalive_idle_s, sizeof(tcp_tuning_.keepalive_idle_s));
#endif
#ifdef TCP_KEEPINTVL
    setsockopt(fd, IPPROTO_TCP, TCP_KEEPINTVL, &tcp_tuning_.keepalive_interval_s,
               sizeof(tcp_tuning_.keepalive_interval_s));
#endif
#ifdef TCP_KEEPCNT
    setsockopt(fd, IPPROTO_TCP, TCP_KEEPCNT, &tcp_tuning_.keepalive_count, sizeof(tcp_tuning_.keepalive_count));
#endif
  }
}

}  // namespace pollcast
