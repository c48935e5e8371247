/**
 * @file server.hpp
 * @brief poll() reactor: accepts sockets, drives Connection I/O, enforces
 *        timeouts and drains open connections on shutdown.
 */

#ifndef POLLCAST_SERVER_HPP_
#define POLLCAST_SERVER_HPP_

#include "connection.hpp"
#include "vocabulary.hpp"

#include <array>
#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>

#include <poll.h>

namespace pollcast {

// ============================================================================
// ServerStats - Atomic counters, readable from any thread
// ============================================================================

struct alignas(kCacheLine) ServerStats {
  std::atomic<uint64_t> total_connections{0};
  std::atomic<uint64_t> active_connections{0};
  std::atomic<uint64_t> rejected_connections{0};
  std::atomic<uint64_t> handshake_errors{0};
  std::atomic<uint64_t> socket_errors{0};
  std::atomic<uint64_t> last_poll_latency_us{0};
  std::atomic<uint64_t> max_poll_latency_us{0};

  void reset() {
    total_connections = 0;
    active_connections = 0;
    rejected_connections = 0;
    handshake_errors = 0;
    socket_errors = 0;
    last_poll_latency_us = 0;
    max_poll_latency_us = 0;
  }
};

struct TcpTuning {
  bool tcp_nodelay = true;   // Disable Nagle algorithm
  bool so_keepalive = false;

  // Effective when so_keepalive=true (Linux-specific)
  int keepalive_idle_s = 60;
  int keepalive_interval_s = 10;
  int keepalive_count = 5;
};

// Self-pipe used to interrupt poll() from other threads and from signal
// handlers. Shared with every Connection so a late send never writes to a
// closed descriptor.
class WakePipe {
 public:
  WakePipe();
  ~WakePipe();

  WakePipe(const WakePipe&) = delete;
  WakePipe& operator=(const WakePipe&) = delete;

  void notify() const;  // async-signal-safe
  void drain() const;
  int read_fd() const { return fds_[0]; }

 private:
  int fds_[2] = {-1, -1};
};

// ============================================================================
// Server (single reactor thread)
// ============================================================================

class Server {
 public:
  using ConnPtr = std::shared_ptr<Connection>;

  // port 0 binds an ephemeral port, see port()
  explicit Server(uint16_t port, const std::string& bind_addr = "");
  ~Server();

  Server(const Server&) = delete;
  Server& operator=(const Server&) = delete;

  // Blocks until stop(). Open connections are drained before returning.
  void run();

  // Safe from any thread and from a signal handler
  void stop() {
    stop_requested_.store(true, std::memory_order_release);
    wake_->notify();
  }

  bool is_running() const { return is_running_.load(std::memory_order_acquire); }

  Server& set_max_connections(size_t max) {
    max_connections_ = max < kMaxConnections ? max : kMaxConnections;
    return *this;
  }

  Server& set_poll_timeout_ms(int timeout) {
    poll_timeout_ms_ = timeout;
    return *this;
  }

  Server& set_shutdown_timeout_ms(int timeout) {
    shutdown_timeout_ms_ = timeout;
    return *this;
  }

  Server& set_tcp_tuning(const TcpTuning& tuning) {
    tcp_tuning_ = tuning;
    return *this;
  }

  // Callbacks (reactor thread)
  std::function<void(const ConnPtr&)> on_connect;
  std::function<void(const ConnPtr&, std::string_view)> on_message;
  std::function<void(const ConnPtr&, bool)> on_close;
  std::function<void(const ConnPtr&)> on_error;
  std::function<void(const ConnPtr&)> on_backpressure;
  std::function<void(const ConnPtr&)> on_drain;
  std::function<HttpResponse(const ConnPtr&, const HttpRequest&)> on_http;

  uint16_t port() const { return port_; }
  size_t get_connection_count() const { return stats_.active_connections.load(std::memory_order_relaxed); }
  const ServerStats& stats() const { return stats_; }

  static constexpr size_t kMaxConnections = 64;

 private:
  uint16_t port_;
  std::string bind_addr_;
  int server_sock_ = -1;
  std::atomic<bool> is_running_{false};
  std::atomic<bool> stop_requested_{false};
  std::shared_ptr<WakePipe> wake_;

  FixedVector<ConnPtr, kMaxConnections> connections_;
  size_t max_connections_ = 50;
  int poll_timeout_ms_ = 100;
  int shutdown_timeout_ms_ = 2000;
  TcpTuning tcp_tuning_;

  // listener + wake pipe + one per connection
  std::array<pollfd, kMaxConnections + 2> poll_fds_{};

  ServerStats stats_;

  void poll_once(int timeout_ms, bool accepting);
  expected<void, ErrorCode> accept_connection();
  void handle_connection_io(const ConnPtr& conn, const pollfd& pfd);
  void handle_read_error(const ConnPtr& conn, ErrorCode code);
  void service_connections();
  void drain_connections();
  void remove_closed_connections();
  void apply_tcp_tuning(int fd);
};

}  // namespace pollcast

#endif  // POLLCAST_SERVER_HPP_
