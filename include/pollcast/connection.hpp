/**
 * @file connection.hpp
 * @brief One client socket: ring buffers, HTTP/WebSocket state table,
 *        frame parsing and a TX path that other threads may push into.
 */

#ifndef POLLCAST_CONNECTION_HPP_
#define POLLCAST_CONNECTION_HPP_

#include "http.hpp"
#include "vocabulary.hpp"
#include "websocket.hpp"

#include <algorithm>
#include <array>
#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>

#include <sockpp/tcp_socket.h>
#include <sys/uio.h>

namespace pollcast {

// ============================================================================
// RingBuffer - Fixed-size circular buffer with iovec I/O
// ============================================================================

template <typename T, size_t Size>
class alignas(kCacheLine) RingBuffer {
 public:
  static constexpr size_t kCapacity = Size;
  RingBuffer() = default;

  bool push(const T* data, size_t len) {
    if (available() < len) return false;
    size_t first = std::min(len, kCapacity - write_idx_);
    std::copy(data, data + first, buffer_.data() + write_idx_);
    std::copy(data + first, data + len, buffer_.data());
    write_idx_ = (write_idx_ + len) % kCapacity;
    count_ += len;
    return true;
  }

  size_t peek(T* data, size_t max_len) const {
    size_t len = std::min(max_len, count_);
    size_t first = std::min(len, kCapacity - read_idx_);
    std::copy(buffer_.data() + read_idx_, buffer_.data() + read_idx_ + first, data);
    std::copy(buffer_.data(), buffer_.data() + (len - first), data + first);
    return len;
  }

  void advance(size_t len) {
    if (len > count_) len = count_;
    read_idx_ = (read_idx_ + len) % kCapacity;
    count_ -= len;
  }

  size_t size() const { return count_; }
  size_t available() const { return kCapacity - count_; }
  bool empty() const { return count_ == 0; }

  void clear() {
    read_idx_ = 0;
    write_idx_ = 0;
    count_ = 0;
  }

  // Readable region as up to two iovecs (for writev)
  size_t fill_iovec(struct iovec* iov, size_t max_iov) const {
    if (empty() || max_iov == 0) return 0;
    size_t contiguous = kCapacity - read_idx_;
    iov[0].iov_base = const_cast<T*>(buffer_.data() + read_idx_);
    if (contiguous >= count_) {
      iov[0].iov_len = count_;
      return 1;
    }
    iov[0].iov_len = contiguous;
    if (max_iov < 2) return 1;
    iov[1].iov_base = const_cast<T*>(buffer_.data());
    iov[1].iov_len = count_ - contiguous;
    return 2;
  }

  // Writable region as up to two iovecs (for readv)
  size_t fill_iovec_write(struct iovec* iov, size_t max_iov) const {
    size_t avail = available();
    if (avail == 0 || max_iov == 0) return 0;
    size_t contiguous = kCapacity - write_idx_;
    iov[0].iov_base = const_cast<T*>(buffer_.data() + write_idx_);
    if (contiguous >= avail) {
      iov[0].iov_len = avail;
      return 1;
    }
    iov[0].iov_len = contiguous;
    if (max_iov < 2) return 1;
    iov[1].iov_base = const_cast<T*>(buffer_.data());
    iov[1].iov_len = avail - contiguous;
    return 2;
  }

  void commit_write(size_t len) {
    if (len > available()) len = available();
    write_idx_ = (write_idx_ + len) % kCapacity;
    count_ += len;
  }

 private:
  alignas(kCacheLine) std::array<T, kCapacity> buffer_{};
  size_t read_idx_ = 0;
  size_t write_idx_ = 0;
  size_t count_ = 0;
};

// ============================================================================
// Connection state (function-pointer state machine, no virtual)
// ============================================================================

enum class ConnectionState : uint8_t {
  kHandshaking,  // Waiting for an HTTP request (upgrade or REST)
  kOpen,         // WebSocket connection established
  kClosing,      // Close frame or HTTP response queued, waiting for flush
  kClosed        // Socket closed, on_close delivered
};

class Connection;

using StateDataHandler = expected<void, ErrorCode> (*)(Connection& conn);
using StateSendHandler = expected<void, ErrorCode> (*)(Connection& conn, std::string_view payload);
using StateCloseHandler = expected<void, ErrorCode> (*)(Connection& conn, uint16_t code);

struct StateOps {
  ConnectionState state;
  StateDataHandler on_data;
  StateSendHandler on_send;
  StateCloseHandler on_close;
};

// ============================================================================
// Connection
// ============================================================================

/**
 * Threading: everything except send(), request_close(), get_state() and
 * has_data_to_send() belongs to the reactor thread. send() may be called
 * from any thread; it takes the TX lock and then pokes the reactor through
 * on_tx_ready. Callbacks other than on_backpressure run on the reactor.
 */
class alignas(kCacheLine) Connection : public std::enable_shared_from_this<Connection> {
 public:
  static constexpr size_t kRxBufferSize = 8192;
  static constexpr size_t kTxBufferSize = 65536;
  static constexpr size_t kHandshakeTimeout = 5000;                  // ms
  static constexpr size_t kCloseTimeout = 5000;                      // ms
  static constexpr size_t kTxHighWatermark = kTxBufferSize * 3 / 4;  // 75%
  static constexpr size_t kTxLowWatermark = kTxBufferSize / 4;       // 25%

  using ConnPtr = std::shared_ptr<Connection>;

  explicit Connection(sockpp::tcp_socket&& sock);
  ~Connection();

  Connection(const Connection&) = delete;
  Connection& operator=(const Connection&) = delete;

  // Reactor I/O
  expected<void, ErrorCode> handle_read();
  expected<void, ErrorCode> handle_write();

  // Queue a text frame. kConnectionClosed unless open, kBufferFull if the
  // whole frame does not fit (nothing is queued in that case, and writes
  // stay paused until on_drain).
  expected<void, ErrorCode> send(std::string_view payload);

  // Reactor thread: start the close handshake (open) or drop the socket.
  void close(uint16_t code = 1000);
  // Reactor thread: close the socket now, no close frame.
  void abort();
  // Any thread: ask the reactor to close(code) on its next pass.
  void request_close(uint16_t code = 1000);
  // Reactor: returns the pending close code and clears it, 0 if none.
  uint16_t take_close_request() { return close_requested_.exchange(0, std::memory_order_acq_rel); }

  // Reactor: close queued and TX drained, socket can go.
  bool ready_to_finish() const { return close_after_flush_ && !has_data_to_send(); }
  void finish_close() { shutdown_socket(true); }

  bool is_closed() const { return get_state() == ConnectionState::kClosed; }
  bool has_data_to_send() const;
  int get_fd() const { return socket_.handle(); }
  uint64_t get_id() const { return id_; }
  const std::string& path() const { return path_; }
  bool is_websocket() const { return upgraded_; }

  // Backpressure
  bool is_write_paused() const { return write_paused_.load(std::memory_order_relaxed); }
  size_t tx_buffer_usage() const;

  bool is_handshake_timed_out() const {
    if (get_state() != ConnectionState::kHandshaking) return false;
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(SteadyClock::now() - created_at_).count();
    return static_cast<size_t>(elapsed) > kHandshakeTimeout;
  }

  bool is_close_timed_out() const {
    if (get_state() != ConnectionState::kClosing) return false;
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(SteadyClock::now() - closing_at_).count();
    return static_cast<size_t>(elapsed) > kCloseTimeout;
  }

  void touch_activity() { last_activity_ = SteadyClock::now(); }
  uint64_t idle_ms() const {
    return static_cast<uint64_t>(
        std::chrono::duration_cast<std::chrono::milliseconds>(SteadyClock::now() - last_activity_).count());
  }

  // Callbacks
  std::function<void(const ConnPtr&)> on_open;
  std::function<void(const ConnPtr&, std::string_view)> on_message;
  std::function<void(const ConnPtr&, bool)> on_close;  // bool: clean close
  std::function<void(const ConnPtr&)> on_error;
  std::function<void(const ConnPtr&)> on_backpressure;
  std::function<void(const ConnPtr&)> on_drain;
  std::function<HttpResponse(const ConnPtr&, const HttpRequest&)> on_http;
  std::function<void()> on_tx_ready;

  ConnectionState get_state() const { return ops_.load(std::memory_order_acquire)->state; }
  ErrorCode get_last_error() const { return last_error_code_; }

  // Internal API (public to avoid friend, used by state handlers)
  void transition_to_state(ConnectionState state);
  expected<void, ErrorCode> parse_request();
  expected<void, ErrorCode> parse_frames(bool closing);
  // kBufferFull: no room for the frame. kConnectionClosed: a Close frame is
  // already queued.
  expected<void, ErrorCode> write_frame(std::string_view payload, ws::OpCode opcode);
  expected<void, ErrorCode> write_close_frame(uint16_t code);
  void queue_raw(std::string_view data);
  void shutdown_socket(bool clean);
  void discard_input() { rx_buffer_.clear(); }

 private:
  using SteadyClock = std::chrono::steady_clock;
  using TimePoint = SteadyClock::time_point;

  uint64_t id_;
  sockpp::tcp_socket socket_;
  RingBuffer<uint8_t, kRxBufferSize> rx_buffer_;
  std::array<uint8_t, kRxBufferSize> scratch_{};

  mutable std::mutex tx_mutex_;
  RingBuffer<uint8_t, kTxBufferSize> tx_buffer_;  // guarded by tx_mutex_
  std::string tx_backlog_;                        // guarded by tx_mutex_, HTTP bodies only
  bool close_queued_ = false;                     // guarded by tx_mutex_

  std::atomic<const StateOps*> ops_;
  std::atomic<uint16_t> close_requested_{0};
  std::atomic<bool> write_paused_{false};
  bool close_after_flush_ = false;
  bool clean_close_ = false;
  bool upgraded_ = false;
  std::string path_;
  ErrorCode last_error_code_ = ErrorCode::kOk;

  TimePoint created_at_ = SteadyClock::now();
  TimePoint closing_at_{};
  TimePoint last_activity_ = SteadyClock::now();

  void refill_from_backlog();
};

}  // namespace pollcast

#endif  // POLLCAST_CONNECTION_HPP_
