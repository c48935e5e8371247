#include "pollcast/connection.hpp"

#include "pollcast/log.hpp"

#include <cerrno>

#include <unistd.h>

namespace pollcast {

// --- State handler functions ---

namespace detail {

expected<void, ErrorCode> handshake_on_data(Connection& conn) { return conn.parse_request(); }

expected<void, ErrorCode> handshake_on_send(Connection&, std::string_view) {
  return expected<void, ErrorCode>::error(ErrorCode::kInvalidState);
}

expected<void, ErrorCode> handshake_on_close(Connection& conn, uint16_t) {
  conn.shutdown_socket(false);
  return expected<void, ErrorCode>::success();
}

expected<void, ErrorCode> open_on_data(Connection& conn) { return conn.parse_frames(false); }

expected<void, ErrorCode> open_on_send(Connection& conn, std::string_view payload) {
  return conn.write_frame(payload, ws::OpCode::kText);
}

expected<void, ErrorCode> open_on_close(Connection& conn, uint16_t code) {
  auto queued = conn.write_close_frame(code);
  if (!queued) {
    conn.shutdown_socket(false);
    return queued;
  }
  conn.transition_to_state(ConnectionState::kClosing);
  return expected<void, ErrorCode>::success();
}

expected<void, ErrorCode> closing_on_data(Connection& conn) {
  if (!conn.is_websocket()) {
    // HTTP response pending, nothing more is read
    conn.discard_input();
    return expected<void, ErrorCode>::success();
  }
  return conn.parse_frames(true);
}

expected<void, ErrorCode> closing_on_send(Connection&, std::string_view) {
  return expected<void, ErrorCode>::error(ErrorCode::kConnectionClosed);
}

expected<void, ErrorCode> closing_on_close(Connection&, uint16_t) { return expected<void, ErrorCode>::success(); }

expected<void, ErrorCode> closed_on_data(Connection&) {
  return expected<void, ErrorCode>::error(ErrorCode::kConnectionClosed);
}

expected<void, ErrorCode> closed_on_send(Connection&, std::string_view) {
  return expected<void, ErrorCode>::error(ErrorCode::kConnectionClosed);
}

expected<void, ErrorCode> closed_on_close(Connection&, uint16_t) {
  return expected<void, ErrorCode>::error(ErrorCode::kConnectionClosed);
}

}  // namespace detail

// State operation tables (const, zero allocation)
static const StateOps kHandshakeOps = {ConnectionState::kHandshaking, detail::handshake_on_data,
                                       detail::handshake_on_send, detail::handshake_on_close};
static const StateOps kOpenOps = {ConnectionState::kOpen, detail::open_on_data, detail::open_on_send,
                                  detail::open_on_close};
static const StateOps kClosingOps = {ConnectionState::kClosing, detail::closing_on_data, detail::closing_on_send,
                                     detail::closing_on_close};
static const StateOps kClosedOps = {ConnectionState::kClosed, detail::closed_on_data, detail::closed_on_send,
                                    detail::closed_on_close};

// --- Connection implementation ---

namespace {

uint64_t next_conn_id() {
  static std::atomic<uint64_t> id{1};
  return id.fetch_add(1, std::memory_order_relaxed);
}

HttpResponse plain_response(int status) {
  HttpResponse res;
  res.status = status;
  res.content_type = "text/plain";
  res.body = http_reason(status);
  return res;
}

}  // namespace

Connection::Connection(sockpp::tcp_socket&& sock)
    : id_(next_conn_id()), socket_(std::move(sock)), ops_(&kHandshakeOps) {
  socket_.set_non_blocking(true);
}

Connection::~Connection() {
  if (socket_.is_open()) socket_.close();
}

expected<void, ErrorCode> Connection::handle_read() {
  struct iovec iov[2];
  size_t iov_count = rx_buffer_.fill_iovec_write(iov, 2);
  if (iov_count == 0) {
    last_error_code_ = ErrorCode::kBufferFull;
    return expected<void, ErrorCode>::error(ErrorCode::kBufferFull);
  }
  ssize_t n = ::readv(socket_.handle(), iov, static_cast<int>(iov_count));
  if (n > 0) {
    rx_buffer_.commit_write(static_cast<size_t>(n));
    touch_activity();
    last_error_code_ = ErrorCode::kOk;
    return ops_.load(std::memory_order_acquire)->on_data(*this);
  }
  if (n == 0) {
    last_error_code_ = ErrorCode::kConnectionClosed;
    return expected<void, ErrorCode>::error(ErrorCode::kConnectionClosed);
  }
  int err = errno;
  if (err != EAGAIN && err != EWOULDBLOCK && err != EINTR) {
    last_error_code_ = ErrorCode::kSocketError;
    return expected<void, ErrorCode>::error(ErrorCode::kSocketError);
  }
  return expected<void, ErrorCode>::success();
}

expected<void, ErrorCode> Connection::handle_write() {
  bool drained = false;
  {
    std::lock_guard<std::mutex> lock(tx_mutex_);
    if (tx_buffer_.empty()) {
      return expected<void, ErrorCode>::success();
    }
    struct iovec iov[2];
    size_t iov_count = tx_buffer_.fill_iovec(iov, 2);
    ssize_t n = ::writev(socket_.handle(), iov, static_cast<int>(iov_count));
    if (n < 0) {
      int err = errno;
      if (err != EAGAIN && err != EWOULDBLOCK && err != EINTR) {
        last_error_code_ = ErrorCode::kSocketError;
        return expected<void, ErrorCode>::error(ErrorCode::kSocketError);
      }
      return expected<void, ErrorCode>::success();
    }
    tx_buffer_.advance(static_cast<size_t>(n));
    refill_from_backlog();
    if (write_paused_.load(std::memory_order_relaxed) && tx_buffer_.size() < kTxLowWatermark) {
      write_paused_.store(false, std::memory_order_relaxed);
      drained = true;
    }
  }
  if (drained && on_drain) on_drain(shared_from_this());
  return expected<void, ErrorCode>::success();
}

expected<void, ErrorCode> Connection::send(std::string_view payload) {
  auto result = ops_.load(std::memory_order_acquire)->on_send(*this, payload);
  const bool full = !result && result.get_error() == ErrorCode::kBufferFull;
  if (!result && !full) return result;

  // A refused frame also pauses, so on_drain tells the sender when to retry
  if (!write_paused_.load(std::memory_order_relaxed) && (full || tx_buffer_usage() > kTxHighWatermark)) {
    write_paused_.store(true, std::memory_order_relaxed);
    if (on_backpressure) on_backpressure(shared_from_this());
  }
  if (on_tx_ready) on_tx_ready();
  return result;
}

void Connection::close(uint16_t code) {
  auto result = ops_.load(std::memory_order_acquire)->on_close(*this, code);
  if (!result) last_error_code_ = result.get_error();
}

void Connection::abort() { shutdown_socket(false); }

void Connection::request_close(uint16_t code) {
  close_requested_.store(code == 0 ? 1000 : code, std::memory_order_release);
  if (on_tx_ready) on_tx_ready();
}

bool Connection::has_data_to_send() const {
  std::lock_guard<std::mutex> lock(tx_mutex_);
  return !tx_buffer_.empty() || !tx_backlog_.empty();
}

size_t Connection::tx_buffer_usage() const {
  std::lock_guard<std::mutex> lock(tx_mutex_);
  return tx_buffer_.size() + tx_backlog_.size();
}

void Connection::transition_to_state(ConnectionState state) {
  switch (state) {
    case ConnectionState::kHandshaking:
      ops_.store(&kHandshakeOps, std::memory_order_release);
      break;
    case ConnectionState::kOpen:
      ops_.store(&kOpenOps, std::memory_order_release);
      if (on_open) on_open(shared_from_this());
      break;
    case ConnectionState::kClosing:
      ops_.store(&kClosingOps, std::memory_order_release);
      closing_at_ = SteadyClock::now();
      close_after_flush_ = true;
      break;
    case ConnectionState::kClosed:
      ops_.store(&kClosedOps, std::memory_order_release);
      if (on_close) on_close(shared_from_this(), clean_close_);
      break;
  }
}

void Connection::shutdown_socket(bool clean) {
  if (is_closed()) return;
  clean_close_ = clean;
  close_after_flush_ = false;
  socket_.close();
  transition_to_state(ConnectionState::kClosed);
}

expected<void, ErrorCode> Connection::parse_request() {
  size_t len = rx_buffer_.peek(scratch_.data(), scratch_.size());
  std::string_view data(reinterpret_cast<const char*>(scratch_.data()), len);

  HttpRequest req;
  auto parsed = parse_http_request(data, req);
  if (parsed && parsed.value() == 0 && rx_buffer_.available() > 0) {
    return expected<void, ErrorCode>::success();  // incomplete
  }
  if (!parsed || parsed.value() == 0) {
    // Malformed, or the request cannot fit the RX buffer
    bool too_large = !parsed ? parsed.get_error() == ErrorCode::kBufferFull : true;
    last_error_code_ = ErrorCode::kHandshakeFailed;
    rx_buffer_.clear();
    queue_raw(plain_response(too_large ? 413 : 400).serialize());
    transition_to_state(ConnectionState::kClosing);
    return expected<void, ErrorCode>::error(ErrorCode::kHandshakeFailed);
  }
  rx_buffer_.advance(parsed.value());

  if (req.is_websocket_upgrade()) {
    std::string response =
        "HTTP/1.1 101 Switching Protocols\r\n"
        "Upgrade: websocket\r\n"
        "Connection: Upgrade\r\n"
        "Sec-WebSocket-Accept: ";
    response += ws::accept_key(req.header("Sec-WebSocket-Key"));
    response += "\r\n\r\n";
    queue_raw(response);
    path_ = req.path;
    upgraded_ = true;
    transition_to_state(ConnectionState::kOpen);
    // Frames pipelined behind the upgrade request
    if (!rx_buffer_.empty() && get_state() == ConnectionState::kOpen) {
      return parse_frames(false);
    }
    return expected<void, ErrorCode>::success();
  }

  HttpResponse res = on_http ? on_http(shared_from_this(), req) : plain_response(404);
  queue_raw(res.serialize());
  rx_buffer_.clear();
  transition_to_state(ConnectionState::kClosing);
  return expected<void, ErrorCode>::success();
}

expected<void, ErrorCode> Connection::parse_frames(bool closing) {
  while (true) {
    size_t len = rx_buffer_.peek(scratch_.data(), scratch_.size());
    if (len == 0) break;

    std::string_view data(reinterpret_cast<const char*>(scratch_.data()), len);
    ws::FrameHeader header;
    size_t header_size = ws::parse_frame_header(data, header);
    if (header_size == 0) break;

    if (header.payload_len > kRxBufferSize - header_size || !header.masked) {
      // Oversized frame, or a client frame without a mask
      last_error_code_ = ErrorCode::kFrameParseError;
      rx_buffer_.clear();
      if (closing) {
        shutdown_socket(false);
      } else {
        close(header.masked ? 1009 : 1002);
      }
      return expected<void, ErrorCode>::error(ErrorCode::kFrameParseError);
    }

    size_t total_frame_size = header_size + static_cast<size_t>(header.payload_len);
    if (len < total_frame_size) break;

    uint8_t* payload = scratch_.data() + header_size;
    size_t payload_len = static_cast<size_t>(header.payload_len);
    ws::unmask(payload, payload_len, scratch_.data() + header_size - 4);
    rx_buffer_.advance(total_frame_size);

    if (closing) {
      // Waiting for the peer's close reply; everything else is discarded
      if (header.opcode == ws::OpCode::kClose) {
        shutdown_socket(true);
        return expected<void, ErrorCode>::success();
      }
      continue;
    }

    switch (header.opcode) {
      case ws::OpCode::kText:
      case ws::OpCode::kBinary:
        if (!header.fin) {
          // Fragmented messages are not supported
          last_error_code_ = ErrorCode::kFrameParseError;
          close(1003);
          return expected<void, ErrorCode>::error(ErrorCode::kFrameParseError);
        }
        if (on_message) {
          on_message(shared_from_this(), std::string_view(reinterpret_cast<const char*>(payload), payload_len));
        }
        if (get_state() != ConnectionState::kOpen) {
          return expected<void, ErrorCode>::success();
        }
        break;
      case ws::OpCode::kClose: {
        uint16_t code = 1000;
        if (payload_len >= 2) {
          code = static_cast<uint16_t>((payload[0] << 8) | payload[1]);
        }
        POLLCAST_LOG_DEBUG("conn " + std::to_string(id_) + " peer close " + std::to_string(code));
        close(code);
        return expected<void, ErrorCode>::success();
      }
      case ws::OpCode::kPing: {
        auto pong = write_frame(std::string_view(reinterpret_cast<const char*>(payload), payload_len), ws::OpCode::kPong);
        if (!pong) POLLCAST_LOG_DEBUG("conn " + std::to_string(id_) + " pong skipped: " + to_string(pong.get_error()));
        break;
      }
      case ws::OpCode::kPong:
        break;
      default:
        last_error_code_ = ErrorCode::kFrameParseError;
        close(1002);
        return expected<void, ErrorCode>::error(ErrorCode::kFrameParseError);
    }
  }

  if (rx_buffer_.available() == 0) {
    last_error_code_ = ErrorCode::kBufferFull;
    return expected<void, ErrorCode>::error(ErrorCode::kBufferFull);
  }
  return expected<void, ErrorCode>::success();
}

expected<void, ErrorCode> Connection::write_frame(std::string_view payload, ws::OpCode opcode) {
  uint8_t header_buf[ws::kMaxFrameHeader];
  size_t header_len = ws::encode_frame_header(header_buf, opcode, payload.size());

  std::lock_guard<std::mutex> lock(tx_mutex_);
  // A sender that saw kOpen just before the close was queued lands here
  if (close_queued_) {
    return expected<void, ErrorCode>::error(ErrorCode::kConnectionClosed);
  }
  if (!tx_backlog_.empty() || tx_buffer_.available() < header_len + payload.size()) {
    return expected<void, ErrorCode>::error(ErrorCode::kBufferFull);
  }
  tx_buffer_.push(header_buf, header_len);
  if (!payload.empty()) {
    tx_buffer_.push(reinterpret_cast<const uint8_t*>(payload.data()), payload.size());
  }
  if (opcode == ws::OpCode::kClose) close_queued_ = true;
  return expected<void, ErrorCode>::success();
}

expected<void, ErrorCode> Connection::write_close_frame(uint16_t code) {
  uint8_t close_payload[2];
  close_payload[0] = static_cast<uint8_t>((code >> 8) & 0xFF);
  close_payload[1] = static_cast<uint8_t>(code & 0xFF);
  return write_frame(std::string_view(reinterpret_cast<const char*>(close_payload), 2), ws::OpCode::kClose);
}

void Connection::queue_raw(std::string_view data) {
  std::lock_guard<std::mutex> lock(tx_mutex_);
  if (tx_backlog_.empty()) {
    size_t n = std::min(data.size(), tx_buffer_.available());
    tx_buffer_.push(reinterpret_cast<const uint8_t*>(data.data()), n);
    data.remove_prefix(n);
  }
  tx_backlog_.append(data.data(), data.size());
}

// tx_mutex_ held
void Connection::refill_from_backlog() {
  if (tx_backlog_.empty()) return;
  size_t n = std::min(tx_backlog_.size(), tx_buffer_.available());
  tx_buffer_.push(reinterpret_cast<const uint8_t*>(tx_backlog_.data()), n);
  tx_backlog_.erase(0, n);
}

}  // namespace pollcast
