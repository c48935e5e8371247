#include "pollcast/connection.hpp"

#include <string>
#include <string_view>
#include <vector>

#include <catch2/catch_test_macros.hpp>
#include <sys/socket.h>
#include <unistd.h>

using namespace pollcast;

namespace {

// An open Connection on one end of a socketpair; the test reads the other
struct PairedConnection {
  int peer = -1;
  std::shared_ptr<Connection> conn;

  PairedConnection() {
    int fds[2];
    REQUIRE(::socketpair(AF_UNIX, SOCK_STREAM, 0, fds) == 0);
    peer = fds[1];
    conn = std::make_shared<Connection>(sockpp::tcp_socket(fds[0]));
    conn->transition_to_state(ConnectionState::kOpen);
  }

  ~PairedConnection() {
    if (peer >= 0) ::close(peer);
  }

  // Writes out the TX buffer, returning what reached the peer
  std::string drain() {
    std::string wire;
    char buf[4096];
    while (conn->has_data_to_send()) {
      REQUIRE(conn->handle_write());
      for (;;) {
        ssize_t n = ::recv(peer, buf, sizeof(buf), MSG_DONTWAIT);
        if (n <= 0) break;
        wire.append(buf, static_cast<size_t>(n));
      }
    }
    return wire;
  }
};

struct WireFrame {
  ws::OpCode opcode;
  std::string payload;
};

std::vector<WireFrame> split_frames(std::string_view wire) {
  std::vector<WireFrame> frames;
  while (!wire.empty()) {
    ws::FrameHeader header;
    size_t header_len = ws::parse_frame_header(wire, header);
    REQUIRE(header_len > 0);
    REQUIRE(wire.size() >= header_len + header.payload_len);
    frames.push_back({header.opcode, std::string(wire.substr(header_len, header.payload_len))});
    wire.remove_prefix(header_len + header.payload_len);
  }
  return frames;
}

}  // namespace

TEST_CASE("Connection - nothing follows the close frame", "[connection]") {
  PairedConnection p;
  REQUIRE(p.conn->send("before"));

  p.conn->close(1000);
  REQUIRE(p.conn->get_state() == ConnectionState::kClosing);

  // A sender that read the open state before close() ran writes directly
  auto late = p.conn->write_frame("late", ws::OpCode::kText);
  REQUIRE(!late);
  REQUIRE(late.get_error() == ErrorCode::kConnectionClosed);
  REQUIRE(p.conn->send("after").get_error() == ErrorCode::kConnectionClosed);

  auto frames = split_frames(p.drain());
  REQUIRE(frames.size() == 2);
  REQUIRE(frames[0].opcode == ws::OpCode::kText);
  REQUIRE(frames[0].payload == "before");
  REQUIRE(frames[1].opcode == ws::OpCode::kClose);
  REQUIRE(frames[1].payload == std::string("\x03\xE8", 2));
}

TEST_CASE("Connection - a full TX buffer pauses until it drains", "[connection]") {
  PairedConnection p;
  bool backpressure = false;
  bool drained = false;
  p.conn->on_backpressure = [&backpressure](const Connection::ConnPtr&) { backpressure = true; };
  p.conn->on_drain = [&drained](const Connection::ConnPtr&) { drained = true; };

  const std::string chunk(1000, 'x');
  size_t queued = 0;
  for (;;) {
    auto sent = p.conn->send(chunk);
    if (!sent) {
      REQUIRE(sent.get_error() == ErrorCode::kBufferFull);
      break;
    }
    ++queued;
  }
  REQUIRE(queued > 0);
  REQUIRE(backpressure);
  REQUIRE(p.conn->is_write_paused());
  REQUIRE(!drained);

  auto frames = split_frames(p.drain());
  REQUIRE(frames.size() == queued);
  REQUIRE(drained);
  REQUIRE(!p.conn->is_write_paused());

  REQUIRE(p.conn->send(chunk));
}

TEST_CASE("Connection - a refused frame alone pauses writes", "[connection]") {
  PairedConnection p;
  bool drained = false;
  p.conn->on_drain = [&drained](const Connection::ConnPtr&) { drained = true; };

  // Queue just under the high watermark, then one frame that cannot fit
  const std::string chunk(1000, 'x');
  while (p.conn->tx_buffer_usage() + 2 * (chunk.size() + 4) < Connection::kTxHighWatermark) {
    REQUIRE(p.conn->send(chunk));
  }
  REQUIRE(!p.conn->is_write_paused());

  const std::string big(Connection::kTxBufferSize / 2, 'y');
  REQUIRE(p.conn->send(big).get_error() == ErrorCode::kBufferFull);
  REQUIRE(p.conn->is_write_paused());

  p.drain();
  REQUIRE(drained);
  REQUIRE(p.conn->send(big));
}
