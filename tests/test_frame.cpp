#include "pollcast/websocket.hpp"

#include <cstring>
#include <string>

#include <catch2/catch_test_macros.hpp>

using namespace pollcast;

namespace {

std::string_view as_view(const uint8_t* data, size_t len) {
  return std::string_view(reinterpret_cast<const char*>(data), len);
}

std::string hex(const SHA1::Digest& digest) {
  static const char kHex[] = "0123456789abcdef";
  std::string out;
  for (uint8_t b : digest) {
    out.push_back(kHex[b >> 4]);
    out.push_back(kHex[b & 0x0F]);
  }
  return out;
}

}  // namespace

// ============================================================================
// Handshake crypto
// ============================================================================

TEST_CASE("Base64 - padding variants", "[frame]") {
  REQUIRE(Base64::encode(reinterpret_cast<const uint8_t*>("f"), 1) == "Zg==");
  REQUIRE(Base64::encode(reinterpret_cast<const uint8_t*>("fo"), 2) == "Zm8=");
  REQUIRE(Base64::encode(reinterpret_cast<const uint8_t*>("foo"), 3) == "Zm9v");
  REQUIRE(Base64::encode(reinterpret_cast<const uint8_t*>("foobar"), 6) == "Zm9vYmFy");
  REQUIRE(Base64::encode(nullptr, 0).empty());
}

TEST_CASE("SHA1 - known digests", "[frame]") {
  REQUIRE(hex(SHA1::compute(reinterpret_cast<const uint8_t*>("abc"), 3)) ==
          "a9993e364706816aba3e25717850c26c9cd0d89d");
  REQUIRE(hex(SHA1::compute(nullptr, 0)) == "da39a3ee5e6b4b0d3255bfef95601890afd80709");
}

TEST_CASE("accept_key - RFC 6455 sample", "[frame]") {
  REQUIRE(ws::accept_key("dGhlIHNhbXBsZSBub25jZQ==") == "s3pPLMBiTxaQ9kYGzzhZRbK+xOo=");
}

// ============================================================================
// Header parsing
// ============================================================================

TEST_CASE("Frame parse - masked text frame", "[frame]") {
  uint8_t frame[] = {0x81, 0x85, 0x37, 0xfa, 0x21, 0x3d, 0x7f, 0x9f, 0x4d, 0x51, 0x58};
  ws::FrameHeader header;
  REQUIRE(ws::parse_frame_header(as_view(frame, sizeof(frame)), header) == 6);
  REQUIRE(header.fin);
  REQUIRE(header.opcode == ws::OpCode::kText);
  REQUIRE(header.masked);
  REQUIRE(header.payload_len == 5);

  ws::unmask(frame + 6, 5, frame + 2);
  REQUIRE(std::memcmp(frame + 6, "Hello", 5) == 0);
}

TEST_CASE("Frame parse - control opcodes", "[frame]") {
  uint8_t close_frame[] = {0x88, 0x02, 0x03, 0xE8};
  uint8_t ping_frame[] = {0x89, 0x00};
  ws::FrameHeader header;

  REQUIRE(ws::parse_frame_header(as_view(close_frame, sizeof(close_frame)), header) == 2);
  REQUIRE(header.opcode == ws::OpCode::kClose);
  REQUIRE(header.payload_len == 2);

  REQUIRE(ws::parse_frame_header(as_view(ping_frame, sizeof(ping_frame)), header) == 2);
  REQUIRE(header.opcode == ws::OpCode::kPing);
  REQUIRE(header.payload_len == 0);
}

TEST_CASE("Frame parse - 16-bit extended length above 127", "[frame]") {
  // 0xC8 = 200; a signed char here would sign-extend
  uint8_t frame[] = {0x82, 0x7E, 0x00, 0xC8};
  ws::FrameHeader header;
  REQUIRE(ws::parse_frame_header(as_view(frame, sizeof(frame)), header) == 4);
  REQUIRE(header.payload_len == 200);
}

TEST_CASE("Frame parse - 64-bit extended length", "[frame]") {
  uint8_t frame[] = {0x82, 0x7F, 0x00, 0x00, 0x00, 0x00, 0x00, 0x01, 0x00, 0x00};
  ws::FrameHeader header;
  REQUIRE(ws::parse_frame_header(as_view(frame, sizeof(frame)), header) == 10);
  REQUIRE(header.payload_len == 65536);
}

TEST_CASE("Frame parse - incomplete headers return 0", "[frame]") {
  ws::FrameHeader header;
  uint8_t one[] = {0x81};
  uint8_t short_ext[] = {0x81, 0x7E, 0x00};
  uint8_t short_mask[] = {0x81, 0x85, 0x37, 0xfa};
  REQUIRE(ws::parse_frame_header(as_view(one, sizeof(one)), header) == 0);
  REQUIRE(ws::parse_frame_header(as_view(short_ext, sizeof(short_ext)), header) == 0);
  REQUIRE(ws::parse_frame_header(as_view(short_mask, sizeof(short_mask)), header) == 0);
}

TEST_CASE("Frame parse - fragment without FIN", "[frame]") {
  uint8_t frame[] = {0x01, 0x03, 'a', 'b', 'c'};
  ws::FrameHeader header;
  REQUIRE(ws::parse_frame_header(as_view(frame, sizeof(frame)), header) == 2);
  REQUIRE(!header.fin);
  REQUIRE(header.opcode == ws::OpCode::kText);
}

// ============================================================================
// Header encoding (server frames are never masked)
// ============================================================================

TEST_CASE("Frame encode - length forms", "[frame]") {
  uint8_t buf[ws::kMaxFrameHeader];

  REQUIRE(ws::encode_frame_header(buf, ws::OpCode::kText, 5) == 2);
  REQUIRE(buf[0] == 0x81);
  REQUIRE(buf[1] == 0x05);

  REQUIRE(ws::encode_frame_header(buf, ws::OpCode::kText, 300) == 4);
  REQUIRE(buf[1] == 126);
  REQUIRE(buf[2] == 0x01);
  REQUIRE(buf[3] == 0x2C);

  REQUIRE(ws::encode_frame_header(buf, ws::OpCode::kBinary, 70000) == 10);
  REQUIRE(buf[0] == 0x82);
  REQUIRE(buf[1] == 127);
  REQUIRE(buf[7] == 0x01);
  REQUIRE(buf[8] == 0x11);
  REQUIRE(buf[9] == 0x70);
}

TEST_CASE("Frame encode - parse accepts what encode writes", "[frame]") {
  uint8_t buf[ws::kMaxFrameHeader];
  size_t len = ws::encode_frame_header(buf, ws::OpCode::kPong, 126);
  ws::FrameHeader header;
  REQUIRE(ws::parse_frame_header(as_view(buf, len), header) == len);
  REQUIRE(header.opcode == ws::OpCode::kPong);
  REQUIRE(header.payload_len == 126);
  REQUIRE(!header.masked);
}
