/**
 * @file websocket.hpp
 * @brief RFC 6455 helpers: accept-key derivation (SHA-1 + Base64) and
 *        frame header encode/decode.
 */

#ifndef POLLCAST_WEBSOCKET_HPP_
#define POLLCAST_WEBSOCKET_HPP_

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace pollcast {

// ============================================================================
// Base64 (encode only, the handshake never decodes)
// ============================================================================

class Base64 {
 public:
  static std::string encode(const uint8_t* data, size_t size) {
    static constexpr const char kAlphabet[] = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";
    std::string out;
    out.reserve((size + 2) / 3 * 4);
    size_t i = 0;
    for (; i + 2 < size; i += 3) {
      uint32_t triple = (uint32_t{data[i]} << 16) | (uint32_t{data[i + 1]} << 8) | data[i + 2];
      out.push_back(kAlphabet[(triple >> 18) & 0x3F]);
      out.push_back(kAlphabet[(triple >> 12) & 0x3F]);
      out.push_back(kAlphabet[(triple >> 6) & 0x3F]);
      out.push_back(kAlphabet[triple & 0x3F]);
    }
    size_t rest = size - i;
    if (rest > 0) {
      uint32_t triple = uint32_t{data[i]} << 16;
      if (rest == 2) triple |= uint32_t{data[i + 1]} << 8;
      out.push_back(kAlphabet[(triple >> 18) & 0x3F]);
      out.push_back(kAlphabet[(triple >> 12) & 0x3F]);
      out.push_back(rest == 2 ? kAlphabet[(triple >> 6) & 0x3F] : '=');
      out.push_back('=');
    }
    return out;
  }
};

// ============================================================================
// SHA-1 (only used to derive Sec-WebSocket-Accept)
// ============================================================================

class SHA1 {
 public:
  using Digest = std::array<uint8_t, 20>;

  static Digest compute(const uint8_t* data, size_t size) {
    SHA1 sha;
    sha.update(data, size);
    return sha.finalize();
  }

  void update(const uint8_t* data, size_t size) {
    for (size_t i = 0; i < size; ++i) {
      block_[block_len_++] = data[i];
      if (block_len_ == block_.size()) {
        process_block();
        block_len_ = 0;
      }
    }
    total_bits_ += static_cast<uint64_t>(size) * 8U;
  }

  Digest finalize() {
    uint64_t bits = total_bits_;
    uint8_t pad = 0x80;
    update(&pad, 1);
    uint8_t zero = 0;
    while (block_len_ != 56) {
      update(&zero, 1);
    }
    uint8_t len_be[8];
    for (int i = 0; i < 8; ++i) {
      len_be[i] = static_cast<uint8_t>(bits >> (56 - 8 * i));
    }
    update(len_be, sizeof(len_be));

    Digest digest{};
    for (size_t i = 0; i < 5; ++i) {
      digest[i * 4] = static_cast<uint8_t>(h_[i] >> 24);
      digest[i * 4 + 1] = static_cast<uint8_t>(h_[i] >> 16);
      digest[i * 4 + 2] = static_cast<uint8_t>(h_[i] >> 8);
      digest[i * 4 + 3] = static_cast<uint8_t>(h_[i]);
    }
    return digest;
  }

 private:
  std::array<uint32_t, 5> h_ = {0x67452301, 0xEFCDAB89, 0x98BADCFE, 0x10325476, 0xC3D2E1F0};
  std::array<uint8_t, 64> block_{};
  size_t block_len_ = 0;
  uint64_t total_bits_ = 0;

  static uint32_t rotl(uint32_t x, int n) { return (x << n) | (x >> (32 - n)); }

  void process_block() {
    uint32_t w[80];
    for (int i = 0; i < 16; ++i) {
      w[i] = (uint32_t{block_[i * 4]} << 24) | (uint32_t{block_[i * 4 + 1]} << 16) |
             (uint32_t{block_[i * 4 + 2]} << 8) | uint32_t{block_[i * 4 + 3]};
    }
    for (int i = 16; i < 80; ++i) {
      w[i] = rotl(w[i - 3] ^ w[i - 8] ^ w[i - 14] ^ w[i - 16], 1);
    }

    uint32_t a = h_[0], b = h_[1], c = h_[2], d = h_[3], e = h_[4];
    for (int i = 0; i < 80; ++i) {
      uint32_t f;
      uint32_t k;
      if (i < 20) {
        f = (b & c) | (~b & d);
        k = 0x5A827999;
      } else if (i < 40) {
        f = b ^ c ^ d;
        k = 0x6ED9EBA1;
      } else if (i < 60) {
        f = (b & c) | (b & d) | (c & d);
        k = 0x8F1BBCDC;
      } else {
        f = b ^ c ^ d;
        k = 0xCA62C1D6;
      }
      uint32_t tmp = rotl(a, 5) + f + e + k + w[i];
      e = d;
      d = c;
      c = rotl(b, 30);
      b = a;
      a = tmp;
    }
    h_[0] += a;
    h_[1] += b;
    h_[2] += c;
    h_[3] += d;
    h_[4] += e;
  }
};

namespace ws {

enum class OpCode : uint8_t {
  kContinuation = 0x0,
  kText = 0x1,
  kBinary = 0x2,
  kClose = 0x8,
  kPing = 0x9,
  kPong = 0xA
};

struct FrameHeader {
  bool fin = false;
  OpCode opcode = OpCode::kContinuation;
  bool masked = false;
  uint64_t payload_len = 0;
};

// Largest header: 2 + 8 (extended length) + 4 (mask key)
static constexpr size_t kMaxFrameHeader = 14;

inline std::string accept_key(std::string_view client_key) {
  constexpr std::string_view kMagic = "258EAFA5-E914-47DA-95CA-C5AB0DC85B11";
  std::string material(client_key);
  material.append(kMagic);
  auto digest = SHA1::compute(reinterpret_cast<const uint8_t*>(material.data()), material.size());
  return Base64::encode(digest.data(), digest.size());
}

// Parse a frame header. Returns bytes consumed (mask key included),
// or 0 if the header is incomplete.
inline size_t parse_frame_header(std::string_view data, FrameHeader& header) {
  if (data.size() < 2) return 0;
  auto byte = [&data](size_t i) { return static_cast<uint8_t>(data[i]); };

  header.fin = (byte(0) & 0x80) != 0;
  header.opcode = static_cast<OpCode>(byte(0) & 0x0F);
  header.masked = (byte(1) & 0x80) != 0;

  uint64_t len = byte(1) & 0x7F;
  size_t header_size = 2;
  if (len == 126) {
    if (data.size() < 4) return 0;
    len = (uint64_t{byte(2)} << 8) | byte(3);
    header_size = 4;
  } else if (len == 127) {
    if (data.size() < 10) return 0;
    len = 0;
    for (size_t i = 2; i < 10; ++i) {
      len = (len << 8) | byte(i);
    }
    header_size = 10;
  }
  header.payload_len = len;

  if (header.masked) {
    if (data.size() < header_size + 4) return 0;
    header_size += 4;
  }
  return header_size;
}

// Encode an unmasked (server-to-client) frame header into buf.
// buf must hold kMaxFrameHeader bytes. Returns header length.
inline size_t encode_frame_header(uint8_t* buf, OpCode opcode, size_t payload_len) {
  size_t pos = 0;
  buf[pos++] = static_cast<uint8_t>(0x80 | static_cast<uint8_t>(opcode));
  if (payload_len < 126) {
    buf[pos++] = static_cast<uint8_t>(payload_len);
  } else if (payload_len < 65536) {
    buf[pos++] = 126;
    buf[pos++] = static_cast<uint8_t>((payload_len >> 8) & 0xFF);
    buf[pos++] = static_cast<uint8_t>(payload_len & 0xFF);
  } else {
    buf[pos++] = 127;
    for (int i = 7; i >= 0; --i) {
      buf[pos++] = static_cast<uint8_t>((static_cast<uint64_t>(payload_len) >> (i * 8)) & 0xFF);
    }
  }
  return pos;
}

inline void unmask(uint8_t* payload, size_t len, const uint8_t* mask_key) {
  for (size_t i = 0; i < len; ++i) payload[i] ^= mask_key[i % 4];
}

}  // namespace ws

}  // namespace pollcast

#endif  // POLLCAST_WEBSOCKET_HPP_
