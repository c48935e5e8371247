/**
 * @file http.hpp
 * @brief Minimal HTTP/1.1 request parsing and response serialization.
 *
 * Only what the reactor needs: the WebSocket upgrade request and small
 * one-shot REST requests with a Content-Length body. No chunked bodies,
 * no pipelining (every response closes the connection).
 */

#ifndef POLLCAST_HTTP_HPP_
#define POLLCAST_HTTP_HPP_

#include "vocabulary.hpp"

#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace pollcast {

struct HttpRequest {
  std::string method;
  std::string target;  // as sent, e.g. "/ws/abc?x=1"
  std::string path;    // target without the query string
  std::string query;
  std::vector<std::pair<std::string, std::string>> headers;
  std::string body;

  // Case-insensitive header lookup. Empty view when absent.
  std::string_view header(std::string_view name) const;

  bool is_websocket_upgrade() const;
};

struct HttpResponse {
  int status = 200;
  std::string content_type = "application/json";
  std::string body;

  std::string serialize() const;

  static HttpResponse json(int status, std::string body) {
    HttpResponse res;
    res.status = status;
    res.body = std::move(body);
    return res;
  }
};

const char* http_reason(int status);

static constexpr size_t kMaxHttpBody = 4096;

// Parse one request from the start of data.
// success(0): incomplete, wait for more bytes.
// success(n): request complete, n bytes consumed.
// error(kHandshakeFailed): malformed request line or headers.
// error(kBufferFull): body larger than kMaxHttpBody.
expected<size_t, ErrorCode> parse_http_request(std::string_view data, HttpRequest& out);

// Split "/a/b/c" into {"a", "b", "c"}. Empty segments are dropped.
std::vector<std::string> split_path(std::string_view path);

}  // namespace pollcast

#endif  // POLLCAST_HTTP_HPP_
