#include "pollcast/http.hpp"

#include <cctype>
#include <cstdlib>

namespace pollcast {

namespace {

bool iequals(std::string_view a, std::string_view b) {
  if (a.size() != b.size()) return false;
  for (size_t i = 0; i < a.size(); ++i) {
    if (std::tolower(static_cast<unsigned char>(a[i])) != std::tolower(static_cast<unsigned char>(b[i]))) {
      return false;
    }
  }
  return true;
}

// Does a comma separated header value contain token (case-insensitive)?
bool has_token(std::string_view value, std::string_view token) {
  while (!value.empty()) {
    size_t comma = value.find(',');
    std::string_view item = value.substr(0, comma);
    while (!item.empty() && (item.front() == ' ' || item.front() == '\t')) item.remove_prefix(1);
    while (!item.empty() && (item.back() == ' ' || item.back() == '\t')) item.remove_suffix(1);
    if (iequals(item, token)) return true;
    if (comma == std::string_view::npos) break;
    value.remove_prefix(comma + 1);
  }
  return false;
}

std::string_view trim(std::string_view s) {
  while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) s.remove_prefix(1);
  while (!s.empty() && (s.back() == ' ' || s.back() == '\t')) s.remove_suffix(1);
  return s;
}

}  // namespace

std::string_view HttpRequest::header(std::string_view name) const {
  for (const auto& kv : headers) {
    if (iequals(kv.first, name)) return kv.second;
  }
  return {};
}

bool HttpRequest::is_websocket_upgrade() const {
  return method == "GET" && iequals(header("Upgrade"), "websocket") && has_token(header("Connection"), "upgrade") &&
         !header("Sec-WebSocket-Key").empty();
}

const char* http_reason(int status) {
  switch (status) {
    case 200: return "OK";
    case 201: return "Created";
    case 400: return "Bad Request";
    case 404: return "Not Found";
    case 405: return "Method Not Allowed";
    case 409: return "Conflict";
    case 413: return "Payload Too Large";
    case 500: return "Internal Server Error";
    case 503: return "Service Unavailable";
    default: return "Unknown";
  }
}

std::string HttpResponse::serialize() const {
  std::string out;
  out.reserve(128 + body.size());
  out += "HTTP/1.1 ";
  out += std::to_string(status);
  out += ' ';
  out += http_reason(status);
  out += "\r\nContent-Type: ";
  out += content_type;
  out += "\r\nContent-Length: ";
  out += std::to_string(body.size());
  out += "\r\nConnection: close\r\n\r\n";
  out += body;
  return out;
}

expected<size_t, ErrorCode> parse_http_request(std::string_view data, HttpRequest& out) {
  size_t head_end = data.find("\r\n\r\n");
  if (head_end == std::string_view::npos) {
    return expected<size_t, ErrorCode>::success(0);
  }
  std::string_view head = data.substr(0, head_end);

  // Request line: METHOD SP TARGET SP VERSION
  size_t line_end = head.find("\r\n");
  std::string_view request_line = head.substr(0, line_end);
  size_t sp1 = request_line.find(' ');
  size_t sp2 = sp1 == std::string_view::npos ? sp1 : request_line.find(' ', sp1 + 1);
  if (sp1 == std::string_view::npos || sp2 == std::string_view::npos || sp1 == 0 || sp2 == sp1 + 1) {
    return expected<size_t, ErrorCode>::error(ErrorCode::kHandshakeFailed);
  }
  if (request_line.substr(sp2 + 1).substr(0, 5) != "HTTP/") {
    return expected<size_t, ErrorCode>::error(ErrorCode::kHandshakeFailed);
  }

  HttpRequest req;
  req.method = std::string(request_line.substr(0, sp1));
  req.target = std::string(request_line.substr(sp1 + 1, sp2 - sp1 - 1));
  size_t qmark = req.target.find('?');
  req.path = req.target.substr(0, qmark);
  if (qmark != std::string::npos) req.query = req.target.substr(qmark + 1);

  std::string_view rest = line_end == std::string_view::npos ? std::string_view{} : head.substr(line_end + 2);
  while (!rest.empty()) {
    size_t eol = rest.find("\r\n");
    std::string_view line = rest.substr(0, eol);
    size_t colon = line.find(':');
    if (colon == std::string_view::npos || colon == 0) {
      return expected<size_t, ErrorCode>::error(ErrorCode::kHandshakeFailed);
    }
    req.headers.emplace_back(std::string(trim(line.substr(0, colon))), std::string(trim(line.substr(colon + 1))));
    if (eol == std::string_view::npos) break;
    rest.remove_prefix(eol + 2);
  }

  size_t body_len = 0;
  std::string_view content_length = req.header("Content-Length");
  if (!content_length.empty()) {
    std::string digits(content_length);
    char* endp = nullptr;
    unsigned long long parsed = std::strtoull(digits.c_str(), &endp, 10);
    if (endp == digits.c_str() || *endp != '\0') {
      return expected<size_t, ErrorCode>::error(ErrorCode::kHandshakeFailed);
    }
    if (parsed > kMaxHttpBody) {
      return expected<size_t, ErrorCode>::error(ErrorCode::kBufferFull);
    }
    body_len = static_cast<size_t>(parsed);
  }

  size_t total = head_end + 4 + body_len;
  if (data.size() < total) {
    return expected<size_t, ErrorCode>::success(0);
  }
  req.body = std::string(data.substr(head_end + 4, body_len));
  out = std::move(req);
  return expected<size_t, ErrorCode>::success(total);
}

std::vector<std::string> split_path(std::string_view path) {
  std::vector<std::string> parts;
  while (!path.empty()) {
    size_t slash = path.find('/');
    std::string_view part = path.substr(0, slash);
    if (!part.empty()) parts.emplace_back(part);
    if (slash == std::string_view::npos) break;
    path.remove_prefix(slash + 1);
  }
  return parts;
}

}  // namespace pollcast
