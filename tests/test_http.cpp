#include "pollcast/http.hpp"

#include <string>

#include <catch2/catch_test_macros.hpp>

using namespace pollcast;

TEST_CASE("HTTP parse - upgrade request", "[http]") {
  const std::string raw =
      "GET /ws/abc?x=1 HTTP/1.1\r\n"
      "Host: localhost\r\n"
      "Upgrade: WebSocket\r\n"
      "Connection: keep-alive, Upgrade\r\n"
      "Sec-WebSocket-Key: dGhlIHNhbXBsZSBub25jZQ==\r\n"
      "Sec-WebSocket-Version: 13\r\n"
      "\r\n";
  HttpRequest req;
  auto parsed = parse_http_request(raw, req);
  REQUIRE(parsed);
  REQUIRE(parsed.value() == raw.size());
  REQUIRE(req.method == "GET");
  REQUIRE(req.target == "/ws/abc?x=1");
  REQUIRE(req.path == "/ws/abc");
  REQUIRE(req.query == "x=1");
  REQUIRE(req.header("sec-websocket-key") == "dGhlIHNhbXBsZSBub25jZQ==");
  REQUIRE(req.is_websocket_upgrade());
}

TEST_CASE("HTTP parse - POST with body", "[http]") {
  const std::string body = R"({"option":"A"})";
  const std::string raw = "POST /api/v1/polls/p1/vote HTTP/1.1\r\nContent-Type: application/json\r\nContent-Length: " +
                          std::to_string(body.size()) + "\r\n\r\n" + body;
  HttpRequest req;
  auto parsed = parse_http_request(raw, req);
  REQUIRE(parsed);
  REQUIRE(parsed.value() == raw.size());
  REQUIRE(req.body == body);
  REQUIRE(!req.is_websocket_upgrade());
}

TEST_CASE("HTTP parse - incomplete input", "[http]") {
  HttpRequest req;
  auto no_end = parse_http_request("GET / HTTP/1.1\r\nHost: x\r\n", req);
  REQUIRE(no_end);
  REQUIRE(no_end.value() == 0);

  auto short_body = parse_http_request("POST / HTTP/1.1\r\nContent-Length: 10\r\n\r\nabc", req);
  REQUIRE(short_body);
  REQUIRE(short_body.value() == 0);
}

TEST_CASE("HTTP parse - trailing bytes are not consumed", "[http]") {
  const std::string first = "GET /api/v1/health HTTP/1.1\r\n\r\n";
  HttpRequest req;
  auto parsed = parse_http_request(first + "GARBAGE", req);
  REQUIRE(parsed);
  REQUIRE(parsed.value() == first.size());
  REQUIRE(req.path == "/api/v1/health");
}

TEST_CASE("HTTP parse - malformed", "[http]") {
  HttpRequest req;
  auto no_version = parse_http_request("GET /\r\n\r\n", req);
  REQUIRE(!no_version);
  REQUIRE(no_version.get_error() == ErrorCode::kHandshakeFailed);

  auto bad_header = parse_http_request("GET / HTTP/1.1\r\nNoColonHere\r\n\r\n", req);
  REQUIRE(!bad_header);
  REQUIRE(bad_header.get_error() == ErrorCode::kHandshakeFailed);

  auto bad_length = parse_http_request("POST / HTTP/1.1\r\nContent-Length: 1x\r\n\r\n", req);
  REQUIRE(!bad_length);
  REQUIRE(bad_length.get_error() == ErrorCode::kHandshakeFailed);
}

TEST_CASE("HTTP parse - body over the limit", "[http]") {
  HttpRequest req;
  std::string raw = "POST / HTTP/1.1\r\nContent-Length: " + std::to_string(kMaxHttpBody + 1) + "\r\n\r\n";
  auto parsed = parse_http_request(raw, req);
  REQUIRE(!parsed);
  REQUIRE(parsed.get_error() == ErrorCode::kBufferFull);
}

TEST_CASE("HTTP - upgrade needs every header", "[http]") {
  HttpRequest req;
  req.method = "GET";
  req.headers = {{"Upgrade", "websocket"}, {"Connection", "Upgrade"}};
  REQUIRE(!req.is_websocket_upgrade());  // no key

  req.headers.emplace_back("Sec-WebSocket-Key", "abc");
  REQUIRE(req.is_websocket_upgrade());

  req.method = "POST";
  REQUIRE(!req.is_websocket_upgrade());
}

TEST_CASE("HTTP response - serialize", "[http]") {
  auto res = HttpResponse::json(409, R"({"status":"error"})");
  std::string wire = res.serialize();
  REQUIRE(wire.rfind("HTTP/1.1 409 Conflict\r\n", 0) == 0);
  REQUIRE(wire.find("Content-Type: application/json\r\n") != std::string::npos);
  REQUIRE(wire.find("Content-Length: 18\r\n") != std::string::npos);
  REQUIRE(wire.find("Connection: close\r\n\r\n{\"status\":\"error\"}") != std::string::npos);
}

TEST_CASE("split_path - drops empty segments", "[http]") {
  auto parts = split_path("//api/v1//polls/");
  REQUIRE(parts.size() == 3);
  REQUIRE(parts[0] == "api");
  REQUIRE(parts[1] == "v1");
  REQUIRE(parts[2] == "polls");
  REQUIRE(split_path("/").empty());
}
