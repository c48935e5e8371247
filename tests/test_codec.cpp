#include "pollcast/codec.hpp"

#include <string>

#include <catch2/catch_test_macros.hpp>

using namespace pollcast;

namespace {

Poll sample_poll() {
  Poll poll;
  poll.id = "p1";
  poll.question = "Tabs or spaces?";
  poll.options = {{"tabs", 3}, {"spaces", 5}};
  poll.created_at_ms = 1700000000000;
  poll.sequence = 8;
  return poll;
}

Json::Value parsed(const std::string& text) {
  auto root = codec::parse(text);
  REQUIRE(root);
  return root.value();
}

}  // namespace

TEST_CASE("Codec - write is compact", "[codec]") {
  Json::Value v(Json::objectValue);
  v["a"] = 1;
  REQUIRE(codec::write(v) == R"({"a":1})");
}

TEST_CASE("Codec - parse rejects garbage", "[codec]") {
  REQUIRE(!codec::parse("{not json"));
  REQUIRE(codec::parse("{not json").get_error() == ErrorCode::kInvalidArgument);
  REQUIRE(!codec::parse(""));
}

TEST_CASE("Codec - parse rejects deep nesting", "[codec]") {
  const std::string deep(1200, '[');
  auto root = codec::parse(deep);
  REQUIRE(!root);
  REQUIRE(root.get_error() == ErrorCode::kInvalidArgument);
  REQUIRE(codec::parse_control(deep).get_error() == ErrorCode::kInvalidArgument);

  std::string closed = std::string(1200, '[') + std::string(1200, ']');
  REQUIRE(!codec::parse(closed));
}

TEST_CASE("Codec - poll JSON fields", "[codec]") {
  Json::Value v = codec::poll_to_json(sample_poll());
  REQUIRE(v["id"].asString() == "p1");
  REQUIRE(v["question"].asString() == "Tabs or spaces?");
  REQUIRE(v["description"].isNull());
  REQUIRE(v["closed"].asBool() == false);
  REQUIRE(v["sequence"].asUInt64() == 8);
  REQUIRE(v["totalVotes"].asInt64() == 8);
  REQUIRE(v["options"].size() == 2);
  REQUIRE(v["options"][1]["label"].asString() == "spaces");
  REQUIRE(v["options"][1]["count"].asInt64() == 5);
}

TEST_CASE("Codec - event survives the bus", "[codec]") {
  ChangeEvent event;
  event.kind = EventKind::kUpdated;
  event.poll_id = "p1";
  event.sequence = 8;
  event.snapshot = sample_poll();
  event.snapshot.closed = true;
  event.snapshot.description = "a classic";

  auto decoded = codec::decode_event(codec::encode_event(event));
  REQUIRE(decoded);
  const ChangeEvent& out = decoded.value();
  REQUIRE(out.kind == EventKind::kUpdated);
  REQUIRE(out.poll_id == "p1");
  REQUIRE(out.sequence == 8);
  REQUIRE(out.snapshot.closed);
  REQUIRE(out.snapshot.description == "a classic");
  REQUIRE(out.snapshot.options.size() == 2);
  REQUIRE(out.snapshot.find_option("tabs")->count == 3);
  REQUIRE(out.snapshot.created_at_ms == 1700000000000);
}

TEST_CASE("Codec - decode_event rejects bad input", "[codec]") {
  REQUIRE(!codec::decode_event("[]"));
  REQUIRE(!codec::decode_event(R"({"kind":"exploded","pollId":"p","sequence":1,"poll":{"id":"p","options":[]}})"));
  REQUIRE(!codec::decode_event(R"({"kind":"updated","pollId":"p","sequence":1})"));
  REQUIRE(!codec::decode_event(
      R"({"kind":"updated","pollId":"p","sequence":1,"poll":{"id":"p","options":[{"label":"A","count":"x"}]}})"));
}

TEST_CASE("Codec - push payloads", "[codec]") {
  Poll poll = sample_poll();

  Json::Value update = parsed(codec::encode_poll_update(poll));
  REQUIRE(update["type"].asString() == "poll_update");
  REQUIRE(update["pollId"].asString() == "p1");
  REQUIRE(update["sequence"].asUInt64() == 8);
  REQUIRE(update["closed"].asBool() == false);
  REQUIRE(update["options"][0]["label"].asString() == "tabs");
  REQUIRE(update["options"][0]["count"].asInt64() == 3);

  Json::Value created = parsed(codec::encode_poll_created(poll));
  REQUIRE(created["type"].asString() == "poll_created");
  REQUIRE(created["poll"]["id"].asString() == "p1");

  Json::Value deleted = parsed(codec::encode_poll_deleted("p1"));
  REQUIRE(deleted["type"].asString() == "poll_deleted");
  REQUIRE(deleted["pollId"].asString() == "p1");

  Json::Value viewers = parsed(codec::encode_viewers("p1", 4));
  REQUIRE(viewers["type"].asString() == "viewers");
  REQUIRE(viewers["count"].asUInt64() == 4);

  REQUIRE(parsed(codec::encode_pong())["type"].asString() == "pong");

  Json::Value error = parsed(codec::encode_error("Poll not found"));
  REQUIRE(error["type"].asString() == "error");
  REQUIRE(error["message"].asString() == "Poll not found");
}

TEST_CASE("Codec - control messages", "[codec]") {
  auto sub = codec::parse_control(R"({"type":"subscribe","pollId":"p9"})");
  REQUIRE(sub);
  REQUIRE(sub.value().type == codec::ControlMessage::Type::kSubscribe);
  REQUIRE(sub.value().poll_id == "p9");

  auto unsub = codec::parse_control(R"({"type":"unsubscribe"})");
  REQUIRE(unsub);
  REQUIRE(unsub.value().type == codec::ControlMessage::Type::kUnsubscribe);

  auto ping = codec::parse_control(R"({"type":"ping"})");
  REQUIRE(ping);
  REQUIRE(ping.value().type == codec::ControlMessage::Type::kPing);
}

TEST_CASE("Codec - malformed control messages", "[codec]") {
  REQUIRE(!codec::parse_control("hello"));
  REQUIRE(!codec::parse_control(R"(["subscribe"])"));
  REQUIRE(!codec::parse_control(R"({"type":"subscribe"})"));
  REQUIRE(!codec::parse_control(R"({"type":"subscribe","pollId":""})"));
  REQUIRE(!codec::parse_control(R"({"type":"subscribe","pollId":7})"));
  REQUIRE(!codec::parse_control(R"({"type":"vote"})"));
  REQUIRE(codec::parse_control(R"({"type":7})").get_error() == ErrorCode::kInvalidArgument);
}

TEST_CASE("Codec - REST envelopes", "[codec]") {
  Json::Value data(Json::objectValue);
  data["pollId"] = "p1";
  Json::Value ok = parsed(codec::envelope_success("Poll p1 deleted successfully", data));
  REQUIRE(ok["status"].asString() == "success");
  REQUIRE(ok["message"].asString() == "Poll p1 deleted successfully");
  REQUIRE(ok["data"]["pollId"].asString() == "p1");

  Json::Value err = parsed(codec::envelope_error("Poll not found"));
  REQUIRE(err["status"].asString() == "error");
  REQUIRE(err["data"].isNull());
}

TEST_CASE("Codec - option labels", "[codec]") {
  auto labels = codec::decode_labels(codec::encode_labels(sample_poll().options));
  REQUIRE(labels);
  REQUIRE(labels.value().size() == 2);
  REQUIRE(labels.value()[0] == "tabs");
  REQUIRE(!codec::decode_labels(R"(["a", 1])"));
  REQUIRE(!codec::decode_labels(R"({"a":1})"));
}
