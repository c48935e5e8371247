#include "pollcast/codec.hpp"

#include "pollcast/log.hpp"

#include <memory>

namespace pollcast {

const char* to_string(EventKind kind) {
  switch (kind) {
    case EventKind::kUpdated: return "updated";
    case EventKind::kCreated: return "created";
    case EventKind::kDeleted: return "deleted";
  }
  return "unknown";
}

namespace codec {

namespace {

const Json::StreamWriterBuilder& writer_builder() {
  static const Json::StreamWriterBuilder builder = [] {
    Json::StreamWriterBuilder b;
    b["indentation"] = "";
    b["emitUTF8"] = true;
    return b;
  }();
  return builder;
}

expected<EventKind, ErrorCode> kind_from_string(const std::string& name) {
  if (name == "updated") return expected<EventKind, ErrorCode>::success(EventKind::kUpdated);
  if (name == "created") return expected<EventKind, ErrorCode>::success(EventKind::kCreated);
  if (name == "deleted") return expected<EventKind, ErrorCode>::success(EventKind::kDeleted);
  return expected<EventKind, ErrorCode>::error(ErrorCode::kInvalidArgument);
}

Json::Value options_to_json(const std::vector<PollOption>& options) {
  Json::Value arr(Json::arrayValue);
  for (const auto& opt : options) {
    Json::Value item(Json::objectValue);
    item["label"] = opt.label;
    item["count"] = Json::Int64(opt.count);
    arr.append(item);
  }
  return arr;
}

Json::Value typed(const char* type) {
  Json::Value v(Json::objectValue);
  v["type"] = type;
  return v;
}

}  // namespace

std::string write(const Json::Value& value) { return Json::writeString(writer_builder(), value); }

expected<Json::Value, ErrorCode> parse(std::string_view text) {
  Json::CharReaderBuilder builder;
  builder["collectComments"] = false;
  std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
  Json::Value root;
  std::string errors;
  try {
    if (!reader->parse(text.data(), text.data() + text.size(), &root, &errors)) {
      return expected<Json::Value, ErrorCode>::error(ErrorCode::kInvalidArgument);
    }
  } catch (const Json::Exception& e) {
    // Nesting past the reader's stack limit throws instead of failing
    POLLCAST_LOG_DEBUG(std::string("json rejected: ") + e.what());
    return expected<Json::Value, ErrorCode>::error(ErrorCode::kInvalidArgument);
  }
  return expected<Json::Value, ErrorCode>::success(std::move(root));
}

Json::Value poll_to_json(const Poll& poll) {
  Json::Value v(Json::objectValue);
  v["id"] = poll.id;
  v["question"] = poll.question;
  if (poll.description.empty()) {
    v["description"] = Json::Value(Json::nullValue);
  } else {
    v["description"] = poll.description;
  }
  v["options"] = options_to_json(poll.options);
  v["closed"] = poll.closed;
  v["createdAt"] = Json::Int64(poll.created_at_ms);
  v["sequence"] = Json::UInt64(poll.sequence);
  v["totalVotes"] = Json::Int64(poll.total_votes());
  return v;
}

expected<Poll, ErrorCode> poll_from_json(const Json::Value& value) {
  auto fail = expected<Poll, ErrorCode>::error(ErrorCode::kInvalidArgument);
  if (!value.isObject() || !value["id"].isString() || !value["options"].isArray()) return fail;

  Poll poll;
  poll.id = value["id"].asString();
  poll.question = value.get("question", "").asString();
  if (value["description"].isString()) poll.description = value["description"].asString();
  poll.closed = value.get("closed", false).asBool();
  if (value["createdAt"].isIntegral()) poll.created_at_ms = value["createdAt"].asInt64();
  if (value["sequence"].isIntegral()) poll.sequence = value["sequence"].asUInt64();

  for (const auto& item : value["options"]) {
    if (!item.isObject() || !item["label"].isString() || !item["count"].isIntegral()) return fail;
    PollOption opt;
    opt.label = item["label"].asString();
    opt.count = item["count"].asInt64();
    poll.options.push_back(std::move(opt));
  }
  return expected<Poll, ErrorCode>::success(std::move(poll));
}

std::string encode_event(const ChangeEvent& event) {
  Json::Value v(Json::objectValue);
  v["kind"] = to_string(event.kind);
  v["pollId"] = event.poll_id;
  v["sequence"] = Json::UInt64(event.sequence);
  v["poll"] = poll_to_json(event.snapshot);
  return write(v);
}

expected<ChangeEvent, ErrorCode> decode_event(std::string_view text) {
  auto fail = expected<ChangeEvent, ErrorCode>::error(ErrorCode::kInvalidArgument);
  auto root = parse(text);
  if (!root) return fail;
  const Json::Value& v = root.value();
  if (!v.isObject() || !v["kind"].isString() || !v["pollId"].isString() || !v["sequence"].isIntegral()) {
    return fail;
  }

  auto kind = kind_from_string(v["kind"].asString());
  if (!kind) return fail;
  auto poll = poll_from_json(v["poll"]);
  if (!poll) return fail;

  ChangeEvent event;
  event.kind = kind.value();
  event.poll_id = v["pollId"].asString();
  event.sequence = v["sequence"].asUInt64();
  event.snapshot = std::move(poll.value());
  return expected<ChangeEvent, ErrorCode>::success(std::move(event));
}

std::string encode_poll_update(const Poll& poll) {
  Json::Value v = typed("poll_update");
  v["pollId"] = poll.id;
  v["options"] = options_to_json(poll.options);
  v["sequence"] = Json::UInt64(poll.sequence);
  v["closed"] = poll.closed;
  return write(v);
}

std::string encode_poll_created(const Poll& poll) {
  Json::Value v = typed("poll_created");
  v["poll"] = poll_to_json(poll);
  return write(v);
}

std::string encode_poll_deleted(const std::string& poll_id) {
  Json::Value v = typed("poll_deleted");
  v["pollId"] = poll_id;
  return write(v);
}

std::string encode_viewers(const std::string& poll_id, size_t count) {
  Json::Value v = typed("viewers");
  v["pollId"] = poll_id;
  v["count"] = Json::UInt64(count);
  return write(v);
}

std::string encode_pong() { return write(typed("pong")); }

std::string encode_error(std::string_view message) {
  Json::Value v = typed("error");
  v["message"] = std::string(message);
  return write(v);
}

expected<ControlMessage, ErrorCode> parse_control(std::string_view text) {
  auto fail = expected<ControlMessage, ErrorCode>::error(ErrorCode::kInvalidArgument);
  auto root = parse(text);
  if (!root || !root.value().isObject() || !root.value()["type"].isString()) return fail;

  const Json::Value& v = root.value();
  const std::string type = v["type"].asString();
  ControlMessage msg;
  if (type == "subscribe") {
    if (!v["pollId"].isString() || v["pollId"].asString().empty()) return fail;
    msg.type = ControlMessage::Type::kSubscribe;
    msg.poll_id = v["pollId"].asString();
  } else if (type == "unsubscribe") {
    msg.type = ControlMessage::Type::kUnsubscribe;
  } else if (type == "ping") {
    msg.type = ControlMessage::Type::kPing;
  } else {
    return fail;
  }
  return expected<ControlMessage, ErrorCode>::success(std::move(msg));
}

std::string envelope_success(const std::string& message, const Json::Value& data) {
  Json::Value v(Json::objectValue);
  v["status"] = "success";
  v["message"] = message;
  v["data"] = data;
  return write(v);
}

std::string envelope_error(const std::string& message, const Json::Value& data) {
  Json::Value v(Json::objectValue);
  v["status"] = "error";
  v["message"] = message;
  v["data"] = data;
  return write(v);
}

std::string encode_labels(const std::vector<PollOption>& options) {
  Json::Value arr(Json::arrayValue);
  for (const auto& opt : options) arr.append(opt.label);
  return write(arr);
}

expected<std::vector<std::string>, ErrorCode> decode_labels(std::string_view text) {
  auto fail = expected<std::vector<std::string>, ErrorCode>::error(ErrorCode::kInvalidArgument);
  auto root = parse(text);
  if (!root || !root.value().isArray()) return fail;
  std::vector<std::string> labels;
  for (const auto& item : root.value()) {
    if (!item.isString()) return fail;
    labels.push_back(item.asString());
  }
  return expected<std::vector<std::string>, ErrorCode>::success(std::move(labels));
}

}  // namespace codec
}  // namespace pollcast
