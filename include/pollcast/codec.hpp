/**
 * @file codec.hpp
 * @brief JSON encoding for polls, bus events, WebSocket pushes, control
 *        messages and REST envelopes.
 */

#ifndef POLLCAST_CODEC_HPP_
#define POLLCAST_CODEC_HPP_

#include "poll.hpp"
#include "vocabulary.hpp"

#include <string>
#include <string_view>
#include <vector>

#include <json/json.h>

namespace pollcast {
namespace codec {

// Compact single-line output
std::string write(const Json::Value& value);
expected<Json::Value, ErrorCode> parse(std::string_view text);

Json::Value poll_to_json(const Poll& poll);
expected<Poll, ErrorCode> poll_from_json(const Json::Value& value);

// Bus format, published on poll-events:{id}
std::string encode_event(const ChangeEvent& event);
expected<ChangeEvent, ErrorCode> decode_event(std::string_view text);

// Server -> client pushes
std::string encode_poll_update(const Poll& poll);
std::string encode_poll_created(const Poll& poll);
std::string encode_poll_deleted(const std::string& poll_id);
std::string encode_viewers(const std::string& poll_id, size_t count);
std::string encode_pong();
std::string encode_error(std::string_view message);

// Client -> server control messages
struct ControlMessage {
  enum class Type : uint8_t { kSubscribe, kUnsubscribe, kPing };
  Type type = Type::kPing;
  std::string poll_id;  // kSubscribe only
};

expected<ControlMessage, ErrorCode> parse_control(std::string_view text);

// REST envelope {"status","message","data"}
std::string envelope_success(const std::string& message, const Json::Value& data);
std::string envelope_error(const std::string& message, const Json::Value& data = Json::Value());

// Option labels as a JSON array, used by the Redis layout
std::string encode_labels(const std::vector<PollOption>& options);
expected<std::vector<std::string>, ErrorCode> decode_labels(std::string_view text);

}  // namespace codec
}  // namespace pollcast

#endif  // POLLCAST_CODEC_HPP_
