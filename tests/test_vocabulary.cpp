#include "pollcast/vocabulary.hpp"

#include <memory>
#include <string>
#include <vector>

#include <catch2/catch_test_macros.hpp>

using namespace pollcast;

// ============================================================================
// expected<V, E>
// ============================================================================

TEST_CASE("expected - success with value", "[vocabulary]") {
  auto result = expected<int, ErrorCode>::success(42);
  REQUIRE(result.has_value());
  REQUIRE(result.value() == 42);
}

TEST_CASE("expected - error", "[vocabulary]") {
  auto result = expected<int, ErrorCode>::error(ErrorCode::kPollNotFound);
  REQUIRE(!result.has_value());
  REQUIRE(result.get_error() == ErrorCode::kPollNotFound);
}

TEST_CASE("expected - value_or", "[vocabulary]") {
  auto ok = expected<int, ErrorCode>::success(10);
  auto err = expected<int, ErrorCode>::error(ErrorCode::kBackendUnavailable);
  REQUIRE(ok.value_or(99) == 10);
  REQUIRE(err.value_or(99) == 99);
}

TEST_CASE("expected - owns a non-trivial payload", "[vocabulary]") {
  auto original = expected<std::vector<std::string>, ErrorCode>::success(std::vector<std::string>{"A", "B"});
  auto copy = original;
  REQUIRE(copy.value().size() == 2);
  REQUIRE(original.value()[1] == "B");

  auto moved = std::move(copy);
  REQUIRE(moved.value()[0] == "A");

  moved = expected<std::vector<std::string>, ErrorCode>::error(ErrorCode::kInvalidArgument);
  REQUIRE(!moved);
  REQUIRE(moved.get_error() == ErrorCode::kInvalidArgument);
}

TEST_CASE("expected - shared_ptr payload is released", "[vocabulary]") {
  auto ptr = std::make_shared<int>(5);
  {
    auto result = expected<std::shared_ptr<int>, ErrorCode>::success(ptr);
    REQUIRE(ptr.use_count() == 2);
  }
  REQUIRE(ptr.use_count() == 1);
}

TEST_CASE("expected<void> - success and error", "[vocabulary]") {
  auto ok = expected<void, ErrorCode>::success();
  auto err = expected<void, ErrorCode>::error(ErrorCode::kPollClosed);
  REQUIRE(ok.has_value());
  REQUIRE(!err.has_value());
  REQUIRE(err.get_error() == ErrorCode::kPollClosed);
}

// ============================================================================
// ErrorCode
// ============================================================================

TEST_CASE("ErrorCode - every code has a text", "[vocabulary]") {
  const ErrorCode codes[] = {ErrorCode::kOk,
                             ErrorCode::kBufferFull,
                             ErrorCode::kBufferEmpty,
                             ErrorCode::kHandshakeFailed,
                             ErrorCode::kFrameParseError,
                             ErrorCode::kConnectionClosed,
                             ErrorCode::kInvalidState,
                             ErrorCode::kSocketError,
                             ErrorCode::kTimeout,
                             ErrorCode::kMaxConnectionsExceeded,
                             ErrorCode::kPollNotFound,
                             ErrorCode::kOptionNotFound,
                             ErrorCode::kPollClosed,
                             ErrorCode::kInvalidArgument,
                             ErrorCode::kAlreadyExists,
                             ErrorCode::kUnknownSubscriber,
                             ErrorCode::kBackendUnavailable,
                             ErrorCode::kInternalError};
  for (ErrorCode code : codes) {
    REQUIRE(std::string(to_string(code)) != "unknown error");
  }
  REQUIRE(std::string(to_string(ErrorCode::kPollClosed)) == "poll closed");
}

TEST_CASE("ErrorCode - connection failures", "[vocabulary]") {
  REQUIRE(is_connection_failure(ErrorCode::kConnectionClosed));
  REQUIRE(is_connection_failure(ErrorCode::kSocketError));
  REQUIRE(is_connection_failure(ErrorCode::kInvalidState));
  // Backpressure, the subscriber is kept
  REQUIRE(!is_connection_failure(ErrorCode::kBufferFull));
  REQUIRE(!is_connection_failure(ErrorCode::kPollNotFound));
  REQUIRE(!is_connection_failure(ErrorCode::kBackendUnavailable));
}

// ============================================================================
// FixedVector
// ============================================================================

TEST_CASE("FixedVector - push until full", "[vocabulary]") {
  FixedVector<int, 3> vec;
  REQUIRE(vec.empty());
  REQUIRE(vec.push_back(1));
  REQUIRE(vec.push_back(2));
  REQUIRE(vec.push_back(3));
  REQUIRE(vec.full());
  REQUIRE(!vec.push_back(4));
  REQUIRE(vec.size() == 3);
}

TEST_CASE("FixedVector - erase_unordered moves the last element in", "[vocabulary]") {
  FixedVector<std::shared_ptr<int>, 4> vec;
  vec.push_back(std::make_shared<int>(1));
  vec.push_back(std::make_shared<int>(2));
  vec.push_back(std::make_shared<int>(3));

  vec.erase_unordered(0);
  REQUIRE(vec.size() == 2);
  REQUIRE(*vec[0] == 3);
  REQUIRE(*vec[1] == 2);

  vec.erase_unordered(1);
  REQUIRE(vec.size() == 1);
  REQUIRE(*vec[0] == 3);

  vec.erase_unordered(5);  // out of range is ignored
  REQUIRE(vec.size() == 1);
}

TEST_CASE("FixedVector - clear destroys elements", "[vocabulary]") {
  auto ptr = std::make_shared<int>(7);
  {
    FixedVector<std::shared_ptr<int>, 2> vec;
    vec.push_back(ptr);
    REQUIRE(ptr.use_count() == 2);
    vec.clear();
    REQUIRE(ptr.use_count() == 1);
    vec.push_back(ptr);
  }
  REQUIRE(ptr.use_count() == 1);
}
