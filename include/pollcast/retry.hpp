/**
 * @file retry.hpp
 * @brief Bounded exponential backoff for kBackendUnavailable.
 */

#ifndef POLLCAST_RETRY_HPP_
#define POLLCAST_RETRY_HPP_

#include "log.hpp"
#include "vocabulary.hpp"

#include <chrono>
#include <string>
#include <thread>

namespace pollcast {

struct RetryPolicy {
  uint32_t max_attempts = 4;
  std::chrono::milliseconds initial_delay{20};
  std::chrono::milliseconds max_delay{1000};
  uint32_t multiplier = 2;

  // Delay before attempt number `attempt` (1-based, attempt 0 never waits)
  std::chrono::milliseconds delay_for(uint32_t attempt) const {
    if (attempt == 0) return std::chrono::milliseconds{0};
    auto delay = initial_delay;
    for (uint32_t i = 1; i < attempt && delay < max_delay; ++i) {
      delay *= multiplier;
    }
    return delay < max_delay ? delay : max_delay;
  }
};

/**
 * Call op() until it succeeds, fails with something other than
 * kBackendUnavailable, or the attempts run out. Only for idempotent ops.
 */
template <typename Op>
auto retry_on_unavailable(const RetryPolicy& policy, const char* what, Op&& op) -> decltype(op()) {
  auto result = op();
  for (uint32_t attempt = 1; attempt < policy.max_attempts; ++attempt) {
    if (result || result.get_error() != ErrorCode::kBackendUnavailable) break;
    auto delay = policy.delay_for(attempt);
    POLLCAST_LOG_WARN(std::string(what) + ": backend unavailable, retry " + std::to_string(attempt) + " in " +
                      std::to_string(delay.count()) + "ms");
    std::this_thread::sleep_for(delay);
    result = op();
  }
  return result;
}

}  // namespace pollcast

#endif  // POLLCAST_RETRY_HPP_
