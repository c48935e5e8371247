/**
 * @file config.hpp
 * @brief Process configuration: defaults, then environment, then argv.
 */

#ifndef POLLCAST_CONFIG_HPP_
#define POLLCAST_CONFIG_HPP_

#include "log.hpp"
#include "vocabulary.hpp"

#include <cstdint>
#include <functional>
#include <string>

namespace pollcast {

struct ServerConfig {
  enum class StoreKind : uint8_t { kMemory, kRedis };

  uint16_t port = 8080;
  std::string bind_addr;  // empty: all interfaces
  StoreKind store = StoreKind::kMemory;
  std::string redis_url = "tcp://127.0.0.1:6379";
  size_t max_connections = 50;
  int poll_timeout_ms = 100;
  int shutdown_timeout_ms = 2000;
  Logger::Level log_level = Logger::Level::kInfo;
  bool show_help = false;
};

// Returns nullptr for an unset variable
using EnvLookup = std::function<const char*(const char*)>;

const char* process_env(const char* name);

// kInvalidArgument on an unknown flag, a missing value or a bad value;
// error then holds a message naming it.
expected<ServerConfig, ErrorCode> load_config(int argc, const char* const* argv, std::string& error,
                                              const EnvLookup& env = process_env);

std::string usage(const char* prog);

const char* to_string(ServerConfig::StoreKind kind);

}  // namespace pollcast

#endif  // POLLCAST_CONFIG_HPP_
