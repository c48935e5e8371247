#include "pollcast/config.hpp"

#include "pollcast/server.hpp"

#include <cerrno>
#include <cstdlib>

namespace pollcast {

namespace {

bool parse_int(const std::string& text, long min, long max, long& out) {
  if (text.empty()) return false;
  errno = 0;
  char* end = nullptr;
  long v = std::strtol(text.c_str(), &end, 10);
  if (errno != 0 || end == nullptr || *end != '\0') return false;
  if (v < min || v > max) return false;
  out = v;
  return true;
}

// One setting, fed from either source. source names the variable or flag.
bool apply(ServerConfig& cfg, const std::string& key, const std::string& value, const std::string& source,
           std::string& error) {
  long n = 0;
  if (key == "port") {
    if (!parse_int(value, 0, 65535, n)) {
      error = source + ": port must be 0-65535, got '" + value + "'";
      return false;
    }
    cfg.port = static_cast<uint16_t>(n);
  } else if (key == "bind") {
    cfg.bind_addr = value;
  } else if (key == "store") {
    if (value == "memory") {
      cfg.store = ServerConfig::StoreKind::kMemory;
    } else if (value == "redis") {
      cfg.store = ServerConfig::StoreKind::kRedis;
    } else {
      error = source + ": store must be 'memory' or 'redis', got '" + value + "'";
      return false;
    }
  } else if (key == "redis-url") {
    if (value.empty()) {
      error = source + ": redis url is empty";
      return false;
    }
    cfg.redis_url = value;
  } else if (key == "max-connections") {
    if (!parse_int(value, 1, static_cast<long>(Server::kMaxConnections), n)) {
      error = source + ": max connections must be 1-" + std::to_string(Server::kMaxConnections) + ", got '" +
              value + "'";
      return false;
    }
    cfg.max_connections = static_cast<size_t>(n);
  } else if (key == "poll-timeout-ms") {
    if (!parse_int(value, 1, 60000, n)) {
      error = source + ": poll timeout must be 1-60000 ms, got '" + value + "'";
      return false;
    }
    cfg.poll_timeout_ms = static_cast<int>(n);
  } else if (key == "shutdown-timeout-ms") {
    if (!parse_int(value, 0, 600000, n)) {
      error = source + ": shutdown timeout must be 0-600000 ms, got '" + value + "'";
      return false;
    }
    cfg.shutdown_timeout_ms = static_cast<int>(n);
  } else if (key == "log-level") {
    auto level = Logger::parse_level(value);
    if (!level) {
      error = source + ": log level must be debug, info, warn, error or off, got '" + value + "'";
      return false;
    }
    cfg.log_level = level.value();
  } else {
    error = "unknown option " + source;
    return false;
  }
  return true;
}

struct EnvBinding {
  const char* var;
  const char* key;
};

const EnvBinding kEnvBindings[] = {
    {"POLLCAST_PORT", "port"},
    {"POLLCAST_BIND", "bind"},
    {"POLLCAST_STORE", "store"},
    {"REDIS_URL", "redis-url"},
    {"POLLCAST_MAX_CONNECTIONS", "max-connections"},
    {"POLLCAST_SHUTDOWN_TIMEOUT_MS", "shutdown-timeout-ms"},
    {"POLLCAST_LOG_LEVEL", "log-level"},
};

}  // namespace

const char* process_env(const char* name) { return std::getenv(name); }

expected<ServerConfig, ErrorCode> load_config(int argc, const char* const* argv, std::string& error,
                                              const EnvLookup& env) {
  ServerConfig cfg;
  auto fail = expected<ServerConfig, ErrorCode>::error(ErrorCode::kInvalidArgument);

  if (env) {
    for (const auto& binding : kEnvBindings) {
      const char* value = env(binding.var);
      if (value == nullptr) continue;
      if (!apply(cfg, binding.key, value, binding.var, error)) return fail;
    }
  }

  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "-h" || arg == "--help") {
      cfg.show_help = true;
      continue;
    }
    if (arg.rfind("--", 0) != 0) {
      error = "unexpected argument '" + arg + "'";
      return fail;
    }

    // --key=value or --key value
    std::string key;
    std::string value;
    auto eq = arg.find('=');
    if (eq != std::string::npos) {
      key = arg.substr(2, eq - 2);
      value = arg.substr(eq + 1);
    } else {
      key = arg.substr(2);
      if (i + 1 >= argc) {
        error = "missing value for " + arg;
        return fail;
      }
      value = argv[++i];
    }
    if (!apply(cfg, key, value, "--" + key, error)) return fail;
  }

  return expected<ServerConfig, ErrorCode>::success(std::move(cfg));
}

std::string usage(const char* prog) {
  std::string text = "Usage: ";
  text += prog;
  text +=
      " [options]\n"
      "\n"
      "  --port N                  listen port, 0 for ephemeral (POLLCAST_PORT, default 8080)\n"
      "  --bind ADDR               bind address (POLLCAST_BIND, default all interfaces)\n"
      "  --store memory|redis      backing store (POLLCAST_STORE, default memory)\n"
      "  --redis-url URL           redis endpoint (REDIS_URL, default tcp://127.0.0.1:6379)\n"
      "  --max-connections N       connection limit (POLLCAST_MAX_CONNECTIONS, default 50)\n"
      "  --poll-timeout-ms N       reactor poll() timeout (default 100)\n"
      "  --shutdown-timeout-ms N   time allowed to drain on shutdown (POLLCAST_SHUTDOWN_TIMEOUT_MS, default 2000)\n"
      "  --log-level LEVEL         debug|info|warn|error|off (POLLCAST_LOG_LEVEL, default info)\n"
      "  -h, --help                show this text\n";
  return text;
}

const char* to_string(ServerConfig::StoreKind kind) {
  switch (kind) {
    case ServerConfig::StoreKind::kMemory: return "memory";
    case ServerConfig::StoreKind::kRedis: return "redis";
  }
  return "unknown";
}

}  // namespace pollcast
