#include "pollcast.hpp"

#ifdef POLLCAST_WITH_REDIS
#include "pollcast/redis_store.hpp"
#endif

#include <csignal>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>

namespace {

pollcast::Server* g_server = nullptr;

void on_signal(int) {
  if (g_server != nullptr) g_server->stop();
}

std::shared_ptr<pollcast::Store> make_store(const pollcast::ServerConfig& cfg) {
  if (cfg.store == pollcast::ServerConfig::StoreKind::kRedis) {
#ifdef POLLCAST_WITH_REDIS
    return std::make_shared<pollcast::RedisStore>(cfg.redis_url);
#else
    POLLCAST_THROW(std::runtime_error("built without Redis support (POLLCAST_WITH_REDIS=OFF)"));
#endif
  }
  return std::make_shared<pollcast::MemoryStore>();
}

}  // namespace

int main(int argc, char* argv[]) {
  std::string error;
  auto cfg = pollcast::load_config(argc, argv, error);
  if (!cfg) {
    std::cerr << "Error: " << error << "\n\n" << pollcast::usage(argv[0]);
    return 2;
  }
  if (cfg.value().show_help) {
    std::cout << pollcast::usage(argv[0]);
    return 0;
  }
  const pollcast::ServerConfig& config = cfg.value();
  pollcast::Logger::set_level(config.log_level);

  try {
    auto store = make_store(config);
    pollcast::PollEngine engine(store);
    pollcast::ConnectionRegistry registry;
    pollcast::BroadcastDispatcher dispatcher(registry);

    // Watchers must be wired before the first vote can be accepted
    pollcast::EventBridge bridge(*store, dispatcher);
    auto started = bridge.start();
    if (!started) {
      POLLCAST_LOG_ERROR(std::string("cannot subscribe to the ") + store->name() + " store: " +
                         pollcast::to_string(started.get_error()));
      return 1;
    }

    pollcast::Server server(config.port, config.bind_addr);
    server.set_max_connections(config.max_connections)
        .set_poll_timeout_ms(config.poll_timeout_ms)
        .set_shutdown_timeout_ms(config.shutdown_timeout_ms);

    pollcast::PollGateway gateway(engine, registry, dispatcher);
    gateway.set_bridge(&bridge);
    gateway.attach(server);

    g_server = &server;
    std::signal(SIGINT, on_signal);
    std::signal(SIGTERM, on_signal);

    POLLCAST_LOG_INFO("pollcast listening on port " + std::to_string(server.port()) + " (" +
                      pollcast::to_string(config.store) + " store)");
    server.run();
    g_server = nullptr;

    auto leftovers = registry.deregister_all();
    if (!leftovers.empty()) {
      POLLCAST_LOG_INFO("deregistered " + std::to_string(leftovers.size()) + " connection(s) at shutdown");
    }
    bridge.stop();
    POLLCAST_LOG_INFO("pollcast stopped");
  } catch (const std::exception& e) {
    POLLCAST_LOG_ERROR(std::string("fatal: ") + e.what());
    return 1;
  }

  return 0;
}
