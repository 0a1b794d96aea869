#include "ledger_engine.hpp"
#include "ledger_server.hpp"
#include "notify/notification_publisher.hpp"
#include "observability/logger.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

std::atomic<bool> running{true};

void signalHandler(int) {
  running = false;
}

int main(int argc, char* argv[]) {
  using namespace ledger;

  // Usage: ledger_server [config.json] [port]
  config::EngineConfig engine_config;
  try {
    if (argc >= 2) {
      engine_config = config::loadConfigFile(argv[1]);
    }
    if (argc >= 3) {
      engine_config.server.port = std::stoi(argv[2]);
    }
  } catch (const std::exception& e) {
    std::cerr << "Invalid configuration: " << e.what() << std::endl;
    return 1;
  }

  auto& logger = observability::Logger::getInstance();
  logger.setLogLevel(observability::parseLogLevel(engine_config.log_level));

  std::cout << "=== Ledger Server ===" << std::endl;
  std::cout << "Port: " << engine_config.server.port << std::endl;
  if (engine_config.use_database) {
    std::cout << "Database: " << engine_config.primary_db.username << "@"
              << engine_config.primary_db.host << ":" << engine_config.primary_db.port << "/"
              << engine_config.primary_db.database << std::endl;
  } else {
    std::cout << "Storage: in-memory" << std::endl;
  }
  std::cout << "=====================" << std::endl;

  signal(SIGINT, signalHandler);
  signal(SIGTERM, signalHandler);

  try {
    DataSources sources = engine_config.use_database ? DataSources::postgres(engine_config)
                                                     : DataSources::inMemory(engine_config);

    // Notifications go out as JSON lines on stdout
    auto sink = std::make_shared<notify::StreamEventSink>(std::cout);
    LedgerEngine engine(engine_config, std::move(sources), sink);
    LedgerServer server(engine_config.server.port, engine);

    if (!server.start()) {
      std::cerr << "Failed to start ledger server" << std::endl;
      return 1;
    }

    int ticks = 0;
    while (running) {
      std::this_thread::sleep_for(std::chrono::milliseconds(200));
      if (++ticks % 50 != 0) {
        continue;
      }
      auto stats = server.getStats();
      LEDGER_LOG_BUILDER(INFO, "Server statistics")
          .field("active_connections", static_cast<std::int64_t>(stats.active_connections))
          .field("notifications_delivered",
                 static_cast<std::int64_t>(stats.notifications.delivered))
          .field("notifications_failed", static_cast<std::int64_t>(stats.notifications.failed))
          .field("notifications_pending",
                 static_cast<std::int64_t>(stats.notifications.pending));
    }

    LEDGER_LOG_INFO("Shutting down");
    server.stop();
  } catch (const std::exception& e) {
    LEDGER_LOG_BUILDER(FATAL, "Server error").field("error", e.what());
    return 1;
  }

  return 0;
}
