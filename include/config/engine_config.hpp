#ifndef ENGINE_CONFIG_HPP_
#define ENGINE_CONFIG_HPP_

#include "money.hpp"

#include <cstddef>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace ledger {
namespace config {

/**
 * What a credit to a frozen account does. Debits from a frozen account are
 * always rejected.
 */
enum class FrozenCreditPolicy {
  BLOCK,
  ALLOW
};

struct AccountPolicy {
  Amount overdraft_limit = 0;  // balance may not drop below -overdraft_limit
  FrozenCreditPolicy frozen_credit = FrozenCreditPolicy::BLOCK;
};

struct LockingConfig {
  int lock_timeout_ms = 2000;
  int lock_attempts = 3;
  int max_version_retries = 3;
};

struct RouterConfig {
  bool replica_enabled = false;
  int staleness_window_ms = 1000;  // read-your-writes window per caller
};

struct PublisherConfig {
  size_t partitions = 4;
  int max_delivery_attempts = 5;
  int retry_backoff_ms = 50;
};

/**
 * Reconciliation of DEEMED_APPROVED transfers. The payee counts as
 * permanently unreachable once either limit is hit; a missing payee, or a
 * frozen one under the BLOCK credit policy, counts as permanently invalid.
 */
struct ReconcilerConfig {
  int interval_ms = 30000;        // 0 disables the background pass
  int max_credit_attempts = 10;
  int give_up_after_ms = 15 * 60 * 1000;
  size_t batch_size = 100;
};

/**
 * PostgreSQL connection settings.
 */
struct DatabaseConfig {
  std::string host = "localhost";
  int port = 5432;
  std::string database = "ledger";
  std::string username = "ledger_user";
  std::string password = "";
  int connection_timeout = 10;  // seconds
  int statement_timeout_ms = 5000;
  size_t max_connections = 8;
};

struct ServerConfig {
  int port = 8080;
};

struct EngineConfig {
  AccountPolicy accounts;
  LockingConfig locking;
  RouterConfig router;
  PublisherConfig publisher;
  ReconcilerConfig reconciler;
  bool use_database = false;
  DatabaseConfig primary_db;
  std::optional<DatabaseConfig> replica_db;
  ServerConfig server;
  std::string log_level = "info";
};

/**
 * Builds a config from JSON. Missing keys keep their defaults; malformed
 * values raise ConfigError.
 */
EngineConfig configFromJson(const nlohmann::json& j);

/**
 * Reads and parses a JSON config file. Throws ConfigError.
 */
EngineConfig loadConfigFile(const std::string& path);

std::string toString(FrozenCreditPolicy policy);

}  // namespace config
}  // namespace ledger

#endif  // ENGINE_CONFIG_HPP_
