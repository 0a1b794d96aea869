#include "config/engine_config.hpp"

#include "ledger_errors.hpp"

#include <fstream>

namespace ledger {
namespace config {

namespace {

template <typename T>
T readValue(const nlohmann::json& section, const char* key, const T& fallback,
            const std::string& path) {
  if (!section.contains(key)) return fallback;
  try {
    return section.at(key).get<T>();
  } catch (const nlohmann::json::exception& e) {
    throw ConfigError("Invalid value for " + path + "." + key + ": " + e.what());
  }
}

int readPositive(const nlohmann::json& section, const char* key, int fallback,
                 const std::string& path, bool allow_zero = false) {
  int value = readValue<int>(section, key, fallback, path);
  if (value < 0 || (value == 0 && !allow_zero)) {
    throw ConfigError(path + "." + key + " must be positive");
  }
  return value;
}

FrozenCreditPolicy parseFrozenCreditPolicy(const std::string& text) {
  if (text == "block") return FrozenCreditPolicy::BLOCK;
  if (text == "allow") return FrozenCreditPolicy::ALLOW;
  throw ConfigError("Unknown frozen_credit_policy: " + text);
}

Amount readAmount(const nlohmann::json& section, const char* key, Amount fallback,
                  const std::string& path) {
  if (!section.contains(key)) return fallback;
  const auto& value = section.at(key);
  if (value.is_string()) {
    auto parsed = parseAmount(value.get<std::string>());
    if (!parsed || *parsed < 0) {
      throw ConfigError("Invalid amount for " + path + "." + key);
    }
    return *parsed;
  }
  if (value.is_number_integer()) {
    Amount minor = value.get<Amount>();
    if (minor < 0) throw ConfigError(path + "." + key + " must not be negative");
    return minor;
  }
  throw ConfigError("Invalid amount for " + path + "." + key);
}

DatabaseConfig databaseFromJson(const nlohmann::json& j, const std::string& path) {
  DatabaseConfig db;
  db.host = readValue<std::string>(j, "host", db.host, path);
  db.port = readPositive(j, "port", db.port, path);
  db.database = readValue<std::string>(j, "database", db.database, path);
  db.username = readValue<std::string>(j, "username", db.username, path);
  db.password = readValue<std::string>(j, "password", db.password, path);
  db.connection_timeout = readPositive(j, "connection_timeout", db.connection_timeout, path);
  db.statement_timeout_ms = readPositive(j, "statement_timeout_ms", db.statement_timeout_ms,
                                         path, true);
  db.max_connections = readValue<size_t>(j, "max_connections", db.max_connections, path);
  if (db.max_connections == 0) {
    throw ConfigError(path + ".max_connections must be positive");
  }
  return db;
}

}  // namespace

std::string toString(FrozenCreditPolicy policy) {
  return policy == FrozenCreditPolicy::BLOCK ? "block" : "allow";
}

EngineConfig configFromJson(const nlohmann::json& j) {
  if (!j.is_object()) {
    throw ConfigError("Config root must be a JSON object");
  }

  EngineConfig config;
  const auto empty = nlohmann::json::object();
  auto section = [&](const char* name) -> const nlohmann::json& {
    if (!j.contains(name)) return empty;
    if (!j.at(name).is_object()) throw ConfigError(std::string(name) + " must be an object");
    return j.at(name);
  };

  const auto& accounts = section("accounts");
  config.accounts.overdraft_limit =
      readAmount(accounts, "overdraft_limit", config.accounts.overdraft_limit, "accounts");
  config.accounts.frozen_credit = parseFrozenCreditPolicy(readValue<std::string>(
      accounts, "frozen_credit_policy", toString(config.accounts.frozen_credit), "accounts"));

  const auto& locking = section("locking");
  config.locking.lock_timeout_ms =
      readPositive(locking, "lock_timeout_ms", config.locking.lock_timeout_ms, "locking");
  config.locking.lock_attempts =
      readPositive(locking, "lock_attempts", config.locking.lock_attempts, "locking");
  config.locking.max_version_retries = readPositive(
      locking, "max_version_retries", config.locking.max_version_retries, "locking");

  const auto& router = section("router");
  config.router.replica_enabled =
      readValue<bool>(router, "replica_enabled", config.router.replica_enabled, "router");
  config.router.staleness_window_ms = readPositive(
      router, "staleness_window_ms", config.router.staleness_window_ms, "router", true);

  const auto& publisher = section("publisher");
  config.publisher.partitions =
      readValue<size_t>(publisher, "partitions", config.publisher.partitions, "publisher");
  if (config.publisher.partitions == 0) {
    throw ConfigError("publisher.partitions must be positive");
  }
  config.publisher.max_delivery_attempts = readPositive(
      publisher, "max_delivery_attempts", config.publisher.max_delivery_attempts, "publisher");
  config.publisher.retry_backoff_ms = readPositive(
      publisher, "retry_backoff_ms", config.publisher.retry_backoff_ms, "publisher", true);

  const auto& reconciler = section("reconciler");
  config.reconciler.interval_ms = readPositive(
      reconciler, "interval_ms", config.reconciler.interval_ms, "reconciler", true);
  config.reconciler.max_credit_attempts = readPositive(
      reconciler, "max_credit_attempts", config.reconciler.max_credit_attempts, "reconciler");
  config.reconciler.give_up_after_ms = readPositive(
      reconciler, "give_up_after_ms", config.reconciler.give_up_after_ms, "reconciler");
  config.reconciler.batch_size =
      readValue<size_t>(reconciler, "batch_size", config.reconciler.batch_size, "reconciler");
  if (config.reconciler.batch_size == 0) {
    throw ConfigError("reconciler.batch_size must be positive");
  }

  const auto& database = section("database");
  config.use_database = readValue<bool>(database, "enabled", config.use_database, "database");
  if (database.contains("primary")) {
    config.primary_db = databaseFromJson(database.at("primary"), "database.primary");
  }
  if (database.contains("replica")) {
    config.replica_db = databaseFromJson(database.at("replica"), "database.replica");
  }

  const auto& server = section("server");
  config.server.port = readPositive(server, "port", config.server.port, "server");

  config.log_level = readValue<std::string>(j, "log_level", config.log_level, "");

  return config;
}

EngineConfig loadConfigFile(const std::string& path) {
  std::ifstream in(path);
  if (!in) {
    throw ConfigError("Cannot open config file: " + path);
  }

  nlohmann::json j;
  try {
    in >> j;
  } catch (const nlohmann::json::parse_error& e) {
    throw ConfigError("Cannot parse config file " + path + ": " + e.what());
  }
  return configFromJson(j);
}

}  // namespace config
}  // namespace ledger
