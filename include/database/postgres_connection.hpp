#ifndef POSTGRES_CONNECTION_HPP_
#define POSTGRES_CONNECTION_HPP_

#include "config/engine_config.hpp"

#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <postgresql/libpq-fe.h>

namespace ledger {
namespace database {

struct PgResultDeleter {
  void operator()(PGresult* result) const { PQclear(result); }
};

using PgResult = std::unique_ptr<PGresult, PgResultDeleter>;

// Text-format query parameters; std::nullopt binds SQL NULL.
using PgParams = std::vector<std::optional<std::string>>;

// Text form of a double that parses back to the same value.
std::string doubleParam(double value);

/**
 * One PostgreSQL connection. Not shared between threads; ConnectionPool hands
 * it to one user at a time.
 *
 * Failures throw: StoreUnavailable for lost connections and statement
 * timeouts, DatabaseError for everything else.
 */
class PostgresConnection {
 public:
  using Config = config::DatabaseConfig;

  explicit PostgresConnection(const Config& config);
  ~PostgresConnection();

  // Non-copyable
  PostgresConnection(const PostgresConnection&) = delete;
  PostgresConnection& operator=(const PostgresConnection&) = delete;

  /**
   * Connect to the database. Logs and returns false on failure.
   */
  bool connect();

  void disconnect();

  bool isConnected() const;

  /**
   * Execute a statement without parameters.
   */
  PgResult execute(const std::string& query);

  /**
   * Execute a parameterized statement.
   */
  PgResult execute(const std::string& query, const PgParams& params);

  void beginTransaction();
  void commitTransaction();
  void rollbackTransaction();

  bool inTransaction() const { return in_transaction_; }

  std::string getLastError() const;

  /**
   * Get connection info for logging (never includes the password).
   */
  std::string getConnectionInfo() const;

 private:
  PgResult check(PGresult* result, const std::string& query);

  Config config_;
  PGconn* connection_;
  bool in_transaction_;
};

/**
 * RAII wrapper for database transactions. Rolls back unless committed.
 */
class TransactionGuard {
 public:
  explicit TransactionGuard(PostgresConnection& conn);
  ~TransactionGuard();

  // Non-copyable
  TransactionGuard(const TransactionGuard&) = delete;
  TransactionGuard& operator=(const TransactionGuard&) = delete;

  void commit();

  void rollback();

 private:
  PostgresConnection& conn_;
  bool finished_;
};

/**
 * Bounded pool of connections, opened lazily up to max_connections.
 */
class ConnectionPool {
 public:
  explicit ConnectionPool(const config::DatabaseConfig& config);
  ~ConnectionPool();

  // Non-copyable
  ConnectionPool(const ConnectionPool&) = delete;
  ConnectionPool& operator=(const ConnectionPool&) = delete;

  /**
   * Exclusive use of one connection; returned to the pool on destruction.
   */
  class Lease {
   public:
    Lease(ConnectionPool& pool, std::unique_ptr<PostgresConnection> conn);
    ~Lease();

    Lease(Lease&& other) noexcept;
    Lease& operator=(Lease&&) = delete;
    Lease(const Lease&) = delete;
    Lease& operator=(const Lease&) = delete;

    PostgresConnection& operator*() { return *conn_; }
    PostgresConnection* operator->() { return conn_.get(); }

   private:
    ConnectionPool* pool_;
    std::unique_ptr<PostgresConnection> conn_;
  };

  /**
   * Waits up to connection_timeout seconds for a free connection.
   * Throws StoreUnavailable if none can be had.
   */
  Lease acquire();

  std::string describe() const;

 private:
  void release(std::unique_ptr<PostgresConnection> conn);

  config::DatabaseConfig config_;
  std::vector<std::unique_ptr<PostgresConnection>> idle_;
  size_t open_count_;
  std::mutex mutex_;
  std::condition_variable available_;
};

}  // namespace database
}  // namespace ledger

#endif  // POSTGRES_CONNECTION_HPP_
