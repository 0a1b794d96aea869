#include "database/postgres_connection.hpp"

#include "ledger_errors.hpp"
#include "observability/logger.hpp"

#include <chrono>
#include <iomanip>
#include <limits>
#include <locale>
#include <sstream>

namespace ledger {
namespace database {

namespace {

// Connection-class errors, statement timeout and server shutdown mean the
// store is unreachable rather than that the query was wrong.
bool isUnavailableState(const std::string& sql_state) {
  return sql_state.rfind("08", 0) == 0 || sql_state == "57014" || sql_state == "57P01" ||
         sql_state == "57P02" || sql_state == "57P03";
}

std::string quoteConnValue(const std::string& value) {
  std::string quoted = "'";
  for (char c : value) {
    if (c == '\'' || c == '\\') quoted += '\\';
    quoted += c;
  }
  quoted += "'";
  return quoted;
}

}  // namespace

std::string doubleParam(double value) {
  std::ostringstream out;
  out.imbue(std::locale::classic());
  out << std::setprecision(std::numeric_limits<double>::max_digits10) << value;
  return out.str();
}

PostgresConnection::PostgresConnection(const Config& config)
    : config_(config), connection_(nullptr), in_transaction_(false) {
}

PostgresConnection::~PostgresConnection() {
  disconnect();
}

bool PostgresConnection::connect() {
  if (connection_) {
    disconnect();
  }

  std::stringstream conn_str;
  conn_str << "host=" << quoteConnValue(config_.host)
           << " port=" << config_.port
           << " dbname=" << quoteConnValue(config_.database)
           << " user=" << quoteConnValue(config_.username)
           << " password=" << quoteConnValue(config_.password)
           << " connect_timeout=" << config_.connection_timeout;

  connection_ = PQconnectdb(conn_str.str().c_str());

  if (PQstatus(connection_) != CONNECTION_OK) {
    LEDGER_LOG_BUILDER(ERROR, "Database connection failed")
        .field("database", getConnectionInfo())
        .field("error", std::string(PQerrorMessage(connection_)));
    PQfinish(connection_);
    connection_ = nullptr;
    return false;
  }

  try {
    execute("SET SESSION statement_timeout = " + std::to_string(config_.statement_timeout_ms));
  } catch (const LedgerError& e) {
    LEDGER_LOG_BUILDER(ERROR, "Failed to configure database session")
        .field("database", getConnectionInfo())
        .field("error", e.what());
    disconnect();
    return false;
  }

  LEDGER_LOG_BUILDER(INFO, "Connected to PostgreSQL").field("database", getConnectionInfo());
  return true;
}

void PostgresConnection::disconnect() {
  if (connection_) {
    if (in_transaction_) {
      PGresult* result = PQexec(connection_, "ROLLBACK");
      PQclear(result);
      in_transaction_ = false;
    }
    PQfinish(connection_);
    connection_ = nullptr;
  }
}

bool PostgresConnection::isConnected() const {
  return connection_ && PQstatus(connection_) == CONNECTION_OK;
}

PgResult PostgresConnection::execute(const std::string& query) {
  if (!connection_) {
    throw StoreUnavailable("Not connected to " + getConnectionInfo());
  }
  return check(PQexec(connection_, query.c_str()), query);
}

PgResult PostgresConnection::execute(const std::string& query, const PgParams& params) {
  if (!connection_) {
    throw StoreUnavailable("Not connected to " + getConnectionInfo());
  }

  std::vector<const char*> values;
  values.reserve(params.size());
  for (const auto& param : params) {
    values.push_back(param ? param->c_str() : nullptr);
  }

  PGresult* result = PQexecParams(connection_, query.c_str(), static_cast<int>(values.size()),
                                  nullptr, values.data(), nullptr, nullptr, 0);
  return check(result, query);
}

PgResult PostgresConnection::check(PGresult* raw, const std::string& query) {
  PgResult result(raw);

  if (!result) {
    throw StoreUnavailable("Query execution failed: " + getLastError());
  }

  ExecStatusType status = PQresultStatus(result.get());
  if (status == PGRES_COMMAND_OK || status == PGRES_TUPLES_OK) {
    return result;
  }

  const char* state = PQresultErrorField(result.get(), PG_DIAG_SQLSTATE);
  std::string sql_state = state ? state : "";
  std::string message = PQresultErrorMessage(result.get());

  LEDGER_LOG_BUILDER(WARN, "Query failed")
      .field("sql_state", sql_state)
      .field("error", message)
      .field("query", query.substr(0, 120));

  if (PQstatus(connection_) != CONNECTION_OK || isUnavailableState(sql_state)) {
    throw StoreUnavailable("Database unavailable: " + message);
  }
  throw DatabaseError(sql_state, "Query failed: " + message);
}

void PostgresConnection::beginTransaction() {
  execute("BEGIN");
  in_transaction_ = true;
}

void PostgresConnection::commitTransaction() {
  if (!in_transaction_) {
    throw DatabaseError("", "Commit without an open transaction");
  }
  in_transaction_ = false;
  execute("COMMIT");
}

void PostgresConnection::rollbackTransaction() {
  if (!in_transaction_) {
    return;
  }
  in_transaction_ = false;
  execute("ROLLBACK");
}

std::string PostgresConnection::getLastError() const {
  if (!connection_) {
    return "Not connected";
  }
  return PQerrorMessage(connection_);
}

std::string PostgresConnection::getConnectionInfo() const {
  std::stringstream ss;
  ss << config_.username << "@" << config_.host << ":" << config_.port << "/" << config_.database;
  return ss.str();
}

TransactionGuard::TransactionGuard(PostgresConnection& conn)
    : conn_(conn), finished_(false) {
  conn_.beginTransaction();
}

TransactionGuard::~TransactionGuard() {
  if (finished_) return;
  try {
    conn_.rollbackTransaction();
  } catch (const LedgerError& e) {
    // The connection is likely gone; the server rolls back on its own.
    LEDGER_LOG_BUILDER(WARN, "Rollback failed").field("error", e.what());
  }
}

void TransactionGuard::commit() {
  if (finished_) return;
  finished_ = true;
  conn_.commitTransaction();
}

void TransactionGuard::rollback() {
  if (finished_) return;
  finished_ = true;
  conn_.rollbackTransaction();
}

ConnectionPool::ConnectionPool(const config::DatabaseConfig& config)
    : config_(config), open_count_(0) {
}

ConnectionPool::~ConnectionPool() = default;

ConnectionPool::Lease::Lease(ConnectionPool& pool, std::unique_ptr<PostgresConnection> conn)
    : pool_(&pool), conn_(std::move(conn)) {
}

ConnectionPool::Lease::Lease(Lease&& other) noexcept
    : pool_(other.pool_), conn_(std::move(other.conn_)) {
  other.pool_ = nullptr;
}

ConnectionPool::Lease::~Lease() {
  if (pool_ && conn_) {
    pool_->release(std::move(conn_));
  }
}

ConnectionPool::Lease ConnectionPool::acquire() {
  std::unique_lock<std::mutex> lock(mutex_);
  auto deadline = std::chrono::steady_clock::now() +
                  std::chrono::seconds(config_.connection_timeout);

  while (idle_.empty() && open_count_ >= config_.max_connections) {
    if (available_.wait_until(lock, deadline) == std::cv_status::timeout &&
        idle_.empty() && open_count_ >= config_.max_connections) {
      throw StoreUnavailable("Timed out waiting for a connection to " + describe());
    }
  }

  if (!idle_.empty()) {
    auto conn = std::move(idle_.back());
    idle_.pop_back();
    return Lease(*this, std::move(conn));
  }

  // Open a new connection outside the pool lock.
  ++open_count_;
  lock.unlock();

  auto conn = std::make_unique<PostgresConnection>(config_);
  if (!conn->connect()) {
    lock.lock();
    --open_count_;
    available_.notify_one();
    throw StoreUnavailable("Cannot connect to " + describe());
  }
  return Lease(*this, std::move(conn));
}

void ConnectionPool::release(std::unique_ptr<PostgresConnection> conn) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (conn->isConnected() && !conn->inTransaction()) {
    idle_.push_back(std::move(conn));
  } else {
    --open_count_;
  }
  available_.notify_one();
}

std::string ConnectionPool::describe() const {
  std::stringstream ss;
  ss << config_.username << "@" << config_.host << ":" << config_.port << "/" << config_.database;
  return ss.str();
}

}  // namespace database
}  // namespace ledger
