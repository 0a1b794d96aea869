#include "database/ledger_persistence.hpp"

#include "ledger_errors.hpp"
#include "observability/logger.hpp"

#include <stdexcept>
#include <string>

namespace ledger {
namespace database {

namespace {

const char* const kSchemaStatements[] = {
    R"(
      CREATE TABLE IF NOT EXISTS accounts (
        account_id TEXT PRIMARY KEY,
        balance BIGINT NOT NULL,
        frozen BOOLEAN NOT NULL DEFAULT FALSE,
        version BIGINT NOT NULL DEFAULT 1,
        created_at TIMESTAMPTZ NOT NULL DEFAULT now(),
        updated_at TIMESTAMPTZ NOT NULL DEFAULT now()
      )
    )",
    R"(
      CREATE TABLE IF NOT EXISTS account_ledger (
        ledger_id BIGSERIAL PRIMARY KEY,
        global_txn_id TEXT NOT NULL,
        account_id TEXT NOT NULL,
        amount BIGINT NOT NULL,
        direction TEXT NOT NULL CHECK (direction IN ('DEBIT', 'CREDIT')),
        counterparty_id TEXT NOT NULL DEFAULT '',
        balance_after BIGINT NOT NULL,
        risk_score DOUBLE PRECISION,
        created_at_us BIGINT NOT NULL,
        UNIQUE (global_txn_id, account_id, direction)
      )
    )",
    "CREATE INDEX IF NOT EXISTS idx_account_ledger_history "
    "ON account_ledger (account_id, created_at_us DESC, ledger_id DESC)",
    "CREATE INDEX IF NOT EXISTS idx_account_ledger_txn ON account_ledger (global_txn_id)",
    R"(
      CREATE TABLE IF NOT EXISTS transfers (
        txn_id TEXT PRIMARY KEY,
        seq BIGSERIAL,
        payer_id TEXT NOT NULL,
        payee_id TEXT NOT NULL,
        amount BIGINT NOT NULL,
        status TEXT NOT NULL,
        verdict TEXT NOT NULL,
        risk_score DOUBLE PRECISION,
        message TEXT NOT NULL DEFAULT '',
        credit_attempts INTEGER NOT NULL DEFAULT 0,
        created_at_us BIGINT NOT NULL,
        updated_at_us BIGINT NOT NULL
      )
    )",
    "CREATE INDEX IF NOT EXISTS idx_transfers_status ON transfers (status, seq)",
};

const char* const kNowMicros = "(EXTRACT(EPOCH FROM clock_timestamp()) * 1000000)::BIGINT";

const char* const kLedgerColumns =
    "ledger_id, global_txn_id, account_id, amount, direction, counterparty_id, "
    "balance_after, risk_score, created_at_us";

const char* const kTransferColumns =
    "txn_id, payer_id, payee_id, amount, status, verdict, risk_score, message, "
    "credit_attempts, created_at_us, updated_at_us";

std::string text(const PgResult& result, int row, int col) {
  return PQgetvalue(result.get(), row, col);
}

std::int64_t int64At(const PgResult& result, int row, int col) {
  return std::stoll(PQgetvalue(result.get(), row, col));
}

std::optional<double> optionalDouble(const PgResult& result, int row, int col) {
  if (PQgetisnull(result.get(), row, col)) {
    return std::nullopt;
  }
  return std::stod(PQgetvalue(result.get(), row, col));
}

std::optional<std::string> optionalParam(const std::optional<double>& value) {
  if (!value) return std::nullopt;
  return doubleParam(*value);
}

Account accountFromRow(const PgResult& result, int row) {
  Account account;
  account.account_id = text(result, row, 0);
  account.balance = int64At(result, row, 1);
  account.frozen = text(result, row, 2) == "t";
  account.version = int64At(result, row, 3);
  return account;
}

LedgerEntry entryFromRow(const PgResult& result, int row) {
  LedgerEntry entry;
  entry.entry_id = int64At(result, row, 0);
  entry.txn_id = text(result, row, 1);
  entry.account_id = text(result, row, 2);
  entry.amount = int64At(result, row, 3);
  auto direction = parseDirection(text(result, row, 4));
  if (!direction) {
    throw DatabaseError("", "Unknown ledger direction in row " + std::to_string(entry.entry_id));
  }
  entry.direction = *direction;
  entry.counterparty_id = text(result, row, 5);
  entry.balance_after = int64At(result, row, 6);
  entry.risk_score = optionalDouble(result, row, 7);
  entry.created_at = fromEpochMicros(int64At(result, row, 8));
  return entry;
}

Transaction transferFromRow(const PgResult& result, int row) {
  Transaction txn;
  txn.txn_id = text(result, row, 0);
  txn.payer_id = text(result, row, 1);
  txn.payee_id = text(result, row, 2);
  txn.amount = int64At(result, row, 3);
  auto status = parseTransactionStatus(text(result, row, 4));
  auto verdict = parseRiskVerdict(text(result, row, 5));
  if (!status || !verdict) {
    throw DatabaseError("", "Corrupt transfer row " + txn.txn_id);
  }
  txn.status = *status;
  txn.verdict = *verdict;
  txn.risk_score = optionalDouble(result, row, 6);
  txn.message = text(result, row, 7);
  txn.credit_attempts = static_cast<int>(int64At(result, row, 8));
  txn.created_at = fromEpochMicros(int64At(result, row, 9));
  txn.updated_at = fromEpochMicros(int64At(result, row, 10));
  return txn;
}

bool rowsAffected(const PgResult& result) {
  return std::string(PQcmdTuples(result.get())) != "0";
}

// Version check and balance update on an open transaction. Leaves the row
// locked until the caller's transaction ends.
storage::ApplyResult applyInTransaction(PostgresConnection& conn, const std::string& account_id,
                                        Amount delta, std::int64_t expected_version,
                                        const config::AccountPolicy& policy) {
  storage::ApplyResult outcome;
  auto current = conn.execute(
      "SELECT account_id, balance, frozen, version FROM accounts "
      "WHERE account_id = $1 FOR UPDATE",
      {account_id});
  if (PQntuples(current.get()) == 0) {
    outcome.status = storage::ApplyStatus::NOT_FOUND;
    return outcome;
  }

  Account account = accountFromRow(current, 0);
  outcome.status = storage::evaluateDelta(account, delta, expected_version, policy);
  if (!outcome.applied()) {
    return outcome;
  }

  auto updated = conn.execute(
      R"(
        UPDATE accounts
        SET balance = balance + $2, version = version + 1, updated_at = now()
        WHERE account_id = $1 AND version = $3
        RETURNING balance, version
      )",
      {account_id, std::to_string(delta), std::to_string(expected_version)});
  if (PQntuples(updated.get()) == 0) {
    outcome.status = storage::ApplyStatus::VERSION_CONFLICT;
    return outcome;
  }

  outcome.new_balance = int64At(updated, 0, 0);
  outcome.new_version = int64At(updated, 0, 1);
  return outcome;
}

storage::AppendStatus insertEntry(PostgresConnection& conn, LedgerEntry& entry) {
  auto result = conn.execute(
      std::string(R"(
        INSERT INTO account_ledger (global_txn_id, account_id, amount, direction,
                                    counterparty_id, balance_after, risk_score, created_at_us)
        VALUES ($1, $2, $3, $4, $5, $6, $7, )") + kNowMicros + R"()
        ON CONFLICT (global_txn_id, account_id, direction) DO NOTHING
        RETURNING ledger_id, created_at_us
      )",
      {entry.txn_id, entry.account_id, std::to_string(entry.amount), toString(entry.direction),
       entry.counterparty_id, std::to_string(entry.balance_after),
       optionalParam(entry.risk_score)});

  if (PQntuples(result.get()) == 0) {
    return storage::AppendStatus::DUPLICATE;
  }
  entry.entry_id = int64At(result, 0, 0);
  entry.created_at = fromEpochMicros(int64At(result, 0, 1));
  return storage::AppendStatus::APPENDED;
}

}  // namespace

void initializeSchema(ConnectionPool& pool) {
  auto conn = pool.acquire();
  TransactionGuard transaction(*conn);
  for (const char* statement : kSchemaStatements) {
    conn->execute(statement);
  }
  transaction.commit();
  LEDGER_LOG_BUILDER(INFO, "Database schema initialized").field("database", pool.describe());
}

// PostgresAccountStore

PostgresAccountStore::PostgresAccountStore(std::shared_ptr<ConnectionPool> pool,
                                           config::AccountPolicy policy)
    : pool_(std::move(pool)), policy_(policy) {
}

std::optional<Account> PostgresAccountStore::get(const std::string& account_id) {
  auto conn = pool_->acquire();
  auto result = conn->execute(
      "SELECT account_id, balance, frozen, version FROM accounts WHERE account_id = $1",
      {account_id});
  if (PQntuples(result.get()) == 0) {
    return std::nullopt;
  }
  return accountFromRow(result, 0);
}

storage::ApplyResult PostgresAccountStore::applyDelta(const std::string& account_id, Amount delta,
                                                      std::int64_t expected_version) {
  auto conn = pool_->acquire();
  TransactionGuard transaction(*conn);
  storage::ApplyResult outcome =
      applyInTransaction(*conn, account_id, delta, expected_version, policy_);
  if (outcome.applied()) {
    transaction.commit();
  }
  return outcome;
}

bool PostgresAccountStore::createAccount(const std::string& account_id, Amount opening_balance) {
  auto conn = pool_->acquire();
  auto result = conn->execute(
      R"(
        INSERT INTO accounts (account_id, balance, frozen, version)
        VALUES ($1, $2, FALSE, 1)
        ON CONFLICT (account_id) DO NOTHING
      )",
      {account_id, std::to_string(opening_balance)});
  bool created = rowsAffected(result);
  if (created) {
    LEDGER_LOG_BUILDER(INFO, "Account created")
        .field("account", observability::maskAccountId(account_id))
        .field("opening_balance", formatAmount(opening_balance));
  }
  return created;
}

bool PostgresAccountStore::setFrozen(const std::string& account_id, bool frozen) {
  auto conn = pool_->acquire();
  auto result = conn->execute(
      R"(
        UPDATE accounts
        SET frozen = $2, version = version + 1, updated_at = now()
        WHERE account_id = $1
      )",
      {account_id, std::string(frozen ? "true" : "false")});
  return rowsAffected(result);
}

// PostgresLedgerWriter

PostgresLedgerWriter::PostgresLedgerWriter(std::shared_ptr<ConnectionPool> pool,
                                           config::AccountPolicy policy)
    : pool_(std::move(pool)), policy_(policy) {
}

storage::PostResult PostgresLedgerWriter::post(const std::string& account_id, Amount delta,
                                               std::int64_t expected_version,
                                               LedgerEntry& entry) {
  storage::PostResult result;
  auto conn = pool_->acquire();
  TransactionGuard transaction(*conn);

  result.apply = applyInTransaction(*conn, account_id, delta, expected_version, policy_);
  if (!result.apply.applied()) {
    return result;
  }

  entry.balance_after = result.apply.new_balance;
  result.append = insertEntry(*conn, entry);
  if (result.append == storage::AppendStatus::DUPLICATE) {
    // The leg is already journaled; keep the balance as it was.
    transaction.rollback();
    LEDGER_LOG_BUILDER(WARN, "Entry already journaled; balance change rolled back")
        .correlation(entry.txn_id)
        .field("direction", toString(entry.direction));
    return result;
  }

  transaction.commit();
  return result;
}

// PostgresLedgerJournal

PostgresLedgerJournal::PostgresLedgerJournal(std::shared_ptr<ConnectionPool> pool)
    : pool_(std::move(pool)) {
}

storage::AppendStatus PostgresLedgerJournal::append(LedgerEntry& entry) {
  auto conn = pool_->acquire();
  return insertEntry(*conn, entry);
}

bool PostgresLedgerJournal::exists(const std::string& txn_id, const std::string& account_id,
                                   Direction direction) {
  auto conn = pool_->acquire();
  auto result = conn->execute(
      "SELECT 1 FROM account_ledger "
      "WHERE global_txn_id = $1 AND account_id = $2 AND direction = $3",
      {txn_id, account_id, toString(direction)});
  return PQntuples(result.get()) > 0;
}

storage::LedgerPage PostgresLedgerJournal::historyFor(const storage::HistoryQuery& query) {
  std::optional<storage::PageToken> start;
  if (!query.page_token.empty()) {
    start = storage::PageToken::decode(query.page_token);
    if (!start) {
      throw std::invalid_argument("Malformed page token");
    }
  }
  size_t page_size = query.page_size == 0 ? 1 : query.page_size;

  PgParams params = {
      query.account_id,
      query.from ? std::optional<std::string>(std::to_string(toEpochMicros(*query.from)))
                 : std::nullopt,
      query.to ? std::optional<std::string>(std::to_string(toEpochMicros(*query.to)))
               : std::nullopt,
      start ? std::optional<std::string>(std::to_string(start->created_at_us)) : std::nullopt,
      start ? std::optional<std::string>(std::to_string(start->entry_id)) : std::nullopt,
      std::to_string(page_size + 1)};

  auto conn = pool_->acquire();
  auto result = conn->execute(
      std::string("SELECT ") + kLedgerColumns + R"(
        FROM account_ledger
        WHERE account_id = $1
          AND ($2::BIGINT IS NULL OR created_at_us >= $2::BIGINT)
          AND ($3::BIGINT IS NULL OR created_at_us <= $3::BIGINT)
          AND ($4::BIGINT IS NULL OR (created_at_us, ledger_id) < ($4::BIGINT, $5::BIGINT))
        ORDER BY created_at_us DESC, ledger_id DESC
        LIMIT $6
      )",
      params);

  storage::LedgerPage page;
  int rows = PQntuples(result.get());
  for (int row = 0; row < rows && page.entries.size() < page_size; ++row) {
    page.entries.push_back(entryFromRow(result, row));
  }
  if (static_cast<size_t>(rows) > page_size) {
    page.next_page_token = storage::PageToken::after(page.entries.back()).encode();
  }
  return page;
}

std::vector<LedgerEntry> PostgresLedgerJournal::entriesForTransaction(const std::string& txn_id) {
  auto conn = pool_->acquire();
  auto result = conn->execute(
      std::string("SELECT ") + kLedgerColumns +
          " FROM account_ledger WHERE global_txn_id = $1 ORDER BY ledger_id",
      {txn_id});

  std::vector<LedgerEntry> entries;
  int rows = PQntuples(result.get());
  for (int row = 0; row < rows; ++row) {
    entries.push_back(entryFromRow(result, row));
  }
  return entries;
}

// PostgresTransactionStore

PostgresTransactionStore::PostgresTransactionStore(std::shared_ptr<ConnectionPool> pool)
    : pool_(std::move(pool)) {
}

std::pair<Transaction, bool> PostgresTransactionStore::insertIfAbsent(const Transaction& txn) {
  std::string now_us = std::to_string(toEpochMicros(Clock::now()));
  auto conn = pool_->acquire();
  auto inserted = conn->execute(
      std::string(R"(
        INSERT INTO transfers (txn_id, payer_id, payee_id, amount, status, verdict, risk_score,
                               message, credit_attempts, created_at_us, updated_at_us)
        VALUES ($1, $2, $3, $4, $5, $6, $7, $8, $9, $10, $10)
        ON CONFLICT (txn_id) DO NOTHING
        RETURNING )") + kTransferColumns,
      {txn.txn_id, txn.payer_id, txn.payee_id, std::to_string(txn.amount), toString(txn.status),
       toString(txn.verdict), optionalParam(txn.risk_score), txn.message,
       std::to_string(txn.credit_attempts), now_us});

  if (PQntuples(inserted.get()) > 0) {
    return {transferFromRow(inserted, 0), true};
  }

  auto existing = conn->execute(
      std::string("SELECT ") + kTransferColumns + " FROM transfers WHERE txn_id = $1",
      {txn.txn_id});
  if (PQntuples(existing.get()) == 0) {
    throw DatabaseError("", "Transfer " + txn.txn_id + " vanished after insert conflict");
  }
  return {transferFromRow(existing, 0), false};
}

std::optional<Transaction> PostgresTransactionStore::get(const std::string& txn_id) {
  auto conn = pool_->acquire();
  auto result = conn->execute(
      std::string("SELECT ") + kTransferColumns + " FROM transfers WHERE txn_id = $1", {txn_id});
  if (PQntuples(result.get()) == 0) {
    return std::nullopt;
  }
  return transferFromRow(result, 0);
}

bool PostgresTransactionStore::transition(const std::string& txn_id, TransactionStatus from,
                                          TransactionStatus to, const std::string& message) {
  if (!isValidTransition(from, to)) {
    throw std::logic_error("Illegal transfer transition " + toString(from) + " -> " +
                           toString(to));
  }

  auto conn = pool_->acquire();
  auto result = conn->execute(
      R"(
        UPDATE transfers
        SET status = $3, message = $4, updated_at_us = $5
        WHERE txn_id = $1 AND status = $2
      )",
      {txn_id, toString(from), toString(to), message,
       std::to_string(toEpochMicros(Clock::now()))});
  return rowsAffected(result);
}

int PostgresTransactionStore::recordCreditAttempt(const std::string& txn_id) {
  auto conn = pool_->acquire();
  auto result = conn->execute(
      R"(
        UPDATE transfers
        SET credit_attempts = credit_attempts + 1, updated_at_us = $2
        WHERE txn_id = $1
        RETURNING credit_attempts
      )",
      {txn_id, std::to_string(toEpochMicros(Clock::now()))});
  if (PQntuples(result.get()) == 0) {
    return 0;
  }
  return static_cast<int>(int64At(result, 0, 0));
}

std::vector<Transaction> PostgresTransactionStore::listByStatus(TransactionStatus status,
                                                                size_t limit) {
  auto conn = pool_->acquire();
  auto result = conn->execute(
      std::string("SELECT ") + kTransferColumns +
          " FROM transfers WHERE status = $1 ORDER BY seq LIMIT $2",
      {toString(status), std::to_string(limit)});

  std::vector<Transaction> transfers;
  int rows = PQntuples(result.get());
  for (int row = 0; row < rows; ++row) {
    transfers.push_back(transferFromRow(result, row));
  }
  return transfers;
}

}  // namespace database
}  // namespace ledger
