#ifndef LEDGER_PERSISTENCE_HPP_
#define LEDGER_PERSISTENCE_HPP_

#include "config/engine_config.hpp"
#include "database/postgres_connection.hpp"
#include "storage/account_store.hpp"
#include "storage/ledger_journal.hpp"
#include "storage/ledger_writer.hpp"
#include "storage/transaction_store.hpp"

#include <memory>

namespace ledger {
namespace database {

/**
 * Creates the accounts, account_ledger and transfers tables and their
 * indexes if they do not exist yet. Throws on failure.
 */
void initializeSchema(ConnectionPool& pool);

/**
 * Account store backed by the `accounts` table. applyDelta runs the version
 * check and the update in one database transaction with the row locked.
 */
class PostgresAccountStore : public storage::AccountStore {
 public:
  PostgresAccountStore(std::shared_ptr<ConnectionPool> pool, config::AccountPolicy policy);

  std::optional<Account> get(const std::string& account_id) override;
  storage::ApplyResult applyDelta(const std::string& account_id, Amount delta,
                                  std::int64_t expected_version) override;
  bool createAccount(const std::string& account_id, Amount opening_balance) override;
  bool setFrozen(const std::string& account_id, bool frozen) override;

 private:
  std::shared_ptr<ConnectionPool> pool_;
  config::AccountPolicy policy_;
};

/**
 * Updates `accounts` and inserts into `account_ledger` inside one database
 * transaction, so a balance never moves without its entry. A duplicate entry
 * rolls the balance change back.
 */
class PostgresLedgerWriter : public storage::LedgerWriter {
 public:
  PostgresLedgerWriter(std::shared_ptr<ConnectionPool> pool, config::AccountPolicy policy);

  storage::PostResult post(const std::string& account_id, Amount delta,
                           std::int64_t expected_version, LedgerEntry& entry) override;

 private:
  std::shared_ptr<ConnectionPool> pool_;
  config::AccountPolicy policy_;
};

/**
 * Journal backed by `account_ledger`. The unique constraint on
 * (global_txn_id, account_id, direction) enforces one entry per leg.
 */
class PostgresLedgerJournal : public storage::LedgerJournal {
 public:
  explicit PostgresLedgerJournal(std::shared_ptr<ConnectionPool> pool);

  storage::AppendStatus append(LedgerEntry& entry) override;
  bool exists(const std::string& txn_id, const std::string& account_id,
              Direction direction) override;
  storage::LedgerPage historyFor(const storage::HistoryQuery& query) override;
  std::vector<LedgerEntry> entriesForTransaction(const std::string& txn_id) override;

 private:
  std::shared_ptr<ConnectionPool> pool_;
};

class PostgresTransactionStore : public storage::TransactionStore {
 public:
  explicit PostgresTransactionStore(std::shared_ptr<ConnectionPool> pool);

  std::pair<Transaction, bool> insertIfAbsent(const Transaction& txn) override;
  std::optional<Transaction> get(const std::string& txn_id) override;
  bool transition(const std::string& txn_id, TransactionStatus from, TransactionStatus to,
                  const std::string& message) override;
  int recordCreditAttempt(const std::string& txn_id) override;
  std::vector<Transaction> listByStatus(TransactionStatus status, size_t limit) override;

 private:
  std::shared_ptr<ConnectionPool> pool_;
};

}  // namespace database
}  // namespace ledger

#endif  // LEDGER_PERSISTENCE_HPP_
