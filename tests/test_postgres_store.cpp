#include "concurrent/lock_manager.hpp"
#include "database/ledger_persistence.hpp"
#include "database/postgres_connection.hpp"
#include "engine/transfer_orchestrator.hpp"
#include "ledger_errors.hpp"

#include <gtest/gtest.h>

#include <cstdlib>
#include <memory>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>

using namespace ledger;

namespace {

// Reads "host=... port=... dbname=... user=... password=..." into a config.
std::optional<config::DatabaseConfig> testDatabase() {
  const char* conninfo = std::getenv("LEDGER_TEST_PG_CONNINFO");
  if (conninfo == nullptr || *conninfo == '\0') {
    return std::nullopt;
  }

  config::DatabaseConfig db;
  db.max_connections = 4;
  std::istringstream in(conninfo);
  std::string pair;
  while (in >> pair) {
    auto eq = pair.find('=');
    if (eq == std::string::npos) continue;
    std::string key = pair.substr(0, eq);
    std::string value = pair.substr(eq + 1);
    if (key == "host") db.host = value;
    else if (key == "port") db.port = std::stoi(value);
    else if (key == "dbname") db.database = value;
    else if (key == "user") db.username = value;
    else if (key == "password") db.password = value;
  }
  return db;
}

}  // namespace

class PostgresStoreTest : public ::testing::Test {
 protected:
  void SetUp() override {
    auto db = testDatabase();
    if (!db) {
      GTEST_SKIP() << "LEDGER_TEST_PG_CONNINFO not set";
    }
    pool_ = std::make_shared<database::ConnectionPool>(*db);
    database::initializeSchema(*pool_);
    accounts_ = std::make_unique<database::PostgresAccountStore>(pool_, config::AccountPolicy{});
    journal_ = std::make_unique<database::PostgresLedgerJournal>(pool_);
    writer_ = std::make_unique<database::PostgresLedgerWriter>(pool_, config::AccountPolicy{});
    transactions_ = std::make_unique<database::PostgresTransactionStore>(pool_);

    // Rows persist between runs, so every id carries a fresh suffix
    suffix_ = engine::TransferOrchestrator::generateTxnId().substr(3, 12);
  }

  std::string id(const std::string& base) const { return base + "-" + suffix_; }

  std::shared_ptr<database::ConnectionPool> pool_;
  std::unique_ptr<database::PostgresAccountStore> accounts_;
  std::unique_ptr<database::PostgresLedgerJournal> journal_;
  std::unique_ptr<database::PostgresLedgerWriter> writer_;
  std::unique_ptr<database::PostgresTransactionStore> transactions_;
  std::string suffix_;
};

TEST_F(PostgresStoreTest, AccountVersioning) {
  std::string acc = id("acc");
  ASSERT_TRUE(accounts_->createAccount(acc, 1000));
  EXPECT_FALSE(accounts_->createAccount(acc, 1000));

  auto account = accounts_->get(acc);
  ASSERT_TRUE(account.has_value());
  EXPECT_EQ(account->balance, 1000);

  auto applied = accounts_->applyDelta(acc, -400, account->version);
  ASSERT_TRUE(applied.applied());
  EXPECT_EQ(applied.new_balance, 600);
  EXPECT_EQ(accounts_->applyDelta(acc, -1, account->version).status,
            storage::ApplyStatus::VERSION_CONFLICT);
  EXPECT_EQ(accounts_->applyDelta(acc, -601, applied.new_version).status,
            storage::ApplyStatus::INSUFFICIENT_BALANCE);

  ASSERT_TRUE(accounts_->setFrozen(acc, true));
  auto frozen = accounts_->get(acc);
  EXPECT_TRUE(frozen->frozen);
  EXPECT_EQ(accounts_->applyDelta(acc, -1, frozen->version).status,
            storage::ApplyStatus::FROZEN);
  EXPECT_FALSE(accounts_->get(id("missing")).has_value());
}

TEST_F(PostgresStoreTest, JournalUniquenessAndPaging) {
  std::string acc = id("acc");
  for (int i = 0; i < 5; ++i) {
    LedgerEntry entry;
    entry.txn_id = id("T" + std::to_string(i));
    entry.account_id = acc;
    entry.amount = -(i + 1);
    entry.direction = Direction::DEBIT;
    entry.counterparty_id = "other";
    entry.balance_after = 0;
    ASSERT_EQ(journal_->append(entry), storage::AppendStatus::APPENDED);
    EXPECT_GT(entry.entry_id, 0);
  }

  LedgerEntry duplicate;
  duplicate.txn_id = id("T0");
  duplicate.account_id = acc;
  duplicate.amount = -1;
  duplicate.direction = Direction::DEBIT;
  EXPECT_EQ(journal_->append(duplicate), storage::AppendStatus::DUPLICATE);
  EXPECT_TRUE(journal_->exists(id("T0"), acc, Direction::DEBIT));

  storage::HistoryQuery query;
  query.account_id = acc;
  query.page_size = 3;
  auto first = journal_->historyFor(query);
  ASSERT_EQ(first.entries.size(), 3u);
  EXPECT_EQ(first.entries[0].txn_id, id("T4"));
  ASSERT_FALSE(first.next_page_token.empty());

  query.page_token = first.next_page_token;
  auto second = journal_->historyFor(query);
  ASSERT_EQ(second.entries.size(), 2u);
  EXPECT_EQ(second.entries[1].txn_id, id("T0"));
  EXPECT_TRUE(second.next_page_token.empty());

  query.page_token = "garbage";
  EXPECT_THROW(journal_->historyFor(query), std::invalid_argument);
}

TEST_F(PostgresStoreTest, TransactionRecords) {
  Transaction txn;
  txn.txn_id = id("T");
  txn.payer_id = "P";
  txn.payee_id = "Q";
  txn.amount = 700;
  txn.risk_score = 0.3;

  auto inserted = transactions_->insertIfAbsent(txn);
  EXPECT_TRUE(inserted.second);
  EXPECT_FALSE(transactions_->insertIfAbsent(txn).second);

  EXPECT_TRUE(transactions_->transition(txn.txn_id, TransactionStatus::INITIATED,
                                        TransactionStatus::DEBITED, "debited"));
  EXPECT_FALSE(transactions_->transition(txn.txn_id, TransactionStatus::INITIATED,
                                         TransactionStatus::FAILED, "late"));
  EXPECT_THROW(transactions_->transition(txn.txn_id, TransactionStatus::DEBITED,
                                         TransactionStatus::SUCCESS, "skip"),
               std::logic_error);

  EXPECT_EQ(transactions_->recordCreditAttempt(txn.txn_id), 1);
  auto stored = transactions_->get(txn.txn_id);
  ASSERT_TRUE(stored.has_value());
  EXPECT_EQ(stored->status, TransactionStatus::DEBITED);
  EXPECT_EQ(stored->amount, 700);
  EXPECT_EQ(stored->credit_attempts, 1);
  ASSERT_TRUE(stored->risk_score.has_value());
  EXPECT_DOUBLE_EQ(*stored->risk_score, 0.3);
}

TEST_F(PostgresStoreTest, RiskScoreKeepsFullPrecision) {
  LedgerEntry entry;
  entry.txn_id = id("T");
  entry.account_id = id("acc");
  entry.amount = -1;
  entry.direction = Direction::DEBIT;
  entry.risk_score = 0.12345678901234567;
  ASSERT_EQ(journal_->append(entry), storage::AppendStatus::APPENDED);

  auto stored = journal_->entriesForTransaction(entry.txn_id);
  ASSERT_EQ(stored.size(), 1u);
  ASSERT_TRUE(stored[0].risk_score.has_value());
  EXPECT_EQ(*stored[0].risk_score, 0.12345678901234567);
}

TEST_F(PostgresStoreTest, WriterStoresBalanceAndEntryTogether) {
  std::string acc = id("acc");
  ASSERT_TRUE(accounts_->createAccount(acc, 1000));
  auto account = accounts_->get(acc);

  LedgerEntry entry;
  entry.txn_id = id("T");
  entry.account_id = acc;
  entry.amount = -400;
  entry.direction = Direction::DEBIT;
  entry.counterparty_id = "other";
  auto posted = writer_->post(acc, -400, account->version, entry);
  ASSERT_TRUE(posted.posted());
  EXPECT_EQ(posted.apply.new_balance, 600);
  EXPECT_EQ(entry.balance_after, 600);
  EXPECT_GT(entry.entry_id, 0);

  // Same leg again: the balance change is rolled back with the insert
  LedgerEntry again = entry;
  auto duplicate = writer_->post(acc, -400, posted.apply.new_version, again);
  EXPECT_TRUE(duplicate.apply.applied());
  EXPECT_EQ(duplicate.append, storage::AppendStatus::DUPLICATE);
  EXPECT_EQ(accounts_->get(acc)->balance, 600);
  EXPECT_EQ(accounts_->get(acc)->version, posted.apply.new_version);
  EXPECT_EQ(journal_->entriesForTransaction(entry.txn_id).size(), 1u);

  // A rejected change writes no entry
  LedgerEntry overdrawn = entry;
  overdrawn.txn_id = id("T2");
  auto rejected = writer_->post(acc, -601, posted.apply.new_version, overdrawn);
  EXPECT_EQ(rejected.apply.status, storage::ApplyStatus::INSUFFICIENT_BALANCE);
  EXPECT_FALSE(journal_->exists(overdrawn.txn_id, acc, Direction::DEBIT));
}

TEST_F(PostgresStoreTest, TransferEndToEnd) {
  std::string payer = id("P");
  std::string payee = id("Q");
  ASSERT_TRUE(accounts_->createAccount(payer, 10000));
  ASSERT_TRUE(accounts_->createAccount(payee, 0));

  concurrent::LockManager locks(std::chrono::milliseconds(2000));
  engine::TransferOrchestrator orchestrator(*accounts_, *journal_, *transactions_, locks,
                                            nullptr, config::LockingConfig{},
                                            config::AccountPolicy{}, writer_.get());
  TransferRequest req;
  req.txn_id = id("T");
  req.payer_id = payer;
  req.payee_id = payee;
  req.amount = 2500;

  EXPECT_EQ(orchestrator.transfer(req).status, TransactionStatus::SUCCESS);
  EXPECT_EQ(orchestrator.transfer(req).status, TransactionStatus::SUCCESS);
  EXPECT_EQ(accounts_->get(payer)->balance, 7500);
  EXPECT_EQ(accounts_->get(payee)->balance, 2500);
  EXPECT_EQ(journal_->entriesForTransaction(req.txn_id).size(), 2u);
}

TEST(PostgresParamTest, DoubleParamRoundTrips) {
  for (double value : {0.1, 0.12345678901234567, 1e-12, 0.999999999999, 42.0}) {
    EXPECT_EQ(std::stod(database::doubleParam(value)), value) << database::doubleParam(value);
  }
  EXPECT_EQ(database::doubleParam(0.5), "0.5");
}

TEST(PostgresPoolTest, UnreachableServerIsStoreUnavailable) {
  config::DatabaseConfig db;
  db.host = "127.0.0.1";
  db.port = 1;
  db.connection_timeout = 1;
  database::ConnectionPool pool(db);
  EXPECT_THROW(pool.acquire(), StoreUnavailable);
}
