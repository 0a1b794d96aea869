#include "storage/transaction_store.hpp"

#include <gtest/gtest.h>

#include <stdexcept>

using namespace ledger;

namespace {

Transaction makeTransaction(const std::string& txn_id) {
  Transaction txn;
  txn.txn_id = txn_id;
  txn.payer_id = "payer";
  txn.payee_id = "payee";
  txn.amount = 500;
  return txn;
}

}  // namespace

class TransactionStoreTest : public ::testing::Test {
 protected:
  storage::MemoryTransactionStore store_;
};

TEST_F(TransactionStoreTest, InsertIfAbsent) {
  auto first = store_.insertIfAbsent(makeTransaction("T1"));
  EXPECT_TRUE(first.second);
  EXPECT_EQ(first.first.status, TransactionStatus::INITIATED);
  EXPECT_NE(toEpochMicros(first.first.created_at), 0);

  Transaction other = makeTransaction("T1");
  other.amount = 999;
  auto second = store_.insertIfAbsent(other);
  EXPECT_FALSE(second.second);
  // The stored record wins
  EXPECT_EQ(second.first.amount, 500);
}

TEST_F(TransactionStoreTest, TransitionIsCompareAndSet) {
  store_.insertIfAbsent(makeTransaction("T1"));

  EXPECT_TRUE(store_.transition("T1", TransactionStatus::INITIATED, TransactionStatus::DEBITED,
                                "debited"));
  // Second caller still expecting INITIATED loses
  EXPECT_FALSE(store_.transition("T1", TransactionStatus::INITIATED, TransactionStatus::FAILED,
                                 "late"));

  auto txn = store_.get("T1");
  ASSERT_TRUE(txn.has_value());
  EXPECT_EQ(txn->status, TransactionStatus::DEBITED);
  EXPECT_EQ(txn->message, "debited");
}

TEST_F(TransactionStoreTest, IllegalTransitionThrows) {
  store_.insertIfAbsent(makeTransaction("T1"));
  EXPECT_THROW(store_.transition("T1", TransactionStatus::INITIATED, TransactionStatus::SUCCESS,
                                 "skip"),
               std::logic_error);
  EXPECT_EQ(store_.get("T1")->status, TransactionStatus::INITIATED);
}

TEST_F(TransactionStoreTest, UnknownTransaction) {
  EXPECT_FALSE(store_.get("missing").has_value());
  EXPECT_FALSE(store_.transition("missing", TransactionStatus::INITIATED,
                                 TransactionStatus::DEBITED, ""));
  EXPECT_EQ(store_.recordCreditAttempt("missing"), 0);
}

TEST_F(TransactionStoreTest, CreditAttemptsCount) {
  store_.insertIfAbsent(makeTransaction("T1"));
  EXPECT_EQ(store_.recordCreditAttempt("T1"), 1);
  EXPECT_EQ(store_.recordCreditAttempt("T1"), 2);
  EXPECT_EQ(store_.get("T1")->credit_attempts, 2);
}

TEST_F(TransactionStoreTest, ListByStatusOldestFirst) {
  for (const char* id : {"T3", "T1", "T2", "T4"}) {
    store_.insertIfAbsent(makeTransaction(id));
  }
  store_.transition("T2", TransactionStatus::INITIATED, TransactionStatus::FAILED, "");

  auto initiated = store_.listByStatus(TransactionStatus::INITIATED, 10);
  ASSERT_EQ(initiated.size(), 3u);
  EXPECT_EQ(initiated[0].txn_id, "T3");
  EXPECT_EQ(initiated[1].txn_id, "T1");
  EXPECT_EQ(initiated[2].txn_id, "T4");

  EXPECT_EQ(store_.listByStatus(TransactionStatus::INITIATED, 2).size(), 2u);
  EXPECT_TRUE(store_.listByStatus(TransactionStatus::DEEMED_APPROVED, 10).empty());
}
