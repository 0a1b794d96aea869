#include "concurrent/lock_manager.hpp"
#include "engine/reconciler.hpp"
#include "engine/transfer_orchestrator.hpp"
#include "observability/metrics.hpp"
#include "storage/ledger_journal.hpp"
#include "storage/transaction_store.hpp"
#include "test_support.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <memory>
#include <thread>

using namespace ledger;

class ReconcilerTest : public ::testing::Test {
 protected:
  ReconcilerTest()
      : locks_(std::chrono::milliseconds(500)),
        orchestrator_(accounts_, journal_, transactions_, locks_, &publisher_,
                      config::LockingConfig{}, config::AccountPolicy{}),
        now_(Clock::now()) {}

  void SetUp() override {
    accounts_.createAccount("P", 10000);
    accounts_.createAccount("Q", 0);
  }

  std::unique_ptr<engine::Reconciler> makeReconciler(config::ReconcilerConfig config) {
    return std::make_unique<engine::Reconciler>(orchestrator_, transactions_, config,
                                                [this] { return now_; });
  }

  // Debits P and leaves the transfer DEEMED_APPROVED.
  void deemApproved(const std::string& txn_id, Amount amount = 1000) {
    accounts_.breakWrites("Q");
    TransferRequest req;
    req.txn_id = txn_id;
    req.payer_id = "P";
    req.payee_id = "Q";
    req.amount = amount;
    auto result = orchestrator_.transfer(req);
    ASSERT_EQ(result.status, TransactionStatus::DEEMED_APPROVED);
  }

  test_support::FaultyAccountStore accounts_;
  storage::MemoryLedgerJournal journal_;
  storage::MemoryTransactionStore transactions_;
  concurrent::LockManager locks_;
  test_support::RecordingPublisher publisher_;
  engine::TransferOrchestrator orchestrator_;
  Timestamp now_;
};

TEST_F(ReconcilerTest, CompletesRecoveredTransfers) {
  deemApproved("T1");
  deemApproved("T2");
  accounts_.heal();

  auto reconciler = makeReconciler(config::ReconcilerConfig{});
  auto stats = reconciler->reconcileOnce();
  EXPECT_EQ(stats.examined, 2u);
  EXPECT_EQ(stats.completed, 2u);
  EXPECT_EQ(stats.reversed, 0u);
  EXPECT_EQ(stats.pending, 0u);

  EXPECT_EQ(accounts_.balanceOf("P"), 8000);
  EXPECT_EQ(accounts_.balanceOf("Q"), 2000);
  EXPECT_EQ(transactions_.get("T1")->status, TransactionStatus::SUCCESS);

  // Nothing left to do
  EXPECT_EQ(reconciler->reconcileOnce().examined, 0u);
}

TEST_F(ReconcilerTest, KeepsRetryingWithinLimits) {
  deemApproved("T1");
  config::ReconcilerConfig config;
  config.max_credit_attempts = 5;
  auto reconciler = makeReconciler(config);

  auto stats = reconciler->reconcileOnce();
  EXPECT_EQ(stats.pending, 1u);
  EXPECT_EQ(transactions_.get("T1")->status, TransactionStatus::DEEMED_APPROVED);
  EXPECT_EQ(accounts_.balanceOf("P"), 9000);
  EXPECT_EQ(observability::getGlobalMetrics().gaugeValue("ledger_deemed_approved_pending"), 1.0);
}

TEST_F(ReconcilerTest, ReversesAfterMaxAttempts) {
  deemApproved("T1");
  config::ReconcilerConfig config;
  config.max_credit_attempts = 3;
  auto reconciler = makeReconciler(config);

  // First failed attempt came from the transfer itself
  EXPECT_EQ(reconciler->reconcileOnce().pending, 1u);
  auto stats = reconciler->reconcileOnce();
  EXPECT_EQ(stats.reversed, 1u);

  EXPECT_EQ(transactions_.get("T1")->status, TransactionStatus::REVERSED);
  EXPECT_EQ(accounts_.balanceOf("P"), 10000);
  EXPECT_EQ(accounts_.balanceOf("Q"), 0);
}

TEST_F(ReconcilerTest, ReversesOnceTooOld) {
  deemApproved("T1");
  config::ReconcilerConfig config;
  config.give_up_after_ms = 60 * 1000;
  auto reconciler = makeReconciler(config);

  EXPECT_EQ(reconciler->reconcileOnce().pending, 1u);

  now_ += std::chrono::minutes(2);
  auto stats = reconciler->reconcileOnce();
  EXPECT_EQ(stats.reversed, 1u);
  EXPECT_EQ(accounts_.balanceOf("P"), 10000);
}

TEST_F(ReconcilerTest, ReversesInvalidPayeeImmediately) {
  deemApproved("T1");
  accounts_.heal();
  accounts_.setFrozen("Q", true);

  auto reconciler = makeReconciler(config::ReconcilerConfig{});
  auto result = reconciler->reconcile("T1");
  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(result->status, TransactionStatus::REVERSED);
  EXPECT_EQ(accounts_.balanceOf("P"), 10000);
}

TEST_F(ReconcilerTest, UnknownTransaction) {
  auto reconciler = makeReconciler(config::ReconcilerConfig{});
  EXPECT_FALSE(reconciler->reconcile("missing").has_value());
}

TEST_F(ReconcilerTest, BatchSizeLimitsPass) {
  deemApproved("T1");
  deemApproved("T2");
  deemApproved("T3");
  accounts_.heal();

  config::ReconcilerConfig config;
  config.batch_size = 2;
  auto reconciler = makeReconciler(config);
  EXPECT_EQ(reconciler->reconcileOnce().examined, 2u);
  EXPECT_EQ(reconciler->reconcileOnce().examined, 1u);
  EXPECT_EQ(accounts_.balanceOf("Q"), 3000);
}

TEST_F(ReconcilerTest, StoreErrorsAreCounted) {
  deemApproved("T1");
  accounts_.heal();
  accounts_.breakAccount("P");
  accounts_.breakAccount("Q");

  auto reconciler = makeReconciler(config::ReconcilerConfig{});
  auto stats = reconciler->reconcileOnce();
  EXPECT_EQ(stats.examined, 1u);
  EXPECT_EQ(stats.pending + stats.errors, 1u);
  EXPECT_EQ(transactions_.get("T1")->status, TransactionStatus::DEEMED_APPROVED);
}

TEST_F(ReconcilerTest, BackgroundPass) {
  deemApproved("T1");
  accounts_.heal();

  config::ReconcilerConfig config;
  config.interval_ms = 10;
  engine::Reconciler reconciler(orchestrator_, transactions_, config);
  ASSERT_TRUE(reconciler.start());
  EXPECT_TRUE(reconciler.isRunning());

  auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
  while (transactions_.get("T1")->status != TransactionStatus::SUCCESS &&
         std::chrono::steady_clock::now() < deadline) {
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
  }
  reconciler.stop();

  EXPECT_FALSE(reconciler.isRunning());
  EXPECT_EQ(transactions_.get("T1")->status, TransactionStatus::SUCCESS);
}

TEST_F(ReconcilerTest, BackgroundPassDisabled) {
  config::ReconcilerConfig config;
  config.interval_ms = 0;
  auto reconciler = makeReconciler(config);
  EXPECT_FALSE(reconciler->start());
  EXPECT_FALSE(reconciler->isRunning());
}
