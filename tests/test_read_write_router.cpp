#include "routing/read_write_router.hpp"

#include <gtest/gtest.h>

#include <chrono>

using namespace ledger;

class ReadWriteRouterTest : public ::testing::Test {
 protected:
  ReadWriteRouterTest() : now_(routing::ReadWriteRouter::SteadyClock::now()) {}

  config::RouterConfig replicaConfig() {
    config::RouterConfig config;
    config.replica_enabled = true;
    config.staleness_window_ms = 1000;
    return config;
  }

  routing::ReadWriteRouter::NowFn clock() {
    return [this] { return now_; };
  }

  storage::MemoryAccountStore primary_accounts_;
  storage::MemoryLedgerJournal primary_journal_;
  storage::MemoryAccountStore replica_accounts_;
  storage::MemoryLedgerJournal replica_journal_;
  routing::ReadWriteRouter::SteadyClock::time_point now_;
};

TEST_F(ReadWriteRouterTest, ReadOnlyKinds) {
  EXPECT_TRUE(routing::isReadOnly(routing::OperationKind::BALANCE));
  EXPECT_TRUE(routing::isReadOnly(routing::OperationKind::STATEMENT));
  EXPECT_TRUE(routing::isReadOnly(routing::OperationKind::TRANSACTION_LOOKUP));
  EXPECT_FALSE(routing::isReadOnly(routing::OperationKind::TRANSFER));
  EXPECT_FALSE(routing::isReadOnly(routing::OperationKind::OPEN_ACCOUNT));
  EXPECT_FALSE(routing::isReadOnly(routing::OperationKind::FREEZE_ACCOUNT));
  EXPECT_FALSE(routing::isReadOnly(routing::OperationKind::RECONCILE));
}

TEST_F(ReadWriteRouterTest, WithoutReplicaEverythingGoesToPrimary) {
  routing::ReadWriteRouter router(config::RouterConfig{}, primary_accounts_, primary_journal_);
  EXPECT_FALSE(router.hasReplica());
  EXPECT_EQ(router.route(routing::OperationKind::BALANCE, "c1"), routing::Route::PRIMARY);

  auto stores = router.storesFor(routing::Route::REPLICA);
  EXPECT_EQ(stores.route, routing::Route::PRIMARY);
  EXPECT_EQ(&stores.accounts, &primary_accounts_);
}

TEST_F(ReadWriteRouterTest, DisabledReplicaIsIgnored) {
  config::RouterConfig config;
  config.replica_enabled = false;
  routing::ReadWriteRouter router(config, primary_accounts_, primary_journal_,
                                  &replica_accounts_, &replica_journal_);
  EXPECT_EQ(router.route(routing::OperationKind::STATEMENT, "c1"), routing::Route::PRIMARY);
}

TEST_F(ReadWriteRouterTest, ReadsGoToReplicaWritesToPrimary) {
  routing::ReadWriteRouter router(replicaConfig(), primary_accounts_, primary_journal_,
                                  &replica_accounts_, &replica_journal_, clock());
  EXPECT_TRUE(router.hasReplica());
  EXPECT_EQ(router.route(routing::OperationKind::BALANCE, "c1"), routing::Route::REPLICA);
  EXPECT_EQ(router.route(routing::OperationKind::TRANSFER, "c1"), routing::Route::PRIMARY);

  auto stores = router.storesFor(routing::Route::REPLICA);
  EXPECT_EQ(stores.route, routing::Route::REPLICA);
  EXPECT_EQ(&stores.accounts, &replica_accounts_);
  EXPECT_EQ(&stores.journal, &replica_journal_);
}

TEST_F(ReadWriteRouterTest, ReadYourWritesWithinWindow) {
  routing::ReadWriteRouter router(replicaConfig(), primary_accounts_, primary_journal_,
                                  &replica_accounts_, &replica_journal_, clock());
  router.recordWrite("c1");

  EXPECT_EQ(router.route(routing::OperationKind::BALANCE, "c1"), routing::Route::PRIMARY);
  // Other callers are unaffected
  EXPECT_EQ(router.route(routing::OperationKind::BALANCE, "c2"), routing::Route::REPLICA);

  now_ += std::chrono::milliseconds(999);
  EXPECT_EQ(router.route(routing::OperationKind::STATEMENT, "c1"), routing::Route::PRIMARY);

  now_ += std::chrono::milliseconds(1);
  EXPECT_EQ(router.route(routing::OperationKind::STATEMENT, "c1"), routing::Route::REPLICA);
}

TEST_F(ReadWriteRouterTest, AnonymousCallersReadFromReplica) {
  routing::ReadWriteRouter router(replicaConfig(), primary_accounts_, primary_journal_,
                                  &replica_accounts_, &replica_journal_, clock());
  router.recordWrite("");
  EXPECT_EQ(router.route(routing::OperationKind::BALANCE, ""), routing::Route::REPLICA);
}
