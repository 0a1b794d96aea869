#include "concurrent/lock_manager.hpp"
#include "ledger_errors.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <string>
#include <thread>
#include <utility>
#include <vector>

using namespace ledger;

TEST(LockManagerTest, AcquireAndRelease) {
  concurrent::LockManager locks(std::chrono::milliseconds(100));
  {
    auto guard = locks.acquire({"b", "a"});
    EXPECT_EQ(guard.size(), 2u);
  }
  // Released on scope exit, so this does not time out
  auto again = locks.acquire({"a"});
  EXPECT_EQ(again.size(), 1u);
  EXPECT_EQ(locks.acquisitionCount(), 2u);
}

TEST(LockManagerTest, DuplicateIdsLockedOnce) {
  concurrent::LockManager locks(std::chrono::milliseconds(100));
  auto guard = locks.acquire({"a", "a"});
  EXPECT_EQ(guard.size(), 1u);
}

TEST(LockManagerTest, TimeoutThrowsAndHoldsNothing) {
  concurrent::LockManager locks(std::chrono::milliseconds(50));
  auto held = locks.acquire({"b"});

  std::thread contender([&] {
    try {
      locks.acquire({"a", "b"});
      ADD_FAILURE() << "expected LockTimeout";
    } catch (const LockTimeout& e) {
      EXPECT_EQ(e.accountId(), "b");
    }
  });
  contender.join();

  // "a" was released when the acquisition failed
  std::thread other([&] {
    auto guard = locks.acquire({"a"});
    EXPECT_EQ(guard.size(), 1u);
  });
  other.join();
}

TEST(LockManagerTest, WithLocksReturnsValue) {
  concurrent::LockManager locks(std::chrono::milliseconds(100));
  int value = locks.withLocks({"a", "b"}, [] { return 42; });
  EXPECT_EQ(value, 42);
}

TEST(LockManagerTest, OpposingOrderDoesNotDeadlock) {
  concurrent::LockManager locks(std::chrono::milliseconds(5000));
  std::atomic<int> counter{0};
  const int iterations = 500;

  std::thread forward([&] {
    for (int i = 0; i < iterations; ++i) {
      locks.withLocks({"p", "q"}, [&] { counter.fetch_add(1); });
    }
  });
  std::thread backward([&] {
    for (int i = 0; i < iterations; ++i) {
      locks.withLocks({"q", "p"}, [&] { counter.fetch_add(1); });
    }
  });
  forward.join();
  backward.join();

  EXPECT_EQ(counter.load(), 2 * iterations);
}

TEST(LockManagerTest, MutualExclusion) {
  concurrent::LockManager locks(std::chrono::milliseconds(5000));
  int unguarded = 0;
  const int num_threads = 8;
  const int iterations = 1000;

  std::vector<std::thread> threads;
  for (int t = 0; t < num_threads; ++t) {
    threads.emplace_back([&] {
      for (int i = 0; i < iterations; ++i) {
        locks.withLocks({"shared"}, [&] { ++unguarded; });
      }
    });
  }
  for (auto& thread : threads) {
    thread.join();
  }

  EXPECT_EQ(unguarded, num_threads * iterations);
}

TEST(LockManagerTest, ReleasedAccountsLeaveTheTable) {
  concurrent::LockManager locks(std::chrono::milliseconds(100));
  {
    auto guard = locks.acquire({"a", "b"});
    EXPECT_EQ(locks.trackedAccounts(), 2u);

    auto moved = std::move(guard);
    EXPECT_EQ(moved.size(), 2u);
    EXPECT_EQ(locks.trackedAccounts(), 2u);
  }
  EXPECT_EQ(locks.trackedAccounts(), 0u);

  for (int i = 0; i < 100; ++i) {
    locks.withLocks({"acc" + std::to_string(i), "shared"}, [] { return 0; });
  }
  EXPECT_EQ(locks.trackedAccounts(), 0u);
}

TEST(LockManagerTest, TimedOutWaiterLeavesNoEntry) {
  concurrent::LockManager locks(std::chrono::milliseconds(20));
  {
    auto held = locks.acquire({"a"});
    std::thread contender([&] { EXPECT_THROW(locks.acquire({"a", "b"}), LockTimeout); });
    contender.join();
    EXPECT_EQ(locks.trackedAccounts(), 1u);
  }
  EXPECT_EQ(locks.trackedAccounts(), 0u);
}
