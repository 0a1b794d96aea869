#ifndef LOCK_MANAGER_HPP_
#define LOCK_MANAGER_HPP_

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace ledger {
namespace concurrent {

/**
 * Per-account mutual exclusion for balance-changing work.
 *
 * Ids are always locked in ascending order with duplicates removed, so two
 * callers holding overlapping sets cannot deadlock. Each acquisition waits at
 * most the configured timeout and throws LockTimeout after that. An
 * account's mutex lives only while some caller holds or waits for it.
 */
class LockManager {
 public:
  explicit LockManager(std::chrono::milliseconds timeout);

  // Non-copyable
  LockManager(const LockManager&) = delete;
  LockManager& operator=(const LockManager&) = delete;

  /**
   * Holds a set of account locks; releases them in reverse order.
   */
  class Guard {
   public:
    Guard() = default;
    Guard(Guard&& other) noexcept;
    Guard& operator=(Guard&& other) noexcept;
    ~Guard();

    size_t size() const { return locks_.size(); }

   private:
    friend class LockManager;
    void release();

    LockManager* owner_ = nullptr;
    std::vector<std::string> ids_;
    std::vector<std::unique_lock<std::timed_mutex>> locks_;
  };

  /**
   * Locks every id in `account_ids`. Throws LockTimeout, with nothing held,
   * if any lock is not granted in time.
   */
  Guard acquire(std::vector<std::string> account_ids);

  /**
   * Runs `fn` with all of `account_ids` locked.
   */
  template <typename Fn>
  auto withLocks(std::vector<std::string> account_ids, Fn&& fn) -> decltype(fn()) {
    Guard guard = acquire(std::move(account_ids));
    return fn();
  }

  /**
   * Number of successful acquire() calls so far.
   */
  std::uint64_t acquisitionCount() const { return acquisitions_.load(); }

  std::chrono::milliseconds timeout() const { return timeout_; }

  /**
   * Number of accounts whose mutex is currently held or waited for.
   */
  size_t trackedAccounts();

 private:
  struct Entry {
    std::timed_mutex mutex;
    size_t users = 0;
  };

  std::timed_mutex& retainMutex(const std::string& account_id);
  void releaseMutex(const std::string& account_id);

  std::chrono::milliseconds timeout_;
  std::mutex table_mutex_;
  std::unordered_map<std::string, std::unique_ptr<Entry>> account_mutexes_;
  std::atomic<std::uint64_t> acquisitions_;
};

}  // namespace concurrent
}  // namespace ledger

#endif  // LOCK_MANAGER_HPP_
