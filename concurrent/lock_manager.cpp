#include "concurrent/lock_manager.hpp"

#include "ledger_errors.hpp"
#include "observability/logger.hpp"
#include "observability/metrics.hpp"

#include <algorithm>

namespace ledger {
namespace concurrent {

LockManager::LockManager(std::chrono::milliseconds timeout)
    : timeout_(timeout), acquisitions_(0) {
}

LockManager::Guard::Guard(Guard&& other) noexcept
    : owner_(other.owner_), ids_(std::move(other.ids_)), locks_(std::move(other.locks_)) {
  other.ids_.clear();
  other.locks_.clear();
}

LockManager::Guard& LockManager::Guard::operator=(Guard&& other) noexcept {
  if (this != &other) {
    release();
    owner_ = other.owner_;
    ids_ = std::move(other.ids_);
    locks_ = std::move(other.locks_);
    other.ids_.clear();
    other.locks_.clear();
  }
  return *this;
}

LockManager::Guard::~Guard() {
  release();
}

void LockManager::Guard::release() {
  // Unlock before dropping the reference so a mutex is never destroyed while held
  while (!locks_.empty()) {
    locks_.pop_back();
    owner_->releaseMutex(ids_.back());
    ids_.pop_back();
  }
}

LockManager::Guard LockManager::acquire(std::vector<std::string> account_ids) {
  // Acquire locks in consistent order to prevent deadlocks
  std::sort(account_ids.begin(), account_ids.end());
  account_ids.erase(std::unique(account_ids.begin(), account_ids.end()), account_ids.end());

  auto& metrics = observability::getGlobalMetrics();
  observability::MetricsCollector::Timer timer(metrics, "ledger_lock_wait_seconds");

  Guard guard;
  guard.owner_ = this;
  guard.ids_.reserve(account_ids.size());
  guard.locks_.reserve(account_ids.size());
  for (const auto& account_id : account_ids) {
    std::unique_lock<std::timed_mutex> lock(retainMutex(account_id), std::defer_lock);
    if (!lock.try_lock_for(timeout_)) {
      releaseMutex(account_id);
      metrics.incrementCounter("ledger_lock_timeouts_total");
      LEDGER_LOG_BUILDER(WARN, "Account lock timed out")
          .field("account", observability::maskAccountId(account_id))
          .field("timeout_ms", static_cast<std::int64_t>(timeout_.count()));
      throw LockTimeout(account_id, "Timed out locking account " +
                                        observability::maskAccountId(account_id));
    }
    guard.ids_.push_back(account_id);
    guard.locks_.push_back(std::move(lock));
  }

  acquisitions_.fetch_add(1);
  metrics.incrementCounter("ledger_lock_acquisitions_total");
  return guard;
}

size_t LockManager::trackedAccounts() {
  std::lock_guard<std::mutex> table_lock(table_mutex_);
  return account_mutexes_.size();
}

std::timed_mutex& LockManager::retainMutex(const std::string& account_id) {
  std::lock_guard<std::mutex> table_lock(table_mutex_);
  auto& entry = account_mutexes_[account_id];
  if (!entry) {
    entry = std::make_unique<Entry>();
  }
  ++entry->users;
  return entry->mutex;
}

void LockManager::releaseMutex(const std::string& account_id) {
  std::lock_guard<std::mutex> table_lock(table_mutex_);
  auto it = account_mutexes_.find(account_id);
  if (it == account_mutexes_.end()) {
    return;
  }
  if (--it->second->users == 0) {
    account_mutexes_.erase(it);
  }
}

}  // namespace concurrent
}  // namespace ledger
