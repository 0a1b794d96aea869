#include "storage/account_store.hpp"

#include <limits>
#include <mutex>

namespace ledger {
namespace storage {

std::string toString(ApplyStatus status) {
  switch (status) {
    case ApplyStatus::APPLIED: return "APPLIED";
    case ApplyStatus::INSUFFICIENT_BALANCE: return "INSUFFICIENT_BALANCE";
    case ApplyStatus::VERSION_CONFLICT: return "VERSION_CONFLICT";
    case ApplyStatus::FROZEN: return "FROZEN";
    case ApplyStatus::NOT_FOUND: return "NOT_FOUND";
    case ApplyStatus::BALANCE_OVERFLOW: return "BALANCE_OVERFLOW";
  }
  return "UNKNOWN";
}

ApplyStatus evaluateDelta(const Account& account, Amount delta, std::int64_t expected_version,
                          const config::AccountPolicy& policy) {
  if (account.version != expected_version) {
    return ApplyStatus::VERSION_CONFLICT;
  }

  if (delta < 0) {
    if (account.frozen) {
      return ApplyStatus::FROZEN;
    }
    // A result below the representable range is below any overdraft limit.
    if (account.balance < std::numeric_limits<Amount>::min() - delta ||
        account.balance + delta < -policy.overdraft_limit) {
      return ApplyStatus::INSUFFICIENT_BALANCE;
    }
  } else {
    if (account.frozen && policy.frozen_credit == config::FrozenCreditPolicy::BLOCK) {
      return ApplyStatus::FROZEN;
    }
    if (account.balance > std::numeric_limits<Amount>::max() - delta) {
      return ApplyStatus::BALANCE_OVERFLOW;
    }
  }

  return ApplyStatus::APPLIED;
}

MemoryAccountStore::MemoryAccountStore(config::AccountPolicy policy) : policy_(policy) {
}

std::optional<Account> MemoryAccountStore::get(const std::string& account_id) {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  auto it = accounts_.find(account_id);
  if (it == accounts_.end()) {
    return std::nullopt;
  }
  return it->second;
}

ApplyResult MemoryAccountStore::applyDelta(const std::string& account_id, Amount delta,
                                           std::int64_t expected_version) {
  std::unique_lock<std::shared_mutex> lock(mutex_);

  ApplyResult result;
  auto it = accounts_.find(account_id);
  if (it == accounts_.end()) {
    result.status = ApplyStatus::NOT_FOUND;
    return result;
  }

  Account& account = it->second;
  result.status = evaluateDelta(account, delta, expected_version, policy_);
  if (!result.applied()) {
    return result;
  }

  account.balance += delta;
  account.version += 1;
  result.new_balance = account.balance;
  result.new_version = account.version;
  return result;
}

bool MemoryAccountStore::createAccount(const std::string& account_id, Amount opening_balance) {
  std::unique_lock<std::shared_mutex> lock(mutex_);
  if (accounts_.count(account_id) > 0) {
    return false;
  }

  Account account;
  account.account_id = account_id;
  account.balance = opening_balance;
  account.version = 1;
  accounts_.emplace(account_id, account);
  return true;
}

bool MemoryAccountStore::setFrozen(const std::string& account_id, bool frozen) {
  std::unique_lock<std::shared_mutex> lock(mutex_);
  auto it = accounts_.find(account_id);
  if (it == accounts_.end()) {
    return false;
  }
  it->second.frozen = frozen;
  it->second.version += 1;
  return true;
}

}  // namespace storage
}  // namespace ledger
