#include "storage/transaction_store.hpp"

#include <algorithm>
#include <stdexcept>

namespace ledger {
namespace storage {

std::pair<Transaction, bool> MemoryTransactionStore::insertIfAbsent(const Transaction& txn) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = transactions_.find(txn.txn_id);
  if (it != transactions_.end()) {
    return {it->second, false};
  }

  Transaction stored = txn;
  Timestamp now = Clock::now();
  stored.created_at = now;
  stored.updated_at = now;
  transactions_.emplace(stored.txn_id, stored);
  insertion_order_[stored.txn_id] = next_order_++;
  return {stored, true};
}

std::optional<Transaction> MemoryTransactionStore::get(const std::string& txn_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = transactions_.find(txn_id);
  if (it == transactions_.end()) {
    return std::nullopt;
  }
  return it->second;
}

bool MemoryTransactionStore::transition(const std::string& txn_id, TransactionStatus from,
                                        TransactionStatus to, const std::string& message) {
  if (!isValidTransition(from, to)) {
    throw std::logic_error("Illegal transfer transition " + toString(from) + " -> " +
                           toString(to));
  }

  std::lock_guard<std::mutex> lock(mutex_);
  auto it = transactions_.find(txn_id);
  if (it == transactions_.end() || it->second.status != from) {
    return false;
  }
  it->second.status = to;
  it->second.message = message;
  it->second.updated_at = Clock::now();
  return true;
}

int MemoryTransactionStore::recordCreditAttempt(const std::string& txn_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = transactions_.find(txn_id);
  if (it == transactions_.end()) {
    return 0;
  }
  it->second.updated_at = Clock::now();
  return ++it->second.credit_attempts;
}

std::vector<Transaction> MemoryTransactionStore::listByStatus(TransactionStatus status,
                                                              size_t limit) {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<Transaction> matches;
  for (const auto& [id, txn] : transactions_) {
    if (txn.status == status) {
      matches.push_back(txn);
    }
  }

  std::sort(matches.begin(), matches.end(), [this](const Transaction& a, const Transaction& b) {
    return insertion_order_.at(a.txn_id) < insertion_order_.at(b.txn_id);
  });
  if (matches.size() > limit) {
    matches.resize(limit);
  }
  return matches;
}

}  // namespace storage
}  // namespace ledger
