#ifndef TRANSACTION_STORE_HPP_
#define TRANSACTION_STORE_HPP_

#include "ledger_types.hpp"

#include <cstddef>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace ledger {
namespace storage {

/**
 * Persistent working records of the transfer orchestrator.
 */
class TransactionStore {
 public:
  virtual ~TransactionStore() = default;

  /**
   * Stores `txn` if its id is unknown. Returns the record that is stored
   * afterwards and whether this call created it.
   */
  virtual std::pair<Transaction, bool> insertIfAbsent(const Transaction& txn) = 0;

  virtual std::optional<Transaction> get(const std::string& txn_id) = 0;

  /**
   * Moves a record from `from` to `to` and stores the message. Returns false
   * if the record is missing or no longer in `from`. Throws std::logic_error
   * for a transition the state machine does not allow.
   */
  virtual bool transition(const std::string& txn_id, TransactionStatus from,
                          TransactionStatus to, const std::string& message) = 0;

  /**
   * Counts one more failed credit attempt and returns the new count.
   */
  virtual int recordCreditAttempt(const std::string& txn_id) = 0;

  /**
   * Oldest first.
   */
  virtual std::vector<Transaction> listByStatus(TransactionStatus status, size_t limit) = 0;
};

class MemoryTransactionStore : public TransactionStore {
 public:
  MemoryTransactionStore() = default;

  // Non-copyable
  MemoryTransactionStore(const MemoryTransactionStore&) = delete;
  MemoryTransactionStore& operator=(const MemoryTransactionStore&) = delete;

  std::pair<Transaction, bool> insertIfAbsent(const Transaction& txn) override;
  std::optional<Transaction> get(const std::string& txn_id) override;
  bool transition(const std::string& txn_id, TransactionStatus from, TransactionStatus to,
                  const std::string& message) override;
  int recordCreditAttempt(const std::string& txn_id) override;
  std::vector<Transaction> listByStatus(TransactionStatus status, size_t limit) override;

 private:
  std::unordered_map<std::string, Transaction> transactions_;
  std::unordered_map<std::string, std::uint64_t> insertion_order_;
  std::uint64_t next_order_ = 0;
  mutable std::mutex mutex_;
};

}  // namespace storage
}  // namespace ledger

#endif  // TRANSACTION_STORE_HPP_
