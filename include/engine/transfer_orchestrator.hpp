#ifndef TRANSFER_ORCHESTRATOR_HPP_
#define TRANSFER_ORCHESTRATOR_HPP_

#include "concurrent/lock_manager.hpp"
#include "config/engine_config.hpp"
#include "engine/idempotency_guard.hpp"
#include "ledger_types.hpp"
#include "notify/notification_publisher.hpp"
#include "storage/account_store.hpp"
#include "storage/ledger_journal.hpp"
#include "storage/ledger_writer.hpp"
#include "storage/transaction_store.hpp"

#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace ledger {
namespace engine {

/**
 * Drives one transfer through INITIATED -> DEBITED -> CREDITED -> SUCCESS and
 * its side branches.
 *
 * Balance changes happen only while both accounts are locked through the
 * LockManager. Every leg is written to the journal under the transaction id,
 * so any transfer can be replayed with the same id without moving money
 * twice. Business outcomes come back in TransferResult; only a broken
 * invariant escapes as an exception.
 */
class TransferOrchestrator {
 public:
  /**
   * Decides, after a failed credit attempt on a DEEMED_APPROVED transfer,
   * whether the payee is to be treated as permanently unreachable.
   */
  using GiveUpPolicy = std::function<bool(const Transaction& txn, int credit_attempts)>;

  /**
   * Balance changes and their entries go through `writer`; when it is null
   * they are written to `accounts` and `journal` in sequence.
   */
  TransferOrchestrator(storage::AccountStore& accounts, storage::LedgerJournal& journal,
                       storage::TransactionStore& transactions, concurrent::LockManager& locks,
                       notify::EventPublisher* publisher, config::LockingConfig locking,
                       config::AccountPolicy policy, storage::LedgerWriter* writer = nullptr);

  // Non-copyable
  TransferOrchestrator(const TransferOrchestrator&) = delete;
  TransferOrchestrator& operator=(const TransferOrchestrator&) = delete;

  /**
   * Executes a transfer. A request without txn_id gets a generated one.
   * Replaying a known txn_id returns the recorded outcome.
   */
  TransferResult transfer(const TransferRequest& request);

  /**
   * Retries the credit of a DEEMED_APPROVED transfer. On success the
   * transfer completes; when the payee rejects the credit, or `give_up`
   * says so after a failed attempt, the payer is refunded and the transfer
   * ends REVERSED. Transfers in any other state are returned as they are.
   * Empty if the id is unknown. Throws LockTimeout and StoreUnavailable.
   */
  std::optional<TransferResult> resolveDeemedApproved(const std::string& txn_id,
                                                      const GiveUpPolicy& give_up);

  static TransferResult resultOf(const Transaction& txn);

  static std::string generateTxnId();

 private:
  enum class CreditOutcome {
    CREDITED,
    UNAVAILABLE,
    REJECTED
  };

  struct CreditLeg {
    CreditOutcome outcome = CreditOutcome::UNAVAILABLE;
    std::optional<Amount> balance_after;
    std::string reason;
  };

  // Result of work done under the account locks, plus the events to publish
  // once the locks are released.
  struct LockedOutcome {
    TransferResult result;
    std::vector<NotificationEvent> events;
  };

  TransferResult process(const Transaction& initial);
  LockedOutcome executeLocked(const std::string& txn_id);
  LockedOutcome resolveLocked(const std::string& txn_id, const GiveUpPolicy& give_up);

  bool debitPayer(Transaction& txn, LockedOutcome& out, std::optional<Amount>& payer_balance);
  void creditLeg(Transaction& txn, std::optional<Amount> payer_balance, LockedOutcome& out);
  CreditLeg creditPayee(const Transaction& txn);
  bool reversePayer(Transaction& txn, LockedOutcome& out);
  void complete(Transaction& txn, std::optional<Amount> payer_balance,
                std::optional<Amount> payee_balance, LockedOutcome& out);
  void fail(Transaction& txn, const std::string& message, LockedOutcome& out);

  bool advance(Transaction& txn, TransactionStatus to, const std::string& message);
  LedgerEntry makeEntry(const Transaction& txn, const std::string& account_id, Amount amount,
                        Direction direction, const std::string& counterparty) const;
  NotificationEvent makeEvent(EventType type, const Transaction& txn, const std::string& target,
                              const std::string& counterparty, std::optional<Amount> balance,
                              const std::string& message) const;
  void publishAll(const std::vector<NotificationEvent>& events);
  void recordOutcome(const TransferResult& result, const TransferRequest& request);

  storage::AccountStore& accounts_;
  storage::LedgerJournal& journal_;
  storage::TransactionStore& transactions_;
  concurrent::LockManager& locks_;
  notify::EventPublisher* publisher_;
  storage::SequentialLedgerWriter sequential_writer_;
  storage::LedgerWriter* writer_;
  IdempotencyGuard guard_;
  config::LockingConfig locking_;
  config::AccountPolicy policy_;
};

}  // namespace engine
}  // namespace ledger

#endif  // TRANSFER_ORCHESTRATOR_HPP_
