#ifndef IDEMPOTENCY_GUARD_HPP_
#define IDEMPOTENCY_GUARD_HPP_

#include "storage/ledger_journal.hpp"

#include <string>

namespace ledger {
namespace engine {

/**
 * Which legs of a transfer the journal already holds.
 */
struct LegsRecorded {
  bool debit_recorded = false;
  bool credit_recorded = false;

  bool complete() const { return debit_recorded && credit_recorded; }
};

/**
 * Answers "has this transaction already moved money?" from the journal alone.
 * The journal's uniqueness on (txn, account, direction) is what makes a
 * replayed transfer safe.
 */
class IdempotencyGuard {
 public:
  explicit IdempotencyGuard(storage::LedgerJournal& journal);

  LegsRecorded check(const std::string& txn_id, const std::string& payer_id,
                     const std::string& payee_id) const;

 private:
  storage::LedgerJournal& journal_;
};

}  // namespace engine
}  // namespace ledger

#endif  // IDEMPOTENCY_GUARD_HPP_
