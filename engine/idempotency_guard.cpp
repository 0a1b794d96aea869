#include "engine/idempotency_guard.hpp"

namespace ledger {
namespace engine {

IdempotencyGuard::IdempotencyGuard(storage::LedgerJournal& journal) : journal_(journal) {
}

LegsRecorded IdempotencyGuard::check(const std::string& txn_id, const std::string& payer_id,
                                     const std::string& payee_id) const {
  LegsRecorded legs;
  legs.debit_recorded = journal_.exists(txn_id, payer_id, Direction::DEBIT);
  legs.credit_recorded = journal_.exists(txn_id, payee_id, Direction::CREDIT);
  return legs;
}

}  // namespace engine
}  // namespace ledger
