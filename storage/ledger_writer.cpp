#include "storage/ledger_writer.hpp"

#include "ledger_errors.hpp"
#include "observability/logger.hpp"
#include "observability/metrics.hpp"

namespace ledger {
namespace storage {

SequentialLedgerWriter::SequentialLedgerWriter(AccountStore& accounts, LedgerJournal& journal)
    : accounts_(accounts), journal_(journal) {
}

PostResult SequentialLedgerWriter::post(const std::string& account_id, Amount delta,
                                        std::int64_t expected_version, LedgerEntry& entry) {
  PostResult result;
  result.apply = accounts_.applyDelta(account_id, delta, expected_version);
  if (!result.apply.applied()) {
    return result;
  }
  entry.balance_after = result.apply.new_balance;

  try {
    result.append = journal_.append(entry);
  } catch (const LedgerError& e) {
    // The append may have been stored even though its acknowledgement was lost.
    bool landed = false;
    try {
      landed = journal_.exists(entry.txn_id, entry.account_id, entry.direction);
    } catch (const LedgerError& check) {
      LEDGER_LOG_BUILDER(FATAL, "Journal state unknown after failed append; balance change kept")
          .correlation(entry.txn_id)
          .field("account", observability::maskAccountId(account_id))
          .field("error", check.what());
      observability::getGlobalMetrics().incrementCounter("ledger_compensation_failures_total");
      throw;
    }
    if (landed) {
      LEDGER_LOG_BUILDER(WARN, "Journal append failed after the entry was stored")
          .correlation(entry.txn_id)
          .field("direction", toString(entry.direction))
          .field("error", e.what());
      return result;
    }
    undo(entry, -delta, result.apply.new_version);
    throw;
  }

  if (result.append == AppendStatus::DUPLICATE) {
    LEDGER_LOG_BUILDER(ERROR, "Entry already journaled; taking back the balance change")
        .correlation(entry.txn_id)
        .field("direction", toString(entry.direction));
    undo(entry, -delta, result.apply.new_version);
  }
  return result;
}

void SequentialLedgerWriter::undo(const LedgerEntry& entry, Amount delta, std::int64_t version) {
  auto& metrics = observability::getGlobalMetrics();
  try {
    ApplyResult undone = accounts_.applyDelta(entry.account_id, delta, version);
    if (undone.applied()) {
      metrics.incrementCounter("ledger_compensations_total");
      return;
    }
    LEDGER_LOG_BUILDER(FATAL, "Compensation rejected; balance and journal disagree")
        .correlation(entry.txn_id)
        .field("account", observability::maskAccountId(entry.account_id))
        .field("reason", toString(undone.status));
  } catch (const StoreUnavailable& e) {
    LEDGER_LOG_BUILDER(FATAL, "Compensation failed; balance and journal disagree")
        .correlation(entry.txn_id)
        .field("account", observability::maskAccountId(entry.account_id))
        .field("error", e.what());
  }
  metrics.incrementCounter("ledger_compensation_failures_total");
}

}  // namespace storage
}  // namespace ledger
