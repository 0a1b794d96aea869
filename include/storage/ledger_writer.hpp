#ifndef LEDGER_WRITER_HPP_
#define LEDGER_WRITER_HPP_

#include "ledger_types.hpp"
#include "storage/account_store.hpp"
#include "storage/ledger_journal.hpp"

#include <cstdint>
#include <string>

namespace ledger {
namespace storage {

/**
 * Outcome of LedgerWriter::post. `append` is only meaningful when the
 * balance change was applied. DUPLICATE means the entry was already in the
 * journal and the balance was left as it was.
 */
struct PostResult {
  ApplyResult apply;
  AppendStatus append = AppendStatus::APPENDED;

  bool posted() const { return apply.applied() && append == AppendStatus::APPENDED; }
};

/**
 * Moves a balance and journals the matching entry as one unit: after post
 * returns or throws, either both are stored or neither is.
 */
class LedgerWriter {
 public:
  virtual ~LedgerWriter() = default;

  /**
   * Applies `delta` to `account_id` if its version still equals
   * `expected_version`, then journals `entry` with balance_after set to the
   * new balance. Throws StoreUnavailable when the outcome is not stored.
   */
  virtual PostResult post(const std::string& account_id, Amount delta,
                          std::int64_t expected_version, LedgerEntry& entry) = 0;
};

/**
 * Writer over an account store and a journal that cannot share a
 * transaction. The balance change goes first; when the entry does not land
 * it is taken back.
 */
class SequentialLedgerWriter : public LedgerWriter {
 public:
  SequentialLedgerWriter(AccountStore& accounts, LedgerJournal& journal);

  // Non-copyable
  SequentialLedgerWriter(const SequentialLedgerWriter&) = delete;
  SequentialLedgerWriter& operator=(const SequentialLedgerWriter&) = delete;

  PostResult post(const std::string& account_id, Amount delta, std::int64_t expected_version,
                  LedgerEntry& entry) override;

 private:
  void undo(const LedgerEntry& entry, Amount delta, std::int64_t version);

  AccountStore& accounts_;
  LedgerJournal& journal_;
};

}  // namespace storage
}  // namespace ledger

#endif  // LEDGER_WRITER_HPP_
