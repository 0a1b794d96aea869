#ifndef LEDGER_JOURNAL_HPP_
#define LEDGER_JOURNAL_HPP_

#include "ledger_types.hpp"

#include <cstddef>
#include <map>
#include <optional>
#include <set>
#include <shared_mutex>
#include <string>
#include <tuple>
#include <unordered_map>
#include <vector>

namespace ledger {
namespace storage {

enum class AppendStatus {
  APPENDED,
  DUPLICATE
};

/**
 * One page request against an account's history. Entries come back newest
 * first; `from`/`to` are inclusive bounds on creation time.
 */
struct HistoryQuery {
  std::string account_id;
  std::optional<Timestamp> from;
  std::optional<Timestamp> to;
  std::string page_token;  // empty for the first page
  size_t page_size = 50;
};

struct LedgerPage {
  std::vector<LedgerEntry> entries;
  std::string next_page_token;  // empty when the history is exhausted
};

/**
 * Keyset position inside a descending history scan.
 */
struct PageToken {
  std::int64_t created_at_us = 0;
  std::int64_t entry_id = 0;

  std::string encode() const;
  static std::optional<PageToken> decode(const std::string& token);
  static PageToken after(const LedgerEntry& entry);
};

/**
 * Append-only journal of ledger entries. Entries are never updated or
 * deleted, so readers need no locking against writers.
 */
class LedgerJournal {
 public:
  virtual ~LedgerJournal() = default;

  /**
   * Assigns entry_id and created_at, then stores the entry. Returns DUPLICATE
   * without writing if (txn_id, account_id, direction) is already present.
   */
  virtual AppendStatus append(LedgerEntry& entry) = 0;

  virtual bool exists(const std::string& txn_id, const std::string& account_id,
                      Direction direction) = 0;

  /**
   * Returns one page of history. Throws std::invalid_argument on a page token
   * this journal did not issue.
   */
  virtual LedgerPage historyFor(const HistoryQuery& query) = 0;

  virtual std::vector<LedgerEntry> entriesForTransaction(const std::string& txn_id) = 0;
};

/**
 * Lazy, finite, restartable sequence over an account's history. Pages are
 * fetched only when the previous one is used up.
 */
class HistoryCursor {
 public:
  HistoryCursor(LedgerJournal& journal, HistoryQuery query);

  /**
   * Next entry, newest first, or empty when the sequence is exhausted.
   */
  std::optional<LedgerEntry> next();

  /**
   * Page token that restarts the sequence right after the last entry handed
   * out by next(). Empty once the sequence is exhausted.
   */
  std::string resumeToken() const;

  bool exhausted() const { return exhausted_; }

 private:
  void fetch();

  LedgerJournal& journal_;
  HistoryQuery query_;
  std::vector<LedgerEntry> buffer_;
  size_t position_ = 0;
  std::string next_token_;
  std::string resume_token_;
  bool fetched_ = false;
  bool exhausted_ = false;
};

/**
 * In-memory journal. Creation timestamps never go backwards.
 */
class MemoryLedgerJournal : public LedgerJournal {
 public:
  MemoryLedgerJournal() = default;

  // Non-copyable
  MemoryLedgerJournal(const MemoryLedgerJournal&) = delete;
  MemoryLedgerJournal& operator=(const MemoryLedgerJournal&) = delete;

  AppendStatus append(LedgerEntry& entry) override;
  bool exists(const std::string& txn_id, const std::string& account_id,
              Direction direction) override;
  LedgerPage historyFor(const HistoryQuery& query) override;
  std::vector<LedgerEntry> entriesForTransaction(const std::string& txn_id) override;

  size_t size() const;

 private:
  using EntryKey = std::tuple<std::string, std::string, Direction>;

  std::vector<LedgerEntry> entries_;
  std::set<EntryKey> keys_;
  // account id -> positions in entries_, ascending by (created_at, entry_id)
  std::unordered_map<std::string, std::vector<size_t>> by_account_;
  std::unordered_map<std::string, std::vector<size_t>> by_txn_;
  std::int64_t next_entry_id_ = 1;
  Timestamp last_created_at_{};
  mutable std::shared_mutex mutex_;
};

}  // namespace storage
}  // namespace ledger

#endif  // LEDGER_JOURNAL_HPP_
