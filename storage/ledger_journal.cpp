#include "storage/ledger_journal.hpp"

#include <mutex>
#include <stdexcept>

namespace ledger {
namespace storage {

std::string PageToken::encode() const {
  return std::to_string(created_at_us) + ":" + std::to_string(entry_id);
}

std::optional<PageToken> PageToken::decode(const std::string& token) {
  auto colon = token.find(':');
  if (colon == std::string::npos || colon == 0 || colon + 1 == token.size()) {
    return std::nullopt;
  }
  try {
    size_t used = 0;
    PageToken decoded;
    decoded.created_at_us = std::stoll(token.substr(0, colon), &used);
    if (used != colon) return std::nullopt;
    std::string id_part = token.substr(colon + 1);
    decoded.entry_id = std::stoll(id_part, &used);
    if (used != id_part.size()) return std::nullopt;
    return decoded;
  } catch (const std::exception&) {
    return std::nullopt;
  }
}

PageToken PageToken::after(const LedgerEntry& entry) {
  return PageToken{toEpochMicros(entry.created_at), entry.entry_id};
}

HistoryCursor::HistoryCursor(LedgerJournal& journal, HistoryQuery query)
    : journal_(journal), query_(std::move(query)), resume_token_(query_.page_token) {
}

std::optional<LedgerEntry> HistoryCursor::next() {
  while (!exhausted_) {
    if (position_ < buffer_.size()) {
      const LedgerEntry& entry = buffer_[position_++];
      resume_token_ = PageToken::after(entry).encode();
      return entry;
    }
    if (fetched_ && next_token_.empty()) {
      exhausted_ = true;
      resume_token_.clear();
      break;
    }
    fetch();
  }
  return std::nullopt;
}

std::string HistoryCursor::resumeToken() const {
  return resume_token_;
}

void HistoryCursor::fetch() {
  if (fetched_) {
    query_.page_token = next_token_;
  }
  LedgerPage page = journal_.historyFor(query_);
  buffer_ = std::move(page.entries);
  position_ = 0;
  next_token_ = std::move(page.next_page_token);
  fetched_ = true;
}

AppendStatus MemoryLedgerJournal::append(LedgerEntry& entry) {
  std::unique_lock<std::shared_mutex> lock(mutex_);

  EntryKey key{entry.txn_id, entry.account_id, entry.direction};
  if (keys_.count(key) > 0) {
    return AppendStatus::DUPLICATE;
  }

  Timestamp now = Clock::now();
  if (now < last_created_at_) {
    now = last_created_at_;
  }
  last_created_at_ = now;

  entry.entry_id = next_entry_id_++;
  entry.created_at = now;

  size_t position = entries_.size();
  entries_.push_back(entry);
  keys_.insert(key);
  by_account_[entry.account_id].push_back(position);
  by_txn_[entry.txn_id].push_back(position);
  return AppendStatus::APPENDED;
}

bool MemoryLedgerJournal::exists(const std::string& txn_id, const std::string& account_id,
                                 Direction direction) {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return keys_.count(EntryKey{txn_id, account_id, direction}) > 0;
}

LedgerPage MemoryLedgerJournal::historyFor(const HistoryQuery& query) {
  std::optional<PageToken> start;
  if (!query.page_token.empty()) {
    start = PageToken::decode(query.page_token);
    if (!start) {
      throw std::invalid_argument("Malformed page token");
    }
  }
  size_t page_size = query.page_size == 0 ? 1 : query.page_size;

  std::shared_lock<std::shared_mutex> lock(mutex_);
  LedgerPage page;
  auto it = by_account_.find(query.account_id);
  if (it == by_account_.end()) {
    return page;
  }

  const auto& positions = it->second;
  for (auto pos = positions.rbegin(); pos != positions.rend(); ++pos) {
    const LedgerEntry& entry = entries_[*pos];
    std::int64_t created_us = toEpochMicros(entry.created_at);

    if (start) {
      bool after_start = created_us < start->created_at_us ||
                         (created_us == start->created_at_us && entry.entry_id < start->entry_id);
      if (!after_start) continue;
    }
    if (query.to && entry.created_at > *query.to) continue;
    if (query.from && entry.created_at < *query.from) break;

    if (page.entries.size() == page_size) {
      page.next_page_token = PageToken::after(page.entries.back()).encode();
      break;
    }
    page.entries.push_back(entry);
  }
  return page;
}

std::vector<LedgerEntry> MemoryLedgerJournal::entriesForTransaction(const std::string& txn_id) {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  std::vector<LedgerEntry> result;
  auto it = by_txn_.find(txn_id);
  if (it == by_txn_.end()) {
    return result;
  }
  for (size_t position : it->second) {
    result.push_back(entries_[position]);
  }
  return result;
}

size_t MemoryLedgerJournal::size() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return entries_.size();
}

}  // namespace storage
}  // namespace ledger
