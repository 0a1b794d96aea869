#include "routing/read_write_router.hpp"

#include "observability/metrics.hpp"

namespace ledger {
namespace routing {

namespace {

constexpr size_t kPruneThreshold = 10000;

}  // namespace

bool isReadOnly(OperationKind kind) {
  switch (kind) {
    case OperationKind::BALANCE:
    case OperationKind::STATEMENT:
    case OperationKind::TRANSACTION_LOOKUP:
      return true;
    case OperationKind::TRANSFER:
    case OperationKind::OPEN_ACCOUNT:
    case OperationKind::FREEZE_ACCOUNT:
    case OperationKind::RECONCILE:
      return false;
  }
  return false;
}

std::string toString(Route route) {
  return route == Route::PRIMARY ? "primary" : "replica";
}

ReadWriteRouter::ReadWriteRouter(config::RouterConfig config,
                                 storage::AccountStore& primary_accounts,
                                 storage::LedgerJournal& primary_journal,
                                 storage::AccountStore* replica_accounts,
                                 storage::LedgerJournal* replica_journal, NowFn now)
    : replica_enabled_(config.replica_enabled),
      staleness_window_(config.staleness_window_ms),
      primary_accounts_(primary_accounts),
      primary_journal_(primary_journal),
      replica_accounts_(replica_accounts),
      replica_journal_(replica_journal),
      now_(std::move(now)) {
}

bool ReadWriteRouter::hasReplica() const {
  return replica_enabled_ && replica_accounts_ != nullptr && replica_journal_ != nullptr;
}

Route ReadWriteRouter::route(OperationKind kind, const std::string& caller_id) {
  Route chosen = Route::PRIMARY;
  if (isReadOnly(kind) && hasReplica()) {
    chosen = Route::REPLICA;
    if (!caller_id.empty()) {
      std::lock_guard<std::mutex> lock(mutex_);
      auto it = last_write_.find(caller_id);
      if (it != last_write_.end() && now_() - it->second < staleness_window_) {
        chosen = Route::PRIMARY;
      }
    }
  }

  observability::getGlobalMetrics().incrementCounter("ledger_routed_operations_total",
                                                     {{"route", toString(chosen)}});
  return chosen;
}

void ReadWriteRouter::recordWrite(const std::string& caller_id) {
  if (caller_id.empty()) return;
  auto now = now_();
  std::lock_guard<std::mutex> lock(mutex_);
  last_write_[caller_id] = now;
  if (last_write_.size() > kPruneThreshold) {
    pruneExpired(now);
  }
}

StorePair ReadWriteRouter::storesFor(Route route) {
  if (route == Route::REPLICA && hasReplica()) {
    return StorePair{Route::REPLICA, *replica_accounts_, *replica_journal_};
  }
  return StorePair{Route::PRIMARY, primary_accounts_, primary_journal_};
}

void ReadWriteRouter::pruneExpired(SteadyClock::time_point now) {
  for (auto it = last_write_.begin(); it != last_write_.end();) {
    if (now - it->second >= staleness_window_) {
      it = last_write_.erase(it);
    } else {
      ++it;
    }
  }
}

}  // namespace routing
}  // namespace ledger
