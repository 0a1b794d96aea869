#ifndef READ_WRITE_ROUTER_HPP_
#define READ_WRITE_ROUTER_HPP_

#include "config/engine_config.hpp"
#include "storage/account_store.hpp"
#include "storage/ledger_journal.hpp"

#include <chrono>
#include <functional>
#include <mutex>
#include <string>
#include <unordered_map>

namespace ledger {
namespace routing {

enum class OperationKind {
  TRANSFER,
  OPEN_ACCOUNT,
  FREEZE_ACCOUNT,
  RECONCILE,
  BALANCE,
  STATEMENT,
  TRANSACTION_LOOKUP
};

enum class Route {
  PRIMARY,
  REPLICA
};

bool isReadOnly(OperationKind kind);
std::string toString(Route route);

/**
 * Stores to use for one routed operation.
 */
struct StorePair {
  Route route;
  storage::AccountStore& accounts;
  storage::LedgerJournal& journal;
};

/**
 * Chooses primary or replica per operation, decided at the call site.
 *
 * Read-only operations go to the replica when one is configured, except for a
 * caller that wrote within the staleness window: those reads go to the
 * primary so the caller sees its own writes.
 */
class ReadWriteRouter {
 public:
  using SteadyClock = std::chrono::steady_clock;
  using NowFn = std::function<SteadyClock::time_point()>;

  ReadWriteRouter(config::RouterConfig config, storage::AccountStore& primary_accounts,
                  storage::LedgerJournal& primary_journal,
                  storage::AccountStore* replica_accounts = nullptr,
                  storage::LedgerJournal* replica_journal = nullptr,
                  NowFn now = [] { return SteadyClock::now(); });

  // Non-copyable
  ReadWriteRouter(const ReadWriteRouter&) = delete;
  ReadWriteRouter& operator=(const ReadWriteRouter&) = delete;

  Route route(OperationKind kind, const std::string& caller_id);

  /**
   * Notes that `caller_id` just wrote through the primary.
   */
  void recordWrite(const std::string& caller_id);

  StorePair storesFor(Route route);

  bool hasReplica() const;

  std::chrono::milliseconds stalenessWindow() const { return staleness_window_; }

 private:
  void pruneExpired(SteadyClock::time_point now);

  bool replica_enabled_;
  std::chrono::milliseconds staleness_window_;
  storage::AccountStore& primary_accounts_;
  storage::LedgerJournal& primary_journal_;
  storage::AccountStore* replica_accounts_;
  storage::LedgerJournal* replica_journal_;
  NowFn now_;

  std::unordered_map<std::string, SteadyClock::time_point> last_write_;
  std::mutex mutex_;
};

}  // namespace routing
}  // namespace ledger

#endif  // READ_WRITE_ROUTER_HPP_
