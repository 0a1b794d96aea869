#ifndef LEDGER_ENGINE_HPP_
#define LEDGER_ENGINE_HPP_

#include "concurrent/lock_manager.hpp"
#include "config/engine_config.hpp"
#include "engine/reconciler.hpp"
#include "engine/transfer_orchestrator.hpp"
#include "notify/notification_publisher.hpp"
#include "routing/read_write_router.hpp"
#include "storage/account_store.hpp"
#include "storage/ledger_journal.hpp"
#include "storage/ledger_writer.hpp"
#include "storage/transaction_store.hpp"

#include <memory>
#include <optional>
#include <string>

namespace ledger {

/**
 * Backing stores for one engine. The replica pair is optional. Without a
 * writer, balance changes and entries go through `accounts` and `journal`
 * one after the other.
 */
struct DataSources {
  std::shared_ptr<storage::AccountStore> accounts;
  std::shared_ptr<storage::LedgerJournal> journal;
  std::shared_ptr<storage::LedgerWriter> writer;
  std::shared_ptr<storage::TransactionStore> transactions;
  std::shared_ptr<storage::AccountStore> replica_accounts;
  std::shared_ptr<storage::LedgerJournal> replica_journal;

  static DataSources inMemory(const config::EngineConfig& config);

  /**
   * Connects to the configured primary (and replica, if any) and makes sure
   * the schema exists. Throws StoreUnavailable or DatabaseError.
   */
  static DataSources postgres(const config::EngineConfig& config);
};

/**
 * Wires the stores, lock manager, orchestrator, reconciler, router and
 * publisher together and exposes the operations the front end needs.
 */
class LedgerEngine {
 public:
  LedgerEngine(config::EngineConfig config, DataSources sources,
               std::shared_ptr<notify::EventSink> sink);
  ~LedgerEngine();

  // Non-copyable
  LedgerEngine(const LedgerEngine&) = delete;
  LedgerEngine& operator=(const LedgerEngine&) = delete;

  /**
   * Start the publisher workers and the background reconciler.
   */
  bool start();

  void stop();

  TransferResult transfer(const TransferRequest& request);

  /**
   * Current balance, read through the router. Empty if the account is unknown.
   */
  std::optional<Amount> balance(const std::string& account_id, const std::string& caller_id);

  /**
   * One page of an account's history, newest first, read through the
   * router. Throws std::invalid_argument on a malformed page token.
   */
  storage::LedgerPage statement(const storage::HistoryQuery& query, const std::string& caller_id);

  std::optional<Transaction> transaction(const std::string& txn_id);

  bool openAccount(const std::string& account_id, Amount opening_balance);

  /**
   * Freezes or unfreezes an account while holding its lock.
   */
  bool setFrozen(const std::string& account_id, bool frozen);

  std::optional<TransferResult> reconcile(const std::string& txn_id);
  engine::Reconciler::PassStats reconcileOnce();

  const config::EngineConfig& config() const { return config_; }
  concurrent::LockManager& locks() { return locks_; }
  routing::ReadWriteRouter& router() { return router_; }
  notify::NotificationPublisher& publisher() { return publisher_; }
  engine::Reconciler& reconciler() { return reconciler_; }

 private:
  config::EngineConfig config_;
  DataSources sources_;
  concurrent::LockManager locks_;
  notify::NotificationPublisher publisher_;
  engine::TransferOrchestrator orchestrator_;
  engine::Reconciler reconciler_;
  routing::ReadWriteRouter router_;
};

}  // namespace ledger

#endif  // LEDGER_ENGINE_HPP_
