#include "ledger_engine.hpp"

#include "database/ledger_persistence.hpp"
#include "observability/logger.hpp"

namespace ledger {

DataSources DataSources::inMemory(const config::EngineConfig& config) {
  DataSources sources;
  sources.accounts = std::make_shared<storage::MemoryAccountStore>(config.accounts);
  sources.journal = std::make_shared<storage::MemoryLedgerJournal>();
  sources.transactions = std::make_shared<storage::MemoryTransactionStore>();
  return sources;
}

DataSources DataSources::postgres(const config::EngineConfig& config) {
  auto primary = std::make_shared<database::ConnectionPool>(config.primary_db);
  database::initializeSchema(*primary);

  DataSources sources;
  sources.accounts = std::make_shared<database::PostgresAccountStore>(primary, config.accounts);
  sources.journal = std::make_shared<database::PostgresLedgerJournal>(primary);
  sources.writer = std::make_shared<database::PostgresLedgerWriter>(primary, config.accounts);
  sources.transactions = std::make_shared<database::PostgresTransactionStore>(primary);

  if (config.replica_db) {
    auto replica = std::make_shared<database::ConnectionPool>(*config.replica_db);
    sources.replica_accounts =
        std::make_shared<database::PostgresAccountStore>(replica, config.accounts);
    sources.replica_journal = std::make_shared<database::PostgresLedgerJournal>(replica);
    LEDGER_LOG_BUILDER(INFO, "Replica configured").field("database", replica->describe());
  }
  return sources;
}

LedgerEngine::LedgerEngine(config::EngineConfig config, DataSources sources,
                           std::shared_ptr<notify::EventSink> sink)
    : config_(std::move(config)),
      sources_(std::move(sources)),
      locks_(std::chrono::milliseconds(config_.locking.lock_timeout_ms)),
      publisher_(std::move(sink), config_.publisher),
      orchestrator_(*sources_.accounts, *sources_.journal, *sources_.transactions, locks_,
                    &publisher_, config_.locking, config_.accounts, sources_.writer.get()),
      reconciler_(orchestrator_, *sources_.transactions, config_.reconciler),
      router_(config_.router, *sources_.accounts, *sources_.journal,
              sources_.replica_accounts.get(), sources_.replica_journal.get()) {
}

LedgerEngine::~LedgerEngine() {
  stop();
}

bool LedgerEngine::start() {
  if (!publisher_.start()) {
    LEDGER_LOG_ERROR("Failed to start notification publisher");
    return false;
  }
  reconciler_.start();
  LEDGER_LOG_BUILDER(INFO, "Ledger engine started")
      .field("replica", router_.hasReplica())
      .field("frozen_credit_policy", config::toString(config_.accounts.frozen_credit))
      .field("overdraft_limit", formatAmount(config_.accounts.overdraft_limit));
  return true;
}

void LedgerEngine::stop() {
  reconciler_.stop();
  publisher_.stop();
}

TransferResult LedgerEngine::transfer(const TransferRequest& request) {
  TransferResult result = orchestrator_.transfer(request);
  router_.recordWrite(request.caller_id.empty() ? request.payer_id : request.caller_id);
  return result;
}

std::optional<Amount> LedgerEngine::balance(const std::string& account_id,
                                            const std::string& caller_id) {
  auto stores = router_.storesFor(router_.route(routing::OperationKind::BALANCE, caller_id));
  auto account = stores.accounts.get(account_id);
  if (!account) {
    return std::nullopt;
  }
  return account->balance;
}

storage::LedgerPage LedgerEngine::statement(const storage::HistoryQuery& query,
                                            const std::string& caller_id) {
  auto stores = router_.storesFor(router_.route(routing::OperationKind::STATEMENT, caller_id));
  return stores.journal.historyFor(query);
}

std::optional<Transaction> LedgerEngine::transaction(const std::string& txn_id) {
  return sources_.transactions->get(txn_id);
}

bool LedgerEngine::openAccount(const std::string& account_id, Amount opening_balance) {
  if (account_id.empty() || opening_balance < 0) {
    return false;
  }
  return sources_.accounts->createAccount(account_id, opening_balance);
}

bool LedgerEngine::setFrozen(const std::string& account_id, bool frozen) {
  bool updated = locks_.withLocks({account_id},
                                  [&] { return sources_.accounts->setFrozen(account_id, frozen); });
  if (updated) {
    LEDGER_LOG_BUILDER(INFO, frozen ? "Account frozen" : "Account unfrozen")
        .field("account", observability::maskAccountId(account_id));
  }
  return updated;
}

std::optional<TransferResult> LedgerEngine::reconcile(const std::string& txn_id) {
  return reconciler_.reconcile(txn_id);
}

engine::Reconciler::PassStats LedgerEngine::reconcileOnce() {
  return reconciler_.reconcileOnce();
}

}  // namespace ledger
