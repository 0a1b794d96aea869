#include "engine/reconciler.hpp"

#include "ledger_errors.hpp"
#include "observability/logger.hpp"
#include "observability/metrics.hpp"

#include <chrono>

namespace ledger {
namespace engine {

Reconciler::Reconciler(TransferOrchestrator& orchestrator, storage::TransactionStore& transactions,
                       config::ReconcilerConfig config, NowFn now)
    : orchestrator_(orchestrator),
      transactions_(transactions),
      config_(config),
      now_(std::move(now)) {
}

Reconciler::~Reconciler() {
  stop();
}

bool Reconciler::shouldGiveUp(const Transaction& txn, int credit_attempts) const {
  if (credit_attempts >= config_.max_credit_attempts) {
    return true;
  }
  auto age = std::chrono::duration_cast<std::chrono::milliseconds>(now_() - txn.created_at);
  return age.count() > config_.give_up_after_ms;
}

std::optional<TransferResult> Reconciler::reconcile(const std::string& txn_id) {
  return orchestrator_.resolveDeemedApproved(
      txn_id, [this](const Transaction& txn, int attempts) { return shouldGiveUp(txn, attempts); });
}

Reconciler::PassStats Reconciler::reconcileOnce() {
  PassStats stats;
  auto& metrics = observability::getGlobalMetrics();
  observability::MetricsCollector::Timer timer(metrics, "ledger_reconcile_pass_seconds");

  auto pending = transactions_.listByStatus(TransactionStatus::DEEMED_APPROVED, config_.batch_size);
  for (const auto& txn : pending) {
    ++stats.examined;
    try {
      auto result = reconcile(txn.txn_id);
      TransactionStatus status = result ? result->status : TransactionStatus::DEEMED_APPROVED;
      if (status == TransactionStatus::SUCCESS) {
        ++stats.completed;
        metrics.incrementCounter("ledger_reconciliations_total", {{"outcome", "completed"}});
      } else if (status == TransactionStatus::REVERSED) {
        ++stats.reversed;
        metrics.incrementCounter("ledger_reconciliations_total", {{"outcome", "reversed"}});
      } else {
        ++stats.pending;
        metrics.incrementCounter("ledger_reconciliations_total", {{"outcome", "pending"}});
      }
    } catch (const LedgerError& e) {
      ++stats.errors;
      metrics.incrementCounter("ledger_reconciliations_total", {{"outcome", "error"}});
      LEDGER_LOG_BUILDER(WARN, "Reconciliation attempt failed")
          .correlation(txn.txn_id)
          .field("error", e.what());
    }
  }

  metrics.setGauge("ledger_deemed_approved_pending", static_cast<double>(stats.pending));
  if (stats.examined > 0) {
    LEDGER_LOG_BUILDER(INFO, "Reconciliation pass finished")
        .field("examined", static_cast<std::int64_t>(stats.examined))
        .field("completed", static_cast<std::int64_t>(stats.completed))
        .field("reversed", static_cast<std::int64_t>(stats.reversed))
        .field("pending", static_cast<std::int64_t>(stats.pending))
        .field("errors", static_cast<std::int64_t>(stats.errors));
  }
  return stats;
}

bool Reconciler::start() {
  if (config_.interval_ms <= 0) {
    LEDGER_LOG_INFO("Background reconciliation disabled");
    return false;
  }

  std::lock_guard<std::mutex> lock(mutex_);
  if (worker_) return true;
  stopping_ = false;
  worker_ = std::make_unique<std::thread>(&Reconciler::workerThread, this);
  LEDGER_LOG_BUILDER(INFO, "Reconciler started").field("interval_ms", config_.interval_ms);
  return true;
}

void Reconciler::stop() {
  std::unique_ptr<std::thread> worker;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!worker_) return;
    stopping_ = true;
    worker = std::move(worker_);
  }
  wake_.notify_all();
  if (worker->joinable()) {
    worker->join();
  }
  LEDGER_LOG_INFO("Reconciler stopped");
}

bool Reconciler::isRunning() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return worker_ != nullptr;
}

void Reconciler::workerThread() {
  std::unique_lock<std::mutex> lock(mutex_);
  while (!stopping_) {
    wake_.wait_for(lock, std::chrono::milliseconds(config_.interval_ms),
                   [this] { return stopping_; });
    if (stopping_) break;

    lock.unlock();
    try {
      reconcileOnce();
    } catch (const LedgerError& e) {
      LEDGER_LOG_BUILDER(ERROR, "Reconciliation pass failed").field("error", e.what());
    }
    lock.lock();
  }
}

}  // namespace engine
}  // namespace ledger
