#ifndef RECONCILER_HPP_
#define RECONCILER_HPP_

#include "config/engine_config.hpp"
#include "engine/transfer_orchestrator.hpp"
#include "storage/transaction_store.hpp"

#include <condition_variable>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

namespace ledger {
namespace engine {

/**
 * Settles DEEMED_APPROVED transfers: retries the credit with the original
 * transaction id, and reverses the transfer once the payee is permanently
 * invalid (missing, or frozen under the block policy) or permanently
 * unreachable (max_credit_attempts failed attempts, or older than
 * give_up_after_ms).
 */
class Reconciler {
 public:
  using NowFn = std::function<Timestamp()>;

  struct PassStats {
    size_t examined = 0;
    size_t completed = 0;
    size_t reversed = 0;
    size_t pending = 0;
    size_t errors = 0;
  };

  Reconciler(TransferOrchestrator& orchestrator, storage::TransactionStore& transactions,
             config::ReconcilerConfig config, NowFn now = [] { return Clock::now(); });
  ~Reconciler();

  // Non-copyable
  Reconciler(const Reconciler&) = delete;
  Reconciler& operator=(const Reconciler&) = delete;

  /**
   * One pass over up to batch_size DEEMED_APPROVED transfers, oldest first.
   */
  PassStats reconcileOnce();

  /**
   * Settles a single transfer now. Empty if the id is unknown.
   * Throws LockTimeout and StoreUnavailable.
   */
  std::optional<TransferResult> reconcile(const std::string& txn_id);

  /**
   * Start the background pass every interval_ms. No-op when interval_ms is 0.
   */
  bool start();

  void stop();

  bool isRunning() const;

 private:
  bool shouldGiveUp(const Transaction& txn, int credit_attempts) const;
  void workerThread();

  TransferOrchestrator& orchestrator_;
  storage::TransactionStore& transactions_;
  config::ReconcilerConfig config_;
  NowFn now_;

  std::unique_ptr<std::thread> worker_;
  bool stopping_ = false;
  mutable std::mutex mutex_;
  std::condition_variable wake_;
};

}  // namespace engine
}  // namespace ledger

#endif  // RECONCILER_HPP_
