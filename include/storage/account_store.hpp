#ifndef ACCOUNT_STORE_HPP_
#define ACCOUNT_STORE_HPP_

#include "config/engine_config.hpp"
#include "ledger_types.hpp"

#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>

namespace ledger {
namespace storage {

enum class ApplyStatus {
  APPLIED,
  INSUFFICIENT_BALANCE,
  VERSION_CONFLICT,
  FROZEN,
  NOT_FOUND,
  BALANCE_OVERFLOW
};

std::string toString(ApplyStatus status);

/**
 * Outcome of AccountStore::applyDelta. new_balance and new_version are only
 * meaningful when status is APPLIED.
 */
struct ApplyResult {
  ApplyStatus status = ApplyStatus::NOT_FOUND;
  Amount new_balance = 0;
  std::int64_t new_version = 0;

  bool applied() const { return status == ApplyStatus::APPLIED; }
};

/**
 * Checks a delta against an account's state and the account policy.
 * Returns APPLIED when the delta may be committed. Shared by every backend so
 * they reject the same things.
 */
ApplyStatus evaluateDelta(const Account& account, Amount delta, std::int64_t expected_version,
                          const config::AccountPolicy& policy);

/**
 * Durable mapping from account id to balance, frozen flag and version.
 * Implementations throw StoreUnavailable when they cannot be reached.
 */
class AccountStore {
 public:
  virtual ~AccountStore() = default;

  virtual std::optional<Account> get(const std::string& account_id) = 0;

  /**
   * The only balance mutator. Applies `delta` if the stored version still
   * equals `expected_version` and the policy allows it, bumping the version.
   * Never partially applies.
   */
  virtual ApplyResult applyDelta(const std::string& account_id, Amount delta,
                                 std::int64_t expected_version) = 0;

  /**
   * Opens an account with the given balance. False if the id is taken.
   */
  virtual bool createAccount(const std::string& account_id, Amount opening_balance) = 0;

  /**
   * Sets the frozen flag. False if the account does not exist.
   */
  virtual bool setFrozen(const std::string& account_id, bool frozen) = 0;
};

/**
 * In-memory account store. Used by tests and the demo server.
 */
class MemoryAccountStore : public AccountStore {
 public:
  explicit MemoryAccountStore(config::AccountPolicy policy = {});

  // Non-copyable
  MemoryAccountStore(const MemoryAccountStore&) = delete;
  MemoryAccountStore& operator=(const MemoryAccountStore&) = delete;

  std::optional<Account> get(const std::string& account_id) override;
  ApplyResult applyDelta(const std::string& account_id, Amount delta,
                         std::int64_t expected_version) override;
  bool createAccount(const std::string& account_id, Amount opening_balance) override;
  bool setFrozen(const std::string& account_id, bool frozen) override;

 private:
  config::AccountPolicy policy_;
  std::unordered_map<std::string, Account> accounts_;
  mutable std::shared_mutex mutex_;
};

}  // namespace storage
}  // namespace ledger

#endif  // ACCOUNT_STORE_HPP_
