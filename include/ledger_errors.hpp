#ifndef LEDGER_ERRORS_HPP_
#define LEDGER_ERRORS_HPP_

#include <stdexcept>
#include <string>

namespace ledger {

/**
 * Base class for infrastructure failures. Business outcomes (insufficient
 * balance, frozen account, duplicates) are reported through status values
 * instead.
 */
class LedgerError : public std::runtime_error {
 public:
  explicit LedgerError(const std::string& what) : std::runtime_error(what) {}
};

/**
 * The backing store could not be reached or did not answer in time.
 * On the credit leg this moves a transfer to DEEMED_APPROVED.
 */
class StoreUnavailable : public LedgerError {
 public:
  explicit StoreUnavailable(const std::string& what) : LedgerError(what) {}
};

/**
 * A per-account lock could not be acquired within the configured wait.
 */
class LockTimeout : public LedgerError {
 public:
  LockTimeout(const std::string& account_id, const std::string& what)
      : LedgerError(what), account_id_(account_id) {}

  const std::string& accountId() const { return account_id_; }

 private:
  std::string account_id_;
};

/**
 * A query was rejected by the database for a reason other than availability.
 */
class DatabaseError : public LedgerError {
 public:
  DatabaseError(const std::string& sql_state, const std::string& what)
      : LedgerError(what), sql_state_(sql_state) {}

  const std::string& sqlState() const { return sql_state_; }

 private:
  std::string sql_state_;
};

class ConfigError : public LedgerError {
 public:
  explicit ConfigError(const std::string& what) : LedgerError(what) {}
};

}  // namespace ledger

#endif  // LEDGER_ERRORS_HPP_
