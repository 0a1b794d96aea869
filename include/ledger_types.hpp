#ifndef LEDGER_TYPES_HPP_
#define LEDGER_TYPES_HPP_

#include "money.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace ledger {

using Clock = std::chrono::system_clock;
using Timestamp = Clock::time_point;

std::int64_t toEpochMicros(Timestamp ts);
Timestamp fromEpochMicros(std::int64_t micros);

/**
 * Current balance and state of one account. Owned by the account store and
 * mutated only while the account lock is held.
 */
struct Account {
  std::string account_id;
  Amount balance = 0;
  bool frozen = false;
  std::int64_t version = 0;
};

enum class Direction {
  DEBIT,
  CREDIT
};

/**
 * One immutable, signed movement of funds against one account for one
 * transaction leg. Unique on (txn_id, account_id, direction).
 */
struct LedgerEntry {
  std::int64_t entry_id = 0;   // assigned by the journal
  std::string txn_id;
  std::string account_id;
  Amount amount = 0;           // negative for DEBIT
  Direction direction = Direction::DEBIT;
  std::string counterparty_id;
  Amount balance_after = 0;
  std::optional<double> risk_score;
  Timestamp created_at{};      // assigned by the journal
};

enum class TransactionStatus {
  INITIATED,
  DEBITED,
  CREDITED,
  SUCCESS,
  BLOCKED_FRAUD,
  FAILED,
  DEEMED_APPROVED,
  REVERSED
};

enum class RiskVerdict {
  ALLOW,
  CHALLENGE,
  BLOCK
};

/**
 * The orchestrator's working record for one transfer.
 */
struct Transaction {
  std::string txn_id;
  std::string payer_id;
  std::string payee_id;
  Amount amount = 0;
  TransactionStatus status = TransactionStatus::INITIATED;
  RiskVerdict verdict = RiskVerdict::ALLOW;
  std::optional<double> risk_score;
  std::string message;
  int credit_attempts = 0;
  Timestamp created_at{};
  Timestamp updated_at{};
};

/**
 * Transfer request as handed over by the switch. Verdict and score come from
 * the fraud subsystem and are taken as given.
 */
struct TransferRequest {
  std::string txn_id;  // idempotency key; generated when empty
  std::string payer_id;
  std::string payee_id;
  Amount amount = 0;
  RiskVerdict verdict = RiskVerdict::ALLOW;
  std::optional<double> risk_score;
  std::string caller_id;
};

struct TransferResult {
  std::string txn_id;
  TransactionStatus status = TransactionStatus::INITIATED;
  std::optional<double> risk_score;
  std::string message;
  bool retryable = false;  // set when the caller should resubmit the same txn_id
};

enum class EventType {
  RECEIVED,
  SENT,
  FAILED,
  REVERSED
};

struct NotificationEvent {
  EventType event_type = EventType::SENT;
  std::string txn_id;
  std::string target_id;  // partition key
  std::string counterparty_id;
  Amount amount = 0;
  std::optional<Amount> balance_after;
  Timestamp timestamp{};
  std::string message;
};

std::string toString(Direction direction);
std::string toString(TransactionStatus status);
std::string toString(RiskVerdict verdict);
std::string toString(EventType type);

std::optional<Direction> parseDirection(const std::string& text);
std::optional<TransactionStatus> parseTransactionStatus(const std::string& text);
std::optional<RiskVerdict> parseRiskVerdict(const std::string& text);
std::optional<EventType> parseEventType(const std::string& text);

/**
 * True for states no transition may leave. DEEMED_APPROVED is not terminal.
 */
bool isTerminal(TransactionStatus status);

/**
 * The transfer state machine: INITIATED -> DEBITED -> CREDITED -> SUCCESS,
 * INITIATED -> BLOCKED_FRAUD | FAILED, DEBITED -> DEEMED_APPROVED,
 * DEEMED_APPROVED -> CREDITED | REVERSED.
 */
bool isValidTransition(TransactionStatus from, TransactionStatus to);

}  // namespace ledger

#endif  // LEDGER_TYPES_HPP_
