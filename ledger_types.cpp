#include "ledger_types.hpp"

namespace ledger {

std::int64_t toEpochMicros(Timestamp ts) {
  return std::chrono::duration_cast<std::chrono::microseconds>(ts.time_since_epoch()).count();
}

Timestamp fromEpochMicros(std::int64_t micros) {
  return Timestamp(std::chrono::duration_cast<Clock::duration>(std::chrono::microseconds(micros)));
}

std::string toString(Direction direction) {
  return direction == Direction::DEBIT ? "DEBIT" : "CREDIT";
}

std::string toString(TransactionStatus status) {
  switch (status) {
    case TransactionStatus::INITIATED: return "INITIATED";
    case TransactionStatus::DEBITED: return "DEBITED";
    case TransactionStatus::CREDITED: return "CREDITED";
    case TransactionStatus::SUCCESS: return "SUCCESS";
    case TransactionStatus::BLOCKED_FRAUD: return "BLOCKED_FRAUD";
    case TransactionStatus::FAILED: return "FAILED";
    case TransactionStatus::DEEMED_APPROVED: return "DEEMED_APPROVED";
    case TransactionStatus::REVERSED: return "REVERSED";
  }
  return "UNKNOWN";
}

std::string toString(RiskVerdict verdict) {
  switch (verdict) {
    case RiskVerdict::ALLOW: return "ALLOW";
    case RiskVerdict::CHALLENGE: return "CHALLENGE";
    case RiskVerdict::BLOCK: return "BLOCK";
  }
  return "UNKNOWN";
}

std::string toString(EventType type) {
  switch (type) {
    case EventType::RECEIVED: return "received";
    case EventType::SENT: return "sent";
    case EventType::FAILED: return "failed";
    case EventType::REVERSED: return "reversed";
  }
  return "unknown";
}

std::optional<Direction> parseDirection(const std::string& text) {
  if (text == "DEBIT") return Direction::DEBIT;
  if (text == "CREDIT") return Direction::CREDIT;
  return std::nullopt;
}

std::optional<TransactionStatus> parseTransactionStatus(const std::string& text) {
  static const TransactionStatus kAll[] = {
      TransactionStatus::INITIATED,     TransactionStatus::DEBITED,
      TransactionStatus::CREDITED,      TransactionStatus::SUCCESS,
      TransactionStatus::BLOCKED_FRAUD, TransactionStatus::FAILED,
      TransactionStatus::DEEMED_APPROVED, TransactionStatus::REVERSED};
  for (auto status : kAll) {
    if (toString(status) == text) return status;
  }
  return std::nullopt;
}

std::optional<RiskVerdict> parseRiskVerdict(const std::string& text) {
  if (text == "ALLOW" || text == "allow") return RiskVerdict::ALLOW;
  if (text == "CHALLENGE" || text == "challenge") return RiskVerdict::CHALLENGE;
  if (text == "BLOCK" || text == "block") return RiskVerdict::BLOCK;
  return std::nullopt;
}

std::optional<EventType> parseEventType(const std::string& text) {
  if (text == "received") return EventType::RECEIVED;
  if (text == "sent") return EventType::SENT;
  if (text == "failed") return EventType::FAILED;
  if (text == "reversed") return EventType::REVERSED;
  return std::nullopt;
}

bool isTerminal(TransactionStatus status) {
  switch (status) {
    case TransactionStatus::SUCCESS:
    case TransactionStatus::BLOCKED_FRAUD:
    case TransactionStatus::FAILED:
    case TransactionStatus::REVERSED:
      return true;
    default:
      return false;
  }
}

bool isValidTransition(TransactionStatus from, TransactionStatus to) {
  switch (from) {
    case TransactionStatus::INITIATED:
      return to == TransactionStatus::DEBITED ||
             to == TransactionStatus::BLOCKED_FRAUD ||
             to == TransactionStatus::FAILED;
    case TransactionStatus::DEBITED:
      return to == TransactionStatus::CREDITED ||
             to == TransactionStatus::DEEMED_APPROVED;
    case TransactionStatus::CREDITED:
      return to == TransactionStatus::SUCCESS;
    case TransactionStatus::DEEMED_APPROVED:
      return to == TransactionStatus::CREDITED ||
             to == TransactionStatus::REVERSED;
    default:
      return false;
  }
}

}  // namespace ledger
