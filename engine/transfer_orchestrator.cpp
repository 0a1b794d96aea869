#include "engine/transfer_orchestrator.hpp"

#include "ledger_errors.hpp"
#include "observability/logger.hpp"
#include "observability/metrics.hpp"

#include <iomanip>
#include <limits>
#include <random>
#include <sstream>

namespace ledger {
namespace engine {

namespace {

const char* const kMsgSuccess = "Transfer successful";
const char* const kMsgInsufficient = "Insufficient balance";
const char* const kMsgNotFound = "Account not found";
const char* const kMsgPayerFrozen = "Account is frozen";
const char* const kMsgPayeeFrozen = "Beneficiary account is frozen";
const char* const kMsgConflict = "Account was updated concurrently; transfer not processed";
const char* const kMsgOverflow = "Amount exceeds the account balance limit";
const char* const kMsgBlocked = "Transaction blocked by fraud check";
const char* const kMsgDebited = "Amount debited from payer";
const char* const kMsgCredited = "Amount credited to payee";
const char* const kMsgDeemed = "Credit to beneficiary pending confirmation; the transfer will be "
                               "completed or reversed";
const char* const kMsgReversed = "Transfer reversed; amount refunded to payer";
const char* const kMsgBusy = "Accounts are busy; the transfer will be retried";
const char* const kMsgUnavailable = "Temporarily unable to process the transfer; it will be retried";
const char* const kMsgIdReused = "Transaction id already used for a different transfer";

const char* const kReversalPrefix = "REVERSAL:";

std::string validate(const TransferRequest& request) {
  if (request.payer_id.empty() || request.payee_id.empty()) {
    return "Payer and payee are required";
  }
  if (request.payer_id == request.payee_id) {
    return "Payer and payee must differ";
  }
  if (request.amount <= 0) {
    return "Amount must be positive";
  }
  return "";
}

}  // namespace

TransferOrchestrator::TransferOrchestrator(storage::AccountStore& accounts,
                                           storage::LedgerJournal& journal,
                                           storage::TransactionStore& transactions,
                                           concurrent::LockManager& locks,
                                           notify::EventPublisher* publisher,
                                           config::LockingConfig locking,
                                           config::AccountPolicy policy,
                                           storage::LedgerWriter* writer)
    : accounts_(accounts),
      journal_(journal),
      transactions_(transactions),
      locks_(locks),
      publisher_(publisher),
      sequential_writer_(accounts, journal),
      writer_(writer ? writer : &sequential_writer_),
      guard_(journal),
      locking_(locking),
      policy_(policy) {
}

TransferResult TransferOrchestrator::resultOf(const Transaction& txn) {
  TransferResult result;
  result.txn_id = txn.txn_id;
  result.status = txn.status;
  result.risk_score = txn.risk_score;
  result.message = txn.message;
  return result;
}

std::string TransferOrchestrator::generateTxnId() {
  thread_local std::mt19937_64 generator(std::random_device{}());
  std::stringstream ss;
  ss << "TXN" << std::hex << std::setfill('0') << std::setw(16) << generator()
     << std::setw(8) << (generator() & 0xffffffffULL);
  return ss.str();
}

TransferResult TransferOrchestrator::transfer(const TransferRequest& request) {
  observability::MetricsCollector::Timer timer(observability::getGlobalMetrics(),
                                               "ledger_transfer_duration_seconds");

  Transaction initial;
  initial.txn_id = request.txn_id.empty() ? generateTxnId() : request.txn_id;
  initial.payer_id = request.payer_id;
  initial.payee_id = request.payee_id;
  initial.amount = request.amount;
  initial.verdict = request.verdict;
  initial.risk_score = request.risk_score;
  initial.status = TransactionStatus::INITIATED;

  TransferResult result;
  std::string invalid = validate(request);
  if (!invalid.empty()) {
    result.txn_id = initial.txn_id;
    result.status = TransactionStatus::FAILED;
    result.risk_score = request.risk_score;
    result.message = invalid;
    recordOutcome(result, request);
    return result;
  }

  try {
    result = process(initial);
  } catch (const StoreUnavailable& e) {
    LEDGER_LOG_BUILDER(WARN, "Store unavailable during transfer")
        .correlation(initial.txn_id)
        .field("error", e.what());
    result.txn_id = initial.txn_id;
    result.status = TransactionStatus::INITIATED;
    result.risk_score = request.risk_score;
    result.message = kMsgUnavailable;
    result.retryable = true;
  }

  recordOutcome(result, request);
  return result;
}

TransferResult TransferOrchestrator::process(const Transaction& initial) {
  auto inserted = transactions_.insertIfAbsent(initial);
  Transaction txn = inserted.first;

  if (!inserted.second) {
    if (txn.payer_id != initial.payer_id || txn.payee_id != initial.payee_id ||
        txn.amount != initial.amount) {
      LEDGER_LOG_BUILDER(WARN, "Transaction id reused with different details")
          .correlation(txn.txn_id);
      TransferResult mismatch;
      mismatch.txn_id = txn.txn_id;
      mismatch.status = TransactionStatus::FAILED;
      mismatch.risk_score = initial.risk_score;
      mismatch.message = kMsgIdReused;
      return mismatch;
    }
    if (isTerminal(txn.status) || txn.status == TransactionStatus::DEEMED_APPROVED) {
      LEDGER_LOG_BUILDER(INFO, "Replayed transfer")
          .correlation(txn.txn_id)
          .field("status", toString(txn.status));
      return resultOf(txn);
    }
  }

  // Both legs already in the journal: nothing to move, only the record may lag.
  if (guard_.check(txn.txn_id, txn.payer_id, txn.payee_id).complete()) {
    LockedOutcome out;
    complete(txn, std::nullopt, std::nullopt, out);
    publishAll(out.events);
    return out.result;
  }

  if (txn.verdict == RiskVerdict::BLOCK) {
    LockedOutcome out;
    if (advance(txn, TransactionStatus::BLOCKED_FRAUD, kMsgBlocked)) {
      out.events.push_back(makeEvent(EventType::FAILED, txn, txn.payer_id, txn.payee_id,
                                     std::nullopt, kMsgBlocked));
    }
    publishAll(out.events);
    return resultOf(txn);
  }

  int attempts = locking_.lock_attempts < 1 ? 1 : locking_.lock_attempts;
  for (int attempt = 1; attempt <= attempts; ++attempt) {
    try {
      LockedOutcome out = locks_.withLocks({txn.payer_id, txn.payee_id},
                                           [&] { return executeLocked(txn.txn_id); });
      publishAll(out.events);
      return out.result;
    } catch (const LockTimeout& e) {
      LEDGER_LOG_BUILDER(WARN, "Lock attempt failed")
          .correlation(txn.txn_id)
          .field("attempt", attempt)
          .field("error", e.what());
    }
  }

  TransferResult busy = resultOf(txn);
  busy.status = TransactionStatus::INITIATED;
  busy.message = kMsgBusy;
  busy.retryable = true;
  return busy;
}

TransferOrchestrator::LockedOutcome TransferOrchestrator::executeLocked(
    const std::string& txn_id) {
  LockedOutcome out;
  auto current = transactions_.get(txn_id);
  if (!current) {
    throw LedgerError("Transfer record " + txn_id + " disappeared");
  }
  Transaction txn = *current;

  // A concurrent request with the same id may have finished while we waited.
  if (isTerminal(txn.status) || txn.status == TransactionStatus::DEEMED_APPROVED) {
    out.result = resultOf(txn);
    return out;
  }

  LegsRecorded legs = guard_.check(txn.txn_id, txn.payer_id, txn.payee_id);
  if (legs.complete()) {
    complete(txn, std::nullopt, std::nullopt, out);
    return out;
  }

  std::optional<Amount> payer_balance;
  if (legs.debit_recorded) {
    // An earlier attempt debited the payer but never got to the credit.
    if (txn.status == TransactionStatus::INITIATED &&
        !advance(txn, TransactionStatus::DEBITED, kMsgDebited)) {
      out.result = resultOf(txn);
      return out;
    }
  } else if (!debitPayer(txn, out, payer_balance)) {
    return out;
  }

  creditLeg(txn, payer_balance, out);
  return out;
}

bool TransferOrchestrator::debitPayer(Transaction& txn, LockedOutcome& out,
                                      std::optional<Amount>& payer_balance) {
  auto payer = accounts_.get(txn.payer_id);
  auto payee = accounts_.get(txn.payee_id);
  if (!payer || !payee) {
    fail(txn, kMsgNotFound, out);
    return false;
  }
  if (payee->frozen && policy_.frozen_credit == config::FrozenCreditPolicy::BLOCK) {
    fail(txn, kMsgPayeeFrozen, out);
    return false;
  }
  if (payee->balance > std::numeric_limits<Amount>::max() - txn.amount) {
    fail(txn, kMsgOverflow, out);
    return false;
  }

  LedgerEntry entry = makeEntry(txn, txn.payer_id, -txn.amount, Direction::DEBIT, txn.payee_id);
  storage::PostResult debit;
  for (int attempt = 0;; ++attempt) {
    debit = writer_->post(txn.payer_id, -txn.amount, payer->version, entry);
    if (debit.apply.status != storage::ApplyStatus::VERSION_CONFLICT ||
        attempt >= locking_.max_version_retries) {
      break;
    }
    payer = accounts_.get(txn.payer_id);
    if (!payer) {
      debit.apply.status = storage::ApplyStatus::NOT_FOUND;
      break;
    }
  }

  switch (debit.apply.status) {
    case storage::ApplyStatus::APPLIED:
      break;
    case storage::ApplyStatus::INSUFFICIENT_BALANCE:
      fail(txn, kMsgInsufficient, out);
      return false;
    case storage::ApplyStatus::FROZEN:
      fail(txn, kMsgPayerFrozen, out);
      return false;
    case storage::ApplyStatus::NOT_FOUND:
      fail(txn, kMsgNotFound, out);
      return false;
    case storage::ApplyStatus::VERSION_CONFLICT:
      fail(txn, kMsgConflict, out);
      return false;
    case storage::ApplyStatus::BALANCE_OVERFLOW:
      fail(txn, kMsgOverflow, out);
      return false;
  }

  if (debit.posted()) {
    payer_balance = debit.apply.new_balance;
  }

  if (!advance(txn, TransactionStatus::DEBITED, kMsgDebited)) {
    out.result = resultOf(txn);
    return false;
  }
  return true;
}

void TransferOrchestrator::creditLeg(Transaction& txn, std::optional<Amount> payer_balance,
                                     LockedOutcome& out) {
  CreditLeg credit = creditPayee(txn);

  switch (credit.outcome) {
    case CreditOutcome::CREDITED:
      complete(txn, payer_balance, credit.balance_after, out);
      return;

    case CreditOutcome::UNAVAILABLE:
      if (advance(txn, TransactionStatus::DEEMED_APPROVED, kMsgDeemed)) {
        txn.credit_attempts = transactions_.recordCreditAttempt(txn.txn_id);
        observability::getGlobalMetrics().incrementCounter("ledger_deemed_approved_total");
        LEDGER_LOG_BUILDER(WARN, "Credit leg unavailable; transfer deemed approved")
            .correlation(txn.txn_id)
            .field("reason", credit.reason);
      }
      out.result = resultOf(txn);
      return;

    case CreditOutcome::REJECTED:
      LEDGER_LOG_BUILDER(WARN, "Credit rejected after debit; reversing")
          .correlation(txn.txn_id)
          .field("reason", credit.reason);
      if (advance(txn, TransactionStatus::DEEMED_APPROVED, credit.reason)) {
        reversePayer(txn, out);
      }
      out.result = resultOf(txn);
      return;
  }
}

TransferOrchestrator::CreditLeg TransferOrchestrator::creditPayee(const Transaction& txn) {
  CreditLeg leg;
  try {
    if (journal_.exists(txn.txn_id, txn.payee_id, Direction::CREDIT)) {
      leg.outcome = CreditOutcome::CREDITED;
      return leg;
    }

    for (int attempt = 0; attempt <= locking_.max_version_retries; ++attempt) {
      auto payee = accounts_.get(txn.payee_id);
      if (!payee) {
        leg.outcome = CreditOutcome::REJECTED;
        leg.reason = "Beneficiary account not found";
        return leg;
      }

      LedgerEntry entry =
          makeEntry(txn, txn.payee_id, txn.amount, Direction::CREDIT, txn.payer_id);
      storage::PostResult credit = writer_->post(txn.payee_id, txn.amount, payee->version, entry);
      switch (credit.apply.status) {
        case storage::ApplyStatus::VERSION_CONFLICT:
          continue;
        case storage::ApplyStatus::FROZEN:
          leg.outcome = CreditOutcome::REJECTED;
          leg.reason = kMsgPayeeFrozen;
          return leg;
        case storage::ApplyStatus::NOT_FOUND:
        case storage::ApplyStatus::INSUFFICIENT_BALANCE:
        case storage::ApplyStatus::BALANCE_OVERFLOW:
          leg.outcome = CreditOutcome::REJECTED;
          leg.reason =
              "Beneficiary account rejected the credit: " + storage::toString(credit.apply.status);
          return leg;
        case storage::ApplyStatus::APPLIED:
          break;
      }

      leg.outcome = CreditOutcome::CREDITED;
      if (credit.posted()) {
        leg.balance_after = credit.apply.new_balance;
      }
      return leg;
    }

    leg.outcome = CreditOutcome::UNAVAILABLE;
    leg.reason = "Beneficiary account kept changing";
    return leg;
  } catch (const StoreUnavailable& e) {
    leg.outcome = CreditOutcome::UNAVAILABLE;
    leg.reason = e.what();
    return leg;
  }
}

bool TransferOrchestrator::reversePayer(Transaction& txn, LockedOutcome& out) {
  std::optional<Amount> refunded_balance;

  if (!journal_.exists(txn.txn_id, txn.payer_id, Direction::CREDIT)) {
    bool refunded = false;
    for (int attempt = 0; attempt <= locking_.max_version_retries && !refunded; ++attempt) {
      auto payer = accounts_.get(txn.payer_id);
      if (!payer) {
        LEDGER_LOG_BUILDER(ERROR, "Cannot reverse transfer; payer account missing")
            .correlation(txn.txn_id);
        return false;
      }

      LedgerEntry entry = makeEntry(txn, txn.payer_id, txn.amount, Direction::CREDIT,
                                    kReversalPrefix + txn.payee_id);
      storage::PostResult credit = writer_->post(txn.payer_id, txn.amount, payer->version, entry);
      if (credit.apply.status == storage::ApplyStatus::VERSION_CONFLICT) {
        continue;
      }
      if (!credit.apply.applied()) {
        LEDGER_LOG_BUILDER(WARN, "Reversal deferred")
            .correlation(txn.txn_id)
            .field("reason", storage::toString(credit.apply.status));
        return false;
      }
      if (credit.posted()) {
        refunded_balance = credit.apply.new_balance;
      }
      refunded = true;
    }
    if (!refunded) {
      LEDGER_LOG_BUILDER(WARN, "Reversal deferred")
          .correlation(txn.txn_id)
          .field("reason", "version conflicts");
      return false;
    }
  }

  if (!advance(txn, TransactionStatus::REVERSED, kMsgReversed)) {
    return false;
  }
  observability::getGlobalMetrics().incrementCounter("ledger_reversals_total");
  out.events.push_back(makeEvent(EventType::REVERSED, txn, txn.payer_id, txn.payee_id,
                                 refunded_balance, kMsgReversed));
  out.result = resultOf(txn);
  return true;
}

void TransferOrchestrator::complete(Transaction& txn, std::optional<Amount> payer_balance,
                                    std::optional<Amount> payee_balance, LockedOutcome& out) {
  if (txn.status == TransactionStatus::INITIATED) {
    advance(txn, TransactionStatus::DEBITED, kMsgDebited);
  }
  if (txn.status == TransactionStatus::DEBITED ||
      txn.status == TransactionStatus::DEEMED_APPROVED) {
    advance(txn, TransactionStatus::CREDITED, kMsgCredited);
  }
  if (txn.status == TransactionStatus::CREDITED &&
      advance(txn, TransactionStatus::SUCCESS, kMsgSuccess)) {
    out.events.push_back(makeEvent(EventType::SENT, txn, txn.payer_id, txn.payee_id,
                                   payer_balance, kMsgSuccess));
    out.events.push_back(makeEvent(EventType::RECEIVED, txn, txn.payee_id, txn.payer_id,
                                   payee_balance, kMsgSuccess));
  }
  out.result = resultOf(txn);
}

void TransferOrchestrator::fail(Transaction& txn, const std::string& message,
                                LockedOutcome& out) {
  if (advance(txn, TransactionStatus::FAILED, message)) {
    out.events.push_back(
        makeEvent(EventType::FAILED, txn, txn.payer_id, txn.payee_id, std::nullopt, message));
  }
  out.result = resultOf(txn);
}

std::optional<TransferResult> TransferOrchestrator::resolveDeemedApproved(
    const std::string& txn_id, const GiveUpPolicy& give_up) {
  auto record = transactions_.get(txn_id);
  if (!record) {
    return std::nullopt;
  }
  if (record->status != TransactionStatus::DEEMED_APPROVED) {
    return resultOf(*record);
  }

  LockedOutcome out = locks_.withLocks({record->payer_id, record->payee_id},
                                       [&] { return resolveLocked(txn_id, give_up); });
  publishAll(out.events);
  return out.result;
}

TransferOrchestrator::LockedOutcome TransferOrchestrator::resolveLocked(
    const std::string& txn_id, const GiveUpPolicy& give_up) {
  LockedOutcome out;
  auto current = transactions_.get(txn_id);
  if (!current) {
    throw LedgerError("Transfer record " + txn_id + " disappeared");
  }
  Transaction txn = *current;
  out.result = resultOf(txn);
  if (txn.status != TransactionStatus::DEEMED_APPROVED) {
    return out;
  }

  CreditLeg credit = creditPayee(txn);
  switch (credit.outcome) {
    case CreditOutcome::CREDITED:
      complete(txn, std::nullopt, credit.balance_after, out);
      break;

    case CreditOutcome::REJECTED:
      LEDGER_LOG_BUILDER(WARN, "Beneficiary permanently invalid; reversing")
          .correlation(txn.txn_id)
          .field("reason", credit.reason);
      reversePayer(txn, out);
      break;

    case CreditOutcome::UNAVAILABLE: {
      int attempts = transactions_.recordCreditAttempt(txn.txn_id);
      txn.credit_attempts = attempts;
      if (give_up && give_up(txn, attempts)) {
        LEDGER_LOG_BUILDER(WARN, "Beneficiary unreachable; reversing")
            .correlation(txn.txn_id)
            .field("credit_attempts", attempts);
        reversePayer(txn, out);
      }
      break;
    }
  }

  out.result = resultOf(txn);
  return out;
}

bool TransferOrchestrator::advance(Transaction& txn, TransactionStatus to,
                                   const std::string& message) {
  if (transactions_.transition(txn.txn_id, txn.status, to, message)) {
    txn.status = to;
    txn.message = message;
    return true;
  }

  LEDGER_LOG_BUILDER(WARN, "Transfer changed state concurrently")
      .correlation(txn.txn_id)
      .field("expected", toString(txn.status))
      .field("target", toString(to));
  auto current = transactions_.get(txn.txn_id);
  if (current) {
    txn = *current;
  }
  return false;
}

LedgerEntry TransferOrchestrator::makeEntry(const Transaction& txn, const std::string& account_id,
                                            Amount amount, Direction direction,
                                            const std::string& counterparty) const {
  LedgerEntry entry;
  entry.txn_id = txn.txn_id;
  entry.account_id = account_id;
  entry.amount = amount;
  entry.direction = direction;
  entry.counterparty_id = counterparty;
  entry.risk_score = txn.risk_score;
  return entry;
}

NotificationEvent TransferOrchestrator::makeEvent(EventType type, const Transaction& txn,
                                                  const std::string& target,
                                                  const std::string& counterparty,
                                                  std::optional<Amount> balance,
                                                  const std::string& message) const {
  NotificationEvent event;
  event.event_type = type;
  event.txn_id = txn.txn_id;
  event.target_id = target;
  event.counterparty_id = counterparty;
  event.amount = txn.amount;
  event.balance_after = balance;
  event.timestamp = Clock::now();
  event.message = message;
  return event;
}

void TransferOrchestrator::publishAll(const std::vector<NotificationEvent>& events) {
  if (!publisher_) return;
  for (const auto& event : events) {
    publisher_->publish(event);
  }
}

void TransferOrchestrator::recordOutcome(const TransferResult& result,
                                         const TransferRequest& request) {
  observability::getGlobalMetrics().incrementCounter("ledger_transfers_total",
                                                     {{"status", toString(result.status)}});

  LEDGER_LOG_BUILDER(INFO, "Transfer processed")
      .correlation(result.txn_id)
      .field("payer", observability::maskAccountId(request.payer_id))
      .field("payee", observability::maskAccountId(request.payee_id))
      .field("amount", formatAmount(request.amount))
      .field("verdict", toString(request.verdict))
      .field("status", toString(result.status))
      .field("retryable", result.retryable);
}

}  // namespace engine
}  // namespace ledger
