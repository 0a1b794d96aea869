#include "money.hpp"
#include "ledger_types.hpp"

#include <gtest/gtest.h>

#include <limits>

using namespace ledger;

// Amount formatting tests
TEST(MoneyTest, FormatsMinorUnits) {
  EXPECT_EQ(formatAmount(0), "0.00");
  EXPECT_EQ(formatAmount(5), "0.05");
  EXPECT_EQ(formatAmount(1234), "12.34");
  EXPECT_EQ(formatAmount(-1234), "-12.34");
  EXPECT_EQ(formatAmount(100000), "1000.00");
}

TEST(MoneyTest, FormatsExtremes) {
  EXPECT_EQ(formatAmount(std::numeric_limits<Amount>::max()), "92233720368547758.07");
  EXPECT_EQ(formatAmount(std::numeric_limits<Amount>::min()), "-92233720368547758.08");
}

TEST(MoneyTest, ParsesDecimalStrings) {
  EXPECT_EQ(parseAmount("12"), Amount{1200});
  EXPECT_EQ(parseAmount("12.3"), Amount{1230});
  EXPECT_EQ(parseAmount("12.34"), Amount{1234});
  EXPECT_EQ(parseAmount("-0.01"), Amount{-1});
  EXPECT_EQ(parseAmount("+7.00"), Amount{700});
}

TEST(MoneyTest, RejectsMalformedAmounts) {
  EXPECT_FALSE(parseAmount(""));
  EXPECT_FALSE(parseAmount("."));
  EXPECT_FALSE(parseAmount("12."));
  EXPECT_FALSE(parseAmount(".50"));
  EXPECT_FALSE(parseAmount("1.234"));
  EXPECT_FALSE(parseAmount("1,00"));
  EXPECT_FALSE(parseAmount("abc"));
  EXPECT_FALSE(parseAmount("1e5"));
  EXPECT_FALSE(parseAmount("99999999999999999999"));
}

// State machine tests
TEST(TransactionStateTest, HappyPathTransitions) {
  EXPECT_TRUE(isValidTransition(TransactionStatus::INITIATED, TransactionStatus::DEBITED));
  EXPECT_TRUE(isValidTransition(TransactionStatus::DEBITED, TransactionStatus::CREDITED));
  EXPECT_TRUE(isValidTransition(TransactionStatus::CREDITED, TransactionStatus::SUCCESS));
}

TEST(TransactionStateTest, SideBranches) {
  EXPECT_TRUE(isValidTransition(TransactionStatus::INITIATED, TransactionStatus::BLOCKED_FRAUD));
  EXPECT_TRUE(isValidTransition(TransactionStatus::INITIATED, TransactionStatus::FAILED));
  EXPECT_TRUE(isValidTransition(TransactionStatus::DEBITED, TransactionStatus::DEEMED_APPROVED));
  EXPECT_TRUE(
      isValidTransition(TransactionStatus::DEEMED_APPROVED, TransactionStatus::CREDITED));
  EXPECT_TRUE(
      isValidTransition(TransactionStatus::DEEMED_APPROVED, TransactionStatus::REVERSED));
}

TEST(TransactionStateTest, TerminalStatesAreFinal) {
  const TransactionStatus all[] = {
      TransactionStatus::INITIATED,     TransactionStatus::DEBITED,
      TransactionStatus::CREDITED,      TransactionStatus::SUCCESS,
      TransactionStatus::BLOCKED_FRAUD, TransactionStatus::FAILED,
      TransactionStatus::DEEMED_APPROVED, TransactionStatus::REVERSED};

  for (auto from : {TransactionStatus::SUCCESS, TransactionStatus::BLOCKED_FRAUD,
                    TransactionStatus::FAILED, TransactionStatus::REVERSED}) {
    EXPECT_TRUE(isTerminal(from));
    for (auto to : all) {
      EXPECT_FALSE(isValidTransition(from, to)) << toString(from) << " -> " << toString(to);
    }
  }
  EXPECT_FALSE(isTerminal(TransactionStatus::DEEMED_APPROVED));
}

TEST(TransactionStateTest, SkippingStatesIsRejected) {
  EXPECT_FALSE(isValidTransition(TransactionStatus::INITIATED, TransactionStatus::SUCCESS));
  EXPECT_FALSE(isValidTransition(TransactionStatus::INITIATED, TransactionStatus::CREDITED));
  EXPECT_FALSE(isValidTransition(TransactionStatus::DEBITED, TransactionStatus::FAILED));
  EXPECT_FALSE(isValidTransition(TransactionStatus::DEBITED, TransactionStatus::REVERSED));
}

TEST(TransactionStateTest, NamesRoundTrip) {
  EXPECT_EQ(parseTransactionStatus("DEEMED_APPROVED"), TransactionStatus::DEEMED_APPROVED);
  EXPECT_EQ(parseRiskVerdict("BLOCK"), RiskVerdict::BLOCK);
  EXPECT_EQ(parseDirection("CREDIT"), Direction::CREDIT);
  EXPECT_EQ(parseEventType(toString(EventType::REVERSED)), EventType::REVERSED);
  EXPECT_FALSE(parseRiskVerdict("MAYBE"));
}

TEST(TimestampTest, EpochMicrosRoundTrip) {
  Timestamp now = Clock::now();
  std::int64_t micros = toEpochMicros(now);
  EXPECT_EQ(toEpochMicros(fromEpochMicros(micros)), micros);
}
