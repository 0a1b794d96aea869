#ifndef MONEY_HPP_
#define MONEY_HPP_

#include <cstdint>
#include <optional>
#include <string>

namespace ledger {

// Fixed-point amount in minor currency units (paise). Signed so ledger
// entries can carry debits as negative movements.
using Amount = std::int64_t;

constexpr Amount kMinorUnitsPerMajor = 100;

/**
 * Formats an amount as "<major>.<2-digit minor>", e.g. -1234 -> "-12.34".
 */
std::string formatAmount(Amount amount);

/**
 * Parses "12", "12.3" or "12.34" (optionally signed) into minor units.
 * Returns empty on malformed input, more than two fractional digits or overflow.
 */
std::optional<Amount> parseAmount(const std::string& text);

}  // namespace ledger

#endif  // MONEY_HPP_
