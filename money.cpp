#include "money.hpp"

#include <cctype>
#include <limits>

namespace ledger {

std::string formatAmount(Amount amount) {
  // Work on the unsigned magnitude so INT64_MIN formats correctly.
  bool negative = amount < 0;
  std::uint64_t magnitude = negative ? 0 - static_cast<std::uint64_t>(amount)
                                     : static_cast<std::uint64_t>(amount);

  std::uint64_t major = magnitude / kMinorUnitsPerMajor;
  std::uint64_t minor = magnitude % kMinorUnitsPerMajor;

  std::string text = negative ? "-" : "";
  text += std::to_string(major);
  text += '.';
  if (minor < 10) text += '0';
  text += std::to_string(minor);
  return text;
}

std::optional<Amount> parseAmount(const std::string& text) {
  if (text.empty()) return std::nullopt;

  size_t pos = 0;
  bool negative = false;
  if (text[pos] == '-' || text[pos] == '+') {
    negative = text[pos] == '-';
    ++pos;
  }

  constexpr Amount kMax = std::numeric_limits<Amount>::max();
  Amount major = 0;
  size_t major_digits = 0;
  while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
    int digit = text[pos] - '0';
    if (major > (kMax - digit) / 10) return std::nullopt;
    major = major * 10 + digit;
    ++major_digits;
    ++pos;
  }
  if (major_digits == 0) return std::nullopt;

  Amount minor = 0;
  if (pos < text.size() && text[pos] == '.') {
    ++pos;
    size_t fraction_digits = 0;
    while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
      if (++fraction_digits > 2) return std::nullopt;
      minor = minor * 10 + (text[pos] - '0');
      ++pos;
    }
    if (fraction_digits == 0) return std::nullopt;
    if (fraction_digits == 1) minor *= 10;
  }
  if (pos != text.size()) return std::nullopt;

  if (major > (kMax - minor) / kMinorUnitsPerMajor) return std::nullopt;
  Amount value = major * kMinorUnitsPerMajor + minor;
  return negative ? -value : value;
}

}  // namespace ledger
