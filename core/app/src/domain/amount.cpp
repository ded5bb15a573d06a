#include "arb/domain/amount.hpp"

#include <algorithm>
#include <stdexcept>

namespace arb {
namespace domain {

std::string toString(Amount value) {
  if (value == 0) {
    return "0";
  }
  std::string digits;
  while (value > 0) {
    digits.push_back(static_cast<char>('0' + static_cast<int>(value % 10)));
    value /= 10;
  }
  std::reverse(digits.begin(), digits.end());
  return digits;
}

std::string toString(SignedAmount value) {
  if (value >= 0) {
    return toString(static_cast<Amount>(value));
  }
  // Negate in unsigned space so the minimum value does not overflow.
  Amount magnitude = static_cast<Amount>(0) - static_cast<Amount>(value);
  return "-" + toString(magnitude);
}

Amount parseAmount(const std::string& text) {
  if (text.empty()) {
    throw std::invalid_argument("empty amount");
  }
  constexpr Amount kMax = ~static_cast<Amount>(0);
  Amount value = 0;
  for (char c : text) {
    if (c < '0' || c > '9') {
      throw std::invalid_argument("non-digit in amount: " + text);
    }
    const Amount digit = static_cast<Amount>(c - '0');
    if (value > (kMax - digit) / 10) {
      throw std::out_of_range("amount exceeds 128 bits: " + text);
    }
    value = value * 10 + digit;
  }
  return value;
}

Amount pow10(unsigned decimals) {
  if (decimals > 38) {
    throw std::out_of_range("10^" + std::to_string(decimals) +
                            " exceeds 128 bits");
  }
  Amount result = 1;
  for (unsigned i = 0; i < decimals; ++i) {
    result *= 10;
  }
  return result;
}

}  // namespace domain
}  // namespace arb
