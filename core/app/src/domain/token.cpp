#include "arb/domain/token.hpp"

#include <cmath>

namespace arb {
namespace domain {

namespace {

// Native units per USD as a long double; keeps 64 bits of mantissa for
// 18-decimal tokens.
long double unitsPerUsd(const TokenInfo& token) {
  return std::pow(10.0L, static_cast<long double>(token.decimals)) /
         static_cast<long double>(token.usd_price);
}

}  // namespace

double toUsd(SignedAmount native, const TokenInfo& token) {
  const long double units = static_cast<long double>(native);
  return static_cast<double>(units / unitsPerUsd(token));
}

Amount fromUsdFloor(double usd, const TokenInfo& token) {
  if (!(usd > 0.0) || token.usd_price <= 0.0) {
    return 0;
  }
  const long double units = std::floor(usd * unitsPerUsd(token));
  return static_cast<Amount>(units);
}

Amount fromUsdCeil(double usd, const TokenInfo& token) {
  if (!(usd > 0.0) || token.usd_price <= 0.0) {
    return 0;
  }
  const long double units = std::ceil(usd * unitsPerUsd(token));
  return static_cast<Amount>(units);
}

}  // namespace domain
}  // namespace arb
