#pragma once

#include "arb/domain/amount.hpp"

#include <string>

namespace arb {
namespace domain {

// -----------------------------------------------------------------------------
// TokenInfo
// -----------------------------------------------------------------------------
//
// @brief  Static description of a token used to translate between native
//         units and USD.
//
// @details
// usd_price is a configured reference price, not a live quote. It is only
// used to size candidate notionals and to express native profit in USD;
// the profitability verdict itself is computed in native units of the
// route's start token.
// -----------------------------------------------------------------------------
struct TokenInfo {
  std::string symbol;
  unsigned decimals{18};
  double usd_price{1.0};
};

/// Native amount (possibly negative) expressed in USD.
double toUsd(SignedAmount native, const TokenInfo& token);

/// USD value converted to native units, rounded down. Non-positive -> 0.
Amount fromUsdFloor(double usd, const TokenInfo& token);

/// USD value converted to native units, rounded up. Used for costs so the
/// native net profit is never overstated.
Amount fromUsdCeil(double usd, const TokenInfo& token);

}  // namespace domain
}  // namespace arb
