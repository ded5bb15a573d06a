#pragma once

#include "arb/accounting/gas_estimator.hpp"
#include "arb/domain/reserve_pair.hpp"
#include "arb/domain/token.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <vector>

namespace arb {
namespace scoring {

constexpr std::size_t kFeatureCount = 7;

using NormalizedFeatures = std::array<double, kFeatureCount>;

// -----------------------------------------------------------------------------
// FeatureVector: raw inputs to the confidence scorer
// -----------------------------------------------------------------------------
//
//   spread_bps      composite spread of the route's legs
//   depth_usd       2 * reserve_in of the first leg, in USD
//   volatility      mid-price return stddev of the first pool, bps
//   size_tier       1..4 bucket of the candidate notional
//   gas_price_gwei  max fee per gas of the current estimate
//   time_of_day     UTC fractional hour [0, 24)
//   day_of_week     UTC, 0 = Sunday
// -----------------------------------------------------------------------------
struct FeatureVector {
  double spread_bps{0.0};
  double depth_usd{0.0};
  double volatility{0.0};
  double size_tier{1.0};
  double gas_price_gwei{0.0};
  double time_of_day{0.0};
  double day_of_week{0.0};
};

/// 1 for <= 100 USD, 2 for <= 500, 3 for <= 1000, 4 above.
int sizeTier(double notional_usd);

FeatureVector extractFeatures(const std::vector<domain::ReservePair>& legs,
                              const domain::TokenInfo& start_token,
                              double notional_usd,
                              const accounting::GasEstimate& gas,
                              double volatility_bps, std::int64_t now_ms);

/// [spread/1000, ln(depth)/20, vol/100, tier/4, gas/100, tod/24, dow/7];
/// the depth term is 0 for depth <= 1.
NormalizedFeatures normalizeFeatures(const FeatureVector& features);

/// Heuristic score in [0, 1]: importance-weighted sum of the normalized
/// features with volatility and gas entering as (1 - x).
double featureImportanceScore(const FeatureVector& features);

}  // namespace scoring
}  // namespace arb
