#include "arb/scoring/feature_vector.hpp"
#include "arb/amm/amm_math.hpp"
#include "arb/time/time_utils.hpp"

#include <algorithm>
#include <cmath>

namespace arb {
namespace scoring {

namespace {

constexpr std::array<double, kFeatureCount> kImportance = {
    0.3, 0.2, 0.15, 0.1, 0.1, 0.08, 0.07};

}  // namespace

int sizeTier(double notional_usd) {
  if (notional_usd <= 100.0) {
    return 1;
  }
  if (notional_usd <= 500.0) {
    return 2;
  }
  if (notional_usd <= 1000.0) {
    return 3;
  }
  return 4;
}

FeatureVector extractFeatures(const std::vector<domain::ReservePair>& legs,
                              const domain::TokenInfo& start_token,
                              double notional_usd,
                              const accounting::GasEstimate& gas,
                              double volatility_bps, std::int64_t now_ms) {
  FeatureVector features;

  std::vector<double> mids;
  mids.reserve(legs.size());
  for (const auto& leg : legs) {
    mids.push_back(amm::midPrice(leg.reserve_in, leg.reserve_out));
  }
  features.spread_bps = amm::compositeSpreadBps(mids);

  if (!legs.empty()) {
    features.depth_usd =
        2.0 * domain::toUsd(static_cast<domain::SignedAmount>(
                                legs.front().reserve_in),
                            start_token);
  }

  features.volatility = volatility_bps;
  features.size_tier = sizeTier(notional_usd);
  features.gas_price_gwei = gas.maxFeeGwei();
  features.time_of_day = utcFractionalHour(now_ms);
  features.day_of_week = utcDayOfWeek(now_ms);
  return features;
}

NormalizedFeatures normalizeFeatures(const FeatureVector& features) {
  const double depth_term =
      features.depth_usd > 1.0 ? std::log(features.depth_usd) / 20.0 : 0.0;
  return {features.spread_bps / 1000.0,
          depth_term,
          features.volatility / 100.0,
          features.size_tier / 4.0,
          features.gas_price_gwei / 100.0,
          features.time_of_day / 24.0,
          features.day_of_week / 7.0};
}

double featureImportanceScore(const FeatureVector& features) {
  NormalizedFeatures x = normalizeFeatures(features);
  // Higher volatility and gas lower the score.
  x[2] = 1.0 - x[2];
  x[4] = 1.0 - x[4];

  double score = 0.0;
  for (std::size_t i = 0; i < kFeatureCount; ++i) {
    score += kImportance[i] * x[i];
  }
  return std::clamp(score, 0.0, 1.0);
}

}  // namespace scoring
}  // namespace arb
