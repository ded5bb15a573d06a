#include "arb/accounting/gas_estimator.hpp"

#include <algorithm>
#include <cmath>
#include <exception>
#include <iostream>

namespace arb {
namespace accounting {

namespace {

constexpr std::uint64_t kDefaultMaxFee = 30 * kGwei;
constexpr std::uint64_t kDefaultPriorityFee = 2 * kGwei;
constexpr std::uint64_t kDefaultGasPrice = 20 * kGwei;
constexpr long double kWeiPerNative = 1e18L;

}  // namespace

const char* toString(Congestion congestion) {
  switch (congestion) {
    case Congestion::Low:    return "low";
    case Congestion::Medium: return "medium";
    case Congestion::High:   return "high";
  }
  return "unknown";
}

GasEstimator::GasEstimator(IFeeOracle& oracle, GasEstimatorConfig config)
    : oracle_(oracle), config_(config) {}

std::optional<FeeData> GasEstimator::queryOracle() {
  try {
    return oracle_.feeData();
  } catch (const std::exception& e) {
    std::cerr << "[GasEstimator] fee oracle failed: " << e.what() << "\n";
    return std::nullopt;
  }
}

GasEstimate GasEstimator::estimate() {
  const std::optional<FeeData> fees = queryOracle();
  if (!fees) {
    std::cerr << "[GasEstimator] fee data unavailable; using fallback of $"
              << config_.fallback_cost_usd << "\n";
    return fallbackEstimate();
  }

  GasEstimate est;
  est.gas_limit = static_cast<std::uint64_t>(
      std::floor(static_cast<double>(config_.base_gas_limit) *
                 config_.multiplier));
  est.max_fee_per_gas = fees->max_fee_per_gas.value_or(kDefaultMaxFee);
  est.max_priority_fee_per_gas =
      fees->max_priority_fee_per_gas.value_or(kDefaultPriorityFee);
  est.cost_wei = static_cast<domain::Amount>(est.gas_limit) *
                 static_cast<domain::Amount>(est.max_fee_per_gas);
  est.cost_usd = static_cast<double>(
      static_cast<long double>(est.cost_wei) / kWeiPerNative *
      static_cast<long double>(config_.native_price_usd));
  est.is_fallback = false;
  return est;
}

GasEstimate GasEstimator::fallbackEstimate() const {
  GasEstimate est;
  est.gas_limit = 400000;
  est.max_fee_per_gas = 50 * kGwei;
  est.max_priority_fee_per_gas = kDefaultPriorityFee;
  est.cost_wei = static_cast<domain::Amount>(20000000000000000ULL);  // 0.02
  est.cost_usd = config_.fallback_cost_usd;
  est.is_fallback = true;
  return est;
}

GasPriceTrends GasEstimator::gasPriceTrends() {
  const std::optional<FeeData> fees = queryOracle();
  GasPriceTrends trends;
  if (!fees) {
    trends.current = 25 * kGwei;
    trends.fast = 35 * kGwei;
    trends.safe = 30 * kGwei;
    trends.congestion = Congestion::Medium;
    return trends;
  }

  trends.current = fees->gas_price.value_or(kDefaultGasPrice);
  trends.fast = trends.current * 130 / 100;
  trends.safe = trends.current * 110 / 100;

  const double gwei =
      static_cast<double>(trends.current) / static_cast<double>(kGwei);
  if (gwei < 20.0) {
    trends.congestion = Congestion::Low;
  } else if (gwei < 50.0) {
    trends.congestion = Congestion::Medium;
  } else {
    trends.congestion = Congestion::High;
  }
  return trends;
}

std::uint64_t dynamicGasPrice(std::uint64_t base_gas_price, Urgency urgency,
                              double market_volatility,
                              double profit_margin_bps) {
  double multiplier = 1.0;
  switch (urgency) {
    case Urgency::Low:    multiplier = 1.05; break;
    case Urgency::Medium: multiplier = 1.15; break;
    case Urgency::High:   multiplier = 1.3;  break;
  }

  multiplier += market_volatility * 0.1;
  if (profit_margin_bps > 500.0) {
    multiplier += 0.1;
  }
  multiplier = std::min(multiplier, 2.0);

  return static_cast<std::uint64_t>(
      std::floor(static_cast<double>(base_gas_price) * multiplier));
}

bool isGasCostAcceptable(double gas_cost_usd, double expected_profit_usd,
                         double max_gas_ratio) {
  if (expected_profit_usd <= 0.0) {
    return false;
  }
  return gas_cost_usd / expected_profit_usd <= max_gas_ratio;
}

}  // namespace accounting
}  // namespace arb
