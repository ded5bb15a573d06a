#pragma once

#include "arb/accounting/i_fee_oracle.hpp"
#include "arb/domain/amount.hpp"

#include <cstdint>

namespace arb {
namespace accounting {

constexpr std::uint64_t kGwei = 1000000000ULL;

struct GasEstimatorConfig {
  /// Gas for approve + three swaps before the safety multiplier.
  std::uint64_t base_gas_limit{350000};
  double multiplier{1.1};
  /// USD price of the chain's native gas token.
  double native_price_usd{2000.0};
  /// USD cost assumed when the fee oracle is unavailable.
  double fallback_cost_usd{40.0};
};

struct GasEstimate {
  std::uint64_t gas_limit{0};
  std::uint64_t max_fee_per_gas{0};
  std::uint64_t max_priority_fee_per_gas{0};
  domain::Amount cost_wei{0};
  double cost_usd{0.0};
  bool is_fallback{false};

  double maxFeeGwei() const {
    return static_cast<double>(max_fee_per_gas) / static_cast<double>(kGwei);
  }
};

enum class Congestion { Low, Medium, High };
enum class Urgency { Low, Medium, High };

const char* toString(Congestion congestion);

struct GasPriceTrends {
  std::uint64_t current{0};
  std::uint64_t fast{0};
  std::uint64_t safe{0};
  Congestion congestion{Congestion::Medium};
};

// -----------------------------------------------------------------------------
// GasEstimator
// -----------------------------------------------------------------------------
//
// @brief  Turns the network fee level into a conservative cost for one
//         arbitrage transaction.
//
// @details
// estimate():
//   gas_limit = floor(base_gas_limit * multiplier)
//   max_fee   = oracle max fee, or 30 gwei when not reported
//   priority  = oracle priority fee, or 2 gwei when not reported
//   cost_wei  = gas_limit * max_fee
//   cost_usd  = cost_wei / 1e18 * native_price_usd
//
// When the oracle returns std::nullopt or throws, a fixed fallback is
// returned instead: 400000 gas at 50 gwei, 0.02 native, and
// fallback_cost_usd. The failure never propagates; skipping an
// opportunity on an inflated cost is preferred to trading on an unknown
// cost basis.
//
// Thread model: not internally synchronized; owned and called by the
// scan loop.
// Ownership: does not own the oracle; it must outlive the estimator.
// -----------------------------------------------------------------------------
class GasEstimator {
 public:
  GasEstimator(IFeeOracle& oracle, GasEstimatorConfig config);

  GasEstimate estimate();

  /// Current/fast/safe gas price and a congestion bucket. Falls back to
  /// 25/35/30 gwei, medium congestion, when the oracle is unavailable.
  GasPriceTrends gasPriceTrends();

  /// Returns the fixed fallback estimate.
  GasEstimate fallbackEstimate() const;

  const GasEstimatorConfig& config() const { return config_; }

 private:
  std::optional<FeeData> queryOracle();

  IFeeOracle& oracle_;
  GasEstimatorConfig config_;
};

/// Gas price scaled for urgency, volatility and margin, capped at 2x.
std::uint64_t dynamicGasPrice(std::uint64_t base_gas_price, Urgency urgency,
                              double market_volatility,
                              double profit_margin_bps);

/// gas / profit <= max_gas_ratio; false for non-positive profit.
bool isGasCostAcceptable(double gas_cost_usd, double expected_profit_usd,
                         double max_gas_ratio = 0.3);

}  // namespace accounting
}  // namespace arb
