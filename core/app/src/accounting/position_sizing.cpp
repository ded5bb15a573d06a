#include "arb/accounting/position_sizing.hpp"

#include <algorithm>
#include <cmath>

namespace arb {
namespace accounting {

double kellyPositionSize(double total_capital, double win_probability,
                         double avg_win_amount, double avg_loss_amount) {
  if (avg_loss_amount == 0.0 || win_probability == 0.0) {
    return 0.0;
  }
  if (!(total_capital > 0.0)) {
    return 0.0;
  }

  const double kelly_fraction =
      (win_probability * avg_win_amount -
       (1.0 - win_probability) * avg_loss_amount) /
      avg_loss_amount;

  // NaN (e.g. infinite inputs) falls through to 0.
  if (std::isnan(kelly_fraction)) {
    return 0.0;
  }
  const double capped = std::max(0.0, std::min(kMaxKellyFraction,
                                               kelly_fraction));
  return total_capital * capped;
}

double riskAdjustedPositionSize(double available_capital_usd,
                                double max_risk_per_trade_pct,
                                double expected_return_bps,
                                double volatility_bps) {
  if (!(expected_return_bps > 0.0)) {
    return 0.0;
  }
  const double max_risk_usd =
      available_capital_usd * (max_risk_per_trade_pct / 100.0);

  const double win_probability = std::min(
      0.8, std::max(0.1, expected_return_bps /
                             (expected_return_bps + volatility_bps)));
  const double kelly_fraction =
      (win_probability * expected_return_bps -
       (1.0 - win_probability) * volatility_bps) /
      expected_return_bps;

  const double kelly_size =
      available_capital_usd * std::max(0.0, std::min(kelly_fraction, 0.25));
  return std::min(max_risk_usd, kelly_size);
}

}  // namespace accounting
}  // namespace arb
