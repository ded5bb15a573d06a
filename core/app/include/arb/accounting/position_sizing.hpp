#pragma once

namespace arb {
namespace accounting {

/// Largest fraction of capital the Kelly sizer will ever commit.
constexpr double kMaxKellyFraction = 0.10;

// -----------------------------------------------------------------------------
// kellyPositionSize()
// -----------------------------------------------------------------------------
//
// @brief  Kelly-criterion position size with a hard 10% cap.
//
// @details
//   fraction = (p * avg_win - (1 - p) * avg_loss) / avg_loss
//   result   = capital * clamp(fraction, 0, 0.10)
//
// Returns exactly 0 when avg_loss_amount == 0 or win_probability == 0.
// The result is never negative and never exceeds 10% of capital,
// whatever the edge.
// -----------------------------------------------------------------------------
double kellyPositionSize(double total_capital, double win_probability,
                         double avg_win_amount, double avg_loss_amount);

// -----------------------------------------------------------------------------
// riskAdjustedPositionSize()
// -----------------------------------------------------------------------------
//
// @brief  Sizing from expected return and volatility (both in bps),
//         bounded by a per-trade risk budget.
//
// @details
//   p        = clamp(e / (e + v), 0.1, 0.8)
//   fraction = clamp((p * e - (1 - p) * v) / e, 0, 0.25)
//   result   = min(capital * max_risk_pct / 100, capital * fraction)
//
// Returns 0 when expected_return_bps <= 0.
// -----------------------------------------------------------------------------
double riskAdjustedPositionSize(double available_capital_usd,
                                double max_risk_per_trade_pct,
                                double expected_return_bps,
                                double volatility_bps);

}  // namespace accounting
}  // namespace arb
