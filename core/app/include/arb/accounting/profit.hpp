#pragma once

#include "arb/domain/amount.hpp"
#include "arb/domain/token.hpp"

namespace arb {
namespace accounting {

// -----------------------------------------------------------------------------
// ProfitCalculation: net-profit verdict for one candidate
// -----------------------------------------------------------------------------
//
// @details
// profit_margin_bps is net / trade size * 10000 and is defined as 0 for a
// zero-sized trade. break_even_usd is the gross profit needed to cover
// gas and slippage.
// -----------------------------------------------------------------------------
struct ProfitCalculation {
  double gross_profit_usd{0.0};
  double gas_cost_usd{0.0};
  double slippage_cost_usd{0.0};
  double net_profit_usd{0.0};
  double profit_margin_bps{0.0};
  double break_even_usd{0.0};
};

/// net = gross - gas - slippage, all in USD.
ProfitCalculation netProfit(double gross_profit_usd, double gas_cost_usd,
                            double slippage_cost_usd, double trade_size_usd);

/// Native-precision variant: the subtraction is done on integers of the
/// start token and every USD field is derived from those integers, so the
/// sign of net_profit_usd always matches the integer result.
ProfitCalculation netProfit(domain::SignedAmount gross_native,
                            domain::Amount gas_native,
                            domain::Amount slippage_native,
                            domain::Amount trade_size_native,
                            const domain::TokenInfo& token);

/// net_profit_usd >= min_profit_usd (inclusive).
bool isProfitable(const ProfitCalculation& calculation, double min_profit_usd);

/// Smallest size clearing both gas break-even and min_profit at the
/// observed spread, capped at max_size_usd. 0 when spread_bps <= 0.
double calculateOptimalSize(double spread_bps, double gas_cost_usd,
                            double max_size_usd, double min_profit_usd);

/// size * spread - gas - size * slippage (spread/slippage in bps).
double expectedProfit(double trade_size_usd, double spread_bps,
                      double gas_cost_usd, double slippage_bps);

/// Size at which the net spread covers gas ten times over, capped at
/// max_size_usd. 0 when the spread does not exceed slippage.
double maxProfitableSize(double spread_bps, double gas_cost_usd,
                         double slippage_bps, double max_size_usd);

/// amount * slippage_bps / 10000.
double slippageCostUsd(double amount_usd, double slippage_bps);

}  // namespace accounting
}  // namespace arb
