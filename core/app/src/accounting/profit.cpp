#include "arb/accounting/profit.hpp"

#include <algorithm>

namespace arb {
namespace accounting {

namespace {
constexpr double kBps = 10000.0;
}  // namespace

ProfitCalculation netProfit(double gross_profit_usd, double gas_cost_usd,
                            double slippage_cost_usd, double trade_size_usd) {
  ProfitCalculation calc;
  calc.gross_profit_usd = gross_profit_usd;
  calc.gas_cost_usd = gas_cost_usd;
  calc.slippage_cost_usd = slippage_cost_usd;
  calc.net_profit_usd = gross_profit_usd - gas_cost_usd - slippage_cost_usd;
  calc.profit_margin_bps =
      trade_size_usd > 0.0 ? calc.net_profit_usd / trade_size_usd * kBps : 0.0;
  calc.break_even_usd = gas_cost_usd + slippage_cost_usd;
  return calc;
}

ProfitCalculation netProfit(domain::SignedAmount gross_native,
                            domain::Amount gas_native,
                            domain::Amount slippage_native,
                            domain::Amount trade_size_native,
                            const domain::TokenInfo& token) {
  using domain::SignedAmount;
  const SignedAmount gas = static_cast<SignedAmount>(gas_native);
  const SignedAmount slippage = static_cast<SignedAmount>(slippage_native);
  const SignedAmount net = gross_native - gas - slippage;

  ProfitCalculation calc;
  calc.gross_profit_usd = domain::toUsd(gross_native, token);
  calc.gas_cost_usd = domain::toUsd(gas, token);
  calc.slippage_cost_usd = domain::toUsd(slippage, token);
  calc.net_profit_usd = domain::toUsd(net, token);
  calc.profit_margin_bps =
      trade_size_native > 0
          ? static_cast<double>(static_cast<long double>(net) /
                                static_cast<long double>(trade_size_native) *
                                kBps)
          : 0.0;
  calc.break_even_usd = domain::toUsd(gas + slippage, token);
  return calc;
}

bool isProfitable(const ProfitCalculation& calculation, double min_profit_usd) {
  return calculation.net_profit_usd >= min_profit_usd;
}

double calculateOptimalSize(double spread_bps, double gas_cost_usd,
                            double max_size_usd, double min_profit_usd) {
  if (spread_bps <= 0.0) {
    return 0.0;
  }
  const double min_size_for_break_even = gas_cost_usd * kBps / spread_bps;
  const double min_size_for_profit =
      (gas_cost_usd + min_profit_usd) * kBps / spread_bps;
  return std::min(std::max(min_size_for_profit, min_size_for_break_even),
                  max_size_usd);
}

double expectedProfit(double trade_size_usd, double spread_bps,
                      double gas_cost_usd, double slippage_bps) {
  const double gross = trade_size_usd * spread_bps / kBps;
  return gross - gas_cost_usd - slippageCostUsd(trade_size_usd, slippage_bps);
}

double maxProfitableSize(double spread_bps, double gas_cost_usd,
                         double slippage_bps, double max_size_usd) {
  if (spread_bps <= slippage_bps) {
    return 0.0;
  }
  const double net_spread_bps = spread_bps - slippage_bps;
  const double max_profitable = gas_cost_usd * kBps / net_spread_bps * 10.0;
  return std::min(max_profitable, max_size_usd);
}

double slippageCostUsd(double amount_usd, double slippage_bps) {
  return amount_usd * slippage_bps / kBps;
}

}  // namespace accounting
}  // namespace arb
