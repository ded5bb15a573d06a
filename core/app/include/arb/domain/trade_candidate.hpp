#pragma once

#include "arb/domain/amount.hpp"
#include "arb/domain/route.hpp"

#include <vector>

namespace arb {
namespace domain {

// -----------------------------------------------------------------------------
// TradeCandidate: one simulated, authorized opportunity
// -----------------------------------------------------------------------------
//
// @brief  Result of simulating a route at one notional size.
//
// @details
// All *_native fields are in smallest units of the route's start token
// (route.tokens[0]). net_profit_native = gross - gas - slippage is computed
// in integers; the *_usd fields are renderings of those integers and are
// never used to decide profitability.
//
// Lifecycle: created per simulation, handed to the candidate sink and the
// caller of OpportunityOrchestrator::onReserveUpdate(), then discarded.
// -----------------------------------------------------------------------------
struct TradeCandidate {
  Route route;
  double notional_usd{0.0};
  Amount amount_in{0};
  std::vector<Amount> leg_amounts_out;

  SignedAmount gross_profit_native{0};
  Amount gas_cost_native{0};
  Amount slippage_cost_native{0};
  SignedAmount net_profit_native{0};

  double gross_profit_usd{0.0};
  double gas_cost_usd{0.0};
  double slippage_cost_usd{0.0};
  double net_profit_usd{0.0};

  double spread_bps{0.0};
  double score{0.0};
};

}  // namespace domain
}  // namespace arb
