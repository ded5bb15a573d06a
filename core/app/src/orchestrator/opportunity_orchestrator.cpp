#include "arb/orchestrator/opportunity_orchestrator.hpp"
#include "arb/accounting/profit.hpp"
#include "arb/amm/amm_math.hpp"
#include "arb/errors.hpp"
#include "arb/scoring/feature_vector.hpp"

#include <algorithm>
#include <iostream>
#include <utility>

namespace arb {

OpportunityOrchestrator::OpportunityOrchestrator(
    OrchestratorConfig config, std::vector<domain::Route> routes,
    const IReserveReader& reader, accounting::GasEstimator& gas,
    const IConfidenceScorer& scorer, RiskController& risk,
    const ITimeProvider& clock)
    : config_(std::move(config)),
      routes_(std::move(routes)),
      reader_(reader),
      gas_(gas),
      scorer_(scorer),
      risk_(risk),
      clock_(clock) {
  std::sort(config_.trade_sizes_usd.begin(), config_.trade_sizes_usd.end());
}

void OpportunityOrchestrator::setCandidateSink(CandidateSink sink) {
  sink_ = std::move(sink);
}

const domain::TokenInfo& OpportunityOrchestrator::tokenInfo(
    const std::string& symbol) const {
  auto it = config_.tokens.find(symbol);
  if (it == config_.tokens.end()) {
    throw InvalidConfiguration("no token info for '" + symbol + "'");
  }
  return it->second;
}

// -----------------------------------------------------------------------------
// onReserveUpdate
// -----------------------------------------------------------------------------
std::vector<domain::TradeCandidate> OpportunityOrchestrator::onReserveUpdate(
    const ReserveUpdateEvent& update) {
  std::vector<domain::TradeCandidate> emitted;

  if (risk_.isKilled()) {
    std::cerr << "[Orchestrator] kill switch active, not evaluating update "
              << update.sequence_id << "\n";
    return emitted;
  }

  const accounting::GasEstimate gas = gas_.estimate();
  const double max_notional = risk_.getLimits().max_notional_usd;

  for (const auto& route : routes_) {
    std::optional<domain::TradeCandidate> candidate;
    try {
      candidate = evaluateRoute(route, gas, max_notional);
    } catch (const std::exception& e) {
      std::cerr << "[Orchestrator] skipping route " << route.id << ": "
                << e.what() << "\n";
      continue;
    }
    if (!candidate) {
      continue;
    }

    std::cout << "[Orchestrator] candidate " << candidate->route.id
              << " size=" << candidate->notional_usd
              << " net=" << candidate->net_profit_usd
              << " score=" << candidate->score << "\n";
    if (sink_) {
      try {
        sink_(*candidate);
      } catch (const std::exception& e) {
        std::cerr << "[Orchestrator] candidate sink failed for "
                  << candidate->route.id << ": " << e.what() << "\n";
      }
    }
    emitted.push_back(std::move(*candidate));
  }
  return emitted;
}

// -----------------------------------------------------------------------------
// evaluateRoute: reserves, spread filter, then sizes in ascending order
// -----------------------------------------------------------------------------
std::optional<domain::TradeCandidate> OpportunityOrchestrator::evaluateRoute(
    const domain::Route& route, const accounting::GasEstimate& gas,
    double max_notional_usd) {
  domain::validateRoute(route);
  const domain::TokenInfo& start = tokenInfo(route.tokens.front());

  std::vector<domain::ReservePair> legs;
  std::vector<double> mids;
  legs.reserve(route.legCount());
  mids.reserve(route.legCount());
  for (std::size_t i = 0; i < route.legCount(); ++i) {
    auto pair = reader_.reserves(route.legTokenIn(i), route.legTokenOut(i),
                                 route.venues[i]);
    if (!pair) {
      std::cerr << "[Orchestrator] no reserves for " << route.legTokenIn(i)
                << "->" << route.legTokenOut(i) << " on " << route.venues[i]
                << ", skipping route " << route.id << "\n";
      return std::nullopt;
    }
    mids.push_back(amm::midPrice(pair->reserve_in, pair->reserve_out));
    legs.push_back(*pair);
  }

  const double spread_bps = amm::compositeSpreadBps(mids);
  if (spread_bps < config_.min_spread_bps) {
    return std::nullopt;
  }

  // A size the controller rejects means every larger size is rejected too:
  // notional only grows, and the other guards do not depend on size.
  for (double size : config_.trade_sizes_usd) {
    if (size > max_notional_usd) {
      continue;
    }
    bool risk_rejected = false;
    auto candidate =
        simulateSize(route, legs, start, size, spread_bps, gas, risk_rejected);
    if (candidate) {
      return candidate;
    }
    if (risk_rejected) {
      break;
    }
  }
  return std::nullopt;
}

std::optional<domain::TradeCandidate> OpportunityOrchestrator::simulateSize(
    const domain::Route& route, const std::vector<domain::ReservePair>& legs,
    const domain::TokenInfo& start_token, double notional_usd,
    double spread_bps, const accounting::GasEstimate& gas,
    bool& risk_rejected) {
  using domain::Amount;
  using domain::SignedAmount;

  const Amount amount_in = domain::fromUsdFloor(notional_usd, start_token);
  if (amount_in == 0) {
    return std::nullopt;
  }

  std::vector<Amount> leg_outs;
  leg_outs.reserve(legs.size());
  Amount amount = amount_in;
  for (const auto& leg : legs) {
    amount = amm::amountOut(amount, leg);
    leg_outs.push_back(amount);
  }

  const SignedAmount gross =
      static_cast<SignedAmount>(amount) - static_cast<SignedAmount>(amount_in);
  const Amount gas_native = domain::fromUsdCeil(gas.cost_usd, start_token);
  const Amount slippage_native = domain::fromUsdCeil(
      accounting::slippageCostUsd(notional_usd, config_.slippage_bps),
      start_token);

  const accounting::ProfitCalculation calc = accounting::netProfit(
      gross, gas_native, slippage_native, amount_in, start_token);
  if (!accounting::isProfitable(calc, config_.min_profit_usd)) {
    return std::nullopt;
  }

  const scoring::FeatureVector features = scoring::extractFeatures(
      legs, start_token, notional_usd, gas,
      reader_.volatilityBps(route.venues.front(), route.legTokenIn(0),
                            route.legTokenOut(0)),
      clock_.now_ms());
  const std::optional<double> score = scorer_.score(features);
  if (!score || *score < config_.score_threshold) {
    return std::nullopt;
  }

  if (!risk_.canTrade(notional_usd, calc.net_profit_usd)) {
    risk_rejected = true;
    return std::nullopt;
  }

  domain::TradeCandidate candidate;
  candidate.route = route;
  candidate.notional_usd = notional_usd;
  candidate.amount_in = amount_in;
  candidate.leg_amounts_out = std::move(leg_outs);
  candidate.gross_profit_native = gross;
  candidate.gas_cost_native = gas_native;
  candidate.slippage_cost_native = slippage_native;
  candidate.net_profit_native = gross - static_cast<SignedAmount>(gas_native) -
                                static_cast<SignedAmount>(slippage_native);
  candidate.gross_profit_usd = calc.gross_profit_usd;
  candidate.gas_cost_usd = calc.gas_cost_usd;
  candidate.slippage_cost_usd = calc.slippage_cost_usd;
  candidate.net_profit_usd = calc.net_profit_usd;
  candidate.spread_bps = spread_bps;
  candidate.score = *score;
  return candidate;
}

}  // namespace arb
