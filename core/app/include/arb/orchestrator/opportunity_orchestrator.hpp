#pragma once

#include "arb/accounting/gas_estimator.hpp"
#include "arb/domain/route.hpp"
#include "arb/domain/token.hpp"
#include "arb/domain/trade_candidate.hpp"
#include "arb/events/event_types.hpp"
#include "arb/market/i_reserve_reader.hpp"
#include "arb/risk/risk_controller.hpp"
#include "arb/scoring/i_confidence_scorer.hpp"
#include "arb/time/i_time_provider.hpp"

#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace arb {

struct OrchestratorConfig {
  double min_profit_usd{1.0};
  double slippage_bps{50.0};
  double score_threshold{0.7};
  double min_spread_bps{10.0};
  std::vector<double> trade_sizes_usd{100.0, 250.0, 500.0, 1000.0};
  std::map<std::string, domain::TokenInfo> tokens;  // keyed by symbol
};

// -----------------------------------------------------------------------------
// OpportunityOrchestrator
// -----------------------------------------------------------------------------
//
// @brief  Re-evaluates every configured route on each reserve update and
//         emits the candidates that are profitable, confident and
//         authorized by the RiskController.
//
// @details
// Per update:
//   - one gas estimate (GasEstimator falls back on oracle failure);
//   - per route, one ReservePair per leg. A missing pool or an invalid
//     route is logged and skips that route only;
//   - routes whose composite spread is below min_spread_bps are skipped;
//   - trade sizes are tried in ascending order, skipping any above the
//     controller's current max_notional_usd. The first size that clears
//     min_profit_usd, the score threshold and canTrade() is emitted and the
//     route is done for this update.
//
// Profit is decided in native units of the route's start token:
//   net = (out_last - amount_in) - ceil(gas) - ceil(slippage)
// The USD figures on the candidate are derived from that integer.
//
// Emission invokes the candidate sink synchronously, so a paper execution
// (and its recordTrade()) completes before the next route is authorized.
//
// Thread model: onReserveUpdate() runs only on the scan loop.
//
// Ownership: holds references to every collaborator; all must outlive the
// orchestrator.
// -----------------------------------------------------------------------------
class OpportunityOrchestrator {
 public:
  using CandidateSink = std::function<void(const domain::TradeCandidate&)>;

  OpportunityOrchestrator(OrchestratorConfig config,
                          std::vector<domain::Route> routes,
                          const IReserveReader& reader,
                          accounting::GasEstimator& gas,
                          const IConfidenceScorer& scorer,
                          RiskController& risk, const ITimeProvider& clock);

  OpportunityOrchestrator(const OpportunityOrchestrator&) = delete;
  OpportunityOrchestrator& operator=(const OpportunityOrchestrator&) = delete;

  void setCandidateSink(CandidateSink sink);

  std::vector<domain::TradeCandidate> onReserveUpdate(
      const ReserveUpdateEvent& update);

  const std::vector<domain::Route>& routes() const { return routes_; }
  const OrchestratorConfig& config() const { return config_; }

 private:
  std::optional<domain::TradeCandidate> evaluateRoute(
      const domain::Route& route, const accounting::GasEstimate& gas,
      double max_notional_usd);

  std::optional<domain::TradeCandidate> simulateSize(
      const domain::Route& route,
      const std::vector<domain::ReservePair>& legs,
      const domain::TokenInfo& start_token, double notional_usd,
      double spread_bps, const accounting::GasEstimate& gas,
      bool& risk_rejected);

  const domain::TokenInfo& tokenInfo(const std::string& symbol) const;

  OrchestratorConfig config_;
  std::vector<domain::Route> routes_;
  const IReserveReader& reader_;
  accounting::GasEstimator& gas_;
  const IConfidenceScorer& scorer_;
  RiskController& risk_;
  const ITimeProvider& clock_;
  CandidateSink sink_;
};

}  // namespace arb
