#pragma once

#include "arb/concurrent/trade_id_generator.hpp"
#include "arb/execution/i_trade_executor.hpp"
#include "arb/time/i_time_provider.hpp"

namespace arb {

// -----------------------------------------------------------------------------
// PaperTradeExecutor
// -----------------------------------------------------------------------------
//
// @brief  Simulated execution: the trade "fills" exactly as simulated.
//
// @details
// Realized profit equals the candidate's net_profit_usd, the timestamp
// comes from the injected ITimeProvider, mode is "paper" and there is no
// tx_ref. Candidates whose native net profit is negative are refused with
// std::invalid_argument; the orchestrator never emits those.
//
// Thread model: called on the scan loop only; the id generator is atomic.
// -----------------------------------------------------------------------------
class PaperTradeExecutor final : public ITradeExecutor {
 public:
  PaperTradeExecutor(const ITimeProvider& clock, TradeIdGenerator& ids);

  PaperTradeExecutor(const PaperTradeExecutor&) = delete;
  PaperTradeExecutor& operator=(const PaperTradeExecutor&) = delete;

  domain::TradeRecord execute(const domain::TradeCandidate& candidate) override;

 private:
  const ITimeProvider& clock_;
  TradeIdGenerator& ids_;
  std::int64_t started_ms_;
};

}  // namespace arb
