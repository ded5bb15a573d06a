#include "arb/execution/paper_trade_executor.hpp"

#include <iostream>
#include <stdexcept>

namespace arb {

PaperTradeExecutor::PaperTradeExecutor(const ITimeProvider& clock,
                                       TradeIdGenerator& ids)
    : clock_(clock), ids_(ids), started_ms_(clock.now_ms()) {}

domain::TradeRecord PaperTradeExecutor::execute(
    const domain::TradeCandidate& candidate) {
  if (candidate.net_profit_native < 0) {
    throw std::invalid_argument("refusing to paper-trade route " +
                                candidate.route.id +
                                " with negative net profit");
  }

  domain::TradeRecord record;
  record.id = ids_.next_trade_id(started_ms_);
  record.timestamp_ms = clock_.now_ms();
  record.route = candidate.route.id;
  record.notional_usd = candidate.notional_usd;
  record.expected_profit_usd = candidate.net_profit_usd;
  record.realized_profit_usd = candidate.net_profit_usd;
  record.gas_cost_usd = candidate.gas_cost_usd;
  record.score = candidate.score;
  record.status = domain::TradeStatus::Success;
  record.mode = "paper";

  std::cout << "[PaperTradeExecutor] " << record.id << " " << record.route
            << " notional=" << record.notional_usd
            << " realized=" << record.realized_profit_usd << "\n";
  return record;
}

}  // namespace arb
