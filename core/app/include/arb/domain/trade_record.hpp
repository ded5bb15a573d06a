#pragma once

#include "arb/domain/risk_state.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace arb {
namespace domain {

// Outcome of an executed trade, folded into RiskState by recordTrade().
struct TradeOutcome {
  double notional_usd{0.0};
  double realized_profit_usd{0.0};
};

enum class TradeStatus { Pending, Success, Failed };

const char* toString(TradeStatus status);

/// Throws std::invalid_argument for an unknown name.
TradeStatus tradeStatusFromString(const std::string& name);

// -----------------------------------------------------------------------------
// TradeRecord: append-only audit row for one attempted trade
// -----------------------------------------------------------------------------
struct TradeRecord {
  std::string id;
  std::int64_t timestamp_ms{0};
  std::string route;
  double notional_usd{0.0};
  double expected_profit_usd{0.0};
  double realized_profit_usd{0.0};
  double gas_cost_usd{0.0};
  double score{0.0};
  TradeStatus status{TradeStatus::Pending};
  std::string mode{"paper"};
  std::optional<std::string> tx_ref;
  std::optional<std::string> error;
};

// -----------------------------------------------------------------------------
// RiskEventRecord: append-only audit row for a risk state transition
// -----------------------------------------------------------------------------
//
// type is one of "kill_switch", "kill_switch_reset", "consecutive_losses",
// "daily_reset". state is the RiskState immediately after the transition.
// -----------------------------------------------------------------------------
struct RiskEventRecord {
  std::string type;
  std::string description;
  RiskState state;
  std::int64_t timestamp_ms{0};
};

// Aggregate for one UTC calendar day ("YYYY-MM-DD").
struct DailyStats {
  std::string date;
  double daily_pnl{0.0};
  std::int64_t trade_count{0};
  double win_rate{0.0};
};

}  // namespace domain
}  // namespace arb
