#pragma once

#include "arb/domain/trade_candidate.hpp"
#include "arb/domain/trade_record.hpp"

namespace arb {

// -----------------------------------------------------------------------------
// ITradeExecutor
// -----------------------------------------------------------------------------
// Turns an authorized candidate into an executed trade. Signing and
// broadcasting are out of scope for this engine; a live implementation
// would submit the route and report the settled result.
//
// execute() returns a TradeRecord with status Success (realized profit
// filled in) or throws std::exception-derived errors on failure. The
// caller persists the record and reports the outcome to the
// RiskController.
// -----------------------------------------------------------------------------
class ITradeExecutor {
 public:
  virtual ~ITradeExecutor() = default;

  virtual domain::TradeRecord execute(
      const domain::TradeCandidate& candidate) = 0;
};

}  // namespace arb
