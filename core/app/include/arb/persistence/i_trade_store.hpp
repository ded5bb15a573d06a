#pragma once

#include "arb/domain/trade_record.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace arb {

// -----------------------------------------------------------------------------
// ITradeStore: append-only audit log and startup source of truth
// -----------------------------------------------------------------------------
//
// @brief  Persistence contract for trade records, risk events and the
//         daily aggregate used to rehydrate the RiskController.
//
// @details
// Writes:
//   saveTrade() and recordRiskEvent() append; records are never updated in
//   place. The RiskController and the engine call them AFTER mutating
//   in-memory state, and a failure is logged rather than rolled back:
//   RiskState correctness takes priority over audit-log completeness.
//
// Reads (startup rehydration):
//   dailyStats(date) returns the aggregate for a "YYYY-MM-DD" UTC date, or
//   std::nullopt when the day has no trades.
//   recentTrades(limit) returns up to `limit` records, MOST RECENT FIRST.
//
// Failure signalling:
//   Implementations throw PersistenceError on I/O failure. Callers catch it
//   (by const std::exception&) and log.
//
// Thread model:
//   Implementations must tolerate calls from the scan loop and the IPC
//   thread (kill/reset commands) concurrently.
// -----------------------------------------------------------------------------
class ITradeStore {
 public:
  virtual ~ITradeStore() = default;

  virtual void saveTrade(const domain::TradeRecord& record) = 0;

  virtual void recordRiskEvent(const domain::RiskEventRecord& event) = 0;

  virtual std::optional<domain::DailyStats> dailyStats(
      const std::string& date) = 0;

  virtual std::vector<domain::TradeRecord> recentTrades(std::size_t limit) = 0;
};

}  // namespace arb
