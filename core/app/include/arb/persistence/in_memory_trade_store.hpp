#pragma once

#include "arb/persistence/i_trade_store.hpp"

#include <atomic>
#include <mutex>
#include <vector>

namespace arb {

// -----------------------------------------------------------------------------
// InMemoryTradeStore: volatile ITradeStore
// -----------------------------------------------------------------------------
//
// @brief  Keeps trades and risk events in vectors. Used for dry runs with
//         no store_dir configured and as the test double for the
//         RiskController and engine tests.
//
// @details
// setFailing(true) makes every call throw PersistenceError, to exercise the
// log-and-continue paths. seedDailyStats() overrides the computed
// aggregate for a date, mirroring a database that already holds the day's
// history.
//
// Thread-safety: every method locks mutex_.
// -----------------------------------------------------------------------------
class InMemoryTradeStore : public ITradeStore {
 public:
  void saveTrade(const domain::TradeRecord& record) override;
  void recordRiskEvent(const domain::RiskEventRecord& event) override;
  std::optional<domain::DailyStats> dailyStats(
      const std::string& date) override;
  std::vector<domain::TradeRecord> recentTrades(std::size_t limit) override;

  void setFailing(bool failing) { failing_.store(failing); }
  void seedDailyStats(const domain::DailyStats& stats);

  std::vector<domain::TradeRecord> trades() const;
  std::vector<domain::RiskEventRecord> riskEvents() const;

 private:
  void throwIfFailing(const char* operation) const;

  mutable std::mutex mutex_;
  std::vector<domain::TradeRecord> trades_;
  std::vector<domain::RiskEventRecord> risk_events_;
  std::vector<domain::DailyStats> seeded_stats_;
  std::atomic<bool> failing_{false};
};

/// Aggregates records whose UTC date equals `date`: PnL sum, count and
/// the fraction with realized profit > 0. std::nullopt when none match.
std::optional<domain::DailyStats> aggregateDailyStats(
    const std::vector<domain::TradeRecord>& records, const std::string& date);

}  // namespace arb
