#include "arb/persistence/in_memory_trade_store.hpp"
#include "arb/errors.hpp"
#include "arb/time/time_utils.hpp"

#include <algorithm>
#include <cstddef>
#include <string>

namespace arb {

std::optional<domain::DailyStats> aggregateDailyStats(
    const std::vector<domain::TradeRecord>& records, const std::string& date) {
  domain::DailyStats stats;
  stats.date = date;
  std::int64_t wins = 0;
  for (const auto& record : records) {
    if (record.status != domain::TradeStatus::Success ||
        utcDate(record.timestamp_ms) != date) {
      continue;
    }
    stats.daily_pnl += record.realized_profit_usd;
    ++stats.trade_count;
    if (record.realized_profit_usd > 0.0) {
      ++wins;
    }
  }
  if (stats.trade_count == 0) {
    return std::nullopt;
  }
  stats.win_rate =
      static_cast<double>(wins) / static_cast<double>(stats.trade_count);
  return stats;
}

void InMemoryTradeStore::throwIfFailing(const char* operation) const {
  if (failing_.load()) {
    throw PersistenceError(std::string("in-memory store offline during ") +
                           operation);
  }
}

void InMemoryTradeStore::saveTrade(const domain::TradeRecord& record) {
  throwIfFailing("saveTrade");
  std::lock_guard lock(mutex_);
  trades_.push_back(record);
}

void InMemoryTradeStore::recordRiskEvent(
    const domain::RiskEventRecord& event) {
  throwIfFailing("recordRiskEvent");
  std::lock_guard lock(mutex_);
  risk_events_.push_back(event);
}

std::optional<domain::DailyStats> InMemoryTradeStore::dailyStats(
    const std::string& date) {
  throwIfFailing("dailyStats");
  std::lock_guard lock(mutex_);
  for (const auto& seeded : seeded_stats_) {
    if (seeded.date == date) {
      return seeded;
    }
  }
  return aggregateDailyStats(trades_, date);
}

std::vector<domain::TradeRecord> InMemoryTradeStore::recentTrades(
    std::size_t limit) {
  throwIfFailing("recentTrades");
  std::lock_guard lock(mutex_);
  const std::size_t count = std::min(limit, trades_.size());
  return std::vector<domain::TradeRecord>(
      trades_.rbegin(), trades_.rbegin() + static_cast<std::ptrdiff_t>(count));
}

void InMemoryTradeStore::seedDailyStats(const domain::DailyStats& stats) {
  std::lock_guard lock(mutex_);
  seeded_stats_.push_back(stats);
}

std::vector<domain::TradeRecord> InMemoryTradeStore::trades() const {
  std::lock_guard lock(mutex_);
  return trades_;
}

std::vector<domain::RiskEventRecord> InMemoryTradeStore::riskEvents() const {
  std::lock_guard lock(mutex_);
  return risk_events_;
}

}  // namespace arb
