#pragma once

#include "arb/persistence/i_trade_store.hpp"

#include <mutex>
#include <string>

namespace arb {

// -----------------------------------------------------------------------------
// JsonlTradeStore: append-only JSON-lines files
// -----------------------------------------------------------------------------
//
// @brief  File-backed ITradeStore: one JSON object per line in
//         <dir>/trades.jsonl and <dir>/risk_events.jsonl.
//
// @details
// Appends open the file in append mode, write one line and flush, so a
// crash loses at most the record being written. Queries re-read
// trades.jsonl; lines that fail to parse are logged and skipped so one
// torn line does not make the whole history unreadable.
//
// The constructor creates `directory` if missing and throws
// PersistenceError if it cannot. Write failures throw PersistenceError.
//
// Thread-safety: a single mutex serializes all file access.
// -----------------------------------------------------------------------------
class JsonlTradeStore : public ITradeStore {
 public:
  explicit JsonlTradeStore(std::string directory);

  void saveTrade(const domain::TradeRecord& record) override;
  void recordRiskEvent(const domain::RiskEventRecord& event) override;
  std::optional<domain::DailyStats> dailyStats(
      const std::string& date) override;
  std::vector<domain::TradeRecord> recentTrades(std::size_t limit) override;

  const std::string& tradesPath() const { return trades_path_; }
  const std::string& riskEventsPath() const { return risk_events_path_; }

 private:
  void appendLine(const std::string& path, const std::string& line);
  std::vector<domain::TradeRecord> readAllTrades();

  std::mutex mutex_;
  std::string trades_path_;
  std::string risk_events_path_;
};

}  // namespace arb
