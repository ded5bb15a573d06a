#include "arb/persistence/jsonl_trade_store.hpp"
#include "arb/errors.hpp"
#include "arb/persistence/in_memory_trade_store.hpp"
#include "arb/persistence/json_codec.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <system_error>
#include <utility>

namespace arb {

JsonlTradeStore::JsonlTradeStore(std::string directory) {
  std::error_code ec;
  std::filesystem::create_directories(directory, ec);
  if (ec) {
    throw PersistenceError("cannot create store directory '" + directory +
                           "': " + ec.message());
  }
  const std::filesystem::path dir(std::move(directory));
  trades_path_ = (dir / "trades.jsonl").string();
  risk_events_path_ = (dir / "risk_events.jsonl").string();
}

void JsonlTradeStore::appendLine(const std::string& path,
                                 const std::string& line) {
  std::ofstream out(path, std::ios::app);
  if (!out) {
    throw PersistenceError("cannot open " + path + " for append");
  }
  out << line << '\n';
  out.flush();
  if (!out) {
    throw PersistenceError("write to " + path + " failed");
  }
}

void JsonlTradeStore::saveTrade(const domain::TradeRecord& record) {
  const nlohmann::json j = record;
  std::lock_guard lock(mutex_);
  appendLine(trades_path_, j.dump());
}

void JsonlTradeStore::recordRiskEvent(const domain::RiskEventRecord& event) {
  const nlohmann::json j = event;
  std::lock_guard lock(mutex_);
  appendLine(risk_events_path_, j.dump());
}

std::vector<domain::TradeRecord> JsonlTradeStore::readAllTrades() {
  std::vector<domain::TradeRecord> records;
  std::ifstream in(trades_path_);
  if (!in) {
    // Nothing written yet.
    return records;
  }

  std::string line;
  std::size_t line_number = 0;
  while (std::getline(in, line)) {
    ++line_number;
    if (line.empty()) {
      continue;
    }
    try {
      records.push_back(
          nlohmann::json::parse(line).get<domain::TradeRecord>());
    } catch (const std::exception& e) {
      std::cerr << "[JsonlTradeStore] skipping " << trades_path_ << ":"
                << line_number << ": " << e.what() << "\n";
    }
  }
  if (in.bad()) {
    throw PersistenceError("read from " + trades_path_ + " failed");
  }
  return records;
}

std::optional<domain::DailyStats> JsonlTradeStore::dailyStats(
    const std::string& date) {
  std::lock_guard lock(mutex_);
  return aggregateDailyStats(readAllTrades(), date);
}

std::vector<domain::TradeRecord> JsonlTradeStore::recentTrades(
    std::size_t limit) {
  std::lock_guard lock(mutex_);
  std::vector<domain::TradeRecord> records = readAllTrades();
  std::reverse(records.begin(), records.end());
  if (records.size() > limit) {
    records.resize(limit);
  }
  return records;
}

}  // namespace arb
