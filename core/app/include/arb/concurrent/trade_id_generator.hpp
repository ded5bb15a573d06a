#pragma once

#include <atomic>
#include <cstdint>
#include <string>
#include <utility>

namespace arb {

// -----------------------------------------------------------------------------
// TradeIdGenerator
// -----------------------------------------------------------------------------
// Thread-safe monotonic sequence used for trade ids and event sequence ids.
// One instance is owned by ArbitrageEngine and shared by reference.
// -----------------------------------------------------------------------------
class TradeIdGenerator {
 public:
  explicit TradeIdGenerator(std::string prefix = "trade")
      : prefix_(std::move(prefix)) {}

  TradeIdGenerator(const TradeIdGenerator&) = delete;
  TradeIdGenerator& operator=(const TradeIdGenerator&) = delete;
  TradeIdGenerator(TradeIdGenerator&&) = delete;
  TradeIdGenerator& operator=(TradeIdGenerator&&) = delete;

  std::uint64_t next_id() {
    return next_id_.fetch_add(1, std::memory_order_relaxed);
  }

  /// "<prefix>-<started_ms>-<n>"; started_ms keeps ids unique across
  /// restarts that append to the same store.
  std::string next_trade_id(std::int64_t started_ms) {
    return prefix_ + "-" + std::to_string(started_ms) + "-" +
           std::to_string(next_id());
  }

 private:
  std::string prefix_;
  std::atomic<std::uint64_t> next_id_{1};
};

}  // namespace arb
