#pragma once

#include "arb/events/event_types.hpp"
#include "arb/market/i_reserve_reader.hpp"

#include <cstddef>
#include <cstdint>
#include <deque>
#include <map>
#include <optional>
#include <shared_mutex>
#include <string>
#include <tuple>

namespace arb {

// -----------------------------------------------------------------------------
// ReserveBook
// -----------------------------------------------------------------------------
//
// @brief  In-memory cache of the latest reserves per (venue, pool), fed by
//         ReserveUpdateEvents, plus a short mid-price history per pool.
//
// @details
// Pools are keyed by venue and the lexicographically ordered token pair,
// so an update for (WETH, USDC) and a lookup for USDC -> WETH hit the same
// entry. reserves() orients the stored pair for the requested direction.
//
// The swap fee is taken from the venue fee table given at construction;
// venues absent from the table use the fee carried by the last update.
//
// Each apply() appends the pool's mid price (second token per first token,
// in raw units) to a history capped at kHistoryDepth entries.
// volatilityBps() reports the population standard deviation of successive
// returns over that history, in basis points.
//
// Thread model:
//   apply() runs on the scan loop; reserves() and volatilityBps() may be
//   called from any thread. A std::shared_mutex lets readers proceed in
//   parallel.
// -----------------------------------------------------------------------------
class ReserveBook : public IReserveReader {
 public:
  static constexpr std::size_t kHistoryDepth = 64;

  using FeeTable = std::map<std::string, std::uint32_t>;

  ReserveBook() = default;
  explicit ReserveBook(FeeTable venue_fees);

  ReserveBook(const ReserveBook&) = delete;
  ReserveBook& operator=(const ReserveBook&) = delete;

  /// Stores the update. Returns false (and logs) when the update names the
  /// same token twice or carries a reserve above the uint112 range.
  bool apply(const ReserveUpdateEvent& update);

  std::optional<domain::ReservePair> reserves(
      const std::string& token_in, const std::string& token_out,
      const std::string& venue) const override;

  /// 0 with fewer than 3 recorded mid prices or for an unknown pool.
  double volatilityBps(const std::string& venue, const std::string& token_a,
                       const std::string& token_b) const override;

  /// Timestamp of the last applied update for the pool.
  std::optional<std::int64_t> lastUpdateMs(const std::string& venue,
                                           const std::string& token_a,
                                           const std::string& token_b) const;

  std::size_t poolCount() const;

 private:
  // (venue, lower symbol, higher symbol)
  using PoolKey = std::tuple<std::string, std::string, std::string>;

  struct PoolEntry {
    domain::Amount reserve_low{0};   // reserve of the lower-sorted token
    domain::Amount reserve_high{0};
    std::uint32_t fee_bps{30};
    std::int64_t updated_ms{0};
    std::deque<double> mid_prices;
  };

  static PoolKey makeKey(const std::string& venue, const std::string& a,
                         const std::string& b);

  const PoolEntry* find(const std::string& venue, const std::string& a,
                        const std::string& b) const;

  FeeTable venue_fees_;
  mutable std::shared_mutex mutex_;
  std::map<PoolKey, PoolEntry> pools_;
};

}  // namespace arb
