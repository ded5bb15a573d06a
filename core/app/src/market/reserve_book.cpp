#include "arb/market/reserve_book.hpp"
#include "arb/amm/amm_math.hpp"

#include <cmath>
#include <iostream>
#include <mutex>
#include <utility>
#include <vector>

namespace arb {

ReserveBook::ReserveBook(FeeTable venue_fees)
    : venue_fees_(std::move(venue_fees)) {}

ReserveBook::PoolKey ReserveBook::makeKey(const std::string& venue,
                                          const std::string& a,
                                          const std::string& b) {
  return a < b ? PoolKey{venue, a, b} : PoolKey{venue, b, a};
}

const ReserveBook::PoolEntry* ReserveBook::find(const std::string& venue,
                                                const std::string& a,
                                                const std::string& b) const {
  auto it = pools_.find(makeKey(venue, a, b));
  return it == pools_.end() ? nullptr : &it->second;
}

bool ReserveBook::apply(const ReserveUpdateEvent& update) {
  if (update.token0 == update.token1) {
    std::cerr << "[ReserveBook] ignoring update for " << update.venue
              << ": token0 and token1 are both " << update.token0 << "\n";
    return false;
  }
  if (update.reserve0 > domain::kMaxReserve ||
      update.reserve1 > domain::kMaxReserve) {
    std::cerr << "[ReserveBook] ignoring update for " << update.venue << " "
              << update.token0 << "/" << update.token1
              << ": reserve exceeds uint112\n";
    return false;
  }

  const bool token0_low = update.token0 < update.token1;
  const domain::Amount low = token0_low ? update.reserve0 : update.reserve1;
  const domain::Amount high = token0_low ? update.reserve1 : update.reserve0;

  std::uint32_t fee = update.fee_bps;
  if (auto it = venue_fees_.find(update.venue); it != venue_fees_.end()) {
    fee = it->second;
  }

  std::unique_lock lock(mutex_);
  PoolEntry& entry = pools_[makeKey(update.venue, update.token0, update.token1)];
  entry.reserve_low = low;
  entry.reserve_high = high;
  entry.fee_bps = fee;
  entry.updated_ms = update.timestamp_ms;

  const double mid = amm::midPrice(low, high);
  if (mid > 0.0) {
    entry.mid_prices.push_back(mid);
    if (entry.mid_prices.size() > kHistoryDepth) {
      entry.mid_prices.pop_front();
    }
  }
  return true;
}

std::optional<domain::ReservePair> ReserveBook::reserves(
    const std::string& token_in, const std::string& token_out,
    const std::string& venue) const {
  std::shared_lock lock(mutex_);
  const PoolEntry* entry = find(venue, token_in, token_out);
  if (!entry) {
    return std::nullopt;
  }
  domain::ReservePair pair;
  if (token_in < token_out) {
    pair.reserve_in = entry->reserve_low;
    pair.reserve_out = entry->reserve_high;
  } else {
    pair.reserve_in = entry->reserve_high;
    pair.reserve_out = entry->reserve_low;
  }
  pair.fee_bps = entry->fee_bps;
  return pair;
}

double ReserveBook::volatilityBps(const std::string& venue,
                                  const std::string& token_a,
                                  const std::string& token_b) const {
  std::shared_lock lock(mutex_);
  const PoolEntry* entry = find(venue, token_a, token_b);
  if (!entry || entry->mid_prices.size() < 3) {
    return 0.0;
  }

  std::vector<double> returns;
  returns.reserve(entry->mid_prices.size() - 1);
  for (std::size_t i = 1; i < entry->mid_prices.size(); ++i) {
    returns.push_back(entry->mid_prices[i] / entry->mid_prices[i - 1] - 1.0);
  }

  double mean = 0.0;
  for (double r : returns) {
    mean += r;
  }
  mean /= static_cast<double>(returns.size());

  double variance = 0.0;
  for (double r : returns) {
    variance += (r - mean) * (r - mean);
  }
  variance /= static_cast<double>(returns.size());
  return std::sqrt(variance) * 10000.0;
}

std::optional<std::int64_t> ReserveBook::lastUpdateMs(
    const std::string& venue, const std::string& token_a,
    const std::string& token_b) const {
  std::shared_lock lock(mutex_);
  const PoolEntry* entry = find(venue, token_a, token_b);
  if (!entry) {
    return std::nullopt;
  }
  return entry->updated_ms;
}

std::size_t ReserveBook::poolCount() const {
  std::shared_lock lock(mutex_);
  return pools_.size();
}

}  // namespace arb
