#pragma once

#include "arb/domain/amount.hpp"
#include "arb/domain/reserve_pair.hpp"

#include <cstdint>
#include <vector>

namespace arb {
namespace amm {

using domain::Amount;
using domain::ReservePair;
using domain::SignedAmount;

/// Basis-point denominator (10000 bps = 100%).
constexpr std::uint32_t kBpsDenominator = 10000;

// -----------------------------------------------------------------------------
// Constant-product swap arithmetic
// -----------------------------------------------------------------------------
//
// Every function on the accounting path is integer-only: amounts are
// 128-bit native units and products that can exceed 128 bits go through
// mulDiv() with a 256-bit intermediate. Floating point is confined to
// midPrice(), priceImpactPct() and compositeSpreadBps(), which are used
// for filtering and features, never for the profit verdict.
//
// Operand validation:
//   - fee_bps >= 10000 throws InvalidConfiguration.
//   - amounts or reserves above domain::kMaxReserve throw std::out_of_range.
//
// Thread-safety: all functions are pure.
// -----------------------------------------------------------------------------

/// floor(a * b / d) with a 256-bit intermediate product.
/// Throws std::domain_error when d == 0 and std::overflow_error when the
/// quotient does not fit in 128 bits.
Amount mulDiv(Amount a, Amount b, Amount d);

/// Output of selling amount_in into a pool, fee taken from the input:
///   eff = amount_in * (10000 - fee_bps)
///   out = floor(eff * reserve_out / (reserve_in * 10000 + eff))
/// Returns 0 if any operand is 0. Always < reserve_out.
Amount amountOut(Amount amount_in, Amount reserve_in, Amount reserve_out,
                 std::uint32_t fee_bps = 30);

/// Convenience overload using a ReservePair's reserves and fee.
inline Amount amountOut(Amount amount_in, const ReservePair& pair) {
  return amountOut(amount_in, pair.reserve_in, pair.reserve_out, pair.fee_bps);
}

/// Minimum input that yields at least amount_out:
///   floor(reserve_in * amount_out * 10000 /
///         ((reserve_out - amount_out) * (10000 - fee_bps))) + 1
/// Returns 0 if any operand is 0. Throws InsufficientLiquidity when
/// amount_out >= reserve_out; the request is never clamped.
Amount amountIn(Amount amount_out, Amount reserve_in, Amount reserve_out,
                std::uint32_t fee_bps = 30);

/// reserve_out / reserve_in, or 0 when either reserve is 0.
double midPrice(Amount reserve_in, Amount reserve_out);

/// Magnitude of the mid-price move caused by the swap, in percent.
/// Non-decreasing in amount_in for fixed reserves; 0 for empty pools.
double priceImpactPct(Amount amount_in, Amount reserve_in, Amount reserve_out,
                      std::uint32_t fee_bps = 30);

/// |1 - prod(mid_prices)| * 10000 for a closed loop of legs. Decimals
/// cancel around a loop, so raw-unit mid prices can be used directly.
/// Returns 0 for an empty list or any non-positive price.
double compositeSpreadBps(const std::vector<double>& mid_prices);

/// Signed profit of in -> leg_a -> leg_b -> in, in native input units.
SignedAmount twoHopProfit(Amount amount_in, const ReservePair& leg_a,
                          const ReservePair& leg_b);

/// Binary search over [0, max_amount] for the two-hop input with the
/// largest profit. Each step probes the slope at the midpoint and keeps
/// the side where profit still rises. The best amount seen is returned,
/// so more iterations never yield a less profitable answer; 0 when no
/// probed amount is profitable.
Amount optimalAmount(const ReservePair& leg_a, const ReservePair& leg_b,
                     Amount max_amount, int iterations = 10);

}  // namespace amm
}  // namespace arb
