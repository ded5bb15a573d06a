#include "arb/amm/amm_math.hpp"
#include "arb/errors.hpp"

#include <cmath>
#include <cstdint>
#include <stdexcept>
#include <string>

namespace arb {
namespace amm {

namespace {

constexpr Amount kLow64Mask = static_cast<Amount>(~std::uint64_t{0});

// 256-bit product split into two 128-bit halves.
struct WideProduct {
  Amount hi{0};
  Amount lo{0};
};

WideProduct mulWide(Amount a, Amount b) {
  const Amount a0 = a & kLow64Mask;
  const Amount a1 = a >> 64;
  const Amount b0 = b & kLow64Mask;
  const Amount b1 = b >> 64;

  const Amount p00 = a0 * b0;
  const Amount p01 = a0 * b1;
  const Amount p10 = a1 * b0;
  const Amount p11 = a1 * b1;

  // Sum of three values below 2^64 each; cannot overflow 128 bits.
  const Amount mid = (p00 >> 64) + (p01 & kLow64Mask) + (p10 & kLow64Mask);

  WideProduct result;
  result.lo = (p00 & kLow64Mask) | (mid << 64);
  result.hi = p11 + (p01 >> 64) + (p10 >> 64) + (mid >> 64);
  return result;
}

void checkFee(std::uint32_t fee_bps) {
  if (fee_bps >= kBpsDenominator) {
    throw InvalidConfiguration("fee_bps " + std::to_string(fee_bps) +
                               " must be below 10000");
  }
}

void checkRange(Amount value, const char* what) {
  if (value > domain::kMaxReserve) {
    throw std::out_of_range(std::string(what) + " " + domain::toString(value) +
                            " exceeds the uint112 range");
  }
}

}  // namespace

Amount mulDiv(Amount a, Amount b, Amount d) {
  if (d == 0) {
    throw std::domain_error("mulDiv: division by zero");
  }

  const WideProduct p = mulWide(a, b);
  if (p.hi == 0) {
    return p.lo / d;
  }
  if (p.hi >= d) {
    throw std::overflow_error("mulDiv: quotient exceeds 128 bits");
  }

  // Restoring long division of (hi:lo) by d. hi < d, so the top 128
  // quotient bits are zero and the remainder starts at hi.
  Amount remainder = p.hi;
  Amount quotient = 0;
  for (int bit = 127; bit >= 0; --bit) {
    const bool carry = (remainder >> 127) != 0;
    remainder = (remainder << 1) | ((p.lo >> bit) & 1);
    quotient <<= 1;
    if (carry || remainder >= d) {
      remainder -= d;
      quotient |= 1;
    }
  }
  return quotient;
}

Amount amountOut(Amount amount_in, Amount reserve_in, Amount reserve_out,
                 std::uint32_t fee_bps) {
  checkFee(fee_bps);
  if (amount_in == 0 || reserve_in == 0 || reserve_out == 0) {
    return 0;
  }
  checkRange(amount_in, "amount_in");
  checkRange(reserve_in, "reserve_in");
  checkRange(reserve_out, "reserve_out");

  const Amount effective_in = amount_in * (kBpsDenominator - fee_bps);
  const Amount denominator = reserve_in * kBpsDenominator + effective_in;
  return mulDiv(effective_in, reserve_out, denominator);
}

Amount amountIn(Amount amount_out, Amount reserve_in, Amount reserve_out,
                std::uint32_t fee_bps) {
  checkFee(fee_bps);
  if (amount_out == 0 || reserve_in == 0 || reserve_out == 0) {
    return 0;
  }
  if (amount_out >= reserve_out) {
    throw InsufficientLiquidity("requested " + domain::toString(amount_out) +
                                " from a reserve of " +
                                domain::toString(reserve_out));
  }
  checkRange(reserve_in, "reserve_in");
  checkRange(reserve_out, "reserve_out");

  const Amount scaled_reserve_in = reserve_in * kBpsDenominator;
  const Amount denominator =
      (reserve_out - amount_out) * (kBpsDenominator - fee_bps);
  return mulDiv(scaled_reserve_in, amount_out, denominator) + 1;
}

double midPrice(Amount reserve_in, Amount reserve_out) {
  if (reserve_in == 0 || reserve_out == 0) {
    return 0.0;
  }
  return static_cast<double>(reserve_out) / static_cast<double>(reserve_in);
}

double priceImpactPct(Amount amount_in, Amount reserve_in, Amount reserve_out,
                      std::uint32_t fee_bps) {
  const double before = midPrice(reserve_in, reserve_out);
  if (before == 0.0 || amount_in == 0) {
    return 0.0;
  }
  const Amount out = amountOut(amount_in, reserve_in, reserve_out, fee_bps);
  const double after = static_cast<double>(reserve_out - out) /
                       static_cast<double>(reserve_in + amount_in);
  return std::fabs(after - before) / before * 100.0;
}

double compositeSpreadBps(const std::vector<double>& mid_prices) {
  if (mid_prices.empty()) {
    return 0.0;
  }
  double composite = 1.0;
  for (double price : mid_prices) {
    if (!(price > 0.0)) {
      return 0.0;
    }
    composite *= price;
  }
  return std::fabs(1.0 - composite) * kBpsDenominator;
}

SignedAmount twoHopProfit(Amount amount_in, const ReservePair& leg_a,
                          const ReservePair& leg_b) {
  const Amount mid = amountOut(amount_in, leg_a);
  const Amount back = amountOut(mid, leg_b);
  return static_cast<SignedAmount>(back) - static_cast<SignedAmount>(amount_in);
}

Amount optimalAmount(const ReservePair& leg_a, const ReservePair& leg_b,
                     Amount max_amount, int iterations) {
  Amount low = 0;
  Amount high = max_amount;
  Amount best_amount = 0;
  SignedAmount best_profit = 0;

  auto consider = [&](Amount amount, SignedAmount profit) {
    if (profit > best_profit) {
      best_profit = profit;
      best_amount = amount;
    }
  };

  for (int i = 0; i < iterations && low < high; ++i) {
    const Amount mid = low + (high - low) / 2;
    // Probe a step proportional to the interval so rounding plateaus at
    // small amounts do not hide the slope.
    Amount step = (high - low) / 1024;
    if (step == 0) {
      step = 1;
    }
    const Amount probe = mid + step <= high ? mid + step : high;

    const SignedAmount profit_mid = twoHopProfit(mid, leg_a, leg_b);
    const SignedAmount profit_probe = twoHopProfit(probe, leg_a, leg_b);
    consider(mid, profit_mid);
    consider(probe, profit_probe);

    if (profit_probe > profit_mid) {
      low = probe;
    } else {
      high = mid;
    }
  }
  return best_amount;
}

}  // namespace amm
}  // namespace arb
