// =============================================================================
// amm_math_test.cpp
// =============================================================================
// Unit tests for the integer constant-product math in arb::amm.
//
// Validates:
//   - amountOut / amountIn hand-computed values and their inverse relation
//   - mulDiv through the 256-bit path, divide-by-zero and overflow
//   - operand validation (fee, uint112 range, insufficient liquidity)
//   - spread, mid price and price impact helpers
//   - twoHopProfit and the slope-probe optimalAmount search
//
// 128-bit values are compared through domain::toString() so failures print
// readable decimals.
// =============================================================================

#include "arb/amm/amm_math.hpp"
#include "arb/errors.hpp"

#include <gtest/gtest.h>

#include <stdexcept>
#include <string>

using arb::amm::Amount;
using arb::amm::ReservePair;
using arb::amm::SignedAmount;
using arb::domain::toString;

namespace {

Amount pow2(int bits) { return static_cast<Amount>(1) << bits; }

}  // namespace

// -----------------------------------------------------------------------------
// 1. amountOut on a 10000/10000 pool with a 30 bps fee.
//    eff = 1000 * 9970, out = floor(9970000 * 10000 / 109970000) = 906
// -----------------------------------------------------------------------------
TEST(AmmMathTest, AmountOutMatchesHandComputedValue) {
  EXPECT_EQ(toString(arb::amm::amountOut(1000, 10000, 10000, 30)), "906");
}

TEST(AmmMathTest, AmountOutZeroOperandsReturnZero) {
  EXPECT_EQ(toString(arb::amm::amountOut(0, 10000, 10000)), "0");
  EXPECT_EQ(toString(arb::amm::amountOut(1000, 0, 10000)), "0");
  EXPECT_EQ(toString(arb::amm::amountOut(1000, 10000, 0)), "0");
}

// -----------------------------------------------------------------------------
// 2. The pool can never be drained: even the largest legal input leaves
//    output strictly below reserve_out.
// -----------------------------------------------------------------------------
TEST(AmmMathTest, AmountOutAlwaysBelowReserve) {
  const Amount out =
      arb::amm::amountOut(arb::domain::kMaxReserve, 1000, 1000, 0);
  EXPECT_TRUE(out < 1000) << toString(out);
}

TEST(AmmMathTest, ZeroFeeGivesMoreThanNonZeroFee) {
  const Amount no_fee = arb::amm::amountOut(1000, 10000, 10000, 0);
  const Amount with_fee = arb::amm::amountOut(1000, 10000, 10000, 30);
  EXPECT_TRUE(no_fee > with_fee);
}

// -----------------------------------------------------------------------------
// 3. amountIn(906) on the same pool is 1000; the +1 makes the required
//    input sufficient despite floor division.
// -----------------------------------------------------------------------------
TEST(AmmMathTest, AmountInInvertsAmountOut) {
  EXPECT_EQ(toString(arb::amm::amountIn(906, 10000, 10000, 30)), "1000");

  const Amount reserve_in = 5000000000ULL;
  const Amount reserve_out = 3000000000000ULL;
  for (Amount want : {Amount{1}, Amount{777}, Amount{123456789}}) {
    const Amount need = arb::amm::amountIn(want, reserve_in, reserve_out, 25);
    EXPECT_TRUE(arb::amm::amountOut(need, reserve_in, reserve_out, 25) >= want)
        << "want=" << toString(want);
  }
}

TEST(AmmMathTest, AmountInThrowsWhenOutputExceedsReserve) {
  EXPECT_THROW(arb::amm::amountIn(10000, 10000, 10000), arb::InsufficientLiquidity);
  EXPECT_THROW(arb::amm::amountIn(20000, 10000, 10000), arb::InsufficientLiquidity);
}

TEST(AmmMathTest, FeeAtOrAboveDenominatorIsRejected) {
  EXPECT_THROW(arb::amm::amountOut(1, 10, 10, 10000), arb::InvalidConfiguration);
  EXPECT_THROW(arb::amm::amountIn(1, 10, 10, 10001), arb::InvalidConfiguration);
}

TEST(AmmMathTest, ReservesAboveUint112AreRejected) {
  const Amount too_big = arb::domain::kMaxReserve + 1;
  EXPECT_THROW(arb::amm::amountOut(1, too_big, 10), std::out_of_range);
  EXPECT_THROW(arb::amm::amountOut(too_big, 10, 10), std::out_of_range);
  EXPECT_THROW(arb::amm::amountIn(1, 10, too_big), std::out_of_range);
}

// -----------------------------------------------------------------------------
// 4. mulDiv: the full product of two 100-bit values needs 200 bits.
// -----------------------------------------------------------------------------
TEST(AmmMathTest, MulDivUsesWideIntermediate) {
  EXPECT_EQ(toString(arb::amm::mulDiv(pow2(100), pow2(100), pow2(90))),
            toString(pow2(110)));
  EXPECT_EQ(toString(arb::amm::mulDiv(pow2(127), 2, 4)), toString(pow2(126)));
  EXPECT_EQ(toString(arb::amm::mulDiv(7, 3, 2)), "10");
}

TEST(AmmMathTest, MulDivRejectsZeroDivisorAndOverflow) {
  EXPECT_THROW(arb::amm::mulDiv(1, 1, 0), std::domain_error);
  EXPECT_THROW(arb::amm::mulDiv(pow2(127), pow2(127), 1), std::overflow_error);
}

TEST(AmmMathTest, MidPriceAndSpread) {
  EXPECT_DOUBLE_EQ(arb::amm::midPrice(100, 250), 2.5);
  EXPECT_DOUBLE_EQ(arb::amm::midPrice(0, 250), 0.0);

  EXPECT_NEAR(arb::amm::compositeSpreadBps({1.01, 1.0}), 100.0, 1e-6);
  EXPECT_NEAR(arb::amm::compositeSpreadBps({2.0, 0.5}), 0.0, 1e-9);
  EXPECT_DOUBLE_EQ(arb::amm::compositeSpreadBps({}), 0.0);
  EXPECT_DOUBLE_EQ(arb::amm::compositeSpreadBps({1.2, 0.0}), 0.0);
}

TEST(AmmMathTest, PriceImpactGrowsWithSize) {
  const Amount r_in = 1000000000;
  const Amount r_out = 2000000000;
  double previous = 0.0;
  for (Amount size : {Amount{1000}, Amount{100000}, Amount{10000000},
                      Amount{500000000}}) {
    const double impact = arb::amm::priceImpactPct(size, r_in, r_out);
    EXPECT_GE(impact, previous);
    previous = impact;
  }
  EXPECT_DOUBLE_EQ(arb::amm::priceImpactPct(1000, 0, r_out), 0.0);
}

// -----------------------------------------------------------------------------
// 5. Two pools quoting 1.1 and 1.0 in opposite directions leave a profitable
//    loop for small sizes; identical pools never do.
// -----------------------------------------------------------------------------
TEST(AmmMathTest, TwoHopProfitSign) {
  const ReservePair cheap{1000000, 1100000, 30};
  const ReservePair fair{1000000, 1000000, 30};

  EXPECT_TRUE(arb::amm::twoHopProfit(1000, cheap, fair) > 0);
  EXPECT_TRUE(arb::amm::twoHopProfit(1000, fair, fair) < 0);
}

TEST(AmmMathTest, OptimalAmountIsZeroWithoutArbitrage) {
  const ReservePair fair{1000000, 1000000, 30};
  EXPECT_EQ(toString(arb::amm::optimalAmount(fair, fair, 500000)), "0");
}

TEST(AmmMathTest, OptimalAmountBeatsCoarseGrid) {
  const ReservePair cheap{1000000, 1100000, 30};
  const ReservePair fair{1000000, 1000000, 30};

  const Amount best = arb::amm::optimalAmount(cheap, fair, 500000, 40);
  const SignedAmount best_profit = arb::amm::twoHopProfit(best, cheap, fair);
  ASSERT_TRUE(best_profit > 0) << toString(best_profit);

  SignedAmount grid_best = 0;
  for (Amount x = 1000; x <= 500000; x += 1000) {
    const SignedAmount p = arb::amm::twoHopProfit(x, cheap, fair);
    if (p > grid_best) {
      grid_best = p;
    }
  }
  // Within 1% of the best grid point.
  EXPECT_TRUE(best_profit * 100 >= grid_best * 99)
      << toString(best_profit) << " vs grid " << toString(grid_best);
}

TEST(AmmMathTest, MoreIterationsNeverReduceProfit) {
  const ReservePair leg_a{2000000000, 2150000000, 30};
  const ReservePair leg_b{3000000000, 2900000000, 25};

  SignedAmount previous = 0;
  for (int iterations : {1, 3, 5, 10, 20}) {
    const Amount amount =
        arb::amm::optimalAmount(leg_a, leg_b, 1000000000, iterations);
    const SignedAmount profit =
        amount == 0 ? 0 : arb::amm::twoHopProfit(amount, leg_a, leg_b);
    EXPECT_TRUE(profit >= previous) << "iterations=" << iterations;
    previous = profit;
  }
}
