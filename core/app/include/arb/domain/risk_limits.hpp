#pragma once

#include <cstdint>
#include <optional>

namespace arb {
namespace domain {

// -----------------------------------------------------------------------------
// RiskLimits: thresholds enforced by the RiskController
// -----------------------------------------------------------------------------
//
// @brief  Mutable collection of risk parameters that govern pre-trade
//         authorization.
//
// @details
// Seeded at startup from configuration (optionally from a named preset),
// then adjustable at runtime by the operator (UPDATE_LIMITS / PRESET
// commands) or by the analytics transforms in risk_analytics.hpp.
//
// Sign convention:
//   max_daily_loss_usd is a POSITIVE magnitude. Trading is killed when
//   daily PnL reaches -max_daily_loss_usd.
//
// Thread model:
//   Plain data with value semantics. The RiskController owns the live copy
//   under its mutex; getLimits() hands out copies.
// -----------------------------------------------------------------------------
struct RiskLimits {
  /// Daily realized loss (USD, positive) at which the kill switch latches.
  double max_daily_loss_usd{100.0};

  /// Largest notional (USD) a single trade may carry.
  double max_notional_usd{1000.0};

  /// Trades allowed in the trailing 60 minutes.
  std::int64_t max_trades_per_hour{100};

  /// Streak of non-positive outcomes at which trading pauses.
  std::int64_t max_consecutive_losses{5};

  /// Quiet period after any losing (or break-even) outcome.
  std::int64_t cooldown_after_loss_ms{60000};

  /// Minimum spacing between consecutive trades.
  std::int64_t min_time_between_trades_ms{5000};
};

// -----------------------------------------------------------------------------
// RiskLimitsUpdate: partial update merged by RiskController::updateLimits()
// -----------------------------------------------------------------------------
struct RiskLimitsUpdate {
  std::optional<double> max_daily_loss_usd;
  std::optional<double> max_notional_usd;
  std::optional<std::int64_t> max_trades_per_hour;
  std::optional<std::int64_t> max_consecutive_losses;
  std::optional<std::int64_t> cooldown_after_loss_ms;
  std::optional<std::int64_t> min_time_between_trades_ms;
};

/// Copies every present field of `update` over `limits`.
inline RiskLimits mergeLimits(RiskLimits limits,
                              const RiskLimitsUpdate& update) {
  if (update.max_daily_loss_usd) {
    limits.max_daily_loss_usd = *update.max_daily_loss_usd;
  }
  if (update.max_notional_usd) {
    limits.max_notional_usd = *update.max_notional_usd;
  }
  if (update.max_trades_per_hour) {
    limits.max_trades_per_hour = *update.max_trades_per_hour;
  }
  if (update.max_consecutive_losses) {
    limits.max_consecutive_losses = *update.max_consecutive_losses;
  }
  if (update.cooldown_after_loss_ms) {
    limits.cooldown_after_loss_ms = *update.cooldown_after_loss_ms;
  }
  if (update.min_time_between_trades_ms) {
    limits.min_time_between_trades_ms = *update.min_time_between_trades_ms;
  }
  return limits;
}

/// Throws InvalidConfiguration for negative or non-finite fields.
void validateLimits(const RiskLimits& limits);

}  // namespace domain
}  // namespace arb
