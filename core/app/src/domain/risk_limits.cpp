#include "arb/domain/risk_limits.hpp"
#include "arb/errors.hpp"

#include <cmath>
#include <string>

namespace arb {
namespace domain {

namespace {

void requireNonNegative(double value, const char* field) {
  if (!std::isfinite(value) || value < 0.0) {
    throw InvalidConfiguration(std::string("risk limit '") + field +
                               "' must be a finite, non-negative number");
  }
}

}  // namespace

void validateLimits(const RiskLimits& limits) {
  requireNonNegative(limits.max_daily_loss_usd, "max_daily_loss_usd");
  requireNonNegative(limits.max_notional_usd, "max_notional_usd");
  requireNonNegative(static_cast<double>(limits.max_trades_per_hour),
                     "max_trades_per_hour");
  requireNonNegative(static_cast<double>(limits.max_consecutive_losses),
                     "max_consecutive_losses");
  requireNonNegative(static_cast<double>(limits.cooldown_after_loss_ms),
                     "cooldown_after_loss_ms");
  requireNonNegative(static_cast<double>(limits.min_time_between_trades_ms),
                     "min_time_between_trades_ms");
}

}  // namespace domain
}  // namespace arb
