#pragma once

#include "arb/domain/risk_limits.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace arb {
namespace risk {

// -----------------------------------------------------------------------------
// Limit adjustments
// -----------------------------------------------------------------------------
// Pure transforms from one RiskLimits to another. The engine applies them
// through RiskController::updateLimits(); they never touch live state.
// Millisecond fields are rounded to the nearest integer and trade counts
// are floored.
// -----------------------------------------------------------------------------

/// volatility_score in [0, 1]. m = 1 - 0.5 * v scales loss, notional and
/// trades; streak = max(2, floor(streak * m)); cooldown * (1 + v);
/// spacing * (1 + 2v).
domain::RiskLimits adjustLimitsForVolatility(const domain::RiskLimits& base,
                                             double volatility_score);

/// m = clamp(2 * win_rate, 0.5, 1.5) * (pnl > 0 ? 1.1 : 0.9). Loss,
/// notional and trades are multiplied by m; cooldown and spacing divided.
domain::RiskLimits adjustLimitsForPerformance(const domain::RiskLimits& base,
                                              double recent_win_rate,
                                              double recent_pnl);

/// 0.7 for hours 22..6 (UTC), 1.2 for 14..18, otherwise 1.0. Scales
/// notional and trades; divides the cooldown.
domain::RiskLimits adjustLimitsForTimeOfDay(const domain::RiskLimits& base,
                                            int hour);

/// "conservative", "moderate" or "aggressive". Throws InvalidConfiguration
/// for any other name.
domain::RiskLimits riskPreset(const std::string& name);

std::vector<std::string> riskPresetNames();

// -----------------------------------------------------------------------------
// Return metrics
// -----------------------------------------------------------------------------

/// (mean - risk_free) / population stddev; 0 for n < 2 or zero stddev.
double sharpeRatio(const std::vector<double>& returns,
                   double risk_free_rate = 0.02);

/// (mean - risk_free) / rms(negative returns); +infinity when no return is
/// negative, 0 for n < 2.
double sortinoRatio(const std::vector<double>& returns,
                    double risk_free_rate = 0.02);

/// sorted[floor((1 - confidence) * n)], index clamped to [0, n - 1];
/// 0 for an empty sample.
double valueAtRisk(const std::vector<double>& returns,
                   double confidence_level = 0.95);

/// Largest peak-to-trough decline of `values` as a fraction of the peak.
double maxDrawdown(const std::vector<double>& values);

// -----------------------------------------------------------------------------
// DrawdownTracker: running maximum adverse excursion
// -----------------------------------------------------------------------------
//
// Feed it equity values in time order. A value above the previous peak
// becomes the new peak and resets the current drawdown to 0; otherwise the
// current drawdown is (peak - value) / peak and the maximum is updated.
// Not thread-safe; owned by a single caller.
// -----------------------------------------------------------------------------
class DrawdownTracker {
 public:
  DrawdownTracker() = default;
  explicit DrawdownTracker(double initial_peak) : peak_(initial_peak) {}

  void update(double value, std::int64_t timestamp_ms);

  double peak() const { return peak_; }
  double currentDrawdown() const { return current_; }
  double maxDrawdown() const { return max_; }
  std::int64_t maxDrawdownTimestampMs() const { return max_timestamp_ms_; }

 private:
  double peak_{0.0};
  double current_{0.0};
  double max_{0.0};
  std::int64_t max_timestamp_ms_{0};
};

struct PositionRisk {
  double size_usd{0.0};
  double risk_fraction{0.0};
};

/// sum(size * risk) / capital; 0 when capital <= 0.
double portfolioHeat(const std::vector<PositionRisk>& positions,
                     double total_capital);

}  // namespace risk
}  // namespace arb
