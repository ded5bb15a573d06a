#include "arb/risk/risk_analytics.hpp"
#include "arb/errors.hpp"

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <limits>

namespace arb {
namespace risk {

namespace {

std::int64_t scaleMs(std::int64_t ms, double factor) {
  return static_cast<std::int64_t>(
      std::llround(static_cast<double>(ms) * factor));
}

std::int64_t floorCount(std::int64_t count, double factor) {
  return static_cast<std::int64_t>(
      std::floor(static_cast<double>(count) * factor));
}

double mean(const std::vector<double>& values) {
  double sum = 0.0;
  for (double v : values) {
    sum += v;
  }
  return sum / static_cast<double>(values.size());
}

}  // namespace

domain::RiskLimits adjustLimitsForVolatility(const domain::RiskLimits& base,
                                             double volatility_score) {
  const double m = 1.0 - volatility_score * 0.5;
  domain::RiskLimits out = base;
  out.max_daily_loss_usd = base.max_daily_loss_usd * m;
  out.max_notional_usd = base.max_notional_usd * m;
  out.max_trades_per_hour = floorCount(base.max_trades_per_hour, m);
  out.max_consecutive_losses =
      std::max<std::int64_t>(2, floorCount(base.max_consecutive_losses, m));
  out.cooldown_after_loss_ms =
      scaleMs(base.cooldown_after_loss_ms, 1.0 + volatility_score);
  out.min_time_between_trades_ms =
      scaleMs(base.min_time_between_trades_ms, 1.0 + volatility_score * 2.0);
  return out;
}

domain::RiskLimits adjustLimitsForPerformance(const domain::RiskLimits& base,
                                              double recent_win_rate,
                                              double recent_pnl) {
  const double performance = std::clamp(recent_win_rate * 2.0, 0.5, 1.5);
  const double m = performance * (recent_pnl > 0.0 ? 1.1 : 0.9);
  domain::RiskLimits out = base;
  out.max_daily_loss_usd = base.max_daily_loss_usd * m;
  out.max_notional_usd = base.max_notional_usd * m;
  out.max_trades_per_hour = floorCount(base.max_trades_per_hour, m);
  out.cooldown_after_loss_ms = scaleMs(base.cooldown_after_loss_ms, 1.0 / m);
  out.min_time_between_trades_ms =
      scaleMs(base.min_time_between_trades_ms, 1.0 / m);
  return out;
}

domain::RiskLimits adjustLimitsForTimeOfDay(const domain::RiskLimits& base,
                                            int hour) {
  double m = 1.0;
  if (hour >= 22 || hour <= 6) {
    m = 0.7;
  } else if (hour >= 14 && hour <= 18) {
    m = 1.2;
  }
  domain::RiskLimits out = base;
  out.max_notional_usd = base.max_notional_usd * m;
  out.max_trades_per_hour = floorCount(base.max_trades_per_hour, m);
  out.cooldown_after_loss_ms = scaleMs(base.cooldown_after_loss_ms, 1.0 / m);
  return out;
}

domain::RiskLimits riskPreset(const std::string& name) {
  if (name == "conservative") {
    return {25.0, 100.0, 20, 3, 300000, 30000};
  }
  if (name == "moderate") {
    return {50.0, 200.0, 50, 5, 60000, 10000};
  }
  if (name == "aggressive") {
    return {100.0, 500.0, 100, 7, 30000, 5000};
  }
  throw InvalidConfiguration("unknown risk preset '" + name + "'");
}

std::vector<std::string> riskPresetNames() {
  return {"conservative", "moderate", "aggressive"};
}

double sharpeRatio(const std::vector<double>& returns, double risk_free_rate) {
  if (returns.size() < 2) {
    return 0.0;
  }
  const double avg = mean(returns);
  double variance = 0.0;
  for (double r : returns) {
    variance += (r - avg) * (r - avg);
  }
  variance /= static_cast<double>(returns.size());
  const double stddev = std::sqrt(variance);
  if (stddev == 0.0) {
    return 0.0;
  }
  return (avg - risk_free_rate) / stddev;
}

double sortinoRatio(const std::vector<double>& returns, double risk_free_rate) {
  if (returns.size() < 2) {
    return 0.0;
  }
  const double avg = mean(returns);
  double downside_sq = 0.0;
  std::size_t downside_count = 0;
  for (double r : returns) {
    if (r < 0.0) {
      downside_sq += r * r;
      ++downside_count;
    }
  }
  if (downside_count == 0) {
    return std::numeric_limits<double>::infinity();
  }
  const double downside_dev =
      std::sqrt(downside_sq / static_cast<double>(downside_count));
  return (avg - risk_free_rate) / downside_dev;
}

double valueAtRisk(const std::vector<double>& returns,
                   double confidence_level) {
  if (returns.empty()) {
    return 0.0;
  }
  std::vector<double> sorted = returns;
  std::sort(sorted.begin(), sorted.end());
  const double raw =
      std::floor((1.0 - confidence_level) * static_cast<double>(sorted.size()));
  const std::size_t index = static_cast<std::size_t>(
      std::clamp(raw, 0.0, static_cast<double>(sorted.size() - 1)));
  return sorted[index];
}

double maxDrawdown(const std::vector<double>& values) {
  DrawdownTracker tracker;
  for (double v : values) {
    tracker.update(v, 0);
  }
  return tracker.maxDrawdown();
}

void DrawdownTracker::update(double value, std::int64_t timestamp_ms) {
  if (value > peak_) {
    peak_ = value;
    current_ = 0.0;
    return;
  }
  if (peak_ <= 0.0) {
    current_ = 0.0;
    return;
  }
  current_ = (peak_ - value) / peak_;
  if (current_ > max_) {
    max_ = current_;
    max_timestamp_ms_ = timestamp_ms;
  }
}

double portfolioHeat(const std::vector<PositionRisk>& positions,
                     double total_capital) {
  if (total_capital <= 0.0) {
    return 0.0;
  }
  double total_risk = 0.0;
  for (const auto& position : positions) {
    total_risk += position.size_usd * position.risk_fraction;
  }
  return total_risk / total_capital;
}

}  // namespace risk
}  // namespace arb
