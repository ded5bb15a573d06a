#include "arb/risk/risk_controller.hpp"
#include "arb/errors.hpp"
#include "arb/time/time_utils.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <sstream>
#include <utility>

namespace arb {

RiskController::RiskController(const ITimeProvider& clock,
                               domain::RiskLimits limits, ITradeStore* store)
    : clock_(clock), store_(store), limits_(limits) {
  domain::validateLimits(limits_);
}

void RiskController::setRiskEventListener(RiskEventListener listener) {
  std::lock_guard lock(mutex_);
  listener_ = std::move(listener);
}

// -----------------------------------------------------------------------------
// Locked helpers
// -----------------------------------------------------------------------------

std::int64_t RiskController::tradesInWindowLocked(std::int64_t now_ms) const {
  return std::count_if(trade_times_.begin(), trade_times_.end(),
                       [now_ms](std::int64_t t) {
                         return now_ms - t < kMillisPerHour;
                       });
}

void RiskController::pruneWindowLocked(std::int64_t now_ms) {
  while (!trade_times_.empty() &&
         now_ms - trade_times_.front() >= kMillisPerHour) {
    trade_times_.pop_front();
  }
}

domain::RiskState RiskController::snapshotLocked(std::int64_t now_ms) const {
  domain::RiskState snapshot = state_;
  snapshot.trades_in_last_hour = tradesInWindowLocked(now_ms);
  return snapshot;
}

domain::RiskEventRecord RiskController::eventLocked(
    const std::string& type, const std::string& description,
    std::int64_t now_ms) const {
  domain::RiskEventRecord event;
  event.type = type;
  event.description = description;
  event.state = snapshotLocked(now_ms);
  event.timestamp_ms = now_ms;
  return event;
}

std::optional<domain::RiskEventRecord> RiskController::killLocked(
    const std::string& reason, std::int64_t now_ms) {
  if (state_.is_killed) {
    std::cerr << "[RiskController] kill requested (" << reason
              << ") but already killed: " << state_.kill_reason.value_or("")
              << "\n";
    return std::nullopt;
  }
  state_.is_killed = true;
  state_.kill_reason = reason;
  std::cerr << "[RiskController] CRITICAL: kill switch activated: " << reason
            << " (daily_pnl=" << state_.daily_pnl << ")\n";
  return eventLocked("kill_switch", reason, now_ms);
}

// -----------------------------------------------------------------------------
// Unlocked helpers
// -----------------------------------------------------------------------------

void RiskController::emit(const std::vector<domain::RiskEventRecord>& events) {
  if (events.empty()) {
    return;
  }
  RiskEventListener listener;
  {
    std::lock_guard lock(mutex_);
    listener = listener_;
  }

  for (const auto& event : events) {
    if (store_) {
      try {
        store_->recordRiskEvent(event);
      } catch (const std::exception& e) {
        std::cerr << "[RiskController] failed to persist risk event '"
                  << event.type << "': " << e.what() << "\n";
      }
    }
    if (listener) {
      listener(event);
    }
  }
}

void RiskController::reject(const char* guard,
                            const std::string& detail) const {
  std::cerr << "[RiskController] trade rejected by " << guard << ": "
            << detail << "\n";
}

// -----------------------------------------------------------------------------
// canTrade
// -----------------------------------------------------------------------------
bool RiskController::canTrade(double notional_usd,
                              double expected_profit_usd) {
  std::vector<domain::RiskEventRecord> events;
  bool allowed = false;
  {
    std::lock_guard lock(mutex_);
    const std::int64_t now = clock_.now_ms();
    pruneWindowLocked(now);
    std::ostringstream detail;

    if (state_.is_killed) {
      detail << state_.kill_reason.value_or("kill switch active");
      reject("killed", detail.str());
    } else if (!std::isfinite(notional_usd) ||
               !std::isfinite(expected_profit_usd)) {
      detail << "non-finite input (notional " << notional_usd
             << ", expected profit " << expected_profit_usd << ")";
      reject("input", detail.str());
    } else if (notional_usd > limits_.max_notional_usd) {
      detail << "notional " << notional_usd << " > "
             << limits_.max_notional_usd;
      reject("notional", detail.str());
    } else if (state_.daily_pnl + expected_profit_usd <=
               -limits_.max_daily_loss_usd) {
      detail << "projected daily pnl "
             << state_.daily_pnl + expected_profit_usd << " <= -"
             << limits_.max_daily_loss_usd;
      reject("projected_loss", detail.str());
      if (auto event = killLocked("Daily loss limit would be exceeded", now)) {
        events.push_back(std::move(*event));
      }
    } else if (state_.consecutive_losses >= limits_.max_consecutive_losses) {
      detail << state_.consecutive_losses << " consecutive losses";
      reject("streak", detail.str());
    } else if (state_.last_loss_time_ms &&
               now - *state_.last_loss_time_ms <
                   limits_.cooldown_after_loss_ms) {
      detail << (now - *state_.last_loss_time_ms) << "ms since last loss < "
             << limits_.cooldown_after_loss_ms;
      reject("cooldown", detail.str());
    } else if (state_.last_trade_time_ms &&
               now - *state_.last_trade_time_ms <
                   limits_.min_time_between_trades_ms) {
      detail << (now - *state_.last_trade_time_ms) << "ms since last trade < "
             << limits_.min_time_between_trades_ms;
      reject("spacing", detail.str());
    } else if (static_cast<std::int64_t>(trade_times_.size()) >=
               limits_.max_trades_per_hour) {
      detail << trade_times_.size() << " trades in the last hour";
      reject("hourly", detail.str());
    } else {
      allowed = true;
    }
  }
  emit(events);
  return allowed;
}

// -----------------------------------------------------------------------------
// recordTrade
// -----------------------------------------------------------------------------
void RiskController::recordTrade(const domain::TradeOutcome& outcome) {
  std::vector<domain::RiskEventRecord> events;
  {
    std::lock_guard lock(mutex_);
    const std::int64_t now = clock_.now_ms();
    pruneWindowLocked(now);

    state_.last_trade_time_ms = now;
    trade_times_.push_back(now);
    state_.daily_pnl += outcome.realized_profit_usd;

    if (outcome.realized_profit_usd <= 0.0) {
      ++state_.consecutive_losses;
      state_.last_loss_time_ms = now;
    } else {
      state_.consecutive_losses = 0;
    }

    std::cout << "[RiskController] recorded trade: notional="
              << outcome.notional_usd
              << " realized=" << outcome.realized_profit_usd
              << " daily_pnl=" << state_.daily_pnl
              << " streak=" << state_.consecutive_losses << "\n";

    if (-state_.daily_pnl >= limits_.max_daily_loss_usd) {
      if (auto event = killLocked("Daily loss limit exceeded", now)) {
        events.push_back(std::move(*event));
      }
    }

    if (state_.consecutive_losses >= kStreakEventThreshold) {
      events.push_back(eventLocked(
          "consecutive_losses",
          std::to_string(state_.consecutive_losses) + " consecutive losses",
          now));
    }
  }
  emit(events);
}

void RiskController::checkLimits() {
  std::vector<domain::RiskEventRecord> events;
  {
    std::lock_guard lock(mutex_);
    const std::int64_t now = clock_.now_ms();
    pruneWindowLocked(now);
    if (!state_.is_killed &&
        -state_.daily_pnl >= limits_.max_daily_loss_usd) {
      if (auto event = killLocked("Daily loss limit check failed", now)) {
        events.push_back(std::move(*event));
      }
    }
  }
  emit(events);
}

// -----------------------------------------------------------------------------
// Kill switch
// -----------------------------------------------------------------------------
void RiskController::killSwitch(const std::string& reason) {
  std::vector<domain::RiskEventRecord> events;
  {
    std::lock_guard lock(mutex_);
    if (auto event = killLocked(reason, clock_.now_ms())) {
      events.push_back(std::move(*event));
    }
  }
  emit(events);
}

void RiskController::emergencyStop() { killSwitch("Emergency stop activated"); }

void RiskController::resetKillSwitch() {
  std::vector<domain::RiskEventRecord> events;
  {
    std::lock_guard lock(mutex_);
    if (!state_.is_killed) {
      return;
    }
    const std::string previous = state_.kill_reason.value_or("");
    state_.is_killed = false;
    state_.kill_reason.reset();
    std::cout << "[RiskController] kill switch reset (was: " << previous
              << ")\n";
    events.push_back(eventLocked("kill_switch_reset",
                                 "Kill switch reset (was: " + previous + ")",
                                 clock_.now_ms()));
  }
  emit(events);
}

void RiskController::resetDailyCounters() {
  std::vector<domain::RiskEventRecord> events;
  {
    std::lock_guard lock(mutex_);
    const std::int64_t now = clock_.now_ms();
    std::cout << "[RiskController] daily reset at " << utcDate(now)
              << " (closing daily_pnl=" << state_.daily_pnl << ")\n";
    state_.daily_pnl = 0.0;
    state_.consecutive_losses = 0;
    state_.last_loss_time_ms.reset();
    events.push_back(eventLocked("daily_reset", "Daily counters reset", now));
  }
  emit(events);
}

void RiskController::updateLimits(const domain::RiskLimitsUpdate& update) {
  std::vector<domain::RiskEventRecord> events;
  {
    std::lock_guard lock(mutex_);
    domain::RiskLimits merged = domain::mergeLimits(limits_, update);
    domain::validateLimits(merged);
    limits_ = merged;
    std::cout << "[RiskController] limits updated: max_daily_loss="
              << limits_.max_daily_loss_usd
              << " max_notional=" << limits_.max_notional_usd
              << " max_trades_per_hour=" << limits_.max_trades_per_hour
              << "\n";
    events.push_back(
        eventLocked("limits_updated", "Risk limits updated", clock_.now_ms()));
  }
  emit(events);
}

domain::RiskLimits RiskController::getLimits() const {
  std::lock_guard lock(mutex_);
  return limits_;
}

domain::RiskState RiskController::getState() const {
  std::lock_guard lock(mutex_);
  return snapshotLocked(clock_.now_ms());
}

bool RiskController::isKilled() const {
  std::lock_guard lock(mutex_);
  return state_.is_killed;
}

// -----------------------------------------------------------------------------
// rehydrate
// -----------------------------------------------------------------------------
void RiskController::rehydrate(ITradeStore& store, const std::string& date) {
  std::optional<domain::DailyStats> stats;
  std::vector<domain::TradeRecord> recent;
  try {
    stats = store.dailyStats(date);
    recent = store.recentTrades(kRehydrateTradeLimit);
  } catch (const std::exception& e) {
    std::cerr << "[RiskController] rehydration from store failed, starting "
                 "from defaults: "
              << e.what() << "\n";
    return;
  }

  std::lock_guard lock(mutex_);
  const std::int64_t now = clock_.now_ms();

  state_.daily_pnl = stats ? stats->daily_pnl : 0.0;
  state_.consecutive_losses = 0;
  state_.last_trade_time_ms.reset();
  state_.last_loss_time_ms.reset();
  trade_times_.clear();

  bool streak_open = true;
  for (const auto& record : recent) {  // most recent first
    if (record.status != domain::TradeStatus::Success) {
      continue;
    }
    if (!state_.last_trade_time_ms) {
      state_.last_trade_time_ms = record.timestamp_ms;
    }
    if (now - record.timestamp_ms < kMillisPerHour &&
        record.timestamp_ms <= now) {
      trade_times_.push_front(record.timestamp_ms);
    }
    if (utcDate(record.timestamp_ms) != date) {
      streak_open = false;
      continue;
    }
    const bool loss = record.realized_profit_usd <= 0.0;
    if (loss && !state_.last_loss_time_ms) {
      state_.last_loss_time_ms = record.timestamp_ms;
    }
    if (streak_open) {
      if (loss) {
        ++state_.consecutive_losses;
      } else {
        streak_open = false;
      }
    }
  }

  std::cout << "[RiskController] rehydrated for " << date
            << ": daily_pnl=" << state_.daily_pnl
            << " streak=" << state_.consecutive_losses
            << " trades_in_last_hour=" << trade_times_.size() << "\n";
}

}  // namespace arb
