#pragma once

#include "arb/domain/risk_limits.hpp"
#include "arb/domain/risk_state.hpp"
#include "arb/domain/trade_record.hpp"
#include "arb/persistence/i_trade_store.hpp"
#include "arb/time/i_time_provider.hpp"

#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace arb {

// -----------------------------------------------------------------------------
// RiskController
// -----------------------------------------------------------------------------
//
// @brief  Stateful pre-trade authorization gate with a latching kill switch.
//
// @details
// Every candidate must pass canTrade() before execution, and every executed
// trade must be reported through recordTrade(). The controller owns the
// only live RiskState and RiskLimits; callers receive copies.
//
// canTrade(notional, expected) evaluates, in order, and stops at the first
// failing guard:
//
//   1. killed          kill switch latched
//      input           notional or expected profit is NaN or infinite
//   2. notional        notional > max_notional_usd
//   3. projected_loss  daily_pnl + expected <= -max_daily_loss_usd
//                      (this guard also LATCHES the kill switch)
//   4. streak          consecutive_losses >= max_consecutive_losses
//   5. cooldown        now - last_loss_time < cooldown_after_loss_ms
//   6. spacing         now - last_trade_time < min_time_between_trades_ms
//   7. hourly          trades in the trailing hour >= max_trades_per_hour
//
// recordTrade() always applies the outcome, then latches the kill switch
// when -daily_pnl >= max_daily_loss_usd. An outcome with realized profit
// <= 0 extends the loss streak and starts a cooldown; a profitable one
// resets the streak.
//
// States: Active and Killed. Killed -> Active only through
// resetKillSwitch(). While Killed, further kill requests keep the first
// reason.
//
// Risk events:
//   kill_switch, kill_switch_reset, consecutive_losses (streak >= 3),
//   limits_updated, daily_reset. Each is written to the ITradeStore (if
//   any) and handed to the listener (if any) AFTER the mutex is released,
//   using a state snapshot taken under the mutex. A store failure is
//   logged; state is never rolled back.
//
// Thread model:
//   One std::mutex guards all state. canTrade() and recordTrade() run on
//   the scan loop; kill, reset and updateLimits arrive from the IPC thread.
//   The listener runs on whichever thread caused the event.
//
// Ownership:
//   Holds references to the ITimeProvider and (optionally) the
//   ITradeStore; both must outlive the controller.
// -----------------------------------------------------------------------------
class RiskController {
 public:
  using RiskEventListener =
      std::function<void(const domain::RiskEventRecord& event)>;

  /// Loss streak length at which a consecutive_losses event is written.
  static constexpr std::int64_t kStreakEventThreshold = 3;

  /// Trade records read back by rehydrate().
  static constexpr std::size_t kRehydrateTradeLimit = 1000;

  RiskController(const ITimeProvider& clock, domain::RiskLimits limits,
                 ITradeStore* store = nullptr);

  RiskController(const RiskController&) = delete;
  RiskController& operator=(const RiskController&) = delete;
  RiskController(RiskController&&) = delete;
  RiskController& operator=(RiskController&&) = delete;

  void setRiskEventListener(RiskEventListener listener);

  // -------------------------------------------------------------------------
  // canTrade(notional_usd, expected_profit_usd)
  // -------------------------------------------------------------------------
  //
  // @return true when every guard passes. Never throws.
  //
  // Side-effects: may latch the kill switch (projected daily loss). Each
  // rejection is logged to std::cerr with the guard name.
  // -------------------------------------------------------------------------
  bool canTrade(double notional_usd, double expected_profit_usd);

  void recordTrade(const domain::TradeOutcome& outcome);

  // Periodic check: latches the kill switch if the realized daily loss
  // has reached the limit while still Active.
  void checkLimits();

  void killSwitch(const std::string& reason);
  void emergencyStop();
  void resetKillSwitch();

  /// Day boundary: zeroes daily_pnl and consecutive_losses and clears the
  /// last loss time. The kill switch and the hourly window are untouched.
  void resetDailyCounters();

  /// Merges the present fields. Throws InvalidConfiguration (and changes
  /// nothing) when the merged limits are invalid.
  void updateLimits(const domain::RiskLimitsUpdate& update);

  domain::RiskLimits getLimits() const;
  domain::RiskState getState() const;
  bool isKilled() const;

  // -------------------------------------------------------------------------
  // rehydrate(store, date)
  // -------------------------------------------------------------------------
  //
  // @brief  Restores state from persisted history at startup.
  //
  // @details
  // daily_pnl comes from store.dailyStats(date). From the most recent
  // successful trades: last_trade_time, the hourly window, and (restricted
  // to trades on `date`) the trailing loss streak and last_loss_time.
  // A store failure is logged and leaves the current state unchanged.
  // -------------------------------------------------------------------------
  void rehydrate(ITradeStore& store, const std::string& date);

 private:
  // All *Locked helpers require mutex_ to be held.
  domain::RiskState snapshotLocked(std::int64_t now_ms) const;
  std::int64_t tradesInWindowLocked(std::int64_t now_ms) const;
  void pruneWindowLocked(std::int64_t now_ms);
  std::optional<domain::RiskEventRecord> killLocked(const std::string& reason,
                                                    std::int64_t now_ms);
  domain::RiskEventRecord eventLocked(const std::string& type,
                                      const std::string& description,
                                      std::int64_t now_ms) const;

  // Called without the mutex held.
  void emit(const std::vector<domain::RiskEventRecord>& events);
  void reject(const char* guard, const std::string& detail) const;

  const ITimeProvider& clock_;
  ITradeStore* store_;

  mutable std::mutex mutex_;
  domain::RiskLimits limits_;
  domain::RiskState state_;
  std::deque<std::int64_t> trade_times_;  // ascending, trailing hour
  RiskEventListener listener_;
};

}  // namespace arb
