// =============================================================================
// risk_controller_test.cpp
// =============================================================================
// Unit tests for arb::RiskController.
//
// Validates:
//   - Each canTrade() guard in isolation, and the guard order
//   - Kill switch latching from recordTrade(), canTrade() and checkLimits()
//   - First kill reason wins; reset clears it
//   - Daily reset, limit updates (merge + validation)
//   - Risk events reach the store and the listener; store failures do not
//     roll back state
//   - rehydrate() from persisted trade history
//   - Concurrent recordTrade() from several threads
//
// Time is driven by SimulationTimeProvider so cooldown, spacing and the
// hourly window are exercised without sleeping.
// =============================================================================

#include "arb/errors.hpp"
#include "arb/persistence/in_memory_trade_store.hpp"
#include "arb/risk/risk_controller.hpp"
#include "arb/time/simulation_time_provider.hpp"

#include <gtest/gtest.h>

#include <limits>
#include <memory>
#include <string>
#include <thread>
#include <vector>

namespace {

// 2024-01-01 12:00:00 UTC
constexpr std::int64_t kNoon = 1704110400000;
constexpr std::int64_t kHour = 3600000;

arb::domain::TradeRecord makeRecord(std::int64_t ts, double realized,
                                    arb::domain::TradeStatus status =
                                        arb::domain::TradeStatus::Success) {
  arb::domain::TradeRecord r;
  r.id = "t-" + std::to_string(ts);
  r.timestamp_ms = ts;
  r.route = "USDC-WETH";
  r.notional_usd = 100.0;
  r.realized_profit_usd = realized;
  r.status = status;
  return r;
}

}  // namespace

class RiskControllerTest : public ::testing::Test {
 protected:
  arb::SimulationTimeProvider clock{kNoon};
  arb::InMemoryTradeStore store;
  arb::domain::RiskLimits limits;  // 100 / 1000 / 100 / 5 / 60000 / 5000
  std::unique_ptr<arb::RiskController> risk;

  void SetUp() override { rebuild(); }

  void rebuild() {
    risk = std::make_unique<arb::RiskController>(clock, limits, &store);
  }

  std::vector<std::string> eventTypes() const {
    std::vector<std::string> types;
    for (const auto& e : store.riskEvents()) {
      types.push_back(e.type);
    }
    return types;
  }
};

// -----------------------------------------------------------------------------
// 1. A fresh controller allows a trade within limits.
// -----------------------------------------------------------------------------
TEST_F(RiskControllerTest, FreshControllerAllowsTrade) {
  EXPECT_TRUE(risk->canTrade(500.0, 5.0));
  const auto state = risk->getState();
  EXPECT_FALSE(state.is_killed);
  EXPECT_DOUBLE_EQ(state.daily_pnl, 0.0);
  EXPECT_EQ(state.trades_in_last_hour, 0);
}

TEST_F(RiskControllerTest, NotionalGuardIsStrictlyAbove) {
  EXPECT_TRUE(risk->canTrade(1000.0, 1.0));
  EXPECT_FALSE(risk->canTrade(1000.01, 1.0));
}

TEST_F(RiskControllerTest, NonFiniteInputsAreRejected) {
  const double nan = std::numeric_limits<double>::quiet_NaN();
  const double inf = std::numeric_limits<double>::infinity();

  EXPECT_FALSE(risk->canTrade(nan, 1.0));
  EXPECT_FALSE(risk->canTrade(100.0, nan));
  EXPECT_FALSE(risk->canTrade(-inf, 1.0));
  EXPECT_FALSE(risk->canTrade(100.0, inf));
  EXPECT_FALSE(risk->isKilled());
  EXPECT_TRUE(risk->canTrade(100.0, 1.0));
}

// -----------------------------------------------------------------------------
// 2. A candidate whose expected profit would push the day to the loss limit
//    is rejected AND latches the kill switch.
// -----------------------------------------------------------------------------
TEST_F(RiskControllerTest, ProjectedLossLatchesKillSwitch) {
  EXPECT_FALSE(risk->canTrade(100.0, -100.0));
  const auto state = risk->getState();
  EXPECT_TRUE(state.is_killed);
  ASSERT_TRUE(state.kill_reason.has_value());
  EXPECT_EQ(*state.kill_reason, "Daily loss limit would be exceeded");
  EXPECT_EQ(eventTypes(), std::vector<std::string>{"kill_switch"});
}

// -----------------------------------------------------------------------------
// 3. Guard order: the notional guard runs before the projected-loss guard,
//    so an oversized candidate with a large expected loss does not kill.
// -----------------------------------------------------------------------------
TEST_F(RiskControllerTest, NotionalGuardPrecedesProjectedLoss) {
  EXPECT_FALSE(risk->canTrade(5000.0, -500.0));
  EXPECT_FALSE(risk->isKilled());
}

TEST_F(RiskControllerTest, SingleLossAtLimitBlocksEveryTrade) {
  risk->recordTrade({100.0, -100.0});
  const auto state = risk->getState();
  EXPECT_TRUE(state.is_killed);
  EXPECT_FALSE(state.kill_reason.value_or("").empty());

  clock.advance_by(kHour * 2);
  EXPECT_FALSE(risk->canTrade(0.0, 0.0));
  EXPECT_FALSE(risk->canTrade(1.0, 50.0));
}

TEST_F(RiskControllerTest, RealizedLossAtLimitKills) {
  risk->recordTrade({100.0, -60.0});
  EXPECT_FALSE(risk->isKilled());

  clock.advance_by(1000);
  risk->recordTrade({100.0, -40.0});
  const auto state = risk->getState();
  EXPECT_TRUE(state.is_killed);
  EXPECT_EQ(state.kill_reason.value_or(""), "Daily loss limit exceeded");
  EXPECT_FALSE(risk->canTrade(10.0, 1.0));
}

// -----------------------------------------------------------------------------
// 4. The first kill reason is kept; later kill requests write no event.
// -----------------------------------------------------------------------------
TEST_F(RiskControllerTest, FirstKillReasonWins) {
  risk->killSwitch("operator halt");
  risk->emergencyStop();
  risk->recordTrade({100.0, -500.0});

  EXPECT_EQ(risk->getState().kill_reason.value_or(""), "operator halt");
  int kills = 0;
  for (const auto& type : eventTypes()) {
    kills += type == "kill_switch" ? 1 : 0;
  }
  EXPECT_EQ(kills, 1);
}

TEST_F(RiskControllerTest, EmergencyStopReason) {
  risk->emergencyStop();
  EXPECT_EQ(risk->getState().kill_reason.value_or(""),
            "Emergency stop activated");
}

TEST_F(RiskControllerTest, ResetKillSwitchClearsReasonAndLogsEvent) {
  risk->killSwitch("manual");
  risk->resetKillSwitch();

  const auto state = risk->getState();
  EXPECT_FALSE(state.is_killed);
  EXPECT_FALSE(state.kill_reason.has_value());
  EXPECT_TRUE(risk->canTrade(100.0, 1.0));

  const auto events = store.riskEvents();
  ASSERT_EQ(events.size(), 2u);
  EXPECT_EQ(events[1].type, "kill_switch_reset");
  EXPECT_FALSE(events[1].state.is_killed);

  // Resetting an active controller is a no-op.
  risk->resetKillSwitch();
  EXPECT_EQ(store.riskEvents().size(), 2u);
}

// -----------------------------------------------------------------------------
// 5. Loss streak: five losses spaced beyond the cooldown block trading even
//    though cooldown and spacing have elapsed. Events fire from streak 3.
// -----------------------------------------------------------------------------
TEST_F(RiskControllerTest, ConsecutiveLossGuard) {
  for (int i = 0; i < 5; ++i) {
    risk->recordTrade({100.0, -1.0});
    clock.advance_by(limits.cooldown_after_loss_ms + 1);
  }
  EXPECT_EQ(risk->getState().consecutive_losses, 5);
  EXPECT_FALSE(risk->canTrade(100.0, 1.0));
  EXPECT_FALSE(risk->isKilled());

  int streak_events = 0;
  for (const auto& type : eventTypes()) {
    streak_events += type == "consecutive_losses" ? 1 : 0;
  }
  EXPECT_EQ(streak_events, 3);

  // Only a daily reset lifts the streak guard.
  risk->resetDailyCounters();
  EXPECT_TRUE(risk->canTrade(100.0, 1.0));
}

TEST_F(RiskControllerTest, BreakEvenCountsAsLossAndProfitResetsStreak) {
  risk->recordTrade({100.0, 0.0});
  EXPECT_EQ(risk->getState().consecutive_losses, 1);
  EXPECT_TRUE(risk->getState().last_loss_time_ms.has_value());

  clock.advance_by(kHour);
  risk->recordTrade({100.0, 2.0});
  EXPECT_EQ(risk->getState().consecutive_losses, 0);
}

// -----------------------------------------------------------------------------
// 5b. The streak counts losses since the last profitable trade, and a
//     break-even outcome extends it.
// -----------------------------------------------------------------------------
TEST_F(RiskControllerTest, StreakAfterProfitCountsLaterLosses) {
  for (double pnl : {2.0, -1.0, -2.0, -1.5}) {
    risk->recordTrade({100.0, pnl});
    clock.advance_by(1000);
  }
  EXPECT_EQ(risk->getState().consecutive_losses, 3);
}

TEST_F(RiskControllerTest, StreakIncludesBreakEvenOutcomes) {
  for (double pnl : {-1.0, 0.0, -1.0}) {
    risk->recordTrade({100.0, pnl});
    clock.advance_by(1000);
  }
  EXPECT_EQ(risk->getState().consecutive_losses, 3);
}

TEST_F(RiskControllerTest, CooldownAfterLoss) {
  risk->recordTrade({100.0, -1.0});

  clock.advance_by(30000);
  EXPECT_FALSE(risk->canTrade(100.0, 1.0));

  clock.advance_by(30000);  // exactly cooldown_after_loss_ms
  EXPECT_TRUE(risk->canTrade(100.0, 1.0));
}

TEST_F(RiskControllerTest, MinimumSpacingBetweenTrades) {
  risk->recordTrade({100.0, 1.0});

  clock.advance_by(4999);
  EXPECT_FALSE(risk->canTrade(100.0, 1.0));

  clock.advance_by(1);
  EXPECT_TRUE(risk->canTrade(100.0, 1.0));
}

// -----------------------------------------------------------------------------
// 6. The hourly window is trailing: a trade exactly one hour old no longer
//    counts.
// -----------------------------------------------------------------------------
TEST_F(RiskControllerTest, HourlyTradeWindow) {
  limits.max_trades_per_hour = 3;
  limits.min_time_between_trades_ms = 0;
  rebuild();

  for (int i = 0; i < 3; ++i) {
    risk->recordTrade({100.0, 1.0});
    clock.advance_by(1);
  }
  EXPECT_EQ(risk->getState().trades_in_last_hour, 3);
  EXPECT_FALSE(risk->canTrade(100.0, 1.0));

  clock.advance_time(kNoon + kHour);
  EXPECT_TRUE(risk->canTrade(100.0, 1.0));
  EXPECT_EQ(risk->getState().trades_in_last_hour, 2);
}

// -----------------------------------------------------------------------------
// 7. checkLimits() kills when a tightened limit is already breached.
// -----------------------------------------------------------------------------
TEST_F(RiskControllerTest, CheckLimitsKillsAfterLimitTightened) {
  risk->recordTrade({100.0, -50.0});
  risk->checkLimits();
  EXPECT_FALSE(risk->isKilled());

  arb::domain::RiskLimitsUpdate update;
  update.max_daily_loss_usd = 40.0;
  risk->updateLimits(update);
  risk->checkLimits();

  EXPECT_TRUE(risk->isKilled());
  EXPECT_EQ(risk->getState().kill_reason.value_or(""),
            "Daily loss limit check failed");
}

TEST_F(RiskControllerTest, DailyResetKeepsKillAndWindow) {
  risk->recordTrade({100.0, -10.0});
  risk->killSwitch("manual");
  risk->resetDailyCounters();

  const auto state = risk->getState();
  EXPECT_DOUBLE_EQ(state.daily_pnl, 0.0);
  EXPECT_EQ(state.consecutive_losses, 0);
  EXPECT_FALSE(state.last_loss_time_ms.has_value());
  EXPECT_TRUE(state.is_killed);
  EXPECT_EQ(state.trades_in_last_hour, 1);
  EXPECT_EQ(eventTypes().back(), "daily_reset");
}

TEST_F(RiskControllerTest, UpdateLimitsMergesPresentFields) {
  arb::domain::RiskLimitsUpdate update;
  update.max_notional_usd = 250.0;
  update.max_trades_per_hour = 7;
  risk->updateLimits(update);

  const auto updated = risk->getLimits();
  EXPECT_DOUBLE_EQ(updated.max_notional_usd, 250.0);
  EXPECT_EQ(updated.max_trades_per_hour, 7);
  EXPECT_DOUBLE_EQ(updated.max_daily_loss_usd, limits.max_daily_loss_usd);
  EXPECT_EQ(eventTypes().back(), "limits_updated");
  EXPECT_FALSE(risk->canTrade(300.0, 1.0));
}

TEST_F(RiskControllerTest, InvalidUpdateChangesNothing) {
  arb::domain::RiskLimitsUpdate update;
  update.max_notional_usd = 10.0;
  update.max_daily_loss_usd = -1.0;
  EXPECT_THROW(risk->updateLimits(update), arb::InvalidConfiguration);

  EXPECT_DOUBLE_EQ(risk->getLimits().max_notional_usd,
                   limits.max_notional_usd);
  EXPECT_TRUE(store.riskEvents().empty());
}

TEST_F(RiskControllerTest, InvalidConstructionLimitsThrow) {
  arb::domain::RiskLimits bad;
  bad.cooldown_after_loss_ms = -5;
  EXPECT_THROW({ arb::RiskController controller(clock, bad); },
               arb::InvalidConfiguration);
}

// -----------------------------------------------------------------------------
// 8. Events go to the store and the listener with a post-transition state.
//    A failing store is logged; the state change stands.
// -----------------------------------------------------------------------------
TEST_F(RiskControllerTest, ListenerReceivesEventsWithSnapshot) {
  std::vector<arb::domain::RiskEventRecord> seen;
  risk->setRiskEventListener(
      [&seen](const arb::domain::RiskEventRecord& e) { seen.push_back(e); });

  risk->killSwitch("listener test");

  ASSERT_EQ(seen.size(), 1u);
  EXPECT_EQ(seen[0].type, "kill_switch");
  EXPECT_EQ(seen[0].description, "listener test");
  EXPECT_TRUE(seen[0].state.is_killed);
  EXPECT_EQ(seen[0].timestamp_ms, kNoon);
}

TEST_F(RiskControllerTest, StoreFailureDoesNotRollBackState) {
  int notified = 0;
  risk->setRiskEventListener(
      [&notified](const arb::domain::RiskEventRecord&) { ++notified; });
  store.setFailing(true);

  EXPECT_NO_THROW(risk->recordTrade({100.0, -150.0}));
  EXPECT_TRUE(risk->isKilled());
  EXPECT_DOUBLE_EQ(risk->getState().daily_pnl, -150.0);
  EXPECT_EQ(notified, 1);
}

TEST_F(RiskControllerTest, WorksWithoutStore) {
  arb::RiskController bare(clock, limits);
  bare.recordTrade({100.0, -200.0});
  EXPECT_TRUE(bare.isKilled());
}

// -----------------------------------------------------------------------------
// 9. rehydrate() rebuilds the day from persisted Success records:
//    pnl from dailyStats, trailing same-day loss streak, last loss and
//    last trade times, and the trailing-hour window. Failed records and
//    other days do not count toward the streak.
// -----------------------------------------------------------------------------
TEST_F(RiskControllerTest, RehydrateFromStore) {
  using arb::domain::TradeStatus;
  store.saveTrade(makeRecord(kNoon - 24 * kHour, -5.0));  // previous day
  store.saveTrade(makeRecord(kNoon - 3 * kHour, 4.0));
  store.saveTrade(makeRecord(kNoon - 2 * kHour, -1.0));
  store.saveTrade(makeRecord(kNoon - 30 * 60000, -2.0));
  store.saveTrade(makeRecord(kNoon - 10 * 60000, 0.0, TradeStatus::Failed));

  risk->rehydrate(store, "2024-01-01");

  const auto state = risk->getState();
  EXPECT_DOUBLE_EQ(state.daily_pnl, 1.0);
  EXPECT_EQ(state.consecutive_losses, 2);
  EXPECT_EQ(state.last_loss_time_ms.value_or(0), kNoon - 30 * 60000);
  EXPECT_EQ(state.last_trade_time_ms.value_or(0), kNoon - 30 * 60000);
  EXPECT_EQ(state.trades_in_last_hour, 1);
  EXPECT_FALSE(state.is_killed);
}

TEST_F(RiskControllerTest, RehydratedStreakStopsAtDateBoundary) {
  store.saveTrade(makeRecord(kNoon - 14 * kHour, -3.0));  // 2023-12-31
  store.saveTrade(makeRecord(kNoon - 13 * kHour, -3.0));  // 2023-12-31
  store.saveTrade(makeRecord(kNoon - 2 * kHour, -1.0));

  risk->rehydrate(store, "2024-01-01");

  const auto state = risk->getState();
  EXPECT_EQ(state.consecutive_losses, 1);
  EXPECT_EQ(state.last_loss_time_ms.value_or(0), kNoon - 2 * kHour);
}

TEST_F(RiskControllerTest, RehydrateUsesSeededDailyStats) {
  arb::domain::DailyStats seeded;
  seeded.date = "2024-01-01";
  seeded.daily_pnl = -42.0;
  seeded.trade_count = 9;
  store.seedDailyStats(seeded);

  risk->rehydrate(store, "2024-01-01");
  EXPECT_DOUBLE_EQ(risk->getState().daily_pnl, -42.0);
  EXPECT_EQ(risk->getState().consecutive_losses, 0);
}

TEST_F(RiskControllerTest, RehydrateFailureKeepsDefaults) {
  risk->recordTrade({100.0, 3.0});
  store.setFailing(true);

  EXPECT_NO_THROW(risk->rehydrate(store, "2024-01-01"));
  EXPECT_DOUBLE_EQ(risk->getState().daily_pnl, 3.0);
}

// -----------------------------------------------------------------------------
// 10. Concurrent recordTrade() from several threads loses no update.
// -----------------------------------------------------------------------------
TEST_F(RiskControllerTest, ConcurrentRecordTrade) {
  constexpr int kThreads = 4;
  constexpr int kPerThread = 200;
  limits.max_trades_per_hour = 100000;
  limits.min_time_between_trades_ms = 0;
  limits.cooldown_after_loss_ms = 0;
  rebuild();

  std::vector<std::thread> threads;
  for (int t = 0; t < kThreads; ++t) {
    threads.emplace_back([this] {
      for (int i = 0; i < kPerThread; ++i) {
        risk->canTrade(10.0, 1.0);
        risk->recordTrade({10.0, 0.5});
      }
    });
  }
  for (auto& t : threads) t.join();

  const auto state = risk->getState();
  EXPECT_EQ(state.trades_in_last_hour, kThreads * kPerThread);
  EXPECT_NEAR(state.daily_pnl, 0.5 * kThreads * kPerThread, 1e-6);
}
