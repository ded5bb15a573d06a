#pragma once

#include "arb/accounting/gas_estimator.hpp"
#include "arb/accounting/i_fee_oracle.hpp"
#include "arb/concurrent/event_loop_thread.hpp"
#include "arb/concurrent/trade_id_generator.hpp"
#include "arb/config/engine_config.hpp"
#include "arb/execution/i_trade_executor.hpp"
#include "arb/execution/paper_trade_executor.hpp"
#include "arb/market/reserve_book.hpp"
#include "arb/network/ipc_server.hpp"
#include "arb/network/reserve_feed_thread.hpp"
#include "arb/orchestrator/opportunity_orchestrator.hpp"
#include "arb/persistence/i_trade_store.hpp"
#include "arb/risk/risk_controller.hpp"
#include "arb/scoring/i_confidence_scorer.hpp"
#include "arb/time/i_time_provider.hpp"
#include "arb/time/simulation_time_provider.hpp"

#include <atomic>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace arb {

// -----------------------------------------------------------------------------
// ArbitrageEngine
// -----------------------------------------------------------------------------
//
// @brief  Wires the reserve feed, the scan loop, the RiskController, the
//         executor and the operator channel into one process.
//
// @details
// Data flow:
//
//   ReserveFeedThread --push--> scan EventLoopThread
//     ReserveUpdateEvent -> processReserveUpdate():
//        1. ReserveBook::apply()
//        2. UTC date rollover -> RiskController::resetDailyCounters()
//        3. OpportunityOrchestrator::onReserveUpdate()
//             candidate sink -> executeCandidate():
//               TradeCandidateEvent, executor, store.saveTrade(),
//               RiskController::recordTrade(), TradeExecutedEvent
//        4. RiskController::checkLimits()
//
// TradeCandidateEvent, TradeExecutedEvent and RiskEventNotice are
// published on the scan loop's EventBus (eventBus()). When IPC endpoints
// are configured the IpcServer subscribes to them and publishes JSON
// telemetry. Risk notices caused by IPC commands are published from the
// IPC thread; EventBus is thread-safe.
//
// Startup (start()) follows the reconcile-before-trade order:
//   rehydrate RiskController from the store, start the scan loop, start
//   the IpcServer, then start the feed.
//
// Ownership:
//   Owns the ReserveBook, GasEstimator, RiskController, orchestrator, scan
//   loop, IpcServer and feed thread. Holds references to the clock, fee
//   oracle, scorer, store and (if given) executor; all must outlive the
//   engine. With no executor a PaperTradeExecutor is created.
// -----------------------------------------------------------------------------
class ArbitrageEngine {
 public:
  ArbitrageEngine(EngineConfig config, const ITimeProvider& clock,
                  IFeeOracle& fee_oracle, const IConfidenceScorer& scorer,
                  ITradeStore& store, ITradeExecutor* executor = nullptr,
                  SimulationTimeProvider* sim_clock = nullptr);

  ~ArbitrageEngine();

  ArbitrageEngine(const ArbitrageEngine&) = delete;
  ArbitrageEngine& operator=(const ArbitrageEngine&) = delete;
  ArbitrageEngine(ArbitrageEngine&&) = delete;
  ArbitrageEngine& operator=(ArbitrageEngine&&) = delete;

  void start();
  void stop();

  /// Enqueues onto the scan loop. Thread-safe.
  void pushEvent(Event event);

  /// Scan-loop handler; also callable directly when the loop is not
  /// running (tests, replays). Returns the candidates emitted.
  std::vector<domain::TradeCandidate> processReserveUpdate(
      const ReserveUpdateEvent& update);

  // -------------------------------------------------------------------------
  // executeCommand(cmd)
  // -------------------------------------------------------------------------
  //
  // @brief  Operator command handler used by IpcServer.
  //
  // @details
  // Accepts plain text ("KILL manual stop", "PRESET moderate",
  // "UPDATE_LIMITS {...}") or JSON ({"command": "KILL", "reason": ...},
  // {"command": "UPDATE_LIMITS", "limits": {...}},
  // {"command": "PRESET", "name": ...}).
  //
  // Commands: PING, STATUS, KILL, RESET, EMERGENCY_STOP, RESET_DAILY,
  // UPDATE_LIMITS, PRESET.
  //
  // @return JSON text {"status": "ok" | "error", ...}. Never throws.
  // -------------------------------------------------------------------------
  std::string executeCommand(const std::string& cmd);

  EventBus& eventBus() { return scan_loop_.eventBus(); }
  RiskController& riskController() { return *risk_; }
  ReserveBook& reserveBook() { return book_; }
  const std::vector<domain::Route>& routes() const {
    return orchestrator_->routes();
  }
  bool isRunning() const { return running_.load(); }

 private:
  void executeCandidate(const domain::TradeCandidate& candidate);
  void saveRecord(const domain::TradeRecord& record);
  void rollDateIfNeeded();

  EngineConfig config_;
  const ITimeProvider& clock_;
  ITradeStore& store_;
  SimulationTimeProvider* sim_clock_;

  TradeIdGenerator ids_{"paper"};
  ReserveBook book_;
  accounting::GasEstimator gas_;
  std::unique_ptr<RiskController> risk_;
  std::unique_ptr<OpportunityOrchestrator> orchestrator_;
  std::unique_ptr<PaperTradeExecutor> owned_executor_;
  ITradeExecutor* executor_;

  EventLoopThread scan_loop_;
  std::unique_ptr<IpcServer> ipc_server_;
  std::optional<EventBus::SubscriptionId> telemetry_subscription_;
  std::unique_ptr<ReserveFeedThread> feed_thread_;

  std::mutex date_mutex_;
  std::string current_date_;

  // Read by executeCommand() on the IPC thread.
  std::atomic<bool> running_{false};
};

}  // namespace arb
