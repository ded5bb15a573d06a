#include "arb/engine/arbitrage_engine.hpp"
#include "arb/orchestrator/route_generator.hpp"
#include "arb/persistence/json_codec.hpp"
#include "arb/risk/risk_analytics.hpp"
#include "arb/time/time_utils.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cctype>
#include <iostream>
#include <utility>

namespace arb {

namespace {

struct ParsedCommand {
  std::string name;
  nlohmann::json args = nlohmann::json::object();
  std::string text_arg;  // remainder of a plain-text command
};

std::string trim(const std::string& s) {
  const auto first = std::find_if_not(s.begin(), s.end(), [](unsigned char c) {
    return std::isspace(c);
  });
  const auto last = std::find_if_not(s.rbegin(), s.rend(), [](unsigned char c) {
                      return std::isspace(c);
                    }).base();
  return first < last ? std::string(first, last) : std::string();
}

ParsedCommand parseCommand(const std::string& raw) {
  ParsedCommand parsed;
  const std::string cmd = trim(raw);
  if (!cmd.empty() && cmd.front() == '{') {
    parsed.args = nlohmann::json::parse(cmd);
    parsed.name = parsed.args.at("command").get<std::string>();
  } else {
    const auto space = cmd.find(' ');
    parsed.name = cmd.substr(0, space);
    if (space != std::string::npos) {
      parsed.text_arg = trim(cmd.substr(space + 1));
    }
  }
  std::transform(parsed.name.begin(), parsed.name.end(), parsed.name.begin(),
                 [](unsigned char c) { return std::toupper(c); });
  return parsed;
}

// Named argument from a JSON command, else the plain-text remainder.
std::string stringArg(const ParsedCommand& cmd, const char* key,
                      const std::string& fallback) {
  if (auto it = cmd.args.find(key); it != cmd.args.end() && it->is_string()) {
    return it->get<std::string>();
  }
  return cmd.text_arg.empty() ? fallback : cmd.text_arg;
}

domain::RiskLimitsUpdate toUpdate(const domain::RiskLimits& limits) {
  domain::RiskLimitsUpdate update;
  update.max_daily_loss_usd = limits.max_daily_loss_usd;
  update.max_notional_usd = limits.max_notional_usd;
  update.max_trades_per_hour = limits.max_trades_per_hour;
  update.max_consecutive_losses = limits.max_consecutive_losses;
  update.cooldown_after_loss_ms = limits.cooldown_after_loss_ms;
  update.min_time_between_trades_ms = limits.min_time_between_trades_ms;
  return update;
}

}  // namespace

ArbitrageEngine::ArbitrageEngine(EngineConfig config,
                                 const ITimeProvider& clock,
                                 IFeeOracle& fee_oracle,
                                 const IConfidenceScorer& scorer,
                                 ITradeStore& store, ITradeExecutor* executor,
                                 SimulationTimeProvider* sim_clock)
    : config_(std::move(config)),
      clock_(clock),
      store_(store),
      sim_clock_(sim_clock),
      book_(config_.venues.fee_bps),
      gas_(fee_oracle, config_.gas),
      executor_(executor) {
  validateEngineConfig(config_);

  risk_ = std::make_unique<RiskController>(clock_, config_.risk_limits,
                                           &store_);
  risk_->setRiskEventListener([this](const domain::RiskEventRecord& event) {
    scan_loop_.eventBus().publish(RiskEventNotice{event, ids_.next_id()});
  });

  orchestrator_ = std::make_unique<OpportunityOrchestrator>(
      config_.orchestratorConfig(),
      generateRoutes(config_.tokenSymbols(), config_.venues.dex_a,
                     config_.venues.dex_b),
      book_, gas_, scorer, *risk_, clock_);
  orchestrator_->setCandidateSink(
      [this](const domain::TradeCandidate& c) { executeCandidate(c); });

  if (executor_ == nullptr) {
    owned_executor_ = std::make_unique<PaperTradeExecutor>(clock_, ids_);
    executor_ = owned_executor_.get();
  }

  scan_loop_.eventBus().subscribe<ReserveUpdateEvent>(
      [this](const ReserveUpdateEvent& e) { processReserveUpdate(e); });

  current_date_ = utcDate(clock_.now_ms());

  std::cout << "[ArbitrageEngine] configured: " << config_.tokens.size()
            << " tokens, " << orchestrator_->routes().size() << " routes on "
            << config_.venues.dex_a << "/" << config_.venues.dex_b
            << ", mode=" << config_.mode << "\n";
}

ArbitrageEngine::~ArbitrageEngine() { stop(); }

// -----------------------------------------------------------------------------
// start / stop
// -----------------------------------------------------------------------------
void ArbitrageEngine::start() {
  if (running_) {
    return;
  }

  {
    std::lock_guard lock(date_mutex_);
    current_date_ = utcDate(clock_.now_ms());
  }
  risk_->rehydrate(store_, current_date_);

  scan_loop_.start();

  if (!config_.endpoints.ipc_cmd.empty() &&
      !config_.endpoints.ipc_pub.empty()) {
    ipc_server_ = std::make_unique<IpcServer>(
        [this](const std::string& cmd) { return executeCommand(cmd); },
        config_.endpoints.ipc_cmd, config_.endpoints.ipc_pub);
    ipc_server_->start();

    IpcServer* ipc = ipc_server_.get();
    telemetry_subscription_ = scan_loop_.eventBus().subscribe(
        [ipc](const Event& e) {
          if (!std::holds_alternative<ReserveUpdateEvent>(e)) {
            ipc->pushTelemetry(e);
          }
        });
  }

  if (!config_.endpoints.reserve_feed.empty()) {
    feed_thread_ = std::make_unique<ReserveFeedThread>(
        [this](Event event) { pushEvent(std::move(event)); },
        config_.endpoints.reserve_feed, sim_clock_);
    feed_thread_->start();
  }

  running_ = true;
  std::cout << "[ArbitrageEngine] started. Threads: scan"
            << (ipc_server_ ? ", ipc" : "")
            << (feed_thread_ ? ", reserve_feed" : "") << ".\n";
}

void ArbitrageEngine::stop() {
  if (!running_) {
    return;
  }

  // Producers first, then the loop that consumes them.
  feed_thread_.reset();
  scan_loop_.stop();
  if (telemetry_subscription_) {
    scan_loop_.eventBus().unsubscribe(*telemetry_subscription_);
    telemetry_subscription_.reset();
  }
  ipc_server_.reset();

  running_ = false;
  std::cout << "[ArbitrageEngine] stopped. All threads joined.\n";
}

void ArbitrageEngine::pushEvent(Event event) {
  scan_loop_.push(std::move(event));
}

// -----------------------------------------------------------------------------
// Scan loop
// -----------------------------------------------------------------------------
void ArbitrageEngine::rollDateIfNeeded() {
  const std::string today = utcDate(clock_.now_ms());
  {
    std::lock_guard lock(date_mutex_);
    if (today == current_date_) {
      return;
    }
    std::cout << "[ArbitrageEngine] UTC date changed " << current_date_
              << " -> " << today << "\n";
    current_date_ = today;
  }
  risk_->resetDailyCounters();
}

std::vector<domain::TradeCandidate> ArbitrageEngine::processReserveUpdate(
    const ReserveUpdateEvent& update) {
  std::vector<domain::TradeCandidate> candidates;
  if (!book_.apply(update)) {
    return candidates;
  }
  rollDateIfNeeded();
  candidates = orchestrator_->onReserveUpdate(update);
  risk_->checkLimits();
  return candidates;
}

void ArbitrageEngine::saveRecord(const domain::TradeRecord& record) {
  try {
    store_.saveTrade(record);
  } catch (const std::exception& e) {
    std::cerr << "[ArbitrageEngine] failed to persist trade " << record.id
              << ": " << e.what() << "\n";
  }
}

void ArbitrageEngine::executeCandidate(const domain::TradeCandidate& candidate) {
  const std::int64_t now = clock_.now_ms();
  scan_loop_.eventBus().publish(
      TradeCandidateEvent{candidate, now, ids_.next_id()});

  domain::TradeRecord record;
  try {
    record = executor_->execute(candidate);
  } catch (const std::exception& e) {
    std::cerr << "[ArbitrageEngine] execution failed for "
              << candidate.route.id << ": " << e.what() << "\n";
    record.id = ids_.next_trade_id(now);
    record.timestamp_ms = now;
    record.route = candidate.route.id;
    record.notional_usd = candidate.notional_usd;
    record.expected_profit_usd = candidate.net_profit_usd;
    record.realized_profit_usd = 0.0;
    record.gas_cost_usd = candidate.gas_cost_usd;
    record.score = candidate.score;
    record.status = domain::TradeStatus::Failed;
    record.mode = config_.mode;
    record.error = e.what();
    saveRecord(record);
    scan_loop_.eventBus().publish(TradeExecutedEvent{record, ids_.next_id()});
    return;
  }

  saveRecord(record);
  risk_->recordTrade({record.notional_usd, record.realized_profit_usd});
  scan_loop_.eventBus().publish(TradeExecutedEvent{record, ids_.next_id()});
}

// -----------------------------------------------------------------------------
// executeCommand
// -----------------------------------------------------------------------------
std::string ArbitrageEngine::executeCommand(const std::string& raw) {
  nlohmann::json response;
  ParsedCommand cmd;

  try {
    cmd = parseCommand(raw);

    if (cmd.name == "PING") {
      response["status"] = "ok";
      response["response"] = "PONG";
    } else if (cmd.name == "STATUS") {
      response["status"] = "ok";
      response["mode"] = config_.mode;
      response["running"] = running_.load();
      response["state"] = risk_->getState();
      response["limits"] = risk_->getLimits();
      response["routes"] = orchestrator_->routes().size();
      response["pools"] = book_.poolCount();
    } else if (cmd.name == "KILL") {
      const std::string reason = stringArg(cmd, "reason", "Manual kill switch");
      risk_->killSwitch(reason);
      response["status"] = "ok";
      response["response"] = "Kill switch activated: " + reason;
    } else if (cmd.name == "RESET") {
      risk_->resetKillSwitch();
      response["status"] = "ok";
      response["response"] = "Kill switch reset";
    } else if (cmd.name == "EMERGENCY_STOP") {
      risk_->emergencyStop();
      response["status"] = "ok";
      response["response"] = "Emergency stop activated";
    } else if (cmd.name == "RESET_DAILY") {
      risk_->resetDailyCounters();
      response["status"] = "ok";
      response["response"] = "Daily counters reset";
    } else if (cmd.name == "UPDATE_LIMITS") {
      nlohmann::json limits_json;
      if (auto it = cmd.args.find("limits"); it != cmd.args.end()) {
        limits_json = *it;
      } else {
        limits_json = nlohmann::json::parse(cmd.text_arg);
      }
      risk_->updateLimits(limits_json.get<domain::RiskLimitsUpdate>());
      response["status"] = "ok";
      response["limits"] = risk_->getLimits();
    } else if (cmd.name == "PRESET") {
      const std::string name = stringArg(cmd, "name", "");
      risk_->updateLimits(toUpdate(risk::riskPreset(name)));
      response["status"] = "ok";
      response["preset"] = name;
      response["limits"] = risk_->getLimits();
    } else {
      response["status"] = "error";
      response["response"] = "Unknown command: " + cmd.name;
    }
  } catch (const std::exception& e) {
    response = nlohmann::json::object();
    response["status"] = "error";
    response["response"] =
        (cmd.name.empty() ? std::string("Bad command") : cmd.name) + ": " +
        e.what();
  }

  return response.dump();
}

}  // namespace arb
