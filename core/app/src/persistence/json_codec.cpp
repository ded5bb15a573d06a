#include "arb/persistence/json_codec.hpp"

#include <string>

namespace arb {
namespace domain {

namespace {

template <typename T>
nlohmann::json optionalToJson(const std::optional<T>& value) {
  return value ? nlohmann::json(*value) : nlohmann::json(nullptr);
}

template <typename T>
std::optional<T> optionalFromJson(const nlohmann::json& j, const char* key) {
  auto it = j.find(key);
  if (it == j.end() || it->is_null()) {
    return std::nullopt;
  }
  return it->get<T>();
}

}  // namespace

void to_json(nlohmann::json& j, const RiskState& state) {
  j = nlohmann::json{
      {"is_killed", state.is_killed},
      {"kill_reason", optionalToJson(state.kill_reason)},
      {"daily_pnl", state.daily_pnl},
      {"consecutive_losses", state.consecutive_losses},
      {"last_trade_time_ms", optionalToJson(state.last_trade_time_ms)},
      {"last_loss_time_ms", optionalToJson(state.last_loss_time_ms)},
      {"trades_in_last_hour", state.trades_in_last_hour}};
}

void from_json(const nlohmann::json& j, RiskState& state) {
  state.is_killed = j.value("is_killed", false);
  state.kill_reason = optionalFromJson<std::string>(j, "kill_reason");
  state.daily_pnl = j.value("daily_pnl", 0.0);
  state.consecutive_losses = j.value("consecutive_losses", std::int64_t{0});
  state.last_trade_time_ms =
      optionalFromJson<std::int64_t>(j, "last_trade_time_ms");
  state.last_loss_time_ms =
      optionalFromJson<std::int64_t>(j, "last_loss_time_ms");
  state.trades_in_last_hour = j.value("trades_in_last_hour", std::int64_t{0});
}

void to_json(nlohmann::json& j, const RiskLimits& limits) {
  j = nlohmann::json{
      {"max_daily_loss_usd", limits.max_daily_loss_usd},
      {"max_notional_usd", limits.max_notional_usd},
      {"max_trades_per_hour", limits.max_trades_per_hour},
      {"max_consecutive_losses", limits.max_consecutive_losses},
      {"cooldown_after_loss_ms", limits.cooldown_after_loss_ms},
      {"min_time_between_trades_ms", limits.min_time_between_trades_ms}};
}

void from_json(const nlohmann::json& j, RiskLimitsUpdate& update) {
  update.max_daily_loss_usd = optionalFromJson<double>(j, "max_daily_loss_usd");
  update.max_notional_usd = optionalFromJson<double>(j, "max_notional_usd");
  update.max_trades_per_hour =
      optionalFromJson<std::int64_t>(j, "max_trades_per_hour");
  update.max_consecutive_losses =
      optionalFromJson<std::int64_t>(j, "max_consecutive_losses");
  update.cooldown_after_loss_ms =
      optionalFromJson<std::int64_t>(j, "cooldown_after_loss_ms");
  update.min_time_between_trades_ms =
      optionalFromJson<std::int64_t>(j, "min_time_between_trades_ms");
}

void to_json(nlohmann::json& j, const TradeRecord& record) {
  j = nlohmann::json{{"id", record.id},
                     {"timestamp_ms", record.timestamp_ms},
                     {"route", record.route},
                     {"notional_usd", record.notional_usd},
                     {"expected_profit_usd", record.expected_profit_usd},
                     {"realized_profit_usd", record.realized_profit_usd},
                     {"gas_cost_usd", record.gas_cost_usd},
                     {"score", record.score},
                     {"status", toString(record.status)},
                     {"mode", record.mode},
                     {"tx_ref", optionalToJson(record.tx_ref)},
                     {"error", optionalToJson(record.error)}};
}

void from_json(const nlohmann::json& j, TradeRecord& record) {
  record.id = j.at("id").get<std::string>();
  record.timestamp_ms = j.at("timestamp_ms").get<std::int64_t>();
  record.route = j.at("route").get<std::string>();
  record.notional_usd = j.at("notional_usd").get<double>();
  record.expected_profit_usd = j.at("expected_profit_usd").get<double>();
  record.realized_profit_usd = j.at("realized_profit_usd").get<double>();
  record.gas_cost_usd = j.value("gas_cost_usd", 0.0);
  record.score = j.value("score", 0.0);
  record.status = tradeStatusFromString(j.at("status").get<std::string>());
  record.mode = j.value("mode", std::string("paper"));
  record.tx_ref = optionalFromJson<std::string>(j, "tx_ref");
  record.error = optionalFromJson<std::string>(j, "error");
}

void to_json(nlohmann::json& j, const RiskEventRecord& event) {
  j = nlohmann::json{{"type", event.type},
                     {"description", event.description},
                     {"state", event.state},
                     {"timestamp_ms", event.timestamp_ms}};
}

void from_json(const nlohmann::json& j, RiskEventRecord& event) {
  event.type = j.at("type").get<std::string>();
  event.description = j.at("description").get<std::string>();
  event.state = j.at("state").get<RiskState>();
  event.timestamp_ms = j.at("timestamp_ms").get<std::int64_t>();
}

void to_json(nlohmann::json& j, const TradeCandidate& candidate) {
  nlohmann::json legs = nlohmann::json::array();
  for (Amount out : candidate.leg_amounts_out) {
    legs.push_back(toString(out));
  }
  j = nlohmann::json{
      {"route", candidate.route.id},
      {"venues", candidate.route.venues},
      {"notional_usd", candidate.notional_usd},
      {"amount_in", toString(candidate.amount_in)},
      {"leg_amounts_out", std::move(legs)},
      {"gross_profit_native", toString(candidate.gross_profit_native)},
      {"net_profit_native", toString(candidate.net_profit_native)},
      {"gross_profit_usd", candidate.gross_profit_usd},
      {"gas_cost_usd", candidate.gas_cost_usd},
      {"slippage_cost_usd", candidate.slippage_cost_usd},
      {"net_profit_usd", candidate.net_profit_usd},
      {"spread_bps", candidate.spread_bps},
      {"score", candidate.score}};
}

}  // namespace domain
}  // namespace arb
