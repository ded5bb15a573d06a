#include "arb/config/engine_config.hpp"
#include "arb/amm/amm_math.hpp"
#include "arb/errors.hpp"
#include "arb/persistence/json_codec.hpp"
#include "arb/risk/risk_analytics.hpp"

#include <nlohmann/json.hpp>

#include <cmath>
#include <fstream>
#include <set>
#include <sstream>

namespace arb {

namespace {

constexpr unsigned kMaxTokenDecimals = 30;

using nlohmann::json;

template <typename T>
void readIfPresent(const json& j, const char* key, T& out,
                   const std::string& section) {
  auto it = j.find(key);
  if (it == j.end() || it->is_null()) {
    return;
  }
  try {
    out = it->get<T>();
  } catch (const json::exception& e) {
    throw InvalidConfiguration("key '" + section + key + "': " + e.what());
  }
}

domain::TokenInfo parseToken(const json& j, std::size_t index) {
  const std::string section = "tokens[" + std::to_string(index) + "].";
  if (!j.is_object() || !j.contains("symbol")) {
    throw InvalidConfiguration("key '" + section + "symbol' is required");
  }
  domain::TokenInfo token;
  readIfPresent(j, "symbol", token.symbol, section);
  readIfPresent(j, "decimals", token.decimals, section);
  readIfPresent(j, "usd_price", token.usd_price, section);
  return token;
}

void parseRisk(const json& j, EngineConfig& config) {
  if (!j.is_object()) {
    throw InvalidConfiguration("key 'risk' must be an object");
  }
  if (auto it = j.find("preset"); it != j.end() && !it->is_null()) {
    if (!it->is_string()) {
      throw InvalidConfiguration("key 'risk.preset' must be a string");
    }
    config.risk_preset = it->get<std::string>();
    config.risk_limits = risk::riskPreset(*config.risk_preset);
  }

  domain::RiskLimitsUpdate overrides;
  try {
    overrides = j.get<domain::RiskLimitsUpdate>();
  } catch (const json::exception& e) {
    throw InvalidConfiguration(std::string("key 'risk': ") + e.what());
  }
  config.risk_limits = domain::mergeLimits(config.risk_limits, overrides);
}

}  // namespace

OrchestratorConfig EngineConfig::orchestratorConfig() const {
  OrchestratorConfig out;
  out.min_profit_usd = min_profit_usd;
  out.slippage_bps = slippage_bps;
  out.score_threshold = score_threshold;
  out.min_spread_bps = min_spread_bps;
  out.trade_sizes_usd = trade_sizes_usd;
  for (const auto& token : tokens) {
    out.tokens[token.symbol] = token;
  }
  return out;
}

std::vector<std::string> EngineConfig::tokenSymbols() const {
  std::vector<std::string> symbols;
  symbols.reserve(tokens.size());
  for (const auto& token : tokens) {
    symbols.push_back(token.symbol);
  }
  return symbols;
}

EngineConfig parseEngineConfig(const std::string& json_text) {
  json root;
  try {
    root = json::parse(json_text);
  } catch (const json::parse_error& e) {
    throw InvalidConfiguration(std::string("malformed JSON: ") + e.what());
  }
  if (!root.is_object()) {
    throw InvalidConfiguration("top-level value must be an object");
  }

  EngineConfig config;
  readIfPresent(root, "mode", config.mode, "");
  readIfPresent(root, "min_profit_usd", config.min_profit_usd, "");
  readIfPresent(root, "slippage_bps", config.slippage_bps, "");
  readIfPresent(root, "score_threshold", config.score_threshold, "");
  readIfPresent(root, "min_spread_bps", config.min_spread_bps, "");
  readIfPresent(root, "trade_sizes_usd", config.trade_sizes_usd, "");
  readIfPresent(root, "store_dir", config.store_dir, "");
  readIfPresent(root, "model_path", config.model_path, "");

  if (auto it = root.find("gas"); it != root.end()) {
    readIfPresent(*it, "base_gas_limit", config.gas.base_gas_limit, "gas.");
    readIfPresent(*it, "multiplier", config.gas.multiplier, "gas.");
    readIfPresent(*it, "native_price_usd", config.gas.native_price_usd,
                  "gas.");
    readIfPresent(*it, "fallback_cost_usd", config.gas.fallback_cost_usd,
                  "gas.");
  }

  if (auto it = root.find("risk"); it != root.end()) {
    parseRisk(*it, config);
  }

  auto tokens = root.find("tokens");
  if (tokens == root.end() || !tokens->is_array()) {
    throw InvalidConfiguration("key 'tokens' is required and must be an array");
  }
  for (std::size_t i = 0; i < tokens->size(); ++i) {
    config.tokens.push_back(parseToken((*tokens)[i], i));
  }

  if (auto it = root.find("venues"); it != root.end()) {
    readIfPresent(*it, "dex_a", config.venues.dex_a, "venues.");
    readIfPresent(*it, "dex_b", config.venues.dex_b, "venues.");
    readIfPresent(*it, "fee_bps", config.venues.fee_bps, "venues.");
  }

  if (auto it = root.find("endpoints"); it != root.end()) {
    readIfPresent(*it, "reserve_feed", config.endpoints.reserve_feed,
                  "endpoints.");
    readIfPresent(*it, "ipc_cmd", config.endpoints.ipc_cmd, "endpoints.");
    readIfPresent(*it, "ipc_pub", config.endpoints.ipc_pub, "endpoints.");
  }

  validateEngineConfig(config);
  return config;
}

EngineConfig loadEngineConfig(const std::string& path) {
  std::ifstream in(path);
  if (!in) {
    throw InvalidConfiguration("cannot open config file '" + path + "'");
  }
  std::ostringstream buffer;
  buffer << in.rdbuf();
  return parseEngineConfig(buffer.str());
}

void validateEngineConfig(const EngineConfig& config) {
  if (config.mode != "paper") {
    throw InvalidConfiguration("key 'mode': only \"paper\" is supported, got \"" +
                               config.mode + "\"");
  }
  if (!(config.min_profit_usd >= 0.0)) {
    throw InvalidConfiguration("key 'min_profit_usd' must be >= 0");
  }
  if (!(config.slippage_bps >= 0.0) ||
      config.slippage_bps >= amm::kBpsDenominator) {
    throw InvalidConfiguration("key 'slippage_bps' must be in [0, 10000)");
  }
  if (!(config.score_threshold >= 0.0 && config.score_threshold <= 1.0)) {
    throw InvalidConfiguration("key 'score_threshold' must be in [0, 1]");
  }
  if (!(config.min_spread_bps >= 0.0)) {
    throw InvalidConfiguration("key 'min_spread_bps' must be >= 0");
  }

  if (config.trade_sizes_usd.empty()) {
    throw InvalidConfiguration("key 'trade_sizes_usd' must not be empty");
  }
  for (double size : config.trade_sizes_usd) {
    if (!std::isfinite(size) || size <= 0.0) {
      throw InvalidConfiguration(
          "key 'trade_sizes_usd' must contain positive sizes only");
    }
  }

  if (config.gas.base_gas_limit == 0 || !(config.gas.multiplier > 0.0) ||
      !(config.gas.native_price_usd > 0.0) ||
      !(config.gas.fallback_cost_usd >= 0.0)) {
    throw InvalidConfiguration(
        "key 'gas': base_gas_limit, multiplier and native_price_usd must be "
        "positive");
  }

  domain::validateLimits(config.risk_limits);

  if (config.tokens.size() < 3) {
    throw InvalidConfiguration("key 'tokens' needs at least 3 tokens, got " +
                               std::to_string(config.tokens.size()));
  }
  std::set<std::string> seen;
  for (const auto& token : config.tokens) {
    if (token.symbol.empty()) {
      throw InvalidConfiguration("key 'tokens': empty symbol");
    }
    if (!seen.insert(token.symbol).second) {
      throw InvalidConfiguration("key 'tokens': duplicate symbol '" +
                                 token.symbol + "'");
    }
    if (token.decimals > kMaxTokenDecimals) {
      throw InvalidConfiguration("key 'tokens': " + token.symbol +
                                 " decimals above 30");
    }
    if (!(token.usd_price > 0.0) || !std::isfinite(token.usd_price)) {
      throw InvalidConfiguration("key 'tokens': " + token.symbol +
                                 " usd_price must be positive");
    }
  }

  if (config.venues.dex_a.empty() || config.venues.dex_b.empty() ||
      config.venues.dex_a == config.venues.dex_b) {
    throw InvalidConfiguration(
        "key 'venues': dex_a and dex_b must be two distinct venues");
  }
  for (const auto& [venue, fee] : config.venues.fee_bps) {
    if (fee >= amm::kBpsDenominator) {
      throw InvalidConfiguration("key 'venues.fee_bps." + venue +
                                 "' must be below 10000");
    }
  }
}

}  // namespace arb
