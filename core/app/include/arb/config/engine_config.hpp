#pragma once

#include "arb/accounting/gas_estimator.hpp"
#include "arb/domain/risk_limits.hpp"
#include "arb/domain/token.hpp"
#include "arb/orchestrator/opportunity_orchestrator.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace arb {

struct VenueConfig {
  std::string dex_a{"quickswap"};
  std::string dex_b{"sushiswap"};
  std::map<std::string, std::uint32_t> fee_bps;  // per venue
};

// Empty endpoint strings disable the corresponding component.
struct EndpointConfig {
  std::string reserve_feed;
  std::string ipc_cmd;
  std::string ipc_pub;
};

// -----------------------------------------------------------------------------
// EngineConfig
// -----------------------------------------------------------------------------
//
// @brief  Everything ArbitrageEngine needs, loaded from one JSON document.
//
// @details
// Top-level keys (all optional unless noted):
//
//   mode              "paper" (the only executable mode)
//   min_profit_usd    1.0
//   slippage_bps      50
//   score_threshold   0.7
//   min_spread_bps    10
//   trade_sizes_usd   [100, 250, 500, 1000]
//   gas               {base_gas_limit, multiplier, native_price_usd,
//                      fallback_cost_usd}
//   risk              {"preset": name, <RiskLimits fields>...}; explicit
//                     fields override the preset
//   tokens            REQUIRED, [{symbol, decimals, usd_price}], >= 3
//   venues            {dex_a, dex_b, fee_bps: {venue: bps}}
//   endpoints         {reserve_feed, ipc_cmd, ipc_pub}
//   store_dir         JSON-lines store directory; empty keeps trades in
//                     memory only
//   model_path        LogisticConfidenceScorer weights file
//
// Loading and validation throw InvalidConfiguration with a message naming
// the offending key.
// -----------------------------------------------------------------------------
struct EngineConfig {
  std::string mode{"paper"};
  double min_profit_usd{1.0};
  double slippage_bps{50.0};
  double score_threshold{0.7};
  double min_spread_bps{10.0};
  std::vector<double> trade_sizes_usd{100.0, 250.0, 500.0, 1000.0};

  accounting::GasEstimatorConfig gas;

  std::optional<std::string> risk_preset;
  domain::RiskLimits risk_limits;

  std::vector<domain::TokenInfo> tokens;  // configuration order
  VenueConfig venues;
  EndpointConfig endpoints;

  std::string store_dir;
  std::string model_path;

  /// Orchestrator settings derived from the fields above.
  OrchestratorConfig orchestratorConfig() const;

  std::vector<std::string> tokenSymbols() const;
};

/// Parses a JSON document. Throws InvalidConfiguration on malformed JSON,
/// wrongly typed keys, or a failed validateEngineConfig().
EngineConfig parseEngineConfig(const std::string& json_text);

/// Reads and parses `path`. Throws InvalidConfiguration if unreadable.
EngineConfig loadEngineConfig(const std::string& path);

void validateEngineConfig(const EngineConfig& config);

}  // namespace arb
