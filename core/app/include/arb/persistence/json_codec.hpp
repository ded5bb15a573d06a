#pragma once

#include "arb/domain/risk_limits.hpp"
#include "arb/domain/risk_state.hpp"
#include "arb/domain/trade_candidate.hpp"
#include "arb/domain/trade_record.hpp"

#include <nlohmann/json.hpp>

namespace arb {
namespace domain {

// -----------------------------------------------------------------------------
// nlohmann::json converters for domain records
// -----------------------------------------------------------------------------
//
// Found by ADL, so `nlohmann::json j = state;` and `j.get<TradeRecord>()`
// work anywhere this header is included. Used by JsonlTradeStore (one
// object per line), by the engine's STATUS command and by IpcServer
// telemetry.
//
// Optional fields are written as null and read back from null or absence.
// 128-bit amounts in TradeCandidate are written as decimal strings.
// -----------------------------------------------------------------------------

void to_json(nlohmann::json& j, const RiskState& state);
void from_json(const nlohmann::json& j, RiskState& state);

void to_json(nlohmann::json& j, const RiskLimits& limits);

/// Reads only the keys present in `j`; unknown keys are ignored. Throws
/// nlohmann::json::type_error for a present key with the wrong type.
void from_json(const nlohmann::json& j, RiskLimitsUpdate& update);

void to_json(nlohmann::json& j, const TradeRecord& record);
void from_json(const nlohmann::json& j, TradeRecord& record);

void to_json(nlohmann::json& j, const RiskEventRecord& event);
void from_json(const nlohmann::json& j, RiskEventRecord& event);

void to_json(nlohmann::json& j, const TradeCandidate& candidate);

}  // namespace domain
}  // namespace arb
