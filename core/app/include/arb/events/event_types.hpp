#pragma once

#include "arb/domain/amount.hpp"
#include "arb/domain/risk_state.hpp"
#include "arb/domain/trade_candidate.hpp"
#include "arb/domain/trade_record.hpp"

#include <cstdint>
#include <string>

namespace arb {

// -----------------------------------------------------------------------------
// Event payloads
// -----------------------------------------------------------------------------
// Every event carries an epoch-millisecond timestamp from the engine's
// ITimeProvider (simulated or wall clock) and a sequence id assigned by the
// producer. Payloads are plain values: copying an event never shares state
// with the component that produced it.
// -----------------------------------------------------------------------------

// -----------------------------------------------------------------------------
// ReserveUpdateEvent
// -----------------------------------------------------------------------------
// One pool observation from the reserve feed. `token0`/`token1` are the
// pool's own ordering; ReserveBook orients them per swap direction.
// -----------------------------------------------------------------------------
struct ReserveUpdateEvent {
  std::string venue;
  std::string token0;
  std::string token1;
  domain::Amount reserve0{0};
  domain::Amount reserve1{0};
  std::uint32_t fee_bps{30};
  std::int64_t timestamp_ms{0};
  std::uint64_t sequence_id{0};
};

// -----------------------------------------------------------------------------
// TradeCandidateEvent
// -----------------------------------------------------------------------------
// Published when a candidate has passed profit, score and risk checks, just
// before it is handed to the executor.
// -----------------------------------------------------------------------------
struct TradeCandidateEvent {
  domain::TradeCandidate candidate;
  std::int64_t timestamp_ms{0};
  std::uint64_t sequence_id{0};
};

// Outcome of a (paper) execution, after it was persisted and recorded.
struct TradeExecutedEvent {
  domain::TradeRecord record;
  std::uint64_t sequence_id{0};
};

// -----------------------------------------------------------------------------
// RiskEventNotice
// -----------------------------------------------------------------------------
// Emitted by the RiskController listener for kill-switch activations,
// resets, loss streaks and limit updates. Mirrors the persisted
// RiskEventRecord so telemetry and the audit log agree.
// -----------------------------------------------------------------------------
struct RiskEventNotice {
  domain::RiskEventRecord event;
  std::uint64_t sequence_id{0};
};

struct HeartbeatEvent {
  std::int64_t timestamp_ms{0};
  std::uint64_t sequence_id{0};
};

}  // namespace arb
