#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace arb {
namespace domain {

// -----------------------------------------------------------------------------
// RiskState: snapshot of the RiskController's authoritative state
// -----------------------------------------------------------------------------
//
// @brief  Read-only copy of the risk state handed to callers.
//
// @details
// The live instance is owned exclusively by RiskController. getState()
// returns a copy taken under the controller's mutex, so fields are
// mutually consistent.
//
//   is_killed / kill_reason:  latched kill switch; reason set on kill,
//                             cleared on reset.
//   daily_pnl:                sum of realized outcomes since the last
//                             daily reset (USD).
//   consecutive_losses:       trailing run of outcomes with realized
//                             profit <= 0.
//   last_trade_time_ms:       time of the last recordTrade(), if any.
//   last_loss_time_ms:        time of the last losing outcome, if any.
//   trades_in_last_hour:      size of the trailing 60-minute window at the
//                             time of the snapshot.
// -----------------------------------------------------------------------------
struct RiskState {
  bool is_killed{false};
  std::optional<std::string> kill_reason;
  double daily_pnl{0.0};
  std::int64_t consecutive_losses{0};
  std::optional<std::int64_t> last_trade_time_ms;
  std::optional<std::int64_t> last_loss_time_ms;
  std::int64_t trades_in_last_hour{0};
};

}  // namespace domain
}  // namespace arb
