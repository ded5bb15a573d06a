#pragma once

#include "arb/domain/reserve_pair.hpp"

#include <optional>
#include <string>

namespace arb {

// -----------------------------------------------------------------------------
// IReserveReader: source of pool reserves for route evaluation
// -----------------------------------------------------------------------------
//
// @brief  Returns the reserves of the pool that swaps `token_in` for
//         `token_out` on `venue`, oriented for that direction.
//
// @details
// std::nullopt means the pool is unknown or its data is unavailable right
// now. The orchestrator treats that as "skip this route", never as an
// error. Implementations backed by a remote node must bound their own
// latency; the scan loop calls reserves() once per leg per route.
//
// volatilityBps() is an optional capability used for scoring features;
// readers without price history report 0.
// -----------------------------------------------------------------------------
class IReserveReader {
 public:
  virtual ~IReserveReader() = default;

  virtual std::optional<domain::ReservePair> reserves(
      const std::string& token_in, const std::string& token_out,
      const std::string& venue) const = 0;

  virtual double volatilityBps(const std::string& /*venue*/,
                               const std::string& /*token_a*/,
                               const std::string& /*token_b*/) const {
    return 0.0;
  }
};

}  // namespace arb
