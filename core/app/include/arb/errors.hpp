#pragma once

#include <stdexcept>
#include <string>

namespace arb {

// -----------------------------------------------------------------------------
// Error hierarchy
// -----------------------------------------------------------------------------
// Raised faults are reserved for programmer-error-class conditions (bad
// configuration, impossible swap requests) and for persistence failures
// that the caller must log. Expected unavailability of external data
// (reserves, fee data, scores) is reported with std::optional instead and
// never reaches this hierarchy.
// -----------------------------------------------------------------------------
class ArbError : public std::runtime_error {
 public:
  explicit ArbError(const std::string& message)
      : std::runtime_error(message) {}
};

// Requested output is at or above the pool's output reserve.
class InsufficientLiquidity : public ArbError {
 public:
  explicit InsufficientLiquidity(const std::string& message)
      : ArbError("Insufficient liquidity: " + message) {}
};

// Structurally invalid limits, routes, fees or config keys.
class InvalidConfiguration : public ArbError {
 public:
  explicit InvalidConfiguration(const std::string& message)
      : ArbError("Invalid configuration: " + message) {}
};

// A trade or risk-event record could not be written or read.
class PersistenceError : public ArbError {
 public:
  explicit PersistenceError(const std::string& message)
      : ArbError("Persistence failure: " + message) {}
};

}  // namespace arb
