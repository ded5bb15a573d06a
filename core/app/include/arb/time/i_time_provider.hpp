#pragma once

#include <cstdint>

namespace arb {

// -----------------------------------------------------------------------------
// ITimeProvider: abstract time source interface
// -----------------------------------------------------------------------------
//
// @brief  Pure virtual interface that abstracts "current time" away from
//         std::chrono::system_clock.
//
// @details
// The risk controller's cooldown, spacing and hourly-window guards are all
// functions of elapsed time. If they read the system clock directly, a
// cooldown could only be tested by sleeping for a minute, and a replay of
// recorded reserve updates would make different decisions on every run.
//
// Components therefore receive `const ITimeProvider&` and call now_ms():
//   - LiveTimeProvider        -> std::chrono::system_clock.
//   - SimulationTimeProvider  -> value set by the reserve feed or a test.
//
// Epoch milliseconds (int64) match the timestamp_ms field carried by the
// JSON reserve-update messages and the persisted trade records.
//
// Thread-safety contract:
//   Implementations MUST be safe for concurrent reads from multiple threads
//   (scan loop, IPC thread, feed thread).
//
// Ownership:
//   Components hold a const reference; the provider must outlive them.
// -----------------------------------------------------------------------------
class ITimeProvider {
 public:
  virtual ~ITimeProvider() = default;

  // Milliseconds since 1970-01-01 00:00:00 UTC. May be 0 before a
  // simulation clock has been advanced.
  virtual std::int64_t now_ms() const = 0;
};

}  // namespace arb
