#pragma once

#include "arb/time/i_time_provider.hpp"

#include <atomic>
#include <cstdint>

namespace arb {

// -----------------------------------------------------------------------------
// SimulationTimeProvider: externally-driven clock
// -----------------------------------------------------------------------------
//
// @brief  ITimeProvider whose "now" is set explicitly, either by the
//         reserve feed (each update carries timestamp_ms) or by a test.
//
// @details
// Used for replaying recorded reserve updates and for exercising the risk
// controller's time-windowed guards without sleeping:
//
//   clock.advance_time(T);          // loss recorded at T
//   clock.advance_time(T + 30000);  // still cooling down
//   clock.advance_time(T + 60001);  // cooldown elapsed
//
// std::atomic gives lock-free reads from the scan loop and IPC thread
// while the feed thread writes.
//
// Thread model: single writer (feed thread or test), many readers.
// -----------------------------------------------------------------------------
class SimulationTimeProvider final : public ITimeProvider {
 public:
  SimulationTimeProvider() = default;
  explicit SimulationTimeProvider(std::int64_t start_ms)
      : current_time_ms_(start_ms) {}

  // Returns the last value passed to advance_time() (0 initially).
  std::int64_t now_ms() const override;

  // Sets the clock. Callers are responsible for monotonic progression.
  void advance_time(std::int64_t new_time_ms);

  // Moves the clock forward by delta_ms.
  void advance_by(std::int64_t delta_ms);

 private:
  std::atomic<std::int64_t> current_time_ms_{0};
};

}  // namespace arb
