#pragma once

#include "arb/time/i_time_provider.hpp"

namespace arb {

// -----------------------------------------------------------------------------
// LiveTimeProvider: wall-clock time source
// -----------------------------------------------------------------------------
// Injected into the RiskController in production so that cooldowns and the
// hourly window follow real time. Stateless; safe from any thread.
// -----------------------------------------------------------------------------
class LiveTimeProvider final : public ITimeProvider {
 public:
  std::int64_t now_ms() const override;
};

}  // namespace arb
