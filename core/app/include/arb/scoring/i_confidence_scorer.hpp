#pragma once

#include "arb/scoring/feature_vector.hpp"

#include <optional>

namespace arb {

// -----------------------------------------------------------------------------
// IConfidenceScorer
// -----------------------------------------------------------------------------
// Probability-like confidence in [0, 1] that a candidate will realize its
// simulated profit. std::nullopt means no score could be produced; the
// orchestrator skips the size in that case. score() may be called from the
// scan loop while an operator retrains from another thread, so
// implementations synchronize internally.
// -----------------------------------------------------------------------------
class IConfidenceScorer {
 public:
  virtual ~IConfidenceScorer() = default;

  virtual std::optional<double> score(
      const scoring::FeatureVector& features) const = 0;
};

}  // namespace arb
