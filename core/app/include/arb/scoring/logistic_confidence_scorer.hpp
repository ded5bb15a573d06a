#pragma once

#include "arb/scoring/i_confidence_scorer.hpp"

#include <array>
#include <cstddef>
#include <mutex>
#include <string>
#include <vector>

namespace arb {

// -----------------------------------------------------------------------------
// LogisticConfidenceScorer
// -----------------------------------------------------------------------------
//
// @brief  score = sigmoid(bias + w . normalizeFeatures(features)).
//
// @details
// Default weights favour spread and depth and penalize volatility and gas:
//   [0.5, 0.3, -0.2, 0.1, -0.1, 0.05, 0.05], bias 0.
//
// Model file (nlohmann::json):
//   {"weights": [7 numbers], "bias": b, "accuracy": a, "sample_count": n}
// loadFromFile() keeps the current model and logs when the file is
// missing or malformed; saveToFile() throws PersistenceError.
//
// train() runs plain stochastic gradient descent on the log loss, with a
// learning rate of 0.01 for 100 epochs, visiting samples in the given
// order, so the result is deterministic. accuracy is then the fraction of
// samples classified correctly at 0.5.
//
// score() returns std::nullopt when a feature is not finite.
//
// Thread model: every method locks mutex_.
// -----------------------------------------------------------------------------
class LogisticConfidenceScorer : public IConfidenceScorer {
 public:
  using Weights = std::array<double, scoring::kFeatureCount>;

  struct TrainingSample {
    scoring::FeatureVector features;
    bool profitable{false};
  };

  struct Model {
    Weights weights{0.5, 0.3, -0.2, 0.1, -0.1, 0.05, 0.05};
    double bias{0.0};
    double accuracy{0.0};
    std::size_t sample_count{0};
  };

  static constexpr double kLearningRate = 0.01;
  static constexpr int kEpochs = 100;

  LogisticConfidenceScorer() = default;
  explicit LogisticConfidenceScorer(Model model) : model_(model) {}

  std::optional<double> score(
      const scoring::FeatureVector& features) const override;

  /// Returns true when the model was replaced by the file's contents.
  bool loadFromFile(const std::string& path);

  void saveToFile(const std::string& path) const;

  void train(const std::vector<TrainingSample>& samples);

  Model model() const;

 private:
  mutable std::mutex mutex_;
  Model model_;
};

}  // namespace arb
