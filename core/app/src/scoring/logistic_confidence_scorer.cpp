#include "arb/scoring/logistic_confidence_scorer.hpp"
#include "arb/errors.hpp"

#include <nlohmann/json.hpp>

#include <cmath>
#include <fstream>
#include <iostream>

namespace arb {

namespace {

double sigmoid(double z) { return 1.0 / (1.0 + std::exp(-z)); }

double linear(const LogisticConfidenceScorer::Model& model,
              const scoring::NormalizedFeatures& x) {
  double z = model.bias;
  for (std::size_t i = 0; i < scoring::kFeatureCount; ++i) {
    z += model.weights[i] * x[i];
  }
  return z;
}

}  // namespace

std::optional<double> LogisticConfidenceScorer::score(
    const scoring::FeatureVector& features) const {
  const scoring::NormalizedFeatures x = scoring::normalizeFeatures(features);
  for (double v : x) {
    if (!std::isfinite(v)) {
      return std::nullopt;
    }
  }
  std::lock_guard lock(mutex_);
  return sigmoid(linear(model_, x));
}

bool LogisticConfidenceScorer::loadFromFile(const std::string& path) {
  std::ifstream in(path);
  if (!in) {
    std::cerr << "[LogisticConfidenceScorer] model file " << path
              << " not found, keeping current weights\n";
    return false;
  }

  Model loaded;
  try {
    const nlohmann::json j = nlohmann::json::parse(in);
    const auto weights = j.at("weights").get<std::vector<double>>();
    if (weights.size() != scoring::kFeatureCount) {
      std::cerr << "[LogisticConfidenceScorer] " << path << " has "
                << weights.size() << " weights, expected "
                << scoring::kFeatureCount << "; keeping current weights\n";
      return false;
    }
    for (std::size_t i = 0; i < scoring::kFeatureCount; ++i) {
      loaded.weights[i] = weights[i];
    }
    loaded.bias = j.value("bias", 0.0);
    loaded.accuracy = j.value("accuracy", 0.0);
    loaded.sample_count = j.value("sample_count", std::size_t{0});
  } catch (const nlohmann::json::exception& e) {
    std::cerr << "[LogisticConfidenceScorer] cannot parse " << path << ": "
              << e.what() << "; keeping current weights\n";
    return false;
  }

  std::lock_guard lock(mutex_);
  model_ = loaded;
  std::cout << "[LogisticConfidenceScorer] loaded model from " << path
            << " (accuracy=" << model_.accuracy
            << ", samples=" << model_.sample_count << ")\n";
  return true;
}

void LogisticConfidenceScorer::saveToFile(const std::string& path) const {
  const Model snapshot = model();
  const nlohmann::json j = {{"weights", snapshot.weights},
                            {"bias", snapshot.bias},
                            {"accuracy", snapshot.accuracy},
                            {"sample_count", snapshot.sample_count}};

  std::ofstream out(path, std::ios::trunc);
  if (!out) {
    throw PersistenceError("cannot open model file " + path);
  }
  out << j.dump(2) << '\n';
  if (!out) {
    throw PersistenceError("write to model file " + path + " failed");
  }
}

void LogisticConfidenceScorer::train(
    const std::vector<TrainingSample>& samples) {
  if (samples.empty()) {
    std::cerr << "[LogisticConfidenceScorer] train() called with no samples\n";
    return;
  }

  std::vector<scoring::NormalizedFeatures> inputs;
  inputs.reserve(samples.size());
  for (const auto& sample : samples) {
    inputs.push_back(scoring::normalizeFeatures(sample.features));
  }

  std::lock_guard lock(mutex_);
  for (int epoch = 0; epoch < kEpochs; ++epoch) {
    for (std::size_t s = 0; s < samples.size(); ++s) {
      const double label = samples[s].profitable ? 1.0 : 0.0;
      const double error = label - sigmoid(linear(model_, inputs[s]));
      for (std::size_t i = 0; i < scoring::kFeatureCount; ++i) {
        model_.weights[i] += kLearningRate * error * inputs[s][i];
      }
      model_.bias += kLearningRate * error;
    }
  }

  std::size_t correct = 0;
  for (std::size_t s = 0; s < samples.size(); ++s) {
    const bool predicted = sigmoid(linear(model_, inputs[s])) >= 0.5;
    if (predicted == samples[s].profitable) {
      ++correct;
    }
  }
  model_.accuracy =
      static_cast<double>(correct) / static_cast<double>(samples.size());
  model_.sample_count = samples.size();
}

LogisticConfidenceScorer::Model LogisticConfidenceScorer::model() const {
  std::lock_guard lock(mutex_);
  return model_;
}

}  // namespace arb
