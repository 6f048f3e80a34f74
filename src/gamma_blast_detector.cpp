#include "gamma_blast_detector.hpp"
#include "confidence_classifier.hpp"
#include "direction_predictor.hpp"
#include "fallback_detector.hpp"
#include "signal_evaluators.hpp"
#include <algorithm>
#include <spdlog/spdlog.h>

GammaBlastSignal
GammaBlastDetector::detect(const MarketSnapshot &current,
                           std::span<const MarketSnapshot> history) const {
  if (history.size() > DetectionConfig::max_history) {
    history = history.first(DetectionConfig::max_history);
  }

  if (history.size() < DetectionConfig::min_adaptive_history) {
    spdlog::debug("Fallback scoring with {} history samples", history.size());
    return detectFallback(current, history);
  }
  return detectAdaptive(current, history);
}

GammaBlastSignal GammaBlastDetector::detectAdaptive(
    const MarketSnapshot &current,
    std::span<const MarketSnapshot> history) const {

  GammaBlastSignal signal;
  signal.mode = DetectionMode::ADAPTIVE;

  const auto hits = evaluateSignals(current, history, signal.metrics);

  double probability = 0.0;
  signal.triggers.reserve(hits.size());
  for (const auto &hit : hits) {
    probability += hit.contribution;
    signal.triggers.push_back(hit.label);
  }
  signal.probability =
      std::clamp(probability, 0.0, DetectionConfig::max_probability);

  signal.direction =
      predictDirection(current, signal.metrics.gex_percentile, signal.metrics);

  const auto tier = classify(signal.probability, signal.triggers.size());
  signal.confidence = tier.confidence;
  signal.risk_level = tier.confidence;
  signal.time_to_blast_min = tier.time_to_blast_min;

  spdlog::debug("Adaptive scoring: p={:.2f} triggers={} direction={}",
                signal.probability, signal.triggers.size(),
                toString(signal.direction));
  return signal;
}
