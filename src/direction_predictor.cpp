#include "direction_predictor.hpp"
#include "detection_config.hpp"
#include <algorithm>
#include <cmath>

int directionScore(const MarketSnapshot &current,
                   std::optional<double> gex_percentile,
                   GammaBlastSignal::Metrics &metrics) {
  int score = 0;

  if (current.ce_oi_total && current.pe_oi_total) {
    const double pcr = *current.pe_oi_total /
                       std::max(*current.ce_oi_total, DetectionConfig::epsilon);
    metrics.pcr = pcr;
    if (pcr < DetectionConfig::pcr_bullish) {
      score += DetectionConfig::pcr_score;
    } else if (pcr > DetectionConfig::pcr_bearish) {
      score -= DetectionConfig::pcr_score;
    }
  }

  // Heavy positive GEX caps the upside, heavy negative GEX props it
  if (gex_percentile) {
    if (*gex_percentile > DetectionConfig::gex_resistance_pct) {
      score -= DetectionConfig::gex_score;
    } else if (*gex_percentile < DetectionConfig::gex_support_pct) {
      score += DetectionConfig::gex_score;
    }
  }

  if (current.ce_iv_avg && current.pe_iv_avg) {
    const double ce_iv = *current.ce_iv_avg;
    const double pe_iv = *current.pe_iv_avg;
    if (ce_iv > pe_iv * DetectionConfig::iv_skew_ratio) {
      score -= DetectionConfig::iv_skew_score;
    } else if (pe_iv > ce_iv * DetectionConfig::iv_skew_ratio) {
      score += DetectionConfig::iv_skew_score;
    }
  }

  metrics.direction_score = score;
  return score;
}

Direction directionFromScore(int score) {
  if (score >= DetectionConfig::direction_threshold)
    return Direction::UPSIDE;
  if (score <= -DetectionConfig::direction_threshold)
    return Direction::DOWNSIDE;
  return Direction::NEUTRAL;
}

Direction predictDirection(const MarketSnapshot &current,
                           std::optional<double> gex_percentile,
                           GammaBlastSignal::Metrics &metrics) {
  return directionFromScore(directionScore(current, gex_percentile, metrics));
}
