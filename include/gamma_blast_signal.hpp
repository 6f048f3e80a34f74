#pragma once
#include <optional>
#include <string>
#include <string_view>
#include <vector>

enum class Direction { UPSIDE, DOWNSIDE, NEUTRAL };

enum class Confidence { CRITICAL, VERY_HIGH, HIGH, MEDIUM, LOW };

enum class DetectionMode { ADAPTIVE, FALLBACK };

std::string_view toString(Direction direction);
std::string_view toString(Confidence confidence);
std::string_view toString(DetectionMode mode);

struct GammaBlastSignal {
  double probability = 0.0;
  Direction direction = Direction::NEUTRAL;
  Confidence confidence = Confidence::LOW;
  int time_to_blast_min = 60;
  std::vector<std::string> triggers;
  Confidence risk_level = Confidence::LOW;
  DetectionMode mode = DetectionMode::FALLBACK;

  // Intermediate values, absent when they could not be computed
  struct Metrics {
    std::optional<double> iv_zscore;
    std::optional<double> oi_accel_zscore;
    std::optional<double> gamma_zscore;
    std::optional<double> gex_percentile;
    std::optional<double> pin_distance_pct;
    std::optional<double> pcr;
    std::optional<int> direction_score;
    std::optional<double> iv_velocity;
    std::optional<double> oi_velocity;
    std::optional<double> gamma_velocity;
  } metrics;
};
