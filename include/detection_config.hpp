#pragma once
#include <cstddef>

struct DetectionConfig {
  // History window
  static constexpr std::size_t min_adaptive_history = 5;
  static constexpr std::size_t max_history = 20;

  static constexpr double max_probability = 0.95;
  static constexpr double epsilon = 1e-9;

  // IV spike (z-score of atm_iv)
  static constexpr double iv_spike_high_z = 2.5;
  static constexpr double iv_spike_high_weight = 0.25;
  static constexpr double iv_spike_low_z = 2.0;
  static constexpr double iv_spike_low_weight = 0.15;

  // OI acceleration (z-score of second derivative of atm_oi)
  static constexpr double oi_unwind_z = -2.0;
  static constexpr double oi_unwind_weight = 0.30;
  static constexpr double oi_buildup_z = 2.0;
  static constexpr double oi_buildup_weight = 0.20;

  // Gamma clustering (z-score of gamma_concentration)
  static constexpr double gamma_cluster_z = 2.0;
  static constexpr double gamma_cluster_weight = 0.20;

  // Strike pin, distance in percent of spot
  static constexpr double pin_distance_pct = 0.5;
  static constexpr double pin_weight = 0.10;

  // GEX
  static constexpr double gex_flip_weight = 0.25;
  static constexpr double gex_extreme_high_pct = 90.0;
  static constexpr double gex_extreme_low_pct = 10.0;
  static constexpr double gex_extreme_weight = 0.15;

  // Direction scoring
  static constexpr double pcr_bullish = 0.7;
  static constexpr double pcr_bearish = 1.3;
  static constexpr int pcr_score = 3;
  static constexpr double gex_resistance_pct = 75.0;
  static constexpr double gex_support_pct = 25.0;
  static constexpr int gex_score = 2;
  static constexpr double iv_skew_ratio = 1.1;
  static constexpr int iv_skew_score = 1;
  static constexpr int direction_threshold = 3;

  // Confidence table, first match wins
  static constexpr double critical_probability = 0.70;
  static constexpr std::size_t critical_triggers = 4;
  static constexpr int critical_minutes = 3;
  static constexpr double very_high_probability = 0.60;
  static constexpr std::size_t very_high_triggers = 3;
  static constexpr int very_high_minutes = 10;
  static constexpr double high_probability = 0.40;
  static constexpr int high_minutes = 20;
  static constexpr double medium_probability = 0.25;
  static constexpr int medium_minutes = 30;
  static constexpr int low_minutes = 60;

  // Fallback (history shorter than min_adaptive_history)
  static constexpr double fallback_base_probability = 0.10;
  static constexpr double fallback_iv_velocity = 0.10;
  static constexpr double fallback_iv_weight = 0.15;
  static constexpr double fallback_oi_velocity = -500.0;
  static constexpr double fallback_oi_weight = 0.15;
  static constexpr double fallback_gamma_velocity = 0.0;
  static constexpr double fallback_gamma_weight = 0.10;
};
