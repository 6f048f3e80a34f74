#include "signal_evaluators.hpp"
#include "detection_config.hpp"
#include "statistics.hpp"
#include <cmath>
#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

namespace {

// z-score of one field of the current snapshot against its history
std::optional<double> fieldZscore(const MarketSnapshot &current,
                                  std::span<const MarketSnapshot> history,
                                  SnapshotField field) {
  const auto &value = current.*field;
  if (!value || !std::isfinite(*value))
    return std::nullopt;

  const auto series = stats::extractSeries(history, field);
  if (!series)
    return std::nullopt;

  return stats::zscore(*value, *series);
}

int sign(double value) { return (value > 0.0) - (value < 0.0); }

} // namespace

std::optional<SignalHit> evaluateIvSpike(const MarketSnapshot &current,
                                         std::span<const MarketSnapshot> history,
                                         GammaBlastSignal::Metrics &metrics) {
  const auto z = fieldZscore(current, history, &MarketSnapshot::atm_iv);
  metrics.iv_zscore = z;
  if (!z)
    return std::nullopt;

  double weight = 0.0;
  if (*z >= DetectionConfig::iv_spike_high_z) {
    weight = DetectionConfig::iv_spike_high_weight;
  } else if (*z >= DetectionConfig::iv_spike_low_z) {
    weight = DetectionConfig::iv_spike_low_weight;
  } else {
    return std::nullopt;
  }
  return SignalHit{weight, fmt::format("IV Spike ({:.1f}σ)", *z)};
}

std::optional<SignalHit>
evaluateOiAcceleration(const MarketSnapshot &current,
                       std::span<const MarketSnapshot> history,
                       GammaBlastSignal::Metrics &metrics) {
  if (!current.atm_oi || !std::isfinite(*current.atm_oi))
    return std::nullopt;

  const auto series = stats::extractSeries(history, &MarketSnapshot::atm_oi);
  if (!series || series->size() < 2)
    return std::nullopt;

  const auto &oi = *series;
  const size_t n = oi.size();
  const double current_accel = *current.atm_oi - 2.0 * oi[n - 1] + oi[n - 2];

  const auto accelerations = stats::secondDerivative(oi);
  const auto z = stats::zscore(current_accel, accelerations);
  metrics.oi_accel_zscore = z;
  if (!z)
    return std::nullopt;

  // Unwinding outranks buildup
  if (*z <= DetectionConfig::oi_unwind_z) {
    return SignalHit{DetectionConfig::oi_unwind_weight,
                     fmt::format("OI Unwinding ({:.1f}σ)", *z)};
  }
  if (*z >= DetectionConfig::oi_buildup_z) {
    return SignalHit{DetectionConfig::oi_buildup_weight,
                     fmt::format("OI Buildup ({:.1f}σ)", *z)};
  }
  return std::nullopt;
}

std::optional<SignalHit>
evaluateGammaConcentration(const MarketSnapshot &current,
                           std::span<const MarketSnapshot> history,
                           GammaBlastSignal::Metrics &metrics) {
  const auto z =
      fieldZscore(current, history, &MarketSnapshot::gamma_concentration);
  metrics.gamma_zscore = z;
  if (!z || *z < DetectionConfig::gamma_cluster_z)
    return std::nullopt;

  return SignalHit{DetectionConfig::gamma_cluster_weight,
                   fmt::format("Gamma Clustering ({:.1f}σ)", *z)};
}

std::optional<SignalHit> evaluatePinRisk(const MarketSnapshot &current,
                                         GammaBlastSignal::Metrics &metrics) {
  if (!current.spot_price || !current.atm_strike)
    return std::nullopt;

  const double spot = *current.spot_price;
  if (!std::isfinite(spot) || !std::isfinite(*current.atm_strike) ||
      spot <= DetectionConfig::epsilon)
    return std::nullopt;

  const double distance_pct =
      std::abs(spot - *current.atm_strike) / spot * 100.0;
  metrics.pin_distance_pct = distance_pct;
  if (distance_pct >= DetectionConfig::pin_distance_pct)
    return std::nullopt;

  return SignalHit{DetectionConfig::pin_weight,
                   fmt::format("Pin Risk ({:.2f}%)", distance_pct)};
}

std::optional<SignalHit> evaluateGexFlip(const MarketSnapshot &current,
                                         std::span<const MarketSnapshot> history) {
  if (history.empty() || !current.net_gex || !history.front().net_gex)
    return std::nullopt;

  const int now = sign(*current.net_gex);
  const int before = sign(*history.front().net_gex);
  if (now * before >= 0)
    return std::nullopt;

  return SignalHit{DetectionConfig::gex_flip_weight, "GEX Flip Detected"};
}

std::optional<SignalHit>
evaluateGexExtreme(const MarketSnapshot &current,
                   std::span<const MarketSnapshot> history,
                   GammaBlastSignal::Metrics &metrics) {
  if (!current.net_gex || !std::isfinite(*current.net_gex))
    return std::nullopt;

  const auto series = stats::extractSeries(history, &MarketSnapshot::net_gex);
  if (!series)
    return std::nullopt;

  const auto rank = stats::percentileRank(*current.net_gex, *series);
  metrics.gex_percentile = rank;
  if (!rank)
    return std::nullopt;

  if (*rank > DetectionConfig::gex_extreme_high_pct ||
      *rank < DetectionConfig::gex_extreme_low_pct) {
    return SignalHit{DetectionConfig::gex_extreme_weight,
                     fmt::format("Extreme GEX ({:.0f}th percentile)", *rank)};
  }
  return std::nullopt;
}

std::vector<SignalHit> evaluateSignals(const MarketSnapshot &current,
                                       std::span<const MarketSnapshot> history,
                                       GammaBlastSignal::Metrics &metrics) {
  std::vector<SignalHit> hits;
  hits.reserve(6);

  auto collect = [&hits](std::optional<SignalHit> &&hit) {
    if (hit) {
      spdlog::trace("Signal fired: {} (+{:.2f})", hit->label, hit->contribution);
      hits.push_back(std::move(*hit));
    }
  };

  collect(evaluateIvSpike(current, history, metrics));
  collect(evaluateOiAcceleration(current, history, metrics));
  collect(evaluateGammaConcentration(current, history, metrics));
  collect(evaluatePinRisk(current, metrics));
  collect(evaluateGexFlip(current, history));
  collect(evaluateGexExtreme(current, history, metrics));

  return hits;
}
