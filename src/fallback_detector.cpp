#include "fallback_detector.hpp"
#include "detection_config.hpp"
#include "statistics.hpp"
#include <algorithm>
#include <cmath>
#include <spdlog/fmt/fmt.h>

namespace {

std::optional<double> meanVelocity(const MarketSnapshot &current,
                                   std::span<const MarketSnapshot> history,
                                   SnapshotField field) {
  const auto &value = current.*field;
  if (!value || !std::isfinite(*value))
    return std::nullopt;

  auto series = stats::extractSeries(history, field);
  if (!series)
    return std::nullopt;
  series->push_back(*value);

  const auto velocity = stats::firstDerivative(*series);
  return stats::mean(velocity);
}

} // namespace

GammaBlastSignal detectFallback(const MarketSnapshot &current,
                                std::span<const MarketSnapshot> history) {
  using C = DetectionConfig;

  GammaBlastSignal signal;
  signal.mode = DetectionMode::FALLBACK;
  double probability = C::fallback_base_probability;

  const auto iv_velocity =
      meanVelocity(current, history, &MarketSnapshot::atm_iv);
  signal.metrics.iv_velocity = iv_velocity;
  if (iv_velocity && *iv_velocity > C::fallback_iv_velocity) {
    probability += C::fallback_iv_weight;
    signal.triggers.push_back(fmt::format("IV Rising ({:+.2f}/step)", *iv_velocity));
  }

  const auto oi_velocity =
      meanVelocity(current, history, &MarketSnapshot::atm_oi);
  signal.metrics.oi_velocity = oi_velocity;
  if (oi_velocity && *oi_velocity < C::fallback_oi_velocity) {
    probability += C::fallback_oi_weight;
    signal.triggers.push_back(fmt::format("OI Unwinding ({:.0f}/step)", *oi_velocity));
  }

  const auto gamma_velocity =
      meanVelocity(current, history, &MarketSnapshot::gamma_concentration);
  signal.metrics.gamma_velocity = gamma_velocity;
  if (gamma_velocity && *gamma_velocity > C::fallback_gamma_velocity) {
    probability += C::fallback_gamma_weight;
    signal.triggers.push_back("Gamma Concentrating");
  }

  signal.probability = std::min(probability, C::max_probability);
  signal.direction = Direction::NEUTRAL;
  signal.confidence = Confidence::LOW;
  signal.risk_level = Confidence::LOW;
  signal.time_to_blast_min = C::low_minutes;
  return signal;
}
