#include "statistics.hpp"
#include "detection_config.hpp"
#include <algorithm>
#include <cmath>
#include <numeric>

namespace stats {

std::optional<std::vector<double>>
extractSeries(std::span<const MarketSnapshot> history, SnapshotField field) {
  std::vector<double> series;
  series.reserve(history.size());

  // History arrives newest-first, walk it backwards
  for (auto it = history.rbegin(); it != history.rend(); ++it) {
    const auto &value = (*it).*field;
    if (!value || !std::isfinite(*value))
      return std::nullopt;
    series.push_back(*value);
  }
  return series;
}

std::optional<double> mean(std::span<const double> values) {
  if (values.empty())
    return std::nullopt;
  return std::reduce(values.begin(), values.end()) /
         static_cast<double>(values.size());
}

std::optional<double> stddev(std::span<const double> values) {
  if (values.size() < 2)
    return std::nullopt;

  const double avg = *mean(values);
  double sum_sq = 0.0;
  for (double v : values) {
    sum_sq += (v - avg) * (v - avg);
  }
  return std::sqrt(sum_sq / static_cast<double>(values.size() - 1));
}

std::optional<double> zscore(double current, std::span<const double> values) {
  const auto sd = stddev(values);
  if (!sd)
    return std::nullopt;

  const double avg = *mean(values);
  // Rounding noise on a flat window must not read as a huge deviation
  if (*sd <= DetectionConfig::epsilon * std::max(1.0, std::abs(avg)))
    return std::nullopt;

  return (current - avg) / *sd;
}

std::optional<double> percentileRank(double current,
                                     std::span<const double> values) {
  if (values.empty())
    return std::nullopt;

  const auto at_or_below = std::count_if(
      values.begin(), values.end(), [current](double v) { return v <= current; });
  return 100.0 * static_cast<double>(at_or_below) /
         static_cast<double>(values.size());
}

std::vector<double> firstDerivative(std::span<const double> series) {
  std::vector<double> velocity;
  if (series.size() < 2)
    return velocity;

  velocity.reserve(series.size() - 1);
  for (size_t i = 1; i < series.size(); ++i) {
    velocity.push_back(series[i] - series[i - 1]);
  }
  return velocity;
}

std::vector<double> secondDerivative(std::span<const double> series) {
  if (series.size() < 3)
    return {};
  const auto velocity = firstDerivative(series);
  return firstDerivative(velocity);
}

} // namespace stats
