#pragma once
#include <optional>
#include <span>
#include <vector>
#include "market_snapshot.hpp"

// Window statistics shared by the evaluators. All functions are pure.
namespace stats {

// Values of one field in oldest-to-newest order. `history` is newest-first.
// Returns nullopt if any snapshot lacks the field.
std::optional<std::vector<double>>
extractSeries(std::span<const MarketSnapshot> history, SnapshotField field);

std::optional<double> mean(std::span<const double> values);

// Sample standard deviation (N-1 denominator), nullopt when N < 2
std::optional<double> stddev(std::span<const double> values);

// nullopt when the standard deviation is undefined or zero
std::optional<double> zscore(double current, std::span<const double> values);

// Share of `values` that are <= current, 0..100
std::optional<double> percentileRank(double current,
                                     std::span<const double> values);

// series[i] - series[i-1]; empty for fewer than 2 points
std::vector<double> firstDerivative(std::span<const double> series);

// Difference of differences; empty for fewer than 3 points
std::vector<double> secondDerivative(std::span<const double> series);

} // namespace stats
