#pragma once
#include <optional>
#include <span>
#include <string>
#include <vector>
#include "gamma_blast_signal.hpp"
#include "market_snapshot.hpp"

// Contribution of one fired signal to the blast probability
struct SignalHit {
  double contribution = 0.0;
  std::string label;
};

// Each evaluator compares the current snapshot against the newest-first
// history and returns nothing when it does not fire or lacks data. The
// statistic it computed is recorded in `metrics` either way.
std::optional<SignalHit> evaluateIvSpike(const MarketSnapshot &current,
                                         std::span<const MarketSnapshot> history,
                                         GammaBlastSignal::Metrics &metrics);

// Acceleration of the current step (history[1], history[0], current) scored
// against the accelerations of every consecutive triple in history.
std::optional<SignalHit>
evaluateOiAcceleration(const MarketSnapshot &current,
                       std::span<const MarketSnapshot> history,
                       GammaBlastSignal::Metrics &metrics);

std::optional<SignalHit>
evaluateGammaConcentration(const MarketSnapshot &current,
                           std::span<const MarketSnapshot> history,
                           GammaBlastSignal::Metrics &metrics);

std::optional<SignalHit> evaluatePinRisk(const MarketSnapshot &current,
                                         GammaBlastSignal::Metrics &metrics);

// Fires only on a strict sign change; a zero reading is not a flip.
std::optional<SignalHit> evaluateGexFlip(const MarketSnapshot &current,
                                         std::span<const MarketSnapshot> history);

std::optional<SignalHit>
evaluateGexExtreme(const MarketSnapshot &current,
                   std::span<const MarketSnapshot> history,
                   GammaBlastSignal::Metrics &metrics);

// Runs all six evaluators in their fixed order.
std::vector<SignalHit> evaluateSignals(const MarketSnapshot &current,
                                       std::span<const MarketSnapshot> history,
                                       GammaBlastSignal::Metrics &metrics);
