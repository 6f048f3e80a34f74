#pragma once
#include <span>
#include "gamma_blast_signal.hpp"
#include "market_snapshot.hpp"

// Fixed-threshold scoring for windows too short to build a baseline.
// Velocities are the mean step change over history (oldest first) followed by
// the current snapshot. Direction, confidence and timing are fixed.
GammaBlastSignal detectFallback(const MarketSnapshot &current,
                                std::span<const MarketSnapshot> history);
