#pragma once
#include <optional>
#include "gamma_blast_signal.hpp"
#include "market_snapshot.hpp"

// Integer score from put/call OI, GEX position and IV skew. Components whose
// inputs are missing add nothing.
int directionScore(const MarketSnapshot &current,
                   std::optional<double> gex_percentile,
                   GammaBlastSignal::Metrics &metrics);

// Scores strictly between the cut-offs resolve to NEUTRAL.
Direction directionFromScore(int score);

Direction predictDirection(const MarketSnapshot &current,
                           std::optional<double> gex_percentile,
                           GammaBlastSignal::Metrics &metrics);
