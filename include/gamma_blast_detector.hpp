#pragma once
#include <span>
#include <vector>
#include "detection_config.hpp"
#include "gamma_blast_signal.hpp"
#include "market_snapshot.hpp"

// Scores one (symbol, expiry) window. Holds no state, so a single instance
// may be shared freely between threads.
class GammaBlastDetector {
public:
  // `history` is newest-first. Entries past DetectionConfig::max_history
  // are ignored.
  GammaBlastSignal detect(const MarketSnapshot &current,
                          std::span<const MarketSnapshot> history) const;

  GammaBlastSignal detect(const MarketSnapshot &current,
                          const std::vector<MarketSnapshot> &history) const {
    return detect(current, std::span<const MarketSnapshot>{history});
  }

private:
  GammaBlastSignal detectAdaptive(const MarketSnapshot &current,
                                  std::span<const MarketSnapshot> history) const;
};
