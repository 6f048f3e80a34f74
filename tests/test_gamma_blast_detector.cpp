#include "gamma_blast_detector.hpp"
#include <gtest/gtest.h>

#include "snapshot_fixtures.hpp"

class GammaBlastDetectorTest : public ::testing::Test {
protected:
  GammaBlastDetector detector_;
};

// Every evaluator fires: IV (0.25), OI unwind (0.30), gamma (0.20),
// pin (0.10), GEX flip (0.25) and extreme GEX (0.15).
static void makeEverythingFire(std::vector<MarketSnapshot> &history,
                               MarketSnapshot &current) {
  history = baselineHistory(10);
  setSeries(history, &MarketSnapshot::atm_iv, ivMean20Sd2());
  setSeries(history, &MarketSnapshot::atm_oi,
            {1130.0, 1120.0, 1100.0, 1090.0, 1070.0, 1060.0, 1040.0, 1030.0,
             1010.0, 1000.0});

  current = baselineCurrent();
  current.atm_iv = 26.0;
  current.atm_oi = 1100.0;
  current.gamma_concentration = 0.35;
  current.atm_strike = 20080.0;
  current.net_gex = -500000.0;
}

TEST_F(GammaBlastDetectorTest, ShortHistoryUsesFallback) {
  const std::vector<MarketSnapshot> history(3, baselineCurrent());

  const auto signal = detector_.detect(baselineCurrent(), history);
  EXPECT_EQ(DetectionMode::FALLBACK, signal.mode);
  EXPECT_EQ(Confidence::LOW, signal.confidence);
  EXPECT_EQ(Direction::NEUTRAL, signal.direction);
  EXPECT_EQ(60, signal.time_to_blast_min);
  EXPECT_DOUBLE_EQ(0.10, signal.probability);
}

TEST_F(GammaBlastDetectorTest, FallbackForEveryShortLength) {
  std::vector<MarketSnapshot> history;
  MarketSnapshot current;
  makeEverythingFire(history, current);

  for (size_t n = 0; n < 5; ++n) {
    const std::span<const MarketSnapshot> window{history.data(), n};
    const auto signal = detector_.detect(current, window);
    EXPECT_EQ(DetectionMode::FALLBACK, signal.mode) << n;
    EXPECT_EQ(Confidence::LOW, signal.confidence) << n;
    EXPECT_EQ(Direction::NEUTRAL, signal.direction) << n;
    EXPECT_EQ(60, signal.time_to_blast_min) << n;
  }

  const std::span<const MarketSnapshot> five{history.data(), 5};
  EXPECT_EQ(DetectionMode::ADAPTIVE, detector_.detect(current, five).mode);
}

TEST_F(GammaBlastDetectorTest, IvSpikeScenario) {
  auto history = baselineHistory(10);
  setSeries(history, &MarketSnapshot::atm_iv, ivMean20Sd2());
  auto current = baselineCurrent();
  current.atm_iv = 26.0;

  const auto signal = detector_.detect(current, history);
  EXPECT_EQ(DetectionMode::ADAPTIVE, signal.mode);
  EXPECT_TRUE(hasTrigger(signal.triggers, "IV Spike (3.0σ)"));
  EXPECT_GE(signal.probability, 0.25);
  EXPECT_DOUBLE_EQ(3.0, *signal.metrics.iv_zscore);
}

TEST_F(GammaBlastDetectorTest, GexFlipScenario) {
  auto history = baselineHistory(10);
  history[0].net_gex = 1000000.0;
  auto current = baselineCurrent();
  current.net_gex = -500000.0;

  const auto signal = detector_.detect(current, history);
  EXPECT_TRUE(hasTrigger(signal.triggers, "GEX Flip Detected"));
  EXPECT_GE(signal.probability, 0.25);
}

TEST_F(GammaBlastDetectorTest, UpsideDirectionScenario) {
  // 3 of 20 historical GEX readings at or below the current one
  auto history = baselineHistory(20);
  for (size_t i = 0; i < history.size(); ++i) {
    const double offset = static_cast<double>(i + 1) * 10000.0;
    history[i].net_gex = i < 3 ? 1000000.0 - offset : 1000000.0 + offset;
  }
  auto current = baselineCurrent();
  current.ce_oi_total = 200000.0;
  current.pe_oi_total = 100000.0;

  const auto signal = detector_.detect(current, history);
  EXPECT_DOUBLE_EQ(15.0, *signal.metrics.gex_percentile);
  EXPECT_EQ(5, *signal.metrics.direction_score);
  EXPECT_EQ(Direction::UPSIDE, signal.direction);
}

TEST_F(GammaBlastDetectorTest, PinRiskScenario) {
  auto current = baselineCurrent();
  current.spot_price = 20000.0;
  current.atm_strike = 20080.0;

  const auto signal = detector_.detect(current, baselineHistory(10));
  ASSERT_EQ(1u, signal.triggers.size());
  EXPECT_EQ("Pin Risk (0.40%)", signal.triggers[0]);
  EXPECT_NEAR(0.10, signal.probability, 1e-12);
  EXPECT_EQ(Confidence::LOW, signal.confidence);
}

TEST_F(GammaBlastDetectorTest, ProbabilityIsCapped) {
  std::vector<MarketSnapshot> history;
  MarketSnapshot current;
  makeEverythingFire(history, current);

  const auto signal = detector_.detect(current, history);
  ASSERT_EQ(6u, signal.triggers.size());
  EXPECT_DOUBLE_EQ(0.95, signal.probability);
  EXPECT_EQ(Confidence::CRITICAL, signal.confidence);
  EXPECT_EQ(Confidence::CRITICAL, signal.risk_level);
  EXPECT_EQ(3, signal.time_to_blast_min);
  EXPECT_EQ("OI Unwinding (-3.7σ)", signal.triggers[1]);
}

TEST_F(GammaBlastDetectorTest, RepeatedCallsAreIdentical) {
  std::vector<MarketSnapshot> history;
  MarketSnapshot current;
  makeEverythingFire(history, current);
  current.atm_iv = 24.7;

  const auto first = detector_.detect(current, history);
  const auto second = detector_.detect(current, history);
  EXPECT_EQ(first.probability, second.probability);
  EXPECT_EQ(first.triggers, second.triggers);
  EXPECT_EQ(first.direction, second.direction);
  EXPECT_EQ(first.confidence, second.confidence);
  EXPECT_EQ(first.time_to_blast_min, second.time_to_blast_min);
  EXPECT_EQ(first.metrics.iv_zscore, second.metrics.iv_zscore);
}

TEST_F(GammaBlastDetectorTest, IvSignalIsMonotonicWithOneTrigger) {
  auto history = baselineHistory(10);
  setSeries(history, &MarketSnapshot::atm_iv, ivMean20Sd2());
  auto current = baselineCurrent();

  double previous = -1.0;
  for (double iv : {23.0, 24.4, 26.0}) {
    current.atm_iv = iv;
    const auto signal = detector_.detect(current, history);
    EXPECT_GT(signal.probability, previous) << iv;
    EXPECT_EQ(iv > 24.0 ? 1u : 0u,
              countTriggersWithPrefix(signal.triggers, "IV Spike"))
        << iv;
    previous = signal.probability;
  }
}

TEST_F(GammaBlastDetectorTest, NoFlipWhenSignsMatch) {
  auto history = baselineHistory(10);
  for (auto &snapshot : history)
    snapshot.net_gex = -*snapshot.net_gex;
  auto current = baselineCurrent();
  current.net_gex = -500000.0;

  const auto signal = detector_.detect(current, history);
  EXPECT_FALSE(hasTrigger(signal.triggers, "GEX Flip Detected"));
}

TEST_F(GammaBlastDetectorTest, DeadZoneScoreIsNeutral) {
  auto current = baselineCurrent();
  current.ce_oi_total = 200000.0; // +3
  current.ce_iv_avg = 25.0;       // -1

  const auto signal = detector_.detect(current, baselineHistory(10));
  EXPECT_EQ(2, *signal.metrics.direction_score);
  EXPECT_EQ(Direction::NEUTRAL, signal.direction);
}

TEST_F(GammaBlastDetectorTest, OnlyNewestTwentyAreUsed) {
  auto history = baselineHistory(20);
  auto longer = history;
  for (int i = 0; i < 5; ++i) {
    auto junk = baselineCurrent();
    junk.atm_iv = 500.0;
    junk.net_gex = -9e9;
    longer.push_back(junk);
  }
  auto current = baselineCurrent();
  current.atm_iv = 22.5;

  const auto expected = detector_.detect(current, history);
  const auto actual = detector_.detect(current, longer);
  EXPECT_EQ(expected.probability, actual.probability);
  EXPECT_EQ(expected.triggers, actual.triggers);
  EXPECT_EQ(expected.metrics.iv_zscore, actual.metrics.iv_zscore);
}

TEST_F(GammaBlastDetectorTest, MissingCurrentFieldsDoNotThrow) {
  MarketSnapshot blank;
  GammaBlastSignal signal;
  EXPECT_NO_THROW(signal = detector_.detect(blank, baselineHistory(10)));
  EXPECT_EQ(DetectionMode::ADAPTIVE, signal.mode);
  EXPECT_TRUE(signal.triggers.empty());
  EXPECT_DOUBLE_EQ(0.0, signal.probability);
  EXPECT_EQ(Direction::NEUTRAL, signal.direction);
  EXPECT_EQ(Confidence::LOW, signal.confidence);
  EXPECT_EQ(60, signal.time_to_blast_min);
}
