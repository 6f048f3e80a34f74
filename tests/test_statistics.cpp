#include "statistics.hpp"
#include <gtest/gtest.h>
#include <vector>

#include "snapshot_fixtures.hpp"

TEST(StatisticsTest, MeanOfEmptyWindowIsUndefined) {
  std::vector<double> empty;
  EXPECT_FALSE(stats::mean(empty).has_value());

  std::vector<double> values = {1.0, 2.0, 3.0, 6.0};
  EXPECT_DOUBLE_EQ(3.0, *stats::mean(values));
}

TEST(StatisticsTest, StddevUsesSampleDenominator) {
  std::vector<double> values = {2.0, 4.0, 4.0, 4.0, 5.0, 5.0, 7.0, 9.0};
  EXPECT_NEAR(2.13809, *stats::stddev(values), 1e-5);
}

TEST(StatisticsTest, StddevNeedsTwoPoints) {
  std::vector<double> one = {5.0};
  EXPECT_FALSE(stats::stddev(one).has_value());
}

TEST(StatisticsTest, ZscoreAgainstKnownWindow) {
  const auto values = ivMean20Sd2();
  EXPECT_DOUBLE_EQ(2.0, *stats::stddev(values));
  EXPECT_DOUBLE_EQ(3.0, *stats::zscore(26.0, values));
  EXPECT_DOUBLE_EQ(-1.5, *stats::zscore(17.0, values));
}

TEST(StatisticsTest, ZscoreUndefinedForFlatOrShortWindow) {
  std::vector<double> flat(10, 0.1);
  EXPECT_FALSE(stats::zscore(0.5, flat).has_value());

  std::vector<double> single = {3.0};
  EXPECT_FALSE(stats::zscore(4.0, single).has_value());
}

TEST(StatisticsTest, PercentileRankCountsTies) {
  std::vector<double> values = {1.0, 2.0, 3.0, 4.0};
  EXPECT_DOUBLE_EQ(75.0, *stats::percentileRank(3.0, values));
  EXPECT_DOUBLE_EQ(0.0, *stats::percentileRank(0.5, values));
  EXPECT_DOUBLE_EQ(100.0, *stats::percentileRank(4.0, values));

  std::vector<double> empty;
  EXPECT_FALSE(stats::percentileRank(1.0, empty).has_value());
}

TEST(StatisticsTest, Derivatives) {
  std::vector<double> squares = {1.0, 4.0, 9.0, 16.0};
  EXPECT_EQ((std::vector<double>{3.0, 5.0, 7.0}),
            stats::firstDerivative(squares));
  EXPECT_EQ((std::vector<double>{2.0, 2.0}), stats::secondDerivative(squares));

  std::vector<double> two = {1.0, 2.0};
  EXPECT_TRUE(stats::secondDerivative(two).empty());
  EXPECT_EQ(1u, stats::firstDerivative(two).size());
}

TEST(StatisticsTest, ExtractSeriesIsOldestFirst) {
  auto history = baselineHistory(3);
  setSeries(history, &MarketSnapshot::atm_iv, {30.0, 20.0, 10.0});

  const auto series = stats::extractSeries(history, &MarketSnapshot::atm_iv);
  ASSERT_TRUE(series.has_value());
  EXPECT_EQ((std::vector<double>{10.0, 20.0, 30.0}), *series);
}

TEST(StatisticsTest, ExtractSeriesRejectsMissingValues) {
  auto history = baselineHistory(4);
  history[2].net_gex.reset();
  EXPECT_FALSE(
      stats::extractSeries(history, &MarketSnapshot::net_gex).has_value());
}
