#include "analysis/statistics.hpp"
#include "core/errors.hpp"

#include <cmath>
#include <gtest/gtest.h>
#include <limits>
#include <vector>

using namespace analysis::stats;

// --- Threshold ---

TEST(StatisticsTest, ThresholdNeedsTwoValues) {
  auto empty = compute_threshold({}, 2.0);
  EXPECT_TRUE(empty.insufficient_data);
  EXPECT_DOUBLE_EQ(empty.threshold, 0.0);

  auto single = compute_threshold({42.0}, 2.0);
  EXPECT_TRUE(single.insufficient_data);
  EXPECT_DOUBLE_EQ(single.threshold, 0.0);
  EXPECT_DOUBLE_EQ(single.mean, 0.0);
  EXPECT_DOUBLE_EQ(single.stddev, 0.0);
}

TEST(StatisticsTest, ThresholdUsesSampleStddev) {
  auto result = compute_threshold({100, 102, 98, 101, 99, 103, 97}, 2.0);
  ASSERT_FALSE(result.insufficient_data);
  EXPECT_DOUBLE_EQ(result.mean, 100.0);
  EXPECT_NEAR(result.stddev, std::sqrt(28.0 / 6.0), 1e-12);
  EXPECT_NEAR(result.threshold, 100.0 + 2.0 * std::sqrt(28.0 / 6.0), 1e-12);
  EXPECT_DOUBLE_EQ(result.sensitivity, 2.0);
}

TEST(StatisticsTest, ThresholdOfFlatBaselineIsTheMean) {
  auto result = compute_threshold({5, 5, 5, 5}, 3.0);
  EXPECT_FALSE(result.insufficient_data);
  EXPECT_DOUBLE_EQ(result.stddev, 0.0);
  EXPECT_DOUBLE_EQ(result.threshold, 5.0);
  EXPECT_FALSE(std::isnan(result.threshold));
}

TEST(StatisticsTest, ThresholdRejectsBadSensitivity) {
  EXPECT_THROW(compute_threshold({1, 2, 3}, -0.5), InvalidInputError);
  EXPECT_THROW(
      compute_threshold({1, 2, 3}, std::numeric_limits<double>::quiet_NaN()),
      InvalidInputError);
}

TEST(StatisticsTest, CoefficientOfVariationWithZeroMean) {
  EXPECT_DOUBLE_EQ(coefficient_of_variation({0, 0, 0}), 0.0);
  EXPECT_DOUBLE_EQ(coefficient_of_variation({-1, 1}), 0.0);
  EXPECT_NEAR(coefficient_of_variation({9, 11}), std::sqrt(2.0) / 10.0, 1e-12);
}

// --- Percentiles ---

TEST(StatisticsTest, PercentilesOfOneToTen) {
  auto p = compute_percentiles({1, 2, 3, 4, 5, 6, 7, 8, 9, 10});
  ASSERT_EQ(p.size(), 4u);
  EXPECT_DOUBLE_EQ(p["p50"], 5.5);
  EXPECT_NEAR(p["p90"], 9.1, 1e-9);
  EXPECT_NEAR(p["p95"], 9.55, 1e-9);
  EXPECT_NEAR(p["p99"], 9.91, 1e-9);
}

TEST(StatisticsTest, PercentilesIgnoreInputOrder) {
  auto p = compute_percentiles({10, 3, 7, 1, 9, 2, 8, 4, 6, 5});
  EXPECT_DOUBLE_EQ(p["p50"], 5.5);
  EXPECT_NEAR(p["p90"], 9.1, 1e-9);
}

TEST(StatisticsTest, MedianOfOddCount) {
  auto p = compute_percentiles({3.0, 1.0, 2.0});
  EXPECT_DOUBLE_EQ(p["p50"], 2.0);
}

TEST(StatisticsTest, EmptyPercentiles) {
  EXPECT_TRUE(compute_percentiles({}).empty());
}

TEST(StatisticsTest, SingleValuePercentiles) {
  auto p = compute_percentiles({7.5});
  for (const auto &[label, value] : p)
    EXPECT_DOUBLE_EQ(value, 7.5) << label;
}

TEST(StatisticsTest, PercentilesAreMonotonic) {
  std::vector<double> values = {12, 0.5, 99, 47, 3, 3, 18, 250, 64, 7, 1};
  auto p = compute_percentiles(values);
  EXPECT_LE(p["p50"], p["p90"]);
  EXPECT_LE(p["p90"], p["p95"]);
  EXPECT_LE(p["p95"], p["p99"]);
  EXPECT_LE(p["p99"], 250.0);
}

// --- Trend ---

TEST(StatisticsTest, IncreasingTrend) {
  std::vector<double> values = {1, 2, 3, 4, 5, 6, 7, 8, 9, 10, 15, 20, 25, 30, 35};
  auto trend = detect_trend(values, 5);
  EXPECT_EQ(trend.direction, TrendDirection::INCREASING);
  EXPECT_GT(trend.change_percent, 10.0);
}

TEST(StatisticsTest, DecreasingTrend) {
  std::vector<double> values = {35, 30, 25, 20, 15, 10, 9, 8, 7, 6, 5, 4, 3, 2, 1};
  auto trend = detect_trend(values, 5);
  EXPECT_EQ(trend.direction, TrendDirection::DECREASING);
  EXPECT_NEAR(trend.change_percent, -62.5, 1e-9);
}

TEST(StatisticsTest, StableTrend) {
  std::vector<double> values = {10, 11, 9, 10, 12, 9, 11, 10,
                                12, 9, 10, 11, 9, 10, 12};
  auto trend = detect_trend(values, 5);
  EXPECT_EQ(trend.direction, TrendDirection::STABLE);
  EXPECT_LT(std::abs(trend.change_percent), 10.0);
}

TEST(StatisticsTest, ShortSeriesIsStable) {
  auto trend = detect_trend({1, 100, 1000}, 5);
  EXPECT_EQ(trend.direction, TrendDirection::STABLE);
  EXPECT_DOUBLE_EQ(trend.change_percent, 0.0);

  // Exactly one window: nothing older to compare against.
  auto exact = detect_trend({1, 2, 3, 4, 5}, 5);
  EXPECT_EQ(exact.direction, TrendDirection::STABLE);
}

TEST(StatisticsTest, TrendUsesAllEarlierValuesWhenShort) {
  // Older part is {10, 10, 10}, recent is {20, 20, 20, 20, 20}.
  auto trend = detect_trend({10, 10, 10, 20, 20, 20, 20, 20}, 5);
  EXPECT_EQ(trend.direction, TrendDirection::INCREASING);
  EXPECT_NEAR(trend.change_percent, 100.0, 1e-9);
}

TEST(StatisticsTest, TrendFromZeroAverageIsStable) {
  auto trend = detect_trend({0, 0, 0, 5, 5, 5}, 3);
  EXPECT_EQ(trend.direction, TrendDirection::STABLE);
  EXPECT_DOUBLE_EQ(trend.change_percent, 0.0);
}

TEST(StatisticsTest, TrendBoundaryIsExclusive) {
  // +10% exactly stays stable.
  auto trend = detect_trend({100, 110}, 1);
  EXPECT_NEAR(trend.change_percent, 10.0, 1e-9);
  EXPECT_EQ(trend.direction, TrendDirection::STABLE);
}

TEST(StatisticsTest, TrendRejectsZeroWindow) {
  EXPECT_THROW(detect_trend({1, 2, 3}, 0), InvalidInputError);
}

TEST(StatisticsTest, TrendDirectionNames) {
  EXPECT_EQ(trend_direction_to_string(TrendDirection::INCREASING),
            "increasing");
  EXPECT_EQ(trend_direction_to_string(TrendDirection::DECREASING),
            "decreasing");
  EXPECT_EQ(trend_direction_to_string(TrendDirection::STABLE), "stable");
}
