// rolling_test.cpp: window statistics and exponential smoothing

#include <gtest/gtest.h>

#include "ind/rolling.h"
#include "util/math.h"

#include <cmath>

TEST(RollingMeanTest, AcceptsPartialWindows) {
  auto out = rolling_mean({1, 2, 3, 4}, 2);
  ASSERT_EQ(out.size(), 4u);
  EXPECT_DOUBLE_EQ(out[0], 1.0);
  EXPECT_DOUBLE_EQ(out[1], 1.5);
  EXPECT_DOUBLE_EQ(out[2], 2.5);
  EXPECT_DOUBLE_EQ(out[3], 3.5);
}

TEST(RollingMeanTest, SkipsMissingValues) {
  auto out = rolling_mean({1, NaN, 3}, 3);
  EXPECT_DOUBLE_EQ(out[0], 1.0);
  EXPECT_DOUBLE_EQ(out[1], 1.0);
  EXPECT_DOUBLE_EQ(out[2], 2.0);

  auto none = rolling_mean({NaN, NaN}, 2);
  EXPECT_TRUE(std::isnan(none[1]));
}

TEST(RollingStdTest, SampleDeviationAfterMinPeriods) {
  auto out = rolling_std({1, 2, 3, 4}, 3, 3);
  EXPECT_TRUE(std::isnan(out[0]));
  EXPECT_TRUE(std::isnan(out[1]));
  EXPECT_DOUBLE_EQ(out[2], 1.0);
  EXPECT_DOUBLE_EQ(out[3], 1.0);
}

TEST(RollingStdTest, ConstantSeriesHasZeroDeviation) {
  auto out = rolling_std(Series(10, 5.0), 4, 4);
  EXPECT_DOUBLE_EQ(out.back(), 0.0);
}

TEST(EwmTest, SeededFromFirstObservation) {
  auto out = ewm({NaN, 1, 2}, 0.5, 1);
  EXPECT_TRUE(std::isnan(out[0]));
  EXPECT_DOUBLE_EQ(out[1], 1.0);
  EXPECT_DOUBLE_EQ(out[2], 1.5);
}

TEST(EwmTest, MissingValueDecaysHistory) {
  // the gap halves the old weight again before 3 arrives
  auto out = ewm({1, NaN, 3}, 0.5, 1);
  EXPECT_DOUBLE_EQ(out[1], 1.0);
  EXPECT_NEAR(out[2], 1.75 / 0.75, 1e-12);
}

TEST(EwmTest, EmaUsesSpanFactor) {
  // alpha = 2 / (3 + 1)
  auto out = ema({2, 4}, 3);
  EXPECT_DOUBLE_EQ(out[0], 2.0);
  EXPECT_DOUBLE_EQ(out[1], 3.0);
}

TEST(EwmTest, WilderWaitsForPeriodObservations) {
  auto out = wilder({NaN, 1, 1, 1, 1}, 3);
  EXPECT_TRUE(std::isnan(out[1]));
  EXPECT_TRUE(std::isnan(out[2]));
  EXPECT_DOUBLE_EQ(out[3], 1.0);
  EXPECT_DOUBLE_EQ(out[4], 1.0);
}

TEST(DiffTest, DiffAndPctChange) {
  auto d = diff({1, 4, 2});
  EXPECT_TRUE(std::isnan(d[0]));
  EXPECT_DOUBLE_EQ(d[1], 3.0);
  EXPECT_DOUBLE_EQ(d[2], -2.0);

  auto p = pct_change({100, 110, 121}, 2);
  EXPECT_TRUE(std::isnan(p[1]));
  EXPECT_NEAR(p[2], 0.21, 1e-12);
}

TEST(RankPctTest, MissingRowsCountInDenominator) {
  auto out = rolling_rank_pct({NaN, 1, 2, 0}, 3);
  EXPECT_TRUE(std::isnan(out[0]));
  EXPECT_DOUBLE_EQ(out[1], 0.5);
  EXPECT_DOUBLE_EQ(out[2], 2.0 / 3.0);
  EXPECT_DOUBLE_EQ(out[3], 1.0 / 3.0);
}

TEST(RankPctTest, MissingCurrentValueIsMissing) {
  auto out = rolling_rank_pct({1, 2, NaN}, 3);
  EXPECT_TRUE(std::isnan(out[2]));
}

TEST(MedianTest, SkipsMissingValues) {
  EXPECT_DOUBLE_EQ(median({3, NaN, 1, 2}), 2.0);
  EXPECT_DOUBLE_EQ(median({4, 1, 3, 2}), 2.5);
  EXPECT_TRUE(std::isnan(median({NaN})));
  EXPECT_TRUE(std::isnan(median({})));
}

TEST(MedianTest, ExpandingMedianSeesOnlyThePast) {
  auto out = expanding_median({5, 1, 3, NaN, 4});
  EXPECT_DOUBLE_EQ(out[0], 5.0);
  EXPECT_DOUBLE_EQ(out[1], 3.0);
  EXPECT_DOUBLE_EQ(out[2], 3.0);
  EXPECT_DOUBLE_EQ(out[3], 3.0);
  EXPECT_DOUBLE_EQ(out[4], 3.5);
}

TEST(MathTest, SafeDivAndRound) {
  EXPECT_TRUE(std::isnan(safe_div(1.0, 0.0)));
  EXPECT_TRUE(std::isnan(safe_div(1.0, NaN)));
  EXPECT_DOUBLE_EQ(safe_div(3.0, 2.0), 1.5);
  EXPECT_DOUBLE_EQ(round(100.0 / 3.0, 2), 33.33);
}

TEST(MathTest, RoundTiesToEven) {
  EXPECT_DOUBLE_EQ(round(3.125, 2), 3.12);
  EXPECT_DOUBLE_EQ(round(15.625, 2), 15.62);
  EXPECT_DOUBLE_EQ(round(0.375, 2), 0.38);
  EXPECT_DOUBLE_EQ(round(2.5, 0), 2.0);
}
