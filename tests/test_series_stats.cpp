#include "analysis/SeriesStats.hpp"

#include <gtest/gtest.h>
#include <vector>

using namespace Sentinel::Analysis;

TEST(SeriesStatsTest, MeanAndPopulationStddev) {
  const auto ms = meanAndStddev({2.0, 4.0, 4.0, 4.0, 5.0, 5.0, 7.0, 9.0});
  EXPECT_DOUBLE_EQ(ms.mean, 5.0);
  EXPECT_DOUBLE_EQ(ms.stddev, 2.0);

  const auto empty = meanAndStddev({});
  EXPECT_DOUBLE_EQ(empty.mean, 0.0);
  EXPECT_DOUBLE_EQ(empty.stddev, 0.0);
}

TEST(SeriesStatsTest, PercentileInterpolates) {
  const std::vector<double> v{10.0, 40.0, 20.0, 30.0};
  EXPECT_DOUBLE_EQ(percentile(v, 0.0), 10.0);
  EXPECT_DOUBLE_EQ(percentile(v, 100.0), 40.0);
  EXPECT_DOUBLE_EQ(percentile(v, 50.0), 25.0);
  EXPECT_DOUBLE_EQ(percentile(v, 150.0), 40.0);
  EXPECT_DOUBLE_EQ(percentile({}, 50.0), 0.0);
  EXPECT_DOUBLE_EQ(percentile({7.0}, 95.0), 7.0);
}

TEST(SeriesStatsTest, TrendNeedsAFullWindow) {
  EXPECT_EQ(detectTrend({1.0, 2.0, 3.0}, 20), Trend::Stable);
  EXPECT_EQ(detectTrend({1.0, 2.0, 3.0, 4.0}, 1), Trend::Stable);
}

TEST(SeriesStatsTest, TrendDirection) {
  std::vector<double> rising;
  std::vector<double> falling;
  std::vector<double> flat;
  for (int i = 0; i < 20; ++i) {
    rising.push_back(100.0 + i * 5.0);
    falling.push_back(200.0 - i * 5.0);
    flat.push_back(100.0 + (i % 2));
  }
  EXPECT_EQ(detectTrend(rising), Trend::Increasing);
  EXPECT_EQ(detectTrend(falling), Trend::Decreasing);
  EXPECT_EQ(detectTrend(flat), Trend::Stable);
  EXPECT_STREQ(trendLabel(Trend::Increasing), "increasing");
}

TEST(SeriesStatsTest, TrendOnlyLooksAtTheLastWindow) {
  std::vector<double> values(30, 1000.0);
  for (int i = 0; i < 10; ++i)
    values.push_back(50.0);
  for (int i = 0; i < 10; ++i)
    values.push_back(50.0);
  EXPECT_EQ(detectTrend(values, 20), Trend::Stable);
}
