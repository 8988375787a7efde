#include "detection/MetricWindow.hpp"
#include "analysis/SeriesStats.hpp"

#include <gtest/gtest.h>
#include <random>
#include <vector>

using namespace Sentinel::Detection;
using Sentinel::Analysis::meanAndStddev;

TEST(MetricWindowTest, EmptyWindowIsInvalid) {
  MetricWindow w(10, 3, 0.1);
  const auto s = w.snapshot();
  EXPECT_EQ(s.count, 0u);
  EXPECT_FALSE(s.isValid);
  EXPECT_DOUBLE_EQ(s.mean, 0.0);
  EXPECT_DOUBLE_EQ(s.stddev, 0.0);
}

TEST(MetricWindowTest, BecomesValidAtMinPoints) {
  MetricWindow w(10, 3, 0.1);
  EXPECT_FALSE(w.update(1.0).isValid);
  EXPECT_FALSE(w.update(2.0).isValid);
  EXPECT_TRUE(w.update(3.0).isValid);
}

TEST(MetricWindowTest, MatchesBatchStatistics) {
  MetricWindow w(100, 10, 0.1);
  std::vector<double> values;
  std::mt19937 gen(7);
  std::normal_distribution<> dist(250.0, 30.0);
  for (int i = 0; i < 60; ++i) {
    values.push_back(dist(gen));
    w.update(values.back());
  }

  const auto ref = meanAndStddev(values);
  EXPECT_NEAR(w.mean(), ref.mean, 1e-9);
  EXPECT_NEAR(w.stddev(), ref.stddev, 1e-9);
  EXPECT_EQ(w.size(), 60u);
  EXPECT_EQ(w.count(), 60u);
}

TEST(MetricWindowTest, EvictsOldestValueWhenFull) {
  const std::size_t capacity = 5;
  MetricWindow w(capacity, 1, 0.1);
  const std::vector<double> values{1000.0, 2.0, 4.0, 6.0, 8.0, 10.0};
  for (double v : values)
    w.update(v);

  EXPECT_EQ(w.size(), capacity);
  EXPECT_EQ(w.count(), capacity + 1);
  EXPECT_DOUBLE_EQ(w.values().front(), 2.0);

  const auto ref = meanAndStddev({2.0, 4.0, 6.0, 8.0, 10.0});
  EXPECT_NEAR(w.mean(), ref.mean, 1e-12);
  EXPECT_NEAR(w.stddev(), ref.stddev, 1e-12);
}

TEST(MetricWindowTest, LongStreamStaysInAgreementWithBuffer) {
  MetricWindow w(50, 10, 0.2);
  std::mt19937 gen(123);
  std::uniform_real_distribution<> dist(0.0, 1000.0);
  for (int i = 0; i < 5000; ++i)
    w.update(dist(gen));

  const std::vector<double> buffered(w.values().begin(), w.values().end());
  const auto ref = meanAndStddev(buffered);
  EXPECT_EQ(buffered.size(), 50u);
  EXPECT_NEAR(w.mean(), ref.mean, 1e-8);
  EXPECT_NEAR(w.stddev(), ref.stddev, 1e-8);
}

TEST(MetricWindowTest, ConstantBufferHasExactlyZeroStddev) {
  MetricWindow w(20, 5, 0.1);
  for (int i = 0; i < 10; ++i)
    w.update(1.0 + i);
  // Flush every varying value out of the buffer
  for (int i = 0; i < 40; ++i)
    w.update(0.1);

  EXPECT_EQ(w.stddev(), 0.0);
  EXPECT_DOUBLE_EQ(w.mean(), 0.1);
}

TEST(MetricWindowTest, EwmaIsSeededWithFirstValue) {
  MetricWindow w(10, 1, 0.5);
  EXPECT_DOUBLE_EQ(w.update(100.0).ewmaBaseline, 100.0);
  EXPECT_DOUBLE_EQ(w.update(200.0).ewmaBaseline, 150.0);
  EXPECT_DOUBLE_EQ(w.update(50.0).ewmaBaseline, 100.0);
}

TEST(MetricWindowTest, EwmaFollowsWholeStreamNotBuffer) {
  MetricWindow w(2, 1, 1.0);
  w.update(5.0);
  w.update(6.0);
  w.update(7.0);
  // alpha = 1 tracks the last value exactly
  EXPECT_DOUBLE_EQ(w.ewmaBaseline(), 7.0);
  EXPECT_DOUBLE_EQ(w.mean(), 6.5);
}

TEST(MetricWindowTest, ZeroCapacityIsClampedToOne) {
  MetricWindow w(0, 1, 0.1);
  w.update(3.0);
  w.update(4.0);
  EXPECT_EQ(w.capacity(), 1u);
  EXPECT_EQ(w.size(), 1u);
  EXPECT_DOUBLE_EQ(w.mean(), 4.0);
}
