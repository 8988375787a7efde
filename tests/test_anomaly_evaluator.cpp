#include "detection/AnomalyEvaluator.hpp"

#include <gtest/gtest.h>

using namespace Sentinel;
using Detection::AnomalyEvaluator;
using Detection::MetricWindow;

namespace {

MetricWindow::Snapshot makeSnapshot(double mean, double stddev, bool valid = true) {
  MetricWindow::Snapshot s;
  s.mean = mean;
  s.stddev = stddev;
  s.ewmaBaseline = mean;
  s.count = valid ? 100 : 3;
  s.isValid = valid;
  return s;
}

const Utils::TimePoint kTs = Utils::fromMillisSinceEpoch(1700000000000);

} // namespace

TEST(AnomalyEvaluatorTest, NoVerdictBeforeMinPoints) {
  AnomalyEvaluator ev;
  EXPECT_FALSE(ev.evaluate(makeSnapshot(100.0, 10.0, false), 1000.0, "m", kTs));
}

TEST(AnomalyEvaluatorTest, NoVerdictOnZeroVariance) {
  AnomalyEvaluator ev;
  EXPECT_FALSE(ev.evaluate(makeSnapshot(100.0, 0.0), 1e9, "m", kTs));
}

TEST(AnomalyEvaluatorTest, ThresholdIsStrict) {
  AnomalyEvaluator ev(3.0);
  EXPECT_FALSE(ev.evaluate(makeSnapshot(100.0, 10.0), 130.0, "m", kTs));
  EXPECT_TRUE(ev.evaluate(makeSnapshot(100.0, 10.0), 130.5, "m", kTs));
}

TEST(AnomalyEvaluatorTest, HighValueCarriesPositiveZ) {
  AnomalyEvaluator ev;
  const auto a = ev.evaluate(makeSnapshot(200.0, 20.0), 300.0, "llm.latency.ms", kTs);
  ASSERT_TRUE(a);
  EXPECT_EQ(a->metricName(), "llm.latency.ms");
  EXPECT_DOUBLE_EQ(a->zScore(), 5.0);
  EXPECT_DOUBLE_EQ(a->deviationPercent(), 50.0);
  EXPECT_EQ(a->direction(), core::Direction::High);
  EXPECT_EQ(a->severity(), core::Severity::Sev2);
  EXPECT_DOUBLE_EQ(a->baselineMean(), 200.0);
  EXPECT_DOUBLE_EQ(a->baselineStddev(), 20.0);
  EXPECT_EQ(a->timestamp(), kTs);
}

TEST(AnomalyEvaluatorTest, LowValueCarriesNegativeZ) {
  AnomalyEvaluator ev;
  const auto a = ev.evaluate(makeSnapshot(200.0, 20.0), 100.0, "m", kTs);
  ASSERT_TRUE(a);
  EXPECT_LT(a->zScore(), 0.0);
  EXPECT_LT(a->deviationPercent(), 0.0);
  EXPECT_EQ(a->direction(), core::Direction::Low);
}

TEST(AnomalyEvaluatorTest, ZeroMeanGivesZeroDeviation) {
  AnomalyEvaluator ev;
  const auto a = ev.evaluate(makeSnapshot(0.0, 1.0), 10.0, "m", kTs);
  ASSERT_TRUE(a);
  EXPECT_DOUBLE_EQ(a->deviationPercent(), 0.0);
}

TEST(AnomalyEvaluatorTest, SeverityBoundaries) {
  AnomalyEvaluator ev(3.0, Detection::SeverityThresholds{6.0, 4.5});
  EXPECT_EQ(ev.classify(3.1), core::Severity::Sev3);
  EXPECT_EQ(ev.classify(4.5), core::Severity::Sev2);
  EXPECT_EQ(ev.classify(5.99), core::Severity::Sev2);
  EXPECT_EQ(ev.classify(6.0), core::Severity::Sev1);
  EXPECT_EQ(ev.classify(50.0), core::Severity::Sev1);
}

TEST(AnomalyEvaluatorTest, SeverityIsMonotonicInMagnitude) {
  AnomalyEvaluator ev;
  core::Severity previous = ev.classify(3.0);
  for (double z = 3.0; z < 12.0; z += 0.25) {
    const auto current = ev.classify(z);
    EXPECT_FALSE(core::isMoreSevere(previous, current)) << "at |z|=" << z;
    previous = current;
  }
}

TEST(AnomalyEvaluatorTest, ExplicitThresholdOverridesConfigured) {
  AnomalyEvaluator ev(3.0);
  const auto snap = makeSnapshot(100.0, 10.0);
  EXPECT_TRUE(ev.evaluate(snap, 125.0, "m", kTs, 2.0));
  EXPECT_FALSE(ev.evaluate(snap, 125.0, "m", kTs));
}
