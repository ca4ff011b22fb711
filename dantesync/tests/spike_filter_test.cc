// Copyright (c) 2025 <Your Name>
#include "internal/spike_filter.hpp"

#include <gtest/gtest.h>

#include "internal/jitter_estimator.hpp"

using dantesync::internal::JitterEstimator;
using dantesync::internal::SpikeFilter;

/**
 * @test SpikeFilterTest.SubstitutesMedianForSpike
 * @brief A sample far from the window median is replaced by the median.
 *
 * @steps
 * 1. Fill a 5-wide window with values whose median is 5.0.
 * 2. Filter 500 with threshold 10.
 *
 * @expected Result is 5.0, flagged substituted, and the window keeps 5.0.
 */
TEST(SpikeFilterTest, SubstitutesMedianForSpike) {
  SpikeFilter f(5, 3, 10.0);
  for (double v : {4.0, 5.0, 6.0, 5.0, 4.5}) {
    EXPECT_FALSE(f.Filter(v).substituted);
  }
  ASSERT_DOUBLE_EQ(f.Median(), 5.0);

  SpikeFilter::Result r = f.Filter(500.0);
  EXPECT_TRUE(r.substituted);
  EXPECT_DOUBLE_EQ(r.value, 5.0);
  EXPECT_DOUBLE_EQ(r.median, 5.0);
  EXPECT_LT(f.Median(), 10.0);
}

TEST(SpikeFilterTest, WithinThresholdPassesThrough) {
  SpikeFilter f(5, 3, 10.0);
  for (double v : {5.0, 5.0, 5.0}) f.Filter(v);
  SpikeFilter::Result r = f.Filter(14.9);
  EXPECT_FALSE(r.substituted);
  EXPECT_DOUBLE_EQ(r.value, 14.9);
}

TEST(SpikeFilterTest, InactiveUntilMinFill) {
  SpikeFilter f(5, 3, 10.0);
  f.Filter(5.0);
  f.Filter(5.0);
  SpikeFilter::Result r = f.Filter(500.0);
  EXPECT_FALSE(r.substituted);
  EXPECT_DOUBLE_EQ(r.value, 500.0);
  EXPECT_EQ(f.Size(), 3u);
}

TEST(SpikeFilterTest, EvenWindowAveragesMiddlePair) {
  SpikeFilter f(4, 1, 1000.0);
  for (double v : {1.0, 2.0, 3.0, 10.0}) f.Filter(v);
  EXPECT_DOUBLE_EQ(f.Median(), 2.5);
}

TEST(SpikeFilterTest, WindowSlides) {
  SpikeFilter f(3, 3, 1000.0);
  for (double v : {1.0, 2.0, 3.0, 40.0, 50.0}) f.Filter(v);
  EXPECT_EQ(f.Size(), 3u);
  EXPECT_DOUBLE_EQ(f.Median(), 40.0);
  f.Clear();
  EXPECT_EQ(f.Size(), 0u);
}

/**
 * @test SpikeFilterTest.JitterNeverSeesSpike
 * @brief Feeding filter output into the estimator keeps the spike out.
 *
 * @steps
 * 1. Warm a filter and an estimator with a steady 5.0 stream.
 * 2. Pass 500 through the filter, then the result into the estimator.
 *
 * @expected Estimator spread stays zero and alpha stays at the default.
 */
TEST(SpikeFilterTest, JitterNeverSeesSpike) {
  SpikeFilter f(5, 3, 10.0);
  JitterEstimator j(30, 15);
  for (int i = 0; i < 20; ++i) j.Observe(f.Filter(5.0).value);

  const double alpha = j.Observe(f.Filter(500.0).value);
  EXPECT_DOUBLE_EQ(alpha, JitterEstimator::kAlphaDefault);
  EXPECT_NEAR(j.StdDev(), 0.0, 1e-9);
}
