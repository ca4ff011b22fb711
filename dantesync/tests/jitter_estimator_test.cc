// Copyright (c) 2025 <Your Name>
#include "internal/jitter_estimator.hpp"

#include <gtest/gtest.h>

#include <cmath>
#include <limits>

using dantesync::internal::JitterEstimator;

namespace {

/** +a, -a, +a, ... */
double Alternating(int i, double a) { return (i % 2 == 0) ? a : -a; }

}  // namespace

TEST(JitterEstimatorTest, AlphaClampsAtBothEnds) {
  EXPECT_DOUBLE_EQ(JitterEstimator::AlphaForStdDev(0.0), 0.3);
  EXPECT_DOUBLE_EQ(JitterEstimator::AlphaForStdDev(1.5), 0.3);
  EXPECT_DOUBLE_EQ(JitterEstimator::AlphaForStdDev(2.0), 0.3);
  EXPECT_DOUBLE_EQ(JitterEstimator::AlphaForStdDev(8.0), 0.1);
  EXPECT_DOUBLE_EQ(JitterEstimator::AlphaForStdDev(10.0), 0.1);
  EXPECT_DOUBLE_EQ(JitterEstimator::AlphaForStdDev(1e6), 0.1);
}

/**
 * @test JitterEstimatorTest.AlphaLinearAndMonotone
 * @brief Between 2 and 8 ppm alpha falls on a straight line.
 *
 * @steps
 * 1. Sweep sigma from 0 to 12 in small steps.
 * 2. Compare each alpha with the previous one and with the line.
 *
 * @expected Never increasing; exactly linear inside [2, 8].
 */
TEST(JitterEstimatorTest, AlphaLinearAndMonotone) {
  double prev = JitterEstimator::AlphaForStdDev(0.0);
  for (int i = 1; i <= 1200; ++i) {
    const double sigma = i * 0.01;
    const double a = JitterEstimator::AlphaForStdDev(sigma);
    EXPECT_LE(a, prev + 1e-15) << "sigma=" << sigma;
    if (sigma >= 2.0 && sigma <= 8.0) {
      const double expect = 0.3 - 0.2 * (sigma - 2.0) / 6.0;
      EXPECT_NEAR(a, expect, 1e-12) << "sigma=" << sigma;
    }
    prev = a;
  }
  EXPECT_NEAR(JitterEstimator::AlphaForStdDev(5.0), 0.2, 1e-12);
}

TEST(JitterEstimatorTest, NanSpreadKeepsDefault) {
  EXPECT_DOUBLE_EQ(JitterEstimator::AlphaForStdDev(
                       std::numeric_limits<double>::quiet_NaN()),
                   0.3);
}

/**
 * @test JitterEstimatorTest.WarmupHoldsDefault
 * @brief Below 15 samples alpha stays 0.3 whatever the variance.
 *
 * @steps
 * 1. Observe 14 samples alternating +/-9 ppm.
 * 2. Observe the 15th.
 *
 * @expected 0.3 for samples 1..14, 0.1 from sample 15.
 */
TEST(JitterEstimatorTest, WarmupHoldsDefault) {
  JitterEstimator j(30, 15);
  for (int i = 0; i < 14; ++i) {
    EXPECT_DOUBLE_EQ(j.Observe(Alternating(i, 9.0)), 0.3) << "sample " << i;
  }
  EXPECT_FALSE(j.Warm());
  const double a = j.Observe(Alternating(14, 9.0));
  EXPECT_TRUE(j.Warm());
  EXPECT_DOUBLE_EQ(a, 0.1);
}

TEST(JitterEstimatorTest, LowSpreadKeepsDefault) {
  JitterEstimator j(30, 15);
  double a = 0.0;
  for (int i = 0; i < 30; ++i) a = j.Observe(20.0 + Alternating(i, 1.0));
  EXPECT_LE(j.StdDev(), 1.5);
  EXPECT_DOUBLE_EQ(a, 0.3);
}

/**
 * @test JitterEstimatorTest.RampIsNotJitter
 * @brief A steady unidirectional drift change keeps the fast alpha.
 *
 * @steps
 * 1. Observe 10, 11, 12, ... for 40 samples.
 *
 * @expected Alpha is 0.3 throughout.
 */
TEST(JitterEstimatorTest, RampIsNotJitter) {
  JitterEstimator j(30, 15);
  for (int i = 0; i < 40; ++i) {
    EXPECT_DOUBLE_EQ(j.Observe(10.0 + i), 0.3) << "sample " << i;
  }
  EXPECT_NEAR(j.StdDev(), 0.0, 1e-9);
}

TEST(JitterEstimatorTest, OscillationDropsAlpha) {
  JitterEstimator j(30, 15);
  double a = 0.0;
  for (int i = 0; i < 30; ++i) a = j.Observe(Alternating(i, 10.0));
  EXPECT_GE(j.StdDev(), 10.0);
  EXPECT_NEAR(a, 0.1, 1e-12);
}

TEST(JitterEstimatorTest, WindowIsBounded) {
  JitterEstimator j(30, 15);
  for (int i = 0; i < 100; ++i) j.Observe(1.0);
  EXPECT_EQ(j.Count(), 30u);
  j.Clear();
  EXPECT_EQ(j.Count(), 0u);
  EXPECT_DOUBLE_EQ(j.Observe(50.0), 0.3);
}
