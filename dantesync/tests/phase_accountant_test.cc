// Copyright (c) 2025 <Your Name>
#include "internal/phase_accountant.hpp"

#include <gtest/gtest.h>

#include <limits>

using dantesync::internal::PhaseAccountant;

TEST(PhaseAccountantTest, AccumulatesMagnitude) {
  PhaseAccountant p;
  p.Tick(2.0, 1.0);
  p.Tick(-3.0, 2.0);
  EXPECT_DOUBLE_EQ(p.ErrorUs(), 8.0);
}

TEST(PhaseAccountantTest, IgnoresBadInput) {
  PhaseAccountant p;
  p.Tick(5.0, 0.0);
  p.Tick(5.0, -1.0);
  p.Tick(std::numeric_limits<double>::quiet_NaN(), 1.0);
  p.Tick(5.0, std::numeric_limits<double>::infinity());
  EXPECT_DOUBLE_EQ(p.ErrorUs(), 0.0);
}

/**
 * @test PhaseAccountantTest.PollIntervalBuckets
 * @brief Poll interval follows the error with boundaries at 20 and 50 us.
 *
 * @steps
 * 1. Accumulate exactly 20.0, then just above, then exactly 50.0 and above.
 *
 * @expected 30 s up to 20.0, 15 s up to 50.0, 10 s beyond.
 */
TEST(PhaseAccountantTest, PollIntervalBuckets) {
  PhaseAccountant p;
  EXPECT_EQ(p.PollIntervalS(), 30);

  p.Tick(20.0, 1.0);
  EXPECT_DOUBLE_EQ(p.ErrorUs(), 20.0);
  EXPECT_EQ(p.PollIntervalS(), 30);

  p.Tick(0.5, 1.0);
  EXPECT_EQ(p.PollIntervalS(), 15);

  p.Reset();
  p.Tick(50.0, 1.0);
  EXPECT_DOUBLE_EQ(p.ErrorUs(), 50.0);
  EXPECT_EQ(p.PollIntervalS(), 15);

  p.Tick(0.5, 1.0);
  EXPECT_EQ(p.PollIntervalS(), 10);
}

TEST(PhaseAccountantTest, ResetClears) {
  PhaseAccountant p;
  p.Tick(100.0, 1.0);
  ASSERT_EQ(p.PollIntervalS(), 10);
  p.Reset();
  EXPECT_DOUBLE_EQ(p.ErrorUs(), 0.0);
  EXPECT_EQ(p.PollIntervalS(), 30);
}
