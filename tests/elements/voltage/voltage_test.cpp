#include <gtest/gtest.h>

#include "VoltageSource.hpp"

#include <string>
#include <vector>

/*
 * voltage_test.cpp
 *
 * Unit tests for VoltageSource::voltage(), VoltageSource::stamp(...) and
 * VoltageSource::computeCurrent(...).
 *
 * These tests exercise:
 *  - the 9 V default for missing or unparseable values
 *  - MNA stamping for a source to ground and between two nets
 *  - reading the branch current back from the solution vector
 */

TEST(VoltageSourceValue, ParsesOrDefaults)
{
  EXPECT_DOUBLE_EQ(VoltageSource("v1", "B", "9V").voltage(), 9.0);
  EXPECT_DOUBLE_EQ(VoltageSource("v2", "B", "12").voltage(), 12.0);
  EXPECT_DOUBLE_EQ(VoltageSource("v3", "B", "-3").voltage(), -3.0);
  EXPECT_DOUBLE_EQ(VoltageSource("v4", "B", "5mV").voltage(), 5.0);
  EXPECT_DOUBLE_EQ(VoltageSource("v5", "B", "").voltage(),
                   VoltageSource::DEFAULT_VOLTAGE);
  EXPECT_DOUBLE_EQ(VoltageSource("v6", "B", "battery").voltage(), 9.0);
}

TEST(VoltageSourceStamp, ToGround)
{
  VoltageSource v("v1", "B", "9V");
  std::vector<std::vector<double>> mna(2, std::vector<double>(2, 0.0));
  std::vector<double> rhs(2, 0.0);

  StampIndices idx;
  idx.p1 = 0;
  idx.p2 = GROUND_INDEX;
  idx.branch = 1;
  v.stamp(mna, rhs, idx);

  EXPECT_DOUBLE_EQ(mna[0][1], 1.0);
  EXPECT_DOUBLE_EQ(mna[1][0], 1.0);
  EXPECT_DOUBLE_EQ(mna[0][0], 0.0);
  EXPECT_DOUBLE_EQ(mna[1][1], 0.0);
  EXPECT_DOUBLE_EQ(rhs[0], 0.0);
  EXPECT_DOUBLE_EQ(rhs[1], 9.0);
}

TEST(VoltageSourceStamp, BetweenTwoNets)
{
  VoltageSource v("v1", "B", "-2");
  std::vector<std::vector<double>> mna(3, std::vector<double>(3, 0.0));
  std::vector<double> rhs(3, 0.0);

  StampIndices idx;
  idx.p1 = 0;
  idx.p2 = 1;
  idx.branch = 2;
  v.stamp(mna, rhs, idx);

  EXPECT_DOUBLE_EQ(mna[0][2], 1.0);
  EXPECT_DOUBLE_EQ(mna[2][0], 1.0);
  EXPECT_DOUBLE_EQ(mna[1][2], -1.0);
  EXPECT_DOUBLE_EQ(mna[2][1], -1.0);
  EXPECT_DOUBLE_EQ(mna[2][2], 0.0);
  EXPECT_DOUBLE_EQ(rhs[2], -2.0);
}

TEST(VoltageSourceStamp, BothPinsGroundedOnlyWritesRhs)
{
  VoltageSource v("v1", "B", "6");
  std::vector<std::vector<double>> mna(1, std::vector<double>(1, 0.0));
  std::vector<double> rhs(1, 0.0);

  StampIndices idx;
  idx.branch = 0;
  v.stamp(mna, rhs, idx);

  EXPECT_DOUBLE_EQ(mna[0][0], 0.0);
  EXPECT_DOUBLE_EQ(rhs[0], 6.0);
}

TEST(VoltageSourceCurrent, ReadsBranchUnknown)
{
  VoltageSource v("v1", "B", "9V");
  EXPECT_TRUE(v.needsBranchCurrent());

  Eigen::VectorXd x(3);
  x << 1.0, 2.0, -0.5;

  StampIndices idx;
  idx.branch = 2;
  EXPECT_DOUBLE_EQ(v.computeCurrent(9.0, 0.0, x, idx), -0.5);

  // Out-of-range branch index reads as zero
  idx.branch = 3;
  EXPECT_DOUBLE_EQ(v.computeCurrent(9.0, 0.0, x, idx), 0.0);
  idx.branch = GROUND_INDEX;
  EXPECT_DOUBLE_EQ(v.computeCurrent(9.0, 0.0, x, idx), 0.0);
}
