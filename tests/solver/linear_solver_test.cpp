#include <gtest/gtest.h>

#include "LinearSolver.hpp"

#include <limits>
#include <stdexcept>

/*
 * linear_solver_test.cpp
 *
 * Unit tests for solveLinearSystem(...): Gaussian elimination with partial
 * pivoting where unknowns without a usable pivot resolve to zero.
 */

TEST(LinearSolver, SolvesWellConditionedSystem)
{
  Eigen::MatrixXd A(2, 2);
  A << 2, 1,
       1, 3;
  Eigen::VectorXd b(2);
  b << 3, 5;

  Eigen::VectorXd x = solveLinearSystem(A, b);
  ASSERT_EQ(x.size(), 2);
  EXPECT_NEAR(x(0), 0.8, 1e-12);
  EXPECT_NEAR(x(1), 1.4, 1e-12);
}

TEST(LinearSolver, PivotsAroundZeroDiagonal)
{
  Eigen::MatrixXd A(2, 2);
  A << 0, 1,
       1, 0;
  Eigen::VectorXd b(2);
  b << 2, 3;

  Eigen::VectorXd x = solveLinearSystem(A, b);
  EXPECT_DOUBLE_EQ(x(0), 3.0);
  EXPECT_DOUBLE_EQ(x(1), 2.0);
}

TEST(LinearSolver, MnaShapedSystem)
{
  // 10 V source at node 0, two 1 ohm resistors in series to ground
  Eigen::MatrixXd A(3, 3);
  A << 1, -1, 1,
      -1,  2, 0,
       1,  0, 0;
  Eigen::VectorXd b(3);
  b << 0, 0, 10;

  Eigen::VectorXd x = solveLinearSystem(A, b);
  EXPECT_NEAR(x(0), 10.0, 1e-12);
  EXPECT_NEAR(x(1), 5.0, 1e-12);
  EXPECT_NEAR(x(2), -5.0, 1e-12);
}

TEST(LinearSolver, FloatingUnknownResolvesToZero)
{
  Eigen::MatrixXd A(2, 2);
  A << 1, 0,
       0, 0;
  Eigen::VectorXd b(2);
  b << 2, 0;

  Eigen::VectorXd x = solveLinearSystem(A, b);
  EXPECT_DOUBLE_EQ(x(0), 2.0);
  EXPECT_DOUBLE_EQ(x(1), 0.0);
}

TEST(LinearSolver, AllZeroMatrixGivesZeroVector)
{
  Eigen::MatrixXd A = Eigen::MatrixXd::Zero(3, 3);
  Eigen::VectorXd b(3);
  b << 1, 2, 3;

  Eigen::VectorXd x = solveLinearSystem(A, b);
  EXPECT_TRUE(x.isZero(0.0));
}

TEST(LinearSolver, ToleranceDecidesFloating)
{
  Eigen::MatrixXd A(1, 1);
  A << 1e-6;
  Eigen::VectorXd b(1);
  b << 1;

  EXPECT_NEAR(solveLinearSystem(A, b)(0), 1e6, 1e-6);
  EXPECT_DOUBLE_EQ(solveLinearSystem(A, b, 1e-5)(0), 0.0);

  A << 1e-12;
  EXPECT_DOUBLE_EQ(solveLinearSystem(A, b)(0), 0.0);
}

TEST(LinearSolver, EmptySystem)
{
  Eigen::VectorXd x = solveLinearSystem(Eigen::MatrixXd(0, 0),
                                        Eigen::VectorXd(0));
  EXPECT_EQ(x.size(), 0);
}

TEST(LinearSolver, CallerMatrixUntouched)
{
  Eigen::MatrixXd A(2, 2);
  A << 0, 1,
       1, 0;
  Eigen::VectorXd b(2);
  b << 2, 3;
  Eigen::MatrixXd before = A;

  solveLinearSystem(A, b);
  EXPECT_TRUE(A == before);
  EXPECT_DOUBLE_EQ(b(0), 2.0);
}

TEST(LinearSolver, DimensionMismatchThrows)
{
  Eigen::MatrixXd A = Eigen::MatrixXd::Identity(2, 2);
  Eigen::VectorXd b(3);
  b << 1, 2, 3;
  EXPECT_THROW(solveLinearSystem(A, b), std::invalid_argument);

  Eigen::MatrixXd wide(2, 3);
  wide.setZero();
  EXPECT_THROW(solveLinearSystem(wide, Eigen::VectorXd::Zero(2)),
               std::invalid_argument);
}

TEST(LinearSolver, NonFiniteSolutionThrows)
{
  Eigen::MatrixXd A(1, 1);
  A << std::numeric_limits<double>::quiet_NaN();
  Eigen::VectorXd b(1);
  b << 1;
  EXPECT_THROW(solveLinearSystem(A, b), std::runtime_error);
}
