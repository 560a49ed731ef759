/*
 * Copyright (c) 2022, Shiv Nadar University, Delhi NCR, India. All Rights
 * Reserved. Permission to use, copy, modify and distribute this software for
 * educational, research, and not-for-profit purposes, without fee and without a
 * signed license agreement, is hereby granted, provided that this paragraph and
 * the following two paragraphs appear in all copies, modifications, and
 * distributions.
 *
 * IN NO EVENT SHALL SHIV NADAR UNIVERSITY BE LIABLE TO ANY PARTY FOR DIRECT,
 * INDIRECT, SPECIAL, INCIDENTAL, OR CONSEQUENTIAL DAMAGES, INCLUDING LOST
 * PROFITS, ARISING OUT OF THE USE OF THIS SOFTWARE.
 *
 * SHIV NADAR UNIVERSITY SPECIFICALLY DISCLAIMS ANY WARRANTIES, INCLUDING, BUT
 * NOT LIMITED TO, THE IMPLIED WARRANTIES OF MERCHANTABILITY AND FITNESS FOR A
 * PARTICULAR PURPOSE. THE SOFTWARE PROVIDED HEREUNDER IS PROVIDED "AS IS". SHIV
 * NADAR UNIVERSITY HAS NO OBLIGATION TO PROVIDE MAINTENANCE, SUPPORT, UPDATES,
 * ENHANCEMENTS, OR MODIFICATIONS.
 */
/**
 * @file LinearSolver.hpp
 * @brief Dense Gaussian elimination with partial pivoting.
 *
 * The routine tolerates singular systems: an unknown whose pivot stays below
 * the tolerance (a floating or disconnected net) resolves to exactly 0
 * instead of being divided by a near-zero value. Only a non-finite result is
 * treated as a failure.
 */

#pragma once

#include <Eigen/Dense>

/**
 * @brief Solve A * x = b.
 *
 * Forward elimination swaps the row with the largest absolute entry in the
 * current column into the pivot position. Columns whose best pivot is below
 * `pivotTolerance` are left uneliminated; back-substitution sets their
 * unknown to 0.
 *
 * @param A Square system matrix (taken by value; the caller's copy is not
 * modified).
 * @param b Right-hand side, same length as A's dimension.
 * @param pivotTolerance Smallest pivot magnitude used as a divisor.
 * @return Solution vector x.
 * @throws std::invalid_argument if A is not square or b does not match.
 * @throws std::runtime_error if the computed solution contains a non-finite
 * value.
 */
Eigen::VectorXd solveLinearSystem(Eigen::MatrixXd A, Eigen::VectorXd b,
                                  double pivotTolerance = 1e-10);
