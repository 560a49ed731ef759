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
 * @file LinearSolver.cpp
 * @brief Gaussian elimination with partial pivoting on Eigen storage.
 *
 * Eigen's own decompositions are not used here: a floating net must resolve
 * to exactly 0 V, which requires per-unknown control over tiny pivots.
 */

#include "LinearSolver.hpp"

#include <cmath>
#include <stdexcept>
#include <string>
#include <utility>

Eigen::VectorXd solveLinearSystem(Eigen::MatrixXd A, Eigen::VectorXd b,
                                  double pivotTolerance)
{
    const Eigen::Index n = b.size();
    if (A.rows() != n || A.cols() != n) {
        throw std::invalid_argument(
            "solveLinearSystem: matrix is " + std::to_string(A.rows()) + "x" +
            std::to_string(A.cols()) + " but RHS has " + std::to_string(n) +
            " entries");
    }

    // Forward elimination
    for (Eigen::Index i = 0; i < n; ++i) {
        Eigen::Index maxRow = i;
        double maxEl = std::abs(A(i, i));
        for (Eigen::Index k = i + 1; k < n; ++k) {
            if (std::abs(A(k, i)) > maxEl) {
                maxEl = std::abs(A(k, i));
                maxRow = k;
            }
        }

        if (maxRow != i) {
            A.row(i).swap(A.row(maxRow));
            std::swap(b(i), b(maxRow));
        }

        // Floating column: nothing usable to divide by.
        if (maxEl < pivotTolerance) continue;

        for (Eigen::Index k = i + 1; k < n; ++k) {
            double c = -A(k, i) / A(i, i);
            if (c == 0.0) continue;
            A(k, i) = 0.0;
            for (Eigen::Index j = i + 1; j < n; ++j) A(k, j) += c * A(i, j);
            b(k) += c * b(i);
        }
    }

    // Back-substitution on the upper triangle
    Eigen::VectorXd x = Eigen::VectorXd::Zero(n);
    for (Eigen::Index i = n - 1; i >= 0; --i) {
        double sum = 0.0;
        for (Eigen::Index j = i + 1; j < n; ++j) sum += A(i, j) * x(j);

        if (std::abs(A(i, i)) < pivotTolerance)
            x(i) = 0.0;  // singular / disconnected
        else
            x(i) = (b(i) - sum) / A(i, i);
    }

    if (!x.allFinite())
        throw std::runtime_error("non-finite value in solution vector");

    return x;
}
