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
 * @file VoltageSource.cpp
 * @brief Implementation of the `VoltageSource` element.
 *
 * Implementation notes (concise):
 *  - The branch current is an explicit unknown; its index is handed in via
 *    `StampIndices::branch`.
 *  - The stamp inserts KCL couplings between the pin nets and the branch
 *    unknown and writes the source voltage into the branch row of the RHS.
 *    Couplings for a pin on the ground net are skipped.
 *
 * Full API documentation is provided in the header `VoltageSource.hpp`.
 */

#include "VoltageSource.hpp"

#include <cmath>

#include "ValueParser.hpp"

double VoltageSource::voltage() const
{
    double volts = parseMagnitude(value);
    if (volts == 0.0 || !std::isfinite(volts)) return DEFAULT_VOLTAGE;
    return volts;
}

/**
 * @brief Stamp the independent voltage source into the MNA matrix and RHS.
 *
 * MNA stamping pattern (element current unknown = I_e, leaving p1):
 *
 *   KCL rows:
 *     - At p1: +I_e (if p1 is not ground)
 *     - At p2: -I_e (if p2 is not ground)
 *
 *   Element equation row (for I_e):
 *     V(p1) - V(p2) = E  -> coefficients +1 and -1 on node voltages,
 *     RHS receives the source voltage.
 */
void VoltageSource::stamp(std::vector<std::vector<double>>& mna,
                          std::vector<double>& rhs,
                          const StampIndices& indices) const
{
    int i = indices.branch;

    if (indices.p1 != GROUND_INDEX) {
        int vplus = indices.p1;
        mna[vplus][i] += 1.0;
        mna[i][vplus] += 1.0;
    }

    if (indices.p2 != GROUND_INDEX) {
        int vminus = indices.p2;
        mna[vminus][i] -= 1.0;
        mna[i][vminus] -= 1.0;
    }

    rhs[i] = voltage();
}

double VoltageSource::computeCurrent(
    double /*v1*/, double /*v2*/, const Eigen::Ref<const Eigen::VectorXd>& x,
    const StampIndices& indices) const
{
    if (indices.branch < 0 || indices.branch >= x.size()) return 0.0;
    return x(indices.branch);
}
