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
 * @file ResistiveElement.cpp
 * @brief Conductance stamp and Ohm's-law current shared by R, LED and switch.
 */

#include "ResistiveElement.hpp"

#include <vector>

void ResistiveElement::stamp(std::vector<std::vector<double>>& mna,
                             std::vector<double>& /*rhs*/,
                             const StampIndices& indices) const
{
    double conductance = 1.0 / resistance();
    int vplus = indices.p1;
    int vminus = indices.p2;

    if (vplus != GROUND_INDEX) mna[vplus][vplus] += conductance;
    if (vminus != GROUND_INDEX) mna[vminus][vminus] += conductance;

    // Off-diagonal coupling only when neither pin is grounded
    if (vplus != GROUND_INDEX && vminus != GROUND_INDEX) {
        mna[vplus][vminus] -= conductance;
        mna[vminus][vplus] -= conductance;
    }
}

double ResistiveElement::computeCurrent(
    double v1, double v2, const Eigen::Ref<const Eigen::VectorXd>& /*x*/,
    const StampIndices& /*indices*/) const
{
    return (v1 - v2) / resistance();
}
