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
#pragma once

/**
 * @file VoltageSource.hpp
 * @brief Declaration of the VoltageSource (independent DC source) element.
 *
 * A voltage source enforces V(p1) - V(p2) = E, where p1 is the positive
 * terminal and p2 the negative terminal. Its branch current is an explicit
 * unknown in the MNA system; the solved value is the signed current flowing
 * out of the positive terminal.
 *
 * The voltage comes from the value string (e.g. "9V", "12"); a value that
 * parses to zero falls back to `DEFAULT_VOLTAGE`.
 */

#include <map>
#include <memory>
#include <string>
#include <vector>

#include "CircuitElement.hpp"

/**
 * @class VoltageSource
 * @brief Independent DC voltage source with its own branch-current unknown.
 *
 * Stamping details (branch unknown index = b):
 *  - KCL coupling: +1 at (p1, b) and (b, p1) when p1 is not ground.
 *  - KCL coupling: -1 at (p2, b) and (b, p2) when p2 is not ground.
 *  - RHS[b] = voltage().
 */
class VoltageSource : public CircuitElement
{
   public:
    /** @brief Source voltage used when the value string parses to zero. */
    constexpr static double DEFAULT_VOLTAGE = 9.0;

    /**
     * @brief Construct a voltage source.
     *
     * @param id Unique component id.
     * @param label Display label (e.g., "9V Battery").
     * @param value Voltage string.
     * @param x Horizontal placement.
     * @param y Vertical placement.
     */
    VoltageSource(const std::string& id, const std::string& label,
                  const std::string& value, double x = 0.0, double y = 0.0)
        : CircuitElement(id, label, value, x, y)
    {
        kind = ComponentKind::Source;
        kindName = "source";
    }

    /**
     * @brief Source voltage in volts.
     */
    double voltage() const;

    /**
     * @brief Stamp the source into the MNA matrix and RHS vector.
     *
     * Requires `indices.branch` to be a valid row of `mna`.
     *
     * @param mna MNA matrix (modified in-place).
     * @param rhs RHS vector (entry at the branch row is set).
     * @param indices Net indices of p1/p2 and the branch-current index.
     */
    void stamp(std::vector<std::vector<double>>& mna, std::vector<double>& rhs,
               const StampIndices& indices) const override;

    /**
     * @brief Returns the solved branch current x[indices.branch].
     */
    double computeCurrent(double v1, double v2,
                          const Eigen::Ref<const Eigen::VectorXd>& x,
                          const StampIndices& indices) const override;

    bool needsBranchCurrent() const override { return true; }
};
