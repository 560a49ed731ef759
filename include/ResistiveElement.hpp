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
 * @file ResistiveElement.hpp
 * @brief Common base for elements reduced to a fixed resistance.
 *
 * Resistors, LEDs and switches are all analysed as ideal linear resistors.
 * Each concrete class only decides its resistance; the conductance stamp and
 * the Ohm's-law current live here so the three stay consistent.
 *
 * Stamping pattern for conductance g = 1/R between pins p1 and p2:
 * @code
 *          p1     p2
 *   p1  [ +g     -g ]
 *   p2  [ -g     +g ]
 * @endcode
 * Rows/columns of a pin on the ground net are dropped.
 */

#include <map>
#include <memory>
#include <string>
#include <vector>

#include "CircuitElement.hpp"

/**
 * @class ResistiveElement
 * @brief Abstract two-terminal element with a fixed equivalent resistance.
 */
class ResistiveElement : public CircuitElement
{
   public:
    ResistiveElement(const std::string& id, const std::string& label,
                     const std::string& value, double x, double y)
        : CircuitElement(id, label, value, x, y)
    {
    }

    /**
     * @brief Equivalent resistance used for both stamping and current
     * extraction.
     * @return Resistance in ohms.
     */
    virtual double resistance() const = 0;

    /**
     * @brief Stamp the conductance 1/R between the element's pins.
     *
     * @param mna Reference to the square MNA matrix (modified in-place).
     * @param rhs Reference to the RHS vector (untouched).
     * @param indices Net indices of p1/p2, GROUND_INDEX for a grounded pin.
     */
    void stamp(std::vector<std::vector<double>>& mna, std::vector<double>& rhs,
               const StampIndices& indices) const override;

    /**
     * @brief Ohm's law: (v1 - v2) / R with the stamped resistance.
     */
    double computeCurrent(double v1, double v2,
                          const Eigen::Ref<const Eigen::VectorXd>& x,
                          const StampIndices& indices) const override;
};
