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
 * @file UnmodeledElement.hpp
 * @brief Placeholder for component kinds without an electrical model.
 *
 * Capacitors, inductors, transistors, ICs and any other tag the editor may
 * produce are accepted so that the rest of the board can still be analysed.
 * They receive two pins like every element but stamp nothing, so their nets
 * are only tied to the circuit through other elements.
 */

#include <string>

#include "CircuitElement.hpp"

class UnmodeledElement : public CircuitElement
{
   public:
    UnmodeledElement(const std::string& id, const std::string& kindTag,
                     const std::string& label, const std::string& value,
                     double x = 0.0, double y = 0.0)
        : CircuitElement(id, label, value, x, y)
    {
        kind = ComponentKind::Unmodeled;
        kindName = kindTag;
    }

    void stamp(std::vector<std::vector<double>>& /*mna*/,
               std::vector<double>& /*rhs*/,
               const StampIndices& /*indices*/) const override
    {
    }
};
