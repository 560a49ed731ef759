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
 * @file Resistor.hpp
 * @brief Declaration of the Resistor element used in circuit simulation.
 *
 * The resistance comes from the component's magnitude string, parsed with
 * `parseMagnitude()` (e.g. "330", "10k", "4.7kΩ"). A string that parses to
 * zero (empty, unparseable, or literally "0") falls back to
 * `DEFAULT_RESISTANCE`.
 *
 * Usage example:
 * @code
 * Resistor r("n2", "R1", "330", 300, 200);
 * double ohms = r.resistance();  // 330.0
 * @endcode
 */

#include <string>

#include "ResistiveElement.hpp"

/**
 * @class Resistor
 * @brief Concrete resistor element implementing a two-terminal resistor.
 */
class Resistor : public ResistiveElement
{
   public:
    /** @brief Resistance used when the value string parses to zero. */
    constexpr static double DEFAULT_RESISTANCE = 1000.0;

    /**
     * @brief Construct a resistor element.
     *
     * @param id Unique component id (e.g., "n2").
     * @param label Display label.
     * @param value Resistance string.
     * @param x Horizontal placement.
     * @param y Vertical placement.
     */
    Resistor(const std::string& id, const std::string& label,
             const std::string& value, double x = 0.0, double y = 0.0)
        : ResistiveElement(id, label, value, x, y)
    {
        kind = ComponentKind::Resistor;
        kindName = "resistor";
    }

    double resistance() const override;
};
