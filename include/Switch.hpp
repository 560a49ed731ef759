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
 * @file Switch.hpp
 * @brief Two-state switch modeled as a very small or very large resistance.
 *
 * The switch is closed only when its value is exactly "closed" (case
 * sensitive, no trimming). Any other value, including an empty one, leaves it
 * open.
 */

#include <string>

#include "ResistiveElement.hpp"

/**
 * @class Switch
 * @brief Switch element: CLOSED_RESISTANCE when closed, OPEN_RESISTANCE
 * otherwise.
 */
class Switch : public ResistiveElement
{
   public:
    constexpr static double CLOSED_RESISTANCE = 0.01;
    constexpr static double OPEN_RESISTANCE = 1e9;

    Switch(const std::string& id, const std::string& label,
           const std::string& value, double x = 0.0, double y = 0.0)
        : ResistiveElement(id, label, value, x, y)
    {
        kind = ComponentKind::Switch;
        kindName = "switch";
    }

    /**
     * @brief True when the switch value is the literal "closed".
     */
    bool isClosed() const { return value == "closed"; }

    double resistance() const override
    {
        return isClosed() ? CLOSED_RESISTANCE : OPEN_RESISTANCE;
    }
};
