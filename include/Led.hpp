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
 * @file Led.hpp
 * @brief LED modeled as a fixed 50 ohm resistance.
 *
 * There is no forward-voltage knee and no reverse blocking: current flows in
 * either direction in proportion to the voltage across the pins. The value
 * string (usually a colour such as "Red") is ignored by the analysis.
 */

#include <string>

#include "ResistiveElement.hpp"

class Led : public ResistiveElement
{
   public:
    constexpr static double LED_RESISTANCE = 50.0;

    Led(const std::string& id, const std::string& label,
        const std::string& value, double x = 0.0, double y = 0.0)
        : ResistiveElement(id, label, value, x, y)
    {
        kind = ComponentKind::Led;
        kindName = "led";
    }

    double resistance() const override { return LED_RESISTANCE; }
};
