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
 * @file ValueParser.hpp
 * @brief Lenient conversion of component magnitude strings to numbers.
 *
 * Board values are free text typed by users or produced by presets ("330Ω",
 * "10k", "9V", "100uF"). Unlike the strict netlist parsing found in SPICE
 * tools, this conversion never fails: anything it cannot read becomes 0 and
 * the caller applies its own fallback.
 *
 * Rules, applied to the lowercased and trimmed text:
 *  - The leading decimal numeral is read (optional sign, digits, optional
 *    fraction, optional exponent). No numeral gives 0.
 *  - The first matching multiplier rule applies:
 *      contains "k"                              -> x1e3
 *      contains "m", but neither "mhz" nor "mv"  -> x1e6 (mega, not milli)
 *      contains "u"                              -> x1e-6
 *      contains "n"                              -> x1e-9
 *      contains "p"                              -> x1e-12
 *    otherwise the numeral is returned unscaled.
 *
 * The substring scan looks at the whole text, not only a suffix, so "10 ohm"
 * is scaled by 1e6 because of its "m". Presets depend on this behaviour.
 */

#pragma once

#include <string>

/**
 * @brief Parse a magnitude string into its base-unit value.
 *
 * @param text Value string as entered on the board (may be empty).
 * @return Parsed value, or 0.0 when no numeral can be read.
 */
double parseMagnitude(const std::string& text);

/**
 * @brief Read the leading decimal numeral of an already trimmed string.
 *
 * @param text Input text.
 * @param[out] value Parsed numeral (0.0 on failure).
 * @return true if a numeral was found at the start of `text`.
 */
bool parseLeadingNumber(const std::string& text, double& value);
