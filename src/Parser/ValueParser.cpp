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
 * @file ValueParser.cpp
 * @brief Lenient magnitude parsing for board values.
 *
 * See ValueParser.hpp for the rules. The multiplier checks run in a fixed
 * order and the first match wins; "m" means mega here, which differs from
 * SPICE (where M is milli and MEG is mega).
 */

#include "ValueParser.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <stdexcept>
#include <string>

namespace
{
bool isDigit(char c) { return std::isdigit((unsigned char)c) != 0; }

bool contains(const std::string& text, const char* needle)
{
    return text.find(needle) != std::string::npos;
}
}  // namespace

bool parseLeadingNumber(const std::string& text, double& value)
{
    value = 0.0;
    size_t pos = 0;
    const size_t n = text.size();

    if (pos < n && (text[pos] == '+' || text[pos] == '-')) ++pos;

    size_t intStart = pos;
    while (pos < n && isDigit(text[pos])) ++pos;
    size_t intDigits = pos - intStart;

    size_t fracDigits = 0;
    if (pos < n && text[pos] == '.') {
        size_t dot = pos++;
        size_t fracStart = pos;
        while (pos < n && isDigit(text[pos])) ++pos;
        fracDigits = pos - fracStart;
        if (intDigits == 0 && fracDigits == 0) pos = dot;
    }

    if (intDigits == 0 && fracDigits == 0) return false;

    // Exponent only counts when at least one digit follows it ("5e" is 5).
    if (pos < n && (text[pos] == 'e' || text[pos] == 'E')) {
        size_t e = pos++;
        if (pos < n && (text[pos] == '+' || text[pos] == '-')) ++pos;
        size_t expStart = pos;
        while (pos < n && isDigit(text[pos])) ++pos;
        if (pos == expStart) pos = e;
    }

    try {
        value = std::stod(text.substr(0, pos));
    } catch (const std::out_of_range&) {
        value = 0.0;
        return false;
    }

    if (!std::isfinite(value)) {
        value = 0.0;
        return false;
    }
    return true;
}

double parseMagnitude(const std::string& text)
{
    if (text.empty()) return 0.0;

    std::string str = text;
    std::transform(str.begin(), str.end(), str.begin(),
                   [](unsigned char c) { return (char)std::tolower(c); });

    const char* whitespace = " \t\n\r\f\v";
    size_t first = str.find_first_not_of(whitespace);
    if (first == std::string::npos) return 0.0;
    size_t last = str.find_last_not_of(whitespace);
    str = str.substr(first, last - first + 1);

    double num = 0.0;
    if (!parseLeadingNumber(str, num)) return 0.0;

    if (contains(str, "k")) return num * 1e3;
    if (contains(str, "m") && !contains(str, "mhz") && !contains(str, "mv"))
        return num * 1e6;
    if (contains(str, "u")) return num * 1e-6;
    if (contains(str, "n")) return num * 1e-9;
    if (contains(str, "p")) return num * 1e-12;

    return num;
}
