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
 * @file Parser.hpp
 * @brief Parser for line-oriented board descriptions.
 *
 * This header defines the `Parser` class which reads a textual board
 * description (components and wires, as saved by the editor's export or
 * written by hand) and fills a `Circuit` ready for analysis.
 *
 * Format:
 * @code
 * * Basic LED driver
 * COMP n1 source   100 200 9V    9V Battery
 * COMP n2 resistor 300 200 330   R1
 * COMP n3 led      500 200 Red   LED1
 * COMP n4 ground   700 200 -
 * WIRE e1 n1 n2
 * WIRE e2 n2 n3
 * WIRE e3 n3 n4
 * .END
 * @endcode
 *
 * Design notes:
 *  - Lines starting with `*` or `#` and blank lines are ignored; `.END`
 *    stops parsing.
 *  - Keywords are case-insensitive. Ids, kinds, values and labels keep their
 *    case (a switch is closed only for the exact value "closed").
 *  - A value of `-` means "no value". The label is the rest of the line and
 *    defaults to the id.
 *  - Coordinates are parsed strictly; component values are not (they go
 *    through `parseMagnitude()` at analysis time).
 */

#pragma once

#include <istream>
#include <string>
#include <vector>

#include "Circuit.hpp"

/**
 * @struct ComponentCounts
 * @brief Simple counters for diagnostics and summary reporting.
 */
struct ComponentCounts
{
    int sourceCount = 0;    /**< Number of voltage sources parsed */
    int groundCount = 0;    /**< Number of ground terminals parsed */
    int resistorCount = 0;  /**< Number of resistors parsed */
    int ledCount = 0;       /**< Number of LEDs parsed */
    int switchCount = 0;    /**< Number of switches parsed */
    int unmodeledCount = 0; /**< Number of parts without a model */
    int wireCount = 0;      /**< Number of wires parsed */
};

/**
 * @class Parser
 * @brief Reads a board description into a `Circuit`.
 *
 * The Parser performs error reporting to `std::cerr` and returns a non-zero
 * error count from `parse()` when problems are encountered. Lines with
 * errors are skipped; the rest of the board is still loaded.
 */
class Parser
{
   public:
    /**
     * @brief Parsed board. Filled by `parse()` / `parseStream()`.
     */
    Circuit circuit;

    /**
     * @brief Parses a board file.
     *
     * @param fileName Path to the board file.
     * @return Number of errors encountered. Zero indicates a clean parse.
     */
    int parse(const std::string& fileName);

    /**
     * @brief Parses a board description from a stream.
     *
     * @param input Stream to read until EOF or `.END`.
     * @return Number of errors encountered.
     */
    int parseStream(std::istream& input);

    /**
     * @brief Validate the exact number of tokens in a line.
     *
     * @param tokens Tokenized line.
     * @param expectedSize Expected token count.
     * @param lineNumber Associated line number (for error messages).
     * @return True if token count matches `expectedSize`, false otherwise.
     */
    bool validateTokens(const std::vector<std::string>& tokens,
                        int expectedSize, int lineNumber);

    /**
     * @brief Validate that a line has at least `minSize` tokens.
     */
    bool validateMinTokens(const std::vector<std::string>& tokens,
                           int minSize, int lineNumber);

    /**
     * @brief Validate the endpoints of a wire.
     *
     * Both endpoints must name components declared earlier, and a wire may
     * not connect a component to itself.
     *
     * @param sourceId Id at the wire's source end.
     * @param targetId Id at the wire's target end.
     * @param lineNumber Line number for diagnostic messages.
     * @return True if the endpoints are valid.
     */
    bool validateEndpoints(const std::string& sourceId,
                           const std::string& targetId, int lineNumber);

    /**
     * @brief Parse a placement coordinate.
     *
     * The whole token must be a well-formed floating-point literal.
     *
     * @param token Coordinate token.
     * @param lineNumber Line number in the board file (used for diagnostics).
     * @param valid Output parameter set to true when parsing succeeds.
     * @return Parsed coordinate (0.0 if `valid` is false).
     */
    double parseCoordinate(const std::string& token, int lineNumber,
                           bool& valid);

    /**
     * @brief Print a summary of component counts collected during parsing.
     */
    void printElementCounts() const;

    const ComponentCounts& counts() const { return componentCounts; }

   private:
    bool parseComponentLine(const std::vector<std::string>& tokens,
                            int lineNumber);
    bool parseWireLine(const std::vector<std::string>& tokens,
                       int lineNumber);

    /**
     * @brief Counters for parsed component kinds (incremented during parse).
     */
    ComponentCounts componentCounts;
};
