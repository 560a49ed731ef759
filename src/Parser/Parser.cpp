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
 * @file Parser.cpp
 * @brief Board description parser.
 *
 * Each statement is one line. A malformed line is reported to stderr with
 * its line number, counted as one error and skipped.
 */

#include "Parser.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <initializer_list>
#include <iostream>
#include <sstream>

namespace
{
std::vector<std::string> tokenize(const std::string& line)
{
    std::vector<std::string> tokens;
    std::istringstream stream(line);
    std::string token;
    while (stream >> token) tokens.push_back(token);
    return tokens;
}

std::string toUpper(std::string text)
{
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return (char)std::toupper(c); });
    return text;
}
}  // namespace

int Parser::parse(const std::string& fileName)
{
    std::ifstream file(fileName);
    if (!file.is_open()) {
        std::cerr << "Error: Board file '" << fileName << "' not available"
                  << std::endl;
        return 1;
    }
    return parseStream(file);
}

int Parser::parseStream(std::istream& input)
{
    int errors = 0;
    int lineNumber = 0;
    std::string line;

    while (std::getline(input, line)) {
        ++lineNumber;
        if (!line.empty() && line.back() == '\r') line.pop_back();

        std::vector<std::string> tokens = tokenize(line);
        if (tokens.empty()) continue;
        if (tokens[0][0] == '*' || tokens[0][0] == '#') continue;

        const std::string keyword = toUpper(tokens[0]);
        if (keyword == ".END") break;

        bool ok = false;
        if (keyword == "COMP") {
            ok = parseComponentLine(tokens, lineNumber);
        } else if (keyword == "WIRE") {
            ok = parseWireLine(tokens, lineNumber);
        } else {
            std::cerr << "Line " << lineNumber << ": Unknown statement '"
                      << tokens[0] << "'" << std::endl;
        }

        if (!ok) ++errors;
    }

    return errors;
}

bool Parser::parseComponentLine(const std::vector<std::string>& tokens,
                                int lineNumber)
{
    // COMP <id> <kind> <x> <y> [<value> [<label...>]]
    if (!validateMinTokens(tokens, 5, lineNumber)) {
        std::cerr << "Error: Invalid component definition at line "
                  << lineNumber << std::endl;
        return false;
    }

    const std::string& id = tokens[1];
    if (circuit.indexOf(id) >= 0) {
        std::cerr << "Line " << lineNumber << ": Duplicate component id '"
                  << id << "'" << std::endl;
        return false;
    }

    bool validX = false;
    bool validY = false;
    double x = parseCoordinate(tokens[3], lineNumber, validX);
    double y = parseCoordinate(tokens[4], lineNumber, validY);
    if (!validX || !validY) return false;

    std::string value;
    if (tokens.size() > 5 && tokens[5] != "-") value = tokens[5];

    std::string label;
    for (size_t i = 6; i < tokens.size(); ++i) {
        if (!label.empty()) label += " ";
        label += tokens[i];
    }
    if (label.empty()) label = id;

    auto element = CircuitElement::create(tokens[2], id, label, value, x, y);
    if (!circuit.addComponent(element)) return false;

    switch (element->getKind()) {
        case ComponentKind::Source:
            componentCounts.sourceCount++;
            break;
        case ComponentKind::Ground:
            componentCounts.groundCount++;
            break;
        case ComponentKind::Resistor:
            componentCounts.resistorCount++;
            break;
        case ComponentKind::Led:
            componentCounts.ledCount++;
            break;
        case ComponentKind::Switch:
            componentCounts.switchCount++;
            break;
        case ComponentKind::Unmodeled:
            componentCounts.unmodeledCount++;
            break;
    }
    return true;
}

bool Parser::parseWireLine(const std::vector<std::string>& tokens,
                           int lineNumber)
{
    // WIRE <id> <sourceId> <targetId>
    if (!validateTokens(tokens, 4, lineNumber)) {
        std::cerr << "Error: Invalid wire definition at line " << lineNumber
                  << std::endl;
        return false;
    }

    if (!validateEndpoints(tokens[2], tokens[3], lineNumber)) return false;

    circuit.addWire(tokens[1], tokens[2], tokens[3]);
    componentCounts.wireCount++;
    return true;
}

bool Parser::validateTokens(const std::vector<std::string>& tokens,
                            int expectedSize, int lineNumber)
{
    if (static_cast<int>(tokens.size()) != expectedSize) {
        std::cerr << "Line " << lineNumber << ": Expected " << expectedSize
                  << " tokens, got " << tokens.size() << std::endl;
        return false;
    }
    return true;
}

bool Parser::validateMinTokens(const std::vector<std::string>& tokens,
                               int minSize, int lineNumber)
{
    if (static_cast<int>(tokens.size()) < minSize) {
        std::cerr << "Line " << lineNumber << ": Expected at least " << minSize
                  << " tokens, got " << tokens.size() << std::endl;
        return false;
    }
    return true;
}

bool Parser::validateEndpoints(const std::string& sourceId,
                               const std::string& targetId, int lineNumber)
{
    if (sourceId == targetId) {
        std::cerr << "Line " << lineNumber
                  << ": Wire endpoints cannot be the same (" << sourceId << ")"
                  << std::endl;
        return false;
    }

    for (const std::string& id : {sourceId, targetId}) {
        if (circuit.indexOf(id) < 0) {
            std::cerr << "Line " << lineNumber << ": Unknown component '"
                      << id << "'" << std::endl;
            return false;
        }
    }
    return true;
}

double Parser::parseCoordinate(const std::string& token, int lineNumber,
                               bool& valid)
{
    // Require std::stod to consume the whole token ("1.2.3" is rejected)
    double value = 0.0;
    bool parsed = false;
    try {
        size_t idx = 0;
        value = std::stod(token, &idx);
        parsed = (idx == token.size());
    } catch (const std::exception&) {
        parsed = false;
    }

    if (!parsed) {
        std::cerr << "Line " << lineNumber << ": Invalid coordinate '" << token
                  << "'" << std::endl;
        valid = false;
        return 0.0;
    }

    valid = true;
    return value;
}

void Parser::printElementCounts() const
{
    std::cout << "Total Sources: " << componentCounts.sourceCount << std::endl;
    std::cout << "Total Grounds: " << componentCounts.groundCount << std::endl;
    std::cout << "Total Resistors: " << componentCounts.resistorCount
              << std::endl;
    std::cout << "Total LEDs: " << componentCounts.ledCount << std::endl;
    std::cout << "Total Switches: " << componentCounts.switchCount
              << std::endl;
    std::cout << "Total Unmodeled Parts: " << componentCounts.unmodeledCount
              << std::endl;
    std::cout << "Total Wires: " << componentCounts.wireCount << std::endl;
}
